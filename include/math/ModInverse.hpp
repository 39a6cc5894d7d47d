// math/ModInverse.hpp
#ifndef MATH_MODINVERSE_HPP
#define MATH_MODINVERSE_HPP

#include <optional>
#include <gmpxx.h>

namespace math {

/// Inverse of a modulo N, normalized into [0, N).
/// Requires gcd(a, N) == 1; throws std::domain_error otherwise.
mpz_class modInverse(const mpz_class& a, const mpz_class& N);

std::optional<mpz_class> tryModInverse(const mpz_class& a, const mpz_class& N);

} // namespace math

#endif // MATH_MODINVERSE_HPP

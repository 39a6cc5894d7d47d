#include "math/ModInverse.hpp"
#include <stdexcept>

namespace math {

std::optional<mpz_class> tryModInverse(const mpz_class& a, const mpz_class& N) {
    if (N < 2) return std::nullopt;
    mpz_class inv;
    if (mpz_invert(inv.get_mpz_t(), a.get_mpz_t(), N.get_mpz_t()) == 0)
        return std::nullopt;
    return inv;
}

mpz_class modInverse(const mpz_class& a, const mpz_class& N) {
    auto inv = tryModInverse(a, N);
    if (!inv) {
        throw std::domain_error("modInverse: " + a.get_str() +
                                " is not invertible modulo " + N.get_str());
    }
    return *inv;
}

} // namespace math

// math/ScalarMultiplier.hpp
#ifndef MATH_SCALARMULTIPLIER_HPP
#define MATH_SCALARMULTIPLIER_HPP

#include "math/CurveGroup.hpp"
#include "math/CurveResult.hpp"
#include "math/Point.hpp"
#include <cstdint>
#include <gmpxx.h>

namespace math {

/// k*P by double-and-add on a CurveGroup. The ladder P, 2P, ..., 2^(m-1)P is
/// built first (m = bit length of k), then the rungs of the set bits are
/// summed. The first non-invertible denominator ends the computation.
class ScalarMultiplier {
public:
    explicit ScalarMultiplier(CurveGroup& curve);

    CurveResult tryMultiply(const Point& p, const mpz_class& k);
    Point multiply(const Point& p, const mpz_class& k);

    /// Group operations performed by the last call.
    uint64_t lastOperationCount() const { return ops_; }

private:
    CurveGroup& curve_;
    uint64_t ops_ = 0;
};

} // namespace math

#endif // MATH_SCALARMULTIPLIER_HPP

// math/CurveResult.hpp
#pragma once
#include "math/Point.hpp"
#include <variant>
#include <gmpxx.h>

namespace math {

/// Nontrivial gcd(denominator, N) hit while adding points over Z/NZ.
struct FactorFound {
    mpz_class factor;
};

/// Outcome of a group operation: either the resulting point or the
/// common factor that stopped it.
class CurveResult {
public:
    CurveResult(const Point& p) : value_(p) {}
    CurveResult(const FactorFound& f) : value_(f) {}

    bool ok() const { return std::holds_alternative<Point>(value_); }
    const Point& point() const { return std::get<Point>(value_); }
    const mpz_class& factor() const { return std::get<FactorFound>(value_).factor; }

    /// The point, or the point at infinity when a factor was found.
    Point pointOrInfinity() const { return ok() ? point() : Point::infinity(); }

private:
    std::variant<Point, FactorFound> value_;
};

} // namespace math

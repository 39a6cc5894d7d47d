// math/CurveGroup.hpp
#ifndef MATH_CURVEGROUP_HPP
#define MATH_CURVEGROUP_HPP

#include "math/CurveResult.hpp"
#include "math/Point.hpp"
#include <gmpxx.h>

namespace math {

/// Group law of the Weierstrass curve y^2 = x^3 + a*x + b over Z/NZ.
///
/// Z/NZ is not a field when N is composite: the slope denominator may share a
/// factor with N. When that happens the operation stops, the gcd is kept in
/// factorHint() and the caller receives it through CurveResult (tryAdd) or as
/// the point at infinity (add).
class CurveGroup {
public:
    CurveGroup(const mpz_class& a, const mpz_class& b, const mpz_class& N);

    /// Curve through (x0, y0) with coefficient a; b is derived.
    static CurveGroup fromPoint(const mpz_class& x0, const mpz_class& y0,
                                const mpz_class& a, const mpz_class& N);

    CurveResult tryAdd(const Point& p, const Point& q);
    Point add(const Point& p, const Point& q);

    /// gcd of the slope denominator of p + q with N, without adding.
    mpz_class obstruction(const Point& p, const Point& q) const;

    bool contains(const Point& p) const;

    const mpz_class& factorHint() const { return lastFactor_; }
    bool isBroken() const { return lastFactor_ != 1; }

    const mpz_class& a() const { return a_; }
    const mpz_class& b() const { return b_; }
    const mpz_class& modulus() const { return N_; }

private:
    CurveResult fail(const mpz_class& g);

    mpz_class a_;
    mpz_class b_;
    mpz_class N_;
    mpz_class lastFactor_;
};

} // namespace math

#endif // MATH_CURVEGROUP_HPP

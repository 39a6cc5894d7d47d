/*
 * Lenstra elliptic curve factorization
 *
 * Affine Weierstrass arithmetic over Z/NZ. A slope denominator that is not a
 * unit modulo N is not an error: its gcd with N is the factor being searched.
 *
 * This code is released as free software.
 */
#include "math/CurveGroup.hpp"
#include "math/ModInverse.hpp"
#include "util/GmpUtils.hpp"
#include <stdexcept>

namespace math {

CurveGroup::CurveGroup(const mpz_class& a, const mpz_class& b, const mpz_class& N)
  : N_(N), lastFactor_(1)
{
    if (N < 2) {
        throw std::invalid_argument("CurveGroup: modulus must be >= 2, got " + N.get_str());
    }
    a_ = util::modN(a, N_);
    b_ = util::modN(b, N_);
}

CurveGroup CurveGroup::fromPoint(const mpz_class& x0, const mpz_class& y0,
                                 const mpz_class& a, const mpz_class& N) {
    if (N < 2) {
        throw std::invalid_argument("CurveGroup: modulus must be >= 2, got " + N.get_str());
    }
    mpz_class b = y0 * y0 - x0 * x0 * x0 - a * x0;
    return CurveGroup(a, util::modN(b, N), N);
}

CurveResult CurveGroup::fail(const mpz_class& g) {
    lastFactor_ = g;
    return FactorFound{g};
}

mpz_class CurveGroup::obstruction(const Point& p, const Point& q) const {
    if (p.isInfinity() || q.isInfinity()) return 1;
    mpz_class den;
    if (p == q) den = 2 * p.y();
    else        den = q.x() - p.x();
    mpz_class g;
    mpz_gcd(g.get_mpz_t(), den.get_mpz_t(), N_.get_mpz_t());
    return g;
}

CurveResult CurveGroup::tryAdd(const Point& p, const Point& q) {
    if (p.isInfinity()) return q;
    if (q.isInfinity()) return p;

    const mpz_class px = util::modN(p.x(), N_), py = util::modN(p.y(), N_);
    const mpz_class qx = util::modN(q.x(), N_), qy = util::modN(q.y(), N_);

    mpz_class num, den;
    if (px == qx && py == qy) {
        num = 3 * px * px + a_;
        den = 2 * py;
    } else {
        num = qy - py;
        den = qx - px;
    }
    den = util::modN(den, N_);

    mpz_class g;
    mpz_gcd(g.get_mpz_t(), den.get_mpz_t(), N_.get_mpz_t());
    if (g != 1) return fail(g);

    const mpz_class slope = util::modN(num * modInverse(den, N_), N_);
    const mpz_class x3 = util::modN(slope * slope - px - qx, N_);
    const mpz_class y3 = util::modN(slope * (px - x3) - py, N_);
    return Point(x3, y3);
}

Point CurveGroup::add(const Point& p, const Point& q) {
    return tryAdd(p, q).pointOrInfinity();
}

bool CurveGroup::contains(const Point& p) const {
    if (p.isInfinity()) return true;
    const mpz_class& x = p.x();
    const mpz_class lhs = util::modN(p.y() * p.y(), N_);
    const mpz_class rhs = util::modN(x * x * x + a_ * x + b_, N_);
    return lhs == rhs;
}

} // namespace math

#include "math/ScalarMultiplier.hpp"
#include "util/GmpUtils.hpp"
#include <stdexcept>
#include <vector>

namespace math {

ScalarMultiplier::ScalarMultiplier(CurveGroup& curve)
  : curve_(curve)
{}

CurveResult ScalarMultiplier::tryMultiply(const Point& p, const mpz_class& k) {
    ops_ = 0;
    if (k <= 0) {
        throw std::invalid_argument("ScalarMultiplier: k must be positive, got " + k.get_str());
    }
    if (p.isInfinity()) return p;

    const size_t m = util::bitLength(k);

    std::vector<Point> ladder;
    ladder.reserve(m);
    ladder.push_back(p);
    for (size_t i = 1; i < m; ++i) {
        CurveResult r = curve_.tryAdd(ladder.back(), ladder.back());
        ++ops_;
        if (!r.ok()) return r;
        ladder.push_back(r.point());
    }

    Point acc = Point::infinity();
    for (size_t i = 0; i < m; ++i) {
        if (!mpz_tstbit(k.get_mpz_t(), static_cast<mp_bitcnt_t>(i))) continue;
        CurveResult r = curve_.tryAdd(ladder[i], acc);
        ++ops_;
        if (!r.ok()) return r;
        acc = r.point();
    }
    return acc;
}

Point ScalarMultiplier::multiply(const Point& p, const mpz_class& k) {
    return tryMultiply(p, k).pointOrInfinity();
}

} // namespace math

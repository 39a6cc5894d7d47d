/*
 * Lenstra elliptic curve factorization
 *
 * Driver for a single curve. The curve is picked through a random point
 * (x0, y0) and coefficient a, so b follows and P0 lies on the curve.
 *
 * This code is released as free software.
 */
#include "core/LenstraSearch.hpp"
#include "math/CurveGroup.hpp"
#include "math/ScalarMultiplier.hpp"
#include "util/GmpUtils.hpp"
#include <chrono>
#include <stdexcept>

using namespace std::chrono;

namespace core {

const char* toString(SearchState s) {
    switch (s) {
        case SearchState::Init:      return "init";
        case SearchState::Iterating: return "iterating";
        case SearchState::Found:     return "found";
        case SearchState::Exhausted: return "exhausted";
        case SearchState::Abandoned: return "abandoned";
    }
    return "unknown";
}

LenstraSearch::LenstraSearch(const mpz_class& N,
                             util::RandomSource& rng,
                             const io::SearchOptions& options,
                             Logger* logger)
  : N_(N), rng_(rng), options_(options), logger_(logger)
{
    if (N_ < 2) {
        throw std::invalid_argument("LenstraSearch: N must be >= 2, got " + N_.get_str());
    }
}

SearchResult LenstraSearch::run() {
    auto run_start = high_resolution_clock::now();
    SearchResult res;
    state_ = SearchState::Init;

    const mpz_class x0 = rng_.uniform(1, N_);
    const mpz_class y0 = rng_.uniform(1, N_);
    const mpz_class a  = rng_.uniform(1, N_);
    math::CurveGroup curve = math::CurveGroup::fromPoint(x0, y0, a, N_);
    math::ScalarMultiplier mul(curve);
    math::Point P(util::modN(x0, N_), util::modN(y0, N_));

    res.a = curve.a();
    res.b = curve.b();
    res.start = P;
    if (logger_) {
        logger_->logStart(N_, rng_.seed());
        logger_->logCurve(curve, P);
    }

    state_ = SearchState::Iterating;
    uint64_t i = 1;
    while (!curve.isBroken() && !P.isInfinity()) {
        if (options_.max_iterations && i > options_.max_iterations) {
            state_ = SearchState::Abandoned;
            break;
        }
        math::CurveResult r = mul.tryMultiply(P, util::mpzFromU64(i));
        ++i;
        if (!r.ok()) break;
        P = r.point();
    }

    if (curve.isBroken()) {
        state_ = SearchState::Found;
        res.factor = curve.factorHint();
    } else if (state_ != SearchState::Abandoned) {
        state_ = SearchState::Exhausted;
    }
    res.state = state_;
    res.iterations = i - 1;
    res.elapsed = duration<double>(high_resolution_clock::now() - run_start).count();

    if (logger_) {
        logger_->logEnd(toString(res.state), res.factor, res.iterations, res.elapsed);
        logger_->flush_log();
    }
    return res;
}

mpz_class lenstra(const mpz_class& N, util::RandomSource& rng) {
    return LenstraSearch(N, rng).run().factor;
}

SearchResult runAttempt(const mpz_class& N, const io::SearchOptions& options) {
    util::SplitMixRandom rng(options.seed);
    Logger logger(options.log_file, options.verbose);
    return LenstraSearch(N, rng, options, &logger).run();
}

} // namespace core

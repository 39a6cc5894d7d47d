// core/LenstraSearch.hpp
#ifndef CORE_LENSTRASEARCH_HPP
#define CORE_LENSTRASEARCH_HPP

#include "core/Logger.hpp"
#include "io/ConfigParser.hpp"
#include "math/Point.hpp"
#include "util/Random.hpp"
#include <cstdint>
#include <gmpxx.h>

namespace core {

enum class SearchState { Init, Iterating, Found, Exhausted, Abandoned };

const char* toString(SearchState s);

struct SearchResult {
    mpz_class factor = 1;
    SearchState state = SearchState::Init;
    uint64_t iterations = 0;
    double elapsed = 0.0;
    // curve of the attempt
    mpz_class a = 0;
    mpz_class b = 0;
    math::Point start = math::Point::infinity();
};

/// One ECM attempt on a random curve: P <- i*P for i = 1, 2, 3, ... until a
/// group operation exposes a common factor with N.
///
/// The result factor is a divisor of N in [1, N]; 1 means this curve gave
/// nothing and the caller should retry with fresh randomness.
class LenstraSearch {
public:
    LenstraSearch(const mpz_class& N,
                  util::RandomSource& rng,
                  const io::SearchOptions& options = io::SearchOptions(),
                  Logger* logger = nullptr);

    SearchResult run();
    SearchState state() const { return state_; }

private:
    mpz_class N_;
    util::RandomSource& rng_;
    io::SearchOptions options_;
    Logger* logger_;
    SearchState state_ = SearchState::Init;
};

/// Single attempt with default options; returns the factor only.
mpz_class lenstra(const mpz_class& N, util::RandomSource& rng);

/// Single attempt configured by options: seeds a SplitMixRandom from
/// options.seed and logs to options.log_file.
SearchResult runAttempt(const mpz_class& N, const io::SearchOptions& options);

} // namespace core

#endif // CORE_LENSTRASEARCH_HPP

// util/Random.hpp
#ifndef UTIL_RANDOM_HPP
#define UTIL_RANDOM_HPP

#include <cstdint>
#include <gmpxx.h>

namespace util {

/// Source of the random curve parameters. Tests substitute fixed sequences.
class RandomSource {
public:
    virtual ~RandomSource() = default;
    /// Integer in [lo, hi], inclusive.
    virtual mpz_class uniform(const mpz_class& lo, const mpz_class& hi) = 0;
    virtual uint64_t seed() const { return 0; }
};

/// splitmix64 stream; wide integers are assembled 64 bits at a time.
class SplitMixRandom : public RandomSource {
public:
    /// seed == 0 derives a seed from the clock.
    explicit SplitMixRandom(uint64_t seed = 0);

    mpz_class uniform(const mpz_class& lo, const mpz_class& hi) override;
    uint64_t seed() const override { return seed_; }

    uint64_t next();

private:
    uint64_t seed_;
    uint64_t state_;
};

} // namespace util

#endif // UTIL_RANDOM_HPP

#include "util/Random.hpp"
#include "util/GmpUtils.hpp"
#include <chrono>
#include <stdexcept>

namespace util {

static uint64_t splitmix64_step(uint64_t& x) {
    x += 0x9E3779B97f4A7C15ULL;
    uint64_t z = x;
    z ^= z >> 30; z *= 0xBF58476D1CE4E5B9ULL;
    z ^= z >> 27; z *= 0x94D049BB133111EBULL;
    z ^= z >> 31;
    return z;
}

SplitMixRandom::SplitMixRandom(uint64_t seed)
  : seed_(seed)
{
    if (seed_ == 0) {
        uint64_t now_ns = (uint64_t)std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::high_resolution_clock::now().time_since_epoch()).count();
        uint64_t s = now_ns;
        seed_ = splitmix64_step(s);
        if (seed_ == 0) seed_ = 1;
    }
    state_ = seed_;
}

uint64_t SplitMixRandom::next() {
    return splitmix64_step(state_);
}

// 64 extra bits beyond the width of the range keep the modulo bias negligible.
mpz_class SplitMixRandom::uniform(const mpz_class& lo, const mpz_class& hi) {
    if (hi < lo) {
        throw std::invalid_argument("uniform: empty range [" + lo.get_str() + ", " + hi.get_str() + "]");
    }
    const mpz_class span = hi - lo + 1;
    const size_t bits = bitLength(span) + 64;
    mpz_class z = 0;
    for (size_t i = 0; i < bits; i += 64) {
        z <<= 64;
        z += mpzFromU64(next());
    }
    return lo + modN(z, span);
}

} // namespace util

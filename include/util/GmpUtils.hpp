#pragma once
#include <cstdint>
#include <string>
#include <gmpxx.h>
#include <gmp.h>

// GMP-based modular arithmetic helpers
namespace util {
    mpz_class mpzFromU64(uint64_t v);
    mpz_class modN(const mpz_class& x, const mpz_class& N);
    size_t bitLength(const mpz_class& x);
    std::string toDecimal(const mpz_class& x);
}

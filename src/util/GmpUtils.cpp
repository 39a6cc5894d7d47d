#include "util/GmpUtils.hpp"
#include <climits>

namespace util {

mpz_class mpzFromU64(uint64_t v) {
#if ULONG_MAX == 0xFFFFFFFFFFFFFFFFULL
  return mpz_class(static_cast<unsigned long>(v));
#else
  mpz_class z;
  mpz_import(z.get_mpz_t(), 1, 1, sizeof(v), 0, 0, &v);
  return z;
#endif
}

// x mod N lifted into [0, N); mpz_mod already ignores the sign of N and
// returns a non-negative remainder for a negative x.
mpz_class modN(const mpz_class& x, const mpz_class& N) {
  mpz_class r;
  mpz_mod(r.get_mpz_t(), x.get_mpz_t(), N.get_mpz_t());
  return r;
}

size_t bitLength(const mpz_class& x) {
  if (x == 0) return 0;
  return mpz_sizeinbase(x.get_mpz_t(), 2);
}

std::string toDecimal(const mpz_class& x) {
  return x.get_str(10);
}

} // namespace util

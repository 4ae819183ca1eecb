#include "wecdsa/crypto/random.hpp"

#include <climits>
#include <stdexcept>

#include <openssl/rand.h>

#include "wecdsa/common/secure_zeroize.hpp"
#include "wecdsa/math/encoding.hpp"

namespace wecdsa {

Bytes OpenSslRandomSource::RandomBytes(size_t size) {
  Bytes out(size);
  if (size == 0) {
    return out;
  }
  if (size > static_cast<size_t>(INT_MAX)) {
    throw std::invalid_argument("RandomBytes request is too large");
  }

  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return out;
}

mpz_class OpenSslRandomSource::UniformInRange(const mpz_class& lo, const mpz_class& hi) {
  if (hi <= lo) {
    throw std::invalid_argument("Random range is empty");
  }

  const mpz_class span = hi - lo;
  if (span == 1) {
    return lo;
  }

  const mpz_class max_offset = span - 1;
  const size_t bits = mpz_sizeinbase(max_offset.get_mpz_t(), 2);
  const size_t byte_count = (bits + 7) / 8;

  while (true) {
    Bytes buffer = RandomBytes(byte_count);
    mpz_class candidate = ImportBigEndian(buffer);
    SecureZeroize(&buffer);

    mpz_fdiv_r_2exp(candidate.get_mpz_t(), candidate.get_mpz_t(), bits);
    if (candidate < span) {
      return lo + candidate;
    }
    SecureZeroize(&candidate);
  }
}

}  // namespace wecdsa

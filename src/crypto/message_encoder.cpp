#include "wecdsa/crypto/message_encoder.hpp"

#include <stdexcept>

#include "wecdsa/common/bytes.hpp"
#include "wecdsa/crypto/hash.hpp"
#include "wecdsa/math/encoding.hpp"

namespace wecdsa {
namespace {

constexpr size_t kDigestBits = 256;

}  // namespace

mpz_class Sha256MessageEncoder::Represent(std::span<const uint8_t> message, const mpz_class& n) const {
  if (n <= 0) {
    throw std::domain_error("Group order must be positive");
  }

  const Bytes digest = Sha256(message);
  mpz_class e = ImportBigEndian(digest);

  const size_t order_bits = mpz_sizeinbase(n.get_mpz_t(), 2);
  if (order_bits < kDigestBits) {
    e >>= static_cast<mp_bitcnt_t>(kDigestBits - order_bits);
  }
  return e;
}

}  // namespace wecdsa

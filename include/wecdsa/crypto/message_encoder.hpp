#pragma once

#include <cstdint>
#include <span>

#include <gmpxx.h>

namespace wecdsa {

// Maps message bytes to the integer e used by signing and verification. Must be
// deterministic and bounded independently of the message length.
class MessageEncoder {
 public:
  virtual ~MessageEncoder() = default;

  virtual mpz_class Represent(std::span<const uint8_t> message, const mpz_class& n) const = 0;
};

// Leftmost min(256, bitlen(n)) bits of SHA-256(message).
class Sha256MessageEncoder : public MessageEncoder {
 public:
  mpz_class Represent(std::span<const uint8_t> message, const mpz_class& n) const override;
};

}  // namespace wecdsa

#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "wecdsa/common/bytes.hpp"
#include "wecdsa/crypto/message_encoder.hpp"
#include "wecdsa/crypto/random.hpp"
#include "wecdsa/curve/curve_group.hpp"
#include "wecdsa/curve/domain_parameters.hpp"
#include "wecdsa/ecdsa/keys.hpp"
#include "wecdsa/ecdsa/signature.hpp"

namespace wecdsa {

struct VerifyItem {
  Bytes message;
  PublicKey public_key;
  Signature signature;
};

// ECDSA over one parameter table. Signing and key generation draw from the
// injected random source and are not safe to call concurrently on one instance;
// Verify and VerifyBatch are. params, rng and encoder must outlive the object.
class Ecdsa {
 public:
  Ecdsa(const DomainParameters& params, RandomSource& rng, const MessageEncoder& encoder);
  Ecdsa(const DomainParameters& params,
        RandomSource& rng,
        const MessageEncoder& encoder,
        uint32_t max_sign_attempts);

  Ecdsa(DomainParameters&& params, RandomSource& rng, const MessageEncoder& encoder) = delete;
  Ecdsa(const DomainParameters& params, RandomSource& rng, const MessageEncoder&& encoder) = delete;
  Ecdsa(DomainParameters&& params,
        RandomSource& rng,
        const MessageEncoder& encoder,
        uint32_t max_sign_attempts) = delete;
  Ecdsa(const DomainParameters& params,
        RandomSource& rng,
        const MessageEncoder&& encoder,
        uint32_t max_sign_attempts) = delete;

  const CurveGroup& group() const;

  PrivateKey GeneratePrivateKey();
  KeyPair GenerateKeyPair();

  // Retries on r == 0 or s == 0 up to the attempt cap, then throws
  // std::runtime_error. Throws std::invalid_argument for a key outside
  // [1, n-1] of this curve.
  Signature Sign(std::span<const uint8_t> message, const PrivateKey& key);

  // Never throws for malformed signatures or for a key that is not a point of
  // this curve; they are rejected.
  bool Verify(std::span<const uint8_t> message, const PublicKey& key, const Signature& signature) const;

  // One result per item, in input order. All s values of the batch are
  // inverted with a single modular inversion, then the point checks are split
  // between the calling thread and up to verify_threads - 1 helper threads
  // started for this call only.
  std::vector<bool> VerifyBatch(const std::vector<VerifyItem>& items) const;

 private:
  mpz_class DrawScalar();

  // Cheap structural checks shared by Verify and VerifyBatch.
  bool IsVerifiable(const PublicKey& key, const Signature& signature) const;

  // w is s^-1 mod n.
  bool CheckWithInverse(std::span<const uint8_t> message,
                        const PublicKey& key,
                        const Signature& signature,
                        const mpz_class& w) const;

  CurveGroup group_;
  RandomSource& rng_;
  const MessageEncoder& encoder_;
  uint32_t max_sign_attempts_ = 0;
};

}  // namespace wecdsa

#pragma once

#include <cstdint>
#include <span>

#include <gmpxx.h>

#include "wecdsa/common/bytes.hpp"
#include "wecdsa/curve/curve_group.hpp"
#include "wecdsa/curve/curve_point.hpp"
#include "wecdsa/curve/domain_parameters.hpp"

namespace wecdsa {

// Scalar d in [1, n-1]. The value is wiped when the key is destroyed.
class PrivateKey {
 public:
  // Throw std::invalid_argument when d is outside [1, n-1].
  static PrivateKey FromScalar(const DomainParameters& params, const mpz_class& d);
  static PrivateKey FromBytes(const DomainParameters& params, std::span<const uint8_t> bytes);

  PrivateKey(const PrivateKey& other) = default;
  PrivateKey(PrivateKey&& other) = default;
  // Both assignments wipe the scalar they replace.
  PrivateKey& operator=(const PrivateKey& other);
  PrivateKey& operator=(PrivateKey&& other);
  ~PrivateKey();

  const mpz_class& scalar() const;

  // Big-endian, params.scalar_bytes() wide.
  Bytes ToBytes(const DomainParameters& params) const;

  bool operator==(const PrivateKey& other) const;
  bool operator!=(const PrivateKey& other) const;

 private:
  explicit PrivateKey(mpz_class d);

  mpz_class d_;
};

// Affine point Q = d*G; never the point at infinity.
class PublicKey {
 public:
  static PublicKey FromPrivateKey(const CurveGroup& group, const PrivateKey& key);

  // Throws std::invalid_argument for the point at infinity or a point outside
  // the subgroup generated by G.
  static PublicKey FromPoint(const CurveGroup& group, const CurvePoint& point);
  static PublicKey FromBytes(const CurveGroup& group, std::span<const uint8_t> encoded);

  const CurvePoint& point() const;
  Bytes ToBytes(const CurveGroup& group, bool compressed = true) const;

  bool operator==(const PublicKey& other) const;
  bool operator!=(const PublicKey& other) const;

 private:
  explicit PublicKey(CurvePoint point);

  CurvePoint point_;
};

struct KeyPair {
  PrivateKey private_key;
  PublicKey public_key;
};

}  // namespace wecdsa

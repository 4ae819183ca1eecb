#include "wecdsa/ecdsa/keys.hpp"

#include <stdexcept>
#include <utility>

#include "wecdsa/common/secure_zeroize.hpp"
#include "wecdsa/math/encoding.hpp"

namespace wecdsa {

PrivateKey::PrivateKey(mpz_class d) : d_(std::move(d)) {}

PrivateKey::~PrivateKey() {
  SecureZeroize(&d_);
}

PrivateKey& PrivateKey::operator=(const PrivateKey& other) {
  if (this != &other) {
    SecureZeroize(&d_);
    d_ = other.d_;
  }
  return *this;
}

PrivateKey& PrivateKey::operator=(PrivateKey&& other) {
  if (this != &other) {
    SecureZeroize(&d_);
    d_.swap(other.d_);
  }
  return *this;
}

PrivateKey PrivateKey::FromScalar(const DomainParameters& params, const mpz_class& d) {
  if (d < 1 || d >= params.n()) {
    throw std::invalid_argument("Private key scalar is outside [1, n-1]");
  }
  return PrivateKey(d);
}

PrivateKey PrivateKey::FromBytes(const DomainParameters& params, std::span<const uint8_t> bytes) {
  if (bytes.size() != params.scalar_bytes()) {
    throw std::invalid_argument("Private key encoding has the wrong length");
  }

  mpz_class d = ImportBigEndian(bytes);
  PrivateKey out = FromScalar(params, d);
  SecureZeroize(&d);
  return out;
}

const mpz_class& PrivateKey::scalar() const {
  return d_;
}

Bytes PrivateKey::ToBytes(const DomainParameters& params) const {
  return ExportFixedWidth(d_, params.scalar_bytes());
}

bool PrivateKey::operator==(const PrivateKey& other) const {
  return d_ == other.d_;
}

bool PrivateKey::operator!=(const PrivateKey& other) const {
  return !(*this == other);
}

PublicKey::PublicKey(CurvePoint point) : point_(std::move(point)) {}

PublicKey PublicKey::FromPrivateKey(const CurveGroup& group, const PrivateKey& key) {
  const mpz_class& d = key.scalar();
  if (d < 1 || d >= group.params().n()) {
    throw std::invalid_argument("Private key scalar is outside [1, n-1]");
  }
  return PublicKey(group.MultiplyBase(d));
}

PublicKey PublicKey::FromPoint(const CurveGroup& group, const CurvePoint& point) {
  if (point.is_infinity()) {
    throw std::invalid_argument("Public key cannot be the point at infinity");
  }
  if (!group.Multiply(point, group.params().n()).is_infinity()) {
    throw std::invalid_argument("Public key is not in the subgroup generated by G");
  }
  return PublicKey(point);
}

PublicKey PublicKey::FromBytes(const CurveGroup& group, std::span<const uint8_t> encoded) {
  return FromPoint(group, group.DecodePoint(encoded));
}

const CurvePoint& PublicKey::point() const {
  return point_;
}

Bytes PublicKey::ToBytes(const CurveGroup& group, bool compressed) const {
  return group.EncodePoint(point_, compressed);
}

bool PublicKey::operator==(const PublicKey& other) const {
  return point_ == other.point_;
}

bool PublicKey::operator!=(const PublicKey& other) const {
  return !(*this == other);
}

}  // namespace wecdsa

#include "wecdsa/ecdsa/signature.hpp"

#include <stdexcept>

#include "wecdsa/math/encoding.hpp"

namespace wecdsa {
namespace {

bool InScalarRange(const mpz_class& value, const mpz_class& n) {
  return value >= 1 && value < n;
}

}  // namespace

bool Signature::operator==(const Signature& other) const {
  return r == other.r && s == other.s;
}

bool Signature::operator!=(const Signature& other) const {
  return !(*this == other);
}

bool IsWellFormed(const Signature& signature, const DomainParameters& params) {
  return InScalarRange(signature.r, params.n()) && InScalarRange(signature.s, params.n());
}

bool IsLowS(const Signature& signature, const DomainParameters& params) {
  const mpz_class half_order = params.n() >> 1;
  return signature.s <= half_order;
}

Signature NormalizeLowS(const Signature& signature, const DomainParameters& params) {
  if (IsLowS(signature, params)) {
    return signature;
  }
  return Signature{signature.r, params.n() - signature.s};
}

Bytes EncodeCompact(const Signature& signature, const DomainParameters& params) {
  if (!IsWellFormed(signature, params)) {
    throw std::invalid_argument("Signature components must be in [1, n-1]");
  }

  const size_t width = params.scalar_bytes();
  const Bytes r_bytes = ExportFixedWidth(signature.r, width);
  const Bytes s_bytes = ExportFixedWidth(signature.s, width);

  Bytes out;
  out.reserve(2 * width);
  out.insert(out.end(), r_bytes.begin(), r_bytes.end());
  out.insert(out.end(), s_bytes.begin(), s_bytes.end());
  return out;
}

Signature DecodeCompact(std::span<const uint8_t> encoded, const DomainParameters& params) {
  const size_t width = params.scalar_bytes();
  if (encoded.size() != 2 * width) {
    throw std::invalid_argument("Compact signature has the wrong length");
  }

  Signature out{ImportBigEndian(encoded.first(width)), ImportBigEndian(encoded.subspan(width, width))};
  if (!IsWellFormed(out, params)) {
    throw std::invalid_argument("Compact signature component is outside [1, n-1]");
  }
  return out;
}

}  // namespace wecdsa

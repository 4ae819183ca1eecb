#pragma once

#include <cstdint>
#include <span>

#include <gmpxx.h>

#include "wecdsa/common/bytes.hpp"
#include "wecdsa/curve/domain_parameters.hpp"

namespace wecdsa {

struct Signature {
  mpz_class r;
  mpz_class s;

  bool operator==(const Signature& other) const;
  bool operator!=(const Signature& other) const;
};

// r and s both in [1, n-1].
bool IsWellFormed(const Signature& signature, const DomainParameters& params);

bool IsLowS(const Signature& signature, const DomainParameters& params);

// (r, n - s) when s > n/2, otherwise unchanged. Both forms verify.
Signature NormalizeLowS(const Signature& signature, const DomainParameters& params);

// r || s, each params.scalar_bytes() wide.
Bytes EncodeCompact(const Signature& signature, const DomainParameters& params);

// Throws std::invalid_argument on a wrong length or a component outside [1, n-1].
Signature DecodeCompact(std::span<const uint8_t> encoded, const DomainParameters& params);

}  // namespace wecdsa

#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include <gmpxx.h>

#include "wecdsa/common/bytes.hpp"
#include "wecdsa/curve/curve_point.hpp"
#include "wecdsa/curve/domain_parameters.hpp"

namespace wecdsa {

// Affine group law over one parameter table. The table must outlive the group.
class CurveGroup {
 public:
  explicit CurveGroup(const DomainParameters& params);
  explicit CurveGroup(DomainParameters&& params) = delete;

  const DomainParameters& params() const;

  bool IsOnCurve(const mpz_class& x, const mpz_class& y) const;

  // Throws std::invalid_argument when a coordinate is outside [0, p) or the
  // pair does not satisfy the curve equation.
  CurvePoint MakePoint(const mpz_class& x, const mpz_class& y) const;

  // Point with the given x and y parity, std::nullopt when x^3 + a*x + b is
  // not a square. Requires p = 3 (mod 4).
  std::optional<CurvePoint> LiftX(const mpz_class& x, bool odd_y) const;

  CurvePoint Negate(const CurvePoint& point) const;
  CurvePoint Add(const CurvePoint& lhs, const CurvePoint& rhs) const;

  // A point with y == 0 has order two and doubles to infinity.
  CurvePoint Double(const CurvePoint& point) const;

  // Double-and-add over the significant bits of k, most significant first.
  // Negative k multiplies the negated point.
  CurvePoint Multiply(const CurvePoint& point, const mpz_class& k) const;
  CurvePoint MultiplyU64(const CurvePoint& point, uint64_t k) const;
  CurvePoint MultiplyBase(const mpz_class& k) const;

  // SEC1 encodings: 0x02/0x03 || x, or 0x04 || x || y.
  Bytes EncodePoint(const CurvePoint& point, bool compressed = true) const;
  CurvePoint DecodePoint(std::span<const uint8_t> encoded) const;

 private:
  CurvePoint FromSlope(const CurvePoint& lhs, const CurvePoint& rhs, const mpz_class& lambda) const;

  const DomainParameters& params_;
};

}  // namespace wecdsa

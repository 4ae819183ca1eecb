#include "wecdsa/curve/curve_group.hpp"

#include <stdexcept>

#include "wecdsa/math/encoding.hpp"
#include "wecdsa/math/modular.hpp"

namespace wecdsa {
namespace {

constexpr uint8_t kPrefixEvenY = 0x02;
constexpr uint8_t kPrefixOddY = 0x03;
constexpr uint8_t kPrefixUncompressed = 0x04;

mpz_class InvertOrThrow(const mpz_class& value, const mpz_class& p) {
  const std::optional<mpz_class> inverse = InvMod(value, p);
  if (!inverse.has_value()) {
    throw std::logic_error("Field element has no inverse modulo p");
  }
  return *inverse;
}

}  // namespace

CurveGroup::CurveGroup(const DomainParameters& params) : params_(params) {}

const DomainParameters& CurveGroup::params() const {
  return params_;
}

bool CurveGroup::IsOnCurve(const mpz_class& x, const mpz_class& y) const {
  const mpz_class& p = params_.p();
  if (x < 0 || x >= p || y < 0 || y >= p) {
    return false;
  }

  const mpz_class lhs = MulMod(y, y, p);
  const mpz_class x_cubed = MulMod(MulMod(x, x, p), x, p);
  const mpz_class rhs = AddMod(AddMod(x_cubed, MulMod(params_.a(), x, p), p), params_.b(), p);
  return lhs == rhs;
}

CurvePoint CurveGroup::MakePoint(const mpz_class& x, const mpz_class& y) const {
  if (!IsOnCurve(x, y)) {
    throw std::invalid_argument("Coordinates do not describe a point on " + params_.name());
  }
  return CurvePoint(x, y);
}

std::optional<CurvePoint> CurveGroup::LiftX(const mpz_class& x, bool odd_y) const {
  const mpz_class& p = params_.p();
  if (x < 0 || x >= p) {
    throw std::invalid_argument("x coordinate is outside [0, p)");
  }

  const mpz_class x_cubed = MulMod(MulMod(x, x, p), x, p);
  const mpz_class rhs = AddMod(AddMod(x_cubed, MulMod(params_.a(), x, p), p), params_.b(), p);
  const std::optional<mpz_class> root = SqrtMod(rhs, p);
  if (!root.has_value()) {
    return std::nullopt;
  }

  mpz_class y = *root;
  if ((mpz_odd_p(y.get_mpz_t()) != 0) != odd_y) {
    if (y == 0) {
      return std::nullopt;
    }
    y = p - y;
  }
  return CurvePoint(x, y);
}

CurvePoint CurveGroup::Negate(const CurvePoint& point) const {
  if (point.is_infinity()) {
    return point;
  }
  return CurvePoint(point.x(), Modulus(-point.y(), params_.p()));
}

CurvePoint CurveGroup::Add(const CurvePoint& lhs, const CurvePoint& rhs) const {
  if (lhs.is_infinity()) {
    return rhs;
  }
  if (rhs.is_infinity()) {
    return lhs;
  }
  if (lhs == rhs) {
    return Double(lhs);
  }
  if (lhs.x() == rhs.x()) {
    // Same x with different y: rhs == -lhs.
    return CurvePoint::Infinity();
  }

  const mpz_class& p = params_.p();
  const mpz_class lambda =
      MulMod(SubMod(rhs.y(), lhs.y(), p), InvertOrThrow(SubMod(rhs.x(), lhs.x(), p), p), p);
  return FromSlope(lhs, rhs, lambda);
}

CurvePoint CurveGroup::Double(const CurvePoint& point) const {
  if (point.is_infinity() || point.y() == 0) {
    return CurvePoint::Infinity();
  }

  const mpz_class& p = params_.p();
  const mpz_class numerator = AddMod(MulMod(3, MulMod(point.x(), point.x(), p), p), params_.a(), p);
  const mpz_class lambda = MulMod(numerator, InvertOrThrow(MulMod(2, point.y(), p), p), p);
  return FromSlope(point, point, lambda);
}

CurvePoint CurveGroup::FromSlope(const CurvePoint& lhs,
                                 const CurvePoint& rhs,
                                 const mpz_class& lambda) const {
  const mpz_class& p = params_.p();
  const mpz_class x = SubMod(SubMod(MulMod(lambda, lambda, p), lhs.x(), p), rhs.x(), p);
  const mpz_class y = SubMod(MulMod(lambda, SubMod(lhs.x(), x, p), p), lhs.y(), p);
  return CurvePoint(x, y);
}

CurvePoint CurveGroup::Multiply(const CurvePoint& point, const mpz_class& k) const {
  if (k < 0) {
    return Multiply(Negate(point), -k);
  }

  CurvePoint acc = CurvePoint::Infinity();
  if (k == 0 || point.is_infinity()) {
    return acc;
  }

  const size_t bits = mpz_sizeinbase(k.get_mpz_t(), 2);
  for (size_t i = bits; i-- > 0;) {
    acc = Double(acc);
    if (mpz_tstbit(k.get_mpz_t(), i) != 0) {
      acc = Add(acc, point);
    }
  }
  return acc;
}

CurvePoint CurveGroup::MultiplyU64(const CurvePoint& point, uint64_t k) const {
  return Multiply(point, mpz_class(k));
}

CurvePoint CurveGroup::MultiplyBase(const mpz_class& k) const {
  return Multiply(params_.G(), k);
}

Bytes CurveGroup::EncodePoint(const CurvePoint& point, bool compressed) const {
  if (point.is_infinity()) {
    throw std::invalid_argument("Point at infinity has no SEC1 encoding");
  }

  const size_t width = params_.field_bytes();
  const Bytes x_bytes = ExportFixedWidth(point.x(), width);

  Bytes out;
  out.reserve(1 + (compressed ? width : 2 * width));
  if (compressed) {
    out.push_back(mpz_odd_p(point.y().get_mpz_t()) != 0 ? kPrefixOddY : kPrefixEvenY);
    out.insert(out.end(), x_bytes.begin(), x_bytes.end());
    return out;
  }

  const Bytes y_bytes = ExportFixedWidth(point.y(), width);
  out.push_back(kPrefixUncompressed);
  out.insert(out.end(), x_bytes.begin(), x_bytes.end());
  out.insert(out.end(), y_bytes.begin(), y_bytes.end());
  return out;
}

CurvePoint CurveGroup::DecodePoint(std::span<const uint8_t> encoded) const {
  const size_t width = params_.field_bytes();
  if (encoded.empty()) {
    throw std::invalid_argument("Encoded point is empty");
  }

  const uint8_t prefix = encoded[0];
  if (prefix == kPrefixEvenY || prefix == kPrefixOddY) {
    if (encoded.size() != 1 + width) {
      throw std::invalid_argument("Compressed point has the wrong length");
    }
    const mpz_class x = ImportBigEndian(encoded.subspan(1, width));
    if (x >= params_.p()) {
      throw std::invalid_argument("Compressed point x is not reduced");
    }
    std::optional<CurvePoint> lifted = LiftX(x, prefix == kPrefixOddY);
    if (!lifted.has_value()) {
      throw std::invalid_argument("Compressed point is not on " + params_.name());
    }
    return *lifted;
  }

  if (prefix == kPrefixUncompressed) {
    if (encoded.size() != 1 + 2 * width) {
      throw std::invalid_argument("Uncompressed point has the wrong length");
    }
    return MakePoint(ImportBigEndian(encoded.subspan(1, width)),
                     ImportBigEndian(encoded.subspan(1 + width, width)));
  }

  throw std::invalid_argument("Unknown SEC1 point prefix");
}

}  // namespace wecdsa

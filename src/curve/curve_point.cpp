#include "wecdsa/curve/curve_point.hpp"

#include <stdexcept>
#include <utility>

namespace wecdsa {

CurvePoint::CurvePoint() = default;

CurvePoint::CurvePoint(mpz_class x, mpz_class y) : affine_(Affine{std::move(x), std::move(y)}) {}

CurvePoint CurvePoint::Infinity() {
  return CurvePoint();
}

bool CurvePoint::is_infinity() const {
  return !affine_.has_value();
}

const mpz_class& CurvePoint::x() const {
  if (!affine_.has_value()) {
    throw std::logic_error("Point at infinity has no x coordinate");
  }
  return affine_->x;
}

const mpz_class& CurvePoint::y() const {
  if (!affine_.has_value()) {
    throw std::logic_error("Point at infinity has no y coordinate");
  }
  return affine_->y;
}

bool CurvePoint::operator==(const CurvePoint& other) const {
  if (is_infinity() || other.is_infinity()) {
    return is_infinity() && other.is_infinity();
  }
  return affine_->x == other.affine_->x && affine_->y == other.affine_->y;
}

bool CurvePoint::operator!=(const CurvePoint& other) const {
  return !(*this == other);
}

std::string CurvePoint::ToString() const {
  if (is_infinity()) {
    return "infinity";
  }
  return "(0x" + affine_->x.get_str(16) + ", 0x" + affine_->y.get_str(16) + ")";
}

}  // namespace wecdsa

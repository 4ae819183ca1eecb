#pragma once

#include <optional>
#include <string>

#include <gmpxx.h>

namespace wecdsa {

class CurveGroup;
class DomainParameters;

// Either the point at infinity or an affine point known to satisfy the curve
// equation of the group that produced it. Affine points are only minted by
// CurveGroup and DomainParameters, both of which check or derive the relation.
class CurvePoint {
 public:
  CurvePoint();

  static CurvePoint Infinity();

  bool is_infinity() const;

  // Throw std::logic_error on the point at infinity.
  const mpz_class& x() const;
  const mpz_class& y() const;

  bool operator==(const CurvePoint& other) const;
  bool operator!=(const CurvePoint& other) const;

  std::string ToString() const;

 private:
  friend class CurveGroup;
  friend class DomainParameters;

  struct Affine {
    mpz_class x;
    mpz_class y;
  };

  CurvePoint(mpz_class x, mpz_class y);

  std::optional<Affine> affine_;
};

}  // namespace wecdsa

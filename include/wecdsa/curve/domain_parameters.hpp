#pragma once

#include <cstddef>
#include <string>

#include <gmpxx.h>

#include "wecdsa/curve/curve_point.hpp"

namespace wecdsa {

// Curve y^2 = x^3 + a*x + b over GF(p) with base point G of prime order n.
// Immutable once built; share it by const reference.
class DomainParameters {
 public:
  // Throws std::invalid_argument unless p and n are prime, p > 3, a and b are
  // reduced, the curve is non-singular, G lies on it and n*G is the identity.
  static DomainParameters Create(std::string name,
                                 const mpz_class& a,
                                 const mpz_class& b,
                                 const mpz_class& p,
                                 const mpz_class& gx,
                                 const mpz_class& gy,
                                 const mpz_class& n);

  static const DomainParameters& Secp256k1();

  const std::string& name() const;
  const mpz_class& a() const;
  const mpz_class& b() const;
  const mpz_class& p() const;
  const CurvePoint& G() const;
  const mpz_class& n() const;

  // Big-endian widths of a field element and of a scalar.
  size_t field_bytes() const;
  size_t scalar_bytes() const;

 private:
  DomainParameters(std::string name,
                   mpz_class a,
                   mpz_class b,
                   mpz_class p,
                   CurvePoint g,
                   mpz_class n);

  std::string name_;
  mpz_class a_;
  mpz_class b_;
  mpz_class p_;
  CurvePoint g_;
  mpz_class n_;
};

}  // namespace wecdsa

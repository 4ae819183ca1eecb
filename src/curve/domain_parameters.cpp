#include "wecdsa/curve/domain_parameters.hpp"

#include <stdexcept>
#include <utility>

#include "wecdsa/curve/curve_group.hpp"
#include "wecdsa/math/modular.hpp"

namespace wecdsa {
namespace {

constexpr int kPrimalityRounds = 32;

bool IsProbablePrime(const mpz_class& value) {
  return mpz_probab_prime_p(value.get_mpz_t(), kPrimalityRounds) != 0;
}

size_t ByteWidth(const mpz_class& value) {
  return (mpz_sizeinbase(value.get_mpz_t(), 2) + 7) / 8;
}

}  // namespace

DomainParameters::DomainParameters(std::string name,
                                   mpz_class a,
                                   mpz_class b,
                                   mpz_class p,
                                   CurvePoint g,
                                   mpz_class n)
    : name_(std::move(name)),
      a_(std::move(a)),
      b_(std::move(b)),
      p_(std::move(p)),
      g_(std::move(g)),
      n_(std::move(n)) {}

DomainParameters DomainParameters::Create(std::string name,
                                          const mpz_class& a,
                                          const mpz_class& b,
                                          const mpz_class& p,
                                          const mpz_class& gx,
                                          const mpz_class& gy,
                                          const mpz_class& n) {
  if (p <= 3 || !IsProbablePrime(p)) {
    throw std::invalid_argument("Field modulus must be a prime greater than 3");
  }
  if (a < 0 || a >= p || b < 0 || b >= p) {
    throw std::invalid_argument("Curve coefficients must be reduced modulo p");
  }

  const mpz_class a_cubed = MulMod(MulMod(a, a, p), a, p);
  const mpz_class discriminant = AddMod(MulMod(4, a_cubed, p), MulMod(27, MulMod(b, b, p), p), p);
  if (discriminant == 0) {
    throw std::invalid_argument("Curve is singular");
  }

  if (n <= 1 || !IsProbablePrime(n)) {
    throw std::invalid_argument("Group order must be prime");
  }

  DomainParameters params(std::move(name), a, b, p, CurvePoint(), n);
  const CurveGroup group(params);
  params.g_ = group.MakePoint(gx, gy);
  if (!group.Multiply(params.g_, n).is_infinity()) {
    throw std::invalid_argument("Base point order does not match n");
  }
  return params;
}

const DomainParameters& DomainParameters::Secp256k1() {
  static const DomainParameters kSecp256k1 = Create(
      "secp256k1",
      mpz_class(0),
      mpz_class(7),
      mpz_class("0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEFFFFFC2F"),
      mpz_class("0x79BE667EF9DCBBAC55A06295CE870B07029BFCDB2DCE28D959F2815B16F81798"),
      mpz_class("0x483ADA7726A3C4655DA4FBFC0E1108A8FD17B448A68554199C47D08FFB10D4B8"),
      mpz_class("0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141"));
  return kSecp256k1;
}

const std::string& DomainParameters::name() const {
  return name_;
}

const mpz_class& DomainParameters::a() const {
  return a_;
}

const mpz_class& DomainParameters::b() const {
  return b_;
}

const mpz_class& DomainParameters::p() const {
  return p_;
}

const CurvePoint& DomainParameters::G() const {
  return g_;
}

const mpz_class& DomainParameters::n() const {
  return n_;
}

size_t DomainParameters::field_bytes() const {
  return ByteWidth(p_);
}

size_t DomainParameters::scalar_bytes() const {
  return ByteWidth(n_);
}

}  // namespace wecdsa

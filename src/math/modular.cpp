#include "wecdsa/math/modular.hpp"

#include <stdexcept>

namespace wecdsa {
namespace {

void RequirePositiveModulus(const mpz_class& m) {
  if (m <= 0) {
    throw std::domain_error("Modulus must be positive");
  }
}

}  // namespace

mpz_class Modulus(const mpz_class& x, const mpz_class& m) {
  RequirePositiveModulus(m);

  // mpz_class % truncates toward zero, so the remainder carries the sign of x.
  mpz_class rem = x % m;
  if (rem < 0) {
    rem = (rem + m) % m;
  }
  return rem;
}

mpz_class AddMod(const mpz_class& x, const mpz_class& y, const mpz_class& m) {
  return Modulus(Modulus(x, m) + Modulus(y, m), m);
}

mpz_class SubMod(const mpz_class& x, const mpz_class& y, const mpz_class& m) {
  return Modulus(Modulus(x, m) - Modulus(y, m), m);
}

mpz_class MulMod(const mpz_class& x, const mpz_class& y, const mpz_class& m) {
  return Modulus(Modulus(x, m) * Modulus(y, m), m);
}

mpz_class PowMod(const mpz_class& x, const mpz_class& e, const mpz_class& m) {
  RequirePositiveModulus(m);
  if (e < 0) {
    throw std::invalid_argument("PowMod exponent must be non-negative");
  }

  const mpz_class base = Modulus(x, m);
  mpz_class result = Modulus(mpz_class(1), m);
  if (e == 0) {
    return result;
  }

  const size_t bits = mpz_sizeinbase(e.get_mpz_t(), 2);
  for (size_t i = bits; i-- > 0;) {
    result = MulMod(result, result, m);
    if (mpz_tstbit(e.get_mpz_t(), i) != 0) {
      result = MulMod(result, base, m);
    }
  }
  return result;
}

std::optional<mpz_class> InvMod(const mpz_class& x, const mpz_class& m) {
  RequirePositiveModulus(m);

  const GcdResult egcd = ExtendedGcd(Modulus(x, m), m);
  if (egcd.gcd != 1) {
    return std::nullopt;
  }
  return Modulus(egcd.u, m);
}

GcdResult ExtendedGcd(const mpz_class& a, const mpz_class& b) {
  if (a < 0 || b < 0) {
    throw std::invalid_argument("ExtendedGcd operands must be non-negative");
  }

  if (a == 0) {
    return GcdResult{b, 0, 1};
  }

  // gcd(b mod a, a) = x * (b mod a) + y * a, and b mod a = b - (b / a) * a.
  const GcdResult inner = ExtendedGcd(Modulus(b, a), a);
  const mpz_class quotient = b / a;
  return GcdResult{inner.gcd, inner.v - inner.u * quotient, inner.u};
}

std::optional<mpz_class> SqrtMod(const mpz_class& x, const mpz_class& p) {
  RequirePositiveModulus(p);
  if (Modulus(p, 4) != 3) {
    throw std::invalid_argument("SqrtMod supports only p = 3 (mod 4)");
  }

  const mpz_class reduced = Modulus(x, p);
  const mpz_class candidate = PowMod(reduced, (p + 1) / 4, p);
  if (MulMod(candidate, candidate, p) != reduced) {
    return std::nullopt;
  }
  return candidate;
}

}  // namespace wecdsa

#pragma once

#include <optional>

#include <gmpxx.h>

namespace wecdsa {

// Bezout triple: u * a + v * b == gcd.
struct GcdResult {
  mpz_class gcd;
  mpz_class u;
  mpz_class v;
};

// Every function below throws std::domain_error when the modulus is not
// positive. Results are canonical residues in [0, m).

mpz_class Modulus(const mpz_class& x, const mpz_class& m);

mpz_class AddMod(const mpz_class& x, const mpz_class& y, const mpz_class& m);
mpz_class SubMod(const mpz_class& x, const mpz_class& y, const mpz_class& m);
mpz_class MulMod(const mpz_class& x, const mpz_class& y, const mpz_class& m);

// Left-to-right square-and-multiply. Negative exponents are rejected with
// std::invalid_argument.
mpz_class PowMod(const mpz_class& x, const mpz_class& e, const mpz_class& m);

// std::nullopt when gcd(x, m) != 1.
std::optional<mpz_class> InvMod(const mpz_class& x, const mpz_class& m);

// Extended Euclid for a, b >= 0. gcd(0, b) == (b, 0, 1).
GcdResult ExtendedGcd(const mpz_class& a, const mpz_class& b);

// Square root modulo a prime p with p = 3 (mod 4). std::nullopt when x is not a
// quadratic residue; std::invalid_argument for other moduli.
std::optional<mpz_class> SqrtMod(const mpz_class& x, const mpz_class& p);

}  // namespace wecdsa

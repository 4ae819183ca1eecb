#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <gmpxx.h>

#include "wecdsa/crypto/random.hpp"
#include "wecdsa/math/encoding.hpp"
#include "wecdsa/math/modular.hpp"

namespace {

using wecdsa::AddMod;
using wecdsa::Bytes;
using wecdsa::ExportFixedWidth;
using wecdsa::ExtendedGcd;
using wecdsa::GcdResult;
using wecdsa::ImportBigEndian;
using wecdsa::InvMod;
using wecdsa::Modulus;
using wecdsa::MulMod;
using wecdsa::OpenSslRandomSource;
using wecdsa::PowMod;
using wecdsa::SqrtMod;
using wecdsa::SubMod;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

void ExpectThrow(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const std::exception&) {
    return;
  }
  throw std::runtime_error("Expected exception: " + message);
}

const mpz_class kSecp256k1P("0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEFFFFFC2F");
const mpz_class kSecp256k1N("0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141");

struct ModulusCase {
  mpz_class x;
  mpz_class m;
  mpz_class expected;
};

void TestModulusCanonicalResidue() {
  const std::vector<ModulusCase> cases = {
      {3, 11, 3},   {10, 17, 10}, {22, 5, 2},  {25, 7, 4},         {100, 30, 10}, {-15, 4, 1},
      {12345, 678, 141}, {0, 5, 0}, {19, 19, 0}, {1, 1, 0},        {-1, 2, 1},    {6, 3, 0},
      {-38, 19, 0}, {-kSecp256k1P - 5, kSecp256k1P, kSecp256k1P - 5},
  };

  for (const ModulusCase& c : cases) {
    const mpz_class got = Modulus(c.x, c.m);
    Expect(got == c.expected,
           "Modulus(" + c.x.get_str() + ", " + c.m.get_str() + ") should be " + c.expected.get_str() +
               ", got " + got.get_str());
    Expect(got >= 0 && got < c.m, "Modulus result must be in [0, m)");
  }
}

void TestModulusRejectsNonPositiveModulus() {
  ExpectThrow([]() { (void)Modulus(3, 0); }, "Modulus with m == 0");
  ExpectThrow([]() { (void)Modulus(-15, 0); }, "Modulus with m == 0 and negative x");
  ExpectThrow([]() { (void)Modulus(3, -7); }, "Modulus with negative m");
  ExpectThrow([]() { (void)MulMod(3, 4, 0); }, "MulMod with m == 0");
  ExpectThrow([]() { (void)InvMod(3, 0); }, "InvMod with m == 0");

  try {
    (void)AddMod(1, 1, 0);
  } catch (const std::domain_error&) {
    return;
  }
  throw std::runtime_error("Test failed: zero modulus must raise std::domain_error");
}

void TestAddSubMulReduceOperandsFirst() {
  Expect(AddMod(-3, -4, 5) == 3, "(-3 + -4) mod 5 == 3");
  Expect(AddMod(kSecp256k1P - 1, 2, kSecp256k1P) == 1, "addition wraps around p");
  Expect(SubMod(2, 5, 7) == 4, "(2 - 5) mod 7 == 4");
  Expect(SubMod(-2, 41, 7) == 6, "(-2 - 41) mod 7 == 6");
  Expect(MulMod(-3, 5, 7) == 6, "(-3 * 5) mod 7 == 6");
  Expect(MulMod(kSecp256k1P - 1, kSecp256k1P - 1, kSecp256k1P) == 1, "(-1)^2 == 1 mod p");

  const mpz_class big_a("123456789012345678901234567890123456789012345678901234567890");
  const mpz_class big_b("-98765432109876543210987654321098765432109876543210");
  mpz_class expected = (big_a * big_b) % kSecp256k1N;
  if (expected < 0) {
    expected += kSecp256k1N;
  }
  Expect(MulMod(big_a, big_b, kSecp256k1N) == expected, "MulMod matches direct reduction");
}

void TestPowModMatchesGmp() {
  Expect(PowMod(2, 10, 1000) == 24, "2^10 mod 1000 == 24");
  Expect(PowMod(5, 0, 13) == 1, "x^0 == 1");
  Expect(PowMod(5, 0, 1) == 0, "anything mod 1 == 0");
  Expect(PowMod(-2, 3, 7) == 6, "(-2)^3 mod 7 == 6");
  ExpectThrow([]() { (void)PowMod(2, -1, 7); }, "PowMod rejects negative exponents");

  OpenSslRandomSource rng;
  for (int i = 0; i < 16; ++i) {
    const mpz_class base = rng.UniformInRange(0, kSecp256k1P);
    const mpz_class exp = rng.UniformInRange(0, kSecp256k1N);
    mpz_class expected;
    mpz_powm(expected.get_mpz_t(), base.get_mpz_t(), exp.get_mpz_t(), kSecp256k1P.get_mpz_t());
    Expect(PowMod(base, exp, kSecp256k1P) == expected, "PowMod must agree with mpz_powm");
  }

  // Fermat: a^(p-1) == 1 for a prime p not dividing a.
  Expect(PowMod(7, kSecp256k1P - 1, kSecp256k1P) == 1, "Fermat little theorem on secp256k1 p");
}

void TestExtendedGcd() {
  struct GcdCase {
    mpz_class a;
    mpz_class b;
    mpz_class gcd;
  };
  const std::vector<GcdCase> cases = {
      {1, 1, 1},    {48, 18, 6},  {180, 48, 12}, {270, 192, 6},     {8, 3, 1},
      {21, 10, 1},  {0, 48, 48},  {48, 0, 48},   {987654, 123456, 6},
      {mpz_class("1241231234124"), 13124, 4},
  };

  for (const GcdCase& c : cases) {
    const GcdResult result = ExtendedGcd(c.a, c.b);
    Expect(result.gcd == c.gcd, "gcd(" + c.a.get_str() + ", " + c.b.get_str() + ") == " + c.gcd.get_str());
    Expect(result.u * c.a + result.v * c.b == result.gcd, "Bezout identity must hold");
  }

  const GcdResult base = ExtendedGcd(0, 7);
  Expect(base.gcd == 7 && base.u == 0 && base.v == 1, "gcd(0, b) == (b, 0, 1)");

  OpenSslRandomSource rng;
  for (int i = 0; i < 16; ++i) {
    const mpz_class a = rng.UniformInRange(0, kSecp256k1P);
    const mpz_class b = rng.UniformInRange(1, kSecp256k1P);
    const GcdResult result = ExtendedGcd(a, b);
    mpz_class expected;
    mpz_gcd(expected.get_mpz_t(), a.get_mpz_t(), b.get_mpz_t());
    Expect(result.gcd == expected, "ExtendedGcd must agree with mpz_gcd");
    Expect(result.u * a + result.v * b == result.gcd, "Bezout identity on 256-bit operands");
  }

  ExpectThrow([]() { (void)ExtendedGcd(-4, 6); }, "ExtendedGcd rejects negative operands");
}

void TestInvMod() {
  Expect(InvMod(3, 11) == mpz_class(4), "3^-1 mod 11 == 4");
  Expect(InvMod(10, 17) == mpz_class(12), "10^-1 mod 17 == 12");
  Expect(InvMod(2, 5) == mpz_class(3), "2^-1 mod 5 == 3");
  Expect(InvMod(mpz_class(1514511242), 123) == mpz_class(53), "1514511242^-1 mod 123 == 53");
  Expect(InvMod(-3, 11) == mpz_class(7), "negative operands are reduced first");

  Expect(!InvMod(2, 4).has_value(), "2 has no inverse mod 4");
  Expect(!InvMod(0, 19).has_value(), "0 has no inverse");
  Expect(!InvMod(kSecp256k1N, kSecp256k1N).has_value(), "n has no inverse mod n");
  Expect(!InvMod(6, 9).has_value(), "6 has no inverse mod 9");

  OpenSslRandomSource rng;
  for (int i = 0; i < 32; ++i) {
    const mpz_class x = rng.UniformInRange(1, kSecp256k1N);
    const std::optional<mpz_class> inv = InvMod(x, kSecp256k1N);
    Expect(inv.has_value(), "non-zero scalar must be invertible mod n");
    Expect(MulMod(x, *inv, kSecp256k1N) == 1, "x * x^-1 == 1 mod n");

    mpz_class expected;
    mpz_invert(expected.get_mpz_t(), x.get_mpz_t(), kSecp256k1N.get_mpz_t());
    Expect(*inv == expected, "InvMod must agree with mpz_invert");
  }

  for (int m = 2; m < 60; ++m) {
    for (int x = -m; x <= 2 * m; ++x) {
      mpz_class g;
      mpz_gcd(g.get_mpz_t(), mpz_class(x).get_mpz_t(), mpz_class(m).get_mpz_t());
      const std::optional<mpz_class> inv = InvMod(x, m);
      if (g == 1) {
        Expect(inv.has_value() && MulMod(x, *inv, m) == 1, "coprime inputs must invert");
        Expect(*inv >= 0 && *inv < m, "inverse must be canonical");
      } else {
        Expect(!inv.has_value(), "non-coprime inputs must report absence");
      }
    }
  }
}

void TestSqrtMod() {
  const std::optional<mpz_class> root = SqrtMod(2, 7);
  Expect(root.has_value() && MulMod(*root, *root, 7) == 2, "2 is a square mod 7");
  Expect(!SqrtMod(3, 7).has_value(), "3 is not a square mod 7");
  Expect(SqrtMod(0, 7) == mpz_class(0), "sqrt(0) == 0");
  ExpectThrow([]() { (void)SqrtMod(2, 17); }, "SqrtMod needs p = 3 mod 4");

  OpenSslRandomSource rng;
  for (int i = 0; i < 8; ++i) {
    const mpz_class x = rng.UniformInRange(0, kSecp256k1P);
    const mpz_class square = MulMod(x, x, kSecp256k1P);
    const std::optional<mpz_class> r = SqrtMod(square, kSecp256k1P);
    Expect(r.has_value(), "a square must have a root");
    Expect(*r == x || *r == kSecp256k1P - x, "root must be +/- x");
  }
}

void TestFixedWidthEncoding() {
  const Bytes five = ExportFixedWidth(5, 4);
  Expect(five == Bytes({0, 0, 0, 5}), "5 encodes as 00000005");
  Expect(ExportFixedWidth(0, 3) == Bytes(3, 0), "zero encodes as all-zero bytes");
  Expect(ImportBigEndian(five) == 5, "import reverses export");
  Expect(ImportBigEndian(Bytes{}) == 0, "empty import is zero");

  const Bytes p_bytes = ExportFixedWidth(kSecp256k1P, 32);
  Expect(p_bytes.size() == 32 && p_bytes.front() == 0xFF && p_bytes.back() == 0x2F, "p encodes to 32 bytes");
  ExpectThrow([]() { (void)ExportFixedWidth(256, 1); }, "value wider than width");
  ExpectThrow([]() { (void)ExportFixedWidth(-1, 4); }, "negative value");
}

}  // namespace

int main() {
  try {
    TestModulusCanonicalResidue();
    TestModulusRejectsNonPositiveModulus();
    TestAddSubMulReduceOperandsFirst();
    TestPowModMatchesGmp();
    TestExtendedGcd();
    TestInvMod();
    TestSqrtMod();
    TestFixedWidthEncoding();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Modular arithmetic tests passed" << '\n';
  return 0;
}

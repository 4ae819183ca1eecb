#include "wecdsa/ecdsa/ecdsa.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include "wecdsa/common/config.hpp"
#include "wecdsa/common/secure_zeroize.hpp"
#include "wecdsa/math/modular.hpp"

namespace wecdsa {
namespace {

// Montgomery's trick: prefix products, one inversion of the total, then a
// backward sweep. Every value must be a unit modulo n.
std::vector<mpz_class> BatchInvert(const std::vector<mpz_class>& values, const mpz_class& n) {
  std::vector<mpz_class> out(values.size());
  if (values.empty()) {
    return out;
  }

  std::vector<mpz_class> prefix(values.size());
  prefix[0] = Modulus(values[0], n);
  for (size_t i = 1; i < values.size(); ++i) {
    prefix[i] = MulMod(prefix[i - 1], values[i], n);
  }

  const std::optional<mpz_class> total_inverse = InvMod(prefix.back(), n);
  if (!total_inverse.has_value()) {
    throw std::logic_error("Batch product has no inverse modulo n");
  }

  mpz_class running = *total_inverse;
  for (size_t i = values.size() - 1; i > 0; --i) {
    out[i] = MulMod(prefix[i - 1], running, n);
    running = MulMod(running, values[i], n);
  }
  out[0] = running;
  return out;
}

}  // namespace

Ecdsa::Ecdsa(const DomainParameters& params, RandomSource& rng, const MessageEncoder& encoder)
    : Ecdsa(params, rng, encoder, GetRuntimeConfig().max_sign_attempts) {}

Ecdsa::Ecdsa(const DomainParameters& params,
             RandomSource& rng,
             const MessageEncoder& encoder,
             uint32_t max_sign_attempts)
    : group_(params), rng_(rng), encoder_(encoder), max_sign_attempts_(max_sign_attempts) {
  if (max_sign_attempts_ == 0) {
    throw std::invalid_argument("max_sign_attempts must be > 0");
  }
}

const CurveGroup& Ecdsa::group() const {
  return group_;
}

mpz_class Ecdsa::DrawScalar() {
  const mpz_class& n = group_.params().n();
  mpz_class value = rng_.UniformInRange(1, n);
  if (value < 1 || value >= n) {
    SecureZeroize(&value);
    throw std::runtime_error("Random source returned a scalar outside [1, n-1]");
  }
  return value;
}

PrivateKey Ecdsa::GeneratePrivateKey() {
  mpz_class d = DrawScalar();
  PrivateKey key = PrivateKey::FromScalar(group_.params(), d);
  SecureZeroize(&d);
  return key;
}

KeyPair Ecdsa::GenerateKeyPair() {
  PrivateKey private_key = GeneratePrivateKey();
  PublicKey public_key = PublicKey::FromPrivateKey(group_, private_key);
  return KeyPair{std::move(private_key), std::move(public_key)};
}

Signature Ecdsa::Sign(std::span<const uint8_t> message, const PrivateKey& key) {
  const mpz_class& n = group_.params().n();
  const mpz_class& d = key.scalar();
  if (d < 1 || d >= n) {
    throw std::invalid_argument("Private key scalar is outside [1, n-1]");
  }

  const mpz_class e = encoder_.Represent(message, n);

  for (uint32_t attempt = 0; attempt < max_sign_attempts_; ++attempt) {
    mpz_class k = DrawScalar();

    const CurvePoint big_r = group_.MultiplyBase(k);
    const mpz_class r = big_r.is_infinity() ? mpz_class(0) : Modulus(big_r.x(), n);
    if (r == 0) {
      SecureZeroize(&k);
      continue;
    }

    std::optional<mpz_class> k_inv = InvMod(k, n);
    SecureZeroize(&k);
    if (!k_inv.has_value()) {
      continue;
    }

    const mpz_class s = MulMod(*k_inv, AddMod(e, MulMod(r, d, n), n), n);
    SecureZeroize(&k_inv);
    if (s == 0) {
      continue;
    }
    return Signature{r, s};
  }

  throw std::runtime_error("Signing exhausted its nonce attempts");
}

bool Ecdsa::IsVerifiable(const PublicKey& key, const Signature& signature) const {
  if (!IsWellFormed(signature, group_.params())) {
    return false;
  }
  const CurvePoint& q = key.point();
  if (q.is_infinity()) {
    return false;
  }
  // A key built against another table is not a point of this group.
  return group_.IsOnCurve(q.x(), q.y());
}

bool Ecdsa::CheckWithInverse(std::span<const uint8_t> message,
                             const PublicKey& key,
                             const Signature& signature,
                             const mpz_class& w) const {
  const mpz_class& n = group_.params().n();
  const mpz_class e = encoder_.Represent(message, n);
  const mpz_class u = MulMod(e, w, n);
  const mpz_class v = MulMod(signature.r, w, n);

  const CurvePoint c = group_.Add(group_.MultiplyBase(u), group_.Multiply(key.point(), v));
  if (c.is_infinity()) {
    return false;
  }
  return Modulus(c.x(), n) == signature.r;
}

bool Ecdsa::Verify(std::span<const uint8_t> message,
                   const PublicKey& key,
                   const Signature& signature) const {
  if (!IsVerifiable(key, signature)) {
    return false;
  }

  const std::optional<mpz_class> w = InvMod(signature.s, group_.params().n());
  if (!w.has_value()) {
    return false;
  }
  return CheckWithInverse(message, key, signature, *w);
}

std::vector<bool> Ecdsa::VerifyBatch(const std::vector<VerifyItem>& items) const {
  std::vector<bool> results(items.size(), false);

  std::vector<size_t> pending;
  std::vector<mpz_class> s_values;
  pending.reserve(items.size());
  s_values.reserve(items.size());
  for (size_t i = 0; i < items.size(); ++i) {
    if (IsVerifiable(items[i].public_key, items[i].signature)) {
      pending.push_back(i);
      s_values.push_back(items[i].signature.s);
    }
  }
  if (pending.empty()) {
    return results;
  }

  // n is prime and every pending s is in [1, n-1], so the product is a unit.
  const std::vector<mpz_class> s_inverses = BatchInvert(s_values, group_.params().n());

  std::vector<uint8_t> accepted(pending.size(), 0);
  std::atomic<size_t> next_item{0};
  auto drain = [&]() {
    for (size_t j = next_item.fetch_add(1); j < pending.size(); j = next_item.fetch_add(1)) {
      const VerifyItem& item = items[pending[j]];
      accepted[j] = CheckWithInverse(item.message, item.public_key, item.signature, s_inverses[j]) ? 1 : 0;
    }
  };

  const size_t worker_count = std::min(GetRuntimeConfig().verify_threads, pending.size());
  std::vector<std::exception_ptr> errors(std::max<size_t>(worker_count, 1));
  std::vector<std::thread> helpers;
  helpers.reserve(errors.size() - 1);
  for (size_t t = 1; t < errors.size(); ++t) {
    try {
      helpers.emplace_back([&drain, &errors, t]() {
        try {
          drain();
        } catch (...) {
          errors[t] = std::current_exception();
        }
      });
    } catch (const std::system_error&) {
      // The calling thread drains whatever the started helpers leave.
      break;
    }
  }

  try {
    drain();
  } catch (...) {
    errors[0] = std::current_exception();
  }
  for (std::thread& helper : helpers) {
    helper.join();
  }
  for (const std::exception_ptr& error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }

  for (size_t j = 0; j < pending.size(); ++j) {
    results[pending[j]] = accepted[j] != 0;
  }
  return results;
}

}  // namespace wecdsa

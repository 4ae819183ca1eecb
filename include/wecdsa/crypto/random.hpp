#pragma once

#include <cstddef>

#include <gmpxx.h>

#include "wecdsa/common/bytes.hpp"

namespace wecdsa {

// Source of uniform integers. Implementations need not be thread-safe; give
// each signing thread its own instance.
class RandomSource {
 public:
  virtual ~RandomSource() = default;

  // Uniform in [lo, hi). Throws std::invalid_argument when hi <= lo.
  virtual mpz_class UniformInRange(const mpz_class& lo, const mpz_class& hi) = 0;
};

// RAND_bytes with rejection sampling over the smallest covering bit width.
class OpenSslRandomSource : public RandomSource {
 public:
  static Bytes RandomBytes(size_t size);

  mpz_class UniformInRange(const mpz_class& lo, const mpz_class& hi) override;
};

}  // namespace wecdsa

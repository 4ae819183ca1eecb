#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include <gmpxx.h>

#include "wecdsa/common/bytes.hpp"

namespace wecdsa {

inline void SecureZeroizeMemory(void* data, size_t size) noexcept {
  if (data == nullptr || size == 0) {
    return;
  }

  volatile uint8_t* ptr = static_cast<volatile uint8_t*>(data);
  while (size > 0) {
    *ptr = 0;
    ++ptr;
    --size;
  }
}

inline void SecureZeroize(Bytes* value) noexcept {
  if (value == nullptr) {
    return;
  }
  if (!value->empty()) {
    SecureZeroizeMemory(value->data(), value->size());
  }
  value->clear();
}

// Overwrites the limbs in use before dropping the value to zero. Limbs GMP
// released during earlier reallocations are out of reach.
inline void SecureZeroize(mpz_class* value) noexcept {
  if (value == nullptr) {
    return;
  }

  mpz_ptr raw = value->get_mpz_t();
  const size_t limb_count = mpz_size(raw);
  if (limb_count > 0) {
    mp_limb_t* limbs = mpz_limbs_modify(raw, static_cast<mp_size_t>(limb_count));
    SecureZeroizeMemory(limbs, limb_count * sizeof(mp_limb_t));
  }
  mpz_limbs_finish(raw, 0);
}

inline void SecureZeroize(std::optional<mpz_class>* value) noexcept {
  if (value == nullptr) {
    return;
  }
  if (value->has_value()) {
    SecureZeroize(&value->value());
  }
  value->reset();
}

}  // namespace wecdsa

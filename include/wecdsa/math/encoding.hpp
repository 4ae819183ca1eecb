#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include <gmpxx.h>

#include "wecdsa/common/bytes.hpp"

namespace wecdsa {

// Unsigned big-endian import. An empty span is zero.
mpz_class ImportBigEndian(std::span<const uint8_t> bytes);

// Left-pads to exactly `width` bytes. Throws std::invalid_argument for
// negative values or values wider than `width`.
Bytes ExportFixedWidth(const mpz_class& value, size_t width);

}  // namespace wecdsa

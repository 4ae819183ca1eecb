#pragma once

#include <span>

#include "wecdsa/common/bytes.hpp"

namespace wecdsa {

Bytes Sha256(std::span<const uint8_t> data);

}  // namespace wecdsa

#pragma once

#include <cstdint>
#include <vector>

namespace wecdsa {

using Bytes = std::vector<uint8_t>;

}  // namespace wecdsa

#include "wecdsa/crypto/hash.hpp"

#include <array>
#include <stdexcept>

#include <openssl/sha.h>

namespace wecdsa {

Bytes Sha256(std::span<const uint8_t> data) {
  std::array<uint8_t, SHA256_DIGEST_LENGTH> digest{};
  if (SHA256(data.data(), data.size(), digest.data()) == nullptr) {
    throw std::runtime_error("SHA256 failed");
  }
  return Bytes(digest.begin(), digest.end());
}

}  // namespace wecdsa

#include "wecdsa/common/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <optional>
#include <thread>

namespace wecdsa {
namespace {

std::optional<unsigned long> ReadPositiveEnv(const char* name) {
  const char* env = std::getenv(name);
  if (env == nullptr || env[0] == '\0') {
    return std::nullopt;
  }

  char* end = nullptr;
  const unsigned long parsed = std::strtoul(env, &end, 10);
  if (end == env || end == nullptr || *end != '\0' || parsed == 0) {
    return std::nullopt;
  }
  return parsed;
}

size_t DefaultVerifyThreads() {
  const unsigned int hw = std::thread::hardware_concurrency();
  return std::max<size_t>(1, hw == 0 ? 1 : hw);
}

}  // namespace

RuntimeConfig LoadRuntimeConfigFromEnv() {
  RuntimeConfig cfg;
  cfg.verify_threads = DefaultVerifyThreads();

  if (const auto attempts = ReadPositiveEnv("WECDSA_MAX_SIGN_ATTEMPTS")) {
    cfg.max_sign_attempts = static_cast<uint32_t>(
        std::min<unsigned long>(*attempts, std::numeric_limits<uint32_t>::max()));
  }
  if (const auto threads = ReadPositiveEnv("WECDSA_VERIFY_THREADS")) {
    cfg.verify_threads = static_cast<size_t>(*threads);
  }
  return cfg;
}

const RuntimeConfig& GetRuntimeConfig() {
  static const RuntimeConfig cfg = LoadRuntimeConfigFromEnv();
  return cfg;
}

}  // namespace wecdsa

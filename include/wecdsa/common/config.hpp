#pragma once

#include <cstddef>
#include <cstdint>

namespace wecdsa {

struct RuntimeConfig {
  uint32_t max_sign_attempts = 64;
  size_t verify_threads = 1;
};

// Reads WECDSA_MAX_SIGN_ATTEMPTS and WECDSA_VERIFY_THREADS. Missing, zero or
// unparseable values keep the defaults.
RuntimeConfig LoadRuntimeConfigFromEnv();

// Loaded on first use and fixed for the rest of the process.
const RuntimeConfig& GetRuntimeConfig();

}  // namespace wecdsa

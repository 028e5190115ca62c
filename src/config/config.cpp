#include "zv/config.h"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <string>

#include "zv/core/key_derivation.h"
#include "zv/error.h"

namespace zv::config {

namespace {

[[noreturn]] void ThrowInvalid(const char* name, const std::string& value, const char* why) {
  throw zv::Error(zv::ErrorDomain::Config, zv::errors::config::kInvalidValue,
                  std::string("Invalid ") + name + "='" + value + "': " + why);
}

uint64_t ParseUnsigned(const char* name, const std::string& value, uint64_t max) {
  uint64_t parsed = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size()) {
    ThrowInvalid(name, value, "expected a non-negative integer");
  }
  if (parsed > max) {
    ThrowInvalid(name, value, "value out of range");
  }
  return parsed;
}

std::optional<std::string> ProcessEnv(const char* name) {
  const char* raw = std::getenv(name);
  if (!raw || *raw == '\0') {
    return std::nullopt;
  }
  return std::string(raw);
}

}  // namespace

const char* VaultKdfName(VaultKdf kdf) noexcept {
  switch (kdf) {
  case VaultKdf::kPbkdf2:
    return "pbkdf2";
  case VaultKdf::kArgon2id:
    return "argon2id";
  }
  return "unknown";
}

EngineConfig LoadFromEnvironment() {
  return LoadFromEnvironment(ProcessEnv);
}

EngineConfig LoadFromEnvironment(const EnvLookup& lookup) {
  EngineConfig config;

  if (auto value = lookup("ZV_PBKDF2_ITERATIONS")) {
    const auto parsed = ParseUnsigned("ZV_PBKDF2_ITERATIONS", *value,
                                      std::numeric_limits<int32_t>::max());
    if (parsed < zv::core::kMinPbkdf2Iterations) {
      throw zv::Error(zv::ErrorDomain::Config, zv::errors::config::kIterationsBelowFloor,
                      "ZV_PBKDF2_ITERATIONS must be at least " +
                          std::to_string(zv::core::kMinPbkdf2Iterations));
    }
    config.pbkdf2_iterations = static_cast<uint32_t>(parsed);
  }
  if (auto value = lookup("ZV_VAULT_DIR")) {
    config.vault_dir = *value;
  }
  if (auto value = lookup("ZV_VAULT_KDF")) {
    if (*value == "pbkdf2") {
      config.vault_kdf = VaultKdf::kPbkdf2;
    } else if (*value == "argon2id") {
      config.vault_kdf = VaultKdf::kArgon2id;
    } else {
      ThrowInvalid("ZV_VAULT_KDF", *value, "expected pbkdf2 or argon2id");
    }
  }
  if (auto value = lookup("ZV_MAX_FILE_SIZE")) {
    config.max_file_size = ParseUnsigned("ZV_MAX_FILE_SIZE", *value, std::numeric_limits<uint64_t>::max());
    if (config.max_file_size == 0) {
      ThrowInvalid("ZV_MAX_FILE_SIZE", *value, "must be positive");
    }
  }
  if (auto value = lookup("ZV_MAX_BATCH_FILES")) {
    config.max_batch_files =
        static_cast<size_t>(ParseUnsigned("ZV_MAX_BATCH_FILES", *value, 10000));
    if (config.max_batch_files == 0) {
      ThrowInvalid("ZV_MAX_BATCH_FILES", *value, "must be positive");
    }
  }
  if (auto value = lookup("ZV_IDLE_TIMEOUT_SECONDS")) {
    config.idle_timeout = std::chrono::seconds(static_cast<int64_t>(
        ParseUnsigned("ZV_IDLE_TIMEOUT_SECONDS", *value, 7ull * 24ull * 3600ull)));
  }
  if (auto value = lookup("ZV_LOG_DIR")) {
    config.log_dir = *value;
  }
  if (auto value = lookup("ZV_LOG_MAX_SIZE")) {
    config.log_max_bytes = ParseUnsigned("ZV_LOG_MAX_SIZE", *value, std::numeric_limits<uint64_t>::max());
    if (config.log_max_bytes == 0) {
      ThrowInvalid("ZV_LOG_MAX_SIZE", *value, "must be positive");
    }
  }
  return config;
}

}  // namespace zv::config

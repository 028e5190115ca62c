#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace zv::config {

enum class VaultKdf : uint8_t { kPbkdf2 = 1, kArgon2id = 2 };

struct EngineConfig {
  uint32_t pbkdf2_iterations{100000};
  std::filesystem::path vault_dir{"vault"};
  VaultKdf vault_kdf{VaultKdf::kPbkdf2};
  uint64_t max_file_size{50ull * 1024ull * 1024ull};
  size_t max_batch_files{10};
  std::chrono::seconds idle_timeout{0};
  std::filesystem::path log_dir{"logs"};
  uint64_t log_max_bytes{10ull * 1024ull * 1024ull};
};

// Looks up a variable; nullopt when unset or empty.
using EnvLookup = std::function<std::optional<std::string>(const char*)>;

// Defaults overridden by ZV_* variables. Throws zv::Error (Config) on values
// that do not parse or fall outside their allowed range.
EngineConfig LoadFromEnvironment();
EngineConfig LoadFromEnvironment(const EnvLookup& lookup);

const char* VaultKdfName(VaultKdf kdf) noexcept;

}  // namespace zv::config

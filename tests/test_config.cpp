#include "zv/config.h"

#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include "zv/error.h"

namespace {

zv::config::EnvLookup FakeEnv(std::map<std::string, std::string> values) {
  return [values = std::move(values)](const char* name) -> std::optional<std::string> {
    auto it = values.find(name);
    if (it == values.end() || it->second.empty()) {
      return std::nullopt;
    }
    return it->second;
  };
}

int ErrorCodeOf(std::map<std::string, std::string> values) {
  try {
    (void)zv::config::LoadFromEnvironment(FakeEnv(std::move(values)));
  } catch (const zv::Error& err) {
    assert(err.domain == zv::ErrorDomain::Config && "config errors use the config domain");
    return err.code;
  }
  return 0;
}

}  // namespace

int main() {
  using zv::config::VaultKdf;

  const auto defaults = zv::config::LoadFromEnvironment(FakeEnv({}));
  assert(defaults.pbkdf2_iterations == 100000 && "default iterations");
  assert(defaults.vault_dir == "vault" && defaults.log_dir == "logs" && "default directories");
  assert(defaults.vault_kdf == VaultKdf::kPbkdf2 && "default vault kdf");
  assert(defaults.max_file_size == 50ull * 1024 * 1024 && defaults.max_batch_files == 10 &&
         "default upload limits");
  assert(defaults.idle_timeout == std::chrono::seconds(0) && "idle lock off by default");

  const auto custom = zv::config::LoadFromEnvironment(FakeEnv({
      {"ZV_PBKDF2_ITERATIONS", "600000"},
      {"ZV_VAULT_DIR", "/var/lib/zv"},
      {"ZV_VAULT_KDF", "argon2id"},
      {"ZV_MAX_FILE_SIZE", "1048576"},
      {"ZV_MAX_BATCH_FILES", "3"},
      {"ZV_IDLE_TIMEOUT_SECONDS", "900"},
      {"ZV_LOG_DIR", "/tmp/zv-logs"},
      {"ZV_LOG_MAX_SIZE", "4096"},
      {"ZV_UNRELATED", "ignored"},
  }));
  assert(custom.pbkdf2_iterations == 600000 && "iterations override");
  assert(custom.vault_dir == "/var/lib/zv" && custom.log_dir == "/tmp/zv-logs" && "directory overrides");
  assert(custom.vault_kdf == VaultKdf::kArgon2id && "kdf override");
  assert(custom.max_file_size == 1048576 && custom.max_batch_files == 3 && "limit overrides");
  assert(custom.idle_timeout == std::chrono::seconds(900) && "idle override");
  assert(custom.log_max_bytes == 4096 && "log size override");

  assert(zv::config::LoadFromEnvironment(FakeEnv({{"ZV_PBKDF2_ITERATIONS", ""}})).pbkdf2_iterations ==
             100000 &&
         "empty values fall back to defaults");

  assert(ErrorCodeOf({{"ZV_PBKDF2_ITERATIONS", "99999"}}) == zv::errors::config::kIterationsBelowFloor &&
         "iteration floor");
  assert(ErrorCodeOf({{"ZV_PBKDF2_ITERATIONS", "lots"}}) == zv::errors::config::kInvalidValue &&
         "non-numeric iterations");
  assert(ErrorCodeOf({{"ZV_PBKDF2_ITERATIONS", "-5"}}) == zv::errors::config::kInvalidValue &&
         "negative iterations");
  assert(ErrorCodeOf({{"ZV_VAULT_KDF", "scrypt"}}) == zv::errors::config::kInvalidValue && "unknown kdf");
  assert(ErrorCodeOf({{"ZV_MAX_FILE_SIZE", "0"}}) == zv::errors::config::kInvalidValue &&
         "zero file size");
  assert(ErrorCodeOf({{"ZV_MAX_BATCH_FILES", "10001"}}) == zv::errors::config::kInvalidValue &&
         "batch limit range");
  assert(ErrorCodeOf({{"ZV_IDLE_TIMEOUT_SECONDS", "12s"}}) == zv::errors::config::kInvalidValue &&
         "trailing characters");
  assert(ErrorCodeOf({{"ZV_LOG_MAX_SIZE", "0"}}) == zv::errors::config::kInvalidValue && "zero log size");

  assert(std::string(zv::config::VaultKdfName(VaultKdf::kPbkdf2)) == "pbkdf2" &&
         std::string(zv::config::VaultKdfName(VaultKdf::kArgon2id)) == "argon2id" && "kdf names");

  std::cout << "config tests ok\n";
  return 0;
}

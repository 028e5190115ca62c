#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "zv/config.h"
#include "zv/core/aead.h"
#include "zv/core/key_derivation.h"
#include "zv/crypto/symmetric_key.h"
#include "zv/vault/vault_store.h"

namespace zv::vault {

inline constexpr uint8_t kVaultEntryVersion = 1;

// How storage keys are derived from the session secret. Iterations apply to
// PBKDF2; the argon2_* fields apply to Argon2id.
struct VaultKdfPolicy {
  config::VaultKdf kdf{config::VaultKdf::kPbkdf2};
  uint32_t pbkdf2_iterations{core::kMinPbkdf2Iterations};
  uint32_t argon2_time_cost{3};
  uint32_t argon2_memory_kib{64 * 1024};
  uint32_t argon2_parallelism{1};

  static VaultKdfPolicy FromConfig(const config::EngineConfig& cfg);
};

// Persisted form of one wrapped master key. For Argon2id entries |iterations|
// holds the time cost.
struct VaultEntry {
  uint8_t version{kVaultEntryVersion};
  std::string user_id;
  config::VaultKdf kdf{config::VaultKdf::kPbkdf2};
  uint32_t iterations{0};
  uint32_t argon2_memory_kib{0};
  uint32_t argon2_parallelism{0};
  core::Salt storage_salt{};
  core::aead::Nonce nonce{};
  std::vector<uint8_t> wrapped_key;
  uint64_t created_at{0};
};

std::vector<uint8_t> EncodeVaultEntry(const VaultEntry& entry);
// Throws zv::Error (Validation/vault::kCorruptEntry or kUnsupportedVersion).
VaultEntry DecodeVaultEntry(std::span<const uint8_t> bytes);

enum class VaultStatus { kOk, kNotFound, kWrongSecret };

struct VaultLookup {
  VaultStatus status{VaultStatus::kNotFound};
  std::optional<crypto::SymmetricKey> key;
};

const char* VaultStatusName(VaultStatus status) noexcept;

// Keeps each user's master key wrapped under a key derived from a session
// secret. Neither the secret nor anything derived from it is persisted.
class KeyVault {
 public:
  explicit KeyVault(std::shared_ptr<VaultStore> store, VaultKdfPolicy policy = {});

  // Overwrites any existing entry for |user_id|.
  void Store(std::string_view user_id, const crypto::SymmetricKey& master_key,
             std::string_view session_secret);
  VaultLookup Retrieve(std::string_view user_id, std::string_view session_secret);
  bool Delete(std::string_view user_id);
  // False on store errors as well as on absence; errors are logged.
  bool Exists(std::string_view user_id);
  void ClearAll();
  // Re-wraps the stored key under |new_secret|. The entry is left untouched
  // unless the status is kOk.
  VaultStatus Rekey(std::string_view user_id, std::string_view old_secret,
                    std::string_view new_secret);

  [[nodiscard]] const VaultKdfPolicy& policy() const noexcept { return policy_; }

 private:
  std::optional<VaultEntry> Load(std::string_view user_id);
  std::optional<crypto::SymmetricKey> Unwrap(const VaultEntry& entry,
                                             std::string_view session_secret);
  VaultEntry Wrap(std::string_view user_id, const crypto::SymmetricKey& master_key,
                  std::string_view session_secret);

  std::shared_ptr<VaultStore> store_;
  VaultKdfPolicy policy_;
};

}  // namespace zv::vault

#include "zv/vault/key_vault.h"

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>

#include "zv/common.h"
#include "zv/error.h"
#include "zv/errors.h"
#include "zv/orchestrator/event_bus.h"
#include "zv/security/secure_buffer.h"
#include "zv/tlv/parser.h"
#include "zv/tlv/writer.h"

#if defined(ZV_HAVE_ARGON2) && ZV_HAVE_ARGON2
#include <argon2.h>
#endif

namespace zv::vault {

namespace {

enum EntryField : uint16_t {
  kFieldVersion = 1,
  kFieldUserId = 2,
  kFieldKdf = 3,
  kFieldIterations = 4,
  kFieldSalt = 5,
  kFieldNonce = 6,
  kFieldWrapped = 7,
  kFieldCreatedAt = 8,
  kFieldArgon2Memory = 9,
  kFieldArgon2Parallelism = 10,
};

constexpr size_t kWrappedKeySize = crypto::SymmetricKey::kSize + core::aead::kTagSize;

[[noreturn]] void ThrowCorrupt(const std::string& detail) {
  throw zv::Error(zv::ErrorDomain::Validation, zv::errors::vault::kCorruptEntry,
                  std::string(zv::errors::msg::kVaultEntryCorrupt) + ": " + detail);
}

void RequireUserId(std::string_view user_id) {
  if (user_id.empty()) {
    throw zv::Error(zv::ErrorDomain::Validation, zv::errors::validation::kEmptyUserId,
                    std::string(zv::errors::msg::kVaultUserIdRequired));
  }
}

void PublishVaultEvent(std::string_view event_id, std::string_view user_id,
                       orchestrator::EventSeverity severity, std::string_view message,
                       std::vector<orchestrator::EventField> extra = {}) {
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kSecurity;
  event.severity = severity;
  event.event_id = std::string(event_id);
  event.message = std::string(message);
  event.fields.emplace_back("user_id", std::string(user_id), orchestrator::FieldPrivacy::kHash);
  for (auto& field : extra) {
    event.fields.push_back(std::move(field));
  }
  orchestrator::EventBus::Instance().Publish(event);
}

uint64_t UnixSecondsNow() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

crypto::SymmetricKey DerivePbkdf2StorageKey(std::string_view secret, const VaultEntry& entry) {
  return core::DeriveMasterKey(secret, std::span<const uint8_t>(entry.storage_salt),
                               entry.iterations);
}

crypto::SymmetricKey DeriveArgon2StorageKey(std::string_view secret, const VaultEntry& entry) {
#if defined(ZV_HAVE_ARGON2) && ZV_HAVE_ARGON2
  security::SecureBuffer<uint8_t> output(crypto::SymmetricKey::kSize);
  int rc = argon2id_hash_raw(entry.iterations, entry.argon2_memory_kib, entry.argon2_parallelism,
                             secret.data(), secret.size(), entry.storage_salt.data(),
                             entry.storage_salt.size(), output.data(), output.size());
  if (rc != ARGON2_OK) {
    throw zv::Error(zv::ErrorDomain::Crypto, zv::errors::crypto::kKdfFailed,
                    std::string(zv::errors::msg::kArgon2DerivationFailed) + ": " +
                        argon2_error_message(rc),
                    rc);
  }
  return crypto::SymmetricKey(std::move(output));
#else
  (void)secret;
  (void)entry;
  throw zv::Error(zv::ErrorDomain::Dependency, zv::errors::dependency::kArgon2Unavailable,
                  std::string(zv::errors::msg::kArgon2Unavailable));
#endif
}

crypto::SymmetricKey DeriveStorageKey(std::string_view secret, const VaultEntry& entry) {
  switch (entry.kdf) {
    case config::VaultKdf::kPbkdf2:
      return DerivePbkdf2StorageKey(secret, entry);
    case config::VaultKdf::kArgon2id:
      return DeriveArgon2StorageKey(secret, entry);
  }
  ThrowCorrupt("unknown kdf");
}

}  // namespace

VaultKdfPolicy VaultKdfPolicy::FromConfig(const config::EngineConfig& cfg) {
  VaultKdfPolicy policy;
  policy.kdf = cfg.vault_kdf;
  policy.pbkdf2_iterations = cfg.pbkdf2_iterations;
  return policy;
}

const char* VaultStatusName(VaultStatus status) noexcept {
  switch (status) {
    case VaultStatus::kOk:
      return "ok";
    case VaultStatus::kNotFound:
      return "not_found";
    case VaultStatus::kWrongSecret:
      return "wrong_secret";
  }
  return "unknown";
}

std::vector<uint8_t> EncodeVaultEntry(const VaultEntry& entry) {
  tlv::Writer writer;
  writer.AppendU8(kFieldVersion, entry.version)
      .AppendString(kFieldUserId, entry.user_id)
      .AppendU8(kFieldKdf, static_cast<uint8_t>(entry.kdf))
      .AppendU32(kFieldIterations, entry.iterations)
      .Append(kFieldSalt, entry.storage_salt)
      .Append(kFieldNonce, entry.nonce)
      .Append(kFieldWrapped, entry.wrapped_key)
      .AppendU64(kFieldCreatedAt, entry.created_at);
  if (entry.kdf == config::VaultKdf::kArgon2id) {
    writer.AppendU32(kFieldArgon2Memory, entry.argon2_memory_kib)
        .AppendU32(kFieldArgon2Parallelism, entry.argon2_parallelism);
  }
  return writer.Release();
}

VaultEntry DecodeVaultEntry(std::span<const uint8_t> bytes) {
  tlv::Parser parser(bytes);
  if (!parser.valid() || parser.consumed() != bytes.size()) {
    ThrowCorrupt("record stream invalid");
  }

  VaultEntry entry;
  auto version = parser.FindU8(kFieldVersion);
  if (!version) {
    ThrowCorrupt("missing version");
  }
  if (*version != kVaultEntryVersion) {
    throw zv::Error(zv::ErrorDomain::Validation, zv::errors::vault::kUnsupportedVersion,
                    std::string(zv::errors::msg::kVaultEntryVersion) + " (" +
                        std::to_string(*version) + ")");
  }
  entry.version = *version;

  auto user_id = parser.FindString(kFieldUserId);
  if (!user_id || user_id->empty()) {
    ThrowCorrupt("missing user id");
  }
  entry.user_id = std::move(*user_id);

  auto kdf = parser.FindU8(kFieldKdf);
  if (!kdf || (*kdf != static_cast<uint8_t>(config::VaultKdf::kPbkdf2) &&
               *kdf != static_cast<uint8_t>(config::VaultKdf::kArgon2id))) {
    ThrowCorrupt("unknown kdf");
  }
  entry.kdf = static_cast<config::VaultKdf>(*kdf);

  auto iterations = parser.FindU32(kFieldIterations);
  if (!iterations || *iterations == 0) {
    ThrowCorrupt("missing iterations");
  }
  if (entry.kdf == config::VaultKdf::kPbkdf2 && *iterations < core::kMinPbkdf2Iterations) {
    ThrowCorrupt("iterations below floor");
  }
  entry.iterations = *iterations;

  if (entry.kdf == config::VaultKdf::kArgon2id) {
    auto memory = parser.FindU32(kFieldArgon2Memory);
    auto lanes = parser.FindU32(kFieldArgon2Parallelism);
    if (!memory || !lanes || *memory == 0 || *lanes == 0) {
      ThrowCorrupt("missing argon2 parameters");
    }
    entry.argon2_memory_kib = *memory;
    entry.argon2_parallelism = *lanes;
  }

  auto salt = parser.Find(kFieldSalt);
  if (!salt || salt->size() != core::kSaltSize) {
    ThrowCorrupt("bad salt");
  }
  std::copy(salt->begin(), salt->end(), entry.storage_salt.begin());

  auto nonce = parser.Find(kFieldNonce);
  if (!nonce || nonce->size() != core::aead::kNonceSize) {
    ThrowCorrupt("bad nonce");
  }
  std::copy(nonce->begin(), nonce->end(), entry.nonce.begin());

  auto wrapped = parser.Find(kFieldWrapped);
  if (!wrapped || wrapped->size() != kWrappedKeySize) {
    ThrowCorrupt("bad wrapped key");
  }
  entry.wrapped_key.assign(wrapped->begin(), wrapped->end());

  auto created_at = parser.FindU64(kFieldCreatedAt);
  if (!created_at) {
    ThrowCorrupt("missing timestamp");
  }
  entry.created_at = *created_at;
  return entry;
}

KeyVault::KeyVault(std::shared_ptr<VaultStore> store, VaultKdfPolicy policy)
    : store_(std::move(store)), policy_(policy) {
  if (!store_) {
    throw zv::Error(zv::ErrorDomain::Internal, 0, "KeyVault requires a store");
  }
  if (policy_.kdf == config::VaultKdf::kPbkdf2 &&
      policy_.pbkdf2_iterations < core::kMinPbkdf2Iterations) {
    throw zv::Error(zv::ErrorDomain::Config, zv::errors::config::kIterationsBelowFloor,
                    std::string(zv::errors::msg::kIterationsTooLow));
  }
}

VaultEntry KeyVault::Wrap(std::string_view user_id, const crypto::SymmetricKey& master_key,
                          std::string_view session_secret) {
  VaultEntry entry;
  entry.user_id = std::string(user_id);
  entry.kdf = policy_.kdf;
  if (policy_.kdf == config::VaultKdf::kArgon2id) {
    entry.iterations = policy_.argon2_time_cost;
    entry.argon2_memory_kib = policy_.argon2_memory_kib;
    entry.argon2_parallelism = policy_.argon2_parallelism;
  } else {
    entry.iterations = policy_.pbkdf2_iterations;
  }
  entry.storage_salt = core::GenerateSalt();
  entry.nonce = core::aead::GenerateNonce();
  entry.created_at = UnixSecondsNow();

  auto storage_key = DeriveStorageKey(session_secret, entry);
  auto raw = master_key.Export();
  entry.wrapped_key = core::aead::Seal(storage_key, entry.nonce, raw.AsU8Span());
  return entry;
}

std::optional<crypto::SymmetricKey> KeyVault::Unwrap(const VaultEntry& entry,
                                                     std::string_view session_secret) {
  auto storage_key = DeriveStorageKey(session_secret, entry);
  try {
    auto raw = core::aead::OpenSecure(storage_key, entry.nonce, entry.wrapped_key);
    return crypto::SymmetricKey(std::move(raw));
  } catch (const AuthenticationFailureError&) {
    return std::nullopt;
  }
}

std::optional<VaultEntry> KeyVault::Load(std::string_view user_id) {
  auto bytes = store_->Get(user_id);
  if (!bytes) {
    return std::nullopt;
  }
  VaultEntry entry = DecodeVaultEntry(*bytes);
  if (entry.user_id != user_id) {
    ThrowCorrupt("user id mismatch");
  }
  return entry;
}

void KeyVault::Store(std::string_view user_id, const crypto::SymmetricKey& master_key,
                     std::string_view session_secret) {
  RequireUserId(user_id);
  const VaultEntry entry = Wrap(user_id, master_key, session_secret);
  store_->Put(user_id, EncodeVaultEntry(entry));
  PublishVaultEvent("vault_store", user_id, orchestrator::EventSeverity::kInfo,
                    "Master key stored",
                    {orchestrator::EventField("kdf", config::VaultKdfName(entry.kdf))});
}

VaultLookup KeyVault::Retrieve(std::string_view user_id, std::string_view session_secret) {
  RequireUserId(user_id);
  VaultLookup lookup;
  auto entry = Load(user_id);
  if (!entry) {
    lookup.status = VaultStatus::kNotFound;
  } else if (auto key = Unwrap(*entry, session_secret)) {
    lookup.status = VaultStatus::kOk;
    lookup.key = std::move(key);
  } else {
    lookup.status = VaultStatus::kWrongSecret;
  }
  PublishVaultEvent("vault_retrieve", user_id,
                    lookup.status == VaultStatus::kWrongSecret
                        ? orchestrator::EventSeverity::kWarning
                        : orchestrator::EventSeverity::kInfo,
                    "Master key lookup",
                    {orchestrator::EventField("status", VaultStatusName(lookup.status))});
  return lookup;
}

bool KeyVault::Delete(std::string_view user_id) {
  RequireUserId(user_id);
  const bool removed = store_->Remove(user_id);
  if (removed) {
    PublishVaultEvent("vault_delete", user_id, orchestrator::EventSeverity::kInfo,
                      "Master key removed");
  }
  return removed;
}

bool KeyVault::Exists(std::string_view user_id) {
  if (user_id.empty()) {
    return false;
  }
  try {
    return store_->Contains(user_id);
  } catch (const zv::Error& err) {
    PublishVaultEvent("vault_exists_failed", user_id, orchestrator::EventSeverity::kWarning,
                      "Vault lookup failed",
                      {orchestrator::EventField("reason", err.what())});
    return false;
  }
}

void KeyVault::ClearAll() {
  store_->Clear();
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kSecurity;
  event.severity = orchestrator::EventSeverity::kInfo;
  event.event_id = "vault_clear";
  event.message = "All stored master keys removed";
  orchestrator::EventBus::Instance().Publish(event);
}

VaultStatus KeyVault::Rekey(std::string_view user_id, std::string_view old_secret,
                            std::string_view new_secret) {
  RequireUserId(user_id);
  auto entry = Load(user_id);
  if (!entry) {
    return VaultStatus::kNotFound;
  }
  auto key = Unwrap(*entry, old_secret);
  if (!key) {
    PublishVaultEvent("vault_rekey", user_id, orchestrator::EventSeverity::kWarning,
                      "Vault rekey rejected",
                      {orchestrator::EventField("status", VaultStatusName(VaultStatus::kWrongSecret))});
    return VaultStatus::kWrongSecret;
  }
  const VaultEntry rewrapped = Wrap(user_id, *key, new_secret);
  store_->Put(user_id, EncodeVaultEntry(rewrapped));
  PublishVaultEvent("vault_rekey", user_id, orchestrator::EventSeverity::kInfo,
                    "Vault entry rewrapped");
  return VaultStatus::kOk;
}

}  // namespace zv::vault

#include "zv/vault/key_vault.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "zv/crypto/provider.h"
#include "zv/crypto/sha256.h"
#include "zv/error.h"
#include "zv/orchestrator/event_bus.h"

namespace {

template <typename Fn>
int ErrorCodeOf(Fn&& fn) {
  try {
    fn();
  } catch (const zv::Error& err) {
    return err.code;
  }
  return 0;
}

// Store that refuses every operation, for the error paths.
class FailingStore : public zv::vault::VaultStore {
 public:
  void Put(std::string_view, std::span<const uint8_t>) override { Fail(); }
  std::optional<std::vector<uint8_t>> Get(std::string_view) override { Fail(); }
  bool Remove(std::string_view) override { Fail(); }
  bool Contains(std::string_view) override { Fail(); }
  void Clear() override { Fail(); }

 private:
  [[noreturn]] static void Fail() {
    throw zv::Error(zv::ErrorDomain::IO, zv::errors::io::kVaultStoreFailed, "store offline");
  }
};

void CheckVaultBehaviour(zv::vault::KeyVault& vault) {
  using zv::vault::VaultStatus;
  const auto master = zv::crypto::SymmetricKey::Generate();

  vault.Store("alice", master, "session-secret");
  assert(vault.Exists("alice") && "entry exists after store");
  assert(!vault.Exists("bob") && "other users absent");

  auto found = vault.Retrieve("alice", "session-secret");
  assert(found.status == VaultStatus::kOk && found.key && found.key->Equals(master) && "round trip");

  auto wrong = vault.Retrieve("alice", "session-secreT");
  assert(wrong.status == VaultStatus::kWrongSecret && !wrong.key && "wrong secret");

  auto missing = vault.Retrieve("bob", "session-secret");
  assert(missing.status == VaultStatus::kNotFound && !missing.key && "not found");

  // Storing again replaces the entry.
  const auto replacement = zv::crypto::SymmetricKey::Generate();
  vault.Store("alice", replacement, "second-secret");
  assert(vault.Retrieve("alice", "session-secret").status == VaultStatus::kWrongSecret &&
         "old secret no longer opens the entry");
  assert(vault.Retrieve("alice", "second-secret").key->Equals(replacement) && "overwrite wins");

  assert(vault.Rekey("alice", "wrong", "third-secret") == VaultStatus::kWrongSecret &&
         "rekey needs the current secret");
  assert(vault.Retrieve("alice", "second-secret").status == VaultStatus::kOk &&
         "failed rekey leaves the entry alone");
  assert(vault.Rekey("alice", "second-secret", "third-secret") == VaultStatus::kOk && "rekey");
  assert(vault.Retrieve("alice", "second-secret").status == VaultStatus::kWrongSecret &&
         "rekey retires the old secret");
  assert(vault.Retrieve("alice", "third-secret").key->Equals(replacement) &&
         "rekey keeps the master key");
  assert(vault.Rekey("bob", "x", "y") == VaultStatus::kNotFound && "rekey of absent user");

  vault.Store("bob", master, "bob-secret");
  assert(vault.Delete("bob") && "delete removes entry");
  assert(!vault.Delete("bob") && "second delete is a no-op");
  assert(!vault.Exists("bob") && "deleted entry gone");

  vault.Store("carol", master, "carol-secret");
  vault.ClearAll();
  assert(!vault.Exists("alice") && !vault.Exists("carol") && "clear removes everything");

  assert(ErrorCodeOf([&] { vault.Store("", master, "s"); }) == zv::errors::validation::kEmptyUserId &&
         "empty user id rejected");
  assert(ErrorCodeOf([&] { (void)vault.Retrieve("", "s"); }) ==
             zv::errors::validation::kEmptyUserId &&
         "empty user id rejected on retrieve");
  assert(!vault.Exists("") && "empty user id never exists");
}

}  // namespace

int main() {
  namespace vault = zv::vault;
  zv::crypto::EnsureCryptoProviderInitialized();

  std::vector<std::string> event_ids;
  std::vector<zv::orchestrator::FieldPrivacy> user_field_privacy;
  zv::orchestrator::EventBus::Instance().Subscribe([&](const zv::orchestrator::Event& event) {
    event_ids.push_back(event.event_id);
    for (const auto& field : event.fields) {
      if (field.key == "user_id") {
        user_field_privacy.push_back(field.privacy);
      }
    }
  });

  {
    auto store = std::make_shared<vault::MemoryVaultStore>();
    vault::KeyVault kv(store);
    CheckVaultBehaviour(kv);
  }

  assert(!event_ids.empty() && event_ids.front() == "vault_store" && "operations are published");
  assert(!user_field_privacy.empty() && "events name the user");
  for (const auto privacy : user_field_privacy) {
    assert(privacy == zv::orchestrator::FieldPrivacy::kHash && "user ids are hashed before logging");
  }

  const auto dir = std::filesystem::temp_directory_path() / "zv_key_vault_test";
  std::filesystem::remove_all(dir);

  {
    auto store = std::make_shared<vault::FileVaultStore>(dir);
    vault::KeyVault kv(store);
    CheckVaultBehaviour(kv);

    const auto master = zv::crypto::SymmetricKey::Generate();
    kv.Store("dave@example.com", master, "secret");
    const auto path = store->EntryPath("dave@example.com");
    assert(path == dir / (zv::crypto::SHA256_Hex("dave@example.com") + ".zvk") &&
           "entry file named by user id digest");
    assert(std::filesystem::exists(path) && "entry persisted");

    // A second vault over the same directory sees the entry.
    vault::KeyVault reopened(std::make_shared<vault::FileVaultStore>(dir));
    assert(reopened.Retrieve("dave@example.com", "secret").key->Equals(master) &&
           "entry survives reopening");

    // Foreign files are left alone by ClearAll.
    const auto foreign = dir / "notes.txt";
    { std::ofstream(foreign) << "keep"; }
    kv.ClearAll();
    assert(std::filesystem::exists(foreign) && !std::filesystem::exists(path) &&
           "clear removes only vault entries");
  }
  std::filesystem::remove_all(dir);

  // Entry encoding.
  {
    auto store = std::make_shared<vault::MemoryVaultStore>();
    vault::KeyVault kv(store);
    const auto master = zv::crypto::SymmetricKey::Generate();
    kv.Store("erin", master, "secret");

    const auto raw = store->Get("erin");
    assert(raw && "raw entry stored");
    const auto entry = vault::DecodeVaultEntry(*raw);
    assert(entry.version == vault::kVaultEntryVersion && entry.user_id == "erin" &&
           entry.kdf == zv::config::VaultKdf::kPbkdf2 &&
           entry.iterations == zv::core::kMinPbkdf2Iterations && entry.wrapped_key.size() == 48 &&
           entry.created_at > 0 && "decoded fields");
    assert(vault::EncodeVaultEntry(entry) == *raw && "encoding is stable");

    auto future = entry;
    future.version = 2;
    assert(ErrorCodeOf([&] { (void)vault::DecodeVaultEntry(vault::EncodeVaultEntry(future)); }) ==
               zv::errors::vault::kUnsupportedVersion &&
           "future version rejected");

    auto weak = entry;
    weak.iterations = 1000;
    assert(ErrorCodeOf([&] { (void)vault::DecodeVaultEntry(vault::EncodeVaultEntry(weak)); }) ==
               zv::errors::vault::kCorruptEntry &&
           "weak iteration count rejected");

    std::vector<uint8_t> truncated(raw->begin(), raw->end() - 3);
    assert(ErrorCodeOf([&] { (void)vault::DecodeVaultEntry(truncated); }) ==
               zv::errors::vault::kCorruptEntry &&
           "truncated entry rejected");

    store->Put("erin", truncated);
    assert(ErrorCodeOf([&] { (void)kv.Retrieve("erin", "secret"); }) ==
               zv::errors::vault::kCorruptEntry &&
           "corrupt entry surfaces on retrieve");

    // An entry filed under another user's name is refused.
    store->Put("frank", *raw);
    assert(ErrorCodeOf([&] { (void)kv.Retrieve("frank", "secret"); }) ==
               zv::errors::vault::kCorruptEntry &&
           "entry bound to its user id");
  }

  // Store failures.
  {
    vault::KeyVault kv(std::make_shared<FailingStore>());
    event_ids.clear();
    assert(!kv.Exists("alice") && "exists reports false on store errors");
    assert(!event_ids.empty() && event_ids.back() == "vault_exists_failed" && "failure published");
    const auto master = zv::crypto::SymmetricKey::Generate();
    assert(ErrorCodeOf([&] { kv.Store("alice", master, "s"); }) == zv::errors::io::kVaultStoreFailed &&
           "store errors propagate");
  }

  {
    vault::VaultKdfPolicy weak;
    weak.pbkdf2_iterations = 10;
    assert(ErrorCodeOf([&] { vault::KeyVault kv(std::make_shared<vault::MemoryVaultStore>(), weak); }) ==
               zv::errors::config::kIterationsBelowFloor &&
           "vault refuses weak policies");
    bool rejected = false;
    try {
      vault::KeyVault kv(nullptr);
    } catch (const zv::Error& err) {
      rejected = err.domain == zv::ErrorDomain::Internal;
    }
    assert(rejected && "vault requires a store");
  }

  {
    zv::config::EngineConfig cfg;
    cfg.pbkdf2_iterations = 250000;
    cfg.vault_kdf = zv::config::VaultKdf::kArgon2id;
    const auto policy = vault::VaultKdfPolicy::FromConfig(cfg);
    assert(policy.kdf == zv::config::VaultKdf::kArgon2id && policy.pbkdf2_iterations == 250000 &&
           "policy follows config");

    vault::KeyVault kv(std::make_shared<vault::MemoryVaultStore>(), policy);
    const auto master = zv::crypto::SymmetricKey::Generate();
#if defined(ZV_HAVE_ARGON2) && ZV_HAVE_ARGON2
    kv.Store("grace", master, "secret");
    assert(kv.Retrieve("grace", "secret").key->Equals(master) && "argon2id round trip");
#else
    assert(ErrorCodeOf([&] { kv.Store("grace", master, "secret"); }) ==
               zv::errors::dependency::kArgon2Unavailable &&
           "argon2id unavailable without libargon2");
#endif
  }

  zv::orchestrator::ResetEventBusForTesting();
  std::cout << "key vault tests ok\n";
  return 0;
}

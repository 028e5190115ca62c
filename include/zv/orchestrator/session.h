#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "zv/config.h"
#include "zv/crypto/symmetric_key.h"
#include "zv/vault/key_vault.h"

namespace zv::orchestrator {

class IdleLock {
 public:
  using Clock = std::chrono::steady_clock;
  using Duration = Clock::duration;

  void Arm(Duration timeout);
  void Disarm() noexcept;
  void NotifyActivity() noexcept;
  void Tick();

  [[nodiscard]] bool Armed() const;

  std::function<void()> on_expire;

 private:
  mutable std::mutex mutex_;
  Duration timeout_{Duration::zero()};
  Clock::time_point last_activity_{Clock::now()};
  Clock::time_point last_tick_{Clock::now()};
  bool armed_{false};
};

struct RegistrationResult {
  std::string salt_base64;
  std::string auth_digest;
};

struct PasswordChange {
  std::string new_salt_base64;
  std::string old_auth_digest;
  std::string new_auth_digest;
  // Key that wrapped the user's existing file keys; hand it to RewrapFileKey.
  crypto::SymmetricKey previous_master_key;
};

// Holds the active user's master key for one client session. Replaces any
// process-wide key state: callers own the context and pass the vault in.
class SessionContext {
 public:
  explicit SessionContext(const config::EngineConfig& cfg = {});
  ~SessionContext();

  SessionContext(const SessionContext&) = delete;
  SessionContext& operator=(const SessionContext&) = delete;

  RegistrationResult Register(std::string_view user_id, std::string_view password,
                              vault::KeyVault& vault);
  // Returns the auth digest to send to the server.
  std::string Login(std::string_view user_id, std::string_view password,
                    std::string_view salt_base64, vault::KeyVault& vault);
  // Restores the master key from the vault without a password derivation.
  // |salt_base64| is only needed for a later ChangePassword.
  vault::VaultStatus Unlock(std::string_view user_id, std::string_view session_secret,
                            vault::KeyVault& vault,
                            std::optional<std::string> salt_base64 = std::nullopt);
  // Throws zv::Error (Security/kCurrentPasswordMismatch) when
  // |current_password| does not reproduce the active master key.
  PasswordChange ChangePassword(std::string_view current_password, std::string_view new_password,
                                vault::KeyVault& vault);
  void Logout(vault::KeyVault& vault);
  // Wipes the in-memory key; the vault entry and the user stay.
  void Lock();

  // Valid until the next Lock or Logout. Throws zv::Error
  // (State/kSessionLocked) when no key is held.
  const crypto::SymmetricKey& MasterKey() const;
  bool HasMasterKey() const;
  std::optional<std::string> UserId() const;

  void ConfigureIdleTimeout(IdleLock::Duration timeout);
  void DisableIdleTimeout() noexcept;
  void NotifyActivity() noexcept;
  void Tick();

 private:
  void Activate(std::string_view user_id, crypto::SymmetricKey key,
                std::optional<std::string> salt_base64);

  mutable std::mutex mutex_;
  uint32_t iterations_;
  IdleLock::Duration idle_timeout_{IdleLock::Duration::zero()};
  IdleLock idle_lock_;
  std::optional<std::string> user_id_;
  std::optional<std::string> salt_base64_;
  crypto::SymmetricKey master_key_;
};

}  // namespace zv::orchestrator

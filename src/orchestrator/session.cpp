#include "zv/orchestrator/session.h"

#include <utility>

#include "zv/core/key_derivation.h"
#include "zv/error.h"
#include "zv/errors.h"
#include "zv/orchestrator/event_bus.h"
#include "zv/orchestrator/password_policy.h"

namespace zv::orchestrator {

namespace {
constexpr IdleLock::Duration kSleepTolerance = std::chrono::seconds(2);

void PublishSessionEvent(std::string_view event_id, std::string_view message,
                         const std::optional<std::string>& user_id,
                         EventSeverity severity = EventSeverity::kInfo) {
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = severity;
  event.event_id = std::string(event_id);
  event.message = std::string(message);
  if (user_id) {
    event.fields.emplace_back("user_id", *user_id, FieldPrivacy::kHash);
  }
  EventBus::Instance().Publish(event);
}
}  // namespace

void IdleLock::Arm(Duration timeout) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (timeout <= Duration::zero()) {
    armed_ = false;
    timeout_ = Duration::zero();
    return;
  }
  timeout_ = timeout;
  last_activity_ = Clock::now();
  last_tick_ = last_activity_;
  armed_ = true;
}

void IdleLock::Disarm() noexcept {
  std::lock_guard<std::mutex> guard(mutex_);
  armed_ = false;
  timeout_ = Duration::zero();
}

void IdleLock::NotifyActivity() noexcept {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!armed_) {
    return;
  }
  last_activity_ = Clock::now();
}

bool IdleLock::Armed() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return armed_;
}

void IdleLock::Tick() {
  std::function<void()> expire;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    const auto now = Clock::now();
    if (!armed_) {
      last_tick_ = now;
      return;
    }
    const auto since_activity = now - last_activity_;
    const auto since_tick = now - last_tick_;
    last_tick_ = now;
    // A gap longer than the timeout between ticks means the host slept.
    if (since_activity >= timeout_ || since_tick > timeout_ + kSleepTolerance) {
      armed_ = false;
      expire = on_expire;
    }
  }
  if (expire) {
    expire();
  }
}

SessionContext::SessionContext(const config::EngineConfig& cfg)
    : iterations_(cfg.pbkdf2_iterations), idle_timeout_(cfg.idle_timeout) {
  idle_lock_.on_expire = [this]() {
    PublishSessionEvent("session_idle_lock", "Idle timeout reached", UserId());
    Lock();
  };
}

SessionContext::~SessionContext() {
  idle_lock_.Disarm();
}

void SessionContext::Activate(std::string_view user_id, crypto::SymmetricKey key,
                              std::optional<std::string> salt_base64) {
  IdleLock::Duration timeout;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    user_id_ = std::string(user_id);
    salt_base64_ = std::move(salt_base64);
    master_key_ = std::move(key);
    timeout = idle_timeout_;
  }
  idle_lock_.Arm(timeout);
}

RegistrationResult SessionContext::Register(std::string_view user_id, std::string_view password,
                                            vault::KeyVault& vault) {
  EnforcePasswordPolicy(password);
  RegistrationResult result;
  result.salt_base64 = core::EncodeSalt(core::GenerateSalt());
  auto key = core::DeriveMasterKey(password, std::string_view(result.salt_base64), iterations_);
  vault.Store(user_id, key, password);
  result.auth_digest = core::HashForAuth(password, std::string_view(result.salt_base64));
  Activate(user_id, std::move(key), result.salt_base64);
  PublishSessionEvent("session_register", "User registered", std::string(user_id));
  return result;
}

std::string SessionContext::Login(std::string_view user_id, std::string_view password,
                                  std::string_view salt_base64, vault::KeyVault& vault) {
  auto key = core::DeriveMasterKey(password, salt_base64, iterations_);
  vault.Store(user_id, key, password);
  std::string digest = core::HashForAuth(password, salt_base64);
  Activate(user_id, std::move(key), std::string(salt_base64));
  PublishSessionEvent("session_login", "User logged in", std::string(user_id));
  return digest;
}

vault::VaultStatus SessionContext::Unlock(std::string_view user_id,
                                          std::string_view session_secret,
                                          vault::KeyVault& vault,
                                          std::optional<std::string> salt_base64) {
  auto lookup = vault.Retrieve(user_id, session_secret);
  if (lookup.status == vault::VaultStatus::kOk && lookup.key) {
    Activate(user_id, std::move(*lookup.key), std::move(salt_base64));
    PublishSessionEvent("session_unlock", "Session restored from vault", std::string(user_id));
  }
  return lookup.status;
}

PasswordChange SessionContext::ChangePassword(std::string_view current_password,
                                              std::string_view new_password,
                                              vault::KeyVault& vault) {
  std::string user_id;
  std::string old_salt;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (!user_id_) {
      throw zv::Error(zv::ErrorDomain::State, zv::errors::state::kNoActiveUser,
                      std::string(zv::errors::msg::kNoActiveUser));
    }
    if (!master_key_.Valid()) {
      throw zv::Error(zv::ErrorDomain::State, zv::errors::state::kSessionLocked,
                      std::string(zv::errors::msg::kMasterKeyNotAvailable));
    }
    if (!salt_base64_) {
      throw zv::Error(zv::ErrorDomain::State, zv::errors::state::kNoActiveUser,
                      std::string(zv::errors::msg::kSaltUnknown));
    }
    user_id = *user_id_;
    old_salt = *salt_base64_;
  }

  auto current_key = core::DeriveMasterKey(current_password, std::string_view(old_salt),
                                           iterations_);
  bool matches = false;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    matches = master_key_.Equals(current_key);
  }
  if (!matches) {
    PublishSessionEvent("session_password_change", "Current password rejected", user_id,
                        EventSeverity::kWarning);
    throw zv::Error(zv::ErrorDomain::Security, zv::errors::security::kCurrentPasswordMismatch,
                    std::string(zv::errors::msg::kCurrentPasswordIncorrect));
  }
  EnforcePasswordPolicy(new_password);

  PasswordChange change;
  change.old_auth_digest = core::HashForAuth(current_password, std::string_view(old_salt));
  change.new_salt_base64 = core::EncodeSalt(core::GenerateSalt());
  auto new_key =
      core::DeriveMasterKey(new_password, std::string_view(change.new_salt_base64), iterations_);
  vault.Store(user_id, new_key, new_password);
  change.new_auth_digest =
      core::HashForAuth(new_password, std::string_view(change.new_salt_base64));
  change.previous_master_key = std::move(current_key);
  Activate(user_id, std::move(new_key), change.new_salt_base64);
  PublishSessionEvent("session_password_change", "Password changed", user_id);
  return change;
}

void SessionContext::Logout(vault::KeyVault& vault) {
  std::optional<std::string> user_id;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    user_id = std::move(user_id_);
    user_id_.reset();
    salt_base64_.reset();
    master_key_ = crypto::SymmetricKey();
  }
  idle_lock_.Disarm();
  if (user_id) {
    vault.Delete(*user_id);
  }
  PublishSessionEvent("session_logout", "User logged out", user_id);
}

void SessionContext::Lock() {
  {
    std::lock_guard<std::mutex> guard(mutex_);
    master_key_ = crypto::SymmetricKey();
  }
  idle_lock_.Disarm();
}

const crypto::SymmetricKey& SessionContext::MasterKey() const {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!master_key_.Valid()) {
    throw zv::Error(zv::ErrorDomain::State, zv::errors::state::kSessionLocked,
                    std::string(zv::errors::msg::kMasterKeyNotAvailable));
  }
  return master_key_;
}

bool SessionContext::HasMasterKey() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return master_key_.Valid();
}

std::optional<std::string> SessionContext::UserId() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return user_id_;
}

void SessionContext::ConfigureIdleTimeout(IdleLock::Duration timeout) {
  bool active = false;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    idle_timeout_ = timeout;
    active = master_key_.Valid();
  }
  if (active) {
    idle_lock_.Arm(timeout);
  }
}

void SessionContext::DisableIdleTimeout() noexcept {
  idle_lock_.Disarm();
}

void SessionContext::NotifyActivity() noexcept {
  idle_lock_.NotifyActivity();
}

void SessionContext::Tick() {
  idle_lock_.Tick();
}

}  // namespace zv::orchestrator

#include <array>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#ifndef _WIN32
#include <signal.h>
#include <termios.h>
#include <unistd.h>
#endif

#include "zv/common.h"
#include "zv/config.h"
#include "zv/core/key_derivation.h"
#include "zv/error.h"
#include "zv/orchestrator/event_bus.h"
#include "zv/orchestrator/io_util.h"
#include "zv/orchestrator/password_policy.h"
#include "zv/orchestrator/session.h"
#include "zv/orchestrator/transfer.h"
#include "zv/orchestrator/transport.h"
#include "zv/orchestrator/upload_policy.h"
#include "zv/security/zeroizer.h"
#include "zv/vault/key_vault.h"
#include "zv/vault/vault_store.h"

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 64;
  constexpr int kExitIO = 74;
  constexpr int kExitAuth = 77;

  constexpr size_t kMaxPasswordLen = 1024;
  constexpr const char kGenericAuthFailureMessage[] = "Authentication failed or key unavailable.";

  std::atomic<uint8_t*> g_signal_buffer{nullptr};
  std::atomic<size_t> g_signal_length{0};

  void PrintUsage() {
    std::cerr << "ZeroVault\n";
    std::cerr << "Usage:\n";
    std::cerr << "  zvault salt\n";
    std::cerr << "  zvault auth-hash --salt=<base64>\n";
    std::cerr << "  zvault strength\n";
    std::cerr << "  zvault register --user=<id>\n";
    std::cerr << "  zvault logout --user=<id>\n";
    std::cerr << "  zvault upload --store=<dir> (--salt=<base64> | --user=<id>) <file>...\n";
    std::cerr << "  zvault download --store=<dir> --out=<dir> (--salt=<base64> | --user=<id>) <id>...\n";
    std::cerr << "\nThe password is read from the terminal, or from ZV_PASSWORD when set.\n";
    std::cerr << "With --user the master key is restored from the vault in ZV_VAULT_DIR.\n";
  }

  struct CommandOptions {
    std::optional<std::string> salt;
    std::optional<std::string> user;
    std::optional<std::filesystem::path> store;
    std::optional<std::filesystem::path> out;
    std::vector<std::string> positional;
  };

  std::optional<std::string_view> FlagValue(std::string_view arg, std::string_view name) {
    if (arg.rfind(name, 0) != 0) {
      return std::nullopt;
    }
    return arg.substr(name.size());
  }

  bool ParseOptions(int argc, char** argv, int index, CommandOptions& out) {
    for (int i = index; i < argc; ++i) {
      std::string_view arg = argv[i];
      if (arg.rfind("--", 0) != 0) {
        out.positional.emplace_back(arg);
        continue;
      }
      std::optional<std::string_view> value;
      if ((value = FlagValue(arg, "--salt="))) {
        out.salt = std::string(*value);
      } else if ((value = FlagValue(arg, "--user="))) {
        out.user = std::string(*value);
      } else if ((value = FlagValue(arg, "--store="))) {
        out.store = std::filesystem::path(std::string(*value));
      } else if ((value = FlagValue(arg, "--out="))) {
        out.out = std::filesystem::path(std::string(*value));
      } else {
        std::cerr << "Validation error: unknown flag " << arg << std::endl;
        return false;
      }
      if (value->empty()) {
        std::cerr << "Validation error: " << arg << " requires a value." << std::endl;
        return false;
      }
    }
    return true;
  }

#ifndef _WIN32
  // Turns terminal echo off for its lifetime.
  class SilentTerminal {
  public:
    explicit SilentTerminal(int fd) : fd_(fd) {
      if (tcgetattr(fd_, &saved_) != 0) {
        throw zv::Error{zv::ErrorDomain::IO, zv::errors::io::kConsoleModeQueryFailed,
                        "Failed to query terminal attributes.", errno};
      }
      termios silent = saved_;
      silent.c_lflag &= ~ECHO;
      if (tcsetattr(fd_, TCSAFLUSH, &silent) != 0) {
        throw zv::Error{zv::ErrorDomain::IO, zv::errors::io::kConsoleEchoDisableFailed,
                        "Failed to disable terminal echo.", errno};
      }
    }
    ~SilentTerminal() { tcsetattr(fd_, TCSAFLUSH, &saved_); }
    SilentTerminal(const SilentTerminal&) = delete;
    SilentTerminal& operator=(const SilentTerminal&) = delete;

  private:
    int fd_;
    termios saved_{};
  };

  // SIGINT/SIGTERM while a password is being typed wipe the buffer first.
  void WipeAndExit(int sig) {
    volatile uint8_t* wipe = g_signal_buffer.load(std::memory_order_acquire);
    const size_t len = g_signal_length.load(std::memory_order_acquire);
    for (size_t i = 0; wipe != nullptr && i < len; ++i) {
      wipe[i] = 0;
    }
    _exit(128 + sig);
  }

  class WipeOnSignal {
  public:
    WipeOnSignal(char* buffer, size_t len) {
      g_signal_buffer.store(reinterpret_cast<uint8_t*>(buffer), std::memory_order_release);
      g_signal_length.store(len, std::memory_order_release);
      struct sigaction sa {};
      sa.sa_handler = WipeAndExit;
      sigemptyset(&sa.sa_mask);
      sigaction(SIGINT, &sa, &previous_int_);
      sigaction(SIGTERM, &sa, &previous_term_);
    }
    ~WipeOnSignal() {
      sigaction(SIGINT, &previous_int_, nullptr);
      sigaction(SIGTERM, &previous_term_, nullptr);
      g_signal_buffer.store(nullptr, std::memory_order_release);
      g_signal_length.store(0, std::memory_order_release);
    }
    WipeOnSignal(const WipeOnSignal&) = delete;
    WipeOnSignal& operator=(const WipeOnSignal&) = delete;

  private:
    struct sigaction previous_int_ {};
    struct sigaction previous_term_ {};
  };

  std::string ReadPasswordFromTty(const std::string& prompt) {
    if (!isatty(STDIN_FILENO)) {
      throw zv::Error{zv::ErrorDomain::IO, zv::errors::io::kPasswordPromptNeedsTty,
                      "Password prompt requires a TTY (or set ZV_PASSWORD)"};
    }
    std::array<char, kMaxPasswordLen + 1> buffer{};
    zv::security::Zeroizer::ScopeWiper<char> wiper(buffer.data(), buffer.size());
    size_t length = 0;
    bool too_long = false;
    {
      SilentTerminal silent(STDIN_FILENO);
      WipeOnSignal on_signal(buffer.data(), buffer.size());
      std::cerr << prompt << std::flush;
      for (;;) {
        char ch = 0;
        const ssize_t n = ::read(STDIN_FILENO, &ch, 1);
        if (n < 0 && errno == EINTR) {
          continue;
        }
        if (n < 0) {
          throw zv::Error{zv::ErrorDomain::IO, zv::errors::io::kPasswordReadFailed,
                          "Failed to read password input.", errno};
        }
        if (n == 0 || ch == '\n') {
          break;
        }
        if (ch == '\r') {
          continue;
        }
        if (ch == '\b' || ch == 0x7F) {
          if (length > 0) {
            buffer[--length] = 0;
          }
        } else if (length < kMaxPasswordLen) {
          buffer[length++] = ch;
        } else {
          too_long = true;
        }
      }
    }
    std::cerr << std::endl;

    if (too_long) {
      throw zv::Error{zv::ErrorDomain::Validation, zv::errors::validation::kPasswordPolicy,
                      "Password exceeds maximum length (1024 bytes)."};
    }
    return std::string(buffer.data(), length);
  }
#else
  std::string ReadPasswordFromTty(const std::string&) {
    throw zv::Error{zv::ErrorDomain::IO, zv::errors::io::kConsoleUnavailable,
                    "Interactive password entry is not supported here; set ZV_PASSWORD"};
  }
#endif

  std::string ReadPassword(const std::string& prompt) {
    if (const char* env = std::getenv("ZV_PASSWORD"); env && *env) {
      return std::string(env);
    }
    return ReadPasswordFromTty(prompt);
  }

  std::string_view DomainPrefix(zv::ErrorDomain domain) {
    switch (domain) {
    case zv::ErrorDomain::IO:
      return "I/O error";
    case zv::ErrorDomain::Security:
      return "Security error";
    case zv::ErrorDomain::Crypto:
      return "Cryptography error";
    case zv::ErrorDomain::Validation:
      return "Validation error";
    case zv::ErrorDomain::Config:
      return "Configuration error";
    case zv::ErrorDomain::Dependency:
      return "Dependency error";
    case zv::ErrorDomain::State:
      return "State error";
    case zv::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  void ReportError(const zv::Error& err) {
    std::cerr << DomainPrefix(err.domain) << ": " << err.what() << '\n';

    zv::orchestrator::Event event;
    event.category = zv::orchestrator::EventCategory::kDiagnostics;
    event.severity = zv::orchestrator::EventSeverity::kError;
    event.event_id = "cli_error";
    event.message = err.what();
    event.fields.emplace_back("domain", std::string(DomainPrefix(err.domain)));
    event.fields.emplace_back("code", std::to_string(err.code),
                              zv::orchestrator::FieldPrivacy::kPublic, true);
    if (err.native_code.has_value()) {
      event.fields.emplace_back("native_code", std::to_string(*err.native_code),
                                zv::orchestrator::FieldPrivacy::kPublic, true);
    }
    try {
      zv::orchestrator::EventBus::Instance().Publish(event);
    } catch (const std::exception& publish_error) {
      std::clog << "{\"event\":\"eventbus_error\",\"message\":\"error report publish failed\",\"detail\":\""
                << publish_error.what() << "\"}" << std::endl;
    }
  }

  int ExitCodeFor(const zv::Error& err) {
    switch (err.domain) {
    case zv::ErrorDomain::IO:
      return kExitIO;
    case zv::ErrorDomain::Security:
    case zv::ErrorDomain::Crypto:
      return kExitAuth;
    case zv::ErrorDomain::Validation:
    case zv::ErrorDomain::Config:
      return kExitUsage;
    case zv::ErrorDomain::Dependency:
    case zv::ErrorDomain::State:
    case zv::ErrorDomain::Internal:
    default:
      return kExitIO;
    }
  }

  zv::vault::KeyVault OpenVault(const zv::config::EngineConfig& cfg) {
    return zv::vault::KeyVault(std::make_shared<zv::vault::FileVaultStore>(cfg.vault_dir),
                               zv::vault::VaultKdfPolicy::FromConfig(cfg));
  }

  // Brings the session's master key up from --salt (derive) or --user (vault).
  int OpenSession(const CommandOptions& options, const zv::config::EngineConfig& cfg,
                  zv::orchestrator::SessionContext& session) {
    if (options.salt.has_value() == options.user.has_value()) {
      PrintUsage();
      return kExitUsage;
    }
    auto password = ReadPassword("Password: ");
    zv::security::Zeroizer::ScopeWiper<char> password_guard(password.data(), password.size());
    if (options.salt) {
      // --salt sessions persist nothing.
      zv::vault::KeyVault scratch(std::make_shared<zv::vault::MemoryVaultStore>());
      session.Login("cli", password, *options.salt, scratch);
      return kExitOk;
    }
    auto vault = OpenVault(cfg);
    switch (session.Unlock(*options.user, password, vault)) {
    case zv::vault::VaultStatus::kOk:
      return kExitOk;
    case zv::vault::VaultStatus::kNotFound:
      std::cerr << "No stored key for this user; run 'zvault register' first." << std::endl;
      return kExitAuth;
    case zv::vault::VaultStatus::kWrongSecret:
      std::cerr << kGenericAuthFailureMessage << std::endl;
      return kExitAuth;
    }
    return kExitAuth;
  }

  void PrintProgress(const zv::orchestrator::ItemProgress& progress) {
    std::cerr << "[" << progress.index << "] " << progress.label << ": "
              << zv::orchestrator::ItemStateName(progress.state);
    if (!progress.error.empty()) {
      std::cerr << " (" << progress.error << ")";
    }
    std::cerr << std::endl;
  }

  int HandleSalt() {
    std::cout << zv::core::EncodeSalt(zv::core::GenerateSalt()) << std::endl;
    return kExitOk;
  }

  int HandleAuthHash(const CommandOptions& options) {
    if (!options.salt || !options.positional.empty()) {
      PrintUsage();
      return kExitUsage;
    }
    zv::core::DecodeSalt(*options.salt);
    auto password = ReadPassword("Password: ");
    zv::security::Zeroizer::ScopeWiper<char> password_guard(password.data(), password.size());
    std::cout << zv::core::HashForAuth(password, std::string_view(*options.salt)) << std::endl;
    return kExitOk;
  }

  int HandleStrength() {
    auto password = ReadPassword("Password: ");
    zv::security::Zeroizer::ScopeWiper<char> password_guard(password.data(), password.size());
    const auto strength = zv::orchestrator::EvaluatePasswordStrength(password);
    std::cout << "score: " << strength.score << "/5" << std::endl;
    std::cout << "entropy_bits: " << static_cast<int>(strength.entropy_bits) << std::endl;
    for (const auto& hint : strength.feedback) {
      std::cout << "- " << hint << std::endl;
    }
    return strength.acceptable() ? kExitOk : kExitUsage;
  }

  int HandleRegister(const CommandOptions& options, const zv::config::EngineConfig& cfg) {
    if (!options.user || !options.positional.empty()) {
      PrintUsage();
      return kExitUsage;
    }
    auto password = ReadPassword("Password: ");
    zv::security::Zeroizer::ScopeWiper<char> password_guard(password.data(), password.size());
    if (!std::getenv("ZV_PASSWORD")) {
      auto confirm = ReadPassword("Confirm password: ");
      zv::security::Zeroizer::ScopeWiper<char> confirm_guard(confirm.data(), confirm.size());
      if (confirm != password) {
        std::cerr << "Validation error: Passwords do not match." << std::endl;
        return kExitUsage;
      }
    }
    auto vault = OpenVault(cfg);
    zv::orchestrator::SessionContext session(cfg);
    const auto result = session.Register(*options.user, password, vault);
    std::cout << "salt: " << result.salt_base64 << std::endl;
    std::cout << "auth_digest: " << result.auth_digest << std::endl;
    return kExitOk;
  }

  int HandleLogout(const CommandOptions& options, const zv::config::EngineConfig& cfg) {
    if (!options.user || !options.positional.empty()) {
      PrintUsage();
      return kExitUsage;
    }
    auto vault = OpenVault(cfg);
    if (!vault.Delete(*options.user)) {
      std::cerr << "No stored key for this user." << std::endl;
    }
    return kExitOk;
  }

  int HandleUpload(const CommandOptions& options, const zv::config::EngineConfig& cfg) {
    if (!options.store || options.positional.empty()) {
      PrintUsage();
      return kExitUsage;
    }
    std::vector<zv::orchestrator::UploadItem> items;
    for (const auto& arg : options.positional) {
      const std::filesystem::path path(arg);
      auto contents = zv::orchestrator::ReadFileBytes(path);
      if (!contents) {
        std::cerr << "I/O error: file not found: " << arg << std::endl;
        return kExitIO;
      }
      zv::orchestrator::UploadItem item;
      item.filename = zv::PathToUtf8String(path.filename());
      item.mime_type = zv::orchestrator::GuessMimeType(item.filename);
      item.contents = std::move(*contents);
      items.push_back(std::move(item));
    }

    const auto validation =
        zv::orchestrator::ValidateBatch(items, zv::orchestrator::UploadLimits::FromConfig(cfg));
    for (const auto& rejected : validation.rejected) {
      std::cerr << rejected.filename << ": " << rejected.reason << std::endl;
    }
    if (validation.accepted.empty()) {
      return kExitUsage;
    }

    zv::orchestrator::SessionContext session(cfg);
    if (int rc = OpenSession(options, cfg, session); rc != kExitOk) {
      return rc;
    }
    zv::orchestrator::DirectoryTransport transport(*options.store);
    zv::orchestrator::TransferJob job(session, transport);
    job.SetProgressCallback(PrintProgress);
    for (size_t index : validation.accepted) {
      job.AddUpload(std::move(items[index]));
    }
    job.Run();

    bool all_ok = validation.valid();
    for (size_t i = 0; i < job.ItemCount(); ++i) {
      const auto& progress = job.Progress(i);
      if (progress.state == zv::orchestrator::ItemState::kComplete && job.RemoteId(i)) {
        std::cout << *job.RemoteId(i) << "\t" << progress.label << std::endl;
      } else {
        all_ok = false;
      }
    }
    session.Lock();
    return all_ok ? kExitOk : kExitIO;
  }

  int HandleDownload(const CommandOptions& options, const zv::config::EngineConfig& cfg) {
    if (!options.store || !options.out || options.positional.empty()) {
      PrintUsage();
      return kExitUsage;
    }
    zv::orchestrator::SessionContext session(cfg);
    if (int rc = OpenSession(options, cfg, session); rc != kExitOk) {
      return rc;
    }
    std::error_code ec;
    std::filesystem::create_directories(*options.out, ec);
    if (ec) {
      std::cerr << "I/O error: cannot create output directory: " << ec.message() << std::endl;
      return kExitIO;
    }
    zv::orchestrator::DirectoryTransport transport(*options.store);
    zv::orchestrator::TransferJob job(session, transport);
    job.SetProgressCallback(PrintProgress);
    for (const auto& id : options.positional) {
      job.AddDownload(id);
    }
    job.Run();

    bool all_ok = true;
    for (size_t i = 0; i < job.ItemCount(); ++i) {
      auto& result = job.Download(i);
      if (!result) {
        all_ok = false;
        continue;
      }
      // Only the final component of the decrypted name is trusted.
      auto name = std::filesystem::path(result->filename).filename();
      if (name.empty() || name == "." || name == "..") {
        name = job.Progress(i).label;
      }
      const auto target = *options.out / name;
      zv::orchestrator::AtomicReplace(target, result->plaintext);
      zv::security::Zeroizer::WipeVector(result->plaintext);
      std::cout << job.Progress(i).label << "\t" << zv::PathToUtf8String(target) << "\t"
                << result->mime_type << std::endl;
    }
    session.Lock();
    return all_ok ? kExitOk : kExitIO;
  }

} // namespace

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      PrintUsage();
      return kExitUsage;
    }
    const std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h" || cmd == "help") {
      PrintUsage();
      return kExitOk;
    }

    CommandOptions options;
    if (!ParseOptions(argc, argv, 2, options)) {
      PrintUsage();
      return kExitUsage;
    }
    const auto cfg = zv::config::LoadFromEnvironment();
    zv::orchestrator::ConfigureDefaultLogger(cfg);

    if (cmd == "salt") {
      return HandleSalt();
    }
    if (cmd == "auth-hash") {
      return HandleAuthHash(options);
    }
    if (cmd == "strength") {
      return HandleStrength();
    }
    if (cmd == "register") {
      return HandleRegister(options, cfg);
    }
    if (cmd == "logout") {
      return HandleLogout(options, cfg);
    }
    if (cmd == "upload") {
      return HandleUpload(options, cfg);
    }
    if (cmd == "download") {
      return HandleDownload(options, cfg);
    }

    PrintUsage();
    return kExitUsage;
  } catch (const zv::AuthenticationFailureError& err) {
    (void)err;
    std::cerr << kGenericAuthFailureMessage << std::endl;
    return kExitAuth;
  } catch (const zv::Error& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << "I/O error: " << err.what() << std::endl;
    return kExitIO;
  }
}

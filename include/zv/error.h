#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace zv {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Dependency = 0x06,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes to avoid collisions with propagated
  // platform error numbers. Codes inside the reserved range are stable.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Dependency:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0;
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace security {
      inline constexpr int kCurrentPasswordMismatch = Make(ErrorDomain::Security, 0x01);
    } // namespace security

    namespace io {
      inline constexpr int kConsoleUnavailable = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kConsoleModeQueryFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kConsoleEchoDisableFailed = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kPasswordReadFailed = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kPasswordPromptNeedsTty = Make(ErrorDomain::IO, 0x05);
      inline constexpr int kVaultStoreFailed = Make(ErrorDomain::IO, 0x06);
      inline constexpr int kTransportFailed = Make(ErrorDomain::IO, 0x07);
      inline constexpr int kObjectMissing = Make(ErrorDomain::IO, 0x08);
      inline constexpr int kAtomicReplaceFailed = Make(ErrorDomain::IO, 0x09);
      inline constexpr int kReadFailed = Make(ErrorDomain::IO, 0x0A);
    } // namespace io

    namespace validation {
      inline constexpr int kMalformedBase64 = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kSaltLength = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kNonceLength = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kCiphertextTruncated = Make(ErrorDomain::Validation, 0x04);
      inline constexpr int kKeyLength = Make(ErrorDomain::Validation, 0x05);
      inline constexpr int kPasswordPolicy = Make(ErrorDomain::Validation, 0x06);
      inline constexpr int kMalformedRecord = Make(ErrorDomain::Validation, 0x07);
      inline constexpr int kEmptyUserId = Make(ErrorDomain::Validation, 0x08);
      inline constexpr int kBatchRejected = Make(ErrorDomain::Validation, 0x09);
    } // namespace validation

    namespace crypto {
      inline constexpr int kProviderFailure = Make(ErrorDomain::Crypto, 0x01);
      inline constexpr int kCannotDecrypt = Make(ErrorDomain::Crypto, 0x02);
      inline constexpr int kRandomUnavailable = Make(ErrorDomain::Crypto, 0x03);
      inline constexpr int kKdfFailed = Make(ErrorDomain::Crypto, 0x04);
    } // namespace crypto

    namespace vault {
      inline constexpr int kCorruptEntry = Make(ErrorDomain::Validation, 0x20);
      inline constexpr int kUnsupportedVersion = Make(ErrorDomain::Validation, 0x21);
    } // namespace vault

    namespace config {
      inline constexpr int kInvalidValue = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kIterationsBelowFloor = Make(ErrorDomain::Config, 0x02);
    } // namespace config

    namespace dependency {
      inline constexpr int kArgon2Unavailable = Make(ErrorDomain::Dependency, 0x01);
    } // namespace dependency

    namespace state {
      inline constexpr int kSessionLocked = Make(ErrorDomain::State, 0x01);
      inline constexpr int kNoActiveUser = Make(ErrorDomain::State, 0x02);
    } // namespace state

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  struct AuthenticationFailureError : public std::runtime_error {
    explicit AuthenticationFailureError(const std::string& msg) : std::runtime_error(msg) {}
  };

  // Which half of a two-layer decryption rejected its input.
  enum class DecryptStage : std::uint8_t { kKeyUnwrap, kBody };

  // Single "cannot decrypt" kind surfaced by the file cipher. The stage is kept
  // for diagnostics only; callers treat both stages the same way.
  struct DecryptionError : public Error {
    DecryptStage stage;
    DecryptionError(DecryptStage s, std::string msg)
        : Error(ErrorDomain::Crypto, errors::crypto::kCannotDecrypt, std::move(msg)), stage(s) {}
  };
} // namespace zv

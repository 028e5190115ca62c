#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "zv/crypto/aes_gcm.h"

namespace zv::crypto {

class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual AES256_GCM::EncryptionResult EncryptAES256GCM(
      std::span<const uint8_t> plaintext,
      std::span<const uint8_t> aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
      std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) = 0;

  // Decrypts into |destination| (at least ciphertext.size() bytes) and returns
  // the number of bytes written. Throws AuthenticationFailureError on tag
  // mismatch; nothing written to |destination| is valid in that case.
  virtual size_t DecryptAES256GCM(
      std::span<const uint8_t> ciphertext,
      std::span<const uint8_t> aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
      std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
      std::span<const uint8_t, AES256_GCM::KEY_SIZE> key,
      std::span<uint8_t> destination) = 0;

  virtual std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) = 0;

  virtual void PBKDF2HMACSHA256(
      std::span<const uint8_t> password,
      std::span<const uint8_t> salt,
      uint32_t iterations,
      std::span<uint8_t> output) = 0;
};

class OpenSSLCryptoProvider : public CryptoProvider {
public:
  AES256_GCM::EncryptionResult EncryptAES256GCM(
      std::span<const uint8_t> plaintext,
      std::span<const uint8_t> aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
      std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) override;

  size_t DecryptAES256GCM(
      std::span<const uint8_t> ciphertext,
      std::span<const uint8_t> aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
      std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
      std::span<const uint8_t, AES256_GCM::KEY_SIZE> key,
      std::span<uint8_t> destination) override;

  std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) override;

  void PBKDF2HMACSHA256(
      std::span<const uint8_t> password,
      std::span<const uint8_t> salt,
      uint32_t iterations,
      std::span<uint8_t> output) override;
};

std::shared_ptr<CryptoProvider> GetCryptoProviderShared();
CryptoProvider& GetCryptoProvider();
// Replaces the process-wide provider; nullptr restores the OpenSSL default on
// next use.
void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider);
// Runs the AES-GCM known-answer test once per process. Throws zv::Error
// (Crypto) if it fails.
void EnsureCryptoProviderInitialized();

}  // namespace zv::crypto

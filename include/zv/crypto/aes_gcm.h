#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace zv::security { template<typename T> class SecureBuffer; }

namespace zv::crypto {

struct AES256_GCM {
  static constexpr size_t KEY_SIZE = 32;
  static constexpr size_t NONCE_SIZE = 12;
  static constexpr size_t TAG_SIZE = 16;

  struct EncryptionResult {
    std::vector<uint8_t> ciphertext;
    std::array<uint8_t, TAG_SIZE> tag;
  };
};

// Encrypts |plaintext| using AES-256-GCM. Throws zv::Error on provider failures.
AES256_GCM::EncryptionResult AES256_GCM_Encrypt(std::span<const uint8_t> plaintext,
                                               std::span<const uint8_t> aad,
                                               std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
                                               std::span<const uint8_t, AES256_GCM::KEY_SIZE> key);

// Decrypts |ciphertext| and validates |tag|. Throws AuthenticationFailureError on
// tag mismatch and zv::Error on other provider failures.
std::vector<uint8_t> AES256_GCM_Decrypt(std::span<const uint8_t> ciphertext,
                                        std::span<const uint8_t> aad,
                                        std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
                                        std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
                                        std::span<const uint8_t, AES256_GCM::KEY_SIZE> key);

// Decrypts straight into locked memory. |dest_buffer| must be sized to the
// ciphertext length. Used for unwrapping keys so the plaintext key never lands
// in a pageable std::vector.
void AES256_GCM_Decrypt_Secure(std::span<const uint8_t> ciphertext,
                               std::span<const uint8_t> aad,
                               std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
                               std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
                               std::span<const uint8_t, AES256_GCM::KEY_SIZE> key,
                               zv::security::SecureBuffer<uint8_t>& dest_buffer);

} // namespace zv::crypto

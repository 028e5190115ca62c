#include "zv/crypto/aes_gcm.h"

#include "zv/crypto/provider.h"
#include "zv/error.h"
#include "zv/security/secure_buffer.h"

namespace zv::crypto {

AES256_GCM::EncryptionResult AES256_GCM_Encrypt(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) {
  auto provider = GetCryptoProviderShared();
  return provider->EncryptAES256GCM(plaintext, aad, nonce, key);
}

std::vector<uint8_t> AES256_GCM_Decrypt(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) {
  auto provider = GetCryptoProviderShared();
  std::vector<uint8_t> plaintext(ciphertext.size());
  size_t decrypted_size = provider->DecryptAES256GCM(ciphertext, aad, nonce, tag, key,
                                                      std::span<uint8_t>(plaintext.data(), plaintext.size()));
  plaintext.resize(decrypted_size);
  return plaintext;
}

void AES256_GCM_Decrypt_Secure(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key,
    zv::security::SecureBuffer<uint8_t>& dest_buffer) {
  if (dest_buffer.size() != ciphertext.size()) {
    throw zv::Error{zv::ErrorDomain::Validation, zv::errors::validation::kKeyLength,
                    "Secure decrypt destination does not match ciphertext length"};
  }
  auto provider = GetCryptoProviderShared();
  size_t decrypted_size = provider->DecryptAES256GCM(ciphertext, aad, nonce, tag, key,
                                                      dest_buffer.AsSpan());
  if (decrypted_size != dest_buffer.size()) {
    throw zv::Error{zv::ErrorDomain::Validation, zv::errors::validation::kKeyLength,
                    "Decrypted size mismatch in secure decrypt"};
  }
}

} // namespace zv::crypto

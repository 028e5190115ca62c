#include "zv/core/aead.h"

#include <algorithm>
#include <string>

#include "zv/crypto/random.h"
#include "zv/error.h"
#include "zv/errors.h"

namespace zv::core::aead {

namespace {

struct SplitSealed {
  std::span<const uint8_t> ciphertext;
  std::span<const uint8_t, kTagSize> tag;
};

SplitSealed Split(std::span<const uint8_t> sealed) {
  if (sealed.size() < kTagSize) {
    throw zv::Error(zv::ErrorDomain::Validation, zv::errors::validation::kCiphertextTruncated,
                    std::string(zv::errors::msg::kCiphertextTruncated));
  }
  const size_t body = sealed.size() - kTagSize;
  return SplitSealed{sealed.first(body), sealed.subspan(body).first<kTagSize>()};
}

}  // namespace

Nonce GenerateNonce() {
  Nonce nonce{};
  crypto::SystemRandomBytes(nonce);
  return nonce;
}

Nonce NonceFromBytes(std::span<const uint8_t> bytes) {
  if (bytes.size() != kNonceSize) {
    throw zv::Error(zv::ErrorDomain::Validation, zv::errors::validation::kNonceLength,
                    std::string(zv::errors::msg::kNonceLengthUnexpected));
  }
  Nonce nonce{};
  std::copy(bytes.begin(), bytes.end(), nonce.begin());
  return nonce;
}

std::vector<uint8_t> Seal(const crypto::SymmetricKey& key, const Nonce& nonce,
                          std::span<const uint8_t> plaintext) {
  auto result = crypto::AES256_GCM_Encrypt(plaintext, {}, nonce, key.Bytes());
  std::vector<uint8_t> sealed;
  sealed.reserve(result.ciphertext.size() + kTagSize);
  sealed.insert(sealed.end(), result.ciphertext.begin(), result.ciphertext.end());
  sealed.insert(sealed.end(), result.tag.begin(), result.tag.end());
  return sealed;
}

std::vector<uint8_t> Open(const crypto::SymmetricKey& key, const Nonce& nonce,
                          std::span<const uint8_t> sealed) {
  const auto parts = Split(sealed);
  return crypto::AES256_GCM_Decrypt(parts.ciphertext, {}, nonce, parts.tag, key.Bytes());
}

security::SecureBuffer<uint8_t> OpenSecure(const crypto::SymmetricKey& key, const Nonce& nonce,
                                           std::span<const uint8_t> sealed) {
  const auto parts = Split(sealed);
  security::SecureBuffer<uint8_t> plaintext(parts.ciphertext.size());
  crypto::AES256_GCM_Decrypt_Secure(parts.ciphertext, {}, nonce, parts.tag, key.Bytes(),
                                    plaintext);
  return plaintext;
}

std::vector<uint8_t> SealBlob(const crypto::SymmetricKey& key, std::span<const uint8_t> plaintext) {
  const Nonce nonce = GenerateNonce();
  auto sealed = Seal(key, nonce, plaintext);
  std::vector<uint8_t> blob;
  blob.reserve(kNonceSize + sealed.size());
  blob.insert(blob.end(), nonce.begin(), nonce.end());
  blob.insert(blob.end(), sealed.begin(), sealed.end());
  return blob;
}

std::vector<uint8_t> OpenBlob(const crypto::SymmetricKey& key, std::span<const uint8_t> blob) {
  if (blob.size() < kNonceSize + kTagSize) {
    throw zv::Error(zv::ErrorDomain::Validation, zv::errors::validation::kCiphertextTruncated,
                    std::string(zv::errors::msg::kCiphertextTruncated));
  }
  const Nonce nonce = NonceFromBytes(blob.first(kNonceSize));
  return Open(key, nonce, blob.subspan(kNonceSize));
}

}  // namespace zv::core::aead

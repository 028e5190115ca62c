#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "zv/core/aead.h"
#include "zv/crypto/symmetric_key.h"

namespace zv::core {

// A file encrypted under its own random key. The file key is stored wrapped
// (AES-256-GCM) under the master key. body_nonce and key_wrap_nonce are drawn
// independently for every file.
struct EncryptedFile {
  std::vector<uint8_t> ciphertext;        // body ciphertext || tag
  std::vector<uint8_t> wrapped_file_key;  // file key ciphertext || tag
  aead::Nonce body_nonce{};
  aead::Nonce key_wrap_nonce{};
  uint64_t plaintext_size{0};

  std::string CiphertextBase64() const;
  std::string WrappedKeyBase64() const;
  std::string BodyNonceBase64() const;
  std::string KeyWrapNonceBase64() const;
};

crypto::SymmetricKey GenerateFileKey();

EncryptedFile EncryptFile(std::span<const uint8_t> plaintext, const crypto::SymmetricKey& master_key);

// Throws DecryptionError with stage kKeyUnwrap when the wrapped key does not
// authenticate under |master_key|, or kBody when the body does not
// authenticate under the unwrapped key. No plaintext is returned on failure.
std::vector<uint8_t> DecryptFile(const EncryptedFile& file, const crypto::SymmetricKey& master_key);

crypto::SymmetricKey UnwrapFileKey(const EncryptedFile& file, const crypto::SymmetricKey& master_key);

// Re-wraps the file key under |new_master| with a fresh key-wrap nonce. The
// body and body nonce are carried over unchanged.
EncryptedFile RewrapFileKey(const EncryptedFile& file, const crypto::SymmetricKey& old_master,
                            const crypto::SymmetricKey& new_master);

}  // namespace zv::core

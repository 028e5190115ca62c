#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "zv/crypto/aes_gcm.h"
#include "zv/crypto/symmetric_key.h"
#include "zv/security/secure_buffer.h"

namespace zv::core::aead {

inline constexpr size_t kNonceSize = crypto::AES256_GCM::NONCE_SIZE;
inline constexpr size_t kTagSize = crypto::AES256_GCM::TAG_SIZE;

using Nonce = std::array<uint8_t, kNonceSize>;

// Fresh random 96-bit nonce. Every Seal under a given key needs its own.
Nonce GenerateNonce();
// Throws zv::Error (Validation/kNonceLength) unless |bytes| is 12 bytes.
Nonce NonceFromBytes(std::span<const uint8_t> bytes);

// AES-256-GCM. Output is ciphertext || 16-byte tag.
std::vector<uint8_t> Seal(const crypto::SymmetricKey& key, const Nonce& nonce,
                          std::span<const uint8_t> plaintext);

// Inverse of Seal. Inputs shorter than the tag throw zv::Error
// (Validation/kCiphertextTruncated) before any cipher call; a tag mismatch
// throws AuthenticationFailureError and nothing is returned.
std::vector<uint8_t> Open(const crypto::SymmetricKey& key, const Nonce& nonce,
                          std::span<const uint8_t> sealed);

// Open() for key material: plaintext goes straight into locked memory.
security::SecureBuffer<uint8_t> OpenSecure(const crypto::SymmetricKey& key, const Nonce& nonce,
                                           std::span<const uint8_t> sealed);

// Self-describing layout nonce || ciphertext || tag, with a fresh nonce.
std::vector<uint8_t> SealBlob(const crypto::SymmetricKey& key, std::span<const uint8_t> plaintext);
std::vector<uint8_t> OpenBlob(const crypto::SymmetricKey& key, std::span<const uint8_t> blob);

}  // namespace zv::core::aead

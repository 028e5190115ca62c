#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "zv/security/secure_buffer.h"

namespace zv::crypto {

// Opaque 256-bit AES key. The bytes live in a locked SecureBuffer and are
// zeroed when the key is destroyed or moved from. Keys cannot be copied;
// Export() is the only way to obtain the raw bytes.
class SymmetricKey {
public:
  static constexpr size_t kSize = 32;

  SymmetricKey() = default;
  explicit SymmetricKey(security::SecureBuffer<uint8_t> bytes);

  SymmetricKey(const SymmetricKey&) = delete;
  SymmetricKey& operator=(const SymmetricKey&) = delete;
  SymmetricKey(SymmetricKey&&) noexcept = default;
  SymmetricKey& operator=(SymmetricKey&&) noexcept = default;

  static SymmetricKey Generate();
  // Throws zv::Error (Validation/kKeyLength) unless |raw| is exactly 32 bytes.
  static SymmetricKey Import(std::span<const uint8_t> raw);

  security::SecureBuffer<uint8_t> Export() const;

  bool Valid() const noexcept { return bytes_.size() == kSize; }
  std::span<const uint8_t, kSize> Bytes() const;

  bool Equals(const SymmetricKey& other) const noexcept;

private:
  security::SecureBuffer<uint8_t> bytes_;
};

}  // namespace zv::crypto

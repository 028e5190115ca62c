#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "zv/crypto/symmetric_key.h"

namespace zv::core {

inline constexpr size_t kSaltSize = 16;
inline constexpr uint32_t kMinPbkdf2Iterations = 100000;
// Length of the auth digest sent to the server. The digest is cut to fit the
// server's 72-byte bcrypt input limit; 43 base64 characters carry 258 bits.
inline constexpr size_t kAuthDigestLength = 43;

using Salt = std::array<uint8_t, kSaltSize>;

Salt GenerateSalt();
std::string EncodeSalt(const Salt& salt);
// Throws zv::Error (Validation) on malformed base64 or a decoded length
// other than 16 bytes.
Salt DecodeSalt(std::string_view salt_base64);

// PBKDF2-HMAC-SHA256, 32-byte output. Deterministic for equal inputs.
crypto::SymmetricKey DeriveMasterKey(std::string_view password, std::span<const uint8_t> salt,
                                     uint32_t iterations = kMinPbkdf2Iterations);
crypto::SymmetricKey DeriveMasterKey(std::string_view password, std::string_view salt_base64,
                                     uint32_t iterations = kMinPbkdf2Iterations);

// base64(SHA-256(password || salt_base64)) truncated to kAuthDigestLength.
// Without a salt only the password is hashed.
std::string HashForAuth(std::string_view password,
                        std::optional<std::string_view> salt_base64 = std::nullopt);

crypto::SymmetricKey GenerateMasterKey();

}  // namespace zv::core

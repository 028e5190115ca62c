#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace zv::crypto {

// PBKDF2-HMAC-SHA256 with a single 32-byte output block.
std::array<uint8_t, 32> PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                                           std::span<const uint8_t> salt,
                                           uint32_t iterations);

}  // namespace zv::crypto

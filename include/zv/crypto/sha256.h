#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace zv::crypto {
std::array<uint8_t,32> SHA256_Hash(std::span<const uint8_t> data);
std::array<uint8_t,32> SHA256_Hash(const std::vector<uint8_t>& data);

// Lowercase hex of the digest; used for on-disk names derived from user ids.
std::string SHA256_Hex(std::string_view data);
} // namespace zv::crypto

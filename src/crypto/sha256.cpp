#include "zv/crypto/sha256.h"

#include "zv/common.h"
#include "zv/crypto/provider.h"

namespace zv::crypto {

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data) {
  return GetCryptoProvider().SHA256(data);
}

std::array<uint8_t, 32> SHA256_Hash(const std::vector<uint8_t>& data) {
  return SHA256_Hash(std::span<const uint8_t>(data.data(), data.size()));
}

std::string SHA256_Hex(std::string_view data) {
  const auto digest = SHA256_Hash(zv::AsBytes(data));
  return zv::HexEncode(digest);
}

} // namespace zv::crypto

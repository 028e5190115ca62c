#include "zv/crypto/pbkdf2.h"

#include "zv/crypto/provider.h"
#include "zv/security/zeroizer.h"

namespace zv::crypto {

std::array<uint8_t, 32> PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                                           std::span<const uint8_t> salt,
                                           uint32_t iterations) {
  std::array<uint8_t, 32> output{};
  security::Zeroizer::ScopeWiper output_guard(std::span<uint8_t>(output.data(), output.size()));
  GetCryptoProvider().PBKDF2HMACSHA256(password, salt, iterations,
                                       std::span<uint8_t>(output.data(), output.size()));
  auto result = output;
  return result;
}

}  // namespace zv::crypto

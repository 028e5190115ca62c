#include "zv/core/key_derivation.h"

#include <algorithm>
#include <string>
#include <vector>

#include "zv/codec/base64.h"
#include "zv/common.h"
#include "zv/crypto/pbkdf2.h"
#include "zv/crypto/random.h"
#include "zv/crypto/sha256.h"
#include "zv/error.h"
#include "zv/errors.h"
#include "zv/security/zeroizer.h"

namespace zv::core {

namespace {

[[noreturn]] void ThrowSaltLength(size_t actual) {
  throw zv::Error(zv::ErrorDomain::Validation, zv::errors::validation::kSaltLength,
                  std::string(zv::errors::msg::kSaltLengthUnexpected) + " (got " +
                      std::to_string(actual) + ")");
}

}  // namespace

Salt GenerateSalt() {
  Salt salt{};
  crypto::SystemRandomBytes(salt);
  return salt;
}

std::string EncodeSalt(const Salt& salt) {
  return codec::Base64Encode(salt);
}

Salt DecodeSalt(std::string_view salt_base64) {
  const auto bytes = codec::Base64Decode(salt_base64);
  if (bytes.size() != kSaltSize) {
    ThrowSaltLength(bytes.size());
  }
  Salt salt{};
  std::copy(bytes.begin(), bytes.end(), salt.begin());
  return salt;
}

crypto::SymmetricKey DeriveMasterKey(std::string_view password, std::span<const uint8_t> salt,
                                     uint32_t iterations) {
  if (salt.size() != kSaltSize) {
    ThrowSaltLength(salt.size());
  }
  if (iterations < kMinPbkdf2Iterations) {
    throw zv::Error(zv::ErrorDomain::Validation, zv::errors::config::kIterationsBelowFloor,
                    std::string(zv::errors::msg::kIterationsTooLow));
  }
  auto derived = crypto::PBKDF2_HMAC_SHA256(zv::AsBytes(password), salt, iterations);
  security::Zeroizer::ScopeWiper derived_guard(std::span<uint8_t>(derived.data(), derived.size()));
  return crypto::SymmetricKey::Import(derived);
}

crypto::SymmetricKey DeriveMasterKey(std::string_view password, std::string_view salt_base64,
                                     uint32_t iterations) {
  const Salt salt = DecodeSalt(salt_base64);
  return DeriveMasterKey(password, std::span<const uint8_t>(salt), iterations);
}

std::string HashForAuth(std::string_view password, std::optional<std::string_view> salt_base64) {
  std::string input(password);
  if (salt_base64) {
    input.append(*salt_base64);
  }
  const auto digest = crypto::SHA256_Hash(zv::AsBytes(input));
  security::Zeroizer::WipeString(input);
  std::string encoded = codec::Base64Encode(digest);
  encoded.resize(std::min(encoded.size(), kAuthDigestLength));
  return encoded;
}

crypto::SymmetricKey GenerateMasterKey() {
  return crypto::SymmetricKey::Generate();
}

}  // namespace zv::core

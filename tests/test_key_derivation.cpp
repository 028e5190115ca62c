#include "zv/core/key_derivation.h"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "zv/common.h"
#include "zv/crypto/pbkdf2.h"
#include "zv/crypto/provider.h"
#include "zv/error.h"

namespace {

std::string ToHex(std::span<const uint8_t> bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  for (uint8_t b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0f]);
  }
  return out;
}

template <typename Fn>
int ErrorCodeOf(Fn&& fn) {
  try {
    fn();
  } catch (const zv::Error& err) {
    return err.code;
  }
  return 0;
}

}  // namespace

int main() {
  namespace core = zv::core;
  zv::crypto::EnsureCryptoProviderInitialized();

  // RFC 7914 section 11: PBKDF2-HMAC-SHA256("passwd", "salt", 1), first block.
  {
    const auto block = zv::crypto::PBKDF2_HMAC_SHA256(zv::AsBytes("passwd"), zv::AsBytes("salt"), 1);
    assert(ToHex(block) == "55ac046e56e3089fec1691c22544b605f94185216dde0465e68b9d57c20dacbc" &&
           "pbkdf2 known-answer vector");
  }

  const auto salt = core::GenerateSalt();
  const auto salt_b64 = core::EncodeSalt(salt);
  assert(salt_b64.size() == 24 && "16-byte salt encodes to 24 characters");
  assert(core::DecodeSalt(salt_b64) == salt && "salt decodes to the same bytes");
  assert(core::GenerateSalt() != salt && "salts are random");

  {
    const auto a = core::DeriveMasterKey("correct horse", salt);
    const auto b = core::DeriveMasterKey("correct horse", salt_b64);
    assert(a.Valid() && a.Equals(b) && "derivation is deterministic across salt forms");

    const auto other_password = core::DeriveMasterKey("correct horsf", salt);
    assert(!a.Equals(other_password) && "password change alters the key");

    auto other_salt = salt;
    other_salt[0] ^= 0x01;
    assert(!a.Equals(core::DeriveMasterKey("correct horse", other_salt)) &&
           "salt change alters the key");

    const auto more_rounds = core::DeriveMasterKey("correct horse", salt, core::kMinPbkdf2Iterations + 1);
    assert(!a.Equals(more_rounds) && "iteration count is part of the derivation");
  }

  assert(ErrorCodeOf([&] { (void)core::DeriveMasterKey("pw", salt, 1000); }) ==
             zv::errors::config::kIterationsBelowFloor &&
         "iteration floor enforced");

  {
    const std::vector<uint8_t> short_salt(12, 0x11);
    assert(ErrorCodeOf([&] { (void)core::DeriveMasterKey("pw", short_salt); }) ==
               zv::errors::validation::kSaltLength &&
           "raw salt must be 16 bytes");
    assert(ErrorCodeOf([] { (void)core::DecodeSalt("AAAAAAAAAAAAAAAA"); }) ==
               zv::errors::validation::kSaltLength &&
           "decoded salt must be 16 bytes");
    assert(ErrorCodeOf([] { (void)core::DecodeSalt("not*base64*at*all"); }) ==
               zv::errors::validation::kMalformedBase64 &&
           "malformed salt text rejected");
  }

  // SHA-256("abc") in base64 is "ungWv48Bz+pBQUDeXa4iI7ADYaOWF3qctBD/YfIAFa0=".
  {
    const auto digest = core::HashForAuth("abc");
    assert(digest == "ungWv48Bz+pBQUDeXa4iI7ADYaOWF3qctBD/YfIAFa0" && "auth digest known answer");
    assert(digest.size() == core::kAuthDigestLength && "auth digest truncated");
    assert(core::HashForAuth("ab", std::string_view("c")) == digest &&
           "salt is appended to the password before hashing");
  }

  {
    const auto key = core::DeriveMasterKey("hunter22", salt_b64);
    const auto digest = core::HashForAuth("hunter22", salt_b64);
    assert(digest == core::HashForAuth("hunter22", salt_b64) && "auth digest is deterministic");
    assert(digest != core::HashForAuth("hunter23", salt_b64) && "auth digest depends on password");
    const auto key_bytes = key.Bytes();
    assert(digest.find(ToHex(key_bytes)) == std::string::npos && "digest does not carry the key");
    const std::string key_text(key_bytes.begin(), key_bytes.end());
    assert(digest.find(key_text) == std::string::npos && "digest does not carry raw key bytes");
  }

  {
    const auto a = core::GenerateMasterKey();
    const auto b = core::GenerateMasterKey();
    assert(a.Valid() && b.Valid() && !a.Equals(b) && "generated master keys are random");
  }

  std::cout << "key derivation tests ok\n";
  return 0;
}

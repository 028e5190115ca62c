#include "zv/core/aead.h"

#include <algorithm>
#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "zv/common.h"
#include "zv/crypto/provider.h"
#include "zv/error.h"

namespace {

std::vector<uint8_t> FromHex(std::string_view hex) {
  std::vector<uint8_t> out;
  for (size_t i = 0; i + 1 < hex.size(); i += 2) {
    auto nibble = [](char c) -> uint8_t {
      return static_cast<uint8_t>(c <= '9' ? c - '0' : c - 'a' + 10);
    };
    out.push_back(static_cast<uint8_t>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
  }
  return out;
}

bool OpenRejected(const zv::crypto::SymmetricKey& key, const zv::core::aead::Nonce& nonce,
                  const std::vector<uint8_t>& sealed) {
  try {
    (void)zv::core::aead::Open(key, nonce, sealed);
  } catch (const zv::AuthenticationFailureError&) {
    return true;
  }
  return false;
}

class FailingEncryptProvider : public zv::crypto::OpenSSLCryptoProvider {
public:
  zv::crypto::AES256_GCM::EncryptionResult EncryptAES256GCM(
      std::span<const uint8_t>, std::span<const uint8_t>,
      std::span<const uint8_t, zv::crypto::AES256_GCM::NONCE_SIZE>,
      std::span<const uint8_t, zv::crypto::AES256_GCM::KEY_SIZE>) override {
    throw zv::Error{zv::ErrorDomain::Crypto, zv::errors::crypto::kProviderFailure,
                    "injected encrypt failure"};
  }
};

}  // namespace

int main() {
  namespace aead = zv::core::aead;
  zv::crypto::EnsureCryptoProviderInitialized();

  // NIST GCM test case 14: zero key, zero IV, one zero block.
  {
    const std::array<uint8_t, 32> zero_key{};
    const auto key = zv::crypto::SymmetricKey::Import(zero_key);
    const aead::Nonce nonce{};
    const std::vector<uint8_t> plaintext(16, 0);
    const auto sealed = aead::Seal(key, nonce, plaintext);
    assert(sealed == FromHex("cea7403d4d606b6e074ec5d3baf39d18"
                             "d0d1c8a799996bf0265b98b5d48ab919") &&
           "known-answer vector matches");
  }

  const auto key = zv::crypto::SymmetricKey::Generate();
  const auto message = zv::AsBytes("hello world");
  const std::vector<uint8_t> plaintext(message.begin(), message.end());

  const auto n1 = aead::GenerateNonce();
  const auto n2 = aead::GenerateNonce();
  assert(n1 != n2 && "nonces are drawn independently");

  const auto sealed = aead::Seal(key, n1, plaintext);
  assert(sealed.size() == plaintext.size() + aead::kTagSize);
  assert(aead::Open(key, n1, sealed) == plaintext);
  assert(aead::Seal(key, n2, plaintext) != sealed && "fresh nonce changes the ciphertext");

  auto secure = aead::OpenSecure(key, n1, sealed);
  assert(secure.size() == plaintext.size());
  assert(std::equal(plaintext.begin(), plaintext.end(), secure.data()));

  // Every single-bit flip must be rejected.
  for (size_t byte = 0; byte < sealed.size(); ++byte) {
    for (int bit = 0; bit < 8; ++bit) {
      auto tampered = sealed;
      tampered[byte] ^= static_cast<uint8_t>(1u << bit);
      if (!OpenRejected(key, n1, tampered)) {
        std::cerr << "bit flip accepted at byte " << byte << " bit " << bit << "\n";
        return 1;
      }
    }
  }

  const auto other_key = zv::crypto::SymmetricKey::Generate();
  assert(OpenRejected(other_key, n1, sealed) && "wrong key is an authentication failure");
  assert(OpenRejected(key, n2, sealed) && "wrong nonce is an authentication failure");

  bool truncated = false;
  try {
    (void)aead::Open(key, n1, std::vector<uint8_t>(aead::kTagSize - 1, 0));
  } catch (const zv::Error& err) {
    truncated = err.domain == zv::ErrorDomain::Validation &&
                err.code == zv::errors::validation::kCiphertextTruncated;
  }
  assert(truncated && "short input is rejected before decryption");

  bool bad_nonce = false;
  try {
    (void)aead::NonceFromBytes(std::vector<uint8_t>(11, 0));
  } catch (const zv::Error& err) {
    bad_nonce = err.code == zv::errors::validation::kNonceLength;
  }
  assert(bad_nonce && "11-byte nonce is rejected");

  const auto blob = aead::SealBlob(key, plaintext);
  assert(blob.size() == aead::kNonceSize + plaintext.size() + aead::kTagSize);
  assert(aead::OpenBlob(key, blob) == plaintext);
  assert(aead::SealBlob(key, {}).size() == aead::kNonceSize + aead::kTagSize);
  assert(aead::OpenBlob(key, aead::SealBlob(key, {})).empty());

  bool key_length = false;
  try {
    (void)zv::crypto::SymmetricKey::Import(std::vector<uint8_t>(31, 1));
  } catch (const zv::Error& err) {
    key_length = err.code == zv::errors::validation::kKeyLength;
  }
  assert(key_length && "31-byte key is rejected");

  auto exported = key.Export();
  const auto reimported = zv::crypto::SymmetricKey::Import(exported.AsSpan());
  assert(reimported.Equals(key));
  assert(!other_key.Equals(key));

  zv::crypto::SymmetricKey moved_from = zv::crypto::SymmetricKey::Generate();
  zv::crypto::SymmetricKey target = std::move(moved_from);
  assert(target.Valid());
  assert(!moved_from.Valid() && "moved-from key holds nothing");

  zv::crypto::SetCryptoProvider(std::make_shared<FailingEncryptProvider>());
  bool provider_failed = false;
  try {
    (void)aead::Seal(key, n1, plaintext);
  } catch (const zv::Error& err) {
    provider_failed = err.domain == zv::ErrorDomain::Crypto &&
                      err.code == zv::errors::crypto::kProviderFailure;
  }
  zv::crypto::SetCryptoProvider(nullptr);
  assert(provider_failed && "provider errors surface unchanged");
  assert(aead::Open(key, n1, aead::Seal(key, n1, plaintext)) == plaintext);

  std::cout << "aead tests ok\n";
  return 0;
}

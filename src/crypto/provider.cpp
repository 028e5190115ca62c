#include "zv/crypto/provider.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#if defined(ZV_HAVE_SODIUM) && ZV_HAVE_SODIUM
#include <sodium.h>
#endif

#include <algorithm>
#include <array>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "zv/crypto/ct.h"
#include "zv/error.h"

namespace zv::crypto {

namespace {

[[noreturn]] void ThrowCryptoError(const std::string& message,
                                   int code = zv::errors::crypto::kProviderFailure);

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

void CheckOpenSSL(int rc, const char* what, int code = zv::errors::crypto::kProviderFailure) {
  if (rc != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage(what), code);
  }
}

int CheckedLength(size_t size, const char* what);

struct CipherCtxFree {
  void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};

// One AES-256-GCM operation: context keyed, nonce set, AAD absorbed.
class GcmOperation {
public:
  GcmOperation(bool encrypt, std::span<const uint8_t, AES256_GCM::KEY_SIZE> key,
               std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce, std::span<const uint8_t> aad)
      : ctx_(EVP_CIPHER_CTX_new()) {
    if (!ctx_) {
      ThrowCryptoError("Failed to allocate AES-GCM context");
    }
    CheckOpenSSL(EVP_CipherInit_ex(ctx_.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr,
                                   encrypt ? 1 : 0),
                 "EVP_CipherInit_ex");
    CheckOpenSSL(EVP_CIPHER_CTX_ctrl(ctx_.get(), EVP_CTRL_GCM_SET_IVLEN,
                                     static_cast<int>(nonce.size()), nullptr),
                 "EVP_CTRL_GCM_SET_IVLEN");
    CheckOpenSSL(EVP_CipherInit_ex(ctx_.get(), nullptr, nullptr, key.data(), nonce.data(),
                                   encrypt ? 1 : 0),
                 "EVP_CipherInit_ex key/iv");
    if (!aad.empty()) {
      int len = 0;
      CheckOpenSSL(EVP_CipherUpdate(ctx_.get(), nullptr, &len, aad.data(), CheckedLength(aad.size(), "aad")),
                   "EVP_CipherUpdate aad");
    }
  }

  // Returns bytes written to |out|, which holds at least in.size() bytes.
  size_t Update(std::span<const uint8_t> in, uint8_t* out) {
    if (in.empty()) {
      return 0;
    }
    int len = 0;
    CheckOpenSSL(EVP_CipherUpdate(ctx_.get(), out, &len, in.data(), CheckedLength(in.size(), "input")),
                 "EVP_CipherUpdate");
    return static_cast<size_t>(len);
  }

  EVP_CIPHER_CTX* get() const noexcept { return ctx_.get(); }

private:
  std::unique_ptr<EVP_CIPHER_CTX, CipherCtxFree> ctx_;
};

std::once_flag& RuntimeOnce() {
  static std::once_flag once;
  return once;
}

std::mutex& ProviderMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<CryptoProvider>& ProviderInstance() {
  static std::shared_ptr<CryptoProvider> instance;
  return instance;
}

void ThrowCryptoError(const std::string& message, int code) {
  throw zv::Error(zv::ErrorDomain::Crypto, code, message);
}

int CheckedLength(size_t size, const char* what) {
  if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw zv::Error(zv::ErrorDomain::Validation, zv::errors::crypto::kProviderFailure,
                    std::string(what) + " exceeds provider length limit");
  }
  return static_cast<int>(size);
}

// NIST GCM test case 16 (AES-256, 60-byte plaintext, 20-byte AAD).
void RunAESGCMKnownAnswerTest() {
  static constexpr std::array<uint8_t, AES256_GCM::KEY_SIZE> kKey{
      0xfe, 0xff, 0xe9, 0x92, 0x86, 0x65, 0x73, 0x1c,
      0x6d, 0x6a, 0x8f, 0x94, 0x67, 0x30, 0x83, 0x08,
      0xfe, 0xff, 0xe9, 0x92, 0x86, 0x65, 0x73, 0x1c,
      0x6d, 0x6a, 0x8f, 0x94, 0x67, 0x30, 0x83, 0x08};
  static constexpr std::array<uint8_t, AES256_GCM::NONCE_SIZE> kNonce{
      0xca, 0xfe, 0xba, 0xbe, 0xfa, 0xce,
      0xdb, 0xad, 0xde, 0xca, 0xf8, 0x88};
  static constexpr std::array<uint8_t, 60> kPlaintext{
      0xd9, 0x31, 0x32, 0x25, 0xf8, 0x84, 0x06, 0xe5, 0xa5, 0x59, 0x09, 0xc5,
      0xaf, 0xf5, 0x26, 0x9a, 0x86, 0xa7, 0xa9, 0x53, 0x15, 0x34, 0xf7, 0xda,
      0x2e, 0x4c, 0x30, 0x3d, 0x8a, 0x31, 0x8a, 0x72, 0x1c, 0x3c, 0x0c, 0x95,
      0x95, 0x68, 0x09, 0x53, 0x2f, 0xcf, 0x0e, 0x24, 0x49, 0xa6, 0xb5, 0x25,
      0xb1, 0x6a, 0xed, 0xf5, 0xaa, 0x0d, 0xe6, 0x57, 0xba, 0x63, 0x7b, 0x39};
  static constexpr std::array<uint8_t, 20> kAad{
      0xfe, 0xed, 0xfa, 0xce, 0xde, 0xad, 0xbe, 0xef, 0xfe, 0xed,
      0xfa, 0xce, 0xde, 0xad, 0xbe, 0xef, 0xab, 0xad, 0xda, 0xd2};
  static constexpr std::array<uint8_t, 60> kExpectedCiphertext{
      0x52, 0x2d, 0xc1, 0xf0, 0x99, 0x56, 0x7d, 0x07, 0xf4, 0x7f, 0x37, 0xa3,
      0x2a, 0x84, 0x42, 0x7d, 0x64, 0x3a, 0x8c, 0xdc, 0xbf, 0xe5, 0xc0, 0xc9,
      0x75, 0x98, 0xa2, 0xbd, 0x25, 0x55, 0xd1, 0xaa, 0x8c, 0xb0, 0x8e, 0x48,
      0x59, 0x0d, 0xbb, 0x3d, 0xa7, 0xb0, 0x8b, 0x10, 0x56, 0x82, 0x88, 0x38,
      0xc5, 0xf6, 0x1e, 0x63, 0x93, 0xba, 0x7a, 0x0a, 0xbc, 0xc9, 0xf6, 0x62};
  static constexpr std::array<uint8_t, AES256_GCM::TAG_SIZE> kExpectedTag{
      0x76, 0xfc, 0x6e, 0xce, 0x0f, 0x4e, 0x17, 0x68,
      0xcd, 0xdf, 0x88, 0x53, 0xbb, 0x2d, 0x55, 0x1b};

  OpenSSLCryptoProvider provider;
  const auto enc = provider.EncryptAES256GCM(
      std::span<const uint8_t>(kPlaintext.data(), kPlaintext.size()),
      std::span<const uint8_t>(kAad.data(), kAad.size()),
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE>(kNonce),
      std::span<const uint8_t, AES256_GCM::KEY_SIZE>(kKey));
  if (enc.ciphertext.size() != kExpectedCiphertext.size() ||
      !ct::CompareEqual(std::span<const uint8_t>(enc.ciphertext.data(), enc.ciphertext.size()),
                        std::span<const uint8_t>(kExpectedCiphertext.data(), kExpectedCiphertext.size()))) {
    ThrowCryptoError("AES-GCM KAT ciphertext mismatch");
  }
  if (!ct::CompareEqual(enc.tag, kExpectedTag)) {
    ThrowCryptoError("AES-GCM KAT tag mismatch");
  }

  std::array<uint8_t, kPlaintext.size()> plain_buf{};
  const size_t written = provider.DecryptAES256GCM(
      std::span<const uint8_t>(enc.ciphertext.data(), enc.ciphertext.size()),
      std::span<const uint8_t>(kAad.data(), kAad.size()),
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE>(kNonce),
      std::span<const uint8_t, AES256_GCM::TAG_SIZE>(enc.tag),
      std::span<const uint8_t, AES256_GCM::KEY_SIZE>(kKey),
      std::span<uint8_t>(plain_buf.data(), plain_buf.size()));
  if (written != kPlaintext.size() || !ct::CompareEqual(plain_buf, kPlaintext)) {
    ThrowCryptoError("AES-GCM KAT decrypt mismatch");
  }
}

// A failed self-test leaves the flag unset, so every later call retries and
// throws again instead of running on a broken provider.
void EnsureCryptoRuntimeConfigured() {
  std::call_once(RuntimeOnce(), []() {
#if defined(ZV_HAVE_SODIUM) && ZV_HAVE_SODIUM
    if (sodium_init() < 0) {
      ThrowCryptoError("sodium_init failed");
    }
#endif
    RunAESGCMKnownAnswerTest();
  });
}

}  // namespace

void EnsureCryptoProviderInitialized() {
  EnsureCryptoRuntimeConfigured();
}

AES256_GCM::EncryptionResult OpenSSLCryptoProvider::EncryptAES256GCM(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) {
  GcmOperation op(true, key, nonce, aad);
  AES256_GCM::EncryptionResult result;
  result.ciphertext.resize(plaintext.size());
  size_t total = op.Update(plaintext, result.ciphertext.data());

  int final_len = 0;
  CheckOpenSSL(EVP_EncryptFinal_ex(op.get(), result.ciphertext.data() + total, &final_len),
               "EVP_EncryptFinal_ex");
  total += static_cast<size_t>(final_len);
  result.ciphertext.resize(total);
  CheckOpenSSL(EVP_CIPHER_CTX_ctrl(op.get(), EVP_CTRL_GCM_GET_TAG, AES256_GCM::TAG_SIZE, result.tag.data()),
               "EVP_CTRL_GCM_GET_TAG");
  return result;
}

size_t OpenSSLCryptoProvider::DecryptAES256GCM(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key,
    std::span<uint8_t> destination) {
  if (destination.size() < ciphertext.size()) {
    ThrowCryptoError("AES-GCM destination buffer too small");
  }
  GcmOperation op(false, key, nonce, aad);
  size_t total = op.Update(ciphertext, destination.data());
  CheckOpenSSL(EVP_CIPHER_CTX_ctrl(op.get(), EVP_CTRL_GCM_SET_TAG, AES256_GCM::TAG_SIZE,
                                   const_cast<uint8_t*>(tag.data())),
               "EVP_CTRL_GCM_SET_TAG");

  int final_len = 0;
  if (EVP_DecryptFinal_ex(op.get(), destination.data() + total, &final_len) <= 0) {
    // Unauthenticated output must not survive the failure.
    std::fill_n(destination.begin(), ciphertext.size(), uint8_t{0});
    ERR_clear_error();
    throw zv::AuthenticationFailureError("AES-GCM authentication failed");
  }
  return total + static_cast<size_t>(final_len);
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::SHA256(
    std::span<const uint8_t> data) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  CheckOpenSSL(EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr),
               "EVP_Digest(EVP_sha256)");
  if (len != out.size()) {
    ThrowCryptoError("Unexpected SHA-256 length");
  }
  return out;
}

void OpenSSLCryptoProvider::PBKDF2HMACSHA256(
    std::span<const uint8_t> password,
    std::span<const uint8_t> salt,
    uint32_t iterations,
    std::span<uint8_t> output) {
  if (iterations == 0 || iterations > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
    ThrowCryptoError("PBKDF2 iteration count out of range", zv::errors::crypto::kKdfFailed);
  }
  // OpenSSL rejects a null password pointer even when the length is zero.
  static const char kEmpty[1] = {0};
  const char* pass = password.empty() ? kEmpty : reinterpret_cast<const char*>(password.data());
  CheckOpenSSL(PKCS5_PBKDF2_HMAC(pass, CheckedLength(password.size(), "password"), salt.data(),
                                 CheckedLength(salt.size(), "salt"), static_cast<int>(iterations),
                                 EVP_sha256(), CheckedLength(output.size(), "derived key"), output.data()),
               "PKCS5_PBKDF2_HMAC", zv::errors::crypto::kKdfFailed);
}

std::shared_ptr<CryptoProvider> GetCryptoProviderShared() {
  EnsureCryptoRuntimeConfigured();
  std::lock_guard<std::mutex> lock(ProviderMutex());
  auto& provider = ProviderInstance();
  if (!provider) {
    provider = std::make_shared<OpenSSLCryptoProvider>();
  }
  return provider;
}

CryptoProvider& GetCryptoProvider() {
  return *GetCryptoProviderShared();
}

void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider) {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance() = std::move(provider);
}

}  // namespace zv::crypto

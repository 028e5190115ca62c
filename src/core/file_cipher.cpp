#include "zv/core/file_cipher.h"

#include <string>
#include <utility>

#include "zv/codec/base64.h"
#include "zv/error.h"
#include "zv/errors.h"
#include "zv/orchestrator/event_bus.h"

namespace zv::core {

namespace {

const char* StageName(DecryptStage stage) {
  switch (stage) {
  case DecryptStage::kKeyUnwrap:
    return "key_unwrap";
  case DecryptStage::kBody:
    return "body";
  }
  return "unknown";
}

[[noreturn]] void FailDecrypt(DecryptStage stage, const std::exception& cause) {
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kSecurity;
  event.severity = orchestrator::EventSeverity::kWarning;
  event.event_id = "file_decrypt_failed";
  event.message = "File decryption rejected";
  event.fields.emplace_back("stage", StageName(stage));
  event.fields.emplace_back("reason", cause.what());
  orchestrator::EventBus::Instance().Publish(event);
  throw DecryptionError(stage, std::string(zv::errors::msg::kCannotDecryptFile));
}

}  // namespace

std::string EncryptedFile::CiphertextBase64() const {
  return codec::Base64Encode(ciphertext);
}

std::string EncryptedFile::WrappedKeyBase64() const {
  return codec::Base64Encode(wrapped_file_key);
}

std::string EncryptedFile::BodyNonceBase64() const {
  return codec::Base64Encode(body_nonce);
}

std::string EncryptedFile::KeyWrapNonceBase64() const {
  return codec::Base64Encode(key_wrap_nonce);
}

crypto::SymmetricKey GenerateFileKey() {
  return crypto::SymmetricKey::Generate();
}

EncryptedFile EncryptFile(std::span<const uint8_t> plaintext, const crypto::SymmetricKey& master_key) {
  EncryptedFile out;
  out.plaintext_size = plaintext.size();

  const auto file_key = GenerateFileKey();
  out.body_nonce = aead::GenerateNonce();
  out.ciphertext = aead::Seal(file_key, out.body_nonce, plaintext);

  out.key_wrap_nonce = aead::GenerateNonce();
  const auto raw_key = file_key.Export();
  out.wrapped_file_key = aead::Seal(master_key, out.key_wrap_nonce, raw_key.AsSpan());
  return out;
}

crypto::SymmetricKey UnwrapFileKey(const EncryptedFile& file, const crypto::SymmetricKey& master_key) {
  try {
    auto raw = aead::OpenSecure(master_key, file.key_wrap_nonce, file.wrapped_file_key);
    return crypto::SymmetricKey(std::move(raw));
  } catch (const AuthenticationFailureError& err) {
    FailDecrypt(DecryptStage::kKeyUnwrap, err);
  } catch (const Error& err) {
    if (err.domain != ErrorDomain::Validation) {
      throw;
    }
    FailDecrypt(DecryptStage::kKeyUnwrap, err);
  }
}

std::vector<uint8_t> DecryptFile(const EncryptedFile& file, const crypto::SymmetricKey& master_key) {
  const auto file_key = UnwrapFileKey(file, master_key);
  try {
    return aead::Open(file_key, file.body_nonce, file.ciphertext);
  } catch (const AuthenticationFailureError& err) {
    FailDecrypt(DecryptStage::kBody, err);
  } catch (const Error& err) {
    if (err.domain != ErrorDomain::Validation) {
      throw;
    }
    FailDecrypt(DecryptStage::kBody, err);
  }
}

EncryptedFile RewrapFileKey(const EncryptedFile& file, const crypto::SymmetricKey& old_master,
                            const crypto::SymmetricKey& new_master) {
  const auto file_key = UnwrapFileKey(file, old_master);
  EncryptedFile out;
  out.ciphertext = file.ciphertext;
  out.body_nonce = file.body_nonce;
  out.plaintext_size = file.plaintext_size;
  out.key_wrap_nonce = aead::GenerateNonce();
  const auto raw_key = file_key.Export();
  out.wrapped_file_key = aead::Seal(new_master, out.key_wrap_nonce, raw_key.AsSpan());
  return out;
}

}  // namespace zv::core

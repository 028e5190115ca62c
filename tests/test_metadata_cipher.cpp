#include "zv/core/metadata_cipher.h"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "zv/codec/base64.h"
#include "zv/common.h"
#include "zv/core/aead.h"
#include "zv/crypto/provider.h"
#include "zv/error.h"
#include "zv/errors.h"
#include "zv/orchestrator/event_bus.h"

namespace {

bool MalformedRecord(std::string_view json) {
  try {
    (void)zv::core::ParseMetadataRecord(json);
  } catch (const zv::Error& err) {
    return err.code == zv::errors::validation::kMalformedRecord;
  }
  return false;
}

std::string SealRaw(std::string_view text, const zv::crypto::SymmetricKey& key) {
  return zv::codec::Base64Encode(zv::core::aead::SealBlob(key, zv::AsBytes(text)));
}

class FailingDecryptProvider : public zv::crypto::OpenSSLCryptoProvider {
public:
  size_t DecryptAES256GCM(std::span<const uint8_t>, std::span<const uint8_t>,
                          std::span<const uint8_t, zv::crypto::AES256_GCM::NONCE_SIZE>,
                          std::span<const uint8_t, zv::crypto::AES256_GCM::TAG_SIZE>,
                          std::span<const uint8_t, zv::crypto::AES256_GCM::KEY_SIZE>,
                          std::span<uint8_t>) override {
    throw zv::Error{zv::ErrorDomain::Crypto, zv::errors::crypto::kProviderFailure,
                    "injected decrypt failure"};
  }
};

}  // namespace

int main() {
  namespace core = zv::core;
  using core::MetadataStatus;
  using zv::orchestrator::Event;
  using zv::orchestrator::EventBus;

  zv::crypto::EnsureCryptoProviderInitialized();

  std::vector<std::string> fallback_reasons;
  EventBus::Instance().Subscribe([&fallback_reasons](const Event& event) {
    if (event.event_id != "metadata_fallback") {
      return;
    }
    for (const auto& field : event.fields) {
      if (field.key == "reason") {
        fallback_reasons.push_back(field.value);
      }
    }
  });

  // Serialization layout.
  {
    core::MetadataRecord record;
    record.filename = "a.txt";
    record.size = 11;
    record.mime_type = "text/plain";
    assert(core::SerializeMetadataRecord(record) ==
               R"({"filename":"a.txt","size":11,"mimeType":"text/plain"})" &&
           "required keys only");

    record.wrapped_file_key = "K";
    record.body_nonce = "I";
    record.key_wrap_nonce = "W";
    assert(core::SerializeMetadataRecord(record) ==
               R"({"filename":"a.txt","size":11,"mimeType":"text/plain","encryptedKey":"K","iv":"I","keyIv":"W"})" &&
           "optional keys in fixed order");
    assert(core::ParseMetadataRecord(core::SerializeMetadataRecord(record)) == record &&
           "serialized record parses back");
  }

  {
    core::MetadataRecord record;
    record.filename = "quote \" slash \\ tab\t newline\n \x01 caf\xc3\xa9";
    record.size = 0;
    record.mime_type = "application/pdf";
    assert(core::ParseMetadataRecord(core::SerializeMetadataRecord(record)) == record &&
           "escapes survive");
  }

  // Records written by other clients.
  {
    const auto legacy = core::ParseMetadataRecord(
        R"({ "filename" : "b.png", "size" : 2048.0, "mimeType" : "image/png", "salt" : "S", "extra" : true, "iv" : null })");
    assert(legacy.filename == "b.png" && legacy.size == 2048 && legacy.mime_type == "image/png" &&
           "whitespace and double sizes accepted");
    assert(legacy.key_wrap_nonce == std::optional<std::string>("S") && "legacy salt read as keyIv");
    assert(!legacy.body_nonce && "null optional ignored");

    const auto both = core::ParseMetadataRecord(
        R"({"filename":"c","size":1,"mimeType":"x/y","keyIv":"NEW","salt":"OLD"})");
    assert(both.key_wrap_nonce == std::optional<std::string>("NEW") && "keyIv wins over salt");

    const auto escaped = core::ParseMetadataRecord(
        R"({"filename":"\u00e9\ud83d\ude00\/","size":3,"mimeType":"text/plain"})");
    assert(escaped.filename == "\xc3\xa9\xf0\x9f\x98\x80/" && "unicode escapes decoded");
  }

  assert(MalformedRecord("") && "empty text");
  assert(MalformedRecord("[]") && "not an object");
  assert(MalformedRecord(R"({"filename":"a","mimeType":"t"})") && "missing size");
  assert(MalformedRecord(R"({"filename":"a","size":"12","mimeType":"t"})") && "string size");
  assert(MalformedRecord(R"({"filename":"a","size":-1,"mimeType":"t"})") && "negative size");
  assert(MalformedRecord(R"({"filename":"a","size":1e20,"mimeType":"t"})") && "size beyond 64 bits");
  assert(MalformedRecord(R"({"filename":"a","size":18446744073709551616,"mimeType":"t"})") &&
         "size of exactly 2^64");
  assert(MalformedRecord(R"({"filename":"a","size":18446744073709551615.0,"mimeType":"t"})") &&
         "double that rounds up to 2^64");
  assert(MalformedRecord(R"({"filename":"a","size":1.5,"mimeType":"t"})") && "fractional size");
  assert(MalformedRecord(R"({"filename":"a","size":1,"mimeType":"t"} x)") && "trailing garbage");
  assert(MalformedRecord(R"({"filename":"a","size":1,"mimeType":"t","n":{}})") && "nested object");
  assert(MalformedRecord(R"({"filename":"a,"size":1,"mimeType":"t"})") && "unterminated string");

  const auto key = zv::crypto::SymmetricKey::Generate();
  const auto other = zv::crypto::SymmetricKey::Generate();

  // End-to-end encryption of the record.
  {
    core::MetadataRecord record;
    record.filename = "a.txt";
    record.size = 11;
    record.mime_type = "text/plain";
    record.wrapped_file_key = "d3JhcHBlZA==";
    record.body_nonce = "AAAAAAAAAAAAAAAA";
    record.key_wrap_nonce = "BBBBBBBBBBBBBBBB";

    const auto blob = core::EncryptMetadata(record, key);
    assert(blob != core::EncryptMetadata(record, key) && "fresh nonce per encryption");
    assert(blob.find("a.txt") == std::string::npos && "filename not visible in the blob");

    fallback_reasons.clear();
    const auto result = core::TryDecryptMetadata(blob, key);
    assert(result.status == MetadataStatus::kOk && result.record == record && "round trip");
    assert(core::DecryptMetadata(blob, key) == record && "plain accessor agrees");
    assert(fallback_reasons.empty() && "no fallback on success");

    const auto wrong = core::TryDecryptMetadata(blob, other);
    assert(wrong.status == MetadataStatus::kAuthenticationFailed && "wrong key detected");
    assert(wrong.record == core::FallbackRecord() && "wrong key gives fallback record");
    assert(wrong.record.filename == "Unknown File" && wrong.record.size == 0 &&
           wrong.record.mime_type == "application/octet-stream" && "fallback values");
    assert(fallback_reasons.size() == 1 && fallback_reasons.back() == "authentication_failed" &&
           "fallback published with reason");
  }

  {
    const auto bad_encoding = core::TryDecryptMetadata("%%%not base64%%%", key);
    assert(bad_encoding.status == MetadataStatus::kMalformedEncoding && "bad base64");
    assert(bad_encoding.record == core::FallbackRecord() && "bad base64 falls back");

    const auto truncated = core::TryDecryptMetadata("AAAAAAAAAAAAAAAAAAAA", key);
    assert(truncated.status == MetadataStatus::kTruncated && "shorter than nonce and tag");

    const auto not_json = core::TryDecryptMetadata(SealRaw("plainly not json", key), key);
    assert(not_json.status == MetadataStatus::kMalformedRecord && "authentic but unparsable");
    assert(not_json.record == core::FallbackRecord() && "unparsable falls back");

    assert(fallback_reasons.size() == 4 && fallback_reasons[1] == "malformed_encoding" &&
           fallback_reasons[2] == "truncated" && fallback_reasons[3] == "malformed_record" &&
           "each fallback reported once");
  }

  // A failing crypto provider also yields the fallback record.
  {
    core::MetadataRecord record;
    record.filename = "p.txt";
    record.size = 1;
    record.mime_type = "text/plain";
    const auto blob = core::EncryptMetadata(record, key);

    fallback_reasons.clear();
    zv::crypto::SetCryptoProvider(std::make_shared<FailingDecryptProvider>());
    const auto failed = core::TryDecryptMetadata(blob, key);
    const auto plain = core::DecryptMetadata(blob, key);
    zv::crypto::SetCryptoProvider(nullptr);
    assert(failed.status == MetadataStatus::kProviderFailure && "provider failure reported");
    assert(failed.record == core::FallbackRecord() && plain == core::FallbackRecord() &&
           "provider failure falls back");
    assert(fallback_reasons.size() == 2 && fallback_reasons[0] == "provider_failure" &&
           "provider fallback published");
    assert(core::DecryptMetadata(blob, key) == record && "default provider restored");
  }

  // Filenames and single fields throw instead of falling back.
  {
    const auto blob = core::EncryptFilename("report.pdf", key);
    assert(core::DecryptFilename(blob, key) == "report.pdf" && "filename round trip");

    bool rejected = false;
    try {
      (void)core::DecryptFilename(blob, other);
    } catch (const zv::AuthenticationFailureError&) {
      rejected = true;
    }
    assert(rejected && "wrong key rejected");

    bool malformed = false;
    try {
      (void)core::DecryptFilename("***", key);
    } catch (const zv::Error& err) {
      malformed = err.domain == zv::ErrorDomain::Validation;
    }
    assert(malformed && "malformed filename blob rejected");

    assert(core::DecryptField(core::EncryptField("", key), key).empty() && "empty field round trip");
  }

  // Server-side copies fall back per field.
  {
    const auto fields = core::EncryptServerFields("notes.md", 4096, "text/markdown", key);
    const auto plain = core::DecryptServerFields(fields, key);
    assert(plain.filename == "notes.md" && plain.size == 4096 && plain.mime_type == "text/markdown" &&
           "server fields round trip");

    auto mixed = fields;
    mixed.encrypted_type = core::EncryptField("text/html", other);
    mixed.encrypted_size = core::EncryptField("not-a-number", key);
    const auto partial = core::DecryptServerFields(mixed, key);
    assert(partial.filename == "notes.md" && "intact field kept");
    assert(partial.mime_type == "application/octet-stream" && "foreign field falls back");
    assert(partial.size == 0 && "non-numeric size falls back");

    const auto missing = core::DecryptServerFields(core::ServerFields{}, key);
    assert(missing.filename == "Unknown File" && missing.size == 0 && "absent fields fall back");
  }

  zv::orchestrator::ResetEventBusForTesting();
  std::cout << "metadata cipher tests ok\n";
  return 0;
}

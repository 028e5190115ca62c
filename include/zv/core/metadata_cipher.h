#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "zv/crypto/symmetric_key.h"

namespace zv::core {

// Plaintext description of a stored file. The optional fields carry the
// base64 forms of the file cipher's wrapped key and nonces.
struct MetadataRecord {
  std::string filename;
  uint64_t size{0};
  std::string mime_type;
  std::optional<std::string> wrapped_file_key;
  std::optional<std::string> body_nonce;
  std::optional<std::string> key_wrap_nonce;

  bool operator==(const MetadataRecord&) const = default;
};

inline constexpr std::string_view kFallbackFilename{"Unknown File"};
inline constexpr std::string_view kFallbackMimeType{"application/octet-stream"};

MetadataRecord FallbackRecord();

// Compact JSON, keys in the order filename, size, mimeType, encryptedKey, iv,
// keyIv. Absent optionals are omitted.
std::string SerializeMetadataRecord(const MetadataRecord& record);
// Throws zv::Error (Validation/kMalformedRecord). Unknown keys are ignored and
// the legacy key "salt" is read as keyIv.
MetadataRecord ParseMetadataRecord(std::string_view json);

enum class MetadataStatus {
  kOk,
  kMalformedEncoding,
  kTruncated,
  kAuthenticationFailed,
  kMalformedRecord,
  kProviderFailure,
};

struct MetadataDecryptResult {
  MetadataRecord record;
  MetadataStatus status{MetadataStatus::kOk};
};

// base64(nonce || ciphertext || tag) under a fresh nonce.
std::string EncryptMetadata(const MetadataRecord& record, const crypto::SymmetricKey& key);

// Never throws on bad input or a failing crypto provider; status says why
// the fallback record was used.
MetadataDecryptResult TryDecryptMetadata(std::string_view blob, const crypto::SymmetricKey& key);
MetadataRecord DecryptMetadata(std::string_view blob, const crypto::SymmetricKey& key);

std::string EncryptFilename(std::string_view name, const crypto::SymmetricKey& key);
// Unlike DecryptMetadata this throws: zv::Error (Validation) for malformed
// input, AuthenticationFailureError for a wrong key or tampered blob.
std::string DecryptFilename(std::string_view blob, const crypto::SymmetricKey& key);

std::string EncryptField(std::string_view value, const crypto::SymmetricKey& key);
std::string DecryptField(std::string_view blob, const crypto::SymmetricKey& key);

// Individually encrypted copies of the descriptive fields, stored by the
// server beside the metadata blob.
struct ServerFields {
  std::string encrypted_size;
  std::string encrypted_type;
  std::string encrypted_original_name;
};

ServerFields EncryptServerFields(std::string_view filename, uint64_t size, std::string_view mime_type,
                                 const crypto::SymmetricKey& key);

struct DecryptedServerFields {
  std::string filename;
  uint64_t size{0};
  std::string mime_type;
};

// Each field falls back independently to the fallback record's value.
DecryptedServerFields DecryptServerFields(const ServerFields& fields, const crypto::SymmetricKey& key);

}  // namespace zv::core

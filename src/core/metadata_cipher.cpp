#include "zv/core/metadata_cipher.h"

#include <charconv>
#include <cmath>
#include <string>
#include <vector>

#include "zv/codec/base64.h"
#include "zv/codec/json.h"
#include "zv/common.h"
#include "zv/core/aead.h"
#include "zv/error.h"
#include "zv/errors.h"
#include "zv/orchestrator/event_bus.h"

namespace zv::core {

namespace {

[[noreturn]] void ThrowMalformedRecord(std::string_view detail) {
  std::string message(zv::errors::msg::kMetadataRecordMalformed);
  message.append(": ");
  message.append(detail);
  throw zv::Error(zv::ErrorDomain::Validation, zv::errors::validation::kMalformedRecord, message);
}

void AppendUtf8(std::string& out, uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Reader for the flat objects produced by SerializeMetadataRecord and by
// older clients: string, number, boolean and null values only.
class FlatJsonReader {
public:
  explicit FlatJsonReader(std::string_view text) : text_(text) {}

  void SkipSpace() {
    while (pos_ < text_.size() &&
           (text_[pos_] == ' ' || text_[pos_] == '\t' || text_[pos_] == '\n' || text_[pos_] == '\r')) {
      ++pos_;
    }
  }

  bool Consume(char c) {
    SkipSpace();
    if (pos_ < text_.size() && text_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  void Expect(char c) {
    if (!Consume(c)) {
      ThrowMalformedRecord(std::string("expected '") + c + "'");
    }
  }

  bool AtEnd() {
    SkipSpace();
    return pos_ == text_.size();
  }

  char Peek() {
    SkipSpace();
    if (pos_ >= text_.size()) {
      ThrowMalformedRecord("unexpected end of input");
    }
    return text_[pos_];
  }

  std::string ReadString() {
    Expect('"');
    std::string out;
    while (true) {
      if (pos_ >= text_.size()) {
        ThrowMalformedRecord("unterminated string");
      }
      const char c = text_[pos_++];
      if (c == '"') {
        return out;
      }
      if (static_cast<unsigned char>(c) < 0x20) {
        ThrowMalformedRecord("control character in string");
      }
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (pos_ >= text_.size()) {
        ThrowMalformedRecord("dangling escape");
      }
      const char esc = text_[pos_++];
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        out.push_back(esc);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u': {
        uint32_t cp = ReadHex4();
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          if (pos_ + 2 > text_.size() || text_[pos_] != '\\' || text_[pos_ + 1] != 'u') {
            ThrowMalformedRecord("unpaired surrogate");
          }
          pos_ += 2;
          const uint32_t low = ReadHex4();
          if (low < 0xDC00 || low > 0xDFFF) {
            ThrowMalformedRecord("unpaired surrogate");
          }
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
          ThrowMalformedRecord("unpaired surrogate");
        }
        AppendUtf8(out, cp);
        break;
      }
      default:
        ThrowMalformedRecord("invalid escape");
      }
    }
  }

  // Returns the raw token of a number, true, false or null.
  std::string_view ReadScalarToken() {
    SkipSpace();
    const size_t start = pos_;
    while (pos_ < text_.size()) {
      const char c = text_[pos_];
      if (c == ',' || c == '}' || c == ' ' || c == '\t' || c == '\n' || c == '\r') {
        break;
      }
      ++pos_;
    }
    if (pos_ == start) {
      ThrowMalformedRecord("missing value");
    }
    return text_.substr(start, pos_ - start);
  }

private:
  uint32_t ReadHex4() {
    if (pos_ + 4 > text_.size()) {
      ThrowMalformedRecord("truncated unicode escape");
    }
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
      const char c = text_[pos_++];
      value <<= 4;
      if (c >= '0' && c <= '9') {
        value |= static_cast<uint32_t>(c - '0');
      } else if (c >= 'a' && c <= 'f') {
        value |= static_cast<uint32_t>(10 + c - 'a');
      } else if (c >= 'A' && c <= 'F') {
        value |= static_cast<uint32_t>(10 + c - 'A');
      } else {
        ThrowMalformedRecord("invalid unicode escape");
      }
    }
    return value;
  }

  std::string_view text_;
  size_t pos_{0};
};

uint64_t ParseSize(std::string_view token) {
  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
  if (ec == std::errc() && ptr == token.data() + token.size()) {
    return value;
  }
  // Some clients serialized sizes as doubles ("1024.0").
  double as_double = 0;
  auto [dptr, dec] = std::from_chars(token.data(), token.data() + token.size(), as_double);
  if (dec != std::errc() || dptr != token.data() + token.size() ||
      !(as_double >= 0 && as_double < 18446744073709551616.0) ||
      std::trunc(as_double) != as_double) {
    ThrowMalformedRecord("size is not a non-negative integer");
  }
  return static_cast<uint64_t>(as_double);
}

void ValidateScalar(std::string_view token) {
  if (token == "true" || token == "false" || token == "null") {
    return;
  }
  double ignored = 0;
  auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), ignored);
  if (ec != std::errc() || ptr != token.data() + token.size()) {
    ThrowMalformedRecord("invalid value");
  }
}

void PublishFallback(MetadataStatus status) {
  const char* reason = "unknown";
  switch (status) {
  case MetadataStatus::kOk:
    return;
  case MetadataStatus::kMalformedEncoding:
    reason = "malformed_encoding";
    break;
  case MetadataStatus::kTruncated:
    reason = "truncated";
    break;
  case MetadataStatus::kAuthenticationFailed:
    reason = "authentication_failed";
    break;
  case MetadataStatus::kMalformedRecord:
    reason = "malformed_record";
    break;
  case MetadataStatus::kProviderFailure:
    reason = "provider_failure";
    break;
  }
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kDiagnostics;
  event.severity = orchestrator::EventSeverity::kWarning;
  event.event_id = "metadata_fallback";
  event.message = "Metadata could not be decrypted; using fallback record";
  event.fields.emplace_back("reason", reason);
  orchestrator::EventBus::Instance().Publish(event);
}

std::string SealText(std::string_view text, const crypto::SymmetricKey& key) {
  return codec::Base64Encode(aead::SealBlob(key, zv::AsBytes(text)));
}

std::string OpenText(std::string_view blob, const crypto::SymmetricKey& key) {
  const auto raw = codec::Base64Decode(blob);
  const auto plain = aead::OpenBlob(key, raw);
  return zv::BytesToString(plain);
}

}  // namespace

MetadataRecord FallbackRecord() {
  MetadataRecord record;
  record.filename = std::string(kFallbackFilename);
  record.size = 0;
  record.mime_type = std::string(kFallbackMimeType);
  return record;
}

std::string SerializeMetadataRecord(const MetadataRecord& record) {
  std::string out;
  out.reserve(128 + record.filename.size());
  out += "{\"filename\":";
  codec::AppendJsonString(out, record.filename);
  out += ",\"size\":";
  out += std::to_string(record.size);
  out += ",\"mimeType\":";
  codec::AppendJsonString(out, record.mime_type);
  if (record.wrapped_file_key) {
    out += ",\"encryptedKey\":";
    codec::AppendJsonString(out, *record.wrapped_file_key);
  }
  if (record.body_nonce) {
    out += ",\"iv\":";
    codec::AppendJsonString(out, *record.body_nonce);
  }
  if (record.key_wrap_nonce) {
    out += ",\"keyIv\":";
    codec::AppendJsonString(out, *record.key_wrap_nonce);
  }
  out.push_back('}');
  return out;
}

MetadataRecord ParseMetadataRecord(std::string_view json) {
  FlatJsonReader reader(json);
  MetadataRecord record;
  bool have_filename = false;
  bool have_size = false;
  bool have_mime = false;

  reader.Expect('{');
  if (!reader.Consume('}')) {
    do {
      const std::string key = reader.ReadString();
      reader.Expect(':');
      const bool is_string = reader.Peek() == '"';
      if (key == "size") {
        if (is_string) {
          ThrowMalformedRecord("size must be a number");
        }
        record.size = ParseSize(reader.ReadScalarToken());
        have_size = true;
        continue;
      }
      if (!is_string) {
        const char next = reader.Peek();
        if (next == '{' || next == '[') {
          ThrowMalformedRecord("nested values are not supported");
        }
        const auto token = reader.ReadScalarToken();
        ValidateScalar(token);
        if (key == "filename" || key == "mimeType") {
          ThrowMalformedRecord(key + " must be a string");
        }
        // null for an optional field means absent.
        continue;
      }
      std::string value = reader.ReadString();
      if (key == "filename") {
        record.filename = std::move(value);
        have_filename = true;
      } else if (key == "mimeType") {
        record.mime_type = std::move(value);
        have_mime = true;
      } else if (key == "encryptedKey") {
        record.wrapped_file_key = std::move(value);
      } else if (key == "iv") {
        record.body_nonce = std::move(value);
      } else if (key == "keyIv" || (key == "salt" && !record.key_wrap_nonce)) {
        record.key_wrap_nonce = std::move(value);
      }
    } while (reader.Consume(','));
    reader.Expect('}');
  }
  if (!reader.AtEnd()) {
    ThrowMalformedRecord("trailing characters");
  }
  if (!have_filename || !have_size || !have_mime) {
    ThrowMalformedRecord("missing required field");
  }
  return record;
}

std::string EncryptMetadata(const MetadataRecord& record, const crypto::SymmetricKey& key) {
  return SealText(SerializeMetadataRecord(record), key);
}

MetadataDecryptResult TryDecryptMetadata(std::string_view blob, const crypto::SymmetricKey& key) {
  MetadataDecryptResult result;
  result.record = FallbackRecord();

  std::vector<uint8_t> raw;
  try {
    raw = codec::Base64Decode(blob);
  } catch (const Error&) {
    result.status = MetadataStatus::kMalformedEncoding;
    PublishFallback(result.status);
    return result;
  }
  if (raw.size() < aead::kNonceSize + aead::kTagSize) {
    result.status = MetadataStatus::kTruncated;
    PublishFallback(result.status);
    return result;
  }

  std::vector<uint8_t> plain;
  try {
    plain = aead::OpenBlob(key, raw);
  } catch (const AuthenticationFailureError&) {
    result.status = MetadataStatus::kAuthenticationFailed;
    PublishFallback(result.status);
    return result;
  } catch (const Error&) {
    result.status = MetadataStatus::kProviderFailure;
    PublishFallback(result.status);
    return result;
  }

  try {
    result.record = ParseMetadataRecord(zv::BytesToString(plain));
  } catch (const Error& err) {
    if (err.code != zv::errors::validation::kMalformedRecord) {
      throw;
    }
    result.status = MetadataStatus::kMalformedRecord;
    PublishFallback(result.status);
    return result;
  }
  result.status = MetadataStatus::kOk;
  return result;
}

MetadataRecord DecryptMetadata(std::string_view blob, const crypto::SymmetricKey& key) {
  return TryDecryptMetadata(blob, key).record;
}

std::string EncryptFilename(std::string_view name, const crypto::SymmetricKey& key) {
  return SealText(name, key);
}

std::string DecryptFilename(std::string_view blob, const crypto::SymmetricKey& key) {
  return OpenText(blob, key);
}

std::string EncryptField(std::string_view value, const crypto::SymmetricKey& key) {
  return SealText(value, key);
}

std::string DecryptField(std::string_view blob, const crypto::SymmetricKey& key) {
  return OpenText(blob, key);
}

ServerFields EncryptServerFields(std::string_view filename, uint64_t size, std::string_view mime_type,
                                 const crypto::SymmetricKey& key) {
  ServerFields fields;
  fields.encrypted_size = EncryptField(std::to_string(size), key);
  fields.encrypted_type = EncryptField(mime_type, key);
  fields.encrypted_original_name = EncryptField(filename, key);
  return fields;
}

DecryptedServerFields DecryptServerFields(const ServerFields& fields, const crypto::SymmetricKey& key) {
  DecryptedServerFields out;
  out.filename = std::string(kFallbackFilename);
  out.mime_type = std::string(kFallbackMimeType);

  auto try_field = [&key](const std::string& blob) -> std::optional<std::string> {
    if (blob.empty()) {
      return std::nullopt;
    }
    try {
      return DecryptField(blob, key);
    } catch (const AuthenticationFailureError&) {
      return std::nullopt;
    } catch (const Error& err) {
      if (err.domain != ErrorDomain::Validation) {
        throw;
      }
      return std::nullopt;
    }
  };

  if (auto name = try_field(fields.encrypted_original_name)) {
    out.filename = std::move(*name);
  }
  if (auto type = try_field(fields.encrypted_type)) {
    out.mime_type = std::move(*type);
  }
  if (auto size = try_field(fields.encrypted_size)) {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(size->data(), size->data() + size->size(), value);
    if (ec == std::errc() && ptr == size->data() + size->size()) {
      out.size = value;
    }
  }
  return out;
}

}  // namespace zv::core

#include "zv/orchestrator/transport.h"

#include <algorithm>
#include <system_error>

#include "zv/common.h"
#include "zv/crypto/random.h"
#include "zv/errors.h"
#include "zv/orchestrator/io_util.h"
#include "zv/tlv/parser.h"
#include "zv/tlv/writer.h"

namespace zv::orchestrator {

namespace {

constexpr size_t kObjectIdBytes = 16;

enum ObjectField : uint16_t {
  kFieldEncryptedFilename = 1,
  kFieldEncryptedMetadata = 2,
  kFieldEncryptedSize = 3,
  kFieldEncryptedType = 4,
  kFieldEncryptedOriginalName = 5,
  kFieldWrappedKey = 6,
  kFieldBodyNonce = 7,
  kFieldKeyWrapNonce = 8,
  kFieldCiphertextSize = 9,
};

[[noreturn]] void ThrowMissing(std::string_view remote_id) {
  throw zv::Error(zv::ErrorDomain::IO, zv::errors::io::kObjectMissing,
                  std::string(zv::errors::msg::kObjectNotFound) + ": " + std::string(remote_id));
}

bool IsObjectId(std::string_view id) {
  return id.size() == kObjectIdBytes * 2 &&
         std::all_of(id.begin(), id.end(), [](char c) {
           return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
         });
}

std::vector<uint8_t> EncodeObjectRecord(const UploadRequest& request) {
  tlv::Writer writer;
  writer.AppendString(kFieldEncryptedFilename, request.encrypted_filename)
      .AppendString(kFieldEncryptedMetadata, request.encrypted_metadata)
      .AppendString(kFieldEncryptedSize, request.server_fields.encrypted_size)
      .AppendString(kFieldEncryptedType, request.server_fields.encrypted_type)
      .AppendString(kFieldEncryptedOriginalName, request.server_fields.encrypted_original_name)
      .AppendString(kFieldWrappedKey, request.key_fields.wrapped_file_key)
      .AppendString(kFieldBodyNonce, request.key_fields.body_nonce)
      .AppendString(kFieldKeyWrapNonce, request.key_fields.key_wrap_nonce)
      .AppendU64(kFieldCiphertextSize, request.ciphertext_size);
  return writer.Release();
}

UploadRequest DecodeObjectRecord(std::span<const uint8_t> bytes, std::string_view remote_id) {
  tlv::Parser parser(bytes);
  if (!parser.valid() || parser.consumed() != bytes.size()) {
    throw zv::Error(zv::ErrorDomain::Validation, zv::errors::validation::kMalformedRecord,
                    "Stored object record is malformed: " + std::string(remote_id));
  }
  UploadRequest request;
  request.encrypted_filename = parser.FindString(kFieldEncryptedFilename).value_or("");
  request.encrypted_metadata = parser.FindString(kFieldEncryptedMetadata).value_or("");
  request.server_fields.encrypted_size = parser.FindString(kFieldEncryptedSize).value_or("");
  request.server_fields.encrypted_type = parser.FindString(kFieldEncryptedType).value_or("");
  request.server_fields.encrypted_original_name =
      parser.FindString(kFieldEncryptedOriginalName).value_or("");
  request.key_fields.wrapped_file_key = parser.FindString(kFieldWrappedKey).value_or("");
  request.key_fields.body_nonce = parser.FindString(kFieldBodyNonce).value_or("");
  request.key_fields.key_wrap_nonce = parser.FindString(kFieldKeyWrapNonce).value_or("");
  request.ciphertext_size = parser.FindU64(kFieldCiphertextSize).value_or(0);
  return request;
}

}  // namespace

std::string GenerateObjectId() {
  return crypto::RandomHex(kObjectIdBytes);
}

void MemoryTransport::MaybeFail() {
  ++calls_;
  if (pending_failures_ == 0) {
    return;
  }
  --pending_failures_;
  throw zv::Error(zv::ErrorDomain::IO, zv::errors::io::kTransportFailed,
                  "Injected transport failure", std::nullopt, failure_class_);
}

std::string MemoryTransport::Upload(const UploadRequest& request) {
  std::lock_guard<std::mutex> guard(mutex_);
  MaybeFail();
  std::string id = GenerateObjectId();
  objects_.emplace(id, request);
  return id;
}

StoredObject MemoryTransport::Download(std::string_view remote_id) {
  std::lock_guard<std::mutex> guard(mutex_);
  MaybeFail();
  auto it = objects_.find(remote_id);
  if (it == objects_.end()) {
    ThrowMissing(remote_id);
  }
  return StoredObject{it->first, it->second};
}

void MemoryTransport::InjectFailures(size_t count, Retryability retry) {
  std::lock_guard<std::mutex> guard(mutex_);
  pending_failures_ = count;
  failure_class_ = retry;
}

void MemoryTransport::Overwrite(std::string_view remote_id, UploadRequest payload) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = objects_.find(remote_id);
  if (it == objects_.end()) {
    ThrowMissing(remote_id);
  }
  it->second = std::move(payload);
}

size_t MemoryTransport::size() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return objects_.size();
}

size_t MemoryTransport::calls() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return calls_;
}

DirectoryTransport::DirectoryTransport(std::filesystem::path dir) : dir_(std::move(dir)) {}

std::string DirectoryTransport::Upload(const UploadRequest& request) {
  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    throw zv::Error(zv::ErrorDomain::IO, zv::errors::io::kTransportFailed,
                    "Failed to create store directory " + zv::PathToUtf8String(dir_) + ": " +
                        ec.message(),
                    ec.value(), ClassifyNativeError(ec.value()));
  }
  const auto record = EncodeObjectRecord(request);
  const std::string id = GenerateObjectId();
  // The record is written last; an object without one does not exist.
  AtomicReplace(dir_ / (id + ".body"), request.encrypted_body);
  AtomicReplace(dir_ / (id + ".meta"), record);
  return id;
}

StoredObject DirectoryTransport::Download(std::string_view remote_id) {
  if (!IsObjectId(remote_id)) {
    ThrowMissing(remote_id);
  }
  const std::string id(remote_id);
  auto record = ReadFileBytes(dir_ / (id + ".meta"));
  if (!record) {
    ThrowMissing(remote_id);
  }
  auto body = ReadFileBytes(dir_ / (id + ".body"));
  if (!body) {
    ThrowMissing(remote_id);
  }
  StoredObject object;
  object.id = id;
  object.payload = DecodeObjectRecord(*record, remote_id);
  object.payload.encrypted_body = std::move(*body);
  return object;
}

}  // namespace zv::orchestrator

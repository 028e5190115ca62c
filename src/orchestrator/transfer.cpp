#include "zv/orchestrator/transfer.h"

#include <exception>
#include <utility>

#include "zv/codec/base64.h"
#include "zv/core/aead.h"
#include "zv/core/file_cipher.h"
#include "zv/core/metadata_cipher.h"
#include "zv/errors.h"
#include "zv/orchestrator/event_bus.h"

namespace zv::orchestrator {

namespace {

constexpr int kPercentStarted = 25;
constexpr int kPercentTransferred = 75;
constexpr int kPercentFetched = 60;
constexpr int kPercentDone = 100;

const char* FailureClassName(FailureClass failure) noexcept {
  switch (failure) {
    case FailureClass::kNone:
      return "none";
    case FailureClass::kRetryable:
      return "retryable";
    case FailureClass::kFatal:
      return "fatal";
  }
  return "unknown";
}

core::aead::Nonce DecodeNonce(const std::string& text) {
  return core::aead::NonceFromBytes(codec::Base64Decode(text));
}

core::EncryptedFile AssembleEncryptedFile(const StoredObject& object,
                                          const core::MetadataDecryptResult& meta) {
  const auto& record = meta.record;
  const auto& server = object.payload.key_fields;
  const bool from_record = meta.status == core::MetadataStatus::kOk && record.wrapped_file_key &&
                           record.body_nonce && record.key_wrap_nonce;

  core::EncryptedFile file;
  file.ciphertext = object.payload.encrypted_body;
  file.plaintext_size = from_record ? record.size : 0;
  try {
    file.wrapped_file_key =
        codec::Base64Decode(from_record ? *record.wrapped_file_key : server.wrapped_file_key);
    file.body_nonce = DecodeNonce(from_record ? *record.body_nonce : server.body_nonce);
    file.key_wrap_nonce = DecodeNonce(from_record ? *record.key_wrap_nonce : server.key_wrap_nonce);
  } catch (const zv::Error& err) {
    if (err.domain != zv::ErrorDomain::Validation) {
      throw;
    }
    throw DecryptionError(DecryptStage::kKeyUnwrap,
                          std::string(zv::errors::msg::kCannotDecryptFile) + ": " + err.what());
  }
  return file;
}

}  // namespace

const char* ItemStateName(ItemState state) noexcept {
  switch (state) {
    case ItemState::kPending:
      return "pending";
    case ItemState::kEncrypting:
      return "encrypting";
    case ItemState::kUploading:
      return "uploading";
    case ItemState::kDownloading:
      return "downloading";
    case ItemState::kDecrypting:
      return "decrypting";
    case ItemState::kComplete:
      return "complete";
    case ItemState::kFailed:
      return "failed";
    case ItemState::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

UploadRequest PrepareUpload(const UploadItem& item, const crypto::SymmetricKey& master_key) {
  auto encrypted = core::EncryptFile(item.contents, master_key);

  core::MetadataRecord record;
  record.filename = item.filename;
  record.size = encrypted.plaintext_size;
  record.mime_type = item.mime_type;
  record.wrapped_file_key = encrypted.WrappedKeyBase64();
  record.body_nonce = encrypted.BodyNonceBase64();
  record.key_wrap_nonce = encrypted.KeyWrapNonceBase64();

  UploadRequest request;
  request.encrypted_metadata = core::EncryptMetadata(record, master_key);
  request.encrypted_filename = core::EncryptFilename(item.filename, master_key);
  request.server_fields =
      core::EncryptServerFields(item.filename, encrypted.plaintext_size, item.mime_type, master_key);
  request.key_fields.wrapped_file_key = *record.wrapped_file_key;
  request.key_fields.body_nonce = *record.body_nonce;
  request.key_fields.key_wrap_nonce = *record.key_wrap_nonce;
  request.ciphertext_size = encrypted.ciphertext.size();
  request.encrypted_body = std::move(encrypted.ciphertext);
  return request;
}

DownloadResult DecryptDownload(const StoredObject& object, const crypto::SymmetricKey& master_key) {
  const auto meta = core::TryDecryptMetadata(object.payload.encrypted_metadata, master_key);
  const auto file = AssembleEncryptedFile(object, meta);

  DownloadResult result;
  result.plaintext = core::DecryptFile(file, master_key);
  if (meta.status == core::MetadataStatus::kOk) {
    result.filename = meta.record.filename;
    result.mime_type = meta.record.mime_type;
    return result;
  }

  result.metadata_fallback = true;
  auto fields = core::DecryptServerFields(object.payload.server_fields, master_key);
  result.filename = std::move(fields.filename);
  result.mime_type = std::move(fields.mime_type);
  if (result.filename == core::kFallbackFilename && !object.payload.encrypted_filename.empty()) {
    try {
      result.filename = core::DecryptFilename(object.payload.encrypted_filename, master_key);
    } catch (const AuthenticationFailureError&) {
      // Keep the fallback name.
    } catch (const zv::Error& err) {
      if (err.domain != zv::ErrorDomain::Validation) {
        throw;
      }
    }
  }
  return result;
}

FailureClass ClassifyFailure(const zv::Error& error) noexcept {
  return error.retryability == Retryability::kFatal ? FailureClass::kFatal
                                                    : FailureClass::kRetryable;
}

TransferJob::TransferJob(SessionContext& session, BlobTransport& transport,
                         const CancellationToken* token)
    : session_(session), transport_(transport), token_(token) {}

size_t TransferJob::AddUpload(UploadItem item) {
  Item entry;
  entry.direction = Direction::kUpload;
  entry.progress.index = items_.size();
  entry.progress.label = item.filename;
  entry.upload = std::move(item);
  items_.push_back(std::move(entry));
  return items_.size() - 1;
}

size_t TransferJob::AddDownload(std::string remote_id) {
  Item entry;
  entry.direction = Direction::kDownload;
  entry.progress.index = items_.size();
  entry.progress.label = remote_id;
  entry.remote_id = std::move(remote_id);
  items_.push_back(std::move(entry));
  return items_.size() - 1;
}

void TransferJob::SetProgressCallback(ProgressCallback callback) {
  callback_ = std::move(callback);
}

bool TransferJob::Step() {
  if (Done()) {
    return false;
  }
  Item& item = items_[current_];
  try {
    Advance(item);
  } catch (const zv::Error& err) {
    Fail(item, ClassifyFailure(err), err.what());
  } catch (const AuthenticationFailureError& err) {
    Fail(item, FailureClass::kFatal, err.what());
  } catch (const std::exception& err) {
    // Transports outside the zv::Error taxonomy.
    Fail(item, FailureClass::kFatal, err.what());
  }
  return !Done();
}

void TransferJob::Run() {
  while (Step()) {
  }
}

void TransferJob::Advance(Item& item) {
  const bool upload = item.direction == Direction::kUpload;
  switch (item.progress.state) {
    case ItemState::kPending:
      if (token_ && token_->Cancelled()) {
        CancelRemaining();
        return;
      }
      SetState(item, upload ? ItemState::kEncrypting : ItemState::kDownloading, kPercentStarted);
      return;
    case ItemState::kEncrypting:
      item.request = PrepareUpload(item.upload, session_.MasterKey());
      item.upload.contents.clear();
      item.upload.contents.shrink_to_fit();
      SetState(item, ItemState::kUploading, kPercentTransferred);
      return;
    case ItemState::kUploading:
      item.remote_id = transport_.Upload(*item.request);
      item.request.reset();
      SetState(item, ItemState::kComplete, kPercentDone);
      ++current_;
      return;
    case ItemState::kDownloading:
      item.fetched = transport_.Download(*item.remote_id);
      SetState(item, ItemState::kDecrypting, kPercentFetched);
      return;
    case ItemState::kDecrypting:
      item.result = DecryptDownload(*item.fetched, session_.MasterKey());
      item.fetched.reset();
      SetState(item, ItemState::kComplete, kPercentDone);
      ++current_;
      return;
    case ItemState::kComplete:
    case ItemState::kFailed:
    case ItemState::kCancelled:
      ++current_;
      return;
  }
}

void TransferJob::SetState(Item& item, ItemState state, int percent) {
  item.progress.state = state;
  item.progress.percent = percent;
  Publish(item);
  if (callback_) {
    callback_(item.progress);
  }
}

void TransferJob::Fail(Item& item, FailureClass failure, const std::string& message) {
  item.request.reset();
  item.fetched.reset();
  item.progress.failure = failure;
  item.progress.error = message;
  if (item.direction == Direction::kUpload) {
    item.remote_id.reset();
  }
  SetState(item, ItemState::kFailed, item.progress.percent);
  ++current_;
}

void TransferJob::CancelRemaining() {
  for (size_t i = current_; i < items_.size(); ++i) {
    Item& item = items_[i];
    if (item.progress.state != ItemState::kPending) {
      continue;
    }
    item.progress.error = std::string(zv::errors::msg::kUploadCancelled);
    SetState(item, ItemState::kCancelled, 0);
  }
  current_ = items_.size();
}

void TransferJob::Publish(const Item& item) {
  Event event;
  event.category = EventCategory::kTelemetry;
  event.severity = item.progress.state == ItemState::kFailed ? EventSeverity::kWarning
                                                             : EventSeverity::kDebug;
  event.event_id = "transfer_item";
  event.message = item.direction == Direction::kUpload ? "Upload progress" : "Download progress";
  event.fields.emplace_back("index", std::to_string(item.progress.index), FieldPrivacy::kPublic,
                            true);
  if (item.direction == Direction::kUpload) {
    event.fields.emplace_back("filename", item.progress.label, FieldPrivacy::kHash);
  } else {
    event.fields.emplace_back("remote_id", item.progress.label);
  }
  event.fields.emplace_back("state", ItemStateName(item.progress.state));
  if (item.progress.state == ItemState::kFailed) {
    event.fields.emplace_back("failure", FailureClassName(item.progress.failure));
  }
  EventBus::Instance().Publish(event);
}

const ItemProgress& TransferJob::Progress(size_t index) const {
  return items_.at(index).progress;
}

size_t TransferJob::CountInState(ItemState state) const noexcept {
  size_t count = 0;
  for (const auto& item : items_) {
    if (item.progress.state == state) {
      ++count;
    }
  }
  return count;
}

const std::optional<std::string>& TransferJob::RemoteId(size_t index) const {
  const auto& item = items_.at(index);
  static const std::optional<std::string> kNone;
  return item.direction == Direction::kUpload ? item.remote_id : kNone;
}

std::optional<DownloadResult>& TransferJob::Download(size_t index) {
  return items_.at(index).result;
}

}  // namespace zv::orchestrator

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "zv/crypto/symmetric_key.h"
#include "zv/orchestrator/session.h"
#include "zv/orchestrator/transport.h"
#include "zv/orchestrator/upload_policy.h"

namespace zv::orchestrator {

class CancellationToken {
 public:
  void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
  [[nodiscard]] bool Cancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

// Uploads run Pending -> Encrypting -> Uploading -> Complete; downloads run
// Pending -> Downloading -> Decrypting -> Complete. Any stage may end in
// Failed. Items not yet started when cancellation is seen become Cancelled.
enum class ItemState {
  kPending,
  kEncrypting,
  kUploading,
  kDownloading,
  kDecrypting,
  kComplete,
  kFailed,
  kCancelled,
};

enum class FailureClass { kNone, kRetryable, kFatal };

const char* ItemStateName(ItemState state) noexcept;

struct ItemProgress {
  size_t index{0};
  // Filename for uploads, remote id for downloads.
  std::string label;
  ItemState state{ItemState::kPending};
  int percent{0};
  FailureClass failure{FailureClass::kNone};
  std::string error;
};

struct DownloadResult {
  std::vector<uint8_t> plaintext;
  std::string filename;
  std::string mime_type;
  // True when the metadata blob could not be read and the names came from
  // the server-side fields instead.
  bool metadata_fallback{false};
};

// Builds the full upload request for one file. Order: file key, body,
// key wrap, metadata, filename and server fields.
UploadRequest PrepareUpload(const UploadItem& item, const crypto::SymmetricKey& master_key);

// Reverses PrepareUpload. Throws DecryptionError when the body cannot be
// decrypted; metadata problems only trigger the fallback names.
DownloadResult DecryptDownload(const StoredObject& object, const crypto::SymmetricKey& master_key);

FailureClass ClassifyFailure(const zv::Error& error) noexcept;

// Processes a batch one item at a time. Step() performs at most one stage of
// the current item and returns, so the caller decides when work resumes.
// The master key is read from the session at every stage; locking the
// session mid-batch fails the remaining work instead of using a stale key.
class TransferJob {
 public:
  using ProgressCallback = std::function<void(const ItemProgress&)>;

  TransferJob(SessionContext& session, BlobTransport& transport,
              const CancellationToken* token = nullptr);

  TransferJob(const TransferJob&) = delete;
  TransferJob& operator=(const TransferJob&) = delete;

  size_t AddUpload(UploadItem item);
  size_t AddDownload(std::string remote_id);
  void SetProgressCallback(ProgressCallback callback);

  // Returns true while items remain.
  bool Step();
  void Run();

  [[nodiscard]] bool Done() const noexcept { return current_ >= items_.size(); }
  [[nodiscard]] const ItemProgress& Progress(size_t index) const;
  [[nodiscard]] size_t ItemCount() const noexcept { return items_.size(); }
  [[nodiscard]] size_t CountInState(ItemState state) const noexcept;

  // Remote id of a completed upload.
  [[nodiscard]] const std::optional<std::string>& RemoteId(size_t index) const;
  // Result of a completed download. The plaintext may be moved out.
  [[nodiscard]] std::optional<DownloadResult>& Download(size_t index);

 private:
  enum class Direction { kUpload, kDownload };

  struct Item {
    Direction direction{Direction::kUpload};
    ItemProgress progress;
    UploadItem upload;
    std::optional<UploadRequest> request;
    std::optional<std::string> remote_id;
    std::optional<StoredObject> fetched;
    std::optional<DownloadResult> result;
  };

  void Advance(Item& item);
  void SetState(Item& item, ItemState state, int percent);
  void Fail(Item& item, FailureClass failure, const std::string& message);
  void CancelRemaining();
  void Publish(const Item& item);

  SessionContext& session_;
  BlobTransport& transport_;
  const CancellationToken* token_;
  ProgressCallback callback_;
  std::vector<Item> items_;
  size_t current_{0};
};

}  // namespace zv::orchestrator

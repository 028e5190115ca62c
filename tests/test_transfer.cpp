#include "zv/orchestrator/transfer.h"

#include <cassert>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <stdexcept>
#include <vector>

#include "zv/core/key_derivation.h"
#include "zv/core/metadata_cipher.h"
#include "zv/crypto/provider.h"
#include "zv/error.h"
#include "zv/errors.h"
#include "zv/orchestrator/event_bus.h"
#include "zv/vault/vault_store.h"

namespace {

using zv::orchestrator::ItemState;
using zv::orchestrator::UploadItem;

UploadItem MakeItem(std::string name, std::string mime, std::string_view body) {
  UploadItem item;
  item.filename = std::move(name);
  item.mime_type = std::move(mime);
  item.contents.assign(body.begin(), body.end());
  return item;
}

std::vector<uint8_t> Bytes(std::string_view text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

void CheckBatchValidation() {
  using zv::orchestrator::UploadLimits;
  using zv::orchestrator::ValidateBatch;

  UploadLimits limits;
  limits.max_file_size = 16;
  limits.max_batch_files = 2;

  std::vector<UploadItem> items;
  items.push_back(MakeItem("a.txt", "text/plain", "short"));
  items.push_back(MakeItem("big.txt", "text/plain", "this body is longer than sixteen bytes"));
  items.push_back(MakeItem("run.exe", "application/x-msdownload", "MZ"));
  items.push_back(MakeItem("a.txt", "text/plain", "again"));
  items.push_back(MakeItem("", "text/plain", "anonymous"));
  items.push_back(MakeItem("b.png", "image/png", "png"));
  items.push_back(MakeItem("c.pdf", "application/pdf", "pdf"));

  const auto result = ValidateBatch(items, limits);
  assert(!result.valid() && "batch has rejections");
  assert((result.accepted == std::vector<size_t>{0, 5}) && "valid items accepted in order");
  assert(result.rejected.size() == 5 && "every bad item reported");
  assert(result.rejected[0].index == 1 && result.rejected[0].reason == "File too large. Maximum size is 0MB" &&
         "size limit rounds to whole MB");
  assert(result.rejected[1].index == 2 &&
         result.rejected[1].reason == zv::errors::msg::kFileTypeUnsupported && "type filter");
  assert(result.rejected[2].index == 3 && result.rejected[2].filename == "a.txt" &&
         result.rejected[2].reason == zv::errors::msg::kDuplicateFileName && "duplicate names");
  assert(result.rejected[3].index == 4 && result.rejected[3].reason == zv::errors::msg::kEmptyFileName &&
         "empty names");
  assert(result.rejected[4].index == 6 && result.rejected[4].reason == zv::errors::msg::kTooManyFiles &&
         "batch limit applies after other checks");

  UploadLimits defaults;
  assert(defaults.max_file_size == 50ull * 1024 * 1024 && defaults.max_batch_files == 10 && "defaults");
  std::vector<UploadItem> ok{MakeItem("x.docx",
                                      "application/vnd.openxmlformats-officedocument.wordprocessingml.document",
                                      "doc")};
  assert(ValidateBatch(ok, defaults).valid() && "office documents accepted");

  assert(zv::orchestrator::GuessMimeType("photo.JPG") == "image/jpeg" && "extension case ignored");
  assert(zv::orchestrator::GuessMimeType("archive.tar.zip") == "application/zip" && "last extension");
  assert(zv::orchestrator::GuessMimeType("README") == "application/octet-stream" && "no extension");
  assert(zv::orchestrator::GuessMimeType("tool.exe") == "application/octet-stream" && "unknown extension");
}

// Fails its first upload with an exception outside zv::Error.
class ResettingTransport : public zv::orchestrator::BlobTransport {
public:
  std::string Upload(const zv::orchestrator::UploadRequest& request) override {
    if (!reset_sent_) {
      reset_sent_ = true;
      throw std::runtime_error("socket reset");
    }
    return inner_.Upload(request);
  }

  zv::orchestrator::StoredObject Download(std::string_view remote_id) override {
    return inner_.Download(remote_id);
  }

private:
  zv::orchestrator::MemoryTransport inner_;
  bool reset_sent_{false};
};

}  // namespace

int main() {
  namespace orch = zv::orchestrator;
  zv::crypto::EnsureCryptoProviderInitialized();

  CheckBatchValidation();

  zv::vault::KeyVault vault(std::make_shared<zv::vault::MemoryVaultStore>());
  orch::SessionContext session;
  const auto salt = zv::core::EncodeSalt(zv::core::GenerateSalt());
  (void)session.Login("alice", "Correct-Horse1!", salt, vault);

  // Request layout.
  {
    const auto item = MakeItem("a.txt", "text/plain", "hello world");
    const auto request = orch::PrepareUpload(item, session.MasterKey());
    assert(request.ciphertext_size == 11 + zv::core::aead::kTagSize && "ciphertext size reported");
    assert(request.encrypted_body.size() == request.ciphertext_size && "body matches size");
    assert(request.key_fields.wrapped_file_key.size() == 64 && "wrapped key copy for the server");
    const auto record = zv::core::DecryptMetadata(request.encrypted_metadata, session.MasterKey());
    assert(record.filename == "a.txt" && record.size == 11 && record.mime_type == "text/plain" &&
           record.wrapped_file_key == request.key_fields.wrapped_file_key &&
           record.body_nonce == request.key_fields.body_nonce &&
           record.key_wrap_nonce == request.key_fields.key_wrap_nonce && "metadata carries key fields");
    assert(zv::core::DecryptFilename(request.encrypted_filename, session.MasterKey()) == "a.txt" &&
           "encrypted filename");
  }

  orch::MemoryTransport transport;
  std::vector<std::string> remote_ids;

  // Upload batch with progress reporting.
  {
    orch::TransferJob job(session, transport);
    std::vector<std::pair<size_t, ItemState>> seen;
    job.SetProgressCallback([&seen](const orch::ItemProgress& p) { seen.emplace_back(p.index, p.state); });
    job.AddUpload(MakeItem("a.txt", "text/plain", "hello world"));
    job.AddUpload(MakeItem("b.pdf", "application/pdf", "%PDF-1.4"));

    assert(job.Step() && job.Progress(0).state == ItemState::kEncrypting &&
           job.Progress(0).percent == 25 && "one stage per step");
    job.Run();
    assert(job.Done() && job.CountInState(ItemState::kComplete) == 2 && "both uploaded");
    assert(job.Progress(1).percent == 100 && "complete is 100 percent");
    assert(seen.size() == 6 && "three transitions per upload");
    assert(seen[0] == std::make_pair(size_t{0}, ItemState::kEncrypting) &&
           seen[1] == std::make_pair(size_t{0}, ItemState::kUploading) &&
           seen[2] == std::make_pair(size_t{0}, ItemState::kComplete) &&
           seen[3].first == 1 && "items run in order");
    assert(job.RemoteId(0) && job.RemoteId(0)->size() == 32 && "remote id assigned");
    assert(transport.size() == 2 && "stored remotely");
    remote_ids = {*job.RemoteId(0), *job.RemoteId(1)};
  }

  // Download batch.
  {
    orch::TransferJob job(session, transport);
    job.AddDownload(remote_ids[1]);
    job.AddDownload(remote_ids[0]);
    job.AddDownload(std::string(32, '0'));
    job.Run();

    auto& first = job.Download(0);
    assert(first && first->filename == "b.pdf" && first->mime_type == "application/pdf" &&
           first->plaintext == Bytes("%PDF-1.4") && !first->metadata_fallback && "download 0");
    auto& second = job.Download(1);
    assert(second && second->filename == "a.txt" && second->plaintext == Bytes("hello world") &&
           "download 1");
    assert(job.Progress(2).state == ItemState::kFailed && !job.Download(2) && "unknown id fails");
    assert(job.Progress(2).failure == orch::FailureClass::kFatal && "missing object is fatal");
    assert(job.CountInState(ItemState::kComplete) == 2 && "failure does not stop the batch");
  }

  // Metadata damage falls back to the server fields.
  {
    auto object = transport.Download(remote_ids[0]);
    auto payload = object.payload;
    payload.encrypted_metadata[20] = payload.encrypted_metadata[20] == 'A' ? 'B' : 'A';
    transport.Overwrite(remote_ids[0], payload);
    const auto result = orch::DecryptDownload(transport.Download(remote_ids[0]), session.MasterKey());
    assert(result.metadata_fallback && "fallback flagged");
    assert(result.filename == "a.txt" && result.mime_type == "text/plain" &&
           result.plaintext == Bytes("hello world") && "server fields and key copies used");

    payload.server_fields = zv::core::ServerFields{};
    transport.Overwrite(remote_ids[0], payload);
    const auto bare = orch::DecryptDownload(transport.Download(remote_ids[0]), session.MasterKey());
    assert(bare.filename == "a.txt" && bare.mime_type == "application/octet-stream" &&
           "encrypted filename used when the original name field is gone");

    payload.key_fields.body_nonce = "not a nonce";
    transport.Overwrite(remote_ids[0], payload);
    bool rejected = false;
    try {
      (void)orch::DecryptDownload(transport.Download(remote_ids[0]), session.MasterKey());
    } catch (const zv::DecryptionError& err) {
      rejected = err.stage == zv::DecryptStage::kKeyUnwrap;
    }
    assert(rejected && "unusable key fields reported as cannot decrypt");
  }

  // Transient transport failures are retryable.
  {
    orch::TransferJob job(session, transport);
    job.AddUpload(MakeItem("c.txt", "text/plain", "retry me"));
    transport.InjectFailures(1, zv::Retryability::kTransient);
    job.Run();
    assert(job.Progress(0).state == ItemState::kFailed &&
           job.Progress(0).failure == orch::FailureClass::kRetryable && !job.RemoteId(0) &&
           "transient failure marked retryable");
    assert(job.Progress(0).percent == 75 && "failure keeps the last percentage");

    orch::TransferJob retry(session, transport);
    retry.AddUpload(MakeItem("c.txt", "text/plain", "retry me"));
    retry.Run();
    assert(retry.Progress(0).state == ItemState::kComplete && "retry succeeds");
  }

  // Foreign transport exceptions fail one item and the batch goes on.
  {
    ResettingTransport resetting;
    orch::TransferJob job(session, resetting);
    job.AddUpload(MakeItem("r1.txt", "text/plain", "first"));
    job.AddUpload(MakeItem("r2.txt", "text/plain", "second"));
    job.Run();
    assert(job.Done() && "batch finished");
    assert(job.Progress(0).state == ItemState::kFailed &&
           job.Progress(0).failure == orch::FailureClass::kFatal &&
           job.Progress(0).error == "socket reset" && !job.RemoteId(0) && "reset fails the item");
    assert(job.Progress(1).state == ItemState::kComplete && job.RemoteId(1) && "next item uploaded");
  }

  // Cancellation stops items that have not started.
  {
    orch::CancellationToken token;
    orch::TransferJob job(session, transport, &token);
    job.AddUpload(MakeItem("d.txt", "text/plain", "one"));
    job.AddUpload(MakeItem("e.txt", "text/plain", "two"));
    job.AddUpload(MakeItem("f.txt", "text/plain", "three"));
    job.Step();
    job.Step();
    job.Step();
    assert(job.Progress(0).state == ItemState::kComplete && "first item finished");
    token.Cancel();
    job.Run();
    assert(job.CountInState(ItemState::kCancelled) == 2 && "remaining items cancelled");
    assert(job.Progress(2).error == zv::errors::msg::kUploadCancelled && "cancel message");
  }

  // Locking the session mid-batch fails the remaining work.
  {
    orch::TransferJob job(session, transport);
    job.AddUpload(MakeItem("g.txt", "text/plain", "locked"));
    job.AddUpload(MakeItem("h.txt", "text/plain", "locked too"));
    job.Step();
    session.Lock();
    job.Run();
    assert(job.CountInState(ItemState::kFailed) == 2 && "no key, no uploads");
    assert(job.Progress(0).failure == orch::FailureClass::kFatal && "locked session is fatal");
    (void)session.Unlock("alice", "Correct-Horse1!", vault, salt);
  }

  // On-disk store.
  {
    const auto dir = std::filesystem::temp_directory_path() / "zv_transfer_test";
    std::filesystem::remove_all(dir);
    orch::DirectoryTransport disk(dir);
    const auto request = orch::PrepareUpload(MakeItem("n.txt", "text/plain", "on disk"), session.MasterKey());
    const auto id = disk.Upload(request);
    assert(std::filesystem::exists(dir / (id + ".body")) && std::filesystem::exists(dir / (id + ".meta")) &&
           "body and record written");

    const auto object = disk.Download(id);
    assert(object.payload.encrypted_metadata == request.encrypted_metadata &&
           object.payload.ciphertext_size == request.ciphertext_size && "record fields survive");
    const auto result = orch::DecryptDownload(object, session.MasterKey());
    assert(result.filename == "n.txt" && result.plaintext == Bytes("on disk") && "disk round trip");

    bool missing = false;
    try {
      (void)disk.Download("../escape");
    } catch (const zv::Error& err) {
      missing = err.code == zv::errors::io::kObjectMissing;
    }
    assert(missing && "ids outside the store are not found");
    std::filesystem::remove_all(dir);
  }

  zv::orchestrator::ResetEventBusForTesting();
  std::cout << "transfer tests ok\n";
  return 0;
}

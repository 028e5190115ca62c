#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "zv/core/metadata_cipher.h"
#include "zv/error.h"

namespace zv::orchestrator {

// Base64 copies of the file cipher's wrapped key and nonces, kept by the
// server so a file stays downloadable when its metadata blob falls back.
struct FileKeyFields {
  std::string wrapped_file_key;
  std::string body_nonce;
  std::string key_wrap_nonce;
};

// Everything the server receives for one file. All values are opaque to the
// transport.
struct UploadRequest {
  std::vector<uint8_t> encrypted_body;
  std::string encrypted_filename;
  std::string encrypted_metadata;
  core::ServerFields server_fields;
  FileKeyFields key_fields;
  uint64_t ciphertext_size{0};
};

struct StoredObject {
  std::string id;
  UploadRequest payload;
};

class BlobTransport {
 public:
  virtual ~BlobTransport() = default;

  // Returns the remote id. Failures throw zv::Error (IO) whose retryability
  // says whether the call may be repeated.
  virtual std::string Upload(const UploadRequest& request) = 0;
  // Throws zv::Error (IO/kObjectMissing) for unknown ids.
  virtual StoredObject Download(std::string_view remote_id) = 0;
};

// 128 random bits as lowercase hex.
std::string GenerateObjectId();

class MemoryTransport : public BlobTransport {
 public:
  std::string Upload(const UploadRequest& request) override;
  StoredObject Download(std::string_view remote_id) override;

  // Makes the next |count| calls fail with an IO error of class |retry|.
  void InjectFailures(size_t count, Retryability retry);
  // Replaces a stored payload, for tamper tests.
  void Overwrite(std::string_view remote_id, UploadRequest payload);
  [[nodiscard]] size_t size() const;
  [[nodiscard]] size_t calls() const;

 private:
  void MaybeFail();

  mutable std::mutex mutex_;
  std::map<std::string, UploadRequest, std::less<>> objects_;
  size_t pending_failures_{0};
  Retryability failure_class_{Retryability::kTransient};
  size_t calls_{0};
};

// Stores <id>.body (raw ciphertext) and <id>.meta (TLV record of the other
// fields) under one directory.
class DirectoryTransport : public BlobTransport {
 public:
  explicit DirectoryTransport(std::filesystem::path dir);

  std::string Upload(const UploadRequest& request) override;
  StoredObject Download(std::string_view remote_id) override;

  [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }

 private:
  std::filesystem::path dir_;
};

}  // namespace zv::orchestrator

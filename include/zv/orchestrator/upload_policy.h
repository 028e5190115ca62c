#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "zv/config.h"

namespace zv::orchestrator {

struct UploadItem {
  std::string filename;
  std::string mime_type;
  std::vector<uint8_t> contents;
};

// MIME types accepted for upload by default.
const std::vector<std::string>& DefaultAllowedMimeTypes();

struct UploadLimits {
  uint64_t max_file_size{50ull * 1024ull * 1024ull};
  size_t max_batch_files{10};
  std::vector<std::string> allowed_mime_types{DefaultAllowedMimeTypes()};

  static UploadLimits FromConfig(const config::EngineConfig& cfg);
};

struct RejectedItem {
  size_t index{0};
  std::string filename;
  std::string reason;
};

struct BatchValidation {
  std::vector<size_t> accepted;
  std::vector<RejectedItem> rejected;

  [[nodiscard]] bool valid() const noexcept { return rejected.empty(); }
};

// Checks each item in order: empty name, size, MIME type, duplicate name among the items
// already accepted, then the batch limit. Rejected items do not stop the rest.
BatchValidation ValidateBatch(const std::vector<UploadItem>& items, const UploadLimits& limits);

// MIME type from the file extension, "application/octet-stream" when unknown.
std::string GuessMimeType(std::string_view filename);

}  // namespace zv::orchestrator

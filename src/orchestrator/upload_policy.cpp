#include "zv/orchestrator/upload_policy.h"

#include <algorithm>
#include <cctype>
#include <utility>

#include "zv/core/metadata_cipher.h"
#include "zv/errors.h"

namespace zv::orchestrator {

namespace {

struct ExtensionMime {
  std::string_view extension;
  std::string_view mime_type;
};

constexpr ExtensionMime kExtensionTable[] = {
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".png", "image/png"},
    {".gif", "image/gif"},
    {".webp", "image/webp"},
    {".pdf", "application/pdf"},
    {".txt", "text/plain"},
    {".doc", "application/msword"},
    {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {".xls", "application/vnd.ms-excel"},
    {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {".zip", "application/zip"},
    {".rar", "application/x-rar-compressed"},
    {".mp4", "video/mp4"},
    {".avi", "video/avi"},
    {".mov", "video/mov"},
    {".mp3", "audio/mp3"},
    {".wav", "audio/wav"},
};

std::string FileTooLargeMessage(uint64_t max_file_size) {
  constexpr uint64_t kMiB = 1024ull * 1024ull;
  const uint64_t rounded = (max_file_size + kMiB / 2) / kMiB;
  return std::string(zv::errors::msg::kFileTooLarge) + std::to_string(rounded) + "MB";
}

}  // namespace

const std::vector<std::string>& DefaultAllowedMimeTypes() {
  static const std::vector<std::string> kAllowed = [] {
    std::vector<std::string> out;
    for (const auto& entry : kExtensionTable) {
      std::string mime(entry.mime_type);
      if (std::find(out.begin(), out.end(), mime) == out.end()) {
        out.push_back(std::move(mime));
      }
    }
    return out;
  }();
  return kAllowed;
}

UploadLimits UploadLimits::FromConfig(const config::EngineConfig& cfg) {
  UploadLimits limits;
  limits.max_file_size = cfg.max_file_size;
  limits.max_batch_files = cfg.max_batch_files;
  return limits;
}

BatchValidation ValidateBatch(const std::vector<UploadItem>& items, const UploadLimits& limits) {
  BatchValidation result;
  std::vector<std::string_view> accepted_names;
  for (size_t i = 0; i < items.size(); ++i) {
    const auto& item = items[i];
    auto reject = [&](std::string reason) {
      result.rejected.push_back(RejectedItem{i, item.filename, std::move(reason)});
    };

    if (item.filename.empty()) {
      reject(std::string(zv::errors::msg::kEmptyFileName));
      continue;
    }
    if (item.contents.size() > limits.max_file_size) {
      reject(FileTooLargeMessage(limits.max_file_size));
      continue;
    }
    if (std::find(limits.allowed_mime_types.begin(), limits.allowed_mime_types.end(),
                  item.mime_type) == limits.allowed_mime_types.end()) {
      reject(std::string(zv::errors::msg::kFileTypeUnsupported));
      continue;
    }
    if (std::find(accepted_names.begin(), accepted_names.end(), item.filename) !=
        accepted_names.end()) {
      reject(std::string(zv::errors::msg::kDuplicateFileName));
      continue;
    }
    if (result.accepted.size() >= limits.max_batch_files) {
      reject(std::string(zv::errors::msg::kTooManyFiles));
      continue;
    }
    accepted_names.push_back(item.filename);
    result.accepted.push_back(i);
  }
  return result;
}

std::string GuessMimeType(std::string_view filename) {
  const auto dot = filename.rfind('.');
  if (dot == std::string_view::npos) {
    return std::string(core::kFallbackMimeType);
  }
  std::string extension(filename.substr(dot));
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (const auto& entry : kExtensionTable) {
    if (entry.extension == extension) {
      return std::string(entry.mime_type);
    }
  }
  return std::string(core::kFallbackMimeType);
}

}  // namespace zv::orchestrator

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <vector>

#include "zv/error.h"

namespace zv::orchestrator {

struct AtomicReplaceHooks {
  // Test seam: runs after the temp file is durable, before the rename.
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
};

// Replaces |target| with |payload| by writing a 0600 temporary file in the
// same directory, syncing it, renaming it into place and syncing the
// directory. Readers observe either the old or the new contents. Throws
// zv::Error (IO) carrying errno and a context trail.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks = {});

// Whole-file read. Returns nullopt when the file does not exist; any other
// failure throws zv::Error (IO/kReadFailed).
std::optional<std::vector<uint8_t>> ReadFileBytes(const std::filesystem::path& path);

// Maps an errno / Win32 error to a retry class.
Retryability ClassifyNativeError(int native);

}  // namespace zv::orchestrator

#include "zv/vault/vault_store.h"

#include <system_error>

#include "zv/common.h"
#include "zv/crypto/sha256.h"
#include "zv/error.h"
#include "zv/orchestrator/io_util.h"

namespace zv::vault {

namespace {

constexpr const char* kEntryExtension = ".zvk";

[[noreturn]] void ThrowStoreError(const std::string& what, const std::filesystem::path& path,
                                  const std::error_code& ec) {
  throw zv::Error(zv::ErrorDomain::IO, zv::errors::io::kVaultStoreFailed,
                  what + " " + zv::PathToUtf8String(path) + ": " + ec.message(), ec.value(),
                  orchestrator::ClassifyNativeError(ec.value()));
}

}  // namespace

void MemoryVaultStore::Put(std::string_view user_id, std::span<const uint8_t> entry) {
  std::lock_guard<std::mutex> guard(mutex_);
  entries_.insert_or_assign(std::string(user_id), std::vector<uint8_t>(entry.begin(), entry.end()));
}

std::optional<std::vector<uint8_t>> MemoryVaultStore::Get(std::string_view user_id) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = entries_.find(user_id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool MemoryVaultStore::Remove(std::string_view user_id) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto it = entries_.find(user_id);
  if (it == entries_.end()) {
    return false;
  }
  entries_.erase(it);
  return true;
}

bool MemoryVaultStore::Contains(std::string_view user_id) {
  std::lock_guard<std::mutex> guard(mutex_);
  return entries_.find(user_id) != entries_.end();
}

void MemoryVaultStore::Clear() {
  std::lock_guard<std::mutex> guard(mutex_);
  entries_.clear();
}

FileVaultStore::FileVaultStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

std::filesystem::path FileVaultStore::EntryPath(std::string_view user_id) const {
  return dir_ / (zv::crypto::SHA256_Hex(user_id) + kEntryExtension);
}

void FileVaultStore::EnsureDirectory() {
  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    ThrowStoreError("Failed to create vault directory", dir_, ec);
  }
  std::filesystem::permissions(dir_, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    ThrowStoreError("Failed to restrict vault directory", dir_, ec);
  }
}

void FileVaultStore::Put(std::string_view user_id, std::span<const uint8_t> entry) {
  EnsureDirectory();
  orchestrator::AtomicReplace(EntryPath(user_id), entry);
}

std::optional<std::vector<uint8_t>> FileVaultStore::Get(std::string_view user_id) {
  return orchestrator::ReadFileBytes(EntryPath(user_id));
}

bool FileVaultStore::Remove(std::string_view user_id) {
  const auto path = EntryPath(user_id);
  std::error_code ec;
  const bool removed = std::filesystem::remove(path, ec);
  if (ec) {
    ThrowStoreError("Failed to remove vault entry", path, ec);
  }
  return removed;
}

bool FileVaultStore::Contains(std::string_view user_id) {
  const auto path = EntryPath(user_id);
  std::error_code ec;
  const bool exists = std::filesystem::is_regular_file(path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    ThrowStoreError("Failed to stat vault entry", path, ec);
  }
  return exists;
}

void FileVaultStore::Clear() {
  std::error_code ec;
  if (!std::filesystem::exists(dir_, ec)) {
    if (ec) {
      ThrowStoreError("Failed to stat vault directory", dir_, ec);
    }
    return;
  }
  std::vector<std::filesystem::path> doomed;
  for (std::filesystem::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->path().extension() == kEntryExtension) {
      doomed.push_back(it->path());
    }
  }
  if (ec) {
    ThrowStoreError("Failed to list vault directory", dir_, ec);
  }
  for (const auto& path : doomed) {
    std::filesystem::remove(path, ec);
    if (ec) {
      ThrowStoreError("Failed to remove vault entry", path, ec);
    }
  }
}

}  // namespace zv::vault

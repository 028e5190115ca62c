#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace zv::vault {

// Persistence seam for encoded vault entries, keyed by user id.
class VaultStore {
 public:
  virtual ~VaultStore() = default;

  virtual void Put(std::string_view user_id, std::span<const uint8_t> entry) = 0;
  virtual std::optional<std::vector<uint8_t>> Get(std::string_view user_id) = 0;
  // Returns false when there was nothing to remove.
  virtual bool Remove(std::string_view user_id) = 0;
  virtual bool Contains(std::string_view user_id) = 0;
  virtual void Clear() = 0;
};

class MemoryVaultStore : public VaultStore {
 public:
  void Put(std::string_view user_id, std::span<const uint8_t> entry) override;
  std::optional<std::vector<uint8_t>> Get(std::string_view user_id) override;
  bool Remove(std::string_view user_id) override;
  bool Contains(std::string_view user_id) override;
  void Clear() override;

 private:
  std::mutex mutex_;
  std::map<std::string, std::vector<uint8_t>, std::less<>> entries_;
};

// One file per user under |dir|, named <sha256-hex(user_id)>.zvk so the user
// id itself never appears on disk. Files are written with AtomicReplace.
class FileVaultStore : public VaultStore {
 public:
  explicit FileVaultStore(std::filesystem::path dir);

  void Put(std::string_view user_id, std::span<const uint8_t> entry) override;
  std::optional<std::vector<uint8_t>> Get(std::string_view user_id) override;
  bool Remove(std::string_view user_id) override;
  bool Contains(std::string_view user_id) override;
  void Clear() override;

  [[nodiscard]] std::filesystem::path EntryPath(std::string_view user_id) const;
  [[nodiscard]] const std::filesystem::path& directory() const noexcept { return dir_; }

 private:
  void EnsureDirectory();

  std::filesystem::path dir_;
};

}  // namespace zv::vault

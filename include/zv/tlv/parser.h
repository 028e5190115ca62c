#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace zv::tlv {

// Wire form of a record: u16 type, u16 length (both little-endian), payload.
struct Record {
  uint16_t type{0};
  std::span<const uint8_t> value{};
};

class Parser {
 public:
  Parser(std::span<const uint8_t> buffer, std::size_t max_records = 64,
         std::size_t max_payload = 64 * 1024 - 1);

  [[nodiscard]] bool valid() const noexcept { return valid_; }
  [[nodiscard]] std::size_t consumed() const noexcept { return consumed_; }

  [[nodiscard]] auto begin() const noexcept { return records_.begin(); }
  [[nodiscard]] auto end() const noexcept { return records_.end(); }

  // First record of |type|, if any.
  [[nodiscard]] std::optional<std::span<const uint8_t>> Find(uint16_t type) const noexcept;
  // Fixed-width little-endian integers. Empty when absent or mis-sized.
  [[nodiscard]] std::optional<uint8_t> FindU8(uint16_t type) const noexcept;
  [[nodiscard]] std::optional<uint32_t> FindU32(uint16_t type) const noexcept;
  [[nodiscard]] std::optional<uint64_t> FindU64(uint16_t type) const noexcept;
  [[nodiscard]] std::optional<std::string> FindString(uint16_t type) const;

 private:
  bool valid_{false};
  std::size_t consumed_{0};
  std::vector<Record> records_{};
};

}  // namespace zv::tlv

#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace zv::tlv {

// Builds the record stream read by Parser. Payloads over 65535 bytes throw
// zv::Error (Validation/kMalformedRecord).
class Writer {
 public:
  Writer& Append(uint16_t type, std::span<const uint8_t> value);
  Writer& AppendU8(uint16_t type, uint8_t value);
  Writer& AppendU32(uint16_t type, uint32_t value);
  Writer& AppendU64(uint16_t type, uint64_t value);
  Writer& AppendString(uint16_t type, std::string_view value);

  [[nodiscard]] const std::vector<uint8_t>& Bytes() const noexcept { return buffer_; }
  [[nodiscard]] std::vector<uint8_t> Release() noexcept { return std::move(buffer_); }

 private:
  std::vector<uint8_t> buffer_{};
};

}  // namespace zv::tlv

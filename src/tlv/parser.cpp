#include "zv/tlv/parser.h"

#include <algorithm>
#include <cstring>

#include "zv/common.h"

namespace zv::tlv {

Parser::Parser(std::span<const uint8_t> buffer, std::size_t max_records, std::size_t max_payload) {
  std::size_t offset = 0;
  std::size_t count = 0;
  while ((buffer.size() - offset) >= sizeof(uint16_t) * 2) {
    if (count >= max_records) {
      valid_ = false;
      return;
    }

    uint16_t type_le = 0;
    uint16_t length_le = 0;
    std::memcpy(&type_le, buffer.data() + offset, sizeof(type_le));
    std::memcpy(&length_le, buffer.data() + offset + sizeof(type_le), sizeof(length_le));

    const uint16_t type = zv::FromLittleEndian(type_le);
    const std::size_t length = static_cast<std::size_t>(zv::FromLittleEndian(length_le));

    if (length > max_payload) {
      valid_ = false;
      return;
    }

    offset += sizeof(uint16_t) * 2;
    if (offset > buffer.size() || (buffer.size() - offset) < length) {
      valid_ = false;
      return;
    }

    records_.push_back(Record{type, buffer.subspan(offset, length)});

    offset += length;
    ++count;
  }

  valid_ = offset == buffer.size();
  consumed_ = offset;
}

std::optional<std::span<const uint8_t>> Parser::Find(uint16_t type) const noexcept {
  auto it = std::find_if(records_.begin(), records_.end(),
                         [type](const Record& record) { return record.type == type; });
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->value;
}

std::optional<uint8_t> Parser::FindU8(uint16_t type) const noexcept {
  auto value = Find(type);
  if (!value || value->size() != sizeof(uint8_t)) {
    return std::nullopt;
  }
  return (*value)[0];
}

std::optional<uint32_t> Parser::FindU32(uint16_t type) const noexcept {
  auto value = Find(type);
  if (!value || value->size() != sizeof(uint32_t)) {
    return std::nullopt;
  }
  uint32_t le = 0;
  std::memcpy(&le, value->data(), sizeof(le));
  return zv::FromLittleEndian(le);
}

std::optional<uint64_t> Parser::FindU64(uint16_t type) const noexcept {
  auto value = Find(type);
  if (!value || value->size() != sizeof(uint64_t)) {
    return std::nullopt;
  }
  uint64_t le = 0;
  std::memcpy(&le, value->data(), sizeof(le));
  return zv::FromLittleEndian(le);
}

std::optional<std::string> Parser::FindString(uint16_t type) const {
  auto value = Find(type);
  if (!value) {
    return std::nullopt;
  }
  return zv::BytesToString(*value);
}

}  // namespace zv::tlv

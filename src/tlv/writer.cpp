#include "zv/tlv/writer.h"

#include <cstring>
#include <limits>
#include <string>

#include "zv/common.h"
#include "zv/error.h"

namespace zv::tlv {

Writer& Writer::Append(uint16_t type, std::span<const uint8_t> value) {
  if (value.size() > std::numeric_limits<uint16_t>::max()) {
    throw zv::Error(zv::ErrorDomain::Validation, zv::errors::validation::kMalformedRecord,
                    "TLV payload too large for type " + std::to_string(type));
  }
  const uint16_t type_le = zv::ToLittleEndian(type);
  const uint16_t length_le = zv::ToLittleEndian(static_cast<uint16_t>(value.size()));
  const size_t offset = buffer_.size();
  buffer_.resize(offset + sizeof(type_le) + sizeof(length_le) + value.size());
  std::memcpy(buffer_.data() + offset, &type_le, sizeof(type_le));
  std::memcpy(buffer_.data() + offset + sizeof(type_le), &length_le, sizeof(length_le));
  if (!value.empty()) {
    std::memcpy(buffer_.data() + offset + sizeof(type_le) + sizeof(length_le), value.data(), value.size());
  }
  return *this;
}

Writer& Writer::AppendU8(uint16_t type, uint8_t value) {
  return Append(type, std::span<const uint8_t>(&value, 1));
}

Writer& Writer::AppendU32(uint16_t type, uint32_t value) {
  const uint32_t le = zv::ToLittleEndian(value);
  return Append(type, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(&le), sizeof(le)));
}

Writer& Writer::AppendU64(uint16_t type, uint64_t value) {
  const uint64_t le = zv::ToLittleEndian(value);
  return Append(type, std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(&le), sizeof(le)));
}

Writer& Writer::AppendString(uint16_t type, std::string_view value) {
  return Append(type, zv::AsBytes(value));
}

}  // namespace zv::tlv

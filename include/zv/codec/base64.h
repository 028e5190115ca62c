#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace zv::codec {

// Input is processed in windows of this many bytes so a single large payload
// never needs one oversized intermediate buffer.
inline constexpr size_t kWindowBytes = 32 * 1024;

// Standard alphabet, '=' padding, no line breaks. Empty input gives "".
std::string Base64Encode(std::span<const uint8_t> data);

// Leading and trailing whitespace is ignored. Throws zv::Error
// (Validation/kMalformedBase64) on characters outside the alphabet, a length
// that is not a multiple of four, or misplaced padding.
std::vector<uint8_t> Base64Decode(std::string_view text);

}  // namespace zv::codec

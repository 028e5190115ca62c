#pragma once

#include <string>
#include <string_view>

namespace zv::codec {

// Appends |text| as a JSON string literal, quotes included. Bytes >= 0x80 are
// copied through unchanged; control characters use short or \u00XX escapes.
void AppendJsonString(std::string& out, std::string_view text);

// Escaped body only, without the surrounding quotes.
std::string EscapeJson(std::string_view text);

}  // namespace zv::codec

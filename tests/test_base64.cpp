#include "zv/codec/base64.h"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "zv/common.h"
#include "zv/error.h"

namespace {

std::vector<uint8_t> PatternBytes(size_t size) {
  std::vector<uint8_t> out(size);
  for (size_t i = 0; i < size; ++i) {
    out[i] = static_cast<uint8_t>((i * 31u + 7u) & 0xFFu);
  }
  return out;
}

bool RejectsAsMalformed(std::string_view text) {
  try {
    (void)zv::codec::Base64Decode(text);
  } catch (const zv::Error& err) {
    return err.domain == zv::ErrorDomain::Validation &&
           err.code == zv::errors::validation::kMalformedBase64;
  }
  return false;
}

}  // namespace

int main() {
  using zv::codec::Base64Decode;
  using zv::codec::Base64Encode;

  assert(Base64Encode({}).empty() && "empty input encodes to empty text");
  assert(Base64Decode("").empty() && "empty text decodes to no bytes");

  // RFC 4648 section 10 vectors.
  assert(Base64Encode(zv::AsBytes("f")) == "Zg==");
  assert(Base64Encode(zv::AsBytes("fo")) == "Zm8=");
  assert(Base64Encode(zv::AsBytes("foo")) == "Zm9v");
  assert(Base64Encode(zv::AsBytes("foobar")) == "Zm9vYmFy");
  assert(zv::BytesToString(Base64Decode("Zm9vYg==")) == "foob");

  for (size_t size : {size_t{1}, size_t{32767}, size_t{32768}, size_t{32769}, size_t{98305},
                      size_t{1048576}}) {
    const auto bytes = PatternBytes(size);
    const auto text = Base64Encode(bytes);
    assert(text.size() == ((size + 2) / 3) * 4 && "encoded length matches 4*ceil(n/3)");
    assert(text.find('\n') == std::string::npos && "no line breaks across windows");
    const auto decoded = Base64Decode(text);
    if (decoded != bytes) {
      std::cerr << "round trip failed at size " << size << "\n";
      return 1;
    }
  }

  assert(zv::BytesToString(Base64Decode("  Zm9v\r\n")) == "foo" &&
         "surrounding whitespace is ignored");

  assert(RejectsAsMalformed("Zm9"));
  assert(RejectsAsMalformed("Zm9v!A=="));
  assert(RejectsAsMalformed("Zg=a"));
  assert(RejectsAsMalformed("=Zg="));
  assert(RejectsAsMalformed("Z==="));
  assert(RejectsAsMalformed("Zm 9v"));

  std::cout << "base64 tests ok\n";
  return 0;
}

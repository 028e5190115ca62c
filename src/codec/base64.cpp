#include "zv/codec/base64.h"

#include <openssl/evp.h>

#include <algorithm>
#include <string>

#include "zv/error.h"
#include "zv/errors.h"

namespace zv::codec {

namespace {

// Largest multiple of three that fits the window; every encoded window except
// the last is then padding-free and the pieces concatenate cleanly.
constexpr size_t kEncodeWindow = (kWindowBytes / 3) * 3;
// Multiple of four, so decode windows align with base64 quanta.
constexpr size_t kDecodeWindow = (kWindowBytes / 4) * 4;

[[noreturn]] void ThrowMalformed() {
  throw zv::Error(zv::ErrorDomain::Validation, zv::errors::validation::kMalformedBase64,
                  std::string(zv::errors::msg::kMalformedBase64));
}

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool IsAlphabet(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
         c == '+' || c == '/';
}

std::string_view Trim(std::string_view text) {
  while (!text.empty() && IsSpace(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && IsSpace(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

size_t ValidateAndCountPadding(std::string_view text) {
  if (text.size() % 4 != 0) {
    ThrowMalformed();
  }
  size_t padding = 0;
  if (!text.empty() && text.back() == '=') {
    padding = 1;
    if (text.size() >= 2 && text[text.size() - 2] == '=') {
      padding = 2;
    }
  }
  const size_t body = text.size() - padding;
  for (size_t i = 0; i < body; ++i) {
    if (!IsAlphabet(text[i])) {
      ThrowMalformed();
    }
  }
  return padding;
}

}  // namespace

std::string Base64Encode(std::span<const uint8_t> data) {
  std::string out;
  if (data.empty()) {
    return out;
  }
  out.reserve(((data.size() + 2) / 3) * 4);
  std::string window(((kEncodeWindow + 2) / 3) * 4 + 1, '\0');
  size_t offset = 0;
  while (offset < data.size()) {
    const size_t take = std::min(kEncodeWindow, data.size() - offset);
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(window.data()),
                                        data.data() + offset, static_cast<int>(take));
    if (written < 0) {
      throw zv::Error(zv::ErrorDomain::Crypto, zv::errors::crypto::kProviderFailure,
                      "EVP_EncodeBlock failed");
    }
    out.append(window.data(), static_cast<size_t>(written));
    offset += take;
  }
  return out;
}

std::vector<uint8_t> Base64Decode(std::string_view text) {
  text = Trim(text);
  std::vector<uint8_t> out;
  if (text.empty()) {
    return out;
  }
  const size_t padding = ValidateAndCountPadding(text);
  out.reserve((text.size() / 4) * 3);

  std::vector<uint8_t> window((kDecodeWindow / 4) * 3);
  size_t offset = 0;
  while (offset < text.size()) {
    const size_t take = std::min(kDecodeWindow, text.size() - offset);
    const int written = EVP_DecodeBlock(window.data(),
                                        reinterpret_cast<const unsigned char*>(text.data() + offset),
                                        static_cast<int>(take));
    if (written < 0) {
      ThrowMalformed();
    }
    size_t produced = static_cast<size_t>(written);
    offset += take;
    // EVP_DecodeBlock counts padding characters as zero bytes.
    if (offset == text.size()) {
      produced -= padding;
    }
    out.insert(out.end(), window.begin(), window.begin() + static_cast<std::ptrdiff_t>(produced));
  }
  return out;
}

}  // namespace zv::codec

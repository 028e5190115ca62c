#pragma once
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

namespace zv {
namespace detail {
template <class T>
[[nodiscard]] constexpr T ReverseBytes(T value) noexcept {
  auto bytes = std::bit_cast<std::array<std::uint8_t, sizeof(T)>>(value);
  for (std::size_t i = 0; i < bytes.size() / 2; ++i) {
    const auto tmp = bytes[i];
    bytes[i] = bytes[bytes.size() - 1U - i];
    bytes[bytes.size() - 1U - i] = tmp;
  }
  return std::bit_cast<T>(bytes);
}
}  // namespace detail

// Wire integers (TLV headers, vault fields) are little-endian.
template <class T>
[[nodiscard]] constexpr T ToLittleEndian(T value) noexcept {
  static_assert(std::is_unsigned_v<T>, "wire integers are unsigned");
  if constexpr (std::endian::native == std::endian::little) {
    return value;
  } else {
    return detail::ReverseBytes(value);
  }
}

template <class T>
[[nodiscard]] constexpr T FromLittleEndian(T value) noexcept {
  return ToLittleEndian(value);
}

// Views the UTF-8 bytes of |text| without copying.
inline std::span<const std::uint8_t> AsBytes(std::string_view text) noexcept {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

inline std::string BytesToString(std::span<const std::uint8_t> bytes) {
  return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

// Lowercase hex, two characters per byte.
inline std::string HexEncode(std::span<const std::uint8_t> bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (std::uint8_t byte : bytes) {
    out.push_back(kDigits[byte >> 4]);
    out.push_back(kDigits[byte & 0x0F]);
  }
  return out;
}

inline std::string PathToUtf8String(const std::filesystem::path& path) {
#if defined(_WIN32)
  const std::u8string u8 = path.u8string();
  return std::string(u8.begin(), u8.end());
#else
  return path.string();
#endif
}
}  // namespace zv

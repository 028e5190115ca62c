#pragma once
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>

namespace zv::crypto::ct {

// Constant-time in the contents. A length mismatch returns false at once;
// lengths of keys, tags and digests are public.
inline bool CompareEqual(std::span<const uint8_t> a, std::span<const uint8_t> b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  volatile uint8_t diff = 0;
  for (size_t i = 0; i < a.size(); ++i) {
    diff |= static_cast<uint8_t>(a[i] ^ b[i]);
  }
  std::atomic_signal_fence(std::memory_order_seq_cst);
  return diff == 0;
}

template <size_t N>
inline bool CompareEqual(const std::array<uint8_t, N>& a, const std::array<uint8_t, N>& b) noexcept {
  return CompareEqual(std::span<const uint8_t>(a), std::span<const uint8_t>(b));
}

} // namespace zv::crypto::ct

#pragma once
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <new>
#include <span>
#include <utility>

#include "zv/security/zeroizer.h"

namespace zv::security {

// Heap buffer for key material. Contents are zeroed on allocation and on
// release, and the pages are locked when the platform allows it. Move-only.
template <typename T>
class SecureBuffer {
public:
  SecureBuffer() noexcept = default;

  explicit SecureBuffer(size_t n) {
    if (n == 0) {
      return;
    }
    if (n > std::numeric_limits<size_t>::max() / sizeof(T)) {
      throw std::bad_array_new_length{};
    }
    ptr_ = static_cast<T*>(::operator new(n * sizeof(T), std::align_val_t{alignof(T)}));
    size_ = n;
    Zeroizer::Wipe(Bytes());
    locked_ = Zeroizer::TryLockMemory(Bytes()) == Zeroizer::LockStatus::Locked;
  }

  explicit SecureBuffer(std::span<const T> source) : SecureBuffer(source.size()) {
    if (!source.empty()) {
      std::memcpy(ptr_, source.data(), source.size_bytes());
    }
  }

  ~SecureBuffer() { Release(); }

  SecureBuffer(const SecureBuffer&) = delete;
  SecureBuffer& operator=(const SecureBuffer&) = delete;

  SecureBuffer(SecureBuffer&& o) noexcept
      : ptr_(std::exchange(o.ptr_, nullptr)),
        size_(std::exchange(o.size_, 0)),
        locked_(std::exchange(o.locked_, false)) {}

  SecureBuffer& operator=(SecureBuffer&& o) noexcept {
    if (this != &o) {
      Release();
      ptr_ = std::exchange(o.ptr_, nullptr);
      size_ = std::exchange(o.size_, 0);
      locked_ = std::exchange(o.locked_, false);
    }
    return *this;
  }

  T* data() noexcept { return ptr_; }
  const T* data() const noexcept { return ptr_; }
  size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  std::span<T> AsSpan() noexcept { return {ptr_, size_}; }
  std::span<const T> AsSpan() const noexcept { return {ptr_, size_}; }
  std::span<const uint8_t> AsU8Span() const noexcept {
    return {reinterpret_cast<const uint8_t*>(ptr_), size_ * sizeof(T)};
  }

private:
  std::span<uint8_t> Bytes() noexcept { return {reinterpret_cast<uint8_t*>(ptr_), size_ * sizeof(T)}; }

  void Release() noexcept {
    if (!ptr_) {
      return;
    }
    Zeroizer::Wipe(Bytes());
    if (locked_) {
      Zeroizer::UnlockMemory(Bytes());
    }
    ::operator delete(ptr_, std::align_val_t{alignof(T)});
    ptr_ = nullptr;
    size_ = 0;
    locked_ = false;
  }

  T* ptr_{nullptr};
  size_t size_{0};
  bool locked_{false};
};

} // namespace zv::security

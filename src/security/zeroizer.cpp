#include "zv/security/zeroizer.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>

#if defined(ZV_HAVE_SODIUM) && ZV_HAVE_SODIUM
#include <sodium.h>
#endif

#if defined(_WIN32)
#define NOMINMAX
#include <windows.h>
#else
#include <sys/mman.h>
#include <unistd.h>
#endif

namespace zv::security {
  namespace {

    inline void PortableZero(std::span<uint8_t> data) noexcept {
      if (data.empty()) {
        return;
      }
#if defined(ZV_HAVE_SODIUM) && ZV_HAVE_SODIUM
      sodium_memzero(data.data(), data.size());
#elif defined(_WIN32)
      ::SecureZeroMemory(data.data(), static_cast<SIZE_T>(data.size()));
#else
      volatile uint8_t* ptr = reinterpret_cast<volatile uint8_t*>(data.data());
      for (std::size_t i = 0; i < data.size(); ++i) {
        ptr[i] = 0;
      }
#if defined(__GNUC__) || defined(__clang__)
      __asm__ __volatile__("" ::: "memory");
#endif
#endif
      std::atomic_thread_fence(std::memory_order_seq_cst);
    }

  } // namespace

  void Zeroizer::Wipe(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return;
    }
    PortableZero(data);
    std::atomic_signal_fence(std::memory_order_seq_cst);
  }

  bool Zeroizer::MemoryLockingSupported() noexcept {
#if defined(_WIN32)
    return true;
#elif defined(_POSIX_MEMLOCK_RANGE) || defined(__linux__) || defined(__APPLE__)
    return true;
#else
    return false;
#endif
  }

  Zeroizer::LockStatus Zeroizer::TryLockMemory(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return LockStatus::Locked;
    }
    if (!MemoryLockingSupported()) {
      return LockStatus::Unsupported;
    }
#if defined(_WIN32)
    return ::VirtualLock(data.data(), data.size()) ? LockStatus::Locked : LockStatus::BestEffort;
#else
    return ::mlock(data.data(), data.size()) == 0 ? LockStatus::Locked : LockStatus::BestEffort;
#endif
  }

  void Zeroizer::UnlockMemory(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return;
    }
#if defined(_WIN32)
    ::VirtualUnlock(data.data(), data.size());
#else
    ::munlock(data.data(), data.size());
#endif
  }

} // namespace zv::security

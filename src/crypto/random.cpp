#include "zv/crypto/random.h"

#include <cerrno>
#include <cstdint>
#include <fstream>
#include <span>
#include <vector>

#if defined(_WIN32)
#include <windows.h>
#include <bcrypt.h>
#if defined(_MSC_VER)
#pragma comment(lib, "bcrypt.lib")
#endif
#if !defined(BCRYPT_SUCCESS)
#define BCRYPT_SUCCESS(status) ((status) >= 0)
#endif
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
#include <stdlib.h>
#include <unistd.h>
#elif defined(__linux__) || defined(__ANDROID__)
#include <sys/random.h>
#include <unistd.h>
#endif

#include "zv/common.h"
#include "zv/error.h"

namespace {

[[noreturn]] void ThrowRandomUnavailable(int native, const char* what) {
  throw zv::Error(zv::ErrorDomain::Crypto, zv::errors::crypto::kRandomUnavailable, what, native);
}

void ReadFromUrandom(std::span<uint8_t> out) {
  std::ifstream urandom("/dev/urandom", std::ios::in | std::ios::binary);
  if (!urandom) {
    ThrowRandomUnavailable(errno, "Failed to open /dev/urandom");
  }
  urandom.read(reinterpret_cast<char*>(out.data()),
               static_cast<std::streamsize>(out.size()));
  if (urandom.gcount() != static_cast<std::streamsize>(out.size())) {
    ThrowRandomUnavailable(errno, "Failed to read sufficient entropy from /dev/urandom");
  }
}

}  // namespace

namespace zv::crypto {

void SystemRandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
#if defined(_WIN32)
  NTSTATUS status = BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(out.data()),
                                    static_cast<ULONG>(out.size()),
                                    BCRYPT_USE_SYSTEM_PREFERRED_RNG);
  if (!BCRYPT_SUCCESS(status)) {
    ThrowRandomUnavailable(static_cast<int>(status), "Windows RNG failed");
  }
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
  arc4random_buf(out.data(), out.size());
#elif defined(__linux__) || defined(__ANDROID__)
  size_t offset = 0;
  while (offset < out.size()) {
    ssize_t result = ::getrandom(out.data() + offset, out.size() - offset, 0);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == ENOSYS) {
        break;  // kernel without getrandom; fall back below
      }
      ThrowRandomUnavailable(errno, "getrandom failed");
    }
    if (result == 0) {
      break;
    }
    offset += static_cast<size_t>(result);
  }
  if (offset < out.size()) {
    ReadFromUrandom(out.subspan(offset));
  }
#else
  ReadFromUrandom(out);
#endif
}

std::string RandomHex(size_t byte_count) {
  std::vector<uint8_t> raw(byte_count);
  SystemRandomBytes(raw);
  return zv::HexEncode(raw);
}

}  // namespace zv::crypto

#include "zv/orchestrator/io_util.h"

#include <cerrno>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>

#include "zv/common.h"
#include "zv/crypto/random.h"

#ifndef _WIN32
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/statfs.h>
#elif defined(__APPLE__) || defined(__FreeBSD__)
#include <sys/mount.h>
#include <sys/param.h>
#endif
#else
#ifndef NOMINMAX
#define NOMINMAX
#endif
#define WIN32_LEAN_AND_MEAN
#include <Windows.h>
#include <fcntl.h>
#include <io.h>
#include <sys/stat.h>
#endif

namespace zv::orchestrator {
namespace {

constexpr char kReplaceFailed[] = "Atomic file replace failed";
constexpr size_t kTempTokenBytes = 16;

// Breadcrumbs describing what AtomicReplace was doing, outermost first.
using Trail = std::vector<std::string>;

std::string WithTrail(std::string_view message, const Trail& trail) {
  std::string out(message);
  for (auto it = trail.rbegin(); it != trail.rend(); ++it) {
    out += "\n  while: ";
    out += *it;
  }
  return out;
}

[[noreturn]] void ThrowNative(const Trail& trail, std::string_view what, int native) {
  std::string message(kReplaceFailed);
  message += ": ";
  message += what;
  throw Error{ErrorDomain::IO, errors::io::kAtomicReplaceFailed, WithTrail(message, trail), native,
              ClassifyNativeError(native), trail};
}

// Runs |fn| with |label| on the trail. Whatever escapes is a zv::Error
// carrying the trail: system errors become IO, anything else Internal.
template <typename Fn>
auto Step(Trail& trail, std::string label, Fn&& fn) -> std::invoke_result_t<Fn&> {
  trail.push_back(std::move(label));
  struct PopOnExit {
    Trail& trail;
    ~PopOnExit() { trail.pop_back(); }
  } pop{trail};
  try {
    return fn();
  } catch (const Error& err) {
    if (!err.context.empty()) {
      throw;
    }
    throw Error{err.domain, err.code, WithTrail(err.what(), trail), err.native_code,
                err.retryability, trail};
  } catch (const std::system_error& sys_err) {
    const int native = sys_err.code().value();
    throw Error{ErrorDomain::IO, errors::io::kAtomicReplaceFailed, WithTrail(sys_err.what(), trail),
                native, ClassifyNativeError(native), trail};
  } catch (const std::exception& ex) {
    throw Error{ErrorDomain::Internal, 0, WithTrail(ex.what(), trail), std::nullopt,
                Retryability::kFatal, trail};
  }
}

bool IsTransientSyncError(int err) {
  return err == EAGAIN || err == EBUSY;
}

#ifdef _WIN32
bool SupportsAtomicRename(const std::filesystem::path&) {
  return true;
}
#else
// Network filesystems do not guarantee rename atomicity.
bool SupportsAtomicRename(const std::filesystem::path& dir) {
  std::error_code ec;
  const auto absolute = std::filesystem::absolute(dir, ec);
  struct statfs info {};
  if (ec || ::statfs(absolute.c_str(), &info) != 0) {
    return false;
  }
#if defined(__linux__)
  switch (static_cast<unsigned long>(info.f_type)) {
  case 0x6969:      // NFS
  case 0x517B:      // SMB
  case 0xFE534D42:  // SMB2
  case 0xFF534D42:  // CIFS
    return false;
  default:
    return true;
  }
#elif defined(__APPLE__) || defined(__FreeBSD__)
  return (info.f_flags & MNT_LOCAL) != 0;
#else
  return true;
#endif
}
#endif

// Owner-only file beside the target. Removed on destruction unless
// committed into place.
class TempFile {
public:
  TempFile(const std::filesystem::path& dir, const std::filesystem::path& target, Trail& trail)
      : trail_(trail) {
    auto name = target.filename();
    name += ".tmp.";
    name += crypto::RandomHex(kTempTokenBytes);
    path_ = dir / name;
#ifdef _WIN32
    fd_ = _wopen(path_.wstring().c_str(), _O_CREAT | _O_EXCL | _O_WRONLY | _O_BINARY,
                 _S_IREAD | _S_IWRITE);
#else
    fd_ = ::open(path_.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0600);
#endif
    if (fd_ < 0) {
      const int err = errno;
      path_.clear();
      ThrowNative(trail_, "open failed", err);
    }
  }

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  ~TempFile() {
    if (fd_ >= 0) {
      CloseFd();
    }
    if (!path_.empty()) {
      std::error_code ec;
      if (!std::filesystem::remove(path_, ec) && ec) {
        std::cerr << "temp file cleanup failed: " << ec.message() << '\n';
      }
    }
  }

  const std::filesystem::path& path() const noexcept { return path_; }

  void Write(std::span<const uint8_t> payload) {
    size_t written = 0;
    while (written < payload.size()) {
      const auto remaining = payload.size() - written;
#ifdef _WIN32
      const auto chunk = _write(fd_, payload.data() + written, static_cast<unsigned int>(remaining));
#else
      const auto chunk = ::write(fd_, payload.data() + written, remaining);
#endif
      if (chunk < 0 && errno == EINTR) {
        continue;
      }
      if (chunk <= 0) {
        ThrowNative(trail_, chunk == 0 ? "short write" : "write failed", chunk == 0 ? EIO : errno);
      }
      written += static_cast<size_t>(chunk);
    }
  }

  // fsync with a short bounded backoff for EAGAIN/EBUSY.
  void Sync() {
    std::chrono::milliseconds backoff{5};
    for (int attempt = 0;; ++attempt) {
#ifdef _WIN32
      const int rc = _commit(fd_);
#else
      const int rc = ::fsync(fd_);
#endif
      if (rc == 0) {
        return;
      }
      const int err = errno;
      if (err == EINTR) {
        continue;
      }
      if (attempt >= 4 || !IsTransientSyncError(err)) {
        ThrowNative(trail_, "fsync failed", err);
      }
      std::this_thread::sleep_for(backoff);
      backoff *= 2;
    }
  }

  void Close() {
    if (CloseFd() != 0) {
      ThrowNative(trail_, "close failed", errno);
    }
  }

  void CommitTo(const std::filesystem::path& target) {
#ifdef _WIN32
    if (!::MoveFileExW(path_.wstring().c_str(), target.wstring().c_str(),
                       MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
      ThrowNative(trail_, "rename failed", static_cast<int>(::GetLastError()));
    }
#else
    if (::rename(path_.c_str(), target.c_str()) != 0) {
      ThrowNative(trail_, "rename failed", errno);
    }
#endif
    path_.clear();
  }

private:
  int CloseFd() {
#ifdef _WIN32
    const int rc = _close(fd_);
#else
    const int rc = ::close(fd_);
#endif
    fd_ = -1;
    return rc;
  }

  Trail& trail_;
  std::filesystem::path path_;
  int fd_{-1};
};

void SyncDirectory(const std::filesystem::path& dir, const Trail& trail) {
#ifdef _WIN32
  // MOVEFILE_WRITE_THROUGH flushed the rename.
  (void)dir;
  (void)trail;
#else
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    ThrowNative(trail, "open directory failed", errno);
  }
  const int rc = ::fsync(fd);
  const int err = errno;
  ::close(fd);
  if (rc != 0) {
    ThrowNative(trail, "directory flush failed", err);
  }
#endif
}

[[noreturn]] void ThrowReadFailed(const std::filesystem::path& path, std::string_view what, int native) {
  throw Error{ErrorDomain::IO, errors::io::kReadFailed,
              std::string(what) + " " + PathToUtf8String(path), native, ClassifyNativeError(native)};
}

}  // namespace

Retryability ClassifyNativeError(int native) {
  switch (native) {
  case EINTR:
  case EAGAIN:
#if defined(EWOULDBLOCK) && EWOULDBLOCK != EAGAIN
  case EWOULDBLOCK:
#endif
    return Retryability::kRetryable;
  case EBUSY:
  case ETIMEDOUT:
    return Retryability::kTransient;
  default:
    return Retryability::kFatal;
  }
}

void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks) {
  Trail trail;
  if (target.empty()) {
    throw Error{ErrorDomain::Validation, errors::validation::kMalformedRecord,
                "Atomic replace needs a target path"};
  }
  trail.push_back("atomic replace target=" + PathToUtf8String(target));

  auto dir = target.parent_path();
  if (dir.empty()) {
    dir = Step(trail, "resolving current working directory", [] { return std::filesystem::current_path(); });
  }
  Step(trail, "checking atomic rename support", [&] {
    if (!SupportsAtomicRename(dir)) {
      throw Error{ErrorDomain::IO, errors::io::kAtomicReplaceFailed,
                  "Filesystem does not support atomic rename"};
    }
  });

  Step(trail, "writing temporary payload file", [&] {
    TempFile temp(dir, target, trail);
    temp.Write(payload);
    temp.Sync();
    temp.Close();
    if (hooks.before_rename) {
      Step(trail, "executing before_rename hook", [&] { hooks.before_rename(temp.path(), target); });
    }
    temp.CommitTo(target);
  });

  Step(trail, "syncing directory metadata", [&] { SyncDirectory(dir, trail); });
}

std::optional<std::vector<uint8_t>> ReadFileBytes(const std::filesystem::path& path) {
  std::error_code ec;
  const bool exists = std::filesystem::exists(path, ec);
  if (ec) {
    ThrowReadFailed(path, "Failed to stat", ec.value());
  }
  if (!exists) {
    return std::nullopt;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    ThrowReadFailed(path, "Failed to open", errno);
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    ThrowReadFailed(path, "Failed to read", errno);
  }
  return bytes;
}

}  // namespace zv::orchestrator

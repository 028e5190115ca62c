#include "zv/orchestrator/io_util.h"

#include <array>
#include <cassert>
#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "zv/error.h"

namespace {

std::vector<uint8_t> ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

size_t CountEntries(const std::filesystem::path& dir) {
  size_t count = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    (void)entry;
    ++count;
  }
  return count;
}

}  // namespace

int main() {
  using zv::orchestrator::AtomicReplace;
  using zv::orchestrator::AtomicReplaceHooks;
  using zv::orchestrator::ReadFileBytes;

  const auto dir = std::filesystem::temp_directory_path() / "zv_io_util_test";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  const auto target = dir / "atomic_replace.bin";

  {
    std::ofstream seed(target, std::ios::binary | std::ios::trunc);
    const std::array<uint8_t, 4> baseline{0xDE, 0xAD, 0xBE, 0xEF};
    seed.write(reinterpret_cast<const char*>(baseline.data()), static_cast<std::streamsize>(baseline.size()));
  }

  AtomicReplaceHooks hooks;
  hooks.before_rename = [](const std::filesystem::path&, const std::filesystem::path&) {
    throw std::runtime_error("simulated crash");
  };

  std::array<uint8_t, 4> update{0xBA, 0xAD, 0xF0, 0x0D};
  bool threw = false;
  try {
    AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()), hooks);
  } catch (const zv::Error& err) {
    threw = err.domain == zv::ErrorDomain::Internal && !err.context.empty();
  }
  assert(threw && "hook failure surfaces as an internal error with context");

  auto bytes = ReadFile(target);
  assert(bytes.size() == 4);
  assert(bytes[0] == 0xDE && bytes[1] == 0xAD && bytes[2] == 0xBE && bytes[3] == 0xEF &&
         "original contents survive an interrupted replace");
  assert(CountEntries(dir) == 1 && "temporary file cleaned up");

  hooks.before_rename = [](const std::filesystem::path&, const std::filesystem::path&) {
    throw std::system_error(std::make_error_code(std::errc::device_or_resource_busy));
  };
  threw = false;
  try {
    AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()), hooks);
  } catch (const zv::Error& err) {
    threw = err.domain == zv::ErrorDomain::IO && err.native_code == EBUSY &&
            err.retryability == zv::Retryability::kTransient;
  }
  assert(threw && "system errors keep their native code and retry class");

  hooks.before_rename = nullptr;
  AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()));

  bytes = ReadFile(target);
  assert(bytes.size() == 4);
  assert(bytes[0] == 0xBA && bytes[1] == 0xAD && bytes[2] == 0xF0 && bytes[3] == 0x0D);

  {
    const auto fresh = dir / "created.bin";
    AtomicReplace(fresh, std::span<const uint8_t>{});
    const auto read = ReadFileBytes(fresh);
    assert(read && read->empty() && "empty payload creates an empty file");
    const auto perms = std::filesystem::status(fresh).permissions();
    assert((perms & std::filesystem::perms::group_all) == std::filesystem::perms::none &&
           (perms & std::filesystem::perms::others_all) == std::filesystem::perms::none &&
           "file is private to the owner");
  }

  {
    const auto read = ReadFileBytes(target);
    assert(read && *read == std::vector<uint8_t>(update.begin(), update.end()) && "read back");
    assert(!ReadFileBytes(dir / "missing.bin") && "missing file reads as nullopt");
  }

  assert(zv::orchestrator::ClassifyNativeError(EAGAIN) == zv::Retryability::kRetryable &&
         "EAGAIN retryable");
  assert(zv::orchestrator::ClassifyNativeError(EACCES) == zv::Retryability::kFatal && "EACCES fatal");

  std::filesystem::remove_all(dir);

  std::cout << "atomic replace tests ok\n";
  return 0;
}

#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace zv::crypto {

// Fills |out| from the operating system CSPRNG. Throws zv::Error
// (Crypto/kRandomUnavailable) when no entropy source can be read.
void SystemRandomBytes(std::span<uint8_t> out);

// |byte_count| random bytes as lowercase hex. Used for object ids and temp
// file names.
std::string RandomHex(size_t byte_count);

}  // namespace zv::crypto

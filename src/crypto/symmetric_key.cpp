#include "zv/crypto/symmetric_key.h"

#include <string>
#include <utility>

#include "zv/crypto/ct.h"
#include "zv/crypto/random.h"
#include "zv/error.h"
#include "zv/errors.h"

namespace zv::crypto {

namespace {

[[noreturn]] void ThrowKeyLength(size_t actual) {
  throw zv::Error(zv::ErrorDomain::Validation, zv::errors::validation::kKeyLength,
                  std::string(zv::errors::msg::kKeyLengthUnexpected) + " (got " +
                      std::to_string(actual) + ")");
}

}  // namespace

SymmetricKey::SymmetricKey(security::SecureBuffer<uint8_t> bytes) : bytes_(std::move(bytes)) {
  if (bytes_.size() != kSize) {
    ThrowKeyLength(bytes_.size());
  }
}

SymmetricKey SymmetricKey::Generate() {
  security::SecureBuffer<uint8_t> bytes(kSize);
  SystemRandomBytes(bytes.AsSpan());
  return SymmetricKey(std::move(bytes));
}

SymmetricKey SymmetricKey::Import(std::span<const uint8_t> raw) {
  if (raw.size() != kSize) {
    ThrowKeyLength(raw.size());
  }
  return SymmetricKey(security::SecureBuffer<uint8_t>(raw));
}

security::SecureBuffer<uint8_t> SymmetricKey::Export() const {
  return security::SecureBuffer<uint8_t>(Bytes());
}

std::span<const uint8_t, SymmetricKey::kSize> SymmetricKey::Bytes() const {
  if (!Valid()) {
    throw zv::Error(zv::ErrorDomain::State, zv::errors::state::kSessionLocked,
                    "Key handle is empty");
  }
  return std::span<const uint8_t, kSize>(bytes_.data(), kSize);
}

bool SymmetricKey::Equals(const SymmetricKey& other) const noexcept {
  if (!Valid() || !other.Valid()) {
    return false;
  }
  return ct::CompareEqual(bytes_.AsSpan(), other.bytes_.AsSpan());
}

}  // namespace zv::crypto

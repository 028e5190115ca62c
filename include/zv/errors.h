#pragma once

#include <string_view>

namespace zv::errors::msg {
// Centralized message catalog.
inline constexpr std::string_view kPasswordTooShort{"Use at least 12 characters"};
inline constexpr std::string_view kPasswordTooLong{"Password too long"};
inline constexpr std::string_view kPasswordMissingUppercase{"Add uppercase letters"};
inline constexpr std::string_view kPasswordMissingLowercase{"Add lowercase letters"};
inline constexpr std::string_view kPasswordMissingDigit{"Add numbers"};
inline constexpr std::string_view kPasswordMissingSpecial{"Add special characters"};
inline constexpr std::string_view kMalformedBase64{"Failed to decode base64: invalid base64 string"};
inline constexpr std::string_view kSaltLengthUnexpected{"Salt must be 16 bytes"};
inline constexpr std::string_view kNonceLengthUnexpected{"Nonce must be 12 bytes"};
inline constexpr std::string_view kKeyLengthUnexpected{"Key must be 32 bytes"};
inline constexpr std::string_view kCiphertextTruncated{"Ciphertext shorter than authentication tag"};
inline constexpr std::string_view kIterationsTooLow{"PBKDF2 iteration count below 100000"};
inline constexpr std::string_view kCannotDecryptFile{"Failed to decrypt file"};
inline constexpr std::string_view kCannotDecryptFilename{"Failed to decrypt filename"};
inline constexpr std::string_view kCannotDecryptField{"Decryption failed"};
inline constexpr std::string_view kMetadataRecordMalformed{"Metadata record is not a valid JSON object"};
inline constexpr std::string_view kArgon2DerivationFailed{"Argon2id derivation failed"};
inline constexpr std::string_view kArgon2Unavailable{"Argon2id support not available in this build"};
inline constexpr std::string_view kVaultEntryCorrupt{"Stored master key entry is corrupt"};
inline constexpr std::string_view kVaultEntryVersion{"Stored master key entry has unsupported version"};
inline constexpr std::string_view kVaultUserIdRequired{"User id required"};
inline constexpr std::string_view kMasterKeyNotAvailable{"Master key not found. Please login again."};
inline constexpr std::string_view kNoActiveUser{"User not authenticated"};
inline constexpr std::string_view kCurrentPasswordIncorrect{"Current password is incorrect"};
inline constexpr std::string_view kSaltUnknown{"Account salt not available. Please login again."};
inline constexpr std::string_view kFileTooLarge{"File too large. Maximum size is "};
inline constexpr std::string_view kFileTypeUnsupported{"File type not supported"};
inline constexpr std::string_view kDuplicateFileName{"Duplicate file name in selection"};
inline constexpr std::string_view kTooManyFiles{"Too many files in one batch"};
inline constexpr std::string_view kEmptyFileName{"File name is empty"};
inline constexpr std::string_view kUploadCancelled{"Upload cancelled"};
inline constexpr std::string_view kObjectNotFound{"Stored object not found"};
}  // namespace zv::errors::msg

#include "zv/orchestrator/password_policy.h"

#include <array>
#include <cmath>
#include <string>

#include "zv/error.h"
#include "zv/errors.h"

namespace zv::orchestrator {
namespace {

constexpr std::size_t kMaxPasswordLength = 1024;

// Shannon entropy of the character distribution, in bits for the whole string.
double ComputeEntropyBits(std::string_view password) {
  if (password.empty()) {
    return 0.0;
  }

  std::array<std::size_t, 256> counts{};
  for (unsigned char ch : password) {
    ++counts[ch];
  }

  const double length = static_cast<double>(password.size());
  double per_character = 0.0;
  for (auto count : counts) {
    if (count == 0) {
      continue;
    }
    const double probability = static_cast<double>(count) / length;
    per_character -= probability * std::log2(probability);
  }
  return per_character * length;
}

bool IsSpecial(char ch) {
  return kPasswordSpecialCharacters.find(ch) != std::string_view::npos;
}

}  // namespace

PasswordStrength EvaluatePasswordStrength(std::string_view password) {
  PasswordStrength strength;
  strength.long_enough = password.size() >= kMinPasswordLength;
  for (char ch : password) {
    if (ch >= 'A' && ch <= 'Z') {
      strength.has_upper = true;
    } else if (ch >= 'a' && ch <= 'z') {
      strength.has_lower = true;
    } else if (ch >= '0' && ch <= '9') {
      strength.has_digit = true;
    } else if (IsSpecial(ch)) {
      strength.has_special = true;
    }
  }
  strength.entropy_bits = ComputeEntropyBits(password);

  if (strength.long_enough) {
    ++strength.score;
  } else {
    strength.feedback.emplace_back(zv::errors::msg::kPasswordTooShort);
  }
  if (strength.has_upper) {
    ++strength.score;
  } else {
    strength.feedback.emplace_back(zv::errors::msg::kPasswordMissingUppercase);
  }
  if (strength.has_lower) {
    ++strength.score;
  } else {
    strength.feedback.emplace_back(zv::errors::msg::kPasswordMissingLowercase);
  }
  if (strength.has_digit) {
    ++strength.score;
  } else {
    strength.feedback.emplace_back(zv::errors::msg::kPasswordMissingDigit);
  }
  if (strength.has_special) {
    ++strength.score;
  } else {
    strength.feedback.emplace_back(zv::errors::msg::kPasswordMissingSpecial);
  }
  return strength;
}

void EnforcePasswordPolicy(std::string_view password) {
  if (password.size() > kMaxPasswordLength) {
    throw zv::Error{zv::ErrorDomain::Validation, zv::errors::validation::kPasswordPolicy,
                    std::string(zv::errors::msg::kPasswordTooLong)};
  }
  const auto strength = EvaluatePasswordStrength(password);
  if (!strength.acceptable()) {
    throw zv::Error{zv::ErrorDomain::Validation, zv::errors::validation::kPasswordPolicy,
                    strength.feedback.front()};
  }
}

}  // namespace zv::orchestrator

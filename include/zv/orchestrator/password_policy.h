#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace zv::orchestrator {

inline constexpr std::size_t kMinPasswordLength = 12;
inline constexpr std::string_view kPasswordSpecialCharacters{"!@#$%^&*(),.?\":{}|<>"};

struct PasswordStrength {
  // One point per satisfied rule: length, upper, lower, digit, special.
  int score{0};
  bool long_enough{false};
  bool has_upper{false};
  bool has_lower{false};
  bool has_digit{false};
  bool has_special{false};
  double entropy_bits{0.0};
  std::vector<std::string> feedback;

  [[nodiscard]] bool acceptable() const noexcept { return feedback.empty(); }
};

PasswordStrength EvaluatePasswordStrength(std::string_view password);

// Throws zv::Error (Validation/kPasswordPolicy) naming the first unmet rule.
void EnforcePasswordPolicy(std::string_view password);

}  // namespace zv::orchestrator

#include "validation.hpp"

namespace toolbridge {

std::optional<ValidationRule> CompileValidationRule(const std::string& pattern,
                                                    const std::string& message,
                                                    std::string* err) {
  ValidationRule rule;
  rule.pattern = pattern;
  rule.message = message.empty() ? "Validation failed for pattern: " + pattern : message;
  try {
    rule.re = std::regex(pattern, std::regex::ECMAScript);
  } catch (const std::regex_error& e) {
    if (err) *err = "invalid validation pattern '" + pattern + "': " + e.what();
    return std::nullopt;
  }
  return rule;
}

std::optional<std::string> FindRuleViolation(const std::vector<ValidationRule>& rules, const std::string& value) {
  for (const auto& rule : rules) {
    if (rule.pattern.empty()) continue;
    if (std::regex_search(value, rule.re)) return rule.message;
  }
  return std::nullopt;
}

}  // namespace toolbridge

#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace toolbridge {

struct ValidationRule {
  std::string pattern;
  std::string message;
  std::regex re;
};

// Fails when the pattern is not a valid ECMAScript regular expression.
std::optional<ValidationRule> CompileValidationRule(const std::string& pattern,
                                                    const std::string& message,
                                                    std::string* err);

// A rule rejects when its pattern is found anywhere in the value.
// Returns the message of the first rejecting rule.
std::optional<std::string> FindRuleViolation(const std::vector<ValidationRule>& rules, const std::string& value);

}  // namespace toolbridge

#include <gtest/gtest.h>

#include "validation.hpp"

using namespace toolbridge;

class ValidationTest : public ::testing::Test {
 protected:
  std::vector<ValidationRule> Compile(const std::vector<std::pair<std::string, std::string>>& specs) {
    std::vector<ValidationRule> rules;
    for (const auto& s : specs) {
      std::string err;
      auto r = CompileValidationRule(s.first, s.second, &err);
      EXPECT_TRUE(r.has_value()) << err;
      if (r) rules.push_back(*r);
    }
    return rules;
  }
};

TEST_F(ValidationTest, NoRulesNoViolation) {
  EXPECT_FALSE(FindRuleViolation({}, "anything at all").has_value());
}

TEST_F(ValidationTest, MatchingPatternReportsMessage) {
  auto rules = Compile({{"rm\\s+-rf", "Destructive command"}});
  auto v = FindRuleViolation(rules, "rm  -rf /");
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(*v, "Destructive command");
}

TEST_F(ValidationTest, PatternMatchesAnywhere) {
  auto rules = Compile({{"secret", "no secrets"}});
  EXPECT_TRUE(FindRuleViolation(rules, "echo my-secret-value").has_value());
  EXPECT_FALSE(FindRuleViolation(rules, "echo public").has_value());
}

TEST_F(ValidationTest, FirstMatchingRuleWins) {
  auto rules = Compile({{"aaa", "first"}, {"a", "second"}});
  EXPECT_EQ(FindRuleViolation(rules, "a").value(), "second");
  EXPECT_EQ(FindRuleViolation(rules, "aaa").value(), "first");
}

TEST_F(ValidationTest, DefaultMessageNamesPattern) {
  std::string err;
  auto r = CompileValidationRule("drop\\s+table", "", &err);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->message, "Validation failed for pattern: drop\\s+table");
}

TEST_F(ValidationTest, InvalidPatternIsRejected) {
  std::string err;
  auto r = CompileValidationRule("([unclosed", "bad", &err);
  EXPECT_FALSE(r.has_value());
  EXPECT_FALSE(err.empty());
}

TEST_F(ValidationTest, EmptyPatternNeverMatches) {
  auto rules = Compile({{"", "empty"}});
  EXPECT_FALSE(FindRuleViolation(rules, "whatever").has_value());
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

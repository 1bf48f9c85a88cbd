#pragma once

#include "errors.hpp"
#include "executors/executor.hpp"
#include "sandbox_executor.hpp"
#include "tool_config.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <set>
#include <string>

namespace toolbridge {

inline constexpr const char* kUidFromPathDirective = "auto:uid-from-path";
inline constexpr const char* kDefaultUidPath = "/var/www/html";

struct PathMapping {
  std::string host_root = "/workspace";
  std::string container_root = "/var/www/html";
};

// Caller arguments win over defaults of the same key.
nlohmann::json MergeArguments(const nlohmann::json& defaults, const nlohmann::json& arguments);

// Rewrites every string under host_root/ to the same path under container_root.
nlohmann::json NormalizePaths(const nlohmann::json& value, const PathMapping& paths);

// Substitutes {name} placeholders. {{ and }} render as literal braces.
std::optional<std::string> RenderTemplate(const std::string& tmpl, const nlohmann::json& args, BridgeError* err);

std::set<std::string> TemplatePlaceholders(const std::string& tmpl);

// Returns the stat target when user is an auto:uid-from-path directive.
std::optional<std::string> ParseUidDirective(const std::string& user);

class CommandToolExecutor : public IToolExecutor {
 public:
  CommandToolExecutor(const SandboxExecutor* sandbox, CommandToolConfig config, PathMapping paths);

  std::string Kind() const override { return "command"; }
  ValidationResult ValidateArguments(const nlohmann::json& arguments) const override;
  std::string Execute(const nlohmann::json& arguments, const ToolCallContext& ctx) override;

  // Never fails: lookup problems fall back to the default user.
  std::string ResolveUser() const;

 private:
  std::optional<std::string> Container() const;

  const SandboxExecutor* sandbox_;
  CommandToolConfig config_;
  PathMapping paths_;
};

}  // namespace toolbridge

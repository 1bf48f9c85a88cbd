#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace toolbridge {

struct ValidationResult {
  bool ok = true;
  std::string message;
};

struct ToolCallContext {
  std::string tool_name;
  // Set for tools derived from a remote catalog.
  std::optional<std::string> remote_tool_name;
};

class IToolExecutor {
 public:
  virtual ~IToolExecutor() = default;

  virtual std::string Kind() const = 0;

  // Called before Execute. Executors with nothing to check return {}.
  virtual ValidationResult ValidateArguments(const nlohmann::json& arguments) const = 0;

  // Failures are reported in the returned text.
  virtual std::string Execute(const nlohmann::json& arguments, const ToolCallContext& ctx) = 0;
};

}  // namespace toolbridge

#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "validation.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

enum class ToolType { Command, McpServer };

// Upper bound for configured timeouts; larger values are clamped.
inline constexpr double kMaxTimeoutSeconds = 86400;

struct CommandToolConfig {
  std::string command_template;
  // Already expanded against the project binding. Empty means the executor default.
  std::string container;
  std::string user = "www-data";
  nlohmann::json default_args = nlohmann::json::object();
  std::vector<std::string> disallowed_commands;
  std::vector<ValidationRule> validation_rules;
  std::string shell = "/bin/bash";
};

struct McpServerToolConfig {
  std::string server_url;
  bool forward_args = true;
  double timeout_seconds = 10;
  std::string auth_username;
  std::string auth_password;
  std::string auth_token;
  bool auth_token_basic = false;
  bool verify_ssl = true;
  bool expose_remote_tools = false;
  std::string tool_prefix;
  double init_timeout_seconds = 30;
  bool keep_proxy_tool = false;
};

struct ToolDefinition {
  std::string name;
  bool enabled = false;
  ToolType type = ToolType::Command;
  std::string description;
  nlohmann::json input_schema;  // null when not configured
  CommandToolConfig command;
  McpServerToolConfig mcp_server;
};

const char* ToolTypeName(ToolType type);

// Field types are checked here; required per-type fields are checked when the
// executor is built. Disabled tools only need a name.
std::optional<ToolDefinition> ParseToolDefinition(const nlohmann::json& j,
                                                  const std::string& project,
                                                  BridgeError* err);

// Parses a {"tools": [...]} document. Bad entries are logged and skipped.
std::vector<ToolDefinition> ParseToolFile(const nlohmann::json& doc,
                                          const std::string& project,
                                          const std::string& source);

// Reads every *.json file of dir in lexical order. Fails only when dir itself is unusable.
bool LoadToolDefinitionsFromDir(const std::string& dir,
                                const std::string& project,
                                std::vector<ToolDefinition>* out,
                                std::string* err);

}  // namespace toolbridge

#include "tool_config.hpp"

#include "log.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace toolbridge {
namespace {

static bool Absent(const nlohmann::json& j, const char* key) {
  return !j.contains(key) || j[key].is_null();
}

static bool ReadString(const nlohmann::json& j, const char* key, std::string* out, BridgeError* err) {
  if (Absent(j, key)) return true;
  if (!j[key].is_string()) {
    SetError(err, ErrorKind::ConfigurationError, std::string("field '") + key + "' must be a string");
    return false;
  }
  *out = j[key].get<std::string>();
  return true;
}

static bool ReadBool(const nlohmann::json& j, const char* key, bool* out, BridgeError* err) {
  if (Absent(j, key)) return true;
  if (!j[key].is_boolean()) {
    SetError(err, ErrorKind::ConfigurationError, std::string("field '") + key + "' must be a boolean");
    return false;
  }
  *out = j[key].get<bool>();
  return true;
}

static bool ReadSeconds(const nlohmann::json& j, const char* key, double* out, BridgeError* err) {
  if (Absent(j, key)) return true;
  if (!j[key].is_number() || j[key].get<double>() <= 0) {
    SetError(err, ErrorKind::ConfigurationError, std::string("field '") + key + "' must be a positive number");
    return false;
  }
  *out = std::min(j[key].get<double>(), kMaxTimeoutSeconds);
  return true;
}

static bool ParseCommandFields(const nlohmann::json& j,
                               const std::string& project,
                               CommandToolConfig* cfg,
                               BridgeError* err) {
  if (!ReadString(j, "command_template", &cfg->command_template, err)) return false;
  if (!ReadString(j, "container", &cfg->container, err)) return false;
  if (!ReadString(j, "user", &cfg->user, err)) return false;
  if (!ReadString(j, "shell", &cfg->shell, err)) return false;
  cfg->container = ExpandProjectPlaceholders(cfg->container, project);
  if (cfg->user.empty()) cfg->user = "www-data";

  if (!Absent(j, "default_args")) {
    if (!j["default_args"].is_object()) {
      SetError(err, ErrorKind::ConfigurationError, "field 'default_args' must be an object");
      return false;
    }
    cfg->default_args = j["default_args"];
  }

  if (!Absent(j, "disallowed_commands")) {
    const auto& list = j["disallowed_commands"];
    if (!list.is_array()) {
      SetError(err, ErrorKind::ConfigurationError, "field 'disallowed_commands' must be a list");
      return false;
    }
    for (const auto& c : list) {
      if (!c.is_string()) {
        SetError(err, ErrorKind::ConfigurationError, "disallowed_commands entries must be strings");
        return false;
      }
      cfg->disallowed_commands.push_back(c.get<std::string>());
    }
  }

  if (!Absent(j, "validation_rules")) {
    const auto& rules = j["validation_rules"];
    if (!rules.is_array()) {
      SetError(err, ErrorKind::ConfigurationError, "field 'validation_rules' must be a list");
      return false;
    }
    for (const auto& r : rules) {
      if (!r.is_object()) continue;
      std::string pattern;
      std::string message;
      if (!ReadString(r, "pattern", &pattern, err)) return false;
      if (!ReadString(r, "message", &message, err)) return false;
      if (pattern.empty()) continue;
      std::string re_err;
      auto rule = CompileValidationRule(pattern, message, &re_err);
      if (!rule) {
        SetError(err, ErrorKind::ConfigurationError, re_err);
        return false;
      }
      cfg->validation_rules.push_back(std::move(*rule));
    }
  }
  return true;
}

static bool ParseMcpServerFields(const nlohmann::json& j, McpServerToolConfig* cfg, BridgeError* err) {
  return ReadString(j, "server_url", &cfg->server_url, err) && ReadBool(j, "forward_args", &cfg->forward_args, err) &&
         ReadSeconds(j, "timeout", &cfg->timeout_seconds, err) &&
         ReadString(j, "auth_username", &cfg->auth_username, err) &&
         ReadString(j, "auth_password", &cfg->auth_password, err) &&
         ReadString(j, "auth_token", &cfg->auth_token, err) &&
         ReadBool(j, "auth_token_basic", &cfg->auth_token_basic, err) &&
         ReadBool(j, "verify_ssl", &cfg->verify_ssl, err) &&
         ReadBool(j, "expose_remote_tools", &cfg->expose_remote_tools, err) &&
         ReadString(j, "tool_prefix", &cfg->tool_prefix, err) &&
         ReadSeconds(j, "init_timeout", &cfg->init_timeout_seconds, err) &&
         ReadBool(j, "keep_proxy_tool", &cfg->keep_proxy_tool, err);
}

}  // namespace

const char* ToolTypeName(ToolType type) {
  switch (type) {
    case ToolType::Command: return "command";
    case ToolType::McpServer: return "mcp_server";
  }
  return "command";
}

std::optional<ToolDefinition> ParseToolDefinition(const nlohmann::json& j,
                                                  const std::string& project,
                                                  BridgeError* err) {
  if (!j.is_object()) {
    SetError(err, ErrorKind::ConfigurationError, "tool entry must be an object");
    return std::nullopt;
  }

  ToolDefinition def;
  if (!ReadString(j, "name", &def.name, err)) return std::nullopt;
  if (def.name.empty()) {
    SetError(err, ErrorKind::ConfigurationError, "tool config missing 'name'");
    return std::nullopt;
  }
  if (!ReadBool(j, "enabled", &def.enabled, err)) return std::nullopt;
  if (!def.enabled) return def;

  std::string type = "command";
  if (!ReadString(j, "type", &type, err)) return std::nullopt;
  if (type == "command") {
    def.type = ToolType::Command;
  } else if (type == "mcp_server" || type == "remote_proxy") {
    def.type = ToolType::McpServer;
  } else {
    SetError(err, ErrorKind::ConfigurationError, "unknown tool type: " + type);
    return std::nullopt;
  }

  if (!ReadString(j, "description", &def.description, err)) return std::nullopt;
  if (!Absent(j, "input_schema")) {
    if (!j["input_schema"].is_object()) {
      SetError(err, ErrorKind::ConfigurationError, "field 'input_schema' must be an object");
      return std::nullopt;
    }
    def.input_schema = j["input_schema"];
  }

  const bool ok = def.type == ToolType::Command ? ParseCommandFields(j, project, &def.command, err)
                                                : ParseMcpServerFields(j, &def.mcp_server, err);
  if (!ok) return std::nullopt;
  return def;
}

std::vector<ToolDefinition> ParseToolFile(const nlohmann::json& doc,
                                          const std::string& project,
                                          const std::string& source) {
  std::vector<ToolDefinition> out;
  if (!doc.is_object() || !doc.contains("tools")) {
    LogError("config", "missing 'tools' array: " + source);
    return out;
  }
  if (!doc["tools"].is_array()) {
    LogError("config", "'tools' must be an array: " + source);
    return out;
  }
  for (const auto& entry : doc["tools"]) {
    BridgeError err;
    auto def = ParseToolDefinition(entry, project, &err);
    if (!def) {
      std::string name = entry.is_object() && entry.contains("name") && entry["name"].is_string()
                             ? entry["name"].get<std::string>()
                             : std::string("<unnamed>");
      LogWarn("config", "skipping tool " + name + " in " + source + ": " + err.message);
      continue;
    }
    out.push_back(std::move(*def));
  }
  return out;
}

bool LoadToolDefinitionsFromDir(const std::string& dir,
                                const std::string& project,
                                std::vector<ToolDefinition>* out,
                                std::string* err) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    if (err) *err = "tools config directory not found: " + dir;
    return false;
  }

  std::vector<std::filesystem::path> files;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code file_ec;
    if (it->is_regular_file(file_ec) && it->path().extension() == ".json") files.push_back(it->path());
  }
  if (ec) {
    if (err) *err = "cannot read tools config directory " + dir + ": " + ec.message();
    return false;
  }
  std::sort(files.begin(), files.end());

  for (const auto& path : files) {
    std::ifstream in(path);
    if (!in) {
      LogError("config", "cannot open " + path.string());
      continue;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    auto doc = nlohmann::json::parse(ss.str(), nullptr, false);
    if (doc.is_discarded()) {
      LogError("config", "json error in " + path.string());
      continue;
    }
    if (doc.is_object() && doc.empty()) {
      LogWarn("config", "empty config file: " + path.string());
      continue;
    }
    auto defs = ParseToolFile(doc, project, path.string());
    for (auto& d : defs) out->push_back(std::move(d));
  }
  return true;
}

}  // namespace toolbridge

#include "executors/command_executor.hpp"

#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <regex>
#include <utility>
#include <vector>

namespace toolbridge {
namespace {

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static bool IsAllDigits(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

static std::string ValueToText(const nlohmann::json& v) {
  if (v.is_string()) return v.get<std::string>();
  return v.dump();
}

static std::string JoinSet(const std::set<std::string>& items, const std::string& sep) {
  std::string out;
  for (const auto& s : items) {
    if (!out.empty()) out += sep;
    out += s;
  }
  return out;
}

}  // namespace

nlohmann::json MergeArguments(const nlohmann::json& defaults, const nlohmann::json& arguments) {
  nlohmann::json merged = defaults.is_object() ? defaults : nlohmann::json::object();
  if (!arguments.is_object()) return merged;
  for (auto it = arguments.begin(); it != arguments.end(); ++it) merged[it.key()] = it.value();
  return merged;
}

nlohmann::json NormalizePaths(const nlohmann::json& value, const PathMapping& paths) {
  if (value.is_string()) {
    const auto& s = value.get_ref<const std::string&>();
    const std::string prefix = paths.host_root + "/";
    if (!paths.host_root.empty() && s.compare(0, prefix.size(), prefix) == 0) {
      return paths.container_root + s.substr(paths.host_root.size());
    }
    return value;
  }
  if (value.is_array()) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& item : value) out.push_back(NormalizePaths(item, paths));
    return out;
  }
  if (value.is_object()) {
    nlohmann::json out = nlohmann::json::object();
    for (auto it = value.begin(); it != value.end(); ++it) out[it.key()] = NormalizePaths(it.value(), paths);
    return out;
  }
  return value;
}

std::optional<std::string> RenderTemplate(const std::string& tmpl, const nlohmann::json& args, BridgeError* err) {
  std::string out;
  out.reserve(tmpl.size());
  for (size_t i = 0; i < tmpl.size(); i++) {
    const char c = tmpl[i];
    if (c == '{') {
      if (i + 1 < tmpl.size() && tmpl[i + 1] == '{') {
        out += '{';
        i++;
        continue;
      }
      const size_t close = tmpl.find('}', i + 1);
      if (close == std::string::npos) {
        SetError(err, ErrorKind::ConfigurationError, "Single '{' encountered in format string");
        return std::nullopt;
      }
      std::string field = tmpl.substr(i + 1, close - i - 1);
      // Format specs and conversions are ignored; only the key matters.
      const size_t spec = field.find_first_of(":!");
      if (spec != std::string::npos) field.resize(spec);
      if (!args.is_object() || !args.contains(field)) {
        SetError(err, ErrorKind::MissingArgument, "Missing required argument '" + field + "'");
        return std::nullopt;
      }
      out += ValueToText(args[field]);
      i = close;
      continue;
    }
    if (c == '}') {
      if (i + 1 < tmpl.size() && tmpl[i + 1] == '}') {
        out += '}';
        i++;
        continue;
      }
      SetError(err, ErrorKind::ConfigurationError, "Single '}' encountered in format string");
      return std::nullopt;
    }
    out += c;
  }
  return out;
}

std::set<std::string> TemplatePlaceholders(const std::string& tmpl) {
  static const std::regex kPlaceholder(R"(\{(\w+)\})");
  std::set<std::string> out;
  for (std::sregex_iterator it(tmpl.begin(), tmpl.end(), kPlaceholder), end; it != end; ++it) {
    out.insert((*it)[1].str());
  }
  return out;
}

std::optional<std::string> ParseUidDirective(const std::string& user) {
  const std::string directive = kUidFromPathDirective;
  if (user.compare(0, directive.size(), directive) != 0) return std::nullopt;
  const std::string rest = user.substr(directive.size());
  if (rest.size() > 1 && rest[0] == ':') return rest.substr(1);
  return std::string(kDefaultUidPath);
}

CommandToolExecutor::CommandToolExecutor(const SandboxExecutor* sandbox, CommandToolConfig config, PathMapping paths)
    : sandbox_(sandbox), config_(std::move(config)), paths_(std::move(paths)) {}

std::optional<std::string> CommandToolExecutor::Container() const {
  if (config_.container.empty()) return std::nullopt;
  return config_.container;
}

std::string CommandToolExecutor::ResolveUser() const {
  auto target = ParseUidDirective(config_.user);
  if (!target) return config_.user;

  try {
    BridgeError err;
    auto res = sandbox_->Execute({"stat", "-c", "%u", *target}, Container(), "root", &err);
    if (!res) {
      LogWarn("user", "failed to get UID for " + *target + ": " + err.message + ". Falling back to " +
                          kDefaultExecUser);
      return kDefaultExecUser;
    }
    const std::string uid = Trim(res->stdout_text);
    if (res->exit_code != 0 || !IsAllDigits(uid)) {
      LogWarn("user", "failed to get UID for " + *target + ": " + Trim(res->stderr_text) + ". Falling back to " +
                          kDefaultExecUser);
      return kDefaultExecUser;
    }
    LogInfo("user", std::string("resolved ") + kUidFromPathDirective + ":" + *target + " to UID " + uid);
    return uid;
  } catch (const std::exception& e) {
    LogError("user", std::string("error resolving ") + kUidFromPathDirective + ": " + e.what());
    return kDefaultExecUser;
  }
}

ValidationResult CommandToolExecutor::ValidateArguments(const nlohmann::json& arguments) const {
  const nlohmann::json args = arguments.is_null() ? nlohmann::json::object() : arguments;
  if (!args.is_object()) return {false, "arguments must be an object"};

  if (auto violation = FindRuleViolation(config_.validation_rules, args.dump())) return {false, *violation};

  std::set<std::string> missing;
  for (const auto& name : TemplatePlaceholders(config_.command_template)) {
    if (config_.default_args.contains(name)) continue;
    if (!args.contains(name)) missing.insert(name);
  }
  if (!missing.empty()) return {false, "Missing: " + JoinSet(missing, ", ")};
  return {};
}

std::string CommandToolExecutor::Execute(const nlohmann::json& arguments, const ToolCallContext& ctx) {
  if (!arguments.is_null() && !arguments.is_object()) return "Error: arguments must be an object";

  const nlohmann::json merged = NormalizePaths(MergeArguments(config_.default_args, arguments), paths_);

  if (merged.contains("command") && merged["command"].is_string()) {
    const auto& command = merged["command"].get_ref<const std::string&>();
    if (std::find(config_.disallowed_commands.begin(), config_.disallowed_commands.end(), command) !=
        config_.disallowed_commands.end()) {
      LogWarn("command", "blocked disallowed command tool=" + ctx.tool_name + " command=" + command);
      return "Error: Command '" + command + "' is not allowed";
    }
  }

  BridgeError err;
  auto rendered = RenderTemplate(config_.command_template, merged, &err);
  if (!rendered) return "Error: " + err.message;

  if (auto violation = FindRuleViolation(config_.validation_rules, *rendered)) {
    return "Validation error: " + *violation;
  }

  const std::string user = ResolveUser();
  auto res = sandbox_->Execute({config_.shell, "-c", *rendered}, Container(), user, &err);
  if (!res) {
    LogWarn("command", "tool=" + ctx.tool_name + " kind=" + ErrorKindName(err.kind) + " error=" + err.message);
    return "Error: " + err.message;
  }

  if (res->exit_code != 0) {
    return "Execution failed (code " + std::to_string(res->exit_code) + ")\nStderr: " + res->stderr_text;
  }
  return Trim(res->stdout_text);
}

}  // namespace toolbridge

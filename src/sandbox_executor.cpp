#include "sandbox_executor.hpp"

#include "log.hpp"

#include <cctype>
#include <string>
#include <string_view>
#include <utility>

namespace toolbridge {
namespace {

constexpr std::string_view kDangerousChars = ";|&><$`\n\r";
constexpr size_t kCheckedPositions = 2;
constexpr size_t kLoggedTokens = 3;

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static std::string JoinHead(const std::vector<std::string>& argv, size_t count) {
  std::string out;
  for (size_t i = 0; i < argv.size() && i < count; i++) {
    if (i > 0) out += ' ';
    out += argv[i];
  }
  return out;
}

}  // namespace

SandboxOptions SandboxOptionsFromConfig(const BridgeConfig& cfg) {
  SandboxOptions opts;
  opts.project = cfg.project;
  opts.container_template = cfg.container_template;
  opts.runtime = cfg.container_runtime;
  opts.site_label = cfg.site_label;
  return opts;
}

bool ValidateCommandVector(const std::vector<std::string>& command, BridgeError* err) {
  if (command.empty()) {
    SetError(err, ErrorKind::InvalidCommand, "Command must be non-empty list");
    return false;
  }
  for (size_t i = 0; i < command.size() && i < kCheckedPositions; i++) {
    if (command[i].find_first_of(kDangerousChars) != std::string::npos) {
      SetError(err, ErrorKind::DangerousCharacter, "Dangerous character in argument " + std::to_string(i));
      return false;
    }
  }
  return true;
}

SandboxExecutor::SandboxExecutor(SandboxOptions options, std::shared_ptr<IProcessRunner> runner)
    : options_(std::move(options)), runner_(std::move(runner)) {}

std::string SandboxExecutor::DefaultContainer() const {
  return ExpandProjectPlaceholders(options_.container_template, options_.project);
}

bool SandboxExecutor::VerifyOwnership(const std::string& container, BridgeError* err) const {
  const std::string format = "{{index .Config.Labels \"" + options_.site_label + "\"}}";
  std::string run_err;
  auto res = runner_->Run({options_.runtime, "inspect", "--format", format, container}, &run_err);
  if (!res) {
    LogWarn("sandbox", "container validation error (continuing) container=" + container + " error=" + run_err);
    return true;
  }
  if (res->exit_code != 0) {
    LogWarn("sandbox", "container '" + container + "' validation failed, proceeding anyway");
    return true;
  }

  const std::string site_name = Trim(res->stdout_text);
  if (options_.project != kDefaultProject && site_name != options_.project) {
    SetError(err, ErrorKind::PermissionDenied,
             "Container '" + container + "' belongs to '" + site_name + "', not '" + options_.project + "'");
    LogWarn("sandbox", "denied container=" + container + " label=" + site_name + " project=" + options_.project);
    return false;
  }
  return true;
}

std::optional<ProcessResult> SandboxExecutor::Execute(const std::vector<std::string>& command,
                                                      const std::optional<std::string>& container,
                                                      const std::string& user,
                                                      BridgeError* err) const {
  const std::string target = container && !container->empty() ? *container : DefaultContainer();

  if (!ValidateCommandVector(command, err)) return std::nullopt;
  if (!VerifyOwnership(target, err)) return std::nullopt;

  std::vector<std::string> full = {options_.runtime, "exec", "-u", user, target};
  full.insert(full.end(), command.begin(), command.end());
  LogInfo("exec", "container=" + target + " user=" + user + " argv=" + JoinHead(command, kLoggedTokens));

  std::string run_err;
  auto res = runner_->Run(full, &run_err);
  if (!res) {
    LogError("exec", "execution error container=" + target + " error=" + run_err);
    SetError(err, ErrorKind::ExecutionError, run_err.empty() ? "execution failed" : run_err);
    return std::nullopt;
  }
  return res;
}

}  // namespace toolbridge

#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "process_runner.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

inline constexpr const char* kDefaultExecUser = "www-data";

struct SandboxOptions {
  std::string project = kDefaultProject;
  std::string container_template = "ddev-{project}-web";
  std::string runtime = "docker";
  std::string site_label = "com.ddev.site-name";
};

SandboxOptions SandboxOptionsFromConfig(const BridgeConfig& cfg);

// Checks the argv shape and the injection rule for the first two positions.
// Index 0 and 1 conventionally hold the interpreter and its flag; from index 2 on
// the elements are opaque script strings passed as single arguments.
bool ValidateCommandVector(const std::vector<std::string>& command, BridgeError* err);

// Runs commands inside a project-owned container via the container runtime CLI.
// The ownership label is re-read on every call.
class SandboxExecutor {
 public:
  SandboxExecutor(SandboxOptions options, std::shared_ptr<IProcessRunner> runner);

  std::optional<ProcessResult> Execute(const std::vector<std::string>& command,
                                       const std::optional<std::string>& container,
                                       const std::string& user,
                                       BridgeError* err) const;

  std::string DefaultContainer() const;
  const std::string& Project() const { return options_.project; }

 private:
  bool VerifyOwnership(const std::string& container, BridgeError* err) const;

  SandboxOptions options_;
  std::shared_ptr<IProcessRunner> runner_;
};

}  // namespace toolbridge

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

struct ProcessResult {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = -1;
};

class IProcessRunner {
 public:
  virtual ~IProcessRunner() = default;

  // Runs argv[0] with the remaining elements as its arguments. No shell is involved.
  // Returns nullopt only when the process could not be started or reaped.
  virtual std::optional<ProcessResult> Run(const std::vector<std::string>& argv, std::string* err) = 0;
};

class PosixProcessRunner : public IProcessRunner {
 public:
  std::optional<ProcessResult> Run(const std::vector<std::string>& argv, std::string* err) override;
};

}  // namespace toolbridge

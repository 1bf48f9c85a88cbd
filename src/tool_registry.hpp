#pragma once

#include "executors/command_executor.hpp"
#include "executors/executor.hpp"
#include "executors/remote_proxy_executor.hpp"
#include "sandbox_executor.hpp"
#include "tool_config.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace toolbridge {

struct ToolDescriptor {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
};

enum class DiscoveryState { Idle, Fetching, Expanded, Failed };

const char* DiscoveryStateName(DiscoveryState state);

// Per-name metadata. Several names may point at the same executor.
struct ToolBinding {
  size_t executor_id = 0;
  ToolDescriptor descriptor;
  std::optional<std::string> remote_tool_name;
  std::string prefix;
};

class ToolRegistry {
 public:
  ToolRegistry(const SandboxExecutor* sandbox, PathMapping paths);
  ToolRegistry(const ToolRegistry&) = delete;
  ToolRegistry& operator=(const ToolRegistry&) = delete;
  // Joins discovery workers that missed their deadline.
  ~ToolRegistry();

  // Returns the number of tool names registered by this call.
  int Load(const std::vector<ToolDefinition>& definitions);

  size_t AddExecutor(std::shared_ptr<IToolExecutor> executor);
  bool Bind(const std::string& name, ToolBinding binding);

  // Total: every failure comes back as text.
  std::string ExecuteTool(const std::string& name, const nlohmann::json& arguments) const;

  std::optional<ToolDescriptor> GetToolDefinition(const std::string& name) const;
  std::vector<ToolDescriptor> ListTools() const;
  bool HasTool(const std::string& name) const;
  size_t ToolCount() const;
  size_t ExecutorCount() const;
  std::optional<std::string> RemoteToolName(const std::string& name) const;
  std::optional<DiscoveryState> GetDiscoveryState(const std::string& proxy_name) const;

 private:
  int LoadSingleTool(const ToolDefinition& def);
  int LoadRemoteTools(const ToolDefinition& def, const std::shared_ptr<RemoteProxyExecutor>& executor);
  std::shared_ptr<IToolExecutor> CreateExecutor(const ToolDefinition& def, std::string* err) const;
  void SetDiscoveryState(const std::string& proxy_name, DiscoveryState state);

  // Runs discovery on an auxiliary thread and waits at most timeout_seconds.
  // A worker that misses the deadline is left running and joined on destruction.
  std::optional<std::vector<McpToolInfo>> FetchRemoteToolsWithDeadline(std::shared_ptr<RemoteProxyExecutor> executor,
                                                                       double timeout_seconds);

  const SandboxExecutor* sandbox_;
  PathMapping paths_;

  mutable std::shared_mutex mu_;
  std::vector<std::shared_ptr<IToolExecutor>> executors_;
  std::unordered_map<std::string, ToolBinding> bindings_;
  std::vector<std::string> order_;
  std::unordered_map<std::string, DiscoveryState> discovery_;

  std::mutex workers_mu_;
  std::vector<std::thread> discovery_workers_;
};

ToolDescriptor MakeDescriptor(const std::string& name, const std::string& description, const nlohmann::json& schema);

}  // namespace toolbridge

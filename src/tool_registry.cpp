#include "tool_registry.hpp"

#include "log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <mutex>
#include <thread>
#include <utility>

namespace toolbridge {
namespace {

constexpr const char* kNoDescription = "Tool with no description";

static nlohmann::json DefaultInputSchema() {
  return {{"type", "object"}, {"properties", nlohmann::json::object()}, {"required", nlohmann::json::array()}};
}

}  // namespace

const char* DiscoveryStateName(DiscoveryState state) {
  switch (state) {
    case DiscoveryState::Idle: return "idle";
    case DiscoveryState::Fetching: return "fetching";
    case DiscoveryState::Expanded: return "expanded";
    case DiscoveryState::Failed: return "failed";
  }
  return "idle";
}

ToolDescriptor MakeDescriptor(const std::string& name, const std::string& description, const nlohmann::json& schema) {
  ToolDescriptor d;
  d.name = name;
  d.description = description.empty() ? kNoDescription : description;
  d.input_schema = schema.is_object() ? schema : DefaultInputSchema();
  return d;
}

ToolRegistry::ToolRegistry(const SandboxExecutor* sandbox, PathMapping paths)
    : sandbox_(sandbox), paths_(std::move(paths)) {}

ToolRegistry::~ToolRegistry() {
  std::lock_guard<std::mutex> lock(workers_mu_);
  for (auto& t : discovery_workers_) {
    if (t.joinable()) t.join();
  }
}

std::optional<std::vector<McpToolInfo>> ToolRegistry::FetchRemoteToolsWithDeadline(
    std::shared_ptr<RemoteProxyExecutor> executor, double timeout_seconds) {
  auto task = std::make_shared<std::packaged_task<std::vector<McpToolInfo>()>>(
      [executor = std::move(executor)]() { return executor->FetchRemoteTools(); });
  auto fut = task->get_future();
  {
    std::lock_guard<std::mutex> lock(workers_mu_);
    discovery_workers_.reserve(discovery_workers_.size() + 1);
    discovery_workers_.emplace_back([task]() { (*task)(); });
  }

  const double bounded = std::min(timeout_seconds, kMaxTimeoutSeconds);
  const auto deadline = std::chrono::milliseconds(static_cast<int64_t>(bounded * 1000.0));
  if (fut.wait_for(deadline) != std::future_status::ready) return std::nullopt;
  return fut.get();
}

int ToolRegistry::Load(const std::vector<ToolDefinition>& definitions) {
  for (const auto& def : definitions) {
    if (def.enabled && def.type == ToolType::McpServer && def.mcp_server.expose_remote_tools) {
      std::unique_lock<std::shared_mutex> lock(mu_);
      discovery_.emplace(def.name, DiscoveryState::Idle);
    }
  }

  int loaded = 0;
  for (const auto& def : definitions) {
    try {
      loaded += LoadSingleTool(def);
    } catch (const std::exception& e) {
      LogError("registry", "error loading tool " + def.name + ": " + e.what());
    }
  }
  LogInfo("registry", "loaded " + std::to_string(loaded) + " tools");
  return loaded;
}

int ToolRegistry::LoadSingleTool(const ToolDefinition& def) {
  if (!def.enabled) {
    LogInfo("registry", "tool disabled: " + def.name);
    return 0;
  }

  std::string err;
  auto executor = CreateExecutor(def, &err);
  if (!executor) {
    LogWarn("registry", "failed to create executor for " + def.name + ": " + err);
    return 0;
  }

  if (def.type == ToolType::McpServer && def.mcp_server.expose_remote_tools) {
    return LoadRemoteTools(def, std::static_pointer_cast<RemoteProxyExecutor>(executor));
  }

  const size_t id = AddExecutor(executor);
  ToolBinding binding;
  binding.executor_id = id;
  binding.descriptor = MakeDescriptor(def.name, def.description, def.input_schema);
  if (!Bind(def.name, std::move(binding))) return 0;
  LogInfo("registry", "loaded tool: " + def.name + " type=" + ToolTypeName(def.type));
  return 1;
}

int ToolRegistry::LoadRemoteTools(const ToolDefinition& def, const std::shared_ptr<RemoteProxyExecutor>& executor) {
  const auto& cfg = def.mcp_server;
  LogInfo("registry", "fetching remote tools for " + def.name + " init_timeout=" +
                          FormatSeconds(cfg.init_timeout_seconds) + "s");
  SetDiscoveryState(def.name, DiscoveryState::Fetching);

  auto remote_tools = FetchRemoteToolsWithDeadline(executor, cfg.init_timeout_seconds);
  if (!remote_tools) {
    LogError("registry", "remote tool discovery for " + def.name + " timed out after " +
                             FormatSeconds(cfg.init_timeout_seconds) + "s");
    remote_tools.emplace();
  } else if (remote_tools->empty()) {
    LogWarn("registry", "no tools fetched from " + def.name);
  }
  SetDiscoveryState(def.name, remote_tools->empty() ? DiscoveryState::Failed : DiscoveryState::Expanded);

  if (remote_tools->empty() && !cfg.keep_proxy_tool) return 0;

  const size_t id = AddExecutor(executor);
  int loaded = 0;
  for (const auto& remote : *remote_tools) {
    const std::string local_name = cfg.tool_prefix + remote.name;
    ToolBinding binding;
    binding.executor_id = id;
    binding.descriptor =
        MakeDescriptor(local_name, remote.description.empty() ? remote.title : remote.description, remote.input_schema);
    binding.remote_tool_name = remote.name;
    binding.prefix = cfg.tool_prefix;
    if (!Bind(local_name, std::move(binding))) continue;
    LogInfo("registry", "loaded remote tool: " + local_name + " (from " + remote.name + ")");
    loaded++;
  }

  if (cfg.keep_proxy_tool) {
    ToolBinding binding;
    binding.executor_id = id;
    binding.descriptor = MakeDescriptor(def.name, def.description, def.input_schema);
    if (Bind(def.name, std::move(binding))) loaded++;
  }

  LogInfo("registry", "loaded " + std::to_string(loaded) + " tools from remote server " + def.name);
  return loaded;
}

std::shared_ptr<IToolExecutor> ToolRegistry::CreateExecutor(const ToolDefinition& def, std::string* err) const {
  switch (def.type) {
    case ToolType::Command: {
      if (def.command.command_template.empty()) {
        if (err) *err = "missing command_template";
        return nullptr;
      }
      if (!sandbox_) {
        if (err) *err = "no sandbox executor configured";
        return nullptr;
      }
      return std::make_shared<CommandToolExecutor>(sandbox_, def.command, paths_);
    }
    case ToolType::McpServer: {
      if (def.mcp_server.server_url.empty()) {
        if (err) *err = "missing server_url";
        return nullptr;
      }
      HttpEndpoint endpoint;
      if (!ParseHttpEndpoint(def.mcp_server.server_url, &endpoint, err)) return nullptr;
      return std::make_shared<RemoteProxyExecutor>(def.mcp_server, std::move(endpoint));
    }
  }
  if (err) *err = "unknown tool type";
  return nullptr;
}

size_t ToolRegistry::AddExecutor(std::shared_ptr<IToolExecutor> executor) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  executors_.push_back(std::move(executor));
  return executors_.size() - 1;
}

bool ToolRegistry::Bind(const std::string& name, ToolBinding binding) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  if (binding.executor_id >= executors_.size()) {
    LogError("registry", "invalid executor id for tool " + name);
    return false;
  }
  if (bindings_.count(name) != 0) {
    LogWarn("registry", "duplicate tool name skipped: " + name);
    return false;
  }
  binding.descriptor.name = name;
  bindings_.emplace(name, std::move(binding));
  order_.push_back(name);
  return true;
}

void ToolRegistry::SetDiscoveryState(const std::string& proxy_name, DiscoveryState state) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  discovery_[proxy_name] = state;
}

std::string ToolRegistry::ExecuteTool(const std::string& name, const nlohmann::json& arguments) const {
  std::shared_ptr<IToolExecutor> executor;
  ToolCallContext ctx;
  {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = bindings_.find(name);
    if (it == bindings_.end()) return "Error: Unknown tool '" + name + "'";
    executor = executors_[it->second.executor_id];
    ctx.tool_name = name;
    ctx.remote_tool_name = it->second.remote_tool_name;
  }

  try {
    auto validation = executor->ValidateArguments(arguments);
    if (!validation.ok) return "Validation error: " + validation.message;
    return executor->Execute(arguments, ctx);
  } catch (const std::exception& e) {
    LogError("registry", "error executing " + name + ": " + e.what());
    return std::string("Error: ") + e.what();
  }
}

std::optional<ToolDescriptor> ToolRegistry::GetToolDefinition(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = bindings_.find(name);
  if (it == bindings_.end()) return std::nullopt;
  return it->second.descriptor;
}

std::vector<ToolDescriptor> ToolRegistry::ListTools() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  std::vector<ToolDescriptor> out;
  out.reserve(order_.size());
  for (const auto& name : order_) out.push_back(bindings_.at(name).descriptor);
  return out;
}

bool ToolRegistry::HasTool(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return bindings_.count(name) != 0;
}

size_t ToolRegistry::ToolCount() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return bindings_.size();
}

size_t ToolRegistry::ExecutorCount() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return executors_.size();
}

std::optional<std::string> ToolRegistry::RemoteToolName(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = bindings_.find(name);
  if (it == bindings_.end()) return std::nullopt;
  return it->second.remote_tool_name;
}

std::optional<DiscoveryState> ToolRegistry::GetDiscoveryState(const std::string& proxy_name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = discovery_.find(proxy_name);
  if (it == discovery_.end()) return std::nullopt;
  return it->second;
}

}  // namespace toolbridge

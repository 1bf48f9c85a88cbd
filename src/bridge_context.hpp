#pragma once

#include "config.hpp"
#include "process_runner.hpp"
#include "sandbox_executor.hpp"
#include "tool_registry.hpp"

#include <memory>
#include <string>

namespace toolbridge {

// Everything the bridge needs at runtime, built once at startup.
struct BridgeContext {
  BridgeConfig config;
  std::shared_ptr<IProcessRunner> runner;
  std::unique_ptr<SandboxExecutor> sandbox;
  std::unique_ptr<ToolRegistry> registry;
};

PathMapping PathMappingFromConfig(const BridgeConfig& cfg);

// Fails only when the tools directory cannot be read. Zero loaded tools is a warning.
std::unique_ptr<BridgeContext> InitializeBridge(const BridgeConfig& config,
                                                std::shared_ptr<IProcessRunner> runner,
                                                std::string* err);

}  // namespace toolbridge

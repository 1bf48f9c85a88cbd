#include "bridge_context.hpp"

#include "log.hpp"
#include "tool_config.hpp"

#include <utility>
#include <vector>

namespace toolbridge {

PathMapping PathMappingFromConfig(const BridgeConfig& cfg) {
  PathMapping paths;
  paths.host_root = cfg.host_project_root;
  paths.container_root = cfg.container_project_root;
  return paths;
}

std::unique_ptr<BridgeContext> InitializeBridge(const BridgeConfig& config,
                                                std::shared_ptr<IProcessRunner> runner,
                                                std::string* err) {
  LogInfo("bridge", "starting project=" + config.project + " tools_dir=" + config.tools_dir);

  std::vector<ToolDefinition> definitions;
  std::string load_err;
  if (!LoadToolDefinitionsFromDir(config.tools_dir, config.project, &definitions, &load_err)) {
    LogError("bridge", "cannot load tool definitions: " + load_err);
    if (err) *err = load_err;
    return nullptr;
  }

  auto ctx = std::make_unique<BridgeContext>();
  ctx->config = config;
  ctx->runner = runner ? std::move(runner) : std::make_shared<PosixProcessRunner>();
  ctx->sandbox = std::make_unique<SandboxExecutor>(SandboxOptionsFromConfig(config), ctx->runner);
  ctx->registry = std::make_unique<ToolRegistry>(ctx->sandbox.get(), PathMappingFromConfig(config));

  const int loaded = ctx->registry->Load(definitions);
  if (loaded == 0) {
    LogWarn("bridge", "no tools loaded from " + config.tools_dir);
  } else {
    LogInfo("bridge", "ready tools=" + std::to_string(loaded) + " container=" + ctx->sandbox->DefaultContainer());
  }
  return ctx;
}

}  // namespace toolbridge

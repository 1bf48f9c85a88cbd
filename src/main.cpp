#include "bridge_context.hpp"
#include "config.hpp"
#include "log.hpp"
#include "stdio_server.hpp"

#include <iostream>
#include <string>

int main() {
  std::ios::sync_with_stdio(false);
  auto cfg = toolbridge::LoadConfigFromEnv();

  std::string err;
  if (!toolbridge::OpenLogFile(cfg.log_file, &err)) {
    std::cerr << "[bridge] " << err << ", logging to stderr\n";
    err.clear();
  }

  auto ctx = toolbridge::InitializeBridge(cfg, nullptr, &err);
  if (!ctx) {
    std::cerr << "[bridge] startup failed: " << err << "\n";
    return 1;
  }

  toolbridge::StdioServer server(ctx->registry.get(), &std::cin, &std::cout);
  server.Run();
  return 0;
}

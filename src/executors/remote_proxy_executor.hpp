#pragma once

#include "executors/executor.hpp"
#include "mcp_client.hpp"
#include "tool_config.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

// Picks the request envelope:
//   known remote tool name  -> tools/call {name, arguments}
//   "method" in arguments   -> JSON-RPC passthrough of method/params
//   otherwise               -> the raw arguments ({} when forwarding is off)
nlohmann::json BuildProxyRequest(const nlohmann::json& arguments,
                                 const std::optional<std::string>& remote_tool_name,
                                 bool forward_args);

// result, then content[0].text, then error, then the whole document.
std::string ExtractResponseText(const nlohmann::json& response);

class RemoteProxyExecutor : public IToolExecutor {
 public:
  // config.server_url must already be validated.
  RemoteProxyExecutor(McpServerToolConfig config, HttpEndpoint endpoint);

  std::string Kind() const override { return "mcp_server"; }
  ValidationResult ValidateArguments(const nlohmann::json& arguments) const override;
  std::string Execute(const nlohmann::json& arguments, const ToolCallContext& ctx) override;

  std::string Proxy(const nlohmann::json& arguments, const std::optional<std::string>& remote_tool_name) const;

  // Empty on any failure.
  std::vector<McpToolInfo> FetchRemoteTools() const;

  const McpServerToolConfig& Config() const { return config_; }

 private:
  McpServerToolConfig config_;
  McpClient client_;
};

}  // namespace toolbridge

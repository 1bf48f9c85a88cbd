#include "executors/remote_proxy_executor.hpp"

#include "log.hpp"

#include <exception>
#include <utility>

namespace toolbridge {
namespace {

static std::string JsonToText(const nlohmann::json& v) {
  if (v.is_string()) return v.get<std::string>();
  return v.dump();
}

}  // namespace

nlohmann::json BuildProxyRequest(const nlohmann::json& arguments,
                                 const std::optional<std::string>& remote_tool_name,
                                 bool forward_args) {
  const nlohmann::json args = arguments.is_null() ? nlohmann::json::object() : arguments;

  if (remote_tool_name && !remote_tool_name->empty()) {
    nlohmann::json params;
    params["name"] = *remote_tool_name;
    params["arguments"] = args;
    return MakeJsonRpcRequest("tools/call", params);
  }

  if (args.is_object() && args.contains("method") && args["method"].is_string() &&
      !args["method"].get_ref<const std::string&>().empty()) {
    nlohmann::json params = args.contains("params") ? args["params"] : nlohmann::json::object();
    return MakeJsonRpcRequest(args["method"].get<std::string>(), params);
  }

  return forward_args ? args : nlohmann::json::object();
}

std::string ExtractResponseText(const nlohmann::json& response) {
  if (!response.is_object()) return JsonToText(response);

  if (response.contains("result")) return JsonToText(response["result"]);

  if (response.contains("content") && response["content"].is_array() && !response["content"].empty()) {
    const auto& first = response["content"][0];
    if (first.is_object() && first.contains("text")) return JsonToText(first["text"]);
    return response.dump();
  }

  if (response.contains("error")) {
    const auto& e = response["error"];
    if (e.is_object() && e.contains("message")) return "RPC Error: " + JsonToText(e["message"]);
    return "RPC Error: " + JsonToText(e);
  }

  return response.dump();
}

RemoteProxyExecutor::RemoteProxyExecutor(McpServerToolConfig config, HttpEndpoint endpoint)
    : config_(std::move(config)), client_(std::move(endpoint), SelectAuth(config_)) {
  client_.SetTimeout(config_.timeout_seconds);
  client_.SetVerifySsl(config_.verify_ssl);
}

ValidationResult RemoteProxyExecutor::ValidateArguments(const nlohmann::json&) const {
  // The remote server validates its own arguments.
  return {};
}

std::string RemoteProxyExecutor::Execute(const nlohmann::json& arguments, const ToolCallContext& ctx) {
  return Proxy(arguments, ctx.remote_tool_name);
}

std::string RemoteProxyExecutor::Proxy(const nlohmann::json& arguments,
                                       const std::optional<std::string>& remote_tool_name) const {
  try {
    const auto payload = BuildProxyRequest(arguments, remote_tool_name, config_.forward_args);
    HttpFailure failure;
    auto body = client_.Post(payload, &failure);
    if (!body) {
      if (failure.timed_out) return "Request timeout after " + FormatSeconds(config_.timeout_seconds) + "s";
      return "HTTP error: " + failure.message;
    }
    auto resp = nlohmann::json::parse(*body, nullptr, false);
    if (resp.is_discarded()) return *body;
    return ExtractResponseText(resp);
  } catch (const std::exception& e) {
    LogError("mcp", "proxy error url=" + config_.server_url + " error=" + e.what());
    return std::string("Error: ") + e.what();
  }
}

std::vector<McpToolInfo> RemoteProxyExecutor::FetchRemoteTools() const {
  try {
    LogInfo("mcp", "fetching remote tools from " + config_.server_url + " timeout=" +
                       FormatSeconds(config_.timeout_seconds) + "s");
    std::string err;
    auto tools = client_.ListTools(&err);
    if (!err.empty()) {
      LogError("mcp", "failed to fetch tools from " + config_.server_url + ": " + err);
      return {};
    }
    LogInfo("mcp", "fetched " + std::to_string(tools.size()) + " tools from " + config_.server_url);
    return tools;
  } catch (const std::exception& e) {
    LogError("mcp", "failed to fetch tools from " + config_.server_url + ": " + e.what());
    return {};
  }
}

}  // namespace toolbridge

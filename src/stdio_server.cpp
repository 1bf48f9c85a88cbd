#include "stdio_server.hpp"

#include "log.hpp"

#include <exception>
#include <istream>
#include <ostream>
#include <system_error>
#include <thread>
#include <utility>

namespace toolbridge {
namespace {

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

static std::string MethodOf(const nlohmann::json& msg) {
  if (!msg.is_object() || !msg.contains("method") || !msg["method"].is_string()) return {};
  return msg["method"].get<std::string>();
}

static bool IsToolsCall(const nlohmann::json& msg) { return MethodOf(msg) == "tools/call"; }

}  // namespace

nlohmann::json MakeRpcResult(const nlohmann::json& id, nlohmann::json result) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

nlohmann::json MakeRpcError(const nlohmann::json& id, int code, const std::string& message) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

StdioServer::StdioServer(const ToolRegistry* registry, std::istream* in, std::ostream* out)
    : registry_(registry), in_(in), out_(out) {}

StdioServer::~StdioServer() { JoinWorkers(); }

void StdioServer::Run() {
  LogInfo("server", "listening on stdio tools=" + std::to_string(registry_->ToolCount()));
  std::string line;
  while (std::getline(*in_, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) continue;
    HandleLine(line);
  }
  JoinWorkers();
  LogInfo("server", "input closed, shutting down");
}

void StdioServer::HandleLine(const std::string& line) {
  auto msg = nlohmann::json::parse(line, nullptr, false);
  if (msg.is_discarded()) {
    LogWarn("server", "unparseable message: " + TruncateForLog(line, 200));
    Write(MakeRpcError(nullptr, kParseError, "Parse error"));
    return;
  }
  if (IsToolsCall(msg)) {
    DispatchCall(std::move(msg));
    return;
  }
  auto reply = HandleMessage(msg);
  if (reply) Write(*reply);
}

void StdioServer::DispatchCall(nlohmann::json msg) {
  ReapFinishedWorkers();
  workers_.reserve(workers_.size() + 1);
  auto done = std::make_shared<std::atomic<bool>>(false);
  auto work = [this, done](nlohmann::json m) {
    std::optional<nlohmann::json> reply;
    try {
      reply = HandleMessage(m);
    } catch (const std::exception& e) {
      LogError("server", std::string("tools/call failed: ") + e.what());
      reply = MakeRpcError(m.value("id", nlohmann::json()), kInternalError, e.what());
    }
    if (reply) Write(*reply);
    done->store(true);
  };
  try {
    workers_.push_back(Worker{std::thread(work, msg), done});
  } catch (const std::system_error& e) {
    // Thread creation failed; serve the call inline.
    LogWarn("server", std::string("worker spawn failed: ") + e.what());
    auto reply = HandleMessage(msg);
    if (reply) Write(*reply);
  }
}

void StdioServer::ReapFinishedWorkers() {
  auto it = workers_.begin();
  while (it != workers_.end()) {
    if (it->done->load()) {
      it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

void StdioServer::JoinWorkers() {
  for (auto& w : workers_) {
    if (w.thread.joinable()) w.thread.join();
  }
  workers_.clear();
}

void StdioServer::Write(const nlohmann::json& msg) {
  std::lock_guard<std::mutex> lock(write_mu_);
  *out_ << msg.dump() << "\n";
  out_->flush();
}

std::optional<nlohmann::json> StdioServer::HandleMessage(const nlohmann::json& msg) const {
  if (!msg.is_object()) return MakeRpcError(nullptr, kInvalidRequest, "Invalid Request");

  const nlohmann::json id = msg.contains("id") ? msg["id"] : nlohmann::json();
  const bool is_notification = !msg.contains("id");
  const std::string method = MethodOf(msg);
  const nlohmann::json params =
      msg.contains("params") && msg["params"].is_object() ? msg["params"] : nlohmann::json::object();

  if (method.rfind("notifications/", 0) == 0) return std::nullopt;
  if (method.empty()) {
    if (is_notification) return std::nullopt;
    return MakeRpcError(id, kInvalidRequest, "Invalid Request");
  }

  if (method == "initialize") {
    nlohmann::json result;
    result["protocolVersion"] = params.contains("protocolVersion") && params["protocolVersion"].is_string()
                                    ? params["protocolVersion"]
                                    : nlohmann::json(kProtocolVersion);
    result["capabilities"] = {{"tools", nlohmann::json::object()}};
    result["serverInfo"] = {{"name", kServerName}, {"version", kServerVersion}};
    LogInfo("server", "initialize protocol=" + result["protocolVersion"].get<std::string>());
    return MakeRpcResult(id, result);
  }
  if (method == "ping") return MakeRpcResult(id, nlohmann::json::object());
  if (method == "tools/list") return MakeRpcResult(id, HandleToolsList());
  if (method == "tools/call") return HandleToolsCall(id, params);

  if (is_notification) return std::nullopt;
  LogWarn("server", "unknown method: " + method);
  return MakeRpcError(id, kMethodNotFound, "Method not found: " + method);
}

nlohmann::json StdioServer::HandleToolsList() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& d : registry_->ListTools()) {
    tools.push_back({{"name", d.name}, {"description", d.description}, {"inputSchema", d.input_schema}});
  }
  return {{"tools", tools}};
}

nlohmann::json StdioServer::HandleToolsCall(const nlohmann::json& id, const nlohmann::json& params) const {
  if (!params.contains("name") || !params["name"].is_string()) {
    return MakeRpcError(id, kInvalidParams, "Missing tool name");
  }
  const std::string name = params["name"].get<std::string>();
  const nlohmann::json arguments =
      params.contains("arguments") && !params["arguments"].is_null() ? params["arguments"] : nlohmann::json::object();

  LogInfo("server", "tools/call name=" + name + " args=" + TruncateForLog(arguments.dump(), 200));
  const std::string text = registry_->ExecuteTool(name, arguments);

  nlohmann::json content = nlohmann::json::array();
  content.push_back({{"type", "text"}, {"text", text}});
  return MakeRpcResult(id, {{"content", content}, {"isError", false}});
}

}  // namespace toolbridge

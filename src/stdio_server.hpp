#pragma once

#include "tool_registry.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace toolbridge {

constexpr const char* kProtocolVersion = "2024-11-05";
constexpr const char* kServerName = "tool-bridge";
constexpr const char* kServerVersion = "0.1.0";

// Newline-delimited JSON-RPC 2.0 over a pair of streams.
class StdioServer {
 public:
  StdioServer(const ToolRegistry* registry, std::istream* in, std::ostream* out);
  StdioServer(const StdioServer&) = delete;
  StdioServer& operator=(const StdioServer&) = delete;
  ~StdioServer();

  // Reads until EOF, then joins in-flight tool calls.
  void Run();

  // Synchronous handling of one message. nullopt means no reply (notifications).
  std::optional<nlohmann::json> HandleMessage(const nlohmann::json& msg) const;

 private:
  void HandleLine(const std::string& line);
  void DispatchCall(nlohmann::json msg);
  void Write(const nlohmann::json& msg);
  void ReapFinishedWorkers();
  void JoinWorkers();

  nlohmann::json HandleToolsList() const;
  nlohmann::json HandleToolsCall(const nlohmann::json& id, const nlohmann::json& params) const;

  const ToolRegistry* registry_;
  std::istream* in_;
  std::ostream* out_;

  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  std::mutex write_mu_;
  // Only touched by the thread that calls Run.
  std::vector<Worker> workers_;
};

nlohmann::json MakeRpcResult(const nlohmann::json& id, nlohmann::json result);
nlohmann::json MakeRpcError(const nlohmann::json& id, int code, const std::string& message);

}  // namespace toolbridge

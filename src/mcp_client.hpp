#pragma once

#include "config.hpp"
#include "tool_config.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace httplib {
class Client;
}

namespace toolbridge {

enum class AuthMode { None, Bearer, TokenBasic, UserPassword };

struct HttpAuth {
  AuthMode mode = AuthMode::None;
  std::string token;
  std::string username;
  std::string password;
};

// Token forms take priority over username/password.
HttpAuth SelectAuth(const McpServerToolConfig& cfg);

using RequestHeaderList = std::vector<std::pair<std::string, std::string>>;

// Header-borne credentials. UserPassword is applied through the client's basic auth instead.
RequestHeaderList BuildAuthHeaders(const HttpAuth& auth);

std::string Base64Encode(const std::string& in);

struct McpToolInfo {
  std::string name;
  std::string title;
  std::string description;
  nlohmann::json input_schema;
};

// Accepts {"tools": [...]}, {"result": {"tools": [...]}} and a bare array.
std::optional<std::vector<McpToolInfo>> ParseToolList(const nlohmann::json& response, std::string* next_cursor);

struct HttpFailure {
  bool timed_out = false;
  std::string message;
};

class McpClient {
 public:
  McpClient(HttpEndpoint endpoint, HttpAuth auth);

  void SetTimeout(double seconds);
  void SetVerifySsl(bool verify);
  double TimeoutSeconds() const { return timeout_seconds_; }

  // POSTs body as JSON. Returns the response body of a 2xx reply.
  std::optional<std::string> Post(const nlohmann::json& body, HttpFailure* failure) const;

  // Sends a JSON-RPC 2.0 request and returns the parsed response document.
  std::optional<nlohmann::json> Rpc(const std::string& method, const nlohmann::json& params, HttpFailure* failure) const;

  std::vector<McpToolInfo> ListTools(std::string* err) const;

 private:
  std::unique_ptr<httplib::Client> MakeClient() const;

  HttpEndpoint endpoint_;
  HttpAuth auth_;
  double timeout_seconds_ = 10;
  bool verify_ssl_ = true;
};

// 10 -> "10", 2.5 -> "2.5".
std::string FormatSeconds(double seconds);

nlohmann::json MakeJsonRpcRequest(const std::string& method, const nlohmann::json& params);

}  // namespace toolbridge

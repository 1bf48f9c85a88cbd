#include "mcp_client.hpp"

#include "log.hpp"

#include <httplib.h>
#include <openssl/evp.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace toolbridge {
namespace {

constexpr int kMaxListPages = 64;
constexpr double kTimeoutSlack = 0.95;

// A read failure only counts as a timeout once the read deadline has passed;
// earlier ones are resets or short replies.
static bool IsTimeoutError(httplib::Error e, double elapsed_seconds, double timeout_seconds) {
  if (e == httplib::Error::ConnectionTimeout) return true;
  return e == httplib::Error::Read && elapsed_seconds >= timeout_seconds * kTimeoutSlack;
}

static std::optional<McpToolInfo> ParseToolEntry(const nlohmann::json& t) {
  if (!t.is_object()) return std::nullopt;
  McpToolInfo info;
  if (t.contains("name") && t["name"].is_string()) info.name = t["name"].get<std::string>();
  if (t.contains("title") && t["title"].is_string()) info.title = t["title"].get<std::string>();
  if (t.contains("description") && t["description"].is_string()) info.description = t["description"].get<std::string>();
  if (t.contains("inputSchema") && t["inputSchema"].is_object()) info.input_schema = t["inputSchema"];
  if (info.name.empty()) return std::nullopt;
  return info;
}

}  // namespace

std::string FormatSeconds(double seconds) {
  const auto whole = static_cast<int64_t>(seconds);
  if (static_cast<double>(whole) == seconds) return std::to_string(whole);
  std::string s = std::to_string(seconds);
  while (!s.empty() && s.back() == '0') s.pop_back();
  return s;
}

HttpAuth SelectAuth(const McpServerToolConfig& cfg) {
  HttpAuth auth;
  if (!cfg.auth_token.empty()) {
    auth.mode = cfg.auth_token_basic ? AuthMode::TokenBasic : AuthMode::Bearer;
    auth.token = cfg.auth_token;
  } else if (!cfg.auth_username.empty() && !cfg.auth_password.empty()) {
    auth.mode = AuthMode::UserPassword;
    auth.username = cfg.auth_username;
    auth.password = cfg.auth_password;
  }
  return auth;
}

RequestHeaderList BuildAuthHeaders(const HttpAuth& auth) {
  switch (auth.mode) {
    case AuthMode::Bearer: return {{"Authorization", "Bearer " + auth.token}};
    case AuthMode::TokenBasic: return {{"Authorization", "Basic " + Base64Encode(auth.token)}};
    case AuthMode::UserPassword:
    case AuthMode::None: break;
  }
  return {};
}

std::string Base64Encode(const std::string& in) {
  std::string out(4 * ((in.size() + 2) / 3) + 1, '\0');
  const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                reinterpret_cast<const unsigned char*>(in.data()), static_cast<int>(in.size()));
  out.resize(n > 0 ? static_cast<size_t>(n) : 0);
  return out;
}

std::optional<std::vector<McpToolInfo>> ParseToolList(const nlohmann::json& response, std::string* next_cursor) {
  const nlohmann::json* tools = nullptr;
  if (response.is_array()) {
    tools = &response;
  } else if (response.is_object()) {
    if (response.contains("tools")) {
      tools = &response["tools"];
    } else if (response.contains("result") && response["result"].is_object()) {
      const auto& result = response["result"];
      if (result.contains("tools")) tools = &result["tools"];
      if (next_cursor && result.contains("nextCursor") && result["nextCursor"].is_string()) {
        *next_cursor = result["nextCursor"].get<std::string>();
      }
    } else if (response.contains("result")) {
      return std::nullopt;
    } else if (response.contains("error")) {
      const auto& e = response["error"];
      std::string msg = e.is_object() && e.contains("message") && e["message"].is_string()
                            ? e["message"].get<std::string>()
                            : e.dump();
      LogWarn("mcp", "tools/list returned error: " + msg);
    }
  } else {
    return std::nullopt;
  }

  std::vector<McpToolInfo> out;
  if (!tools || !tools->is_array()) return out;
  for (const auto& t : *tools) {
    if (auto info = ParseToolEntry(t)) out.push_back(std::move(*info));
  }
  return out;
}

nlohmann::json MakeJsonRpcRequest(const std::string& method, const nlohmann::json& params) {
  nlohmann::json req;
  req["jsonrpc"] = "2.0";
  req["method"] = method;
  req["params"] = params;
  req["id"] = 1;
  return req;
}

McpClient::McpClient(HttpEndpoint endpoint, HttpAuth auth) : endpoint_(std::move(endpoint)), auth_(std::move(auth)) {}

void McpClient::SetTimeout(double seconds) {
  if (seconds > 0) timeout_seconds_ = std::min(seconds, kMaxTimeoutSeconds);
}

void McpClient::SetVerifySsl(bool verify) {
  verify_ssl_ = verify;
}

std::unique_ptr<httplib::Client> McpClient::MakeClient() const {
  auto cli = std::make_unique<httplib::Client>(endpoint_.scheme + "://" + endpoint_.host + ":" +
                                               std::to_string(endpoint_.port));
  const auto timeout = std::chrono::microseconds(static_cast<int64_t>(timeout_seconds_ * 1000000.0));
  cli->set_connection_timeout(timeout);
  cli->set_read_timeout(timeout);
  cli->set_write_timeout(timeout);
  cli->enable_server_certificate_verification(verify_ssl_);

  httplib::Headers headers;
  for (const auto& kv : BuildAuthHeaders(auth_)) headers.emplace(kv.first, kv.second);
  if (!headers.empty()) cli->set_default_headers(std::move(headers));
  if (auth_.mode == AuthMode::UserPassword) cli->set_basic_auth(auth_.username, auth_.password);
  return cli;
}

std::optional<std::string> McpClient::Post(const nlohmann::json& body, HttpFailure* failure) const {
  auto cli = MakeClient();
  if (!cli->is_valid()) {
    if (failure) failure->message = "invalid client for " + EndpointUrl(endpoint_);
    return std::nullopt;
  }

  const std::string path = endpoint_.base_path.empty() ? "/" : endpoint_.base_path;
  const auto start = std::chrono::steady_clock::now();
  auto res = cli->Post(path, body.dump(), "application/json");
  if (!res) {
    if (failure) {
      const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
      failure->timed_out = IsTimeoutError(res.error(), elapsed.count(), timeout_seconds_);
      failure->message = httplib::to_string(res.error()) + " (" + EndpointUrl(endpoint_) + ")";
    }
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    if (failure) failure->message = "status " + std::to_string(res->status) + " from " + EndpointUrl(endpoint_);
    return std::nullopt;
  }
  return res->body;
}

std::optional<nlohmann::json> McpClient::Rpc(const std::string& method,
                                             const nlohmann::json& params,
                                             HttpFailure* failure) const {
  auto body = Post(MakeJsonRpcRequest(method, params), failure);
  if (!body) return std::nullopt;
  auto resp = nlohmann::json::parse(*body, nullptr, false);
  if (resp.is_discarded()) {
    if (failure) failure->message = "invalid json response from " + EndpointUrl(endpoint_);
    return std::nullopt;
  }
  return resp;
}

std::vector<McpToolInfo> McpClient::ListTools(std::string* err) const {
  std::vector<McpToolInfo> out;
  std::string cursor;
  for (int page = 0; page < kMaxListPages; page++) {
    nlohmann::json params = nlohmann::json::object();
    if (!cursor.empty()) params["cursor"] = cursor;

    HttpFailure failure;
    auto r = Rpc("tools/list", params, &failure);
    if (!r) {
      if (err) {
        *err = failure.timed_out ? "timeout after " + FormatSeconds(timeout_seconds_) + "s: " + failure.message
                                 : failure.message;
      }
      return {};
    }

    std::string next;
    auto tools = ParseToolList(*r, &next);
    if (!tools) {
      if (err) *err = "unexpected response format from " + EndpointUrl(endpoint_);
      return {};
    }
    for (auto& t : *tools) out.push_back(std::move(t));
    if (next.empty()) break;
    cursor = next;
  }
  return out;
}

}  // namespace toolbridge

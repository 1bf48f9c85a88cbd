#include "config.hpp"

#include <cstdlib>
#include <string>
#include <utility>

namespace toolbridge {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static void ReplaceAll(std::string* s, const std::string& from, const std::string& to) {
  if (from.empty()) return;
  size_t pos = 0;
  while ((pos = s->find(from, pos)) != std::string::npos) {
    s->replace(pos, from.size(), to);
    pos += to.size();
  }
}

static std::string TrimTrailingSlash(std::string s) {
  while (s.size() > 1 && s.back() == '/') s.pop_back();
  return s;
}

}  // namespace

BridgeConfig LoadConfigFromEnv() {
  BridgeConfig cfg;

  if (auto p = GetEnvStr("DDEV_PROJECT"); !p.empty()) cfg.project = p;
  if (auto root = GetEnvStr("HOST_PROJECT_ROOT"); !root.empty()) cfg.host_project_root = TrimTrailingSlash(root);
  if (auto root = GetEnvStr("CONTAINER_PROJECT_ROOT"); !root.empty()) {
    cfg.container_project_root = TrimTrailingSlash(root);
  }
  if (auto dir = GetEnvStr("BRIDGE_TOOLS_DIR"); !dir.empty()) cfg.tools_dir = dir;
  if (auto log = GetEnvStr("BRIDGE_LOG_FILE"); !log.empty()) cfg.log_file = log;
  if (auto tmpl = GetEnvStr("BRIDGE_CONTAINER_TEMPLATE"); !tmpl.empty()) cfg.container_template = tmpl;
  if (auto rt = GetEnvStr("BRIDGE_CONTAINER_RUNTIME"); !rt.empty()) cfg.container_runtime = rt;
  if (auto label = GetEnvStr("BRIDGE_SITE_LABEL"); !label.empty()) cfg.site_label = label;

  return cfg;
}

bool ParseHttpEndpoint(const std::string& url, HttpEndpoint* out, std::string* err) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  int default_port = 80;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    default_port = 443;
    s = s.substr(8);
  } else {
    if (err) *err = "unsupported url scheme: " + url;
    return false;
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else {
    ep.host = s;
  }
  if (ep.host.empty()) {
    if (err) *err = "missing host in url: " + url;
    return false;
  }
  if (ep.port <= 0) ep.port = default_port;
  if (out) *out = std::move(ep);
  return true;
}

std::string EndpointUrl(const HttpEndpoint& ep) {
  return ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port) + ep.base_path;
}

std::string ExpandProjectPlaceholders(const std::string& s, const std::string& project) {
  std::string out = s;
  ReplaceAll(&out, "{project}", project);
  ReplaceAll(&out, "{DDEV_PROJECT}", project);
  return out;
}

}  // namespace toolbridge

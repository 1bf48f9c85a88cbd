#pragma once

#include <string>

namespace toolbridge {

inline constexpr const char* kDefaultProject = "default-project";

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 80;
  std::string base_path;
};

struct BridgeConfig {
  std::string project = kDefaultProject;
  std::string host_project_root = "/workspace";
  std::string container_project_root = "/var/www/html";
  std::string tools_dir = ".agents/tools-config";
  std::string log_file = "/tmp/tool-bridge.log";
  std::string container_template = "ddev-{project}-web";
  std::string container_runtime = "docker";
  std::string site_label = "com.ddev.site-name";
};

BridgeConfig LoadConfigFromEnv();

// Accepts http:// and https:// URLs only.
bool ParseHttpEndpoint(const std::string& url, HttpEndpoint* out, std::string* err);
std::string EndpointUrl(const HttpEndpoint& ep);

// Replaces {project} and {DDEV_PROJECT} with the bound project name.
std::string ExpandProjectPlaceholders(const std::string& s, const std::string& project);

}  // namespace toolbridge

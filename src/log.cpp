#include "log.hpp"

#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <utility>

namespace toolbridge {
namespace {

std::mutex g_log_mu;
std::unique_ptr<std::ofstream> g_log_file;
std::ostream* g_log_out = nullptr;

static const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO";
}

static std::string Timestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

}  // namespace

bool OpenLogFile(const std::string& path, std::string* err) {
  std::lock_guard<std::mutex> lock(g_log_mu);
  if (path.empty() || path == "-") {
    g_log_file.reset();
    g_log_out = &std::cerr;
    return true;
  }
  auto f = std::make_unique<std::ofstream>(path, std::ios::app);
  if (!f->is_open()) {
    if (err) *err = "cannot open log file: " + path;
    return false;
  }
  g_log_file = std::move(f);
  g_log_out = g_log_file.get();
  return true;
}

void SetLogStream(std::ostream* out) {
  std::lock_guard<std::mutex> lock(g_log_mu);
  g_log_file.reset();
  g_log_out = out;
}

void Log(LogLevel level, const std::string& tag, const std::string& message) {
  std::lock_guard<std::mutex> lock(g_log_mu);
  std::ostream& out = g_log_out ? *g_log_out : std::cerr;
  out << Timestamp() << " " << LevelName(level) << " [" << tag << "] " << message << "\n";
  out.flush();
}

std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

}  // namespace toolbridge

#pragma once

#include <cstddef>
#include <ostream>
#include <string>

namespace toolbridge {

enum class LogLevel { Info, Warn, Error };

// stdout carries the protocol, so log lines go to a separate sink.
// Defaults to std::cerr until a file is opened.
bool OpenLogFile(const std::string& path, std::string* err);
void SetLogStream(std::ostream* out);

void Log(LogLevel level, const std::string& tag, const std::string& message);

inline void LogInfo(const std::string& tag, const std::string& message) {
  Log(LogLevel::Info, tag, message);
}
inline void LogWarn(const std::string& tag, const std::string& message) {
  Log(LogLevel::Warn, tag, message);
}
inline void LogError(const std::string& tag, const std::string& message) {
  Log(LogLevel::Error, tag, message);
}

std::string TruncateForLog(std::string s, size_t max_chars);

}  // namespace toolbridge

#pragma once

#include <string>
#include <utility>

namespace toolbridge {

enum class ErrorKind {
  InvalidCommand,
  DangerousCharacter,
  PermissionDenied,
  MissingArgument,
  ValidationFailed,
  DisallowedCommand,
  ExecutionError,
  TransportError,
  ConfigurationError,
};

struct BridgeError {
  ErrorKind kind = ErrorKind::ExecutionError;
  std::string message;
};

inline const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidCommand: return "invalid_command";
    case ErrorKind::DangerousCharacter: return "dangerous_character";
    case ErrorKind::PermissionDenied: return "permission_denied";
    case ErrorKind::MissingArgument: return "missing_argument";
    case ErrorKind::ValidationFailed: return "validation_failed";
    case ErrorKind::DisallowedCommand: return "disallowed_command";
    case ErrorKind::ExecutionError: return "execution_error";
    case ErrorKind::TransportError: return "transport_error";
    case ErrorKind::ConfigurationError: return "configuration_error";
  }
  return "unknown";
}

inline void SetError(BridgeError* err, ErrorKind kind, std::string message) {
  if (!err) return;
  err->kind = kind;
  err->message = std::move(message);
}

}  // namespace toolbridge

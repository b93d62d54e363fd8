#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace ranops::core::errors {

// Failure taxonomy shared by every orchestration layer. Everything except
// kPreflightFailure is caught at the phase boundary and turned into a failed
// trial attempt.
enum class ErrorKind {
  kNone,
  kResourceBusy,
  kTimeout,
  kStartFailure,
  kValidationFailure,
  kPreflightFailure,
  kCancelled,
};

inline const char* ToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return "none";
  case ErrorKind::kResourceBusy:
    return "resource_busy";
  case ErrorKind::kTimeout:
    return "timeout";
  case ErrorKind::kStartFailure:
    return "start_failure";
  case ErrorKind::kValidationFailure:
    return "validation_failure";
  case ErrorKind::kPreflightFailure:
    return "preflight_failure";
  case ErrorKind::kCancelled:
    return "cancelled";
  }
  return "none";
}

struct OrchestrationError {
  ErrorKind kind = ErrorKind::kNone;
  std::string message;
  // Optional multi-line context, e.g. the tail of a log that never showed its
  // readiness marker.
  std::string diagnostics;

  bool ok() const {
    return kind == ErrorKind::kNone;
  }

  void Clear() {
    kind = ErrorKind::kNone;
    message.clear();
    diagnostics.clear();
  }

  // `kind: message`, the form used in log fields and the final summary.
  std::string Describe() const {
    if (ok()) {
      return "ok";
    }
    return std::string(ToString(kind)) + ": " + message;
  }
};

inline OrchestrationError MakeError(ErrorKind kind, std::string message,
                                    std::string diagnostics = {}) {
  OrchestrationError error;
  error.kind = kind;
  error.message = std::move(message);
  error.diagnostics = std::move(diagnostics);
  return error;
}

} // namespace ranops::core::errors

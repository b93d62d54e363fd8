#pragma once

#include "orchestration/cancellation_token.hpp"

#include <atomic>
#include <functional>
#include <string>

#include <signal.h>

namespace ranops::core::logging {
class Logger;
}

namespace ranops::orchestration {

// How a guarded run ended. Cleanup receives it so its log line says why it ran.
enum class ExitRoute {
  kCompleted,
  kFailed,
  kInterrupted,
};

const char* ToString(ExitRoute route);

// Wraps the top-level run loop so every exit path (normal completion,
// failure, SIGINT/SIGTERM, external termination request) funnels through one
// cleanup callback, invoked exactly once.
//
// Signals only flip an atomic flag bound to the run's CancellationToken; the
// blocking wait in progress observes it, unwinds, and the scoped finalizer in
// `Run` performs cleanup on the control thread.
class CancellationHandler {
public:
  using Body = std::function<int()>;
  using Cleanup = std::function<void(ExitRoute)>;

  CancellationHandler(CancellationToken& token, core::logging::Logger& logger);
  ~CancellationHandler();

  CancellationHandler(const CancellationHandler&) = delete;
  CancellationHandler& operator=(const CancellationHandler&) = delete;

  // Installs SIGINT/SIGTERM handlers. Previous dispositions are restored on
  // destruction.
  bool Install(std::string& error);

  // External termination request from another thread or component.
  void RequestTermination(const std::string& reason);

  // Signal number received since construction, or 0.
  int ReceivedSignal() const;

  // Runs `body` and then `cleanup` exactly once, also when `body` exits by
  // exception. Returns the body's exit code, 130 when the run was cancelled,
  // or 1 when `body` threw a std::exception (logged, cleanup on the failed
  // route).
  int Run(const Body& body, const Cleanup& cleanup);

private:
  CancellationToken& token_;
  core::logging::Logger& logger_;
  bool installed_ = false;
  struct sigaction previous_int_{};
  struct sigaction previous_term_{};
};

// Test hook: clears the process-wide pending-signal flag between runs.
void ResetPendingSignalForTesting();

} // namespace ranops::orchestration

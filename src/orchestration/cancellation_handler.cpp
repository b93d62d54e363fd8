#include "orchestration/cancellation_handler.hpp"

#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"

#include <cerrno>
#include <cstring>
#include <exception>

namespace ranops::orchestration {

namespace {

// Written from the signal handler; lock-free atomic<int> stores are
// async-signal-safe.
std::atomic<int> g_pending_signal{0};

extern "C" void HandleTerminationSignal(int signal_number) {
  g_pending_signal.store(signal_number);
}

// Runs the wrapped callable once when the scope unwinds, whatever the route.
class ScopedFinalizer {
public:
  explicit ScopedFinalizer(std::function<void()> finalizer) : finalizer_(std::move(finalizer)) {}

  ~ScopedFinalizer() {
    if (finalizer_) {
      finalizer_();
    }
  }

  ScopedFinalizer(const ScopedFinalizer&) = delete;
  ScopedFinalizer& operator=(const ScopedFinalizer&) = delete;

private:
  std::function<void()> finalizer_;
};

} // namespace

const char* ToString(const ExitRoute route) {
  switch (route) {
  case ExitRoute::kCompleted:
    return "completed";
  case ExitRoute::kFailed:
    return "failed";
  case ExitRoute::kInterrupted:
    return "interrupted";
  }
  return "failed";
}

void ResetPendingSignalForTesting() {
  g_pending_signal.store(0);
}

CancellationHandler::CancellationHandler(CancellationToken& token, core::logging::Logger& logger)
    : token_(token), logger_(logger) {
  token_.BindSignalFlag(&g_pending_signal);
}

CancellationHandler::~CancellationHandler() {
  if (installed_) {
    (void)sigaction(SIGINT, &previous_int_, nullptr);
    (void)sigaction(SIGTERM, &previous_term_, nullptr);
  }
  token_.BindSignalFlag(nullptr);
}

bool CancellationHandler::Install(std::string& error) {
  struct sigaction action {};
  action.sa_handler = HandleTerminationSignal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;

  if (sigaction(SIGINT, &action, &previous_int_) == -1) {
    error = std::string("failed to install SIGINT handler: ") + std::strerror(errno);
    return false;
  }
  if (sigaction(SIGTERM, &action, &previous_term_) == -1) {
    error = std::string("failed to install SIGTERM handler: ") + std::strerror(errno);
    (void)sigaction(SIGINT, &previous_int_, nullptr);
    return false;
  }
  installed_ = true;
  return true;
}

void CancellationHandler::RequestTermination(const std::string& reason) {
  logger_.Warn("termination requested", {{"reason", reason}});
  token_.Cancel(reason);
}

int CancellationHandler::ReceivedSignal() const {
  return g_pending_signal.load();
}

int CancellationHandler::Run(const Body& body, const Cleanup& cleanup) {
  ExitRoute route = ExitRoute::kFailed;
  ScopedFinalizer finalizer([&]() {
    if (token_.IsCancelled()) {
      route = ExitRoute::kInterrupted;
    }
    logger_.Info("running exit cleanup", {{"route", ToString(route)}});
    if (cleanup) {
      cleanup(route);
    }
  });

  int exit_code = core::errors::ToInt(core::errors::ExitCode::kFailure);
  try {
    exit_code = body();
  } catch (const std::exception& ex) {
    logger_.Error("run aborted by exception", {{"error", ex.what()}});
    route = ExitRoute::kFailed;
    return core::errors::ToInt(core::errors::ExitCode::kFailure);
  }
  if (token_.IsCancelled()) {
    route = ExitRoute::kInterrupted;
    const int signal_number = ReceivedSignal();
    logger_.Warn("run cancelled",
                 {{"signal", std::to_string(signal_number)}, {"reason", token_.Reason()}});
    return core::errors::ToInt(core::errors::ExitCode::kInterrupted);
  }
  route = exit_code == 0 ? ExitRoute::kCompleted : ExitRoute::kFailed;
  return exit_code;
}

} // namespace ranops::orchestration

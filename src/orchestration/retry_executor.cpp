#include "orchestration/retry_executor.hpp"

#include "core/logging/logger.hpp"

#include <string>

namespace ranops::orchestration {

using core::errors::ErrorKind;
using core::errors::MakeError;

RetryOutcome RetryExecutor::Execute(const std::string_view name, const RetryPolicy& policy,
                                    const RetryOperation& operation,
                                    const BetweenAttemptsHook& between_attempts) const {
  RetryOutcome outcome;
  const std::string label(name);
  const std::string max_attempts = std::to_string(policy.max_attempts);

  if (policy.max_attempts == 0U) {
    outcome.last_error = MakeError(ErrorKind::kStartFailure, label + ": retry budget is zero");
    return outcome;
  }

  std::chrono::milliseconds delay = policy.initial_delay;
  for (std::uint32_t attempt = 1; attempt <= policy.max_attempts; ++attempt) {
    if (token_.IsCancelled()) {
      outcome.last_error =
          MakeError(ErrorKind::kCancelled, label + " cancelled before attempt " +
                                               std::to_string(attempt));
      return outcome;
    }

    outcome.attempts = attempt;
    logger_.Info("attempting step",
                 {{"step", label},
                  {"attempt", std::to_string(attempt)},
                  {"max_attempts", max_attempts}});

    core::errors::OrchestrationError error;
    if (operation(attempt, error)) {
      logger_.Info("step succeeded", {{"step", label}, {"attempt", std::to_string(attempt)}});
      outcome.succeeded = true;
      outcome.last_error.Clear();
      return outcome;
    }
    if (error.ok()) {
      error = MakeError(ErrorKind::kStartFailure, label + " failed without a reason");
    }
    outcome.last_error = error;

    if (error.kind == ErrorKind::kCancelled || token_.IsCancelled()) {
      logger_.Warn("step cancelled", {{"step", label}, {"attempt", std::to_string(attempt)}});
      if (error.kind != ErrorKind::kCancelled) {
        outcome.last_error = MakeError(ErrorKind::kCancelled, label + " cancelled");
      }
      return outcome;
    }

    if (attempt == policy.max_attempts) {
      logger_.Error("step failed after all attempts",
                    {{"step", label}, {"attempts", max_attempts}, {"error", error.Describe()}});
      break;
    }

    logger_.Warn("step failed, will retry",
                 {{"step", label},
                  {"attempt", std::to_string(attempt)},
                  {"error", error.Describe()},
                  {"retry_in_ms", std::to_string(delay.count())}});
    if (between_attempts) {
      between_attempts(attempt, error);
    }

    outcome.delays.push_back(delay);
    if (!token_.SleepFor(delay)) {
      outcome.last_error = MakeError(ErrorKind::kCancelled, label + " cancelled during backoff");
      return outcome;
    }
    if (policy.backoff == BackoffMode::kExponential) {
      delay *= 2;
    }
  }

  return outcome;
}

} // namespace ranops::orchestration

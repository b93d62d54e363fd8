#include "trial/trial_controller.hpp"

#include "orchestration/retry_executor.hpp"
#include "trial/phase_runner.hpp"

namespace ranops::trial {

using core::errors::ErrorKind;
using core::errors::MakeError;
using core::errors::OrchestrationError;

const char* ToString(const AttemptOutcome outcome) {
  switch (outcome) {
  case AttemptOutcome::kSucceeded:
    return "success";
  case AttemptOutcome::kFailedPhase:
    return "failed-phase";
  case AttemptOutcome::kTimedOut:
    return "timed-out";
  case AttemptOutcome::kCancelled:
    return "cancelled";
  }
  return "failed-phase";
}

const char* ToString(const TrialStatus status) {
  switch (status) {
  case TrialStatus::kSucceeded:
    return "succeeded";
  case TrialStatus::kPermanentlyFailed:
    return "permanently_failed";
  case TrialStatus::kCancelled:
    return "cancelled";
  }
  return "permanently_failed";
}

TrialResult TrialController::Run(const TrialId& id, const TrialStepCallback& on_step) {
  TrialResult result;
  const TrialLayout layout(env_.config, id);
  const std::string label = id.Label();
  const std::uint32_t max_attempts = env_.config.max_trial_retries + 1U;

  const auto run_attempt = [&](const std::uint32_t attempt, OrchestrationError& error) {
    TrialAttempt record;
    record.number = attempt;
    record.started_at = std::chrono::system_clock::now();
    const std::uint32_t retry_count = attempt - 1U;
    env_.logger.Info("trial attempt started", {{"attempt", std::to_string(attempt)},
                                               {"max_attempts", std::to_string(max_attempts)},
                                               {"dir", layout.Directory().string()}});
    if (on_step) {
      on_step(id, "starting", retry_count);
    }

    bool ok = false;
    std::string setup_error;
    if (!layout.CheckInputs(setup_error) || !layout.PrepareDirectories(setup_error)) {
      error = MakeError(ErrorKind::kStartFailure, setup_error);
    } else {
      PhaseRunner runner(env_, layout);
      std::optional<Phase> failed_phase;
      ok = runner.RunAll(
          [&](const Phase phase) {
            record.reached = phase;
            if (on_step) {
              on_step(id, ToString(phase), retry_count);
            }
          },
          failed_phase, error);
      if (!ok && failed_phase.has_value()) {
        env_.logger.Error("trial attempt failed",
                          {{"attempt", std::to_string(attempt)},
                           {"failed_phase", ToString(*failed_phase)},
                           {"error", error.Describe()}});
      }
    }
    if (!ok && !record.reached.has_value()) {
      env_.logger.Error("trial attempt failed before first phase",
                        {{"attempt", std::to_string(attempt)}, {"error", error.Describe()}});
    }

    record.finished_at = std::chrono::system_clock::now();
    if (ok) {
      record.outcome = AttemptOutcome::kSucceeded;
    } else if (error.kind == ErrorKind::kCancelled) {
      record.outcome = AttemptOutcome::kCancelled;
    } else if (error.kind == ErrorKind::kTimeout) {
      record.outcome = AttemptOutcome::kTimedOut;
    } else {
      record.outcome = AttemptOutcome::kFailedPhase;
    }
    record.error = error;
    result.history.push_back(record);
    return ok;
  };

  orchestration::RetryPolicy policy;
  policy.max_attempts = max_attempts;
  policy.initial_delay = env_.config.trial_retry_delay;
  policy.backoff = orchestration::BackoffMode::kFixed;

  const orchestration::RetryExecutor retry(env_.token, env_.logger);
  const auto outcome = retry.Execute(
      "trial " + label, policy, run_attempt,
      [this, &layout](std::uint32_t failed_attempt, const OrchestrationError&) {
        cleanup_.Run(layout, "retry after attempt " + std::to_string(failed_attempt));
      });

  result.attempts = outcome.attempts;
  result.last_error = outcome.last_error;
  if (outcome.succeeded) {
    result.status = TrialStatus::kSucceeded;
  } else if (outcome.last_error.kind == ErrorKind::kCancelled) {
    result.status = TrialStatus::kCancelled;
  } else {
    result.status = TrialStatus::kPermanentlyFailed;
  }
  env_.logger.Info("trial finished", {{"status", ToString(result.status)},
                                      {"attempts", std::to_string(result.attempts)}});
  return result;
}

} // namespace ranops::trial

#pragma once

#include "core/errors/orchestration_error.hpp"
#include "trial/cleanup.hpp"
#include "trial/phase.hpp"
#include "trial/trial_environment.hpp"
#include "trial/trial_layout.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace ranops::trial {

enum class AttemptOutcome {
  kSucceeded,
  kFailedPhase,
  kTimedOut,
  kCancelled,
};

const char* ToString(AttemptOutcome outcome);

struct TrialAttempt {
  std::uint32_t number = 0;
  std::chrono::system_clock::time_point started_at{};
  std::chrono::system_clock::time_point finished_at{};
  // Last phase entered; empty when the attempt failed before the first phase.
  std::optional<Phase> reached;
  AttemptOutcome outcome = AttemptOutcome::kFailedPhase;
  core::errors::OrchestrationError error;
};

enum class TrialStatus {
  kSucceeded,
  kPermanentlyFailed,
  kCancelled,
};

const char* ToString(TrialStatus status);

struct TrialResult {
  TrialStatus status = TrialStatus::kPermanentlyFailed;
  std::uint32_t attempts = 0;
  std::vector<TrialAttempt> history;
  core::errors::OrchestrationError last_error;
};

// Progress callback: `step` is a phase name or "starting"; `retry_count` is
// the number of failed attempts so far.
using TrialStepCallback =
    std::function<void(const TrialId& id, std::string_view step, std::uint32_t retry_count)>;

// Runs one trial under trial-level retry: max_trial_retries + 1 attempts with
// a fixed delay, the cleanup protocol between attempts.
class TrialController {
public:
  TrialController(const TrialEnvironment& env, CleanupProtocol& cleanup)
      : env_(env), cleanup_(cleanup) {}

  TrialResult Run(const TrialId& id, const TrialStepCallback& on_step = {});

private:
  const TrialEnvironment& env_;
  CleanupProtocol& cleanup_;
};

} // namespace ranops::trial

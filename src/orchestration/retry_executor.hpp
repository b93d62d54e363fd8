#pragma once

#include "core/errors/orchestration_error.hpp"
#include "orchestration/cancellation_token.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>
#include <vector>

namespace ranops::core::logging {
class Logger;
}

namespace ranops::orchestration {

enum class BackoffMode {
  // Delay doubles after every failed attempt. Growth is unbounded; the
  // attempt budget bounds total time.
  kExponential,
  // Same delay before every retry (trial-level retries).
  kFixed,
};

struct RetryPolicy {
  std::uint32_t max_attempts = 3U;
  std::chrono::milliseconds initial_delay{10'000};
  BackoffMode backoff = BackoffMode::kExponential;
};

struct RetryOutcome {
  bool succeeded = false;
  std::uint32_t attempts = 0;
  core::errors::OrchestrationError last_error;
  // Backoff delays actually requested, one per retry.
  std::vector<std::chrono::milliseconds> delays;
};

// One attempt of the wrapped operation. `attempt` is 1-based. Must be safe to
// re-invoke after a failed attempt; callers that hold host state discharge
// that with the between-attempts hook.
using RetryOperation =
    std::function<bool(std::uint32_t attempt, core::errors::OrchestrationError& error)>;

// Runs after a failed attempt that will be retried, before the backoff sleep.
using BetweenAttemptsHook =
    std::function<void(std::uint32_t failed_attempt, const core::errors::OrchestrationError&)>;

// Bounded retry with backoff, reused per phase (start control plane: 3
// attempts from 10s) and per trial (whole phase sequence, fixed delay).
// Backoff sleeps are cancellable; cancellation ends the loop with kCancelled.
class RetryExecutor {
public:
  RetryExecutor(const CancellationToken& token, core::logging::Logger& logger)
      : token_(token), logger_(logger) {}

  RetryOutcome Execute(std::string_view name, const RetryPolicy& policy,
                       const RetryOperation& operation,
                       const BetweenAttemptsHook& between_attempts = {}) const;

private:
  const CancellationToken& token_;
  core::logging::Logger& logger_;
};

} // namespace ranops::orchestration

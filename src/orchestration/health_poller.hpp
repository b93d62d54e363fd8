#pragma once

#include "orchestration/cancellation_token.hpp"

#include <chrono>
#include <cstdint>
#include <functional>

namespace ranops::orchestration {

// Side-effect-free readiness check: a log marker seen, a container reporting
// healthy, a PID file naming a live process.
using ReadinessPredicate = std::function<bool()>;

enum class PollStatus {
  kReady,
  kTimeout,
  kCancelled,
};

const char* ToString(PollStatus status);

struct PollResult {
  PollStatus status = PollStatus::kTimeout;
  std::uint32_t evaluations = 0;
  std::chrono::milliseconds elapsed{0};
};

// Bounded-time polling primitive. Evaluates the predicate immediately, then
// every `interval` until it holds or `timeout` has elapsed. Retry policy is
// deliberately absent; callers compose HealthPoller with RetryExecutor.
//
// Timing contract: with an always-false predicate the call returns kTimeout
// no later than `timeout + interval` (plus predicate cost), because the last
// sleep is clipped to the remaining budget.
class HealthPoller {
public:
  explicit HealthPoller(const CancellationToken& token) : token_(token) {}

  PollResult Poll(const ReadinessPredicate& predicate, std::chrono::milliseconds interval,
                  std::chrono::milliseconds timeout) const;

private:
  const CancellationToken& token_;
};

} // namespace ranops::orchestration

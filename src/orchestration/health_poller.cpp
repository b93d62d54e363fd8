#include "orchestration/health_poller.hpp"

#include <algorithm>

namespace ranops::orchestration {

const char* ToString(const PollStatus status) {
  switch (status) {
  case PollStatus::kReady:
    return "ready";
  case PollStatus::kTimeout:
    return "timeout";
  case PollStatus::kCancelled:
    return "cancelled";
  }
  return "timeout";
}

PollResult HealthPoller::Poll(const ReadinessPredicate& predicate,
                              const std::chrono::milliseconds interval,
                              const std::chrono::milliseconds timeout) const {
  PollResult result;
  const auto started = std::chrono::steady_clock::now();
  const auto elapsed = [&started]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
  };
  const std::chrono::milliseconds step = std::max(interval, std::chrono::milliseconds(1));

  while (true) {
    if (token_.IsCancelled()) {
      result.status = PollStatus::kCancelled;
      break;
    }

    ++result.evaluations;
    if (predicate()) {
      result.status = PollStatus::kReady;
      break;
    }

    const std::chrono::milliseconds spent = elapsed();
    if (spent >= timeout) {
      result.status = PollStatus::kTimeout;
      break;
    }

    if (!token_.SleepFor(std::min(step, timeout - spent))) {
      result.status = PollStatus::kCancelled;
      break;
    }
  }

  result.elapsed = elapsed();
  return result;
}

} // namespace ranops::orchestration

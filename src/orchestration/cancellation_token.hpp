#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace ranops::orchestration {

// Cooperative cancellation shared by every blocking point of a run: health
// polls, retry backoff, the traffic-generation wait and the inter-trial pause.
//
// A token is cancelled when any of these holds:
// - `Cancel()` was called on it (external termination request, sibling failure)
// - its parent token is cancelled
// - the bound process signal flag is non-zero
//
// Waits wake at least every `kWakeSlice` so a signal flag set from a handler
// (which cannot notify a condition variable) is still observed promptly.
class CancellationToken {
public:
  static constexpr std::chrono::milliseconds kWakeSlice{50};

  CancellationToken() = default;
  explicit CancellationToken(const CancellationToken* parent) : parent_(parent) {}

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void Cancel(std::string reason);
  bool IsCancelled() const;
  std::string Reason() const;

  // Binds the async-signal-safe flag written by CancellationHandler's handler.
  void BindSignalFlag(const std::atomic<int>* flag) {
    signal_flag_ = flag;
  }

  // Sleeps for `duration` unless cancelled first. Returns false when the sleep
  // was cut short (or the token was already cancelled).
  bool SleepFor(std::chrono::milliseconds duration) const;

private:
  std::atomic<bool> cancelled_{false};
  const CancellationToken* parent_ = nullptr;
  const std::atomic<int>* signal_flag_ = nullptr;
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::string reason_;
};

} // namespace ranops::orchestration

#include "orchestration/cancellation_token.hpp"

#include <algorithm>

namespace ranops::orchestration {

void CancellationToken::Cancel(std::string reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_.load()) {
      reason_ = std::move(reason);
    }
    cancelled_.store(true);
  }
  cv_.notify_all();
}

bool CancellationToken::IsCancelled() const {
  if (cancelled_.load()) {
    return true;
  }
  if (signal_flag_ != nullptr && signal_flag_->load() != 0) {
    return true;
  }
  return parent_ != nullptr && parent_->IsCancelled();
}

std::string CancellationToken::Reason() const {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.load()) {
      return reason_;
    }
  }
  if (signal_flag_ != nullptr && signal_flag_->load() != 0) {
    return "signal " + std::to_string(signal_flag_->load());
  }
  if (parent_ != nullptr && parent_->IsCancelled()) {
    return parent_->Reason();
  }
  return "";
}

bool CancellationToken::SleepFor(const std::chrono::milliseconds duration) const {
  const auto deadline = std::chrono::steady_clock::now() + duration;
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    if (IsCancelled()) {
      return false;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return true;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    cv_.wait_for(lock, std::max(std::min(remaining, kWakeSlice), std::chrono::milliseconds(1)));
  }
}

} // namespace ranops::orchestration

#include "services/testing/fake_managed_service.hpp"

namespace ranops::services::testing {

bool FakeManagedService::Start(const core::TemplateVars& vars, std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++start_calls_;
  last_vars_ = vars;
  if (start_calls_ <= fail_starts_) {
    error = name_ + ": scripted start failure " + std::to_string(start_calls_);
    return false;
  }
  running_ = true;
  probes_since_start_ = 0;
  return true;
}

bool FakeManagedService::IsReady() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++probe_calls_;
  if (!running_ || never_ready_) {
    return false;
  }
  ++probes_since_start_;
  return probes_since_start_ > ready_after_probes_;
}

bool FakeManagedService::Stop(std::chrono::milliseconds, std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++stop_calls_;
  if (stop_fails_) {
    error = name_ + ": scripted stop timeout";
    return false;
  }
  running_ = false;
  return true;
}

bool FakeManagedService::ForceStop(std::string&) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++force_stop_calls_;
  running_ = false;
  return true;
}

std::string FakeManagedService::DiagnosticTail(std::size_t) {
  return name_ + ": no healthy status reported";
}

void FakeManagedService::SetFailStarts(const std::uint32_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_starts_ = count;
}

void FakeManagedService::SetNeverReady(const bool never_ready) {
  std::lock_guard<std::mutex> lock(mutex_);
  never_ready_ = never_ready;
}

void FakeManagedService::SetReadyAfterProbes(const std::uint32_t probes) {
  std::lock_guard<std::mutex> lock(mutex_);
  ready_after_probes_ = probes;
}

void FakeManagedService::SetStopFails(const bool stop_fails) {
  std::lock_guard<std::mutex> lock(mutex_);
  stop_fails_ = stop_fails;
}

std::uint32_t FakeManagedService::StartCalls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return start_calls_;
}

std::uint32_t FakeManagedService::StopCalls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stop_calls_;
}

std::uint32_t FakeManagedService::ForceStopCalls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return force_stop_calls_;
}

std::uint32_t FakeManagedService::ProbeCalls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return probe_calls_;
}

bool FakeManagedService::Running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

core::TemplateVars FakeManagedService::LastVars() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_vars_;
}

} // namespace ranops::services::testing

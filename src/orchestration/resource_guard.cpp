#include "orchestration/resource_guard.hpp"

#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"

#include <algorithm>
#include <charconv>
#include <csignal>
#include <fstream>
#include <system_error>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

namespace ranops::orchestration {

using core::errors::ErrorKind;
using core::errors::MakeError;

namespace {

bool ParsePort(const std::string& id, std::uint16_t& port) {
  unsigned value = 0;
  const char* begin = id.data();
  const char* end = id.data() + id.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end || value == 0U || value > 65535U) {
    return false;
  }
  port = static_cast<std::uint16_t>(value);
  return true;
}

std::string JoinPids(const std::vector<int>& pids) {
  std::string out;
  for (const int pid : pids) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out += std::to_string(pid);
  }
  return out;
}

} // namespace

const char* ToString(const ResourceKind kind) {
  switch (kind) {
  case ResourceKind::kPort:
    return "port";
  case ResourceKind::kNamespace:
    return "namespace";
  case ResourceKind::kSession:
    return "session";
  case ResourceKind::kPidFile:
    return "pid_file";
  }
  return "port";
}

bool ReadPidFile(const fs::path& pid_file, int& pid) {
  std::ifstream in(pid_file);
  if (!in) {
    return false;
  }
  long long value = 0;
  if (!(in >> value) || value <= 0 || value > 4194304) {
    return false;
  }
  pid = static_cast<int>(value);
  return true;
}

bool WritePidFile(const fs::path& pid_file, const int pid, std::string& error) {
  return core::WriteTextFileAtomic(pid_file, std::to_string(pid) + "\n", error);
}

ResourceGuard::ResourceGuard(host::IHostControl& host, const CancellationToken& token,
                             core::logging::Logger& logger, ResourceGuardOptions options)
    : host_(host), token_(token), logger_(logger), options_(options) {}

bool ResourceGuard::IsFreeOnHost(const ResourceKind kind, const std::string& id) {
  switch (kind) {
  case ResourceKind::kPort: {
    std::uint16_t port = 0;
    return ParsePort(id, port) && host_.FindPortHolders(port).empty();
  }
  case ResourceKind::kNamespace:
    return !host_.NamespaceExists(id);
  case ResourceKind::kSession:
    return !host_.SessionExists(id);
  case ResourceKind::kPidFile: {
    int pid = 0;
    return !ReadPidFile(id, pid) || !host_.IsProcessAlive(pid);
  }
  }
  return false;
}

bool ResourceGuard::ReclaimPidFile(const fs::path& pid_file, std::string& error) {
  int pid = 0;
  if (ReadPidFile(pid_file, pid) && host_.IsProcessAlive(pid)) {
    std::string signal_error;
    if (!host_.SignalProcess(pid, SIGTERM, signal_error)) {
      logger_.Warn("SIGTERM failed",
                   {{"pid_file", pid_file.string()}, {"pid", std::to_string(pid)},
                    {"error", signal_error}});
    }
    const auto deadline = std::chrono::steady_clock::now() + options_.terminate_grace;
    while (host_.IsProcessAlive(pid) && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(CancellationToken::kWakeSlice);
    }
    if (host_.IsProcessAlive(pid)) {
      logger_.Warn("process survived SIGTERM, sending SIGKILL",
                   {{"pid_file", pid_file.string()}, {"pid", std::to_string(pid)}});
      if (!host_.SignalProcess(pid, SIGKILL, signal_error)) {
        error = "failed to kill pid " + std::to_string(pid) + ": " + signal_error;
        return false;
      }
    }
  }

  std::error_code ec;
  fs::remove(pid_file, ec);
  if (ec) {
    error = "failed to remove pid file '" + pid_file.string() + "': " + ec.message();
    return false;
  }
  return true;
}

bool ResourceGuard::ForceReclaim(const ResourceKind kind, const std::string& id,
                                 std::string& error) {
  error.clear();
  switch (kind) {
  case ResourceKind::kPort: {
    std::uint16_t port = 0;
    if (!ParsePort(id, port)) {
      error = "invalid port '" + id + "'";
      return false;
    }
    const std::vector<int> holders = host_.FindPortHolders(port);
    if (holders.empty()) {
      return true;
    }
    logger_.Warn("killing port holders", {{"port", id}, {"pids", JoinPids(holders)}});
    bool all_signalled = true;
    for (const int pid : holders) {
      std::string signal_error;
      if (!host_.SignalProcess(pid, SIGKILL, signal_error)) {
        all_signalled = false;
        error = signal_error;
      }
    }
    return all_signalled;
  }
  case ResourceKind::kNamespace:
    if (!host_.NamespaceExists(id)) {
      return true;
    }
    if (!host_.DeleteNamespace(id, error)) {
      return false;
    }
    if (host_.NamespaceExists(id)) {
      error = "namespace " + id + " still present after delete";
      return false;
    }
    return true;
  case ResourceKind::kSession:
    if (!host_.SessionExists(id)) {
      return true;
    }
    return host_.KillSession(id, error);
  case ResourceKind::kPidFile:
    return ReclaimPidFile(id, error);
  }
  error = "unknown resource kind";
  return false;
}

bool ResourceGuard::Acquire(const ResourceKind kind, const std::string& id,
                            const std::string& owner, ResourceHandle& handle,
                            core::errors::OrchestrationError& error) {
  handle = ResourceHandle{};
  const std::string label = std::string(ToString(kind)) + " " + id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = live_.find(Key{kind, id});
    if (it != live_.end()) {
      error = MakeError(ErrorKind::kResourceBusy,
                        label + " already held by " + it->second.owner);
      return false;
    }
  }

  const std::uint32_t checks = std::max<std::uint32_t>(1U, options_.reclaim_checks);
  bool free = false;
  for (std::uint32_t check = 1; check <= checks; ++check) {
    if (IsFreeOnHost(kind, id)) {
      free = true;
      break;
    }
    if (check == checks) {
      break;
    }
    logger_.Warn("resource in use, reclaiming",
                 {{"resource", label},
                  {"check", std::to_string(check)},
                  {"max_checks", std::to_string(checks)}});
    std::string reclaim_error;
    if (!ForceReclaim(kind, id, reclaim_error)) {
      logger_.Warn("reclaim attempt failed", {{"resource", label}, {"error", reclaim_error}});
    }
    if (!token_.SleepFor(options_.reclaim_settle)) {
      error = MakeError(ErrorKind::kCancelled, "cancelled while reclaiming " + label);
      return false;
    }
  }
  if (!free) {
    error = MakeError(ErrorKind::kResourceBusy,
                      label + " still in use after " + std::to_string(checks) + " checks");
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const Key key{kind, id};
  if (live_.count(key) > 0U) {
    error = MakeError(ErrorKind::kResourceBusy, label + " acquired concurrently");
    return false;
  }
  handle.kind = kind;
  handle.id = id;
  handle.owner = owner;
  handle.sequence = next_sequence_++;
  live_.emplace(key, handle);
  logger_.Debug("resource acquired",
                {{"resource", label}, {"owner", owner},
                 {"sequence", std::to_string(handle.sequence)}});
  return true;
}

bool ResourceGuard::Release(const ResourceHandle& handle, std::string& error) {
  error.clear();
  if (!handle.valid()) {
    return true;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = live_.find(Key{handle.kind, handle.id});
    if (it == live_.end() || it->second.sequence != handle.sequence) {
      return true;
    }
    live_.erase(it);
  }

  const std::string label = std::string(ToString(handle.kind)) + " " + handle.id;
  if (!ForceReclaim(handle.kind, handle.id, error)) {
    logger_.Warn("resource release failed", {{"resource", label}, {"error", error}});
    return false;
  }
  logger_.Debug("resource released", {{"resource", label}, {"owner", handle.owner}});
  return true;
}

bool ResourceGuard::KillByPattern(const std::string& pattern, std::string& error) {
  logger_.Info("killing processes by pattern", {{"pattern", pattern}});
  return host_.KillByPattern(pattern, error);
}

std::size_t ResourceGuard::ReleaseMatching(const std::string& owner, const ResourceKind* kind) {
  std::vector<ResourceHandle> handles;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, handle] : live_) {
      if (handle.owner == owner && (kind == nullptr || handle.kind == *kind)) {
        handles.push_back(handle);
      }
    }
  }
  std::sort(handles.begin(), handles.end(),
            [](const ResourceHandle& lhs, const ResourceHandle& rhs) {
              return lhs.sequence > rhs.sequence;
            });

  std::size_t failures = 0;
  for (const auto& handle : handles) {
    std::string error;
    if (!Release(handle, error)) {
      ++failures;
    }
  }
  return failures;
}

std::size_t ResourceGuard::ReleaseOwnedOfKind(const std::string& owner, const ResourceKind kind) {
  return ReleaseMatching(owner, &kind);
}

std::size_t ResourceGuard::ReleaseAllOwnedBy(const std::string& owner) {
  return ReleaseMatching(owner, nullptr);
}

std::size_t ResourceGuard::LiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return live_.size();
}

std::size_t ResourceGuard::LiveCountFor(const std::string& owner) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(std::count_if(
      live_.begin(), live_.end(), [&owner](const auto& entry) { return entry.second.owner == owner; }));
}

std::vector<ResourceHandle> ResourceGuard::LiveHandles(const std::string& owner) const {
  std::vector<ResourceHandle> handles;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [key, handle] : live_) {
    if (handle.owner == owner) {
      handles.push_back(handle);
    }
  }
  std::sort(handles.begin(), handles.end(),
            [](const ResourceHandle& lhs, const ResourceHandle& rhs) {
              return lhs.sequence < rhs.sequence;
            });
  return handles;
}

} // namespace ranops::orchestration

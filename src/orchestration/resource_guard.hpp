#pragma once

#include "core/errors/orchestration_error.hpp"
#include "host/host_control.hpp"
#include "orchestration/cancellation_token.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ranops::core::logging {
class Logger;
}

namespace ranops::orchestration {

enum class ResourceKind {
  kPort,
  kNamespace,
  kSession,
  kPidFile,
};

const char* ToString(ResourceKind kind);

// Registry entry for one exclusive host resource. `sequence` is the global
// acquisition order; 0 means "not acquired".
struct ResourceHandle {
  ResourceKind kind = ResourceKind::kPort;
  std::string id;
  std::string owner;
  std::uint64_t sequence = 0;

  bool valid() const {
    return sequence != 0U;
  }
};

struct ResourceGuardOptions {
  // Host checks performed by Acquire before surfacing ResourceBusy.
  std::uint32_t reclaim_checks = 5U;
  // Settle time after a forced reclaim before checking again.
  std::chrono::milliseconds reclaim_settle{2'000};
  // SIGTERM -> SIGKILL grace for pid-file owners.
  std::chrono::milliseconds terminate_grace{2'000};
};

// Tracks ports, network namespaces, terminal sessions and PID files the run
// owns, and is the only place that forcibly frees them.
//
// Invariants:
// - at most one live handle per (kind, id)
// - Release is idempotent; releasing an unknown or already released handle
//   succeeds without touching the host
// - owner-wide release runs in reverse acquisition order and never stops at
//   the first failure
//
// Reclaim waits inside Acquire observe the run token. Release and grace waits
// do not: they run during cleanup, which must finish after a signal too.
class ResourceGuard {
public:
  ResourceGuard(host::IHostControl& host, const CancellationToken& token,
                core::logging::Logger& logger, ResourceGuardOptions options = {});

  ResourceGuard(const ResourceGuard&) = delete;
  ResourceGuard& operator=(const ResourceGuard&) = delete;

  bool Acquire(ResourceKind kind, const std::string& id, const std::string& owner,
               ResourceHandle& handle, core::errors::OrchestrationError& error);

  bool Release(const ResourceHandle& handle, std::string& error);

  // Frees the resource on the host whether or not it is registered. Does not
  // touch the registry.
  bool ForceReclaim(ResourceKind kind, const std::string& id, std::string& error);

  bool IsFreeOnHost(ResourceKind kind, const std::string& id);

  // Audited name-pattern kill. Patterns are POSIX extended regexes matched
  // against full command lines.
  bool KillByPattern(const std::string& pattern, std::string& error);

  // Release helpers for cleanup. Return the number of releases that failed.
  std::size_t ReleaseOwnedOfKind(const std::string& owner, ResourceKind kind);
  std::size_t ReleaseAllOwnedBy(const std::string& owner);

  std::size_t LiveCount() const;
  std::size_t LiveCountFor(const std::string& owner) const;
  std::vector<ResourceHandle> LiveHandles(const std::string& owner) const;

  const ResourceGuardOptions& options() const {
    return options_;
  }

private:
  struct Key {
    ResourceKind kind;
    std::string id;

    bool operator<(const Key& other) const {
      if (kind != other.kind) {
        return static_cast<int>(kind) < static_cast<int>(other.kind);
      }
      return id < other.id;
    }
  };

  bool ReclaimPidFile(const std::filesystem::path& pid_file, std::string& error);
  std::size_t ReleaseMatching(const std::string& owner, const ResourceKind* kind);

  host::IHostControl& host_;
  const CancellationToken& token_;
  core::logging::Logger& logger_;
  ResourceGuardOptions options_;

  mutable std::mutex mutex_;
  std::uint64_t next_sequence_ = 1;
  std::map<Key, ResourceHandle> live_;
};

// PID stored in a PID file (first whitespace-delimited token). False when the
// file is missing or malformed.
bool ReadPidFile(const std::filesystem::path& pid_file, int& pid);

bool WritePidFile(const std::filesystem::path& pid_file, int pid, std::string& error);

} // namespace ranops::orchestration

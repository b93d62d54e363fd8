#pragma once

#include "core/string_utils.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace ranops::services {

// Contract for a long-lived subsystem the orchestrator starts once per trial
// attempt (near-RT RIC, 5G core). How the service decides it is healthy is
// its own business; the orchestrator only polls IsReady().
class IManagedService {
public:
  virtual ~IManagedService() = default;

  virtual std::string Name() const = 0;

  // `vars` carries per-trial values (e.g. `metrics_path`) for command
  // templates.
  virtual bool Start(const core::TemplateVars& vars, std::string& error) = 0;

  // Side-effect-free readiness probe, safe to call repeatedly.
  virtual bool IsReady() = 0;

  // Orderly shutdown bounded by `timeout`. Idempotent: stopping a service
  // that is not running succeeds.
  virtual bool Stop(std::chrono::milliseconds timeout, std::string& error) = 0;

  // Last-resort stop used when Stop fails or times out.
  virtual bool ForceStop(std::string& error) = 0;

  // Recent service output for failure diagnostics.
  virtual std::string DiagnosticTail(std::size_t max_lines) = 0;
};

} // namespace ranops::services

#pragma once

#include "host/host_control.hpp"
#include "services/managed_service.hpp"

#include <chrono>
#include <string>

namespace ranops::services {

enum class HealthProbe {
  // Ready once `ready_marker` appears in the container's log.
  kLogMarker,
  // Ready once the container's health check reports "healthy".
  kContainerHealth,
};

const char* ToString(HealthProbe probe);
bool ParseHealthProbe(const std::string& raw, HealthProbe& probe);

struct ComposeServiceOptions {
  std::string name;
  // Container inspected for readiness and diagnostics.
  std::string container;
  HealthProbe probe = HealthProbe::kContainerHealth;
  std::string ready_marker;
  // Templates expanded with the vars given to Start, e.g.
  // "cd {compose_dir} && sudo env METRICS_PATH={metrics_path} docker compose up -d".
  std::string start_command;
  std::string stop_command;
  // `docker ps --filter name=<filter>` selection for ForceStop.
  std::string force_stop_filter;
  std::chrono::milliseconds start_timeout{120'000};
  std::chrono::milliseconds probe_timeout{15'000};
  std::string privilege_prefix = "sudo";
};

// IManagedService over a docker compose project.
class ComposeService final : public IManagedService {
public:
  ComposeService(host::IHostControl& host, ComposeServiceOptions options);

  std::string Name() const override;
  bool Start(const core::TemplateVars& vars, std::string& error) override;
  bool IsReady() override;
  bool Stop(std::chrono::milliseconds timeout, std::string& error) override;
  bool ForceStop(std::string& error) override;
  std::string DiagnosticTail(std::size_t max_lines) override;

private:
  std::string Docker() const;

  host::IHostControl& host_;
  ComposeServiceOptions options_;
  core::TemplateVars last_vars_;
};

} // namespace ranops::services

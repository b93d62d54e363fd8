#pragma once

#include "config/orchestrator_config.hpp"
#include "core/logging/logger.hpp"
#include "grid/grid_scheduler.hpp"
#include "host/host_control.hpp"
#include "orchestration/resource_guard.hpp"
#include "services/managed_service.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>

namespace ranops::cli {

struct RunOptions {
  std::uint32_t start_trial_set = 0;
  std::uint32_t start_experiment = 1;
  std::optional<std::uint32_t> only_experiment;
  std::filesystem::path config_path;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Host-facing collaborators of one run. Dispatch wires the Linux host and the
// compose services; tests pass fakes.
struct RunDependencies {
  host::IHostControl& host;
  services::IManagedService& control_plane;
  services::IManagedService& core;
  core::logging::Logger& logger;
  orchestration::ResourceGuardOptions guard_options;
};

// Runs the grid described by `options` in-process, wrapped by the
// cancellation handler so every exit route ends in one cleanup pass. Returns
// 0 when the grid was traversed (permanently failed cells included) and 130
// when a signal or termination request stopped it. `summary`, when given,
// receives the per-cell outcomes.
int ExecuteGrid(const RunOptions& options, const config::OrchestratorConfig& config,
                const RunDependencies& deps, grid::GridSummary* summary = nullptr);

// Process exit codes:
//   0   => grid traversed
//   2   => usage error
//   10  => preflight failure (missing input files)
//   11  => config file unreadable or invalid
//   130 => interrupted (SIGINT/SIGTERM)
int Dispatch(int argc, char** argv);

} // namespace ranops::cli

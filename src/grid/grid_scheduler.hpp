#pragma once

#include "core/errors/orchestration_error.hpp"
#include "grid/checkpoint_store.hpp"
#include "trial/cleanup.hpp"
#include "trial/trial_controller.hpp"
#include "trial/trial_environment.hpp"
#include "trial/trial_layout.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace ranops::grid {

struct GridRequest {
  std::uint32_t start_trial_set = 0;
  std::uint32_t start_experiment = 1;
  // Set: run exactly (start_trial_set, only_experiment) and stop.
  std::optional<std::uint32_t> only_experiment;
};

struct CellOutcome {
  trial::TrialId id;
  trial::TrialStatus status = trial::TrialStatus::kPermanentlyFailed;
  std::uint32_t attempts = 0;
  core::errors::OrchestrationError last_error;
};

struct GridSummary {
  std::vector<CellOutcome> cells;
  std::size_t succeeded = 0;
  std::size_t permanently_failed = 0;
  // The run stopped early on cancellation; `cells` holds what finished.
  bool cancelled = false;
};

// Cells in execution order. Trial sets run from start_trial_set to
// total_trial_sets - 1; the first set starts at start_experiment, later sets
// at 1. Empty when the start position lies beyond the grid.
std::vector<trial::TrialId> PlanCells(const config::OrchestratorConfig& config,
                                      const GridRequest& request);

// Iterates the grid one cell at a time. A permanently failed cell is recorded
// and the grid moves on; only cancellation stops it early. The checkpoint is
// rewritten to the configured state file on every phase transition.
class GridScheduler {
public:
  GridScheduler(const trial::TrialEnvironment& env, trial::CleanupProtocol& cleanup,
                RunCheckpoint& checkpoint);

  GridSummary Run(const GridRequest& request);

  // Cell currently between "starting" and its post-cell cleanup, if any.
  std::optional<trial::TrialId> ActiveCell() const {
    return active_cell_;
  }

private:
  void RecordStep(const trial::TrialId& id, std::string_view step, std::uint32_t retry_count);
  void PersistCheckpoint();

  const trial::TrialEnvironment& env_;
  trial::CleanupProtocol& cleanup_;
  RunCheckpoint& checkpoint_;
  std::optional<trial::TrialId> active_cell_;
};

// One INFO line per grid plus one ERROR line per permanently failed cell,
// with its retry count.
void LogSummary(const GridSummary& summary, core::logging::Logger& logger);

} // namespace ranops::grid

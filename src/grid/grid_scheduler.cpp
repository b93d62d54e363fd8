#include "grid/grid_scheduler.hpp"

#include <chrono>
#include <string>

namespace ranops::grid {

std::vector<trial::TrialId> PlanCells(const config::OrchestratorConfig& config,
                                      const GridRequest& request) {
  std::vector<trial::TrialId> cells;
  if (request.only_experiment.has_value()) {
    cells.push_back(trial::TrialId{request.start_trial_set, *request.only_experiment});
    return cells;
  }

  for (std::uint32_t trial_set = request.start_trial_set; trial_set < config.total_trial_sets;
       ++trial_set) {
    const std::uint32_t first =
        trial_set == request.start_trial_set ? request.start_experiment : 1U;
    for (std::uint32_t experiment = first; experiment <= config.total_experiments; ++experiment) {
      cells.push_back(trial::TrialId{trial_set, experiment});
    }
  }
  return cells;
}

GridScheduler::GridScheduler(const trial::TrialEnvironment& env, trial::CleanupProtocol& cleanup,
                             RunCheckpoint& checkpoint)
    : env_(env), cleanup_(cleanup), checkpoint_(checkpoint) {}

void GridScheduler::PersistCheckpoint() {
  checkpoint_.updated_at = std::chrono::system_clock::now();
  std::string error;
  if (!WriteCheckpoint(checkpoint_, env_.config.state_file, error)) {
    // Visibility only; a full /tmp must not fail the trial.
    env_.logger.Warn("state file write failed", {{"error", error}});
  }
}

void GridScheduler::RecordStep(const trial::TrialId& id, const std::string_view step,
                               const std::uint32_t retry_count) {
  checkpoint_.trial_set = id.trial_set;
  checkpoint_.experiment = id.experiment;
  checkpoint_.step = std::string(step);
  checkpoint_.retry_count = retry_count;
  checkpoint_.retry_counts[id.RetryKey()] = retry_count;
  PersistCheckpoint();
}

GridSummary GridScheduler::Run(const GridRequest& request) {
  GridSummary summary;
  const std::vector<trial::TrialId> cells = PlanCells(env_.config, request);
  env_.logger.Info("grid started", {{"cells", std::to_string(cells.size())},
                                    {"start_trial_set", std::to_string(request.start_trial_set)},
                                    {"start_experiment", std::to_string(request.start_experiment)},
                                    {"single_cell", request.only_experiment ? "true" : "false"}});

  trial::TrialController controller(env_, cleanup_);
  for (std::size_t i = 0; i < cells.size(); ++i) {
    const trial::TrialId& id = cells[i];
    if (env_.token.IsCancelled()) {
      summary.cancelled = true;
      break;
    }

    active_cell_ = id;
    env_.logger.SetTrial(id.Label());
    const trial::TrialResult result =
        controller.Run(id, [this](const trial::TrialId& cell, std::string_view step,
                                  std::uint32_t retry_count) {
          RecordStep(cell, step, retry_count);
        });

    CellOutcome outcome;
    outcome.id = id;
    outcome.status = result.status;
    outcome.attempts = result.attempts;
    outcome.last_error = result.last_error;
    summary.cells.push_back(outcome);

    if (result.status == trial::TrialStatus::kCancelled) {
      // Exit cleanup owns this cell now.
      summary.cancelled = true;
      break;
    }

    const std::uint32_t retries = result.attempts > 0 ? result.attempts - 1U : 0U;
    checkpoint_.retry_counts[id.RetryKey()] = retries;
    if (result.status == trial::TrialStatus::kSucceeded) {
      ++summary.succeeded;
      ++checkpoint_.completed_runs;
      checkpoint_.last_completed = id.Label();
    } else {
      ++summary.permanently_failed;
      env_.logger.Error("trial permanently failed", {{"attempts", std::to_string(result.attempts)},
                                                     {"error", result.last_error.Describe()}});
    }
    checkpoint_.step = "cleanup";
    checkpoint_.retry_count = retries;
    PersistCheckpoint();

    const trial::TrialLayout layout(env_.config, id);
    cleanup_.Run(layout, "cell finished");
    active_cell_.reset();

    if (i + 1 < cells.size()) {
      env_.logger.Info("pausing before next trial",
                       {{"pause_ms", std::to_string(env_.config.inter_trial_pause.count())}});
      if (!env_.token.SleepFor(env_.config.inter_trial_pause)) {
        summary.cancelled = true;
        break;
      }
    }
  }

  env_.logger.SetTrial("-");
  if (!summary.cancelled) {
    checkpoint_.step = "finished";
    PersistCheckpoint();
  }
  return summary;
}

void LogSummary(const GridSummary& summary, core::logging::Logger& logger) {
  logger.Info("grid finished", {{"cells_run", std::to_string(summary.cells.size())},
                                {"succeeded", std::to_string(summary.succeeded)},
                                {"permanently_failed", std::to_string(summary.permanently_failed)},
                                {"cancelled", summary.cancelled ? "true" : "false"}});
  for (const auto& cell : summary.cells) {
    if (cell.status != trial::TrialStatus::kPermanentlyFailed) {
      continue;
    }
    logger.Error("permanently failed cell",
                 {{"cell", cell.id.Label()},
                  {"attempts", std::to_string(cell.attempts)},
                  {"retries", std::to_string(cell.attempts > 0 ? cell.attempts - 1U : 0U)},
                  {"error", cell.last_error.Describe()}});
  }
}

} // namespace ranops::grid

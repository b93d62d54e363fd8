#include "ranops/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "grid/checkpoint_store.hpp"
#include "host/linux_host_control.hpp"
#include "orchestration/cancellation_handler.hpp"
#include "orchestration/cancellation_token.hpp"
#include "services/compose_service.hpp"
#include "trial/cleanup.hpp"
#include "trial/trial_environment.hpp"
#include "trial/trial_layout.hpp"

#include <charconv>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace ranops::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitPreflightFailed = core::errors::ToInt(core::errors::ExitCode::kPreflightFailed);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  ranops [start_trial_set=0] [start_experiment=1] [only_experiment] "
         "[--config <file.json>] [--log-level <debug|info|warn|error>]\n"
      << "  ranops --help\n"
      << "\n"
      << "Runs every (trial set, experiment) cell from the start position to the end of the\n"
      << "grid. With only_experiment (equal to start_experiment), runs that one cell and\n"
      << "stops.\n";
}

bool ParseIndex(std::string_view raw, std::string_view name, std::uint32_t& value,
                std::string& error) {
  std::uint32_t parsed = 0;
  const auto* begin = raw.data();
  const auto* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (raw.empty() || ec != std::errc() || ptr != end) {
    error = "invalid " + std::string(name) + " '" + std::string(raw) +
            "' (expected a non-negative integer)";
    return false;
  }
  value = parsed;
  return true;
}

// Returns false on a usage error. `help` is set when --help was requested.
bool ParseRunOptions(const std::vector<std::string_view>& args, RunOptions& options, bool& help,
                     std::string& error) {
  std::vector<std::string_view> positionals;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--help" || token == "-h") {
      help = true;
      return true;
    }
    if (token == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      options.config_path = fs::path(std::string(args[i + 1]));
      ++i;
      continue;
    }
    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level";
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(args[i + 1], parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      ++i;
      continue;
    }
    if (token.size() > 1 && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    positionals.push_back(token);
  }

  if (positionals.size() > 3U) {
    error = "too many positional arguments (expected at most 3)";
    return false;
  }
  if (positionals.size() >= 1U &&
      !ParseIndex(positionals[0], "start_trial_set", options.start_trial_set, error)) {
    return false;
  }
  if (positionals.size() >= 2U &&
      !ParseIndex(positionals[1], "start_experiment", options.start_experiment, error)) {
    return false;
  }
  if (positionals.size() == 3U) {
    std::uint32_t only = 0;
    if (!ParseIndex(positionals[2], "only_experiment", only, error)) {
      return false;
    }
    options.only_experiment = only;
  }

  // Experiments are 1-based.
  if (options.start_experiment == 0U) {
    error = "start_experiment must be >= 1";
    return false;
  }
  if (options.only_experiment.has_value() && *options.only_experiment == 0U) {
    error = "only_experiment must be >= 1";
    return false;
  }
  // The single cell is (start_trial_set, start_experiment); only_experiment
  // must name the same experiment.
  if (options.only_experiment.has_value() &&
      *options.only_experiment != options.start_experiment) {
    error = "only_experiment " + std::to_string(*options.only_experiment) +
            " does not match start_experiment " + std::to_string(options.start_experiment);
    return false;
  }
  return true;
}

services::ComposeServiceOptions MakeComposeOptions(const config::ServiceConfig& service,
                                                   const config::OrchestratorConfig& config) {
  services::ComposeServiceOptions options;
  options.name = service.name;
  options.container = service.container;
  options.probe = service.probe;
  options.ready_marker = service.ready_marker;
  options.start_command = service.start_command;
  options.stop_command = service.stop_command;
  options.force_stop_filter = service.force_stop_filter;
  options.privilege_prefix = config.privilege_prefix;
  return options;
}

void LogResumeHint(const config::OrchestratorConfig& config, core::logging::Logger& logger) {
  std::error_code ec;
  if (!fs::exists(config.state_file, ec) || ec) {
    return;
  }
  grid::RunCheckpoint previous;
  std::string error;
  if (!grid::LoadCheckpoint(config.state_file, previous, error)) {
    logger.Warn("ignoring unreadable state file", {{"error", error}});
    return;
  }
  logger.Info("previous run state found",
              {{"state_file", config.state_file.string()},
               {"training_set", std::to_string(previous.trial_set)},
               {"experiment", std::to_string(previous.experiment)},
               {"step", previous.step},
               {"completed_runs", std::to_string(previous.completed_runs)},
               {"resume_hint", grid::ResumeHint(previous)}});
}

} // namespace

int ExecuteGrid(const RunOptions& options, const config::OrchestratorConfig& config,
                const RunDependencies& deps, grid::GridSummary* summary) {
  core::logging::Logger& logger = deps.logger;
  LogResumeHint(config, logger);

  orchestration::CancellationToken token;
  orchestration::CancellationHandler handler(token, logger);
  std::string error;
  if (!handler.Install(error)) {
    logger.Error("signal handler install failed", {{"error", error}});
    return kExitFailure;
  }

  orchestration::ResourceGuard guard(deps.host, token, logger, deps.guard_options);
  const trial::TrialEnvironment env{config,        deps.host, guard, deps.control_plane,
                                    deps.core,     logger,    token};
  trial::CleanupProtocol cleanup(env);
  grid::RunCheckpoint checkpoint;
  checkpoint.trial_set = options.start_trial_set;
  checkpoint.experiment = options.only_experiment.value_or(options.start_experiment);
  grid::GridScheduler scheduler(env, cleanup, checkpoint);

  grid::GridRequest request;
  request.start_trial_set = options.start_trial_set;
  request.start_experiment = options.start_experiment;
  request.only_experiment = options.only_experiment;

  grid::GridSummary result;
  const int exit_code = handler.Run(
      [&]() {
        result = scheduler.Run(request);
        grid::LogSummary(result, logger);
        return kExitSuccess;
      },
      [&](const orchestration::ExitRoute route) {
        const trial::TrialId cell =
            scheduler.ActiveCell().value_or(trial::TrialId{checkpoint.trial_set,
                                                           checkpoint.experiment});
        logger.SetTrial(cell.Label());
        const trial::TrialLayout layout(config, cell);
        cleanup.Run(layout, std::string("exit: ") + orchestration::ToString(route));
        logger.SetTrial("-");
      });

  if (summary != nullptr) {
    *summary = result;
  }
  return exit_code;
}

int Dispatch(int argc, char** argv) {
  std::vector<std::string_view> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  RunOptions options;
  bool help = false;
  std::string error;
  if (!ParseRunOptions(args, options, help, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  if (help) {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  core::logging::Logger logger(options.log_level);

  config::OrchestratorConfig config = config::DefaultOrchestratorConfig();
  if (!options.config_path.empty() &&
      !config::LoadOrchestratorConfig(options.config_path, config, error)) {
    logger.Error("config load failed",
                 {{"path", options.config_path.string()}, {"error", error}});
    return kExitConfigInvalid;
  }

  if (!config::ValidatePreflight(config, error)) {
    logger.Error("preflight failed", {{"error", error}});
    return kExitPreflightFailed;
  }

  host::LinuxHostOptions host_options;
  host_options.privilege_prefix = config.privilege_prefix;
  host::LinuxHostControl host(host_options);
  services::ComposeService control_plane(host, MakeComposeOptions(config.control_plane, config));
  services::ComposeService core_network(host, MakeComposeOptions(config.core, config));

  const RunDependencies deps{host, control_plane, core_network, logger, {}};
  return ExecuteGrid(options, config, deps);
}

} // namespace ranops::cli

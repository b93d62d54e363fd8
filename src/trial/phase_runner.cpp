#include "trial/phase_runner.hpp"

#include "core/string_utils.hpp"
#include "orchestration/health_poller.hpp"
#include "orchestration/readiness.hpp"
#include "orchestration/retry_executor.hpp"
#include "trial/output_validator.hpp"

#include <algorithm>
#include <csignal>
#include <future>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace ranops::trial {

using core::errors::ErrorKind;
using core::errors::MakeError;
using core::errors::OrchestrationError;
using orchestration::HealthPoller;
using orchestration::PollStatus;
using orchestration::ResourceHandle;
using orchestration::ResourceKind;
using orchestration::RetryExecutor;

namespace {

constexpr std::chrono::milliseconds kPidPollInterval{500};
constexpr std::chrono::milliseconds kSinkPollInterval{1'000};
constexpr std::chrono::milliseconds kCommandTimeout{30'000};
constexpr std::size_t kServiceTailLines = 20U;
constexpr std::size_t kSinkTailLines = 10U;

std::string Millis(const std::chrono::milliseconds duration) {
  return std::to_string(duration.count()) + "ms";
}

OrchestrationError PollFailure(const PollStatus status, const std::string& what,
                               std::string diagnostics = {}) {
  if (status == PollStatus::kCancelled) {
    return MakeError(ErrorKind::kCancelled, what + " (cancelled)");
  }
  return MakeError(ErrorKind::kTimeout, what, std::move(diagnostics));
}

void RemoveStale(const fs::path& path) {
  std::error_code ec;
  fs::remove(path, ec);
}

std::string MissingMarkers(const fs::path& log_path, const std::vector<std::string>& markers) {
  const std::vector<bool> seen = orchestration::ScanLogForMarkers(log_path, markers);
  std::string missing;
  for (std::size_t i = 0; i < markers.size(); ++i) {
    if (seen[i]) {
      continue;
    }
    if (!missing.empty()) {
      missing += "; ";
    }
    missing += markers[i];
  }
  return missing;
}

} // namespace

PhaseRunner::PhaseRunner(const TrialEnvironment& env, const TrialLayout& layout)
    : env_(env), layout_(layout), owner_(layout.id().Label()) {}

bool PhaseRunner::RunAll(const PhaseTransitionCallback& on_enter,
                         std::optional<Phase>& failed_phase, OrchestrationError& error) {
  failed_phase.reset();
  for (const Phase phase : kPhaseOrder) {
    if (env_.token.IsCancelled()) {
      failed_phase = phase;
      error = MakeError(ErrorKind::kCancelled,
                        std::string("cancelled before ") + ToString(phase) + ": " +
                            env_.token.Reason());
      return false;
    }
    if (on_enter) {
      on_enter(phase);
    }
    env_.logger.Info("phase started", {{"phase", ToString(phase)}});
    const auto started = std::chrono::steady_clock::now();
    if (!RunPhase(phase, error)) {
      failed_phase = phase;
      env_.logger.Error("phase failed", {{"phase", ToString(phase)}, {"error", error.Describe()}});
      if (!error.diagnostics.empty()) {
        env_.logger.Error("phase diagnostics",
                          {{"phase", ToString(phase)}, {"tail", error.diagnostics}});
      }
      return false;
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    env_.logger.Info("phase completed",
                     {{"phase", ToString(phase)}, {"elapsed_ms", std::to_string(elapsed.count())}});
  }
  return true;
}

bool PhaseRunner::RunPhase(const Phase phase, OrchestrationError& error) {
  switch (phase) {
  case Phase::kControlPlaneUp:
    return ControlPlaneUp(error);
  case Phase::kCoreUp:
    return CoreUp(error);
  case Phase::kRadioNodeUp:
    return RadioNodeUp(error);
  case Phase::kNamespacesReady:
    return NamespacesReady(error);
  case Phase::kClientsAttached:
    return ClientsAttached(error);
  case Phase::kScenarioRunning:
    return ScenarioRunning(error);
  case Phase::kClientsConnected:
    return ClientsConnected(error);
  case Phase::kTrafficRunning:
    return TrafficRunning(error);
  case Phase::kValidated:
    return Validated(error);
  }
  error = MakeError(ErrorKind::kStartFailure, "unknown phase");
  return false;
}

bool PhaseRunner::Acquire(const ResourceKind kind, const std::string& id, ResourceHandle& handle,
                          OrchestrationError& error) {
  return env_.guard.Acquire(kind, id, owner_, handle, error);
}

bool PhaseRunner::StartService(services::IManagedService& service,
                               const config::ServiceConfig& settings, OrchestrationError& error) {
  const core::TemplateVars vars = {
      {"compose_dir", settings.compose_dir},
      {"metrics_path", core::ShellQuote(layout_.MetricsDir().string())},
  };

  const RetryExecutor retry(env_.token, env_.logger);
  const auto outcome = retry.Execute(
      "start " + service.Name(), env_.config.service_start_retry,
      [&service, &vars](std::uint32_t, OrchestrationError& attempt_error) {
        std::string start_error;
        if (!service.Start(vars, start_error)) {
          attempt_error = MakeError(ErrorKind::kStartFailure, start_error);
          return false;
        }
        return true;
      });
  if (!outcome.succeeded) {
    error = outcome.last_error;
    return false;
  }

  const HealthPoller poller(env_.token);
  const auto result = poller.Poll([&service]() { return service.IsReady(); },
                                  env_.config.health_interval, settings.ready_timeout);
  if (result.status != PollStatus::kReady) {
    error = PollFailure(result.status,
                        service.Name() + " not ready within " + Millis(settings.ready_timeout),
                        result.status == PollStatus::kTimeout
                            ? service.DiagnosticTail(kServiceTailLines)
                            : std::string());
    return false;
  }
  env_.logger.Info("service ready", {{"service", service.Name()},
                                     {"elapsed_ms", std::to_string(result.elapsed.count())}});
  return true;
}

bool PhaseRunner::ControlPlaneUp(OrchestrationError& error) {
  return StartService(env_.control_plane, env_.config.control_plane, error);
}

bool PhaseRunner::CoreUp(OrchestrationError& error) {
  if (!StartService(env_.core, env_.config.core, error)) {
    return false;
  }
  if (env_.config.sink_command.empty()) {
    return true;
  }
  for (const std::uint16_t port : env_.config.sink_ports) {
    const std::string command =
        core::ExpandTemplate(env_.config.sink_command, {{"port", std::to_string(port)}});
    host::CommandResult result;
    std::string run_error;
    if (!env_.host.RunCommand(command, kCommandTimeout, result, run_error) ||
        result.exit_code != 0) {
      env_.logger.Warn("traffic sink failed to start",
                       {{"port", std::to_string(port)},
                        {"exit_code", std::to_string(result.exit_code)},
                        {"error", run_error}});
    }
  }
  return true;
}

bool PhaseRunner::RadioNodeUp(OrchestrationError& error) {
  std::vector<std::uint16_t> ports = env_.config.radio_ports;
  if (std::find(ports.begin(), ports.end(), env_.config.metrics_port) == ports.end()) {
    ports.push_back(env_.config.metrics_port);
  }
  for (const std::uint16_t port : ports) {
    ResourceHandle handle;
    if (!Acquire(ResourceKind::kPort, std::to_string(port), handle, error)) {
      return false;
    }
  }

  if (!env_.config.metrics_sink_command.empty() && !StartMetricsSink(error)) {
    return false;
  }

  const RetryExecutor retry(env_.token, env_.logger);
  const auto outcome =
      retry.Execute("start radio node", env_.config.radio_start_retry,
                    [this](std::uint32_t, OrchestrationError& attempt_error) {
                      return StartRadioNode(attempt_error);
                    });
  if (!outcome.succeeded) {
    error = outcome.last_error;
    return false;
  }
  return true;
}

bool PhaseRunner::StartMetricsSink(OrchestrationError& error) {
  const fs::path& pid_file = env_.config.metrics_sink_pid_file;
  ResourceHandle handle;
  if (!Acquire(ResourceKind::kPidFile, pid_file.string(), handle, error)) {
    return false;
  }

  const core::TemplateVars vars = {
      {"log_dir", core::ShellQuote(layout_.RadioLogDir().string())},
      {"name", env_.config.radio_node_name},
      {"metrics_port", std::to_string(env_.config.metrics_port)},
  };
  const fs::path sink_log = layout_.RadioLogDir() / (env_.config.radio_node_name + "_sink.out");
  int pid = -1;
  std::string spawn_error;
  if (!env_.host.SpawnBackground(core::ExpandTemplate(env_.config.metrics_sink_command, vars),
                                 sink_log, pid, spawn_error)) {
    error = MakeError(ErrorKind::kStartFailure, "metrics sink failed to start: " + spawn_error);
    return false;
  }
  std::string write_error;
  if (!orchestration::WritePidFile(pid_file, pid, write_error)) {
    std::string signal_error;
    if (!env_.host.SignalProcess(pid, SIGTERM, signal_error)) {
      env_.logger.Warn("failed to stop untracked metrics sink",
                       {{"pid", std::to_string(pid)}, {"error", signal_error}});
    }
    error = MakeError(ErrorKind::kStartFailure, "metrics sink pid file: " + write_error);
    return false;
  }

  const std::uint16_t port = env_.config.metrics_port;
  const HealthPoller poller(env_.token);
  const auto result = poller.Poll(
      [this, port]() { return !env_.host.FindPortHolders(port).empty(); }, kSinkPollInterval,
      env_.config.metrics_sink_timeout);
  if (result.status != PollStatus::kReady) {
    error = PollFailure(result.status,
                        "metrics sink not listening on port " + std::to_string(port) +
                            " within " + Millis(env_.config.metrics_sink_timeout),
                        orchestration::FormatLogTail(sink_log, kSinkTailLines));
    return false;
  }
  env_.logger.Info("metrics sink ready",
                   {{"port", std::to_string(port)}, {"pid", std::to_string(pid)}});
  return true;
}

bool PhaseRunner::StartRadioNode(OrchestrationError& error) {
  const config::OrchestratorConfig& config = env_.config;
  std::string release_error;
  if (!env_.guard.Release(radio_session_, release_error)) {
    env_.logger.Warn("previous radio node session not released", {{"error", release_error}});
  }
  radio_session_ = ResourceHandle{};
  if (!Acquire(ResourceKind::kSession, config.radio_session, radio_session_, error)) {
    return false;
  }

  const fs::path log_path = layout_.RadioNodeLog();
  RemoveStale(log_path);
  const core::TemplateVars vars = {
      {"config", core::ShellQuote(config.radio_node_config.string())},
      {"name", config.radio_node_name},
      {"bind_address", config.radio_bind_address},
      {"tx_port", std::to_string(config.radio_tx_port)},
      {"rx_port", std::to_string(config.radio_rx_port)},
      {"log_dir", core::ShellQuote(layout_.RadioLogDir().string())},
      {"metrics_port", std::to_string(config.metrics_port)},
  };
  std::string start_error;
  if (!env_.host.StartSession(config.radio_session, core::ExpandTemplate(config.radio_command, vars),
                              start_error)) {
    error = MakeError(ErrorKind::kStartFailure, "radio node session failed: " + start_error);
    return false;
  }
  env_.logger.Info("radio node started",
                   {{"session", config.radio_session}, {"log", log_path.string()}});

  const HealthPoller poller(env_.token);
  const auto result =
      poller.Poll(orchestration::LogContainsAll(log_path, config.radio_ready_markers),
                  config.radio_poll_interval, config.radio_ready_timeout);
  if (result.status != PollStatus::kReady) {
    error = PollFailure(result.status,
                        "radio node not attached within " + Millis(config.radio_ready_timeout) +
                            ", missing: " + MissingMarkers(log_path, config.radio_ready_markers),
                        orchestration::FormatLogTail(log_path, config.radio_tail_lines));
    return false;
  }
  env_.logger.Info("radio node attached",
                   {{"elapsed_ms", std::to_string(result.elapsed.count())}});
  return true;
}

bool PhaseRunner::NamespacesReady(OrchestrationError& error) {
  const config::OrchestratorConfig& config = env_.config;
  std::string bridge;
  const HealthPoller poller(env_.token);
  const auto result = poller.Poll(
      [this, &bridge]() {
        return env_.host.FindInterfaceWithAddress(env_.config.bridge_address, bridge);
      },
      config.bridge_poll_interval, config.bridge_timeout);
  if (result.status != PollStatus::kReady) {
    error = PollFailure(result.status, "no interface with address " + config.bridge_address +
                                           " within " + Millis(config.bridge_timeout));
    return false;
  }
  env_.logger.Info("core bridge found", {{"interface", bridge}});

  for (std::uint32_t i = 1; i <= config.client_count; ++i) {
    const std::string name = layout_.NamespaceName(i);
    ResourceHandle handle;
    if (!Acquire(ResourceKind::kNamespace, name, handle, error)) {
      return false;
    }
    std::string add_error;
    if (!env_.host.AddNamespace(name, add_error)) {
      error = MakeError(ErrorKind::kStartFailure,
                        "failed to create namespace " + name + ": " + add_error);
      return false;
    }
    env_.logger.Info("namespace created", {{"namespace", name}});
  }

  if (!env_.host.RouteExists(config.client_route)) {
    std::string route_error;
    if (env_.host.AddRoute(config.client_route, route_error)) {
      env_.logger.Info("client route added", {{"route", config.client_route}});
    } else {
      env_.logger.Warn("failed to add client route",
                       {{"route", config.client_route}, {"error", route_error}});
    }
  }
  return true;
}

bool PhaseRunner::ClientsAttached(OrchestrationError& error) {
  const config::OrchestratorConfig& config = env_.config;
  std::vector<ClientIdentity> identities;
  std::string load_error;
  if (!LoadClientIdentities(config.client_table, identities, load_error)) {
    error = MakeError(ErrorKind::kStartFailure, load_error);
    return false;
  }
  if (identities.size() < config.client_count) {
    error = MakeError(ErrorKind::kStartFailure,
                      "client table has " + std::to_string(identities.size()) +
                          " entries, " + std::to_string(config.client_count) + " required");
    return false;
  }

  client_sessions_.assign(config.client_count, ResourceHandle{});
  const RetryExecutor retry(env_.token, env_.logger);
  for (std::uint32_t i = 1; i <= config.client_count; ++i) {
    const ClientIdentity& identity = identities[i - 1U];
    const auto outcome =
        retry.Execute("start client " + layout_.ClientSession(i), config.client_start_retry,
                      [this, i, &identity](std::uint32_t, OrchestrationError& attempt_error) {
                        return StartClient(i, identity, attempt_error);
                      });
    if (!outcome.succeeded) {
      error = outcome.last_error;
      return false;
    }
  }
  return true;
}

bool PhaseRunner::StartClient(const std::uint32_t index, const ClientIdentity& identity,
                              OrchestrationError& error) {
  ResourceHandle& session = client_sessions_[index - 1U];
  std::string release_error;
  if (!env_.guard.Release(session, release_error)) {
    env_.logger.Warn("previous client session not released", {{"error", release_error}});
  }
  session = ResourceHandle{};

  const std::string name = layout_.ClientSession(index);
  if (!Acquire(ResourceKind::kSession, name, session, error)) {
    return false;
  }
  RemoveStale(layout_.ClientStdoutLog(index));

  std::uint16_t tx_port = 0;
  std::uint16_t rx_port = 0;
  ClientRadioPorts(index, tx_port, rx_port);
  const std::string ns = layout_.NamespaceName(index);
  const core::TemplateVars vars = {
      {"config", core::ShellQuote(env_.config.client_config.string())},
      {"namespace", ns},
      {"tx_port", std::to_string(tx_port)},
      {"rx_port", std::to_string(rx_port)},
      {"imsi", identity.imsi},
      {"key", identity.key},
      {"imei", identity.imei},
      {"log_dir", core::ShellQuote(layout_.ClientLogDir().string())},
  };
  env_.logger.Info("starting client", {{"client", name},
                                       {"identity", identity.name},
                                       {"imsi", identity.imsi},
                                       {"namespace", ns},
                                       {"tx_port", std::to_string(tx_port)},
                                       {"rx_port", std::to_string(rx_port)}});
  std::string start_error;
  if (!env_.host.StartSession(name, core::ExpandTemplate(env_.config.client_command, vars),
                              start_error)) {
    error = MakeError(ErrorKind::kStartFailure, name + " session failed: " + start_error);
    return false;
  }
  return true;
}

bool PhaseRunner::ScenarioRunning(OrchestrationError& error) {
  const config::OrchestratorConfig& config = env_.config;
  const fs::path& pid_file = config.scenario_pid_file;
  ResourceHandle handle;
  if (!Acquire(ResourceKind::kPidFile, pid_file.string(), handle, error)) {
    return false;
  }
  RemoveStale(pid_file);

  const std::string command = "cd " + core::ShellQuote(layout_.Directory().string()) +
                              " && bash " + core::ShellQuote(layout_.ScenarioScript().string());
  env_.logger.Info("launching scenario", {{"script", layout_.ScenarioScript().string()}});
  host::CommandResult result;
  std::string run_error;
  if (!env_.host.RunCommand(command, config.scenario_timeout, result, run_error)) {
    error = MakeError(ErrorKind::kStartFailure, "scenario script not runnable: " + run_error);
    return false;
  }
  if (result.timed_out) {
    error = MakeError(ErrorKind::kStartFailure,
                      "scenario script did not return within " + Millis(config.scenario_timeout),
                      result.output);
    return false;
  }
  if (result.exit_code != 0) {
    error = MakeError(ErrorKind::kStartFailure,
                      "scenario script exited with code " + std::to_string(result.exit_code),
                      result.output);
    return false;
  }

  int pid = 0;
  const HealthPoller poller(env_.token);
  const auto poll = poller.Poll(
      [this, &pid_file, &pid]() {
        return orchestration::ReadPidFile(pid_file, pid) && env_.host.IsProcessAlive(pid);
      },
      kPidPollInterval, config.scenario_pid_timeout);
  if (poll.status == PollStatus::kCancelled) {
    error = MakeError(ErrorKind::kCancelled, "cancelled waiting for scenario pid file");
    return false;
  }
  if (poll.status != PollStatus::kReady) {
    error = MakeError(ErrorKind::kStartFailure,
                      "scenario pid file " + pid_file.string() + " does not name a live process");
    return false;
  }
  env_.logger.Info("scenario running", {{"pid", std::to_string(pid)}});
  return true;
}

OrchestrationError PhaseRunner::WaitForClient(const std::uint32_t index,
                                              orchestration::CancellationToken& siblings) {
  const config::OrchestratorConfig& config = env_.config;
  const std::string name = layout_.ClientSession(index);
  const fs::path log_path = layout_.ClientStdoutLog(index);
  const HealthPoller poller(siblings);

  const auto file_result = poller.Poll(orchestration::FileExists(log_path),
                                       config.client_poll_interval, config.client_log_timeout);
  if (file_result.status != PollStatus::kReady) {
    OrchestrationError failure =
        PollFailure(file_result.status, name + " log " + log_path.string() +
                                            " not created within " +
                                            Millis(config.client_log_timeout));
    if (failure.kind != ErrorKind::kCancelled) {
      siblings.Cancel(name + " failed");
    }
    return failure;
  }

  const auto ready = poller.Poll(orchestration::LogContainsAll(log_path, config.client_ready_markers),
                                 config.client_poll_interval, config.client_ready_timeout);
  if (ready.status != PollStatus::kReady) {
    OrchestrationError failure = PollFailure(
        ready.status,
        name + " not connected within " + Millis(config.client_ready_timeout) + ", missing: " +
            MissingMarkers(log_path, config.client_ready_markers),
        orchestration::FormatLogTail(log_path, config.client_tail_lines));
    if (failure.kind != ErrorKind::kCancelled) {
      siblings.Cancel(name + " failed");
    }
    return failure;
  }

  env_.logger.Info("client connected", {{"client", name},
                                        {"elapsed_ms", std::to_string(ready.elapsed.count())}});
  return OrchestrationError{};
}

bool PhaseRunner::ClientsConnected(OrchestrationError& error) {
  const config::OrchestratorConfig& config = env_.config;
  orchestration::CancellationToken siblings(&env_.token);

  std::vector<std::future<OrchestrationError>> waits;
  waits.reserve(config.client_count);
  for (std::uint32_t i = 1; i <= config.client_count; ++i) {
    waits.push_back(std::async(std::launch::async,
                               [this, i, &siblings]() { return WaitForClient(i, siblings); }));
  }
  std::vector<OrchestrationError> results;
  results.reserve(waits.size());
  for (auto& wait : waits) {
    results.push_back(wait.get());
  }

  // Report the root cause, not the siblings it cancelled.
  OrchestrationError first_failure;
  for (const auto& result : results) {
    if (!result.ok() && result.kind != ErrorKind::kCancelled) {
      first_failure = result;
      break;
    }
  }
  if (first_failure.ok()) {
    for (const auto& result : results) {
      if (!result.ok()) {
        first_failure = result;
        break;
      }
    }
  }
  if (!first_failure.ok()) {
    error = first_failure;
    return false;
  }

  if (config.client_default_route_command.empty()) {
    return true;
  }
  for (std::uint32_t i = 1; i <= config.client_count; ++i) {
    const std::string ns = layout_.NamespaceName(i);
    const std::string command =
        core::ExpandTemplate(config.client_default_route_command, {{"namespace", ns}});
    host::CommandResult result;
    std::string run_error;
    if (!env_.host.RunCommand(command, kCommandTimeout, result, run_error) ||
        result.exit_code != 0) {
      env_.logger.Warn("failed to configure client default route",
                       {{"namespace", ns}, {"exit_code", std::to_string(result.exit_code)}});
    }
  }
  return true;
}

void PhaseRunner::StopGenerators() {
  for (auto it = generators_.rbegin(); it != generators_.rend(); ++it) {
    std::string signal_error;
    if (env_.host.IsProcessAlive(it->pid) &&
        !env_.host.SignalProcess(it->pid, SIGTERM, signal_error)) {
      env_.logger.Warn("failed to signal traffic generator",
                       {{"client", it->client}, {"error", signal_error}});
    }
    std::string release_error;
    if (!env_.guard.Release(it->pid_file, release_error)) {
      env_.logger.Warn("failed to release traffic generator",
                       {{"client", it->client}, {"error", release_error}});
    }
  }
  generators_.clear();
}

bool PhaseRunner::TrafficRunning(OrchestrationError& error) {
  const config::OrchestratorConfig& config = env_.config;
  const fs::path artifact = layout_.MetricsArtifact();
  std::error_code remove_ec;
  fs::remove(artifact, remove_ec);
  if (remove_ec) {
    env_.logger.Warn("failed to remove stale metrics artifact",
                     {{"path", artifact.string()}, {"error", remove_ec.message()}});
  }

  std::vector<ConditionRow> rows;
  std::string parse_error;
  if (!ParseConditions(layout_.ConditionsFile(), layout_.Directory(), rows, parse_error)) {
    error = MakeError(ErrorKind::kStartFailure, parse_error);
    return false;
  }

  bool all_started = true;
  std::uint32_t counter = 0;
  for (const auto& row : rows) {
    ++counter;
    if (counter > config.client_count) {
      break;
    }
    std::error_code exists_ec;
    if (!fs::is_regular_file(row.profile_script, exists_ec)) {
      env_.logger.Warn("traffic profile not found, skipping client",
                       {{"client", row.client}, {"script", row.profile_script.string()}});
      continue;
    }

    const std::string ns = core::ToLowerAscii(row.client);
    const std::uint16_t port = static_cast<std::uint16_t>(config.traffic_base_port + counter);
    const fs::path pid_file = layout_.TrafficPidFile(row.client);
    TrafficGenerator generator;
    generator.client = row.client;
    OrchestrationError acquire_error;
    if (!Acquire(ResourceKind::kPidFile, pid_file.string(), generator.pid_file, acquire_error)) {
      env_.logger.Error("traffic generator pid file busy",
                        {{"client", row.client}, {"error", acquire_error.Describe()}});
      all_started = false;
      continue;
    }

    const core::TemplateVars vars = {
        {"namespace", ns},
        {"script", core::ShellQuote(row.profile_script.string())},
        {"port", std::to_string(port)},
    };
    std::string spawn_error;
    if (!env_.host.SpawnBackground(core::ExpandTemplate(config.traffic_command, vars),
                                   layout_.TrafficLog(row.client), generator.pid, spawn_error)) {
      env_.logger.Error("traffic generator failed to start",
                        {{"client", row.client}, {"error", spawn_error}});
      std::string release_error;
      if (!env_.guard.Release(generator.pid_file, release_error)) {
        env_.logger.Warn("failed to release traffic generator pid file",
                         {{"client", row.client}, {"error", release_error}});
      }
      all_started = false;
      continue;
    }
    std::string write_error;
    if (!orchestration::WritePidFile(pid_file, generator.pid, write_error)) {
      env_.logger.Warn("failed to record traffic generator pid",
                       {{"client", row.client}, {"error", write_error}});
    }
    env_.logger.Info("traffic generator started", {{"client", row.client},
                                                   {"namespace", ns},
                                                   {"port", std::to_string(port)},
                                                   {"pid", std::to_string(generator.pid)}});
    generators_.push_back(std::move(generator));
  }

  for (const auto& generator : generators_) {
    if (!env_.host.IsProcessAlive(generator.pid)) {
      env_.logger.Error("traffic generator exited early",
                        {{"client", generator.client}, {"pid", std::to_string(generator.pid)}});
      all_started = false;
    }
  }
  if (!all_started) {
    StopGenerators();
    error = MakeError(ErrorKind::kStartFailure, "one or more traffic generators failed to start");
    return false;
  }
  if (generators_.empty()) {
    env_.logger.Warn("no traffic generators were started");
    return true;
  }

  env_.logger.Info("traffic running",
                   {{"generators", std::to_string(generators_.size())},
                    {"duration_ms", std::to_string(config.traffic_duration.count())}});
  if (!env_.token.SleepFor(config.traffic_duration)) {
    StopGenerators();
    error = MakeError(ErrorKind::kCancelled, "traffic wait cancelled: " + env_.token.Reason());
    return false;
  }
  StopGenerators();
  env_.logger.Info("traffic generation completed");
  return true;
}

bool PhaseRunner::Validated(OrchestrationError& error) {
  ValidationReport report;
  if (!ValidateMetricsArtifact(layout_.MetricsArtifact(), env_.config.traffic_duration,
                               env_.config.validation_tolerance, report, error)) {
    return false;
  }
  env_.logger.Info("metrics artifact valid",
                   {{"rows", std::to_string(report.data_rows)},
                    {"span_s", std::to_string(report.span_seconds)}});
  return true;
}

} // namespace ranops::trial

#include "trial/cleanup.hpp"

#include "core/fs_utils.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <initializer_list>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace ranops::trial {

using orchestration::ResourceKind;

namespace {

bool IsTrafficPidFile(const std::string& id) {
  return core::WildcardMatch("iperf_*.pid", fs::path(id).filename().string());
}

} // namespace

CleanupReport CleanupProtocol::Run(const TrialLayout& layout, const std::string_view reason) {
  const std::string owner = layout.id().Label();
  env_.logger.Info("cleanup started", {{"reason", reason}, {"owner", owner}});
  const auto started = std::chrono::steady_clock::now();

  struct NamedStep {
    const char* name;
    Step step;
  };
  const std::vector<NamedStep> steps = {
      {"stop traffic generators", [this](const TrialLayout& l) { return StopTrafficGenerators(l); }},
      {"stop background processes",
       [this](const TrialLayout& l) { return StopBackgroundProcesses(l); }},
      {"terminate sessions", [this](const TrialLayout& l) { return TerminateSessions(l); }},
      {"stop managed services", [this](const TrialLayout& l) { return StopServices(l); }},
      {"remove client namespaces", [this](const TrialLayout& l) { return RemoveNamespaces(l); }},
      {"kill lingering processes",
       [this](const TrialLayout& l) { return KillLingeringProcesses(l); }},
      {"free radio ports", [this](const TrialLayout& l) { return FreePorts(l); }},
      {"remove temp files", [this](const TrialLayout& l) { return RemoveTempFiles(l); }},
      {"remove client route", [this](const TrialLayout& l) { return RemoveClientRoute(l); }},
  };

  CleanupReport report;
  for (std::size_t i = 0; i < steps.size(); ++i) {
    if (!RunStep(i + 1U, steps[i].name, steps[i].step, layout)) {
      ++report.steps_with_failures;
    }
  }

  report.release_failures = env_.guard.ReleaseAllOwnedBy(owner);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  if (report.steps_with_failures == 0U && report.release_failures == 0U) {
    env_.logger.Info("cleanup complete",
                     {{"owner", owner}, {"elapsed_ms", std::to_string(elapsed.count())}});
  } else {
    env_.logger.Warn("cleanup complete with failures",
                     {{"owner", owner},
                      {"failed_steps", std::to_string(report.steps_with_failures)},
                      {"release_failures", std::to_string(report.release_failures)},
                      {"elapsed_ms", std::to_string(elapsed.count())}});
  }
  return report;
}

bool CleanupProtocol::RunStep(const std::size_t number, const std::string_view name,
                              const Step& step, const TrialLayout& layout) {
  const std::string label = std::to_string(number) + "/9";
  env_.logger.Info("cleanup step", {{"step", label}, {"name", name}});
  try {
    return step(layout);
  } catch (const std::exception& ex) {
    env_.logger.Error("cleanup step raised",
                      {{"step", label}, {"name", name}, {"error", ex.what()}});
    return false;
  }
}

bool CleanupProtocol::StopTrafficGenerators(const TrialLayout& layout) {
  bool ok = true;
  const std::string owner = layout.id().Label();
  for (const auto& handle : env_.guard.LiveHandles(owner)) {
    if (handle.kind != ResourceKind::kPidFile || !IsTrafficPidFile(handle.id)) {
      continue;
    }
    std::string error;
    if (!env_.guard.Release(handle, error)) {
      env_.logger.Warn("traffic generator release failed", {{"pid_file", handle.id}, {"error", error}});
      ok = false;
    }
  }

  std::vector<fs::path> stale;
  std::error_code ec;
  if (fs::is_directory(env_.config.temp_dir, ec)) {
    for (const auto& entry : fs::directory_iterator(env_.config.temp_dir, ec)) {
      if (IsTrafficPidFile(entry.path().string())) {
        stale.push_back(entry.path());
      }
    }
  }
  for (const auto& pid_file : stale) {
    std::string error;
    if (!env_.guard.ForceReclaim(ResourceKind::kPidFile, pid_file.string(), error)) {
      env_.logger.Warn("stale traffic generator not stopped",
                       {{"pid_file", pid_file.string()}, {"error", error}});
      ok = false;
    }
  }

  if (!env_.config.traffic_kill_pattern.empty()) {
    std::string error;
    if (!env_.guard.KillByPattern(env_.config.traffic_kill_pattern, error)) {
      env_.logger.Warn("traffic generator pattern kill failed", {{"error", error}});
      ok = false;
    }
  }
  return ok;
}

bool CleanupProtocol::StopBackgroundProcesses(const TrialLayout&) {
  bool ok = true;
  for (const fs::path& pid_file :
       {env_.config.scenario_pid_file, env_.config.metrics_sink_pid_file}) {
    std::string error;
    if (!env_.guard.ForceReclaim(ResourceKind::kPidFile, pid_file.string(), error)) {
      env_.logger.Warn("background process not stopped",
                       {{"pid_file", pid_file.string()}, {"error", error}});
      ok = false;
    }
  }
  return ok;
}

bool CleanupProtocol::TerminateSessions(const TrialLayout& layout) {
  bool ok = true;
  if (env_.guard.ReleaseOwnedOfKind(layout.id().Label(), ResourceKind::kSession) != 0U) {
    ok = false;
  }

  std::vector<std::string> owned = {env_.config.radio_session};
  for (std::uint32_t i = 1; i <= env_.config.client_count; ++i) {
    owned.push_back(layout.ClientSession(i));
  }
  for (const auto& name : owned) {
    std::string error;
    if (!env_.guard.ForceReclaim(ResourceKind::kSession, name, error)) {
      env_.logger.Warn("session not terminated", {{"session", name}, {"error", error}});
      ok = false;
    }
  }
  return ok;
}

bool CleanupProtocol::StopServices(const TrialLayout&) {
  const auto stop = [this](services::IManagedService& service) {
    std::string error;
    if (service.Stop(env_.config.service_stop_timeout, error)) {
      return true;
    }
    env_.logger.Warn("service stop failed, forcing", {{"service", service.Name()}, {"error", error}});
    std::string force_error;
    if (!service.ForceStop(force_error)) {
      env_.logger.Error("service force stop failed",
                        {{"service", service.Name()}, {"error", force_error}});
      return false;
    }
    return true;
  };

  auto control_plane_stop = std::async(std::launch::async, [&stop, this]() {
    return stop(env_.control_plane);
  });
  auto core_stop = std::async(std::launch::async, [&stop, this]() { return stop(env_.core); });
  const bool control_plane_ok = control_plane_stop.get();
  const bool core_ok = core_stop.get();
  return control_plane_ok && core_ok;
}

bool CleanupProtocol::RemoveNamespaces(const TrialLayout& layout) {
  bool ok = true;
  if (env_.guard.ReleaseOwnedOfKind(layout.id().Label(), ResourceKind::kNamespace) != 0U) {
    ok = false;
  }
  for (std::uint32_t i = 1; i <= env_.config.client_count; ++i) {
    const std::string name = layout.NamespaceName(i);
    std::string error;
    if (!env_.guard.ForceReclaim(ResourceKind::kNamespace, name, error)) {
      env_.logger.Warn("namespace not removed", {{"namespace", name}, {"error", error}});
      ok = false;
    }
  }
  return ok;
}

bool CleanupProtocol::KillLingeringProcesses(const TrialLayout&) {
  bool ok = true;
  for (const auto& pattern : env_.config.kill_patterns) {
    std::string error;
    if (!env_.guard.KillByPattern(pattern, error)) {
      env_.logger.Warn("pattern kill failed", {{"pattern", pattern}, {"error", error}});
      ok = false;
    }
  }
  return ok;
}

bool CleanupProtocol::FreePorts(const TrialLayout& layout) {
  bool ok = true;
  if (env_.guard.ReleaseOwnedOfKind(layout.id().Label(), ResourceKind::kPort) != 0U) {
    ok = false;
  }
  for (const std::uint16_t port : env_.config.cleanup_ports) {
    std::string error;
    if (!env_.guard.ForceReclaim(ResourceKind::kPort, std::to_string(port), error)) {
      env_.logger.Warn("port not freed", {{"port", std::to_string(port)}, {"error", error}});
      ok = false;
    }
  }
  return ok;
}

bool CleanupProtocol::RemoveTempFiles(const TrialLayout& layout) {
  std::vector<std::string> errors;
  std::size_t removed = 0;
  for (const auto& pattern : env_.config.temp_file_patterns) {
    removed += core::RemoveFilesMatching(env_.config.temp_dir, pattern, errors);
  }
  removed += core::RemoveFilesMatching(layout.RadioLogDir(), "*.log", errors);
  for (const auto& error : errors) {
    env_.logger.Warn("temp file not removed", {{"error", error}});
  }
  env_.logger.Debug("temp files removed", {{"count", std::to_string(removed)}});
  return errors.empty();
}

bool CleanupProtocol::RemoveClientRoute(const TrialLayout&) {
  if (!env_.host.RouteExists(env_.config.client_route)) {
    return true;
  }
  std::string error;
  if (!env_.host.DeleteRoute(env_.config.client_route, error)) {
    env_.logger.Warn("client route not removed",
                     {{"route", env_.config.client_route}, {"error", error}});
    return false;
  }
  env_.logger.Info("client route removed", {{"route", env_.config.client_route}});
  return true;
}

} // namespace ranops::trial

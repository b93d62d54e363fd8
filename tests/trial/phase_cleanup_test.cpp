#include "../common/lab_fixture.hpp"
#include "../common/temp_dir.hpp"
#include "core/errors/orchestration_error.hpp"
#include "orchestration/cancellation_token.hpp"
#include "orchestration/resource_guard.hpp"
#include "trial/cleanup.hpp"
#include "trial/phase.hpp"
#include "trial/phase_runner.hpp"
#include "trial/trial_environment.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

using ranops::core::errors::ErrorKind;
using ranops::core::errors::OrchestrationError;
using ranops::orchestration::CancellationToken;
using ranops::orchestration::ResourceGuard;
using ranops::tests::common::LabFixture;
using ranops::tests::common::LabKnobs;
using ranops::tests::common::ScopedTempDir;
using ranops::trial::CleanupProtocol;
using ranops::trial::Phase;
using ranops::trial::PhaseRunner;
using ranops::trial::TrialEnvironment;
using ranops::trial::TrialId;
using ranops::trial::TrialLayout;

namespace {

struct FailureCase {
  Phase phase;
  ErrorKind kind;
  std::function<void(LabFixture&)> arrange;
  // Checks the host state the failed phase left, before cleanup runs.
  std::function<void(const LabFixture&)> verify;
};

std::vector<FailureCase> FailureCases() {
  return {
      {Phase::kControlPlaneUp, ErrorKind::kTimeout,
       [](LabFixture& lab) { lab.control_plane.SetNeverReady(true); }},
      {Phase::kCoreUp, ErrorKind::kTimeout, [](LabFixture& lab) { lab.core.SetNeverReady(true); }},
      {Phase::kRadioNodeUp, ErrorKind::kTimeout,
       [](LabFixture& lab) {
         LabKnobs knobs;
         knobs.radio_attaches = false;
         lab.SetKnobs(knobs);
       }},
      {Phase::kNamespacesReady, ErrorKind::kTimeout,
       [](LabFixture& lab) { lab.config.bridge_address = "10.99.0.1"; }},
      {Phase::kClientsAttached, ErrorKind::kStartFailure,
       [](LabFixture& lab) {
         LabKnobs knobs;
         knobs.client_session_fails = true;
         lab.SetKnobs(knobs);
       },
       [](const LabFixture& lab) {
         // The first client failure ends the phase; later clients never start.
         const auto started = lab.host.StartedSessions();
         REQUIRE(std::count(started.begin(), started.end(), "ue1") ==
                 static_cast<std::ptrdiff_t>(lab.config.client_start_retry.max_attempts));
         REQUIRE(std::count(started.begin(), started.end(), "ue2") == 0);
         REQUIRE(std::count(started.begin(), started.end(), "ue3") == 0);
       }},
      {Phase::kScenarioRunning, ErrorKind::kStartFailure,
       [](LabFixture& lab) {
         LabKnobs knobs;
         knobs.scenario_exit_code = 1;
         lab.SetKnobs(knobs);
       }},
      {Phase::kClientsConnected, ErrorKind::kTimeout,
       [](LabFixture& lab) {
         LabKnobs knobs;
         knobs.clients_connect = false;
         lab.SetKnobs(knobs);
       }},
      {Phase::kTrafficRunning, ErrorKind::kStartFailure,
       [](LabFixture& lab) {
         LabKnobs knobs;
         knobs.failing_traffic_namespace = "ue3";
         lab.SetKnobs(knobs);
       },
       [](const LabFixture& lab) {
         // ue1 and ue2 were running when ue3 failed; both are stopped before
         // the phase reports the failure.
         const auto spawned = lab.host.SpawnedCommands();
         REQUIRE(spawned.size() == 3U);
         REQUIRE(spawned[2].rfind("traffic ue3 ", 0) == 0U);
         REQUIRE(lab.host.SignalledPids().size() == 2U);
         REQUIRE(lab.host.LiveSpawnedCount() == 0U);
       }},
      {Phase::kValidated, ErrorKind::kValidationFailure,
       [](LabFixture& lab) {
         LabKnobs knobs;
         knobs.header_only_artifacts = 1U;
         lab.SetKnobs(knobs);
       }},
  };
}

} // namespace

TEST_CASE("Cleanup leaves nothing behind after a failure in any phase", "[trial][cleanup]") {
  for (const auto& failure : FailureCases()) {
    CAPTURE(ranops::trial::ToString(failure.phase));
    ScopedTempDir temp("ranops-phase-cleanup");
    LabFixture lab(temp.path());
    failure.arrange(lab);
    const TrialId id{0U, 1U};
    lab.WriteTrial(id);

    CancellationToken token;
    ResourceGuard guard(lab.host, token, lab.logger, lab.guard_options);
    const TrialEnvironment env{lab.config, lab.host, guard, lab.control_plane,
                               lab.core,   lab.logger, token};
    const TrialLayout layout(lab.config, id);
    std::string setup_error;
    REQUIRE(layout.PrepareDirectories(setup_error));

    std::vector<Phase> entered;
    std::optional<Phase> failed_phase;
    OrchestrationError error;
    PhaseRunner runner(env, layout);
    REQUIRE_FALSE(runner.RunAll([&entered](Phase phase) { entered.push_back(phase); },
                                failed_phase, error));
    REQUIRE(failed_phase.has_value());
    REQUIRE(*failed_phase == failure.phase);
    REQUIRE(entered.back() == failure.phase);
    REQUIRE(error.kind == failure.kind);
    if (failure.verify) {
      failure.verify(lab);
    }

    CleanupProtocol cleanup(env);
    const auto report = cleanup.Run(layout, "test");
    REQUIRE(report.release_failures == 0U);
    REQUIRE(guard.LiveCount() == 0U);
    REQUIRE(lab.HostIsClean());
    REQUIRE_FALSE(std::filesystem::exists(lab.config.scenario_pid_file));
  }
}

TEST_CASE("A full attempt succeeds and cleanup releases everything it acquired",
          "[trial][cleanup]") {
  ScopedTempDir temp("ranops-phase-cleanup");
  LabFixture lab(temp.path());
  const TrialId id{0U, 1U};
  lab.WriteTrial(id);

  CancellationToken token;
  ResourceGuard guard(lab.host, token, lab.logger, lab.guard_options);
  const TrialEnvironment env{lab.config, lab.host, guard, lab.control_plane,
                             lab.core,   lab.logger, token};
  const TrialLayout layout(lab.config, id);
  std::string setup_error;
  REQUIRE(layout.PrepareDirectories(setup_error));

  std::vector<Phase> entered;
  std::optional<Phase> failed_phase;
  OrchestrationError error;
  PhaseRunner runner(env, layout);
  REQUIRE(runner.RunAll([&entered](Phase phase) { entered.push_back(phase); }, failed_phase,
                        error));
  REQUIRE(entered.size() == 9U);
  REQUIRE_FALSE(failed_phase.has_value());
  REQUIRE(guard.LiveCountFor(id.Label()) > 0U);
  REQUIRE(lab.host.NamespaceCount() == 3U);
  // Traffic generators are stopped by the phase itself.
  REQUIRE(lab.host.LiveSpawnedCount() == 0U);
  REQUIRE(lab.host.SpawnedCommands().size() == 3U);

  CleanupProtocol cleanup(env);
  const auto report = cleanup.Run(layout, "test");
  REQUIRE(report.steps_with_failures == 0U);
  REQUIRE(guard.LiveCount() == 0U);
  REQUIRE(lab.HostIsClean());
  REQUIRE(lab.control_plane.StopCalls() == 1U);
  REQUIRE(lab.core.StopCalls() == 1U);
}

TEST_CASE("Stale leftovers from a crashed run are reclaimed on acquire", "[trial][cleanup]") {
  ScopedTempDir temp("ranops-phase-cleanup");
  LabFixture lab(temp.path());
  const TrialId id{0U, 1U};
  lab.WriteTrial(id);

  lab.host.AddSession(lab.config.radio_session);
  lab.host.AddSession("ue2");
  lab.host.AddNamespaceDirect("ue1");
  const int stale_gnb = lab.host.AddProcess("sudo gnb -c old.yaml");
  lab.host.AddPortHolder(2000, stale_gnb);

  CancellationToken token;
  ResourceGuard guard(lab.host, token, lab.logger, lab.guard_options);
  const TrialEnvironment env{lab.config, lab.host, guard, lab.control_plane,
                             lab.core,   lab.logger, token};
  const TrialLayout layout(lab.config, id);
  std::string setup_error;
  REQUIRE(layout.PrepareDirectories(setup_error));

  std::optional<Phase> failed_phase;
  OrchestrationError error;
  PhaseRunner runner(env, layout);
  REQUIRE(runner.RunAll({}, failed_phase, error));
  REQUIRE_FALSE(lab.host.IsProcessAlive(stale_gnb));

  CleanupProtocol cleanup(env);
  cleanup.Run(layout, "test");
  REQUIRE(lab.HostIsClean());
}

TEST_CASE("Cleanup is idempotent and falls back to force-stop", "[trial][cleanup]") {
  ScopedTempDir temp("ranops-phase-cleanup");
  LabFixture lab(temp.path());
  lab.control_plane.SetStopFails(true);
  const TrialId id{0U, 1U};

  CancellationToken token;
  ResourceGuard guard(lab.host, token, lab.logger, lab.guard_options);
  const TrialEnvironment env{lab.config, lab.host, guard, lab.control_plane,
                             lab.core,   lab.logger, token};
  const TrialLayout layout(lab.config, id);
  CleanupProtocol cleanup(env);

  cleanup.Run(layout, "first");
  cleanup.Run(layout, "second");
  REQUIRE(lab.control_plane.StopCalls() == 2U);
  REQUIRE(lab.control_plane.ForceStopCalls() == 2U);
  REQUIRE(lab.core.ForceStopCalls() == 0U);
  REQUIRE(lab.HostIsClean());

  const std::string log = lab.Log();
  REQUIRE(log.find("step=\"9/9\"") != std::string::npos);
}

TEST_CASE("Cleanup still completes after cancellation", "[trial][cleanup]") {
  ScopedTempDir temp("ranops-phase-cleanup");
  LabFixture lab(temp.path());
  const TrialId id{0U, 1U};
  lab.host.AddNamespaceDirect("ue1");
  lab.host.AddSession("ue3");
  lab.host.AddRouteDirect(lab.config.client_route);

  CancellationToken token;
  token.Cancel("sigint");
  ResourceGuard guard(lab.host, token, lab.logger, lab.guard_options);
  const TrialEnvironment env{lab.config, lab.host, guard, lab.control_plane,
                             lab.core,   lab.logger, token};
  CleanupProtocol cleanup(env);
  cleanup.Run(TrialLayout(lab.config, id), "interrupted");
  REQUIRE(lab.HostIsClean());
}

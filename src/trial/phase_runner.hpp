#pragma once

#include "core/errors/orchestration_error.hpp"
#include "orchestration/resource_guard.hpp"
#include "trial/phase.hpp"
#include "trial/trial_environment.hpp"
#include "trial/trial_layout.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ranops::trial {

// Invoked when a phase is entered, before its start action runs.
using PhaseTransitionCallback = std::function<void(Phase)>;

// Drives one trial attempt through the ordered phases. Each phase composes
// HealthPoller, RetryExecutor and ResourceGuard; every resource it acquires is
// owned by the trial label, so the cleanup protocol can release whatever an
// aborted attempt left behind.
//
// A runner is single-use: construct one per attempt.
class PhaseRunner {
public:
  PhaseRunner(const TrialEnvironment& env, const TrialLayout& layout);

  // Runs every phase in order. On failure `failed_phase` names the phase that
  // aborted the attempt and `error` carries its reason.
  bool RunAll(const PhaseTransitionCallback& on_enter, std::optional<Phase>& failed_phase,
              core::errors::OrchestrationError& error);

  bool RunPhase(Phase phase, core::errors::OrchestrationError& error);

private:
  struct TrafficGenerator {
    std::string client;
    int pid = -1;
    orchestration::ResourceHandle pid_file;
  };

  bool ControlPlaneUp(core::errors::OrchestrationError& error);
  bool CoreUp(core::errors::OrchestrationError& error);
  bool RadioNodeUp(core::errors::OrchestrationError& error);
  bool NamespacesReady(core::errors::OrchestrationError& error);
  bool ClientsAttached(core::errors::OrchestrationError& error);
  bool ScenarioRunning(core::errors::OrchestrationError& error);
  bool ClientsConnected(core::errors::OrchestrationError& error);
  bool TrafficRunning(core::errors::OrchestrationError& error);
  bool Validated(core::errors::OrchestrationError& error);

  bool StartService(services::IManagedService& service, const config::ServiceConfig& settings,
                    core::errors::OrchestrationError& error);
  bool StartMetricsSink(core::errors::OrchestrationError& error);
  bool StartRadioNode(core::errors::OrchestrationError& error);
  bool StartClient(std::uint32_t index, const ClientIdentity& identity,
                   core::errors::OrchestrationError& error);
  // Waits for one client's log and attach markers. A failure cancels
  // `siblings` so the other waits return promptly.
  core::errors::OrchestrationError WaitForClient(std::uint32_t index,
                                                 orchestration::CancellationToken& siblings);
  bool Acquire(orchestration::ResourceKind kind, const std::string& id,
               orchestration::ResourceHandle& handle, core::errors::OrchestrationError& error);
  void StopGenerators();

  const TrialEnvironment& env_;
  const TrialLayout& layout_;
  std::string owner_;
  orchestration::ResourceHandle radio_session_;
  std::vector<orchestration::ResourceHandle> client_sessions_;
  std::vector<TrafficGenerator> generators_;
};

} // namespace ranops::trial

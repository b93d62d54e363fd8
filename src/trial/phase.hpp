#pragma once

#include <array>

namespace ranops::trial {

// Strictly ordered steps of one trial attempt. A failure aborts the attempt;
// no phase is skipped or reordered.
enum class Phase {
  kControlPlaneUp,
  kCoreUp,
  kRadioNodeUp,
  kNamespacesReady,
  kClientsAttached,
  kScenarioRunning,
  kClientsConnected,
  kTrafficRunning,
  kValidated,
};

inline constexpr std::array<Phase, 9> kPhaseOrder = {
    Phase::kControlPlaneUp,  Phase::kCoreUp,           Phase::kRadioNodeUp,
    Phase::kNamespacesReady, Phase::kClientsAttached,  Phase::kScenarioRunning,
    Phase::kClientsConnected, Phase::kTrafficRunning,  Phase::kValidated,
};

inline const char* ToString(Phase phase) {
  switch (phase) {
  case Phase::kControlPlaneUp:
    return "ControlPlaneUp";
  case Phase::kCoreUp:
    return "CoreUp";
  case Phase::kRadioNodeUp:
    return "RadioNodeUp";
  case Phase::kNamespacesReady:
    return "NamespacesReady";
  case Phase::kClientsAttached:
    return "ClientsAttached";
  case Phase::kScenarioRunning:
    return "ScenarioRunning";
  case Phase::kClientsConnected:
    return "ClientsConnected";
  case Phase::kTrafficRunning:
    return "TrafficRunning";
  case Phase::kValidated:
    return "Validated";
  }
  return "ControlPlaneUp";
}

} // namespace ranops::trial

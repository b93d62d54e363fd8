#pragma once

#include "config/orchestrator_config.hpp"
#include "core/logging/logger.hpp"
#include "host/host_control.hpp"
#include "orchestration/cancellation_token.hpp"
#include "orchestration/resource_guard.hpp"
#include "services/managed_service.hpp"

namespace ranops::trial {

// Collaborators shared by the phase runner, the cleanup protocol and the
// trial controller. Non-owning; everything outlives the run.
struct TrialEnvironment {
  const config::OrchestratorConfig& config;
  host::IHostControl& host;
  orchestration::ResourceGuard& guard;
  services::IManagedService& control_plane;
  services::IManagedService& core;
  core::logging::Logger& logger;
  const orchestration::CancellationToken& token;
};

} // namespace ranops::trial

#pragma once

#include "trial/trial_environment.hpp"
#include "trial/trial_layout.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace ranops::trial {

struct CleanupReport {
  // Steps that logged at least one failure.
  std::size_t steps_with_failures = 0;
  // Handles whose final release failed.
  std::size_t release_failures = 0;
};

// The single teardown path, shared by success, attempt failure, between-grid
// cells and signal exit. Steps run in a fixed order; each step logs its own
// failures and never stops the ones after it.
//
//   1. traffic generators   4. managed services    7. radio ports
//   2. background processes 5. client namespaces   8. temp and log files
//   3. sessions             6. pattern kills       9. client route
//
// Afterwards every handle still owned by the trial is released in reverse
// acquisition order. Waits inside cleanup are bounded but ignore the run's
// cancellation token.
class CleanupProtocol {
public:
  explicit CleanupProtocol(const TrialEnvironment& env) : env_(env) {}

  CleanupReport Run(const TrialLayout& layout, std::string_view reason);

private:
  using Step = std::function<bool(const TrialLayout&)>;

  bool RunStep(std::size_t number, std::string_view name, const Step& step,
               const TrialLayout& layout);

  bool StopTrafficGenerators(const TrialLayout& layout);
  bool StopBackgroundProcesses(const TrialLayout& layout);
  bool TerminateSessions(const TrialLayout& layout);
  bool StopServices(const TrialLayout& layout);
  bool RemoveNamespaces(const TrialLayout& layout);
  bool KillLingeringProcesses(const TrialLayout& layout);
  bool FreePorts(const TrialLayout& layout);
  bool RemoveTempFiles(const TrialLayout& layout);
  bool RemoveClientRoute(const TrialLayout& layout);

  const TrialEnvironment& env_;
};

} // namespace ranops::trial

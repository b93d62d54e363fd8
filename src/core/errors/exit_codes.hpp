#pragma once

namespace ranops::core::errors {

// Stable process-exit contract for wrapper scripts.
//
// The first three values preserve conventional meanings used by scripts:
// - 0 success (full grid or single cell traversed, failed cells included)
// - 1 generic command failure
// - 2 usage/argument failure
//
// Additional values classify run-level outcomes so wrappers can branch
// without scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kPreflightFailed = 10,
  kConfigInvalid = 11,
  kInterrupted = 130,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace ranops::core::errors

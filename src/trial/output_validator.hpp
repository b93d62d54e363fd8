#pragma once

#include "core/errors/orchestration_error.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>

namespace ranops::trial {

struct ValidationReport {
  std::size_t data_rows = 0;
  double first_epoch_seconds = 0.0;
  double last_epoch_seconds = 0.0;
  double span_seconds = 0.0;
};

// Checks the trial's metrics artifact: it exists, has data rows under a
// header with a `Timestamp` column, every timestamp parses, and the
// max - min span is within `expected +- tolerance` (inclusive).
// Every violation is a kValidationFailure.
bool ValidateMetricsArtifact(const std::filesystem::path& csv_path,
                             std::chrono::milliseconds expected_span,
                             std::chrono::milliseconds tolerance, ValidationReport& report,
                             core::errors::OrchestrationError& error);

} // namespace ranops::trial

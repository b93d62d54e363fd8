#include "trial/output_validator.hpp"

#include "core/string_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace ranops::trial {

using core::errors::ErrorKind;
using core::errors::MakeError;

namespace {

std::string StripQuotes(std::string value) {
  if (value.size() >= 2U && value.front() == '"' && value.back() == '"') {
    return value.substr(1, value.size() - 2U);
  }
  return value;
}

std::string FormatSeconds(double seconds) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << seconds;
  return out.str();
}

} // namespace

bool ValidateMetricsArtifact(const fs::path& csv_path, const std::chrono::milliseconds expected_span,
                             const std::chrono::milliseconds tolerance, ValidationReport& report,
                             core::errors::OrchestrationError& error) {
  report = ValidationReport{};
  std::error_code ec;
  if (!fs::is_regular_file(csv_path, ec)) {
    error = MakeError(ErrorKind::kValidationFailure,
                      "metrics artifact not found: " + csv_path.string());
    return false;
  }

  std::ifstream in(csv_path, std::ios::binary);
  if (!in) {
    error = MakeError(ErrorKind::kValidationFailure,
                      "unable to read metrics artifact: " + csv_path.string());
    return false;
  }

  std::string header;
  if (!std::getline(in, header)) {
    error = MakeError(ErrorKind::kValidationFailure, "metrics artifact is empty");
    return false;
  }
  if (header.size() >= 3U && header.compare(0, 3, "\xEF\xBB\xBF") == 0) {
    header.erase(0, 3);
  }

  const std::vector<std::string> columns = core::SplitCsvLine(header);
  std::size_t ts_index = columns.size();
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (StripQuotes(columns[i]) == "Timestamp") {
      ts_index = i;
      break;
    }
  }

  std::vector<std::string> rows;
  std::string line;
  while (std::getline(in, line)) {
    if (!core::Trim(line).empty()) {
      rows.push_back(line);
    }
  }
  if (rows.empty()) {
    error = MakeError(ErrorKind::kValidationFailure,
                      "metrics artifact has only a header row: " + csv_path.string());
    return false;
  }
  if (ts_index == columns.size()) {
    error = MakeError(ErrorKind::kValidationFailure,
                      "Timestamp column not found in metrics artifact header");
    return false;
  }

  double min_epoch = 0.0;
  double max_epoch = 0.0;
  for (std::size_t row = 0; row < rows.size(); ++row) {
    const std::vector<std::string> fields = core::SplitCsvLine(rows[row]);
    double epoch = 0.0;
    if (ts_index >= fields.size() || !core::ParseTimestampSeconds(fields[ts_index], epoch)) {
      const std::string raw = ts_index < fields.size() ? fields[ts_index] : std::string();
      error = MakeError(ErrorKind::kValidationFailure,
                        "unparseable timestamp '" + raw + "' on data row " +
                            std::to_string(row + 1U));
      return false;
    }
    if (row == 0U) {
      min_epoch = epoch;
      max_epoch = epoch;
    } else {
      min_epoch = std::min(min_epoch, epoch);
      max_epoch = std::max(max_epoch, epoch);
    }
  }

  report.data_rows = rows.size();
  report.first_epoch_seconds = min_epoch;
  report.last_epoch_seconds = max_epoch;
  report.span_seconds = max_epoch - min_epoch;

  const double expected = static_cast<double>(expected_span.count()) / 1000.0;
  const double slack = static_cast<double>(tolerance.count()) / 1000.0;
  if (report.span_seconds < expected - slack || report.span_seconds > expected + slack) {
    error = MakeError(ErrorKind::kValidationFailure,
                      "metrics span " + FormatSeconds(report.span_seconds) +
                          "s outside expected " + FormatSeconds(expected) + "s +- " +
                          FormatSeconds(slack) + "s");
    return false;
  }
  return true;
}

} // namespace ranops::trial

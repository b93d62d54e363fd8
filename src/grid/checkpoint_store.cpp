#include "grid/checkpoint_store.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <string_view>

namespace fs = std::filesystem;

namespace ranops::grid {

namespace {

using JsonValue = core::json::Value;
using JsonObject = JsonValue::Object;

bool ParseUnsigned(const JsonValue& field, std::string_view key, std::uint64_t limit,
                   std::uint64_t& value, std::string& error) {
  const double number = field.number_value;
  if (field.type != JsonValue::Type::kNumber || !std::isfinite(number) || number < 0.0 ||
      std::floor(number) != number || number >= static_cast<double>(limit) + 1.0) {
    error = "checkpoint field '" + std::string(key) + "' must be a non-negative integer";
    return false;
  }
  value = static_cast<std::uint64_t>(number);
  return true;
}

bool ParseRequiredUnsignedField(const JsonObject& object, std::string_view key,
                                std::uint64_t limit, std::uint64_t& value, std::string& error) {
  const auto it = object.find(std::string(key));
  if (it == object.end()) {
    error = "checkpoint missing required field '" + std::string(key) + "'";
    return false;
  }
  return ParseUnsigned(it->second, key, limit, value, error);
}

void ParseOptionalStringField(const JsonObject& object, std::string_view key,
                              std::string& value) {
  const auto it = object.find(std::string(key));
  if (it != object.end() && it->second.type == JsonValue::Type::kString) {
    value = it->second.string_value;
  }
}

} // namespace

std::string ResumeHint(const RunCheckpoint& checkpoint) {
  return "ranops " + std::to_string(checkpoint.trial_set) + " " +
         std::to_string(checkpoint.experiment);
}

bool WriteCheckpoint(const RunCheckpoint& checkpoint, const fs::path& output_path,
                     std::string& error) {
  error.clear();
  if (output_path.empty()) {
    error = "checkpoint output path cannot be empty";
    return false;
  }

  std::ostringstream out;
  out << "{\n"
      << "  \"training_set\": " << checkpoint.trial_set << ",\n"
      << "  \"experiment\": " << checkpoint.experiment << ",\n"
      << "  \"step\": \"" << core::EscapeJson(checkpoint.step) << "\",\n"
      << "  \"retry_count\": " << checkpoint.retry_count << ",\n"
      << "  \"timestamp\": \"" << core::FormatUtcTimestamp(checkpoint.updated_at) << "\",\n"
      << "  \"updated_at_epoch_ms\": " << core::ToEpochMilliseconds(checkpoint.updated_at) << ",\n"
      << "  \"retry_counts\": {";
  bool first = true;
  for (const auto& [key, count] : checkpoint.retry_counts) {
    out << (first ? "\n" : ",\n") << "    \"" << core::EscapeJson(key) << "\": " << count;
    first = false;
  }
  out << (first ? "},\n" : "\n  },\n")
      << "  \"last_completed\": \"" << core::EscapeJson(checkpoint.last_completed) << "\",\n"
      << "  \"completed_runs\": " << checkpoint.completed_runs << ",\n"
      << "  \"resume_hint\": \"" << core::EscapeJson(ResumeHint(checkpoint)) << "\"\n"
      << "}\n";

  if (!core::WriteTextFileAtomic(output_path, out.str(), error)) {
    error = "failed while writing checkpoint '" + output_path.string() + "' (" + error + ")";
    return false;
  }
  return true;
}

bool LoadCheckpoint(const fs::path& checkpoint_path, RunCheckpoint& checkpoint,
                    std::string& error) {
  checkpoint = RunCheckpoint{};

  std::string text;
  if (!core::ReadTextFile(checkpoint_path, text, error)) {
    return false;
  }

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(text, root, parse_error)) {
    error = "invalid checkpoint JSON '" + checkpoint_path.string() + "': " + parse_error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "checkpoint root must be a JSON object";
    return false;
  }

  const JsonObject& object = root.object_value;
  constexpr std::uint64_t kMaxIndex = std::numeric_limits<std::uint32_t>::max();
  std::uint64_t trial_set = 0;
  std::uint64_t experiment = 0;
  std::uint64_t retry_count = 0;
  std::uint64_t completed_runs = 0;
  if (!ParseRequiredUnsignedField(object, "training_set", kMaxIndex, trial_set, error) ||
      !ParseRequiredUnsignedField(object, "experiment", kMaxIndex, experiment, error) ||
      !ParseRequiredUnsignedField(object, "retry_count", kMaxIndex, retry_count, error)) {
    error = "checkpoint parse failed for '" + checkpoint_path.string() + "': " + error;
    return false;
  }
  // Older state files carry only the cell position.
  const auto completed_it = object.find("completed_runs");
  if (completed_it != object.end() &&
      !ParseUnsigned(completed_it->second, "completed_runs",
                     std::numeric_limits<std::uint64_t>::max(), completed_runs, error)) {
    return false;
  }

  const auto counts_it = object.find("retry_counts");
  if (counts_it != object.end()) {
    if (counts_it->second.type != JsonValue::Type::kObject) {
      error = "checkpoint field 'retry_counts' must be an object";
      return false;
    }
    for (const auto& [key, value] : counts_it->second.object_value) {
      std::uint64_t count = 0;
      if (!ParseUnsigned(value, "retry_counts." + key, kMaxIndex, count, error)) {
        return false;
      }
      checkpoint.retry_counts[key] = static_cast<std::uint32_t>(count);
    }
  }

  const auto updated_it = object.find("updated_at_epoch_ms");
  if (updated_it != object.end() && updated_it->second.type == JsonValue::Type::kNumber) {
    // Bounded by what system_clock can represent, not just by int64.
    const double max_ms = static_cast<double>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::duration::max())
            .count());
    const double epoch_ms = updated_it->second.number_value;
    if (!std::isfinite(epoch_ms) || std::fabs(epoch_ms) >= max_ms) {
      error = "checkpoint field 'updated_at_epoch_ms' is out of range";
      return false;
    }
    checkpoint.updated_at = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(static_cast<std::int64_t>(epoch_ms)));
  }

  checkpoint.trial_set = static_cast<std::uint32_t>(trial_set);
  checkpoint.experiment = static_cast<std::uint32_t>(experiment);
  checkpoint.retry_count = static_cast<std::uint32_t>(retry_count);
  checkpoint.completed_runs = completed_runs;
  ParseOptionalStringField(object, "step", checkpoint.step);
  ParseOptionalStringField(object, "last_completed", checkpoint.last_completed);
  return true;
}

} // namespace ranops::grid

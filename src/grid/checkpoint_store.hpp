#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace ranops::grid {

// Progress snapshot rewritten after every phase transition. It is operator
// visibility only: nothing reads it back to drive scheduling, but the CLI logs
// it as a resume hint on the next start.
struct RunCheckpoint {
  std::uint32_t trial_set = 0;
  std::uint32_t experiment = 1;
  // Phase name, "starting", "cleanup" or "finished".
  std::string step;
  std::uint32_t retry_count = 0;
  // Failed attempts per trial, keyed "trN_expM".
  std::map<std::string, std::uint32_t> retry_counts;
  // Label of the last cell that finished successfully, "trN/expM".
  std::string last_completed;
  std::uint64_t completed_runs = 0;
  std::chrono::system_clock::time_point updated_at{};
};

bool WriteCheckpoint(const RunCheckpoint& checkpoint, const std::filesystem::path& output_path,
                     std::string& error);

bool LoadCheckpoint(const std::filesystem::path& checkpoint_path, RunCheckpoint& checkpoint,
                    std::string& error);

// CLI arguments that restart the grid at the checkpoint's cell.
std::string ResumeHint(const RunCheckpoint& checkpoint);

} // namespace ranops::grid

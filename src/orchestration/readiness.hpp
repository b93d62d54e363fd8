#pragma once

#include "orchestration/health_poller.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace ranops::orchestration {

// Per-marker presence in a log file, in the order given. A missing file
// reports every marker absent.
std::vector<bool> ScanLogForMarkers(const std::filesystem::path& log_path,
                                    const std::vector<std::string>& markers);

// Ready once every marker has appeared in the log. A partial match (for
// example core attach seen but control-plane attach not yet) is not ready.
ReadinessPredicate LogContainsAll(std::filesystem::path log_path,
                                  std::vector<std::string> markers);

ReadinessPredicate FileExists(std::filesystem::path path);

// Tail of `log_path` formatted for an ERROR log field, one indented line per
// log line.
std::string FormatLogTail(const std::filesystem::path& log_path, std::size_t max_lines);

} // namespace ranops::orchestration

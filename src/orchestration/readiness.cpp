#include "orchestration/readiness.hpp"

#include "core/fs_utils.hpp"

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace ranops::orchestration {

std::vector<bool> ScanLogForMarkers(const fs::path& log_path,
                                    const std::vector<std::string>& markers) {
  std::vector<bool> seen(markers.size(), false);
  std::string contents;
  std::string error;
  if (!core::ReadTextFile(log_path, contents, error)) {
    return seen;
  }
  for (std::size_t i = 0; i < markers.size(); ++i) {
    seen[i] = contents.find(markers[i]) != std::string::npos;
  }
  return seen;
}

ReadinessPredicate LogContainsAll(fs::path log_path, std::vector<std::string> markers) {
  return [log_path = std::move(log_path), markers = std::move(markers)]() {
    const std::vector<bool> seen = ScanLogForMarkers(log_path, markers);
    for (const bool marker_seen : seen) {
      if (!marker_seen) {
        return false;
      }
    }
    return true;
  };
}

ReadinessPredicate FileExists(fs::path path) {
  return [path = std::move(path)]() {
    std::error_code ec;
    return fs::exists(path, ec) && !ec;
  };
}

std::string FormatLogTail(const fs::path& log_path, const std::size_t max_lines) {
  const std::vector<std::string> lines = core::TailLines(log_path, max_lines);
  if (lines.empty()) {
    return "(no log output at " + log_path.string() + ")";
  }
  std::string out;
  for (const auto& line : lines) {
    if (!out.empty()) {
      out.push_back('\n');
    }
    out += "    " + line;
  }
  return out;
}

} // namespace ranops::orchestration

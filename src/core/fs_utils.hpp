#ifndef RANOPS_CORE_FS_UTILS_HPP_
#define RANOPS_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <deque>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ranops::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

// Best-effort atomic text file write:
// 1) write full content to a temporary sibling file
// 2) rename temp file into final destination
//
// On platforms/filesystems where rename-overwrite is restricted, we attempt a
// remove+rename fallback while still ensuring partially written output files are
// not published.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file << text;
    if (!out_file) {
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code remove_ec;
  (void)std::filesystem::remove(output_path, remove_ec);
  rename_ec.clear();
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}


inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read text file: " + path.string();
    return false;
  }

  contents.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  return true;
}

// Last `max_lines` lines of a log file, used as diagnostic context when a
// readiness wait times out. Missing files yield an empty result.
inline std::vector<std::string> TailLines(const std::filesystem::path& path,
                                          std::size_t max_lines) {
  std::vector<std::string> lines;
  std::ifstream file(path, std::ios::binary);
  if (!file || max_lines == 0U) {
    return lines;
  }

  std::deque<std::string> window;
  std::string line;
  while (std::getline(file, line)) {
    window.push_back(line);
    if (window.size() > max_lines) {
      window.pop_front();
    }
  }
  lines.assign(window.begin(), window.end());
  return lines;
}

// Shell-style match supporting `*` (any run) and `?` (any one character).
inline bool WildcardMatch(std::string_view pattern, std::string_view text) {
  std::size_t p = 0;
  std::size_t t = 0;
  std::size_t star = std::string_view::npos;
  std::size_t mark = 0;
  while (t < text.size()) {
    if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
      ++p;
      ++t;
    } else if (p < pattern.size() && pattern[p] == '*') {
      star = p++;
      mark = t;
    } else if (star != std::string_view::npos) {
      p = star + 1;
      t = ++mark;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*') {
    ++p;
  }
  return p == pattern.size();
}

// Removes regular files directly under `dir` whose names match `pattern`.
// Returns the number removed; per-file errors are appended to `errors`.
inline std::size_t RemoveFilesMatching(const std::filesystem::path& dir, std::string_view pattern,
                                       std::vector<std::string>& errors) {
  std::size_t removed = 0;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return removed;
  }

  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    errors.push_back("failed to list '" + dir.string() + "': " + ec.message());
    return removed;
  }
  for (const auto& entry : it) {
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec) ||
        !WildcardMatch(pattern, entry.path().filename().string())) {
      continue;
    }
    if (std::filesystem::remove(entry.path(), entry_ec)) {
      ++removed;
    } else if (entry_ec) {
      errors.push_back("failed to remove '" + entry.path().string() + "': " + entry_ec.message());
    }
  }
  return removed;
}

} // namespace ranops::core

#endif // RANOPS_CORE_FS_UTILS_HPP_

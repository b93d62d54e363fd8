#ifndef RANOPS_CORE_TIME_UTILS_HPP_
#define RANOPS_CORE_TIME_UTILS_HPP_

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace ranops::core {

// Canonical UTC timestamp formatter used by the logger and the state file.
// Millisecond precision keeps traces readable while preserving triage value.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

inline std::int64_t ToEpochMilliseconds(std::chrono::system_clock::time_point ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

namespace detail {

// Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant's algorithm).
inline std::int64_t DaysFromCivil(std::int64_t year, unsigned month, unsigned day) {
  year -= month <= 2 ? 1 : 0;
  const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
  const auto yoe = static_cast<unsigned>(year - era * 400);
  const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

inline bool ReadFixedDigits(std::string_view text, std::size_t& pos, std::size_t count,
                            int& value) {
  if (pos + count > text.size()) {
    return false;
  }
  value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    const char c = text[pos + i];
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  pos += count;
  return true;
}

inline bool ParseEpochNumber(std::string_view text, double& epoch_seconds) {
  if (text.empty()) {
    return false;
  }
  bool seen_digit = false;
  bool seen_dot = false;
  for (const char c : text) {
    if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
      seen_digit = true;
    } else if (c == '.' && !seen_dot) {
      seen_dot = true;
    } else {
      return false;
    }
  }
  if (!seen_digit) {
    return false;
  }
  const std::string owned(text);
  char* end = nullptr;
  errno = 0;
  const double parsed = std::strtod(owned.c_str(), &end);
  if (errno == ERANGE || end != owned.c_str() + owned.size() || !std::isfinite(parsed)) {
    return false;
  }
  epoch_seconds = parsed;
  return true;
}

} // namespace detail

// Parses `YYYY-MM-DD[T| ]HH:MM:SS[.fraction][Z|+HH:MM|-HH:MM]` or a plain
// epoch-seconds number. Timestamps without a zone are read as UTC; only the
// differences between timestamps of one table matter to callers.
inline bool ParseTimestampSeconds(std::string_view raw, double& epoch_seconds) {
  while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.front())) != 0) {
    raw.remove_prefix(1);
  }
  while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.back())) != 0) {
    raw.remove_suffix(1);
  }
  if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
    raw = raw.substr(1, raw.size() - 2);
  }

  if (detail::ParseEpochNumber(raw, epoch_seconds)) {
    return true;
  }

  std::size_t pos = 0;
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  if (!detail::ReadFixedDigits(raw, pos, 4, year) || pos >= raw.size() || raw[pos++] != '-' ||
      !detail::ReadFixedDigits(raw, pos, 2, month) || pos >= raw.size() || raw[pos++] != '-' ||
      !detail::ReadFixedDigits(raw, pos, 2, day)) {
    return false;
  }
  if (pos >= raw.size() || (raw[pos] != 'T' && raw[pos] != ' ')) {
    return false;
  }
  ++pos;
  if (!detail::ReadFixedDigits(raw, pos, 2, hour) || pos >= raw.size() || raw[pos++] != ':' ||
      !detail::ReadFixedDigits(raw, pos, 2, minute)) {
    return false;
  }
  if (pos < raw.size() && raw[pos] == ':') {
    ++pos;
    if (!detail::ReadFixedDigits(raw, pos, 2, second)) {
      return false;
    }
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
      second > 60) {
    return false;
  }

  double fraction = 0.0;
  if (pos < raw.size() && raw[pos] == '.') {
    ++pos;
    double scale = 0.1;
    std::size_t digits = 0;
    while (pos < raw.size() && std::isdigit(static_cast<unsigned char>(raw[pos])) != 0) {
      fraction += scale * (raw[pos] - '0');
      scale /= 10.0;
      ++pos;
      ++digits;
    }
    if (digits == 0U) {
      return false;
    }
  }

  int offset_seconds = 0;
  if (pos < raw.size()) {
    const char zone = raw[pos];
    if (zone == 'Z' || zone == 'z') {
      ++pos;
    } else if (zone == '+' || zone == '-') {
      ++pos;
      int offset_hours = 0;
      int offset_minutes = 0;
      if (!detail::ReadFixedDigits(raw, pos, 2, offset_hours)) {
        return false;
      }
      if (pos < raw.size() && raw[pos] == ':') {
        ++pos;
      }
      if (!detail::ReadFixedDigits(raw, pos, 2, offset_minutes)) {
        return false;
      }
      offset_seconds = (offset_hours * 3600 + offset_minutes * 60) * (zone == '+' ? 1 : -1);
    }
  }
  if (pos != raw.size()) {
    return false;
  }

  const std::int64_t days =
      detail::DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
  const std::int64_t whole = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;
  epoch_seconds = static_cast<double>(whole) + fraction;
  return true;
}

} // namespace ranops::core

#endif // RANOPS_CORE_TIME_UTILS_HPP_

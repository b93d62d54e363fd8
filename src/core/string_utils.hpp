#ifndef RANOPS_CORE_STRING_UTILS_HPP_
#define RANOPS_CORE_STRING_UTILS_HPP_

#include <cctype>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace ranops::core {

using TemplateVars = std::map<std::string, std::string>;

inline std::string Trim(std::string_view raw) {
  std::size_t begin = 0;
  std::size_t end = raw.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(raw[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1])) != 0) {
    --end;
  }
  return std::string(raw.substr(begin, end - begin));
}

// Replaces every `{name}` placeholder with its value. Unknown placeholders are
// left untouched so a typo in a config template stays visible in the logs.
inline std::string ExpandTemplate(std::string_view text, const TemplateVars& vars) {
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t open = text.find('{', pos);
    if (open == std::string_view::npos) {
      out.append(text.substr(pos));
      break;
    }
    const std::size_t close = text.find('}', open + 1);
    if (close == std::string_view::npos) {
      out.append(text.substr(pos));
      break;
    }
    out.append(text.substr(pos, open - pos));
    const std::string key(text.substr(open + 1, close - open - 1));
    const auto it = vars.find(key);
    if (it != vars.end()) {
      out.append(it->second);
    } else {
      out.append(text.substr(open, close - open + 1));
    }
    pos = close + 1;
  }
  return out;
}

// POSIX single-quote escaping for values spliced into `sh -c` commands.
inline std::string ShellQuote(std::string_view raw) {
  std::string out = "'";
  for (const char c : raw) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

// Comma split without quoting rules; the conditions manifest and client table
// never quote fields.
inline std::vector<std::string> SplitCsvLine(std::string_view line) {
  std::vector<std::string> fields;
  std::size_t pos = 0;
  while (true) {
    const std::size_t comma = line.find(',', pos);
    if (comma == std::string_view::npos) {
      fields.push_back(Trim(line.substr(pos)));
      break;
    }
    fields.push_back(Trim(line.substr(pos, comma - pos)));
    pos = comma + 1;
  }
  return fields;
}

inline std::string ToLowerAscii(std::string value) {
  for (char& c : value) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return value;
}

} // namespace ranops::core

#endif // RANOPS_CORE_STRING_UTILS_HPP_

#ifndef RANOPS_CORE_JSON_DOM_HPP_
#define RANOPS_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace ranops::core::json {

// Minimal DOM shared by the orchestrator config loader and the run checkpoint
// reader. Both documents are small and operator-edited.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;
};

// Recursive-descent reader. Failures report the line and column of the
// offending character.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    if (!ReadValue(root, error)) {
      return false;
    }
    SkipSpace();
    return pos_ == input_.size() || Fail("unexpected trailing content after JSON value", error);
  }

private:
  // Nesting limit for arrays and objects.
  static constexpr std::size_t kMaxDepth = 64;

  bool ReadValue(Value& value, std::string& error) {
    SkipSpace();
    if (pos_ == input_.size()) {
      return Fail("unexpected end of input while parsing value", error);
    }
    value = Value{};
    switch (input_[pos_]) {
    case '{':
      value.type = Value::Type::kObject;
      return ReadContainer('}', value, error);
    case '[':
      value.type = Value::Type::kArray;
      return ReadContainer(']', value, error);
    case '"':
      value.type = Value::Type::kString;
      return ReadString(value.string_value, error);
    case 't':
      value.type = Value::Type::kBool;
      value.bool_value = true;
      return ReadLiteral("true", error);
    case 'f':
      value.type = Value::Type::kBool;
      return ReadLiteral("false", error);
    case 'n':
      return ReadLiteral("null", error);
    default:
      value.type = Value::Type::kNumber;
      return ReadNumber(value.number_value, error);
    }
  }

  // Objects and arrays share the comma/close handling; objects also read a
  // key and ':' before each member.
  bool ReadContainer(const char close, Value& value, std::string& error) {
    if (++depth_ > kMaxDepth) {
      return Fail("nesting too deep", error);
    }
    ++pos_;
    SkipSpace();
    if (Accept(close)) {
      --depth_;
      return true;
    }
    const bool is_object = close == '}';
    while (true) {
      Value item;
      if (is_object) {
        std::string key;
        SkipSpace();
        if (!ReadString(key, error)) {
          return false;
        }
        SkipSpace();
        if (!Accept(':')) {
          return Fail("expected ':' after object key", error);
        }
        if (!ReadValue(item, error)) {
          return false;
        }
        value.object_value[key] = std::move(item);
      } else {
        if (!ReadValue(item, error)) {
          return false;
        }
        value.array_value.push_back(std::move(item));
      }
      SkipSpace();
      if (Accept(close)) {
        --depth_;
        return true;
      }
      if (!Accept(',')) {
        return Fail(is_object ? "expected ',' or '}' in object" : "expected ',' or ']' in array",
                    error);
      }
    }
  }

  bool ReadString(std::string& out, std::string& error) {
    if (!Accept('"')) {
      return Fail("expected '\"' to start string", error);
    }
    out.clear();
    while (pos_ < input_.size()) {
      const char c = input_[pos_++];
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        --pos_;
        return Fail("control character in string", error);
      }
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (pos_ == input_.size()) {
        break;
      }
      const char escape = input_[pos_++];
      constexpr std::string_view kEscapes = "\"\"\\\\//b\bf\fn\nr\rt\t";
      bool known = false;
      for (std::size_t i = 0; i + 1 < kEscapes.size(); i += 2) {
        if (kEscapes[i] == escape) {
          out.push_back(kEscapes[i + 1]);
          known = true;
          break;
        }
      }
      if (!known) {
        --pos_;
        return Fail(escape == 'u' ? "\\u escapes are not supported"
                                  : "invalid escape sequence in string",
                    error);
      }
    }
    return Fail("unterminated string literal", error);
  }

  bool ReadLiteral(std::string_view word, std::string& error) {
    if (input_.substr(pos_, word.size()) != word) {
      return Fail("expected JSON value", error);
    }
    pos_ += word.size();
    return true;
  }

  // Validates the JSON number grammar, then converts with strtod.
  bool ReadNumber(double& out, std::string& error) {
    const std::size_t start = pos_;
    Accept('-');
    if (!Accept('0') && SkipDigits() == 0U) {
      pos_ = start;
      return Fail("expected JSON value", error);
    }
    if (Accept('.') && SkipDigits() == 0U) {
      return Fail("expected digits after decimal point", error);
    }
    if (Accept('e') || Accept('E')) {
      if (!Accept('+')) {
        Accept('-');
      }
      if (SkipDigits() == 0U) {
        return Fail("expected exponent digits", error);
      }
    }
    const std::string token(input_.substr(start, pos_ - start));
    errno = 0;
    out = std::strtod(token.c_str(), nullptr);
    if (errno == ERANGE && std::isinf(out)) {
      pos_ = start;
      return Fail("numeric value out of range", error);
    }
    return true;
  }

  std::size_t SkipDigits() {
    const std::size_t start = pos_;
    while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_])) != 0) {
      ++pos_;
    }
    return pos_ - start;
  }

  void SkipSpace() {
    while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_])) != 0) {
      ++pos_;
    }
  }

  bool Accept(const char expected) {
    if (pos_ < input_.size() && input_[pos_] == expected) {
      ++pos_;
      return true;
    }
    return false;
  }

  bool Fail(std::string_view message, std::string& error) const {
    std::size_t line = 1;
    std::size_t col = 1;
    for (std::size_t i = 0; i < pos_ && i < input_.size(); ++i) {
      if (input_[i] == '\n') {
        ++line;
        col = 1;
      } else {
        ++col;
      }
    }
    error = "parse error at line " + std::to_string(line) + ", col " + std::to_string(col) +
            ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t depth_ = 0;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

// Returns the member named `key` of an object value, or nullptr when the value
// is not an object or the member is absent.
inline const Value* FindMember(const Value& object, std::string_view key) {
  if (object.type != Value::Type::kObject) {
    return nullptr;
  }
  const auto it = object.object_value.find(std::string(key));
  return it == object.object_value.end() ? nullptr : &it->second;
}

inline const char* TypeName(Value::Type type) {
  switch (type) {
  case Value::Type::kObject:
    return "object";
  case Value::Type::kArray:
    return "array";
  case Value::Type::kString:
    return "string";
  case Value::Type::kNumber:
    return "number";
  case Value::Type::kBool:
    return "bool";
  case Value::Type::kNull:
    return "null";
  }
  return "null";
}

} // namespace ranops::core::json

#endif // RANOPS_CORE_JSON_DOM_HPP_

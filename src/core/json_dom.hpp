#ifndef CAMHOST_CORE_JSON_DOM_HPP_
#define CAMHOST_CORE_JSON_DOM_HPP_

#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace camhost::core::json {

// DOM shared by the wire codec and the settings schema. Integers and floating
// point numbers are distinct types so values such as `exposure_ms: 100.0` and
// `roi_width: 512` survive an encode/decode cycle unchanged.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kInteger,
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
  std::int64_t integer_value = 0;
  double number_value = 0.0;
  bool bool_value = false;

  bool IsNumeric() const {
    return type == Type::kInteger || type == Type::kNumber;
  }

  // Numeric view regardless of integer/float storage.
  double AsDouble() const {
    return type == Type::kInteger ? static_cast<double>(integer_value) : number_value;
  }

  friend bool operator==(const Value& lhs, const Value& rhs) {
    if (lhs.type != rhs.type) {
      return false;
    }
    switch (lhs.type) {
    case Type::kObject:
      return lhs.object_value == rhs.object_value;
    case Type::kArray:
      return lhs.array_value == rhs.array_value;
    case Type::kString:
      return lhs.string_value == rhs.string_value;
    case Type::kInteger:
      return lhs.integer_value == rhs.integer_value;
    case Type::kNumber:
      return lhs.number_value == rhs.number_value;
    case Type::kBool:
      return lhs.bool_value == rhs.bool_value;
    case Type::kNull:
      return true;
    }
    return false;
  }
};

inline const char* ToString(Value::Type type) {
  switch (type) {
  case Value::Type::kObject:
    return "object";
  case Value::Type::kArray:
    return "array";
  case Value::Type::kString:
    return "string";
  case Value::Type::kInteger:
    return "integer";
  case Value::Type::kNumber:
    return "number";
  case Value::Type::kBool:
    return "bool";
  case Value::Type::kNull:
    return "null";
  }
  return "null";
}

inline Value MakeNull() {
  return Value{};
}

inline Value MakeBool(bool value) {
  Value out;
  out.type = Value::Type::kBool;
  out.bool_value = value;
  return out;
}

inline Value MakeInteger(std::int64_t value) {
  Value out;
  out.type = Value::Type::kInteger;
  out.integer_value = value;
  return out;
}

inline Value MakeNumber(double value) {
  Value out;
  out.type = Value::Type::kNumber;
  out.number_value = value;
  return out;
}

inline Value MakeString(std::string value) {
  Value out;
  out.type = Value::Type::kString;
  out.string_value = std::move(value);
  return out;
}

inline Value MakeArray(Value::Array items = {}) {
  Value out;
  out.type = Value::Type::kArray;
  out.array_value = std::move(items);
  return out;
}

inline Value MakeObject(Value::Object members = {}) {
  Value out;
  out.type = Value::Type::kObject;
  out.object_value = std::move(members);
  return out;
}

inline const Value* FindMember(const Value& object, std::string_view key) {
  if (object.type != Value::Type::kObject) {
    return nullptr;
  }
  const auto it = object.object_value.find(std::string(key));
  if (it == object.object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

// Lightweight JSON parser with deterministic diagnostics.
// Errors report line/column so malformed frames are easy to pinpoint.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  static constexpr std::size_t kMaxDepth = 64;

  bool ParseValue(Value& value, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }

    const char c = Peek();
    if (c == '{') {
      return ParseObject(value, error);
    }
    if (c == '[') {
      return ParseArray(value, error);
    }
    if (c == '"') {
      value = Value{};
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value = Value{};
      return ParseNumber(value, error);
    }
    if (StartsWith("true")) {
      value = MakeBool(true);
      AdvanceN(4);
      return true;
    }
    if (StartsWith("false")) {
      value = MakeBool(false);
      AdvanceN(5);
      return true;
    }
    if (StartsWith("null")) {
      value = MakeNull();
      AdvanceN(4);
      return true;
    }

    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value& value, std::string& error) {
    value = MakeObject();

    if (!ConsumeChar('{', "expected '{' to start object", error)) {
      return false;
    }
    if (++depth_ > kMaxDepth) {
      return Fail("JSON nesting is too deep", error);
    }
    SkipWhitespace();

    if (Match('}')) {
      --depth_;
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }

      SkipWhitespace();
      if (!ConsumeChar(':', "expected ':' after object key", error)) {
        return false;
      }

      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.object_value[key] = std::move(item);

      SkipWhitespace();
      if (Match('}')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between object entries", error)) {
        return false;
      }
    }

    --depth_;
    return true;
  }

  bool ParseArray(Value& value, std::string& error) {
    value = MakeArray();

    if (!ConsumeChar('[', "expected '[' to start array", error)) {
      return false;
    }
    if (++depth_ > kMaxDepth) {
      return Fail("JSON nesting is too deep", error);
    }
    SkipWhitespace();

    if (Match(']')) {
      --depth_;
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between array items", error)) {
        return false;
      }
    }

    --depth_;
    return true;
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!ConsumeChar('"', "expected '\"' to start string", error)) {
      return false;
    }

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (c == '\\') {
        if (AtEnd()) {
          return Fail("unterminated escape sequence in string", error);
        }
        const char esc = Advance();
        switch (esc) {
        case '"':
        case '\\':
        case '/':
          output.push_back(esc);
          break;
        case 'b':
          output.push_back('\b');
          break;
        case 'f':
          output.push_back('\f');
          break;
        case 'n':
          output.push_back('\n');
          break;
        case 'r':
          output.push_back('\r');
          break;
        case 't':
          output.push_back('\t');
          break;
        case 'u':
          if (!ParseUnicodeEscape(output, error)) {
            return false;
          }
          break;
        default:
          return Fail("invalid escape sequence in string", error);
        }
        continue;
      }

      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      output.push_back(c);
    }

    return Fail("unterminated string literal", error);
  }

  // Decodes \uXXXX (basic multilingual plane only) into UTF-8.
  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    if (pos_ + 4 > input_.size()) {
      return Fail("truncated unicode escape", error);
    }
    unsigned int code_point = 0;
    const char* begin = input_.data() + pos_;
    const auto [ptr, ec] = std::from_chars(begin, begin + 4, code_point, 16);
    if (ec != std::errc() || ptr != begin + 4) {
      return Fail("invalid unicode escape", error);
    }
    if (code_point >= 0xD800U && code_point <= 0xDFFFU) {
      return Fail("surrogate unicode escapes are not supported", error);
    }
    AdvanceN(4);

    if (code_point < 0x80U) {
      output.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (code_point >> 6)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xE0U | (code_point >> 12)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    }
    return true;
  }

  bool ParseNumber(Value& value, std::string& error) {
    const std::size_t start = pos_;
    bool is_float = false;

    if (Match('-')) {
      // optional sign
    }

    if (Match('0')) {
      // single leading zero
    } else {
      if (!ConsumeDigits()) {
        return Fail("expected digits in number", error);
      }
    }

    if (Match('.')) {
      is_float = true;
      if (!ConsumeDigits()) {
        return Fail("expected digits after decimal point", error);
      }
    }

    if (Match('e') || Match('E')) {
      is_float = true;
      if (Match('+') || Match('-')) {
        // exponent sign
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string text(input_.substr(start, pos_ - start));
    if (!is_float) {
      std::int64_t parsed = 0;
      const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
      if (ec == std::errc() && ptr == text.data() + text.size()) {
        value.type = Value::Type::kInteger;
        value.integer_value = parsed;
        return true;
      }
      // Out-of-range integers degrade to floating point.
    }

    char* parse_end = nullptr;
    const double parsed = std::strtod(text.c_str(), &parse_end);
    if (parse_end == nullptr || *parse_end != '\0') {
      return Fail("invalid number token", error);
    }
    value.type = Value::Type::kNumber;
    value.number_value = parsed;
    return true;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool ConsumeDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
      ++count;
    }
    return count > 0U;
  }

  bool ConsumeChar(char expected, std::string_view message, std::string& error) {
    if (AtEnd() || Peek() != expected) {
      return Fail(message, error);
    }
    Advance();
    return true;
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  bool StartsWith(std::string_view token) const {
    if (pos_ + token.size() > input_.size()) {
      return false;
    }
    return input_.substr(pos_, token.size()) == token;
  }

  void AdvanceN(std::size_t n) {
    for (std::size_t i = 0; i < n; ++i) {
      Advance();
    }
  }

  char Peek() const {
    return input_[pos_];
  }

  char Advance() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
  std::size_t depth_ = 0;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

} // namespace camhost::core::json

#endif // CAMHOST_CORE_JSON_DOM_HPP_

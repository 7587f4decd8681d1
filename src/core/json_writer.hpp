#ifndef CAMHOST_CORE_JSON_WRITER_HPP_
#define CAMHOST_CORE_JSON_WRITER_HPP_

#include "core/json_dom.hpp"

#include <charconv>
#include <cmath>
#include <cstdio>
#include <string>
#include <string_view>

namespace camhost::core::json {

// String escaping shared by every JSON producer in the project. Control
// characters are written as four-digit unicode escapes, which the parser in
// json_dom.hpp decodes back to the original byte.
inline std::string EscapeJson(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        char escaped[7];
        std::snprintf(escaped, sizeof(escaped), "\\u%04x", static_cast<unsigned int>(as_unsigned));
        out += escaped;
      } else {
        out.push_back(ch);
      }
      break;
    }
    }
  }
  return out;
}

// Shortest round-trip text for a finite double, always carrying a decimal
// point or exponent so the parser reads it back as a number, not an integer.
inline std::string FormatDouble(double value) {
  char buffer[32];
  const auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
  if (ec != std::errc()) {
    return "0.0";
  }
  std::string text(buffer, ptr);
  if (text.find_first_of(".eE") == std::string::npos) {
    text += ".0";
  }
  return text;
}

class Writer {
public:
  // Serializes `value` as compact JSON. Fails only for non-finite numbers,
  // which JSON cannot represent.
  bool Write(const Value& value, std::string& out, std::string& error) {
    switch (value.type) {
    case Value::Type::kNull:
      out += "null";
      return true;
    case Value::Type::kBool:
      out += value.bool_value ? "true" : "false";
      return true;
    case Value::Type::kInteger:
      out += std::to_string(value.integer_value);
      return true;
    case Value::Type::kNumber:
      if (!std::isfinite(value.number_value)) {
        error = "cannot encode non-finite number";
        return false;
      }
      out += FormatDouble(value.number_value);
      return true;
    case Value::Type::kString:
      out.push_back('"');
      out += EscapeJson(value.string_value);
      out.push_back('"');
      return true;
    case Value::Type::kArray: {
      out.push_back('[');
      bool first = true;
      for (const Value& item : value.array_value) {
        if (!first) {
          out.push_back(',');
        }
        first = false;
        if (!Write(item, out, error)) {
          return false;
        }
      }
      out.push_back(']');
      return true;
    }
    case Value::Type::kObject: {
      out.push_back('{');
      bool first = true;
      for (const auto& [key, item] : value.object_value) {
        if (!first) {
          out.push_back(',');
        }
        first = false;
        out.push_back('"');
        out += EscapeJson(key);
        out += "\":";
        if (!Write(item, out, error)) {
          return false;
        }
      }
      out.push_back('}');
      return true;
    }
    }

    error = "unknown JSON value type";
    return false;
  }
};

inline bool Serialize(const Value& value, std::string& out, std::string& error) {
  out.clear();
  Writer writer;
  return writer.Write(value, out, error);
}

} // namespace camhost::core::json

#endif // CAMHOST_CORE_JSON_WRITER_HPP_

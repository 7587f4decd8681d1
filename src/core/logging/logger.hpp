#pragma once

#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace camhost::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }

  return "INFO";
}

// Numeric level used on the worker spawn command line. Values follow the
// common 10/20/30/40 convention so other supervisors can drive the worker.
inline int ToNumericLevel(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return 10;
  case LogLevel::kInfo:
    return 20;
  case LogLevel::kWarn:
    return 30;
  case LogLevel::kError:
    return 40;
  }

  return 20;
}

inline std::string ExpectedLogLevelList() {
  return "debug|info|warn|error|10|20|30|40";
}

inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();

  if (raw.empty()) {
    error = "missing value for log level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }

  int numeric = 0;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), numeric);
  if (ec == std::errc() && ptr == raw.data() + raw.size()) {
    // Anything between the canonical steps rounds down to the closest level.
    if (numeric < 20) {
      level = LogLevel::kDebug;
    } else if (numeric < 30) {
      level = LogLevel::kInfo;
    } else if (numeric < 40) {
      level = LogLevel::kWarn;
    } else {
      level = LogLevel::kError;
    }
    return true;
  }

  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "debug") {
    level = LogLevel::kDebug;
    return true;
  }
  if (normalized == "info") {
    level = LogLevel::kInfo;
    return true;
  }
  if (normalized == "warn" || normalized == "warning") {
    level = LogLevel::kWarn;
    return true;
  }
  if (normalized == "error") {
    level = LogLevel::kError;
    return true;
  }

  error = "invalid log level '" + std::string(raw) + "' (expected " + ExpectedLogLevelList() +
          ")";
  return false;
}

// Structured key=value logger shared by the client, server and control-loop
// threads. One record is one line; records from different threads never
// interleave.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mu_);
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    std::lock_guard<std::mutex> lock(mu_);
    return min_level_;
  }

  void SetComponent(std::string component) {
    std::lock_guard<std::mutex> lock(mu_);
    component_ = std::move(component);
  }

  bool ShouldLog(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level,
           std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (!ShouldLog(level)) {
      return;
    }

    std::ostringstream line;
    line << "ts_utc=" << core::FormatUtcTimestamp(std::chrono::system_clock::now())
         << " level=" << ToString(level);

    std::lock_guard<std::mutex> lock(mu_);
    line << " component=" << Quote(component_) << " msg=" << Quote(message);
    for (const auto& field : fields) {
      line << ' ' << field.key << '=' << Quote(field.value);
    }
    line << '\n';

    (*out_) << line.str();
    out_->flush();
  }

  void Debug(std::string_view message,
             std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message,
            std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message,
            std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message,
             std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  static std::string EscapeForQuoted(std::string_view raw) {
    std::string escaped;
    escaped.reserve(raw.size());

    for (const char c : raw) {
      switch (c) {
      case '\\':
        escaped += "\\\\";
        break;
      case '"':
        escaped += "\\\"";
        break;
      case '\n':
        escaped += "\\n";
        break;
      case '\r':
        escaped += "\\r";
        break;
      case '\t':
        escaped += "\\t";
        break;
      default:
        escaped.push_back(c);
        break;
      }
    }

    return escaped;
  }

  static std::string Quote(std::string_view raw) {
    return std::string("\"") + EscapeForQuoted(raw) + "\"";
  }

  mutable std::mutex mu_;
  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::string component_ = "-";
};

} // namespace camhost::core::logging

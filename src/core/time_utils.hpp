#ifndef CAMHOST_CORE_TIME_UTILS_HPP_
#define CAMHOST_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace camhost::core {

// Canonical UTC timestamp formatter used by the logger.
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

// Seconds on the steady clock. Frame capture times use this so they stay
// comparable across a session regardless of wall-clock adjustments.
inline double MonotonicSeconds() {
  const auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
  return std::chrono::duration<double>(since_epoch).count();
}

inline std::chrono::steady_clock::duration SecondsToDuration(double seconds) {
  return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
      std::chrono::duration<double>(seconds));
}

// "0.5s", "5s": compact duration text for log fields and error messages.
inline std::string FormatSeconds(double seconds) {
  std::ostringstream out;
  out << seconds << 's';
  return out.str();
}

} // namespace camhost::core

#endif // CAMHOST_CORE_TIME_UTILS_HPP_

#pragma once

#include <string>
#include <string_view>

namespace camhost::driver {

// Stable classification of driver failures. Vendor SDK text changes between
// releases; these codes do not.
enum class DriverErrorCode {
  kDeviceNotFound,
  kDeviceBusy,
  kDeviceDisconnected,
  kTimeout,
  kSdkUnavailable,
  kInvalidConfiguration,
  kStateConflict,
  kUnknown,
};

std::string_view ToStableErrorCode(DriverErrorCode code);

struct DriverErrorMapping {
  DriverErrorCode code = DriverErrorCode::kUnknown;
  std::string actionable_message;
  std::string detail;
};

// `operation` is a short label such as "open", "arm" or "poll_frame".
DriverErrorMapping MapDriverError(std::string_view operation, std::string_view detail);

// "<CODE>: <actionable message> detail: <raw detail>". The detail suffix is
// omitted when `detail` is blank.
std::string FormatDriverError(std::string_view operation, std::string_view detail);

} // namespace camhost::driver

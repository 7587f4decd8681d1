#include "driver/error_mapper.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace camhost::driver {

namespace {

// Lowercases and folds whitespace runs so keyword matching ignores layout.
std::string Normalize(std::string_view text, bool lowercase) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (const char raw : text) {
    const auto c = static_cast<unsigned char>(raw);
    if (std::isspace(c) != 0) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(lowercase ? static_cast<char>(std::tolower(c)) : raw);
  }
  return out;
}

bool Mentions(std::string_view text, std::initializer_list<std::string_view> keywords) {
  return std::any_of(keywords.begin(), keywords.end(), [text](std::string_view keyword) {
    return text.find(keyword) != std::string_view::npos;
  });
}

DriverErrorCode Classify(std::string_view text) {
  if (text.empty()) {
    return DriverErrorCode::kUnknown;
  }
  if (Mentions(text, {"sdk unavailable", "sdk not found", "sdk adapter", "driver binaries",
                      "no vendor"})) {
    return DriverErrorCode::kSdkUnavailable;
  }
  if (Mentions(text, {"disconnect", "connection lost", "unplugged", "device lost"})) {
    return DriverErrorCode::kDeviceDisconnected;
  }
  if (Mentions(text, {"timed out", "timeout"})) {
    return DriverErrorCode::kTimeout;
  }
  if (Mentions(text, {"busy", "in use", "already open"})) {
    return DriverErrorCode::kDeviceBusy;
  }
  if (Mentions(text, {"not found", "no camera", "unknown serial"})) {
    return DriverErrorCode::kDeviceNotFound;
  }
  if (Mentions(text, {"not open", "not armed", "already armed", "while armed", "state"})) {
    return DriverErrorCode::kStateConflict;
  }
  if (Mentions(text, {"invalid", "rejected", "out of range", "unsupported"})) {
    return DriverErrorCode::kInvalidConfiguration;
  }
  return DriverErrorCode::kUnknown;
}

std::string Guidance(DriverErrorCode code, std::string_view operation) {
  const std::string op = operation.empty() ? std::string("driver call") : std::string(operation);
  switch (code) {
  case DriverErrorCode::kDeviceNotFound:
    return "Camera not found during " + op + "; refresh the serial list and check power/cable.";
  case DriverErrorCode::kDeviceBusy:
    return "Camera is busy during " + op + "; close other programs holding the camera.";
  case DriverErrorCode::kDeviceDisconnected:
    return "Camera disconnected during " + op + "; check the cable and reopen the camera.";
  case DriverErrorCode::kTimeout:
    return "Camera timed out during " + op + "; check trigger wiring and exposure time.";
  case DriverErrorCode::kSdkUnavailable:
    return "Vendor SDK is unavailable; check the driver binary path given to the worker.";
  case DriverErrorCode::kInvalidConfiguration:
    return "Camera rejected the configuration during " + op + "; check the advertised ranges.";
  case DriverErrorCode::kStateConflict:
    return "Camera state conflict during " + op + "; the request does not fit the session state.";
  case DriverErrorCode::kUnknown:
  default:
    return "Unexpected driver failure during " + op + ".";
  }
}

} // namespace

std::string_view ToStableErrorCode(DriverErrorCode code) {
  switch (code) {
  case DriverErrorCode::kDeviceNotFound:
    return "DEVICE_NOT_FOUND";
  case DriverErrorCode::kDeviceBusy:
    return "DEVICE_BUSY";
  case DriverErrorCode::kDeviceDisconnected:
    return "DEVICE_DISCONNECTED";
  case DriverErrorCode::kTimeout:
    return "TIMEOUT";
  case DriverErrorCode::kSdkUnavailable:
    return "SDK_UNAVAILABLE";
  case DriverErrorCode::kInvalidConfiguration:
    return "INVALID_CONFIGURATION";
  case DriverErrorCode::kStateConflict:
    return "STATE_CONFLICT";
  case DriverErrorCode::kUnknown:
  default:
    return "UNKNOWN";
  }
}

DriverErrorMapping MapDriverError(std::string_view operation, std::string_view detail) {
  DriverErrorMapping mapped;
  mapped.detail = Normalize(detail, false);
  mapped.code = Classify(Normalize(detail, true));
  mapped.actionable_message = Guidance(mapped.code, operation);
  return mapped;
}

std::string FormatDriverError(std::string_view operation, std::string_view detail) {
  const DriverErrorMapping mapped = MapDriverError(operation, detail);
  std::string formatted =
      std::string(ToStableErrorCode(mapped.code)) + ": " + mapped.actionable_message;
  if (!mapped.detail.empty()) {
    formatted += " detail: " + mapped.detail;
  }
  return formatted;
}

} // namespace camhost::driver

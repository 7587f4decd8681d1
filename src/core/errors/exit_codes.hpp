#pragma once

namespace camhost::core::errors {

// Stable process-exit contract shared by `camhost` and `camhost_worker`.
//
// The first three values preserve conventional meanings used by scripts:
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// The worker-specific values let the supervisor classify a start-up failure
// without scraping the captured stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kDriverUnavailable = 20,
  kSocketFailed = 21,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace camhost::core::errors

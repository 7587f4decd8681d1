#include "client/camera.hpp"
#include "common/assertions.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#ifndef CAMHOST_WORKER_PATH
#error "CAMHOST_WORKER_PATH must point at the camhost_worker binary"
#endif

using camhost::client::Camera;
using camhost::client::CameraState;
using camhost::tests::common::AssertContains;
using camhost::tests::common::Fail;

namespace {

struct CapturedError {
  std::string message;
  std::string trace;
};

// Starts a worker that is expected to die and returns the reported failure.
CapturedError ExpectWorkerDeath(camhost::client::ClientOptions options, int expected_code,
                                camhost::core::logging::Logger& logger) {
  options.worker_path = CAMHOST_WORKER_PATH;
  options.log_level = camhost::core::logging::LogLevel::kError;

  Camera camera(options, logger);
  std::mutex mu;
  std::vector<CapturedError> errors;
  camera.SetErrorHandler([&](const std::string& message, const std::string& trace) {
    std::lock_guard<std::mutex> lock(mu);
    errors.push_back({message, trace});
  });

  std::string error;
  if (!camera.Start(error)) {
    Fail("spawning the worker must succeed even when it later fails: " + error);
  }
  if (!camera.WaitForState([](const CameraState& s) { return !s.errors.empty(); },
                           std::chrono::seconds(10))) {
    Fail("worker death was not reported");
  }
  if (!camhost::tests::common::WaitUntil([&camera] { return !camera.process_running(); },
                                         std::chrono::seconds(5))) {
    Fail("worker must not be running after it reported a failure");
  }
  camera.Stop();

  if (camera.worker_exit_code() != expected_code) {
    Fail("unexpected worker exit code " + std::to_string(camera.worker_exit_code().value_or(-1)));
  }
  if (camera.process_connected()) {
    Fail("a worker that never listened must not count as connected");
  }

  std::lock_guard<std::mutex> lock(mu);
  if (errors.size() != 1U) {
    Fail("expected exactly one reported failure, got " + std::to_string(errors.size()));
  }
  AssertContains(errors[0].message,
                 "Worker process exited with code " + std::to_string(expected_code));
  return errors[0];
}

void CheckMissingDriver(camhost::core::logging::Logger& logger) {
  camhost::client::ClientOptions options;
  options.driver_bin_path = "/nonexistent/camhost/driver";
  const CapturedError failure = ExpectWorkerDeath(options, 20, logger);
  AssertContains(failure.trace, "is not a directory");
}

void CheckBadSimOptions(camhost::core::logging::Logger& logger) {
  camhost::client::ClientOptions options;
  options.driver_bin_path = "sim:lens=wide";
  const CapturedError failure = ExpectWorkerDeath(options, 20, logger);
  AssertContains(failure.trace, "unknown sim driver option 'lens'");
}

} // namespace

int main() {
  camhost::core::logging::Logger logger(camhost::core::logging::LogLevel::kError);
  logger.SetComponent("worker_process_error_smoke");

  CheckMissingDriver(logger);
  CheckBadSimOptions(logger);

  std::cout << "worker_process_error_smoke: ok\n";
  return 0;
}

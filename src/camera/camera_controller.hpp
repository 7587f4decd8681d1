#pragma once

#include "core/blocking_queue.hpp"
#include "core/logging/logger.hpp"
#include "core/schema/settings_snapshot.hpp"
#include "driver/camera_driver.hpp"
#include "protocol/message.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace camhost::camera {

struct ControllerOptions {
  // Sleep between frame polls that found nothing queued while playing.
  std::chrono::microseconds poll_interval{1000};
};

// One camera session driven from a dedicated control-loop thread.
//
// The server thread talks to the loop only through the request and event
// queues. The loop is the only caller of the driver. Every session that is
// started ends with exactly one `cam_closed`, which is always the last event
// it emits, whether the session ended on request or on a driver failure.
class CameraController {
public:
  CameraController(std::unique_ptr<driver::ICameraDriver> driver, std::string serial,
                   ControllerOptions options, core::logging::Logger& logger);
  ~CameraController();

  CameraController(const CameraController&) = delete;
  CameraController& operator=(const CameraController&) = delete;

  // Opens the camera on the control-loop thread. Call once.
  void Start();

  // Enqueues a client request. Requests sent after the session ended are
  // never processed.
  void SendRequest(protocol::Message request);

  std::optional<protocol::Message> TryGetEvent();

  template <typename Rep, typename Period>
  std::optional<protocol::Message> GetEventFor(std::chrono::duration<Rep, Period> timeout) {
    return events_.GetFor(timeout);
  }

  // Blocks until the control loop has exited.
  void Join();

  // False from the moment the loop decides to exit. Requests sent after that
  // are never processed, so the owner must finish the session first.
  bool accepting_requests() const { return accepting_.load(); }

  // True once `cam_closed` has been queued.
  bool finished() const { return finished_.load(); }

  const std::string& serial() const { return serial_; }

private:
  enum class Outcome {
    kContinue,
    kClose,
    kDriverFailure,
  };

  void Run();
  Outcome HandleRequest(const protocol::Message& request);
  Outcome HandlePlay();
  Outcome HandleStop();
  Outcome HandleSetting(const protocol::Message& request);
  Outcome PollOnce(bool& produced);
  Outcome DriverFailure(const char* operation, const std::string& detail);

  void ReportException(const std::string& message, const std::string& trace);
  void Shutdown();
  void Emit(protocol::Message event);

  const char* StateName() const;

  std::unique_ptr<driver::ICameraDriver> driver_;
  const std::string serial_;
  const ControllerOptions options_;
  core::logging::Logger& logger_;

  core::BlockingQueue<protocol::Message> requests_;
  core::BlockingQueue<protocol::Message> events_;
  std::thread thread_;
  std::atomic<bool> accepting_{true};
  std::atomic<bool> finished_{false};

  // Owned by the control-loop thread.
  bool playing_ = false;
  core::schema::SettingsSnapshot snapshot_;
};

} // namespace camhost::camera

#pragma once

#include "camera/camera_controller.hpp"
#include "core/logging/logger.hpp"
#include "driver/camera_driver.hpp"
#include "net/socket.hpp"
#include "protocol/message.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace camhost::worker {

struct ServerOptions {
  std::string host = "127.0.0.1";
  std::uint16_t port = 0;
  // Longest single wait for client bytes before the event queue is drained.
  double recv_timeout_s = 0.01;
  // How long to wait for the supervisor to connect. Non-positive waits forever.
  double accept_timeout_s = 60.0;
  std::string driver_spec = "sim";
  camera::ControllerOptions controller;
};

// Worker side of the protocol: one listening socket, exactly one accepted
// connection, at most one camera session at a time.
//
// Call order is Prepare (driver), Listen (socket), Serve (pump until `eof`,
// peer close or a connection error).
class CameraServer {
public:
  CameraServer(ServerOptions options, core::logging::Logger& logger);
  ~CameraServer();

  CameraServer(const CameraServer&) = delete;
  CameraServer& operator=(const CameraServer&) = delete;

  // Resolves the driver spec once so an unusable driver fails before the
  // socket is opened. Discovery requests use this instance.
  bool Prepare(std::string& error);

  bool Listen(std::string& error);

  // Port actually bound, valid after Listen.
  std::uint16_t port() const { return bound_port_; }

  // Returns false on a connection-level failure. A clean `eof` or a peer
  // closing between frames returns true.
  bool Serve(std::string& error);

private:
  enum class Flow {
    kContinue,
    kStop,
  };

  Flow Dispatch(const protocol::Message& request);
  void OpenSession(const protocol::Message& request);
  void AnswerSerials();
  void RejectRequest(const std::string& message, const std::string& trace);

  // Sends every queued controller event. Releases the controller once its
  // `cam_closed` went out.
  void FlushEvents();
  void CloseSession();
  void Send(const protocol::Message& message);

  const ServerOptions options_;
  core::logging::Logger& logger_;

  std::unique_ptr<driver::ICameraDriver> discovery_driver_;
  std::unique_ptr<camera::CameraController> controller_;
  net::SocketFd listener_;
  net::SocketFd connection_;
  std::uint16_t bound_port_ = 0;

  // Set when a send fails; nothing more is written to the connection.
  bool connection_broken_ = false;
  std::string send_error_;
};

} // namespace camhost::worker

#pragma once

#include "client/child_process.hpp"
#include "core/blocking_queue.hpp"
#include "core/logging/logger.hpp"
#include "protocol/message.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>

namespace camhost::client {

struct ClientOptions {
  std::string worker_path;
  // Forwarded to the worker verbatim: a vendor driver directory or a sim spec.
  std::string driver_bin_path = "sim";
  std::string host = "127.0.0.1";
  // 0 picks a free port before the worker is spawned.
  std::uint16_t port = 0;
  double recv_timeout_s = 0.01;
  double connect_timeout_s = 5.0;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Receives everything the client thread reads plus failures from either
// supervisor thread. Implementations must be thread-safe: `OnException` can
// arrive from the process-watch thread while `OnMessage` runs on the client
// thread.
class IClientListener {
public:
  virtual ~IClientListener() = default;

  virtual void OnMessage(protocol::Message message) = 0;
  virtual void OnException(const std::string& message, const std::string& trace) = 0;
};

// Supervisor: spawns `camhost_worker`, connects to it and pumps messages.
//
// Two threads run per started process. The process-watch thread only waits
// for the child and reports a non-zero exit with its stderr. The client
// thread connects (retrying refusals until `connect_timeout_s`), then
// alternates a bounded socket wait with a non-blocking drain of the outbound
// queue. It exits after forwarding `eof` or when the connection ends.
class CameraClient {
public:
  CameraClient(ClientOptions options, IClientListener& listener, core::logging::Logger& logger);
  // Equivalent to StopProcess(true, kDefaultKillDelay) for a running client.
  ~CameraClient();

  CameraClient(const CameraClient&) = delete;
  CameraClient& operator=(const CameraClient&) = delete;

  static constexpr double kDefaultKillDelay = 5.0;

  bool StartProcess(std::string& error);

  void SendRequest(protocol::Message request);

  // Sends `eof`. With `join`, waits for the client thread and then for the
  // worker; a worker still alive after `kill_delay_s` is killed.
  void StopProcess(bool join, double kill_delay_s = kDefaultKillDelay);

  bool process_connected() const { return connected_.load(); }
  bool process_running() const { return child_.running(); }
  std::uint16_t port() const { return port_; }
  std::optional<int> exit_code() const { return child_.exit_code(); }

private:
  void RunClient();
  void WatchProcess();

  const ClientOptions options_;
  IClientListener& listener_;
  core::logging::Logger& logger_;

  ChildProcess child_;
  core::BlockingQueue<protocol::Message> outbound_;
  std::thread client_thread_;
  std::thread watch_thread_;
  std::uint16_t port_ = 0;
  std::atomic<bool> connected_{false};
  std::atomic<bool> stopping_{false};
  std::atomic<bool> killed_{false};
};

} // namespace camhost::client

#include "core/errors/exit_codes.hpp"
#include "core/logging/logger.hpp"
#include "worker/camera_server.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace {

using camhost::core::errors::ExitCode;
using camhost::core::errors::ToInt;

constexpr int kExpectedArgs = 6;

void PrintUsage(std::ostream& out) {
  out << "usage: camhost_worker <log_level> <driver_bin_path> <host> <port> <recv_timeout>\n"
      << "  log_level        10 debug, 20 info, 30 warn, 40 error\n"
      << "  driver_bin_path  vendor driver directory, or sim / sim:<k=v,...>\n"
      << "  recv_timeout     seconds to wait for client data per pump cycle\n";
}

bool ParsePort(std::string_view text, std::uint16_t& port) {
  unsigned value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size() || value > 65535U) {
    return false;
  }
  port = static_cast<std::uint16_t>(value);
  return true;
}

bool ParseTimeout(const std::string& text, double& seconds) {
  char* end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (text.empty() || end != text.c_str() + text.size() || !std::isfinite(value) || value < 0.0) {
    return false;
  }
  seconds = value;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  namespace logging = camhost::core::logging;

  if (argc != kExpectedArgs) {
    PrintUsage(std::cerr);
    return ToInt(ExitCode::kUsage);
  }

  std::string error;
  logging::LogLevel level = logging::LogLevel::kInfo;
  if (!logging::ParseLogLevel(argv[1], level, error)) {
    std::cerr << "error: " << error << '\n';
    return ToInt(ExitCode::kUsage);
  }

  camhost::worker::ServerOptions options;
  options.driver_spec = argv[2];
  options.host = argv[3];
  if (!ParsePort(argv[4], options.port)) {
    std::cerr << "error: invalid port '" << argv[4] << "'\n";
    return ToInt(ExitCode::kUsage);
  }
  if (!ParseTimeout(argv[5], options.recv_timeout_s)) {
    std::cerr << "error: invalid recv_timeout '" << argv[5] << "'\n";
    return ToInt(ExitCode::kUsage);
  }

  logging::Logger logger(level);
  logger.SetComponent("camhost_worker");

  camhost::worker::CameraServer server(options, logger);
  if (!server.Prepare(error)) {
    logger.Error("driver unavailable", {{"driver", options.driver_spec}, {"error", error}});
    std::cerr << "error: driver unavailable: " << error << '\n';
    return ToInt(ExitCode::kDriverUnavailable);
  }
  if (!server.Listen(error)) {
    std::cerr << "error: cannot listen: " << error << '\n';
    return ToInt(ExitCode::kSocketFailed);
  }
  if (!server.Serve(error)) {
    std::cerr << "error: " << error << '\n';
    return ToInt(ExitCode::kFailure);
  }
  return ToInt(ExitCode::kSuccess);
}

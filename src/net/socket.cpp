#include "net/socket.hpp"

#include "core/time_utils.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <utility>

namespace camhost::net {

namespace {

constexpr int kListenBacklog = 1;
constexpr auto kConnectRetryInterval = std::chrono::milliseconds(10);

std::string Errno(const char* call) {
  return std::string(call) + " failed: " + std::strerror(errno);
}

bool ResolveIpv4(const std::string& host, std::uint16_t port, sockaddr_in& address,
                 std::string& error) {
  std::memset(&address, 0, sizeof(address));
  address.sin_family = AF_INET;
  address.sin_port = htons(port);
  if (inet_pton(AF_INET, host.c_str(), &address.sin_addr) == 1) {
    return true;
  }

  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* result = nullptr;
  const int status = getaddrinfo(host.c_str(), nullptr, &hints, &result);
  if (status != 0 || result == nullptr) {
    error = "cannot resolve host '" + host + "': " + gai_strerror(status);
    return false;
  }
  address.sin_addr = reinterpret_cast<const sockaddr_in*>(result->ai_addr)->sin_addr;
  freeaddrinfo(result);
  return true;
}

int PollTimeoutMs(double timeout_s) {
  if (timeout_s <= 0.0) {
    return 0;
  }
  return static_cast<int>(std::ceil(timeout_s * 1000.0));
}

void EnableNoDelay(int fd) {
  int enabled = 1;
  // Latency tweak only; a failure leaves a working socket.
  (void)setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &enabled, sizeof(enabled));
}

} // namespace

SocketFd::~SocketFd() {
  Reset();
}

SocketFd::SocketFd(SocketFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

SocketFd& SocketFd::operator=(SocketFd&& other) noexcept {
  if (this != &other) {
    Reset(std::exchange(other.fd_, -1));
  }
  return *this;
}

void SocketFd::Reset(int fd) {
  if (fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = fd;
}

bool ListenTcp(const std::string& host, std::uint16_t port, SocketFd& listener,
               std::string& error) {
  sockaddr_in address{};
  if (!ResolveIpv4(host, port, address, error)) {
    return false;
  }

  SocketFd fd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!fd.valid()) {
    error = Errno("socket()");
    return false;
  }
  int reuse = 1;
  if (setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) != 0) {
    error = Errno("setsockopt(SO_REUSEADDR)");
    return false;
  }
  if (::bind(fd.get(), reinterpret_cast<const sockaddr*>(&address), sizeof(address)) != 0) {
    error = "bind() to " + host + ":" + std::to_string(port) + " failed: " + std::strerror(errno);
    return false;
  }
  if (::listen(fd.get(), kListenBacklog) != 0) {
    error = Errno("listen()");
    return false;
  }
  listener = std::move(fd);
  return true;
}

bool LocalPort(const SocketFd& socket, std::uint16_t& port, std::string& error) {
  sockaddr_in address{};
  socklen_t length = sizeof(address);
  if (::getsockname(socket.get(), reinterpret_cast<sockaddr*>(&address), &length) != 0) {
    error = Errno("getsockname()");
    return false;
  }
  port = ntohs(address.sin_port);
  return true;
}

bool AcceptConnection(const SocketFd& listener, double timeout_s, SocketFd& connection,
                      std::string& error) {
  if (timeout_s > 0.0) {
    bool readable = false;
    if (!WaitReadable(listener.get(), timeout_s, readable, error)) {
      return false;
    }
    if (!readable) {
      error = "no client connected within " + core::FormatSeconds(timeout_s);
      return false;
    }
  }

  int fd = -1;
  do {
    fd = ::accept4(listener.get(), nullptr, nullptr, SOCK_CLOEXEC);
  } while (fd < 0 && errno == EINTR);
  if (fd < 0) {
    error = Errno("accept()");
    return false;
  }
  EnableNoDelay(fd);
  connection.Reset(fd);
  return true;
}

bool ConnectTcp(const std::string& host, std::uint16_t port, SocketFd& connection, bool& refused,
                std::string& error) {
  refused = false;
  sockaddr_in address{};
  if (!ResolveIpv4(host, port, address, error)) {
    return false;
  }

  SocketFd fd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!fd.valid()) {
    error = Errno("socket()");
    return false;
  }
  int status = -1;
  do {
    status = ::connect(fd.get(), reinterpret_cast<const sockaddr*>(&address), sizeof(address));
  } while (status != 0 && errno == EINTR);
  if (status != 0) {
    refused = errno == ECONNREFUSED;
    error = "connect() to " + host + ":" + std::to_string(port) + " failed: " +
            std::strerror(errno);
    return false;
  }
  EnableNoDelay(fd.get());
  connection = std::move(fd);
  return true;
}

bool ConnectWithRetry(const std::string& host, std::uint16_t port, double timeout_s,
                      const std::function<bool()>& keep_trying, SocketFd& connection,
                      std::string& error) {
  const double deadline = core::MonotonicSeconds() + timeout_s;
  while (true) {
    bool refused = false;
    std::string attempt_error;
    if (ConnectTcp(host, port, connection, refused, attempt_error)) {
      return true;
    }
    if (!refused) {
      error = attempt_error;
      return false;
    }
    if (core::MonotonicSeconds() >= deadline) {
      error = "timed out after " + core::FormatSeconds(timeout_s) + " waiting for " + host + ":" +
              std::to_string(port) + " (" + attempt_error + ")";
      return false;
    }
    if (keep_trying && !keep_trying()) {
      error = "connect to " + host + ":" + std::to_string(port) + " abandoned";
      return false;
    }
    std::this_thread::sleep_for(kConnectRetryInterval);
  }
}

bool PickOpenPort(const std::string& host, std::uint16_t& port, std::string& error) {
  SocketFd listener;
  if (!ListenTcp(host, 0, listener, error)) {
    return false;
  }
  return LocalPort(listener, port, error);
}

bool WaitReadable(int fd, double timeout_s, bool& readable, std::string& error) {
  pollfd entry{};
  entry.fd = fd;
  entry.events = POLLIN;

  int status = -1;
  do {
    status = ::poll(&entry, 1, PollTimeoutMs(timeout_s));
  } while (status < 0 && errno == EINTR);
  if (status < 0) {
    error = Errno("poll()");
    return false;
  }
  readable = status > 0 && (entry.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
  if ((entry.revents & POLLNVAL) != 0) {
    error = "poll() on invalid descriptor";
    return false;
  }
  return true;
}

bool SendAll(int fd, const void* data, std::size_t size, std::string& error) {
  const auto* cursor = static_cast<const std::uint8_t*>(data);
  std::size_t remaining = size;
  while (remaining > 0U) {
    const ssize_t sent = ::send(fd, cursor, remaining, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = Errno("send()");
      return false;
    }
    if (sent == 0) {
      error = "send() made no progress";
      return false;
    }
    cursor += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

} // namespace camhost::net

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace camhost::net {

// Owns one socket descriptor and closes it on destruction.
class SocketFd {
public:
  SocketFd() = default;
  explicit SocketFd(int fd) : fd_(fd) {}
  ~SocketFd();

  SocketFd(const SocketFd&) = delete;
  SocketFd& operator=(const SocketFd&) = delete;
  SocketFd(SocketFd&& other) noexcept;
  SocketFd& operator=(SocketFd&& other) noexcept;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  // Closes the current descriptor (if any) and takes ownership of `fd`.
  void Reset(int fd = -1);

private:
  int fd_ = -1;
};

// IPv4 listener bound to host:port with SO_REUSEADDR. Port 0 binds an
// ephemeral port; use `LocalPort` to read it back.
bool ListenTcp(const std::string& host, std::uint16_t port, SocketFd& listener,
               std::string& error);

bool LocalPort(const SocketFd& socket, std::uint16_t& port, std::string& error);

// Waits up to `timeout_s` seconds for one inbound connection. A non-positive
// timeout waits indefinitely.
bool AcceptConnection(const SocketFd& listener, double timeout_s, SocketFd& connection,
                      std::string& error);

// Single connect attempt. `refused` reports whether the peer actively
// refused, which callers treat as "server not up yet".
bool ConnectTcp(const std::string& host, std::uint16_t port, SocketFd& connection, bool& refused,
                std::string& error);

// Retries refused connects until `timeout_s` elapses or `keep_trying`
// returns false. Any other connect error fails immediately.
bool ConnectWithRetry(const std::string& host, std::uint16_t port, double timeout_s,
                      const std::function<bool()>& keep_trying, SocketFd& connection,
                      std::string& error);

// Binds port 0 on `host`, reads the assigned port and releases it.
bool PickOpenPort(const std::string& host, std::uint16_t& port, std::string& error);

// poll(2) for readability with EINTR retry. Hang-ups and socket errors count
// as readable so the following recv reports them.
bool WaitReadable(int fd, double timeout_s, bool& readable, std::string& error);

// Sends the full buffer, retrying short writes and EINTR. SIGPIPE is
// suppressed; a closed peer is reported as an error.
bool SendAll(int fd, const void* data, std::size_t size, std::string& error);

} // namespace camhost::net

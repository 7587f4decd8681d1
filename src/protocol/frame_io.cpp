#include "protocol/frame_io.hpp"

#include "net/socket.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <string_view>
#include <sys/socket.h>
#include <utility>

namespace camhost::protocol {

namespace {

constexpr std::size_t kRecvChunkBytes = 64U * 1024U;

} // namespace

bool FrameReader::Feed(const std::uint8_t* data, std::size_t size, std::vector<Message>& messages,
                       std::string& error) {
  buffer_.insert(buffer_.end(), data, data + size);

  std::size_t offset = 0;
  bool ok = true;
  while (true) {
    if (!header_.has_value()) {
      if (buffer_.size() - offset < kHeaderSize) {
        break;
      }
      FrameHeader header;
      if (!DecodeHeader(buffer_.data() + offset, header, error)) {
        ok = false;
        break;
      }
      header_ = header;
      offset += kHeaderSize;
    }

    const std::size_t body_size =
        static_cast<std::size_t>(header_->text_len) + static_cast<std::size_t>(header_->binary_len);
    if (buffer_.size() - offset < body_size) {
      break;
    }

    const auto* text_begin = reinterpret_cast<const char*>(buffer_.data() + offset);
    const std::string_view text(text_begin, header_->text_len);
    const auto binary_begin = buffer_.begin() + static_cast<std::ptrdiff_t>(offset) +
                              static_cast<std::ptrdiff_t>(header_->text_len);
    std::vector<std::uint8_t> binary(binary_begin,
                                     binary_begin + static_cast<std::ptrdiff_t>(header_->binary_len));

    Message message;
    if (!Decode(text, std::move(binary), message, error)) {
      ok = false;
      break;
    }
    messages.push_back(std::move(message));
    offset += body_size;
    header_.reset();
  }

  buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
  return ok;
}

ReadStatus FrameReader::ReadFrom(int fd, std::vector<Message>& messages, std::string& error) {
  std::array<std::uint8_t, kRecvChunkBytes> chunk{};
  ssize_t received = -1;
  do {
    received = ::recv(fd, chunk.data(), chunk.size(), MSG_DONTWAIT);
  } while (received < 0 && errno == EINTR);

  if (received < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return ReadStatus::kOk;
    }
    error = std::string("recv() failed: ") + std::strerror(errno);
    return ReadStatus::kError;
  }
  if (received == 0) {
    if (mid_frame()) {
      error = "peer closed the connection mid-frame";
    }
    return ReadStatus::kClosed;
  }
  if (!Feed(chunk.data(), static_cast<std::size_t>(received), messages, error)) {
    return ReadStatus::kError;
  }
  return ReadStatus::kOk;
}

bool WriteMessage(int fd, const Message& message, std::string& error) {
  std::string text;
  if (!EncodeText(message, text, error)) {
    return false;
  }
  const auto header = EncodeHeader(FrameHeader{
      .text_len = static_cast<std::uint32_t>(text.size()),
      .binary_len = static_cast<std::uint32_t>(message.binary.size()),
  });

  if (!net::SendAll(fd, header.data(), header.size(), error) ||
      !net::SendAll(fd, text.data(), text.size(), error)) {
    return false;
  }
  if (!message.binary.empty() &&
      !net::SendAll(fd, message.binary.data(), message.binary.size(), error)) {
    return false;
  }
  return true;
}

} // namespace camhost::protocol

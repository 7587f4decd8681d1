#pragma once

#include "protocol/codec.hpp"
#include "protocol/message.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace camhost::protocol {

enum class ReadStatus {
  kOk = 0,
  // Peer closed the stream. `error` is set when it closed mid-frame.
  kClosed,
  kError,
};

// Incremental frame decoder. Bytes arrive in arbitrary chunks; complete
// messages are yielded in arrival order and a partial frame stays buffered
// until the rest of it is fed.
class FrameReader {
public:
  FrameReader() = default;

  FrameReader(const FrameReader&) = delete;
  FrameReader& operator=(const FrameReader&) = delete;

  bool Feed(const std::uint8_t* data, std::size_t size, std::vector<Message>& messages,
            std::string& error);

  // One recv() from `fd` followed by `Feed`. Call after the socket polled
  // readable; a spurious wakeup returns kOk with no messages.
  ReadStatus ReadFrom(int fd, std::vector<Message>& messages, std::string& error);

  bool mid_frame() const { return header_.has_value() || !buffer_.empty(); }

private:
  std::vector<std::uint8_t> buffer_;
  std::optional<FrameHeader> header_;
};

// Writes header, text and binary sections to a connected socket.
bool WriteMessage(int fd, const Message& message, std::string& error);

} // namespace camhost::protocol

#include "common/assertions.hpp"
#include "protocol/codec.hpp"
#include "protocol/frame_io.hpp"
#include "protocol/message.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

using camhost::tests::common::AssertContains;
using camhost::tests::common::Fail;

namespace protocol = camhost::protocol;

namespace {

std::vector<std::uint8_t> Encode(const protocol::Message& message) {
  std::vector<std::uint8_t> frame;
  std::string error;
  if (!protocol::EncodeFrame(message, frame, error)) {
    Fail("encode failed: " + error);
  }
  return frame;
}

void CheckByteAtATime() {
  camhost::core::schema::FrameEnvelope image;
  image.width = 4;
  image.height = 1;
  image.frame_index = 3;
  image.pixel_bytes = {1, 0, 2, 0, 3, 0, 4, 0};

  std::vector<std::uint8_t> stream = Encode(protocol::MakeOpenCam("sim-00001"));
  const std::vector<std::uint8_t> second = Encode(protocol::MakeImageMessage(image));
  stream.insert(stream.end(), second.begin(), second.end());

  protocol::FrameReader reader;
  std::vector<protocol::Message> messages;
  std::string error;
  for (std::size_t i = 0; i < stream.size(); ++i) {
    if (!reader.Feed(&stream[i], 1, messages, error)) {
      Fail("byte-wise feed failed: " + error);
    }
    const bool at_boundary = i + 1 == stream.size() || i + 1 == stream.size() - second.size();
    if (reader.mid_frame() == at_boundary) {
      Fail("mid_frame disagrees with the frame boundary at byte " + std::to_string(i));
    }
  }

  if (messages.size() != 2U || messages[0].tag != protocol::Tag::kOpenCam ||
      messages[1].tag != protocol::Tag::kImage) {
    Fail("expected open_cam then image from byte-wise feed");
  }
  if (messages[1].binary != image.pixel_bytes) {
    Fail("image payload changed in transit");
  }
}

void CheckCorruptHeader() {
  protocol::FrameReader reader;
  std::vector<protocol::Message> messages;
  std::string error;
  const std::vector<std::uint8_t> header = {0xFF, 0xFF, 0xFF, 0xFF, 0, 0, 0, 0};
  if (reader.Feed(header.data(), header.size(), messages, error)) {
    Fail("oversized text section must be rejected");
  }
  AssertContains(error, "exceeds the limit");
}

void CheckSocketClose() {
  int fds[2] = {-1, -1};
  if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
    Fail("socketpair failed");
  }

  std::string error;
  if (!protocol::WriteMessage(fds[0], protocol::MakePlaying(true), error)) {
    Fail("write failed: " + error);
  }
  const std::vector<std::uint8_t> partial = Encode(protocol::MakeMessage(protocol::Tag::kStop));
  if (::write(fds[0], partial.data(), 5) != 5) {
    Fail("partial write failed");
  }
  ::close(fds[0]);

  protocol::FrameReader reader;
  std::vector<protocol::Message> messages;
  protocol::ReadStatus status = protocol::ReadStatus::kOk;
  for (int i = 0; i < 4 && status == protocol::ReadStatus::kOk; ++i) {
    error.clear();
    status = reader.ReadFrom(fds[1], messages, error);
  }
  ::close(fds[1]);

  if (messages.size() != 1U || messages[0].tag != protocol::Tag::kPlaying) {
    Fail("complete frame before the close must be delivered");
  }
  if (status != protocol::ReadStatus::kClosed) {
    Fail("expected closed status after peer close");
  }
  AssertContains(error, "mid-frame");
}

void CheckCleanClose() {
  int fds[2] = {-1, -1};
  if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
    Fail("socketpair failed");
  }
  ::close(fds[0]);

  protocol::FrameReader reader;
  std::vector<protocol::Message> messages;
  std::string error;
  if (reader.ReadFrom(fds[1], messages, error) != protocol::ReadStatus::kClosed ||
      !error.empty()) {
    Fail("close between frames must be a clean close");
  }
  ::close(fds[1]);
}

void CheckSpuriousWakeup() {
  int fds[2] = {-1, -1};
  if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
    Fail("socketpair failed");
  }
  protocol::FrameReader reader;
  std::vector<protocol::Message> messages;
  std::string error;
  if (reader.ReadFrom(fds[1], messages, error) != protocol::ReadStatus::kOk ||
      !messages.empty()) {
    Fail("read with no data pending must return ok with no messages");
  }
  ::close(fds[0]);
  ::close(fds[1]);
}

} // namespace

int main() {
  CheckByteAtATime();
  CheckCorruptHeader();
  CheckSocketClose();
  CheckCleanClose();
  CheckSpuriousWakeup();

  std::cout << "frame_reader_smoke: ok\n";
  return 0;
}

#ifndef CAMHOST_TESTS_COMMON_ASSERTIONS_HPP_
#define CAMHOST_TESTS_COMMON_ASSERTIONS_HPP_

#include "protocol/message.hpp"

#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace camhost::tests::common {

[[noreturn]] inline void Fail(std::string_view message) {
  std::cerr << message << '\n';
  std::abort();
}

inline void AssertContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) != std::string_view::npos) {
    return;
  }
  std::cerr << "expected to find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

// Polls `condition` every millisecond until it holds or `timeout` passes.
inline bool WaitUntil(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!condition()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return true;
}

inline std::string DescribeTags(const std::vector<protocol::Message>& messages) {
  std::string out;
  for (const protocol::Message& message : messages) {
    out += out.empty() ? "" : ",";
    out += protocol::ToString(message.tag);
  }
  return out;
}

inline void AssertTags(const std::vector<protocol::Message>& messages,
                       const std::vector<protocol::Tag>& expected, std::string_view context) {
  bool match = messages.size() == expected.size();
  for (std::size_t i = 0; match && i < expected.size(); ++i) {
    match = messages[i].tag == expected[i];
  }
  if (match) {
    return;
  }
  std::string wanted;
  for (const protocol::Tag tag : expected) {
    wanted += wanted.empty() ? "" : ",";
    wanted += protocol::ToString(tag);
  }
  Fail(std::string(context) + ": expected [" + wanted + "] got [" + DescribeTags(messages) + "]");
}

} // namespace camhost::tests::common

#endif // CAMHOST_TESTS_COMMON_ASSERTIONS_HPP_

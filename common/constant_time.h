#ifndef CLIPSYNC_CONSTANT_TIME_H
#define CLIPSYNC_CONSTANT_TIME_H

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace clipsync::common {

// Compares a presented secret against the configured one without an early
// exit on the first mismatching byte. An empty expected value never matches.
inline bool SecretEquals(std::string_view expected, std::string_view presented) {
  if (expected.empty()) {
    return false;
  }
  const std::size_t max_len =
      expected.size() > presented.size() ? expected.size() : presented.size();
  std::size_t diff = expected.size() ^ presented.size();
  for (std::size_t i = 0; i < max_len; ++i) {
    const std::uint8_t ec =
        i < expected.size() ? static_cast<std::uint8_t>(expected[i]) : 0;
    const std::uint8_t pc =
        i < presented.size() ? static_cast<std::uint8_t>(presented[i]) : 0;
    diff |= static_cast<std::size_t>(ec ^ pc);
  }
  return diff == 0;
}

}  // namespace clipsync::common

#endif  // CLIPSYNC_CONSTANT_TIME_H

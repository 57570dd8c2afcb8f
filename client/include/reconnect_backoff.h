#ifndef CLIPSYNC_CLIENT_RECONNECT_BACKOFF_H
#define CLIPSYNC_CLIENT_RECONNECT_BACKOFF_H

#include <cstdint>

namespace clipsync::client {

// Exponential reconnect delay: initial, 2x, 4x, ... capped at max. Never
// exhausts; Reset after a successful connect.
class ReconnectBackoff {
 public:
  ReconnectBackoff(std::uint32_t initial_ms, std::uint32_t max_ms);

  std::uint32_t NextDelayMs();
  void Reset();

  std::uint32_t attempt() const { return attempt_; }

 private:
  std::uint32_t initial_ms_;
  std::uint32_t max_ms_;
  std::uint32_t next_ms_;
  std::uint32_t attempt_{0};
};

}  // namespace clipsync::client

#endif  // CLIPSYNC_CLIENT_RECONNECT_BACKOFF_H

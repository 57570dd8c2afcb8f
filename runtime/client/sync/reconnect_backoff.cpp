#include "reconnect_backoff.h"

namespace clipsync::client {

ReconnectBackoff::ReconnectBackoff(std::uint32_t initial_ms,
                                   std::uint32_t max_ms)
    : initial_ms_(initial_ms == 0 ? 1 : initial_ms),
      max_ms_(max_ms < initial_ms_ ? initial_ms_ : max_ms),
      next_ms_(initial_ms_) {}

std::uint32_t ReconnectBackoff::NextDelayMs() {
  const std::uint32_t delay = next_ms_;
  ++attempt_;
  if (next_ms_ >= max_ms_ / 2) {
    next_ms_ = max_ms_;
  } else {
    next_ms_ *= 2;
  }
  return delay;
}

void ReconnectBackoff::Reset() {
  next_ms_ = initial_ms_;
  attempt_ = 0;
}

}  // namespace clipsync::client

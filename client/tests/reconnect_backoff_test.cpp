#include <cassert>
#include <cstdint>
#include <vector>

#include "reconnect_backoff.h"

using clipsync::client::ReconnectBackoff;

int main() {
  {
    ReconnectBackoff backoff(1000, 30000);
    const std::vector<std::uint32_t> expected = {1000, 2000,  4000,  8000,
                                                 16000, 30000, 30000, 30000};
    for (const auto want : expected) {
      assert(backoff.NextDelayMs() == want);
    }
    assert(backoff.attempt() == expected.size());
    backoff.Reset();
    assert(backoff.attempt() == 0);
    assert(backoff.NextDelayMs() == 1000);
    assert(backoff.NextDelayMs() == 2000);
  }

  {
    ReconnectBackoff backoff(0, 0);
    assert(backoff.NextDelayMs() == 1);
    assert(backoff.NextDelayMs() == 1);
  }

  {
    ReconnectBackoff backoff(500, 100);
    assert(backoff.NextDelayMs() == 500);
    assert(backoff.NextDelayMs() == 500);
  }

  {
    ReconnectBackoff backoff(3000000000u, 4000000000u);
    assert(backoff.NextDelayMs() == 3000000000u);
    assert(backoff.NextDelayMs() == 4000000000u);
    assert(backoff.NextDelayMs() == 4000000000u);
  }

  return 0;
}

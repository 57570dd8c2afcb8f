#include "platform_time.h"

#include <chrono>
#include <thread>

namespace clipsync::platform {

void SleepMs(std::uint32_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

}  // namespace clipsync::platform

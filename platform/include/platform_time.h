#ifndef CLIPSYNC_PLATFORM_TIME_H
#define CLIPSYNC_PLATFORM_TIME_H

#include <cstdint>

namespace clipsync::platform {

void SleepMs(std::uint32_t ms);

}  // namespace clipsync::platform

#endif  // CLIPSYNC_PLATFORM_TIME_H

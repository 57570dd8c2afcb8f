#ifndef CLIPSYNC_PLATFORM_RANDOM_H
#define CLIPSYNC_PLATFORM_RANDOM_H

#include <cstddef>
#include <cstdint>

namespace clipsync::platform {

bool RandomBytes(std::uint8_t* out, std::size_t len);

}  // namespace clipsync::platform

#endif  // CLIPSYNC_PLATFORM_RANDOM_H

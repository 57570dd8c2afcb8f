#ifndef CLIPSYNC_PLATFORM_IO_H
#define CLIPSYNC_PLATFORM_IO_H

#include <cstdint>

namespace clipsync::platform::io {

using Handle = int;
constexpr Handle kStdin = 0;

// True when a read on `handle` will not block, EOF and errors included.
bool WaitForReadable(Handle handle, std::uint32_t timeout_ms);

}  // namespace clipsync::platform::io

#endif  // CLIPSYNC_PLATFORM_IO_H

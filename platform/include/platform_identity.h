#ifndef CLIPSYNC_PLATFORM_IDENTITY_H
#define CLIPSYNC_PLATFORM_IDENTITY_H

#include <string>

namespace clipsync::platform {

// Host name as reported by the OS, empty when unavailable.
std::string Hostname();

}  // namespace clipsync::platform

#endif  // CLIPSYNC_PLATFORM_IDENTITY_H

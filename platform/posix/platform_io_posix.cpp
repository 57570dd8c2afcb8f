#include "platform_io.h"

#include <cerrno>
#include <poll.h>

namespace clipsync::platform::io {

bool WaitForReadable(Handle handle, std::uint32_t timeout_ms) {
  pollfd pfd{};
  pfd.fd = handle;
  pfd.events = POLLIN;
  int rc = 0;
  do {
    rc = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
  } while (rc < 0 && errno == EINTR);
  return rc > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

}  // namespace clipsync::platform::io

#ifndef CLIPSYNC_PLATFORM_CLIPBOARD_H
#define CLIPSYNC_PLATFORM_CLIPBOARD_H

#include <memory>
#include <string>

namespace clipsync::platform {

class ClipboardAccessor {
 public:
  virtual ~ClipboardAccessor() = default;

  virtual bool Read(std::string& out, std::string& error) = 0;
  virtual bool Write(const std::string& text, std::string& error) = 0;
};

struct ClipboardCommands {
  std::string read_command;
  std::string write_command;
};

// Picks wl-paste/wl-copy under Wayland, xclip under X11, pbpaste/pbcopy on
// macOS.
ClipboardCommands DetectClipboardCommands();

// Runs external helper commands through the shell. Empty commands fall back
// to DetectClipboardCommands().
std::unique_ptr<ClipboardAccessor> CreateSystemClipboard(
    ClipboardCommands commands = {});

}  // namespace clipsync::platform

#endif  // CLIPSYNC_PLATFORM_CLIPBOARD_H

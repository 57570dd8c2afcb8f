#include "platform_clipboard.h"

#include <cstdio>
#include <cstdlib>
#include <sys/wait.h>
#include <utility>

namespace clipsync::platform {

namespace {

constexpr std::size_t kMaxClipboardRead = 16u * 1024u * 1024u;

bool ExitedCleanly(int status) {
  return status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

class CommandClipboard final : public ClipboardAccessor {
 public:
  explicit CommandClipboard(ClipboardCommands commands)
      : commands_(std::move(commands)) {}

  bool Read(std::string& out, std::string& error) override {
    out.clear();
    error.clear();
    if (commands_.read_command.empty()) {
      error = "no clipboard read command";
      return false;
    }
    FILE* pipe = ::popen(commands_.read_command.c_str(), "r");
    if (!pipe) {
      error = "popen failed: " + commands_.read_command;
      return false;
    }
    char buf[4096];
    std::size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
      if (out.size() + n > kMaxClipboardRead) {
        ::pclose(pipe);
        out.clear();
        error = "clipboard content too large";
        return false;
      }
      out.append(buf, n);
    }
    const int status = ::pclose(pipe);
    if (!ExitedCleanly(status)) {
      out.clear();
      error = "clipboard read command failed";
      return false;
    }
    return true;
  }

  bool Write(const std::string& text, std::string& error) override {
    error.clear();
    if (commands_.write_command.empty()) {
      error = "no clipboard write command";
      return false;
    }
    FILE* pipe = ::popen(commands_.write_command.c_str(), "w");
    if (!pipe) {
      error = "popen failed: " + commands_.write_command;
      return false;
    }
    const std::size_t written = std::fwrite(text.data(), 1, text.size(), pipe);
    const int status = ::pclose(pipe);
    if (written != text.size() || !ExitedCleanly(status)) {
      error = "clipboard write command failed";
      return false;
    }
    return true;
  }

 private:
  ClipboardCommands commands_;
};

}  // namespace

ClipboardCommands DetectClipboardCommands() {
  ClipboardCommands cmds;
#if defined(__APPLE__)
  cmds.read_command = "pbpaste";
  cmds.write_command = "pbcopy";
#else
  const char* wayland = std::getenv("WAYLAND_DISPLAY");
  if (wayland && *wayland != '\0') {
    cmds.read_command = "wl-paste --no-newline 2>/dev/null";
    cmds.write_command = "wl-copy 2>/dev/null";
  } else {
    cmds.read_command = "xclip -selection clipboard -o 2>/dev/null";
    cmds.write_command = "xclip -selection clipboard -i 2>/dev/null";
  }
#endif
  return cmds;
}

std::unique_ptr<ClipboardAccessor> CreateSystemClipboard(
    ClipboardCommands commands) {
  const ClipboardCommands detected = DetectClipboardCommands();
  if (commands.read_command.empty()) {
    commands.read_command = detected.read_command;
  }
  if (commands.write_command.empty()) {
    commands.write_command = detected.write_command;
  }
  return std::make_unique<CommandClipboard>(std::move(commands));
}

}  // namespace clipsync::platform

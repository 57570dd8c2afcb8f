#include "platform_identity.h"

#include <cctype>
#include <fstream>
#include <unistd.h>

namespace clipsync::platform {

namespace {

void TrimTrailingSpace(std::string& value) {
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.back())) != 0) {
    value.pop_back();
  }
}

}  // namespace

std::string Hostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) == 0 && buf[0] != '\0') {
    std::string name(buf);
    TrimTrailingSpace(name);
    if (!name.empty()) {
      return name;
    }
  }
  std::ifstream f("/etc/hostname");
  if (!f) {
    return {};
  }
  std::string line;
  std::getline(f, line);
  TrimTrailingSpace(line);
  return line;
}

}  // namespace clipsync::platform

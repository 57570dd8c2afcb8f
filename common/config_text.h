#ifndef CLIPSYNC_CONFIG_TEXT_H
#define CLIPSYNC_CONFIG_TEXT_H

#include <cstdint>
#include <functional>
#include <string>

namespace clipsync::common {

std::string Trim(const std::string& input);
std::string StripInlineComment(const std::string& input);

bool ParseUint16(const std::string& text, std::uint16_t& out);
bool ParseUint32(const std::string& text, std::uint32_t& out);
bool ParseBool(const std::string& text, bool& out);

// Called once per `key=value` line with the enclosing `[section]` name
// (empty before the first section header).
using IniHandler = std::function<void(const std::string& section,
                                      const std::string& key,
                                      const std::string& value)>;

bool ReadIniFile(const std::string& path, const IniHandler& handler,
                 std::string& error);

// Returns false when the variable is unset or empty.
bool GetEnv(const char* name, std::string& out);

}  // namespace clipsync::common

#endif  // CLIPSYNC_CONFIG_TEXT_H

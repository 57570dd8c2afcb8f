#ifndef CLIPSYNC_HEX_UTILS_H
#define CLIPSYNC_HEX_UTILS_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace clipsync::common {

std::string BytesToHex(const std::uint8_t* data, std::size_t len);

// Formats 16 random bytes as an RFC 4122 version 4 UUID string
// (the version and variant bits are forced).
std::string FormatUuidV4(std::array<std::uint8_t, 16> bytes);

}  // namespace clipsync::common

#endif  // CLIPSYNC_HEX_UTILS_H

#ifndef CLIPSYNC_COMMON_URL_CODEC_H
#define CLIPSYNC_COMMON_URL_CODEC_H

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace clipsync::common {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// '+' decodes to a space; malformed escapes are kept as-is.
std::string UrlDecode(std::string_view text);
std::string UrlEncode(std::string_view text);

QueryParams ParseQuery(std::string_view query);
std::string EncodeQuery(const QueryParams& params);
// First value for `name`, or empty.
std::string QueryValue(const QueryParams& params, std::string_view name);
// Replaces the first `name` entry or appends one.
void SetQueryValue(QueryParams& params, const std::string& name,
                   const std::string& value);

struct WsUrl {
  std::string host;
  std::uint16_t port{80};
  std::string path{"/"};
  QueryParams query;
};

// Only `ws://` is accepted. IPv6 hosts are written in brackets.
bool ParseWsUrl(const std::string& url, WsUrl& out, std::string& error);

// Path plus encoded query, as sent in the request line.
std::string RequestTarget(const WsUrl& url);
// Value for the Host header; the port is omitted when it is 80.
std::string HostHeader(const WsUrl& url);

}  // namespace clipsync::common

#endif  // CLIPSYNC_COMMON_URL_CODEC_H

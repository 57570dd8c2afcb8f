#include "url_codec.h"

#include <cctype>

#include "config_text.h"

namespace clipsync::common {

namespace {

constexpr std::string_view kWsScheme = "ws://";

int HexValue(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

bool HasSchemePrefix(const std::string& url) {
  if (url.size() <= kWsScheme.size()) {
    return false;
  }
  for (std::size_t i = 0; i < kWsScheme.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(url[i])) != kWsScheme[i]) {
      return false;
    }
  }
  return true;
}

bool ParsePort(const std::string& text, std::uint16_t& port) {
  return ParseUint16(text, port) && port != 0;
}

}  // namespace

std::string UrlDecode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (ch == '+') {
      out.push_back(' ');
      continue;
    }
    if (ch == '%' && i + 2 < text.size()) {
      const int hi = HexValue(text[i + 1]);
      const int lo = HexValue(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(ch);
  }
  return out;
}

std::string UrlEncode(std::string_view text) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(text.size() * 3);
  for (const char ch : text) {
    const unsigned char uc = static_cast<unsigned char>(ch);
    if (std::isalnum(uc) != 0 || ch == '-' || ch == '_' || ch == '.' ||
        ch == '~') {
      out.push_back(ch);
      continue;
    }
    out.push_back('%');
    out.push_back(kHex[uc >> 4]);
    out.push_back(kHex[uc & 0x0F]);
  }
  return out;
}

QueryParams ParseQuery(std::string_view query) {
  QueryParams out;
  std::size_t start = 0;
  while (start <= query.size()) {
    std::size_t end = query.find('&', start);
    if (end == std::string_view::npos) {
      end = query.size();
    }
    const std::string_view pair = query.substr(start, end - start);
    if (!pair.empty()) {
      const std::size_t eq = pair.find('=');
      if (eq == std::string_view::npos) {
        out.emplace_back(UrlDecode(pair), std::string());
      } else {
        out.emplace_back(UrlDecode(pair.substr(0, eq)),
                         UrlDecode(pair.substr(eq + 1)));
      }
    }
    start = end + 1;
  }
  return out;
}

std::string EncodeQuery(const QueryParams& params) {
  std::string out;
  for (const auto& kv : params) {
    if (!out.empty()) {
      out.push_back('&');
    }
    out.append(UrlEncode(kv.first));
    out.push_back('=');
    out.append(UrlEncode(kv.second));
  }
  return out;
}

std::string QueryValue(const QueryParams& params, std::string_view name) {
  for (const auto& kv : params) {
    if (kv.first == name) {
      return kv.second;
    }
  }
  return {};
}

void SetQueryValue(QueryParams& params, const std::string& name,
                   const std::string& value) {
  for (auto& kv : params) {
    if (kv.first == name) {
      kv.second = value;
      return;
    }
  }
  params.emplace_back(name, value);
}

bool ParseWsUrl(const std::string& url, WsUrl& out, std::string& error) {
  out = WsUrl{};
  if (!HasSchemePrefix(url)) {
    error = "server url must start with ws://";
    return false;
  }
  const std::string rest = url.substr(kWsScheme.size());
  const std::size_t slash = rest.find_first_of("/?");
  const std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    const std::string tail = rest.substr(slash);
    const std::size_t q = tail.find('?');
    out.path = tail.substr(0, q);
    if (out.path.empty()) {
      out.path = "/";
    }
    if (q != std::string::npos) {
      out.query = ParseQuery(std::string_view(tail).substr(q + 1));
    }
  }
  if (authority.empty()) {
    error = "server url has no host";
    return false;
  }
  if (authority.front() == '[') {
    const std::size_t close = authority.find(']');
    if (close == std::string::npos) {
      error = "server url has malformed host";
      return false;
    }
    out.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size() &&
        (authority[close + 1] != ':' ||
         !ParsePort(authority.substr(close + 2), out.port))) {
      error = "server url has invalid port";
      return false;
    }
  } else {
    const std::size_t colon = authority.rfind(':');
    out.host = authority.substr(0, colon);
    if (colon != std::string::npos &&
        !ParsePort(authority.substr(colon + 1), out.port)) {
      error = "server url has invalid port";
      return false;
    }
  }
  if (out.host.empty()) {
    error = "server url has no host";
    return false;
  }
  return true;
}

std::string RequestTarget(const WsUrl& url) {
  std::string target = url.path;
  if (!url.query.empty()) {
    target.push_back('?');
    target.append(EncodeQuery(url.query));
  }
  return target;
}

std::string HostHeader(const WsUrl& url) {
  std::string host = url.host.find(':') != std::string::npos
                         ? "[" + url.host + "]"
                         : url.host;
  if (url.port != 80) {
    host.append(":" + std::to_string(url.port));
  }
  return host;
}

}  // namespace clipsync::common

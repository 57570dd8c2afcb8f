#include "client_config.h"

#include "config_text.h"
#include "platform_identity.h"
#include "url_codec.h"

namespace clipsync::client {

namespace {

using common::ParseBool;
using common::ParseUint32;

constexpr const char* kFallbackHostname = "UnknownHost";

void ApplyKV(ClientConfig& cfg, const std::string& key,
             const std::string& val, std::string& bad_key) {
  bool ok = true;
  if (key == "server_url") {
    cfg.server_url = val;
  } else if (key == "api_key") {
    cfg.api_key = val;
  } else if (key == "hostname") {
    cfg.hostname = val;
  } else if (key == "poll_interval_ms") {
    ok = ParseUint32(val, cfg.poll_interval_ms);
  } else if (key == "backoff_initial_ms") {
    ok = ParseUint32(val, cfg.backoff_initial_ms);
  } else if (key == "backoff_max_ms") {
    ok = ParseUint32(val, cfg.backoff_max_ms);
  } else if (key == "connect_timeout_ms") {
    ok = ParseUint32(val, cfg.connect_timeout_ms);
  } else if (key == "write_wait_ms") {
    ok = ParseUint32(val, cfg.write_wait_ms);
  } else if (key == "pong_wait_ms") {
    ok = ParseUint32(val, cfg.pong_wait_ms);
  } else if (key == "ping_period_ms") {
    ok = ParseUint32(val, cfg.ping_period_ms);
  } else if (key == "max_message_bytes") {
    ok = ParseUint32(val, cfg.max_message_bytes);
  } else if (key == "debug_log") {
    ok = ParseBool(val, cfg.debug_log);
  } else if (key == "sync_enabled") {
    ok = ParseBool(val, cfg.sync_enabled);
  } else if (key == "clipboard_read_command") {
    cfg.clipboard_read_command = val;
  } else if (key == "clipboard_write_command") {
    cfg.clipboard_write_command = val;
  }
  if (!ok && bad_key.empty()) {
    bad_key = key;
  }
}

}  // namespace

bool ValidateClientConfig(ClientConfig& cfg, std::string& error) {
  if (cfg.server_url.empty()) {
    error = "server url missing (set SERVER_WS_URL or [client] server_url)";
    return false;
  }
  common::WsUrl url;
  if (!common::ParseWsUrl(cfg.server_url, url, error)) {
    return false;
  }
  if (cfg.api_key.empty()) {
    error = "api key missing (set CLIPBOARD_API_KEY or [client] api_key)";
    return false;
  }
  if (cfg.hostname.empty()) {
    cfg.hostname = platform::Hostname();
    if (cfg.hostname.empty()) {
      cfg.hostname = kFallbackHostname;
    }
  }
  if (cfg.poll_interval_ms == 0 || cfg.backoff_initial_ms == 0 ||
      cfg.connect_timeout_ms == 0 || cfg.write_wait_ms == 0 ||
      cfg.pong_wait_ms == 0) {
    error = "intervals and timeouts must be > 0";
    return false;
  }
  if (cfg.backoff_max_ms < cfg.backoff_initial_ms) {
    error = "backoff_max_ms must be >= backoff_initial_ms";
    return false;
  }
  if (cfg.ping_period_ms == 0) {
    cfg.ping_period_ms = static_cast<std::uint32_t>(
        (static_cast<std::uint64_t>(cfg.pong_wait_ms) * 9u) / 10u);
  }
  if (cfg.ping_period_ms == 0 || cfg.ping_period_ms >= cfg.pong_wait_ms) {
    error = "ping_period_ms must be below pong_wait_ms";
    return false;
  }
  if (cfg.max_message_bytes < 1024u) {
    error = "max_message_bytes too small";
    return false;
  }
  return true;
}

bool LoadClientConfig(const std::string& path, ClientConfig& out_cfg,
                      std::string& error) {
  out_cfg = ClientConfig{};
  error.clear();
  if (!path.empty()) {
    std::string bad_key;
    const bool read_ok = common::ReadIniFile(
        path,
        [&out_cfg, &bad_key](const std::string& section, const std::string& key,
                             const std::string& val) {
          if (section == "client") {
            ApplyKV(out_cfg, key, val, bad_key);
          }
        },
        error);
    if (!read_ok) {
      return false;
    }
    if (!bad_key.empty()) {
      error = "invalid value for " + bad_key + " in " + path;
      return false;
    }
  }

  std::string value;
  if (common::GetEnv("SERVER_WS_URL", value)) {
    out_cfg.server_url = value;
  }
  if (common::GetEnv("CLIPBOARD_API_KEY", value)) {
    out_cfg.api_key = value;
  }
  if (common::GetEnv("CLIPSYNC_HOSTNAME", value)) {
    out_cfg.hostname = value;
  }
  if (common::GetEnv("CLIPSYNC_DEBUG", value) &&
      !ParseBool(value, out_cfg.debug_log)) {
    error = "invalid CLIPSYNC_DEBUG: " + value;
    return false;
  }
  return ValidateClientConfig(out_cfg, error);
}

}  // namespace clipsync::client

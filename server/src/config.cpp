#include "config.h"

#include "clipboard_store.h"
#include "config_text.h"

namespace clipsync::server {

namespace {

using common::ParseBool;
using common::ParseUint16;
using common::ParseUint32;

struct IniState {
  ServerConfig* cfg{nullptr};
  std::string bad_key;
};

void ApplyKV(IniState& state, const std::string& section,
             const std::string& key, const std::string& value) {
  if (section != "server") {
    return;
  }
  ServerSection& s = state.cfg->server;
  bool ok = true;
  if (key == "bind_address") {
    s.bind_address = value;
  } else if (key == "listen_port") {
    ok = ParseUint16(value, s.listen_port);
  } else if (key == "api_key") {
    s.api_key = value;
  } else if (key == "debug_log") {
    ok = ParseBool(value, s.debug_log);
  } else if (key == "max_connections") {
    ok = ParseUint32(value, s.max_connections);
  } else if (key == "max_connections_per_ip") {
    ok = ParseUint32(value, s.max_connections_per_ip);
  } else if (key == "history_size") {
    ok = ParseUint32(value, s.history_size);
  } else if (key == "event_queue_capacity") {
    ok = ParseUint32(value, s.event_queue_capacity);
  } else if (key == "handshake_timeout_ms") {
    ok = ParseUint32(value, s.handshake_timeout_ms);
  } else if (key == "write_wait_ms") {
    ok = ParseUint32(value, s.write_wait_ms);
  } else if (key == "pong_wait_ms") {
    ok = ParseUint32(value, s.pong_wait_ms);
  } else if (key == "ping_period_ms") {
    ok = ParseUint32(value, s.ping_period_ms);
  } else if (key == "max_message_bytes") {
    ok = ParseUint32(value, s.max_message_bytes);
  }
  if (!ok && state.bad_key.empty()) {
    state.bad_key = key;
  }
}

bool ApplyEnvironment(ServerConfig& cfg, std::string& error) {
  std::string value;
  if (common::GetEnv("PORT", value) &&
      !ParseUint16(value, cfg.server.listen_port)) {
    error = "invalid PORT: " + value;
    return false;
  }
  if (common::GetEnv("CLIPBOARD_API_KEY", value)) {
    cfg.server.api_key = value;
  }
  if (common::GetEnv("CLIPSYNC_DEBUG", value) &&
      !ParseBool(value, cfg.server.debug_log)) {
    error = "invalid CLIPSYNC_DEBUG: " + value;
    return false;
  }
  return true;
}

}  // namespace

bool ValidateConfig(ServerConfig& config, std::string& error) {
  ServerSection& s = config.server;
  if (s.api_key.empty()) {
    error = "api key missing (set CLIPBOARD_API_KEY or [server] api_key)";
    return false;
  }
  if (s.listen_port == 0) {
    error = "server listen port missing";
    return false;
  }
  if (s.history_size == 0 || s.event_queue_capacity == 0 ||
      s.max_connections == 0 || s.max_connections_per_ip == 0) {
    error = "history_size, event_queue_capacity and connection limits must be > 0";
    return false;
  }
  if (s.history_size > kDefaultHistorySize) {
    error = "history_size must be <= " + std::to_string(kDefaultHistorySize);
    return false;
  }
  if (s.write_wait_ms == 0 || s.pong_wait_ms == 0 ||
      s.handshake_timeout_ms == 0) {
    error = "timeouts must be > 0";
    return false;
  }
  if (s.ping_period_ms == 0) {
    s.ping_period_ms = static_cast<std::uint32_t>(
        (static_cast<std::uint64_t>(s.pong_wait_ms) * 9u) / 10u);
  }
  if (s.ping_period_ms == 0 || s.ping_period_ms >= s.pong_wait_ms) {
    error = "ping_period_ms must be below pong_wait_ms";
    return false;
  }
  if (s.max_message_bytes < 1024u) {
    error = "max_message_bytes too small";
    return false;
  }
  return true;
}

bool LoadConfig(const std::string& path, ServerConfig& out_config,
                std::string& error) {
  out_config = ServerConfig{};
  error.clear();
  if (!path.empty()) {
    IniState state;
    state.cfg = &out_config;
    const bool read_ok = common::ReadIniFile(
        path,
        [&state](const std::string& section, const std::string& key,
                 const std::string& value) {
          ApplyKV(state, section, key, value);
        },
        error);
    if (!read_ok) {
      return false;
    }
    if (!state.bad_key.empty()) {
      error = "invalid value for " + state.bad_key + " in " + path;
      return false;
    }
  }
  if (!ApplyEnvironment(out_config, error)) {
    return false;
  }
  return ValidateConfig(out_config, error);
}

}  // namespace clipsync::server

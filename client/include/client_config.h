#ifndef CLIPSYNC_CLIENT_CONFIG_H
#define CLIPSYNC_CLIENT_CONFIG_H

#include <cstdint>
#include <string>

namespace clipsync::client {

struct ClientConfig {
  std::string server_url;
  std::string api_key;
  std::string hostname;
  std::uint32_t poll_interval_ms{2000};
  std::uint32_t backoff_initial_ms{1000};
  std::uint32_t backoff_max_ms{30000};
  std::uint32_t connect_timeout_ms{10000};
  std::uint32_t write_wait_ms{10000};
  std::uint32_t pong_wait_ms{60000};
  std::uint32_t ping_period_ms{0};
  std::uint32_t max_message_bytes{512u * 1024u};
  bool debug_log{false};
  bool sync_enabled{true};
  std::string clipboard_read_command;
  std::string clipboard_write_command;
};

// `[client]` section of `path` when non-empty, then SERVER_WS_URL,
// CLIPBOARD_API_KEY, CLIPSYNC_HOSTNAME and CLIPSYNC_DEBUG. An empty hostname
// falls back to the OS host name, then to "UnknownHost".
bool LoadClientConfig(const std::string& path, ClientConfig& out_cfg,
                      std::string& error);

bool ValidateClientConfig(ClientConfig& cfg, std::string& error);

}  // namespace clipsync::client

#endif  // CLIPSYNC_CLIENT_CONFIG_H

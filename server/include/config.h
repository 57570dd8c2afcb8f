#ifndef CLIPSYNC_SERVER_CONFIG_H
#define CLIPSYNC_SERVER_CONFIG_H

#include <cstdint>
#include <string>

namespace clipsync::server {

struct ServerSection {
  std::string bind_address{"0.0.0.0"};
  std::uint16_t listen_port{8080};
  std::string api_key;
  bool debug_log{false};
  std::uint32_t max_connections{256};
  std::uint32_t max_connections_per_ip{64};
  std::uint32_t history_size{20};
  std::uint32_t event_queue_capacity{256};
  std::uint32_t handshake_timeout_ms{10000};
  std::uint32_t write_wait_ms{10000};
  std::uint32_t pong_wait_ms{60000};
  std::uint32_t ping_period_ms{0};
  std::uint32_t max_message_bytes{512u * 1024u};
};

struct ServerConfig {
  ServerSection server;
};

// Reads `path` when non-empty, then applies PORT, CLIPBOARD_API_KEY and
// CLIPSYNC_DEBUG from the environment, then validates. ping_period_ms of 0 is
// derived as 9/10 of pong_wait_ms.
bool LoadConfig(const std::string& path, ServerConfig& out_config,
                std::string& error);

bool ValidateConfig(ServerConfig& config, std::string& error);

}  // namespace clipsync::server

#endif  // CLIPSYNC_SERVER_CONFIG_H

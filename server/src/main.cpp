#include <csignal>
#include <fstream>
#include <string>

#include "connection_handler.h"
#include "network_server.h"
#include "platform_log.h"
#include "platform_time.h"
#include "sync_hub.h"

namespace {

namespace pl = clipsync::platform::log;

constexpr const char* kDefaultConfigPath = "clipsync_server.ini";

volatile std::sig_atomic_t g_stop_requested = 0;

void OnStopSignal(int) { g_stop_requested = 1; }

std::string ResolveConfigPath(int argc, char** argv) {
  if (argc > 1) {
    return argv[1];
  }
  std::ifstream candidate(kDefaultConfigPath);
  return candidate.good() ? kDefaultConfigPath : "";
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGPIPE, SIG_IGN);
  std::signal(SIGINT, OnStopSignal);
  std::signal(SIGTERM, OnStopSignal);

  const std::string config_path = ResolveConfigPath(argc, argv);
  std::string error;
  clipsync::server::SyncHub hub;
  if (!hub.Init(config_path, error)) {
    pl::Log(pl::Level::kError, "main", error);
    return 1;
  }

  const auto& cfg = hub.config();
  if (cfg.server.debug_log) {
    pl::SetMinLevel(pl::Level::kDebug);
  }
  pl::Log(pl::Level::kInfo, "main", "server config loaded",
          {{"config", config_path.empty() ? "(environment)" : config_path},
           {"listen_port", std::to_string(cfg.server.listen_port)},
           {"history_size", std::to_string(cfg.server.history_size)},
           {"ping_period_ms", std::to_string(cfg.server.ping_period_ms)}});

  clipsync::server::ConnectionHandler handler(&hub);
  clipsync::server::NetworkServerLimits limits;
  limits.max_connections = cfg.server.max_connections;
  limits.max_connections_per_ip = cfg.server.max_connections_per_ip;
  clipsync::server::NetworkServer net(&handler, cfg.server.bind_address,
                                      cfg.server.listen_port, limits);
  if (!net.Start(error)) {
    pl::Log(pl::Level::kError, "main",
            error.empty() ? "network server start failed" : error);
    hub.Shutdown();
    return 1;
  }

  while (g_stop_requested == 0) {
    clipsync::platform::SleepMs(200);
  }

  pl::Log(pl::Level::kInfo, "main", "shutting down");
  hub.Shutdown();
  net.Stop();
  const auto stats = handler.stats();
  pl::Log(pl::Level::kInfo, "main", "stopped",
          {{"upgrades", std::to_string(stats.upgrades)},
           {"auth_failures", std::to_string(stats.auth_failures)},
           {"health_checks", std::to_string(stats.health_checks)}});
  return 0;
}

#include <cassert>
#include <cstdlib>
#include <fstream>
#include <string>

#include "config.h"

using clipsync::server::LoadConfig;
using clipsync::server::ServerConfig;

static void WriteFile(const std::string& path, const std::string& content) {
  std::ofstream f(path, std::ios::binary);
  f << content;
}

int main() {
  ::unsetenv("PORT");
  ::unsetenv("CLIPBOARD_API_KEY");
  ::unsetenv("CLIPSYNC_DEBUG");

  {
    const std::string path = "tmp_config_full.ini";
    WriteFile(path,
              "# hub settings\n"
              "[server]\n"
              "listen_port=9000  # listen port\n"
              "api_key=shared-secret\n"
              "max_connections=10\n"
              "max_connections_per_ip=3\n"
              "history_size=5\n"
              "pong_wait_ms=2000\n"
              "debug_log=1\n");
    ServerConfig cfg;
    std::string err;
    bool ok = LoadConfig(path, cfg, err);
    assert(ok);
    assert(cfg.server.listen_port == 9000);
    assert(cfg.server.api_key == "shared-secret");
    assert(cfg.server.max_connections == 10);
    assert(cfg.server.max_connections_per_ip == 3);
    assert(cfg.server.history_size == 5);
    assert(cfg.server.debug_log);
    assert(cfg.server.pong_wait_ms == 2000);
    assert(cfg.server.ping_period_ms == 1800);
    assert(cfg.server.write_wait_ms == 10000);
    assert(cfg.server.max_message_bytes == 512u * 1024u);
  }

  {
    const std::string path = "tmp_config_defaults.ini";
    WriteFile(path, "[server]\napi_key=k\n");
    ServerConfig cfg;
    std::string err;
    bool ok = LoadConfig(path, cfg, err);
    assert(ok);
    assert(cfg.server.listen_port == 8080);
    assert(cfg.server.history_size == 20);
    assert(cfg.server.pong_wait_ms == 60000);
    assert(cfg.server.ping_period_ms == 54000);
    assert(!cfg.server.debug_log);
  }

  {
    const std::string path = "tmp_config_no_key.ini";
    WriteFile(path, "[server]\nlisten_port=8000\n");
    ServerConfig cfg;
    std::string err;
    bool ok = LoadConfig(path, cfg, err);
    assert(!ok);
    assert(err.find("api key") != std::string::npos);
  }

  {
    const std::string path = "tmp_config_bad_port.ini";
    WriteFile(path, "[server]\napi_key=k\nlisten_port=70000\n");
    ServerConfig cfg;
    std::string err;
    bool ok = LoadConfig(path, cfg, err);
    assert(!ok);
    assert(err == "invalid value for listen_port in " + path);
  }

  {
    const std::string path = "tmp_config_ping.ini";
    WriteFile(path,
              "[server]\napi_key=k\npong_wait_ms=1000\nping_period_ms=1000\n");
    ServerConfig cfg;
    std::string err;
    bool ok = LoadConfig(path, cfg, err);
    assert(!ok);
  }

  {
    const std::string path = "tmp_config_history.ini";
    WriteFile(path, "[server]\napi_key=k\nhistory_size=21\n");
    ServerConfig cfg;
    std::string err;
    bool ok = LoadConfig(path, cfg, err);
    assert(!ok);
    assert(err == "history_size must be <= 20");

    WriteFile(path, "[server]\napi_key=k\nhistory_size=20\n");
    ok = LoadConfig(path, cfg, err);
    assert(ok);
    assert(cfg.server.history_size == 20);
  }

  {
    const std::string path = "tmp_config_other_section.ini";
    WriteFile(path,
              "[client]\napi_key=ignored\n[server]\napi_key=hub-key\n");
    ServerConfig cfg;
    std::string err;
    bool ok = LoadConfig(path, cfg, err);
    assert(ok);
    assert(cfg.server.api_key == "hub-key");
  }

  {
    ServerConfig cfg;
    std::string err;
    bool ok = LoadConfig("tmp_config_missing_file.ini", cfg, err);
    assert(!ok);
  }

  {
    ::setenv("PORT", "7070", 1);
    ::setenv("CLIPBOARD_API_KEY", "from-env", 1);
    const std::string path = "tmp_config_env.ini";
    WriteFile(path, "[server]\nlisten_port=9000\napi_key=from-file\n");
    ServerConfig cfg;
    std::string err;
    bool ok = LoadConfig(path, cfg, err);
    assert(ok);
    assert(cfg.server.listen_port == 7070);
    assert(cfg.server.api_key == "from-env");

    ServerConfig env_only;
    ok = LoadConfig("", env_only, err);
    assert(ok);
    assert(env_only.server.api_key == "from-env");

    ::setenv("PORT", "not-a-port", 1);
    ok = LoadConfig("", env_only, err);
    assert(!ok);
    ::unsetenv("PORT");
    ::unsetenv("CLIPBOARD_API_KEY");
  }

  return 0;
}

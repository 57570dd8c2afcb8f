#include <cassert>
#include <cstdlib>
#include <fstream>
#include <string>

#include "client_config.h"

using clipsync::client::ClientConfig;
using clipsync::client::LoadClientConfig;

static void WriteFile(const std::string& path, const std::string& content) {
  std::ofstream f(path, std::ios::binary);
  f << content;
}

int main() {
  ::unsetenv("SERVER_WS_URL");
  ::unsetenv("CLIPBOARD_API_KEY");
  ::unsetenv("CLIPSYNC_HOSTNAME");
  ::unsetenv("CLIPSYNC_DEBUG");

  {
    const std::string path = "tmp_client_full.ini";
    WriteFile(path,
              "[client]\n"
              "server_url=ws://127.0.0.1:9000/ws  # hub\n"
              "api_key=secret\n"
              "hostname=laptop\n"
              "poll_interval_ms=500\n"
              "backoff_initial_ms=250\n"
              "backoff_max_ms=4000\n"
              "sync_enabled=0\n"
              "clipboard_read_command=cat /tmp/clip\n");
    ClientConfig cfg;
    std::string err;
    bool ok = LoadClientConfig(path, cfg, err);
    assert(ok);
    assert(cfg.server_url == "ws://127.0.0.1:9000/ws");
    assert(cfg.api_key == "secret");
    assert(cfg.hostname == "laptop");
    assert(cfg.poll_interval_ms == 500);
    assert(cfg.backoff_initial_ms == 250);
    assert(cfg.backoff_max_ms == 4000);
    assert(!cfg.sync_enabled);
    assert(cfg.clipboard_read_command == "cat /tmp/clip");
    assert(cfg.ping_period_ms == 54000);
  }

  {
    const std::string path = "tmp_client_defaults.ini";
    WriteFile(path, "[client]\nserver_url=ws://hub/ws\napi_key=k\n");
    ClientConfig cfg;
    std::string err;
    bool ok = LoadClientConfig(path, cfg, err);
    assert(ok);
    assert(cfg.poll_interval_ms == 2000);
    assert(cfg.backoff_initial_ms == 1000);
    assert(cfg.backoff_max_ms == 30000);
    assert(cfg.sync_enabled);
    assert(!cfg.hostname.empty());
  }

  {
    const std::string path = "tmp_client_no_url.ini";
    WriteFile(path, "[client]\napi_key=k\n");
    ClientConfig cfg;
    std::string err;
    assert(!LoadClientConfig(path, cfg, err));
    assert(err.find("server url") != std::string::npos);
  }

  {
    const std::string path = "tmp_client_wss.ini";
    WriteFile(path, "[client]\nserver_url=wss://hub/ws\napi_key=k\n");
    ClientConfig cfg;
    std::string err;
    assert(!LoadClientConfig(path, cfg, err));
  }

  {
    const std::string path = "tmp_client_backoff.ini";
    WriteFile(path,
              "[client]\nserver_url=ws://hub/ws\napi_key=k\n"
              "backoff_initial_ms=5000\nbackoff_max_ms=1000\n");
    ClientConfig cfg;
    std::string err;
    assert(!LoadClientConfig(path, cfg, err));
  }

  {
    const std::string path = "tmp_client_bad_number.ini";
    WriteFile(path,
              "[client]\nserver_url=ws://hub/ws\napi_key=k\npoll_interval_ms=-1\n");
    ClientConfig cfg;
    std::string err;
    assert(!LoadClientConfig(path, cfg, err));
    assert(err == "invalid value for poll_interval_ms in " + path);
  }

  {
    ::setenv("SERVER_WS_URL", "ws://env-host:8081/ws", 1);
    ::setenv("CLIPBOARD_API_KEY", "env-key", 1);
    ::setenv("CLIPSYNC_HOSTNAME", "env-box", 1);
    ClientConfig cfg;
    std::string err;
    bool ok = LoadClientConfig("", cfg, err);
    assert(ok);
    assert(cfg.server_url == "ws://env-host:8081/ws");
    assert(cfg.api_key == "env-key");
    assert(cfg.hostname == "env-box");
    ::unsetenv("SERVER_WS_URL");
    ::unsetenv("CLIPBOARD_API_KEY");
    ::unsetenv("CLIPSYNC_HOSTNAME");
  }

  return 0;
}

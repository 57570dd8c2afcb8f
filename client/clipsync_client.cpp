#include <csignal>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <system_error>

#include "client_config.h"
#include "platform_clipboard.h"
#include "platform_log.h"
#include "platform_io.h"
#include "sync_agent.h"
#include "ws_client.h"

namespace {

namespace pl = clipsync::platform::log;
using clipsync::client::AgentStatus;
using clipsync::client::ConnectionState;
using clipsync::client::SyncAgent;

constexpr const char* kDefaultConfigPath = "clipsync_client.ini";

volatile std::sig_atomic_t g_stop_requested = 0;

void OnStopSignal(int) { g_stop_requested = 1; }

std::string ResolveConfigPath(int argc, char** argv) {
  if (argc > 1) {
    return argv[1];
  }
  std::ifstream candidate(kDefaultConfigPath);
  return candidate.good() ? kDefaultConfigPath : "";
}

void PrintHelp() {
  std::cout << "commands:\n"
               "  a                    accept pending file offer\n"
               "  r                    reject pending file offer\n"
               "  s                    toggle clipboard sync\n"
               "  d                    refresh device list\n"
               "  o <deviceId> <path>  offer a file to a device\n"
               "  l                    show status\n"
               "  q                    quit\n";
}

void PrintStatus(const AgentStatus& s) {
  std::cout << "state: " << clipsync::client::ConnectionStateName(s.state)
            << "  sync: " << (s.sync_enabled ? "on" : "off")
            << "  attempts: " << s.connect_attempts << "\n";
  if (!s.last_error.empty()) {
    std::cout << "last error: " << s.last_error << "\n";
  }
  std::cout << "devices (" << s.devices.size() << "):\n";
  for (const auto& d : s.devices) {
    std::cout << "  " << d.id << "  " << d.hostname << "\n";
  }
  std::cout << "history (" << s.history.size() << "):\n";
  for (std::size_t i = 0; i < s.history.size(); ++i) {
    std::string line = s.history[i].substr(0, 60);
    for (char& ch : line) {
      if (ch == '\n' || ch == '\r' || ch == '\t') {
        ch = ' ';
      }
    }
    std::cout << "  " << i + 1 << ". " << line
              << (s.history[i].size() > 60 ? "..." : "") << "\n";
  }
  if (s.pending_offer) {
    std::cout << "pending offer: " << s.pending_offer->filename << " ("
              << s.pending_offer->filesize << " bytes) from "
              << s.pending_offer->offering_hostname << "\n";
  }
  std::cout.flush();
}

// Prints connection transitions and notices as they change.
class StatusPrinter {
 public:
  void operator()(const AgentStatus& s) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (s.state != last_state_ || s.next_retry_ms != last_retry_ms_) {
      last_state_ = s.state;
      last_retry_ms_ = s.next_retry_ms;
      std::cout << "[" << clipsync::client::ConnectionStateName(s.state) << "]";
      if (s.state == ConnectionState::kDisconnected && !s.last_error.empty()) {
        std::cout << " " << s.last_error;
        if (s.next_retry_ms != 0) {
          std::cout << " (retry in " << s.next_retry_ms << " ms)";
        }
      }
      std::cout << std::endl;
    }
    if (!s.last_notice.empty() && s.last_notice != last_notice_) {
      last_notice_ = s.last_notice;
      std::cout << "* " << s.last_notice << std::endl;
    }
  }

 private:
  std::mutex mutex_;
  ConnectionState last_state_{ConnectionState::kDisconnected};
  std::uint32_t last_retry_ms_{0};
  std::string last_notice_;
};

bool OfferFileCommand(SyncAgent& agent, std::istringstream& args,
                      std::string& error) {
  std::string target;
  std::string path;
  args >> target >> std::ws;
  std::getline(args, path);
  if (target.empty() || path.empty()) {
    error = "usage: o <deviceId> <path>";
    return false;
  }
  std::error_code ec;
  const std::filesystem::path file(path);
  const auto size = std::filesystem::file_size(file, ec);
  if (ec) {
    error = "cannot stat " + path + ": " + ec.message();
    return false;
  }
  return agent.OfferFile(target, file.filename().string(),
                         static_cast<std::int64_t>(size), error);
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGPIPE, SIG_IGN);
  std::signal(SIGINT, OnStopSignal);
  std::signal(SIGTERM, OnStopSignal);

  const std::string config_path = ResolveConfigPath(argc, argv);
  clipsync::client::ClientConfig cfg;
  std::string error;
  if (!clipsync::client::LoadClientConfig(config_path, cfg, error)) {
    pl::Log(pl::Level::kError, "main", error);
    return 1;
  }
  if (cfg.debug_log) {
    pl::SetMinLevel(pl::Level::kDebug);
  }
  pl::Log(pl::Level::kInfo, "main", "client config loaded",
          {{"config", config_path.empty() ? "(environment)" : config_path},
           {"hostname", cfg.hostname},
           {"poll_interval_ms", std::to_string(cfg.poll_interval_ms)}});

  clipsync::platform::ClipboardCommands commands;
  commands.read_command = cfg.clipboard_read_command;
  commands.write_command = cfg.clipboard_write_command;
  std::shared_ptr<clipsync::platform::ClipboardAccessor> clipboard =
      clipsync::platform::CreateSystemClipboard(commands);
  auto connector = std::make_shared<clipsync::client::WsConnector>(cfg);

  SyncAgent agent(clipsync::client::MakeAgentOptions(cfg), connector,
                  clipboard);
  auto printer = std::make_shared<StatusPrinter>();
  agent.SetObserver([printer](const AgentStatus& s) { (*printer)(s); });
  if (!agent.Start(error)) {
    pl::Log(pl::Level::kError, "main", error);
    return 1;
  }
  PrintHelp();

  bool quit = false;
  while (!quit && g_stop_requested == 0) {
    if (!clipsync::platform::io::WaitForReadable(
            clipsync::platform::io::kStdin, 200)) {
      continue;
    }
    std::string line;
    if (!std::getline(std::cin, line)) {
      break;
    }
    std::istringstream args(line);
    std::string cmd;
    args >> cmd;
    if (cmd.empty()) {
      continue;
    }
    bool ok = true;
    error.clear();
    if (cmd == "a") {
      ok = agent.AcceptPendingOffer(error);
    } else if (cmd == "r") {
      ok = agent.RejectPendingOffer(error);
    } else if (cmd == "s") {
      agent.SetSyncEnabled(!agent.Status().sync_enabled);
    } else if (cmd == "d") {
      ok = agent.RequestDevices(error);
    } else if (cmd == "o") {
      ok = OfferFileCommand(agent, args, error);
    } else if (cmd == "l") {
      PrintStatus(agent.Status());
    } else if (cmd == "q") {
      quit = true;
    } else {
      PrintHelp();
    }
    if (!ok) {
      std::cout << "error: " << error << std::endl;
    }
  }

  agent.Stop();
  pl::Log(pl::Level::kInfo, "main", "stopped");
  return 0;
}

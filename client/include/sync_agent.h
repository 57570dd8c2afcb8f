#ifndef CLIPSYNC_CLIENT_SYNC_AGENT_H
#define CLIPSYNC_CLIENT_SYNC_AGENT_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "agent_link.h"
#include "client_config.h"
#include "platform_clipboard.h"
#include "protocol.h"
#include "reconnect_backoff.h"

namespace clipsync::client {

enum class ConnectionState : std::uint8_t {
  kDisconnected = 0,
  kConnecting = 1,
  kConnected = 2
};

const char* ConnectionStateName(ConnectionState state);

constexpr std::size_t kAgentHistoryLimit = 20;

struct AgentOptions {
  std::uint32_t poll_interval_ms{2000};
  std::uint32_t backoff_initial_ms{1000};
  std::uint32_t backoff_max_ms{30000};
  std::uint32_t pong_wait_ms{60000};
  std::uint32_t ping_period_ms{54000};
  bool sync_enabled{true};
};

AgentOptions MakeAgentOptions(const ClientConfig& cfg);

struct PendingFileOffer {
  std::string filename;
  std::int64_t filesize{0};
  std::string offering_device_id;
  std::string offering_hostname;
};

struct AgentStatus {
  ConnectionState state{ConnectionState::kDisconnected};
  std::string last_error;
  std::string last_notice;
  std::uint32_t next_retry_ms{0};
  std::uint64_t connect_attempts{0};
  bool sync_enabled{true};
  std::vector<server::proto::DeviceInfo> devices;
  std::vector<std::string> history;
  std::optional<PendingFileOffer> pending_offer;
};

using StatusObserver = std::function<void(const AgentStatus&)>;

// Keeps one connection to the hub alive and mirrors the OS clipboard through
// it. Each connection attempt owns a cancel scope shared by the listener, ping
// and poll threads; a fault on any of them ends all three before the next
// attempt starts.
class SyncAgent {
 public:
  SyncAgent(AgentOptions options, std::shared_ptr<AgentConnector> connector,
            std::shared_ptr<platform::ClipboardAccessor> clipboard);
  ~SyncAgent();

  SyncAgent(const SyncAgent&) = delete;
  SyncAgent& operator=(const SyncAgent&) = delete;

  // Called outside internal locks, from agent threads.
  void SetObserver(StatusObserver observer);

  bool Start(std::string& error);
  void Stop();

  AgentStatus Status() const;
  ConnectionState state() const;

  void SetSyncEnabled(bool enabled);
  bool RequestDevices(std::string& error);
  bool OfferFile(const std::string& target_id, const std::string& filename,
                 std::int64_t filesize, std::string& error);
  bool AcceptPendingOffer(std::string& error);
  bool RejectPendingOffer(std::string& error);

  // Applies one inbound event to local state and the OS clipboard.
  void ApplyEvent(const server::proto::Event& event);
  // One clipboard poll: sends the local value when it is new to this agent.
  void PollClipboardOnce();

  std::string last_sent() const;
  std::string last_received() const;

 private:
  struct AttemptScope;
  struct InboundVisitor;

  void SupervisorLoop();
  // Returns the reason the attempt ended.
  std::string RunConnected(const std::shared_ptr<AgentLink>& link);
  void ListenLoop(const std::shared_ptr<AttemptScope>& scope);
  void PingLoop(const std::shared_ptr<AttemptScope>& scope);
  void PollLoop(const std::shared_ptr<AttemptScope>& scope);
  bool WaitForStop(std::uint32_t delay_ms);
  bool SendEvent(const server::proto::Event& event, std::string& error);
  bool SendFileAck(bool allow, std::string& error);
  void SetState(ConnectionState state, const std::string& error,
                std::uint32_t next_retry_ms);
  void SetNotice(const std::string& notice);
  void Notify();
  AgentStatus StatusLocked() const;
  std::shared_ptr<AttemptScope> CurrentScope() const;

  const AgentOptions options_;
  std::shared_ptr<AgentConnector> connector_;
  std::shared_ptr<platform::ClipboardAccessor> clipboard_;
  ReconnectBackoff backoff_;

  mutable std::mutex mutex_;
  std::condition_variable stop_cv_;
  bool stopping_{false};
  std::thread supervisor_;
  std::shared_ptr<AttemptScope> scope_;

  ConnectionState state_{ConnectionState::kDisconnected};
  std::string last_error_;
  std::string last_notice_;
  std::uint32_t next_retry_ms_{0};
  std::uint64_t connect_attempts_{0};
  bool sync_enabled_{true};
  std::string last_sent_;
  std::string last_received_;
  std::vector<std::string> history_;
  std::vector<server::proto::DeviceInfo> devices_;
  std::unordered_map<std::string, std::string> hostnames_;
  std::optional<PendingFileOffer> pending_offer_;

  std::mutex observer_mutex_;
  StatusObserver observer_;
};

}  // namespace clipsync::client

#endif  // CLIPSYNC_CLIENT_SYNC_AGENT_H

#include "sync_agent.h"

#include <chrono>
#include <utility>
#include <variant>

#include "platform_log.h"

namespace clipsync::client {

namespace {

namespace pl = platform::log;
namespace proto = server::proto;

void PrependBounded(std::vector<std::string>& history,
                    const std::string& value) {
  history.insert(history.begin(), value);
  if (history.size() > kAgentHistoryLimit) {
    history.resize(kAgentHistoryLimit);
  }
}

}  // namespace

const char* ConnectionStateName(ConnectionState state) {
  switch (state) {
    case ConnectionState::kDisconnected:
      return "disconnected";
    case ConnectionState::kConnecting:
      return "connecting";
    case ConnectionState::kConnected:
      return "connected";
  }
  return "unknown";
}

AgentOptions MakeAgentOptions(const ClientConfig& cfg) {
  AgentOptions o;
  o.poll_interval_ms = cfg.poll_interval_ms;
  o.backoff_initial_ms = cfg.backoff_initial_ms;
  o.backoff_max_ms = cfg.backoff_max_ms;
  o.pong_wait_ms = cfg.pong_wait_ms;
  o.ping_period_ms = cfg.ping_period_ms != 0 ? cfg.ping_period_ms
                                             : cfg.pong_wait_ms / 10 * 9;
  o.sync_enabled = cfg.sync_enabled;
  return o;
}

struct SyncAgent::AttemptScope {
  explicit AttemptScope(std::shared_ptr<AgentLink> l) : link(std::move(l)) {}

  void Cancel(const std::string& why) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (cancelled) {
        return;
      }
      cancelled = true;
      reason = why;
    }
    cv.notify_all();
    link->Close();
  }

  bool IsCancelled() const {
    std::lock_guard<std::mutex> lock(mutex);
    return cancelled;
  }

  // True when cancelled before the delay elapsed.
  bool WaitFor(std::uint32_t ms) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, std::chrono::milliseconds(ms),
                       [this] { return cancelled; });
  }

  std::string Reason() const {
    std::lock_guard<std::mutex> lock(mutex);
    return reason;
  }

  const std::shared_ptr<AgentLink> link;
  mutable std::mutex mutex;
  std::condition_variable cv;
  bool cancelled{false};
  std::string reason;
};

// Runs with mutex_ held. Anything that must touch the OS clipboard is left in
// `write_back` for the caller.
struct SyncAgent::InboundVisitor {
  SyncAgent& agent;
  const std::string& sender;
  std::optional<std::string>& write_back;

  void operator()(const proto::ClipboardUpdate& update) const {
    agent.last_received_ = update.content;
    PrependBounded(agent.history_, update.content);
    if (agent.sync_enabled_ && update.content != agent.last_sent_) {
      write_back = update.content;
    }
  }

  void operator()(const proto::ClipboardHistory& history) const {
    agent.history_ = history.history;
    if (agent.history_.size() > kAgentHistoryLimit) {
      agent.history_.resize(kAgentHistoryLimit);
    }
    pl::Log(pl::Level::kDebug, "agent", "history received",
            {{"items", std::to_string(agent.history_.size())}});
  }

  void operator()(const proto::DeviceList& list) const {
    agent.devices_ = list.devices;
    agent.hostnames_.clear();
    for (const auto& d : list.devices) {
      agent.hostnames_[d.id] = d.hostname;
    }
    pl::Log(pl::Level::kDebug, "agent", "device list",
            {{"devices", std::to_string(list.devices.size())}});
  }

  void operator()(const proto::RequestDevices&) const {
    pl::Log(pl::Level::kDebug, "agent", "unexpected request_devices ignored");
  }

  void operator()(const proto::FileOffer& offer) const {
    PendingFileOffer pending;
    pending.filename = offer.filename;
    pending.filesize = offer.filesize;
    pending.offering_device_id = sender;
    pending.offering_hostname = HostnameOf(sender);
    agent.last_notice_ = pending.offering_hostname + " offers " +
                         offer.filename + " (" +
                         std::to_string(offer.filesize) + " bytes)";
    agent.pending_offer_ = std::move(pending);
  }

  void operator()(const proto::FileAck& ack) const {
    agent.last_notice_ = HostnameOf(sender) +
                         (ack.allow ? " accepted " : " rejected ") +
                         ack.filename;
    if (ack.allow) {
      pl::Log(pl::Level::kInfo, "agent",
              "file accepted by peer; chunk transfer is not available",
              {{"file", ack.filename}, {"device", sender}});
    }
  }

  std::string HostnameOf(const std::string& id) const {
    const auto it = agent.hostnames_.find(id);
    if (it == agent.hostnames_.end()) {
      return "Unknown";
    }
    return it->second;
  }
};

SyncAgent::SyncAgent(AgentOptions options,
                     std::shared_ptr<AgentConnector> connector,
                     std::shared_ptr<platform::ClipboardAccessor> clipboard)
    : options_(options),
      connector_(std::move(connector)),
      clipboard_(std::move(clipboard)),
      backoff_(options.backoff_initial_ms, options.backoff_max_ms),
      sync_enabled_(options.sync_enabled) {}

SyncAgent::~SyncAgent() {
  Stop();
}

void SyncAgent::SetObserver(StatusObserver observer) {
  std::lock_guard<std::mutex> lock(observer_mutex_);
  observer_ = std::move(observer);
}

bool SyncAgent::Start(std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (supervisor_.joinable()) {
    error = "agent already started";
    return false;
  }
  if (!connector_ || !clipboard_) {
    error = "agent missing connector or clipboard";
    return false;
  }
  stopping_ = false;
  supervisor_ = std::thread([this] { SupervisorLoop(); });
  return true;
}

void SyncAgent::Stop() {
  std::shared_ptr<AttemptScope> scope;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!supervisor_.joinable()) {
      return;
    }
    stopping_ = true;
    scope = scope_;
  }
  stop_cv_.notify_all();
  if (scope) {
    scope->Cancel("agent stopped");
  }
  supervisor_.join();
  SetState(ConnectionState::kDisconnected, "", 0);
}

AgentStatus SyncAgent::Status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return StatusLocked();
}

AgentStatus SyncAgent::StatusLocked() const {
  AgentStatus s;
  s.state = state_;
  s.last_error = last_error_;
  s.last_notice = last_notice_;
  s.next_retry_ms = next_retry_ms_;
  s.connect_attempts = connect_attempts_;
  s.sync_enabled = sync_enabled_;
  s.devices = devices_;
  s.history = history_;
  s.pending_offer = pending_offer_;
  return s;
}

ConnectionState SyncAgent::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::string SyncAgent::last_sent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_sent_;
}

std::string SyncAgent::last_received() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_received_;
}

void SyncAgent::SetSyncEnabled(bool enabled) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sync_enabled_ = enabled;
    last_notice_ = enabled ? "sync enabled" : "sync disabled";
  }
  pl::Log(pl::Level::kInfo, "agent", enabled ? "sync enabled" : "sync disabled");
  Notify();
}

bool SyncAgent::RequestDevices(std::string& error) {
  proto::Event event;
  event.payload = proto::RequestDevices{};
  return SendEvent(event, error);
}

bool SyncAgent::OfferFile(const std::string& target_id,
                          const std::string& filename, std::int64_t filesize,
                          std::string& error) {
  if (filename.empty()) {
    error = "file name is empty";
    return false;
  }
  if (filesize < 0) {
    error = "file size is negative";
    return false;
  }
  proto::Event event;
  event.payload = proto::FileOffer{filename, filesize, target_id};
  if (!SendEvent(event, error)) {
    return false;
  }
  SetNotice("offered " + filename + " to " +
            (target_id.empty() ? std::string("all devices") : target_id));
  return true;
}

bool SyncAgent::AcceptPendingOffer(std::string& error) {
  return SendFileAck(true, error);
}

bool SyncAgent::RejectPendingOffer(std::string& error) {
  return SendFileAck(false, error);
}

bool SyncAgent::SendFileAck(bool allow, std::string& error) {
  PendingFileOffer offer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_offer_) {
      error = "no pending file offer";
      return false;
    }
    offer = *pending_offer_;
  }
  proto::Event event;
  event.payload = proto::FileAck{offer.filename, allow, offer.offering_device_id};
  if (!SendEvent(event, error)) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_offer_ &&
        pending_offer_->offering_device_id == offer.offering_device_id &&
        pending_offer_->filename == offer.filename) {
      pending_offer_.reset();
    }
    last_notice_ = std::string(allow ? "accepted " : "rejected ") +
                   offer.filename + " from " + offer.offering_hostname;
  }
  Notify();
  return true;
}

void SyncAgent::ApplyEvent(const proto::Event& event) {
  std::optional<std::string> write_back;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::visit(InboundVisitor{*this, event.sender_id, write_back},
               event.payload);
  }
  if (write_back) {
    std::string error;
    if (!clipboard_->Write(*write_back, error)) {
      pl::Log(pl::Level::kWarn, "agent", "clipboard write failed",
              {{"error", error}});
    }
  }
  Notify();
}

void SyncAgent::PollClipboardOnce() {
  std::string content;
  std::string error;
  if (!clipboard_->Read(content, error)) {
    pl::Log(pl::Level::kDebug, "agent", "clipboard read failed",
            {{"error", error}});
    return;
  }
  if (content.empty()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sync_enabled_ || content == last_sent_ || content == last_received_) {
      return;
    }
  }
  proto::Event event;
  event.payload = proto::ClipboardUpdate{content};
  if (!SendEvent(event, error)) {
    pl::Log(pl::Level::kDebug, "agent", "clipboard update not sent",
            {{"error", error}});
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_sent_ = content;
  }
  pl::Log(pl::Level::kDebug, "agent", "clipboard sent",
          {{"bytes", std::to_string(content.size())}});
}

std::shared_ptr<SyncAgent::AttemptScope> SyncAgent::CurrentScope() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return scope_;
}

bool SyncAgent::SendEvent(const proto::Event& event, std::string& error) {
  const std::shared_ptr<AttemptScope> scope = CurrentScope();
  if (!scope || scope->IsCancelled()) {
    error = "not connected";
    return false;
  }
  if (!scope->link->Send(event, error)) {
    scope->Cancel("send failed: " + error);
    return false;
  }
  return true;
}

bool SyncAgent::WaitForStop(std::uint32_t delay_ms) {
  std::unique_lock<std::mutex> lock(mutex_);
  return stop_cv_.wait_for(lock, std::chrono::milliseconds(delay_ms),
                           [this] { return stopping_; });
}

void SyncAgent::SupervisorLoop() {
  for (;;) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopping_) {
        return;
      }
      ++connect_attempts_;
    }
    SetState(ConnectionState::kConnecting, "", 0);

    std::string error;
    std::shared_ptr<AgentLink> link = connector_->Connect(error);
    std::string reason;
    if (link) {
      backoff_.Reset();
      reason = RunConnected(link);
    } else {
      reason = error.empty() ? "connect failed" : error;
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopping_) {
        return;
      }
    }

    const std::uint32_t delay = backoff_.NextDelayMs();
    pl::Log(pl::Level::kWarn, "agent", "disconnected",
            {{"reason", reason}, {"retry_ms", std::to_string(delay)}});
    SetState(ConnectionState::kDisconnected, reason, delay);
    if (WaitForStop(delay)) {
      return;
    }
  }
}

std::string SyncAgent::RunConnected(const std::shared_ptr<AgentLink>& link) {
  auto scope = std::make_shared<AttemptScope>(link);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      link->Close();
      return "agent stopped";
    }
    scope_ = scope;
  }
  SetState(ConnectionState::kConnected, "", 0);
  pl::Log(pl::Level::kInfo, "agent", "connected");

  std::string error;
  if (!RequestDevices(error)) {
    pl::Log(pl::Level::kWarn, "agent", "request_devices failed",
            {{"error", error}});
  }

  std::thread ping([this, scope] { PingLoop(scope); });
  std::thread poll([this, scope] { PollLoop(scope); });
  ListenLoop(scope);
  scope->Cancel("listener stopped");
  ping.join();
  poll.join();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (scope_ == scope) {
      scope_.reset();
    }
  }
  return scope->Reason();
}

void SyncAgent::ListenLoop(const std::shared_ptr<AttemptScope>& scope) {
  while (!scope->IsCancelled()) {
    proto::Event event;
    std::string error;
    switch (scope->link->Read(event, options_.pong_wait_ms, error)) {
      case LinkReadStatus::kEvent:
        ApplyEvent(event);
        break;
      case LinkReadStatus::kIgnored:
        break;
      case LinkReadStatus::kTimeout:
        scope->Cancel("read deadline exceeded");
        return;
      case LinkReadStatus::kClosed:
        scope->Cancel(error.empty() ? "connection closed" : error);
        return;
    }
  }
}

void SyncAgent::PingLoop(const std::shared_ptr<AttemptScope>& scope) {
  while (!scope->WaitFor(options_.ping_period_ms)) {
    std::string error;
    if (!scope->link->SendPing(error)) {
      scope->Cancel("ping failed: " + error);
      return;
    }
  }
}

void SyncAgent::PollLoop(const std::shared_ptr<AttemptScope>& scope) {
  while (!scope->WaitFor(options_.poll_interval_ms)) {
    PollClipboardOnce();
  }
}

void SyncAgent::SetState(ConnectionState state, const std::string& error,
                         std::uint32_t next_retry_ms) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
    if (!error.empty() || state == ConnectionState::kConnected) {
      last_error_ = error;
    }
    next_retry_ms_ = next_retry_ms;
  }
  Notify();
}

void SyncAgent::SetNotice(const std::string& notice) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_notice_ = notice;
  }
  Notify();
}

void SyncAgent::Notify() {
  StatusObserver observer;
  {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer = observer_;
  }
  if (!observer) {
    return;
  }
  observer(Status());
}

}  // namespace clipsync::client

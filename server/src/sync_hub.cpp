#include "sync_hub.h"

#include <chrono>
#include <utility>

#include "constant_time.h"
#include "platform_log.h"

namespace clipsync::server {

namespace {

namespace pl = platform::log;

}  // namespace

struct SyncHub::InboundVisitor {
  SyncHub& hub;
  const std::string& sender;
  proto::Event& event;

  void operator()(proto::ClipboardUpdate& update) const {
    std::lock_guard<std::mutex> lock(hub.update_mutex_);
    if (!hub.store_->SetIfChanged(update.content)) {
      pl::Log(pl::Level::kDebug, "hub", "clipboard unchanged",
              {{"device", sender}});
      return;
    }
    pl::Log(pl::Level::kInfo, "hub", "clipboard updated",
            {{"device", sender},
             {"bytes", std::to_string(update.content.size())}});
    hub.router_->Publish(RoutedEvent{std::move(event), {}});
  }

  void operator()(proto::RequestDevices&) const {
    RoutedEvent reply;
    reply.event.payload = proto::DeviceList{hub.registry_->DeviceInfos()};
    reply.recipient = sender;
    hub.router_->Publish(std::move(reply));
  }

  void operator()(proto::FileOffer& offer) const {
    pl::Log(pl::Level::kInfo, "hub", "file offer",
            {{"device", sender},
             {"file", offer.filename},
             {"size", std::to_string(offer.filesize)},
             {"target", offer.target_id.empty() ? "*" : offer.target_id}});
    hub.router_->Publish(RoutedEvent{std::move(event), {}});
  }

  void operator()(proto::FileAck& ack) const {
    pl::Log(pl::Level::kInfo, "hub", "file ack",
            {{"device", sender},
             {"file", ack.filename},
             {"allow", ack.allow ? "1" : "0"},
             {"source", ack.source_id}});
    hub.router_->Publish(RoutedEvent{std::move(event), {}});
  }

  void operator()(proto::DeviceList&) const {
    hub.ProtocolError(sender, "device_list is server-to-client only");
  }

  void operator()(proto::ClipboardHistory&) const {
    hub.ProtocolError(sender, "clipboard_history is server-to-client only");
  }
};

SyncHub::SyncHub() = default;

SyncHub::~SyncHub() {
  Shutdown();
}

bool SyncHub::Init(const std::string& config_path, std::string& error) {
  ServerConfig cfg;
  if (!LoadConfig(config_path, cfg, error)) {
    return false;
  }
  return Init(cfg, error);
}

bool SyncHub::Init(const ServerConfig& config, std::string& error) {
  if (running_.load()) {
    error = "hub already initialized";
    return false;
  }
  config_ = config;
  if (!ValidateConfig(config_, error)) {
    return false;
  }
  registry_ = std::make_unique<DeviceRegistry>();
  store_ = std::make_unique<ClipboardStore>(config_.server.history_size);
  router_ = std::make_unique<BroadcastRouter>(*registry_,
                                              config_.server.event_queue_capacity);
  router_->Start();
  running_.store(true);
  return true;
}

void SyncHub::Shutdown() {
  bool expected = true;
  if (!running_.compare_exchange_strong(expected, false)) {
    return;
  }
  const std::size_t closed = registry_->Clear();
  router_->Stop();
  const RouterStats s = router_->stats();
  pl::Log(pl::Level::kInfo, "hub", "shutdown",
          {{"closed", std::to_string(closed)},
           {"delivered", std::to_string(s.delivered)},
           {"write_failures", std::to_string(s.write_failures)},
           {"dropped", std::to_string(s.dropped)}});
}

bool SyncHub::Authorize(std::string_view presented_key) const {
  return common::SecretEquals(config_.server.api_key, presented_key);
}

std::string SyncHub::SanitizeHostname(std::string_view raw) {
  std::string out;
  out.reserve(raw.size() < kMaxHostnameBytes ? raw.size() : kMaxHostnameBytes);
  for (const char ch : raw) {
    const unsigned char uc = static_cast<unsigned char>(ch);
    out.push_back((uc < 0x20 || uc == 0x7F) ? '?' : ch);
  }
  if (out.size() > kMaxHostnameBytes) {
    std::size_t cut = kMaxHostnameBytes;
    while (cut > 0 &&
           (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80) {
      --cut;
    }
    out.resize(cut);
  }
  if (out.empty()) {
    return "Unknown";
  }
  return out;
}

bool SyncHub::AdmitDevice(const std::string& hostname,
                          std::shared_ptr<DeviceConnection> connection,
                          std::string& out_device_id, std::string& error) {
  out_device_id.clear();
  if (!running_.load()) {
    error = "hub not running";
    return false;
  }
  Device device;
  device.id = DeviceRegistry::GenerateDeviceId();
  if (device.id.empty()) {
    error = "device id rng failed";
    return false;
  }
  device.hostname = SanitizeHostname(hostname);
  device.connection = std::move(connection);
  device.connected_at = std::chrono::steady_clock::now();
  const std::string id = device.id;
  if (!router_->Admit(std::move(device), error)) {
    return false;
  }
  if (!running_.load()) {
    router_->Remove(id);
    error = "hub shutting down";
    return false;
  }

  {
    // Held across both publishes so no broadcast update can be queued
    // between the snapshot and the device's initial state.
    std::lock_guard<std::mutex> lock(update_mutex_);
    const std::string current = store_->CurrentSnapshot();
    if (!current.empty()) {
      RoutedEvent initial;
      initial.event.payload = proto::ClipboardUpdate{current};
      initial.recipient = id;
      router_->Publish(std::move(initial));
    }
    RoutedEvent history;
    history.event.payload = proto::ClipboardHistory{store_->HistorySnapshot()};
    history.recipient = id;
    router_->Publish(std::move(history));
  }

  out_device_id = id;
  return true;
}

void SyncHub::ProtocolError(const std::string& device_id,
                            const std::string& what) {
  protocol_errors_.fetch_add(1);
  pl::Log(pl::Level::kWarn, "hub", "protocol error, frame dropped",
          {{"device", device_id}, {"error", what}});
}

void SyncHub::HandleText(const std::string& device_id, const std::string& text) {
  proto::Event event;
  std::string error;
  if (!proto::DecodeEvent(text, event, error)) {
    ProtocolError(device_id, error);
    return;
  }
  HandleEvent(device_id, std::move(event));
}

void SyncHub::HandleEvent(const std::string& device_id, proto::Event event) {
  if (!running_.load()) {
    return;
  }
  event.sender_id = device_id;
  std::visit(InboundVisitor{*this, device_id, event}, event.payload);
}

void SyncHub::DisconnectDevice(const std::string& device_id,
                               const std::string& reason) {
  if (!registry_) {
    return;
  }
  if (router_->Remove(device_id)) {
    pl::Log(pl::Level::kInfo, "hub", "device disconnected",
            {{"device", device_id}, {"reason", reason}});
  }
}

void SyncHub::OnText(const std::string& device_id, const std::string& text) {
  HandleText(device_id, text);
}

void SyncHub::OnSessionClosed(const std::string& device_id,
                              const std::string& reason) {
  DisconnectDevice(device_id, reason);
}

LifecycleTimings SyncHub::timings() const {
  LifecycleTimings t;
  t.write_wait = std::chrono::milliseconds(config_.server.write_wait_ms);
  t.pong_wait = std::chrono::milliseconds(config_.server.pong_wait_ms);
  t.ping_period = std::chrono::milliseconds(config_.server.ping_period_ms);
  return t;
}

}  // namespace clipsync::server

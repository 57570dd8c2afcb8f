#include "broadcast_router.h"

#include <utility>

#include "platform_log.h"

namespace clipsync::server {

namespace {

namespace pl = platform::log;

struct TargetSelector {
  const std::string& sender;
  const std::vector<Device>& members;

  std::vector<std::string> AllExceptSender() const {
    std::vector<std::string> out;
    for (const auto& d : members) {
      if (d.id != sender) {
        out.push_back(d.id);
      }
    }
    return out;
  }

  std::vector<std::string> Only(const std::string& id) const {
    std::vector<std::string> out;
    if (id.empty()) {
      return out;
    }
    for (const auto& d : members) {
      if (d.id == id) {
        out.push_back(d.id);
        break;
      }
    }
    return out;
  }

  std::vector<std::string> operator()(const proto::ClipboardUpdate&) const {
    return AllExceptSender();
  }
  std::vector<std::string> operator()(const proto::FileOffer& offer) const {
    if (offer.target_id.empty()) {
      return AllExceptSender();
    }
    if (offer.target_id == sender) {
      return {};
    }
    return Only(offer.target_id);
  }
  std::vector<std::string> operator()(const proto::FileAck& ack) const {
    return Only(ack.source_id);
  }
  std::vector<std::string> operator()(const proto::DeviceList&) const {
    std::vector<std::string> out;
    out.reserve(members.size());
    for (const auto& d : members) {
      out.push_back(d.id);
    }
    return out;
  }
  // Point-to-point only; without a recipient nobody gets these.
  std::vector<std::string> operator()(const proto::ClipboardHistory&) const {
    return {};
  }
  std::vector<std::string> operator()(const proto::RequestDevices&) const {
    return {};
  }
};

}  // namespace

BroadcastRouter::BroadcastRouter(DeviceRegistry& registry,
                                 std::size_t queue_capacity)
    : registry_(registry), queue_(queue_capacity) {}

BroadcastRouter::~BroadcastRouter() {
  Stop();
}

std::vector<std::string> BroadcastRouter::SelectTargets(
    const RoutedEvent& routed, const std::vector<Device>& members) {
  const TargetSelector selector{routed.event.sender_id, members};
  if (!routed.recipient.empty()) {
    return selector.Only(routed.recipient);
  }
  return std::visit(selector, routed.event.payload);
}

std::size_t BroadcastRouter::Route(const RoutedEvent& routed) {
  routed_.fetch_add(1, std::memory_order_relaxed);
  const std::vector<Device> members = registry_.Snapshot();
  const std::vector<std::string> targets = SelectTargets(routed, members);
  if (targets.empty()) {
    return 0;
  }
  const std::string text = proto::EncodeEvent(routed.event);
  const char* type_name = proto::EventTypeName(proto::TypeOf(routed.event));

  std::size_t delivered = 0;
  std::vector<std::string> failed;
  for (const auto& id : targets) {
    const Device* device = nullptr;
    for (const auto& d : members) {
      if (d.id == id) {
        device = &d;
        break;
      }
    }
    if (!device || !device->connection) {
      continue;
    }
    std::string error;
    if (device->connection->SendText(text, error)) {
      ++delivered;
      continue;
    }
    write_failures_.fetch_add(1, std::memory_order_relaxed);
    pl::Log(pl::Level::kWarn, "router", "write failed, removing device",
            {{"device", id}, {"type", type_name}, {"error", error}});
    failed.push_back(id);
  }
  delivered_.fetch_add(delivered, std::memory_order_relaxed);
  for (const auto& id : failed) {
    Remove(id);
  }
  pl::Log(pl::Level::kDebug, "router", "routed",
          {{"type", type_name},
           {"targets", std::to_string(targets.size())},
           {"delivered", std::to_string(delivered)}});
  return delivered;
}

bool BroadcastRouter::Publish(RoutedEvent routed) {
  return queue_.Push(std::move(routed));
}

bool BroadcastRouter::TryPublish(RoutedEvent routed) {
  if (queue_.TryPush(std::move(routed))) {
    return true;
  }
  dropped_.fetch_add(1, std::memory_order_relaxed);
  pl::Log(pl::Level::kWarn, "router", "event queue saturated, event dropped");
  return false;
}

bool BroadcastRouter::Admit(Device device, std::string& error) {
  const std::string id = device.id;
  const std::string hostname = device.hostname;
  if (!registry_.Admit(std::move(device), error)) {
    return false;
  }
  pl::Log(pl::Level::kInfo, "router", "device admitted",
          {{"device", id}, {"hostname", hostname},
           {"members", std::to_string(registry_.Size())}});
  PublishDeviceList();
  return true;
}

bool BroadcastRouter::Remove(const std::string& id) {
  if (!registry_.Remove(id)) {
    return false;
  }
  pl::Log(pl::Level::kInfo, "router", "device removed",
          {{"device", id}, {"members", std::to_string(registry_.Size())}});
  PublishDeviceList();
  return true;
}

void BroadcastRouter::PublishDeviceList() {
  RoutedEvent routed;
  routed.event.payload = proto::DeviceList{registry_.DeviceInfos()};
  TryPublish(std::move(routed));
}

void BroadcastRouter::Start() {
  std::lock_guard<std::mutex> lock(thread_mutex_);
  if (dispatcher_.joinable()) {
    return;
  }
  dispatcher_ = std::thread([this] { DispatchLoop(); });
}

void BroadcastRouter::Stop() {
  queue_.Close();
  std::lock_guard<std::mutex> lock(thread_mutex_);
  if (dispatcher_.joinable()) {
    dispatcher_.join();
  }
}

void BroadcastRouter::DispatchLoop() {
  RoutedEvent routed;
  while (queue_.Pop(routed)) {
    Route(routed);
  }
}

RouterStats BroadcastRouter::stats() const {
  RouterStats s;
  s.routed = routed_.load(std::memory_order_relaxed);
  s.delivered = delivered_.load(std::memory_order_relaxed);
  s.write_failures = write_failures_.load(std::memory_order_relaxed);
  s.dropped = dropped_.load(std::memory_order_relaxed);
  return s;
}

}  // namespace clipsync::server

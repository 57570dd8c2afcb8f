#ifndef CLIPSYNC_SERVER_BROADCAST_ROUTER_H
#define CLIPSYNC_SERVER_BROADCAST_ROUTER_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "device_registry.h"
#include "event_queue.h"
#include "protocol.h"

namespace clipsync::server {

struct RoutedEvent {
  proto::Event event;
  // Non-empty: deliver to this device only. Empty: apply the per-type rules.
  std::string recipient;
};

struct RouterStats {
  std::uint64_t routed{0};
  std::uint64_t delivered{0};
  std::uint64_t write_failures{0};
  std::uint64_t dropped{0};
};

class BroadcastRouter {
 public:
  BroadcastRouter(DeviceRegistry& registry, std::size_t queue_capacity);
  ~BroadcastRouter();

  BroadcastRouter(const BroadcastRouter&) = delete;
  BroadcastRouter& operator=(const BroadcastRouter&) = delete;

  // Ids from `members` that should receive `routed`, in member order.
  static std::vector<std::string> SelectTargets(
      const RoutedEvent& routed, const std::vector<Device>& members);

  // Delivers synchronously from a registry snapshot, without holding the
  // registry lock. A failed write removes that device and delivery continues.
  // Returns the number of successful writes.
  std::size_t Route(const RoutedEvent& routed);

  // Queue for the dispatcher thread. Publish waits for room; TryPublish drops
  // and counts the event when the queue is full.
  bool Publish(RoutedEvent routed);
  bool TryPublish(RoutedEvent routed);

  // Registry membership changes. Each successful change queues a best-effort
  // device_list to every member.
  bool Admit(Device device, std::string& error);
  bool Remove(const std::string& id);

  void Start();
  void Stop();

  RouterStats stats() const;

 private:
  void DispatchLoop();
  void PublishDeviceList();

  DeviceRegistry& registry_;
  EventQueue<RoutedEvent> queue_;
  std::mutex thread_mutex_;
  std::thread dispatcher_;
  std::atomic<std::uint64_t> routed_{0};
  std::atomic<std::uint64_t> delivered_{0};
  std::atomic<std::uint64_t> write_failures_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace clipsync::server

#endif  // CLIPSYNC_SERVER_BROADCAST_ROUTER_H

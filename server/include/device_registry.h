#ifndef CLIPSYNC_SERVER_DEVICE_REGISTRY_H
#define CLIPSYNC_SERVER_DEVICE_REGISTRY_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "protocol.h"

namespace clipsync::server {

// Write side of a live device link. Implementations bound every write by the
// configured write deadline.
class DeviceConnection {
 public:
  virtual ~DeviceConnection() = default;

  virtual bool SendText(const std::string& text, std::string& error) = 0;
  virtual void Close() = 0;
};

struct Device {
  std::string id;
  std::string hostname;
  std::shared_ptr<DeviceConnection> connection;
  std::uint64_t admitted_seq{0};
  std::chrono::steady_clock::time_point connected_at;
};

class DeviceRegistry {
 public:
  DeviceRegistry() = default;

  DeviceRegistry(const DeviceRegistry&) = delete;
  DeviceRegistry& operator=(const DeviceRegistry&) = delete;

  static std::string GenerateDeviceId();

  bool Admit(Device device, std::string& error);

  // Idempotent. The first call for a present id erases it and closes its
  // connection outside the lock; later calls return false and touch nothing.
  bool Remove(const std::string& id);

  // Point-in-time copy in admission order.
  std::vector<Device> Snapshot() const;
  std::optional<Device> Find(const std::string& id) const;
  std::vector<proto::DeviceInfo> DeviceInfos() const;
  std::size_t Size() const;

  // Closes and erases every device; returns how many were removed.
  std::size_t Clear();

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Device> devices_;
  std::uint64_t next_seq_{1};
};

}  // namespace clipsync::server

#endif  // CLIPSYNC_SERVER_DEVICE_REGISTRY_H

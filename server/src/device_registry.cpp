#include "device_registry.h"

#include <algorithm>
#include <array>
#include <mutex>
#include <utility>

#include "hex_utils.h"
#include "platform_random.h"

namespace clipsync::server {

namespace {

void SortByAdmission(std::vector<Device>& devices) {
  std::sort(devices.begin(), devices.end(),
            [](const Device& a, const Device& b) {
              return a.admitted_seq < b.admitted_seq;
            });
}

}  // namespace

std::string DeviceRegistry::GenerateDeviceId() {
  std::array<std::uint8_t, 16> rnd{};
  if (!platform::RandomBytes(rnd.data(), rnd.size())) {
    return {};
  }
  return common::FormatUuidV4(rnd);
}

bool DeviceRegistry::Admit(Device device, std::string& error) {
  if (device.id.empty()) {
    error = "device id empty";
    return false;
  }
  if (!device.connection) {
    error = "device has no connection";
    return false;
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (devices_.find(device.id) != devices_.end()) {
    error = "device id already registered";
    return false;
  }
  device.admitted_seq = next_seq_++;
  const std::string id = device.id;
  devices_.emplace(id, std::move(device));
  return true;
}

bool DeviceRegistry::Remove(const std::string& id) {
  std::shared_ptr<DeviceConnection> connection;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = devices_.find(id);
    if (it == devices_.end()) {
      return false;
    }
    connection = std::move(it->second.connection);
    devices_.erase(it);
  }
  if (connection) {
    connection->Close();
  }
  return true;
}

std::vector<Device> DeviceRegistry::Snapshot() const {
  std::vector<Device> out;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    out.reserve(devices_.size());
    for (const auto& kv : devices_) {
      out.push_back(kv.second);
    }
  }
  SortByAdmission(out);
  return out;
}

std::optional<Device> DeviceRegistry::Find(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = devices_.find(id);
  if (it == devices_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<proto::DeviceInfo> DeviceRegistry::DeviceInfos() const {
  const auto devices = Snapshot();
  std::vector<proto::DeviceInfo> out;
  out.reserve(devices.size());
  for (const auto& d : devices) {
    out.push_back(proto::DeviceInfo{d.id, d.hostname});
  }
  return out;
}

std::size_t DeviceRegistry::Size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return devices_.size();
}

std::size_t DeviceRegistry::Clear() {
  std::unordered_map<std::string, Device> drained;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    drained.swap(devices_);
  }
  for (auto& kv : drained) {
    if (kv.second.connection) {
      kv.second.connection->Close();
    }
  }
  return drained.size();
}

}  // namespace clipsync::server

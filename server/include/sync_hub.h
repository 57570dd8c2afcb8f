#ifndef CLIPSYNC_SERVER_SYNC_HUB_H
#define CLIPSYNC_SERVER_SYNC_HUB_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "broadcast_router.h"
#include "clipboard_store.h"
#include "config.h"
#include "device_registry.h"
#include "device_session.h"
#include "protocol.h"

namespace clipsync::server {

constexpr std::size_t kMaxHostnameBytes = 255;

class SyncHub final : public SessionSink {
 public:
  SyncHub();
  ~SyncHub() override;

  SyncHub(const SyncHub&) = delete;
  SyncHub& operator=(const SyncHub&) = delete;

  bool Init(const std::string& config_path, std::string& error);
  bool Init(const ServerConfig& config, std::string& error);

  // Closes every device and stops the dispatcher. Safe to call twice.
  void Shutdown();

  bool Authorize(std::string_view presented_key) const;

  // "Unknown" when empty; control characters become '?'; truncated to
  // kMaxHostnameBytes without splitting a UTF-8 sequence.
  static std::string SanitizeHostname(std::string_view raw);

  // Registers the connection under a fresh id and queues the initial state
  // for it: the current value (if any) then the history.
  bool AdmitDevice(const std::string& hostname,
                   std::shared_ptr<DeviceConnection> connection,
                   std::string& out_device_id, std::string& error);

  // Decodes a text frame; malformed frames are logged and dropped.
  void HandleText(const std::string& device_id, const std::string& text);
  void HandleEvent(const std::string& device_id, proto::Event event);

  void DisconnectDevice(const std::string& device_id, const std::string& reason);

  void OnText(const std::string& device_id, const std::string& text) override;
  void OnSessionClosed(const std::string& device_id,
                       const std::string& reason) override;

  LifecycleTimings timings() const;
  const ServerConfig& config() const { return config_; }
  DeviceRegistry* registry() { return registry_.get(); }
  ClipboardStore* store() { return store_.get(); }
  BroadcastRouter* router() { return router_.get(); }
  std::uint64_t protocol_errors() const { return protocol_errors_.load(); }

 private:
  struct InboundVisitor;

  void ProtocolError(const std::string& device_id, const std::string& what);

  ServerConfig config_;
  std::unique_ptr<DeviceRegistry> registry_;
  std::unique_ptr<ClipboardStore> store_;
  std::unique_ptr<BroadcastRouter> router_;
  std::mutex update_mutex_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> protocol_errors_{0};
};

}  // namespace clipsync::server

#endif  // CLIPSYNC_SERVER_SYNC_HUB_H

#ifndef CLIPSYNC_SERVER_DEVICE_SESSION_H
#define CLIPSYNC_SERVER_DEVICE_SESSION_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "device_registry.h"
#include "ws_channel.h"

namespace clipsync::server {

struct LifecycleTimings {
  std::chrono::milliseconds write_wait{10000};
  std::chrono::milliseconds pong_wait{60000};
  std::chrono::milliseconds ping_period{54000};
};

// Server side of a device connection: pings every ping_period and drops the
// peer after pong_wait without a frame.
WsChannelOptions SessionChannelOptions(const LifecycleTimings& timings,
                                       std::size_t max_message_bytes);

enum class SessionState : std::uint8_t { kActive = 0, kClosing = 1, kClosed = 2 };

// Receives what a session reads. OnSessionClosed is called exactly once.
class SessionSink {
 public:
  virtual ~SessionSink() = default;

  virtual void OnText(const std::string& device_id, const std::string& text) = 0;
  virtual void OnSessionClosed(const std::string& device_id,
                               const std::string& reason) = 0;
};

// DeviceConnection over a WsChannel. Close sends a normal close frame and
// ends the session that runs the channel.
class WsConnection final : public DeviceConnection {
 public:
  explicit WsConnection(std::shared_ptr<WsChannel> channel);

  bool SendText(const std::string& text, std::string& error) override;
  void Close() override;

 private:
  std::shared_ptr<WsChannel> channel_;
};

class DeviceSession {
 public:
  DeviceSession(std::string device_id, std::shared_ptr<WsChannel> channel,
                SessionSink& sink);

  DeviceSession(const DeviceSession&) = delete;
  DeviceSession& operator=(const DeviceSession&) = delete;

  // Blocks on the calling thread until the connection is torn down. Text is
  // handed to the sink on this thread, in arrival order.
  void Run();

  SessionState state() const { return state_.load(); }
  const std::string& close_reason() const { return close_reason_; }

 private:
  const std::string device_id_;
  std::shared_ptr<WsChannel> channel_;
  SessionSink& sink_;
  std::atomic<SessionState> state_{SessionState::kActive};
  std::string close_reason_;
};

}  // namespace clipsync::server

#endif  // CLIPSYNC_SERVER_DEVICE_SESSION_H

#include "device_session.h"

#include <utility>

#include "platform_log.h"

namespace clipsync::server {

namespace {

namespace pl = platform::log;

constexpr std::chrono::milliseconds kInboxWait{1000};

}  // namespace

WsChannelOptions SessionChannelOptions(const LifecycleTimings& timings,
                                       std::size_t max_message_bytes) {
  WsChannelOptions options;
  options.write_wait = timings.write_wait;
  options.read_timeout = timings.pong_wait;
  options.ping_period = timings.ping_period;
  options.max_message_bytes = max_message_bytes;
  return options;
}

WsConnection::WsConnection(std::shared_ptr<WsChannel> channel)
    : channel_(std::move(channel)) {}

bool WsConnection::SendText(const std::string& text, std::string& error) {
  if (channel_->closed()) {
    error = "connection closed";
    return false;
  }
  return channel_->SendText(text, error);
}

void WsConnection::Close() {
  channel_->Close(kCloseNormal, "closed by server");
}

DeviceSession::DeviceSession(std::string device_id,
                             std::shared_ptr<WsChannel> channel,
                             SessionSink& sink)
    : device_id_(std::move(device_id)),
      channel_(std::move(channel)),
      sink_(sink) {}

void DeviceSession::Run() {
  WsInbox inbox(channel_, [this](const std::string&) {
    state_.store(SessionState::kClosing);
  });
  std::string error;
  if (!inbox.Start(error)) {
    pl::Log(pl::Level::kError, "session", "session not started",
            {{"device", device_id_}, {"error", error}});
    channel_->Close(kCloseGoingAway, "server busy");
    channel_->Run({});
    close_reason_ = error;
  } else {
    std::string text;
    InboxStatus status = InboxStatus::kTimeout;
    while ((status = inbox.Next(text, kInboxWait)) != InboxStatus::kEnded) {
      if (status == InboxStatus::kText) {
        sink_.OnText(device_id_, text);
      }
    }
    inbox.Join();
    close_reason_ = channel_->close_info().reason;
  }

  state_.store(SessionState::kClosing);
  pl::Log(pl::Level::kInfo, "session", "closing",
          {{"device", device_id_}, {"reason", close_reason_}});
  sink_.OnSessionClosed(device_id_, close_reason_);
  state_.store(SessionState::kClosed);
}

}  // namespace clipsync::server

#ifndef CLIPSYNC_SERVER_WS_CHANNEL_H
#define CLIPSYNC_SERVER_WS_CHANNEL_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

namespace clipsync::server {

constexpr std::uint16_t kCloseNormal = 1000;
constexpr std::uint16_t kCloseGoingAway = 1001;
constexpr std::uint16_t kCloseMessageTooBig = 1009;

struct WsChannelOptions {
  std::chrono::milliseconds write_wait{10000};
  // Zero disables the deadline. Any frame, control frames included, re-arms it.
  std::chrono::milliseconds read_timeout{0};
  // Zero disables keepalive pings.
  std::chrono::milliseconds ping_period{0};
  std::size_t max_message_bytes{512u * 1024u};
};

struct WsCloseInfo {
  std::string reason;
  bool by_peer{false};
  std::uint16_t peer_code{0};
  std::string peer_reason;
};

struct WsChannelHandlers {
  // Returning false pauses reading until ResumeReading().
  std::function<bool(std::string text)> on_text;
  // Ping, pong or close frame received.
  std::function<void()> on_control;
  // Runs once, on the channel thread, before the socket is released.
  std::function<void(const std::string& reason)> on_closing;
};

// An upgraded WebSocket connection driven by its own io_context. Run() owns
// the calling thread until the connection is torn down; SendText, SendPing
// and Close may be called from any thread and are serialized onto it.
class WsChannel {
 public:
  using Stream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  // `stream` must have completed its handshake on `ioc`, which is not running.
  WsChannel(std::shared_ptr<boost::asio::io_context> ioc, Stream stream,
            WsChannelOptions options);
  ~WsChannel();

  WsChannel(const WsChannel&) = delete;
  WsChannel& operator=(const WsChannel&) = delete;

  void Run(WsChannelHandlers handlers);

  // Block until the frame is written or write_wait passes. A missed deadline
  // tears the connection down. From the channel thread they only queue.
  bool SendText(std::string text, std::string& error);
  bool SendPing(std::string& error);

  // Sends a close frame when the handshake is still possible. Idempotent.
  void Close(std::uint16_t code, std::string reason);
  void ResumeReading();

  bool closed() const { return closing_.load(); }
  WsCloseInfo close_info() const;

 private:
  struct WriteJob {
    enum class Kind : std::uint8_t { kText = 0, kPing = 1 };
    Kind kind{Kind::kText};
    std::string payload;
    std::promise<std::string> done;  // empty on success
  };

  bool Submit(std::shared_ptr<WriteJob> job, std::string& error);
  bool Dispatch(std::function<void()> fn);

  void Start();
  void DoRead();
  void OnRead(const boost::beast::error_code& ec);
  void ArmReadDeadline();
  void SchedulePing();
  void Enqueue(std::shared_ptr<WriteJob> job);
  void WriteNext();
  void OnWritten(const boost::beast::error_code& ec);
  void Teardown(std::uint16_t code, const std::string& reason, bool graceful);
  void ReleaseSocket();

  // Declared first so the stream and timers are destroyed before it.
  std::shared_ptr<boost::asio::io_context> ioc_;
  Stream ws_;
  boost::asio::steady_timer read_timer_;
  boost::asio::steady_timer ping_timer_;
  boost::asio::steady_timer close_timer_;
  boost::beast::flat_buffer read_buffer_;
  const WsChannelOptions options_;
  WsChannelHandlers handlers_;

  std::deque<std::shared_ptr<WriteJob>> queue_;
  std::shared_ptr<WriteJob> current_;
  bool read_paused_{false};
  std::atomic<bool> closing_{false};

  mutable std::mutex mutex_;
  bool finished_{false};
  WsCloseInfo info_;
};

enum class InboxStatus : std::uint8_t {
  kText = 0,
  kControl = 1,
  kTimeout = 2,
  kEnded = 3
};

// Runs a channel on its own thread and hands received text to one consumer
// thread, so a consumer that blocks never stalls the channel's writes.
// Reading pauses while kMaxPendingTexts messages wait.
class WsInbox {
 public:
  static constexpr std::size_t kMaxPendingTexts = 64;

  explicit WsInbox(std::shared_ptr<WsChannel> channel,
                   std::function<void(const std::string&)> on_closing = {});
  // Closes the channel if it is still running, then joins.
  ~WsInbox();

  WsInbox(const WsInbox&) = delete;
  WsInbox& operator=(const WsInbox&) = delete;

  bool Start(std::string& error);

  // Queued text is returned before kEnded.
  InboxStatus Next(std::string& text, std::chrono::milliseconds timeout);
  void Join();

 private:
  std::shared_ptr<WsChannel> channel_;
  std::function<void(const std::string&)> on_closing_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> texts_;
  std::size_t control_frames_{0};
  bool paused_{false};
  bool ended_{false};
  std::thread thread_;
};

}  // namespace clipsync::server

#endif  // CLIPSYNC_SERVER_WS_CHANNEL_H

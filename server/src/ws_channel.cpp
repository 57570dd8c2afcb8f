#include "ws_channel.h"

#include <system_error>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/beast/websocket/rfc6455.hpp>

#include "platform_log.h"

namespace clipsync::server {

namespace {

namespace pl = platform::log;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;

// RFC 6455 caps a close frame payload at 125 bytes, two of them the code.
constexpr std::size_t kMaxCloseReasonBytes = 123;

std::string CloseReasonText(const std::string& reason) {
  return reason.size() > kMaxCloseReasonBytes
             ? reason.substr(0, kMaxCloseReasonBytes)
             : reason;
}

bool IsDisconnect(const beast::error_code& ec) {
  return ec == asio::error::eof || ec == asio::error::connection_reset ||
         ec == asio::error::broken_pipe;
}

}  // namespace

WsChannel::WsChannel(std::shared_ptr<asio::io_context> ioc, Stream stream,
                     WsChannelOptions options)
    : ioc_(std::move(ioc)),
      ws_(std::move(stream)),
      read_timer_(*ioc_),
      ping_timer_(*ioc_),
      close_timer_(*ioc_),
      options_(options) {
  // The websocket layer applies its own timeouts from here on.
  beast::get_lowest_layer(ws_).expires_never();
  websocket::stream_base::timeout timeouts{};
  timeouts.handshake_timeout = options_.write_wait;
  timeouts.idle_timeout = websocket::stream_base::none();
  timeouts.keep_alive_pings = false;
  ws_.set_option(timeouts);
  ws_.read_message_max(options_.max_message_bytes);
  ws_.text(true);
}

WsChannel::~WsChannel() = default;

void WsChannel::Run(WsChannelHandlers handlers) {
  handlers_ = std::move(handlers);
  asio::post(*ioc_, [this] { Start(); });
  ioc_->run();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_ = true;
  }
  // Fails writes that were posted while run() was returning.
  ioc_->restart();
  ioc_->poll();
}

bool WsChannel::SendText(std::string text, std::string& error) {
  auto job = std::make_shared<WriteJob>();
  job->kind = WriteJob::Kind::kText;
  job->payload = std::move(text);
  return Submit(std::move(job), error);
}

bool WsChannel::SendPing(std::string& error) {
  auto job = std::make_shared<WriteJob>();
  job->kind = WriteJob::Kind::kPing;
  return Submit(std::move(job), error);
}

void WsChannel::Close(std::uint16_t code, std::string reason) {
  const bool queued = Dispatch([this, code, reason = std::move(reason)] {
    Teardown(code, reason, true);
  });
  if (!queued) {
    pl::Log(pl::Level::kDebug, "ws", "close after channel finished");
  }
}

void WsChannel::ResumeReading() {
  const bool queued = Dispatch([this] {
    if (!read_paused_ || closing_.load()) {
      return;
    }
    read_paused_ = false;
    DoRead();
  });
  if (!queued) {
    pl::Log(pl::Level::kDebug, "ws", "resume after channel finished");
  }
}

WsCloseInfo WsChannel::close_info() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return info_;
}

bool WsChannel::Dispatch(std::function<void()> fn) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (finished_) {
    return false;
  }
  asio::post(*ioc_, std::move(fn));
  return true;
}

bool WsChannel::Submit(std::shared_ptr<WriteJob> job, std::string& error) {
  if (ioc_->get_executor().running_in_this_thread()) {
    if (closing_.load()) {
      error = "connection closed";
      return false;
    }
    Enqueue(std::move(job));
    return true;
  }
  std::future<std::string> result = job->done.get_future();
  if (!Dispatch([this, job] { Enqueue(job); })) {
    error = "connection closed";
    return false;
  }
  if (result.wait_for(options_.write_wait) != std::future_status::ready) {
    error = "write deadline exceeded";
    const bool queued = Dispatch(
        [this] { Teardown(kCloseGoingAway, "write deadline exceeded", false); });
    pl::Log(pl::Level::kWarn, "ws", "write deadline exceeded",
            {{"teardown", queued ? "queued" : "already finished"}});
    return false;
  }
  try {
    error = result.get();
  } catch (const std::future_error&) {
    error = "connection closed";
  }
  return error.empty();
}

void WsChannel::Start() {
  if (closing_.load()) {
    return;
  }
  ws_.control_callback([this](websocket::frame_type, beast::string_view) {
    ArmReadDeadline();
    if (handlers_.on_control) {
      handlers_.on_control();
    }
  });
  ArmReadDeadline();
  SchedulePing();
  DoRead();
}

void WsChannel::DoRead() {
  ws_.async_read(read_buffer_,
                 [this](const beast::error_code& ec, std::size_t) { OnRead(ec); });
}

void WsChannel::OnRead(const beast::error_code& ec) {
  if (ec) {
    if (closing_.load()) {
      return;
    }
    if (ec == websocket::error::closed) {
      const websocket::close_reason& peer = ws_.reason();
      {
        std::lock_guard<std::mutex> lock(mutex_);
        info_.by_peer = true;
        info_.peer_code = static_cast<std::uint16_t>(peer.code);
        info_.peer_reason.assign(peer.reason.data(), peer.reason.size());
      }
      Teardown(kCloseNormal, "peer closed", false);
      return;
    }
    if (ec == websocket::error::message_too_big) {
      Teardown(kCloseMessageTooBig, "message too big", true);
      return;
    }
    if (IsDisconnect(ec)) {
      Teardown(kCloseGoingAway, "connection closed", false);
      return;
    }
    Teardown(kCloseGoingAway, "read failed: " + ec.message(), true);
    return;
  }

  ArmReadDeadline();
  bool keep_reading = true;
  if (ws_.got_text()) {
    std::string text = beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(read_buffer_.size());
    if (handlers_.on_text) {
      keep_reading = handlers_.on_text(std::move(text));
    }
  } else {
    pl::Log(pl::Level::kDebug, "ws", "binary frame ignored",
            {{"bytes", std::to_string(read_buffer_.size())}});
    read_buffer_.consume(read_buffer_.size());
  }
  if (closing_.load()) {
    return;
  }
  if (!keep_reading) {
    read_paused_ = true;
    return;
  }
  DoRead();
}

void WsChannel::ArmReadDeadline() {
  if (options_.read_timeout.count() <= 0 || closing_.load()) {
    return;
  }
  read_timer_.expires_after(options_.read_timeout);
  read_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || closing_.load()) {
      return;
    }
    // A frame may have re-armed the timer after this wait completed.
    if (read_timer_.expiry() > asio::steady_timer::clock_type::now()) {
      return;
    }
    Teardown(kCloseGoingAway, "read deadline exceeded", true);
  });
}

void WsChannel::SchedulePing() {
  if (options_.ping_period.count() <= 0 || closing_.load()) {
    return;
  }
  ping_timer_.expires_after(options_.ping_period);
  ping_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || closing_.load()) {
      return;
    }
    auto job = std::make_shared<WriteJob>();
    job->kind = WriteJob::Kind::kPing;
    Enqueue(std::move(job));
    SchedulePing();
  });
}

void WsChannel::Enqueue(std::shared_ptr<WriteJob> job) {
  if (closing_.load()) {
    job->done.set_value("connection closed");
    return;
  }
  queue_.push_back(std::move(job));
  if (!current_) {
    WriteNext();
  }
}

void WsChannel::WriteNext() {
  if (queue_.empty() || closing_.load()) {
    return;
  }
  current_ = std::move(queue_.front());
  queue_.pop_front();
  if (current_->kind == WriteJob::Kind::kPing) {
    ws_.async_ping(websocket::ping_data{},
                   [this](const beast::error_code& ec) { OnWritten(ec); });
    return;
  }
  ws_.async_write(asio::buffer(current_->payload),
                  [this](const beast::error_code& ec, std::size_t) {
                    OnWritten(ec);
                  });
}

void WsChannel::OnWritten(const beast::error_code& ec) {
  std::shared_ptr<WriteJob> job = std::move(current_);
  current_.reset();
  if (ec) {
    const std::string what =
        (job->kind == WriteJob::Kind::kPing ? "ping failed: " : "write failed: ") +
        ec.message();
    job->done.set_value(what);
    Teardown(kCloseGoingAway, what, false);
    return;
  }
  job->done.set_value(std::string());
  WriteNext();
}

void WsChannel::Teardown(std::uint16_t code, const std::string& reason,
                         bool graceful) {
  if (closing_.exchange(true)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    info_.reason = reason;
  }
  if (handlers_.on_closing) {
    handlers_.on_closing(reason);
  }
  read_timer_.cancel();
  ping_timer_.cancel();
  while (!queue_.empty()) {
    queue_.front()->done.set_value("connection closed");
    queue_.pop_front();
  }
  if (!graceful || !ws_.is_open()) {
    ReleaseSocket();
    return;
  }

  // The close handshake gets one write_wait; after that the socket goes.
  close_timer_.expires_after(options_.write_wait);
  close_timer_.async_wait([this](const boost::system::error_code& ec) {
    if (!ec) {
      ReleaseSocket();
    }
  });
  const websocket::close_reason frame(static_cast<websocket::close_code>(code),
                                      CloseReasonText(reason));
  ws_.async_close(frame, [this](const beast::error_code& ec) {
    if (ec) {
      pl::Log(pl::Level::kDebug, "ws", "close handshake incomplete",
              {{"error", ec.message()}});
    }
    close_timer_.cancel();
    ReleaseSocket();
  });
}

void WsChannel::ReleaseSocket() {
  auto& lowest = beast::get_lowest_layer(ws_);
  if (!lowest.socket().is_open()) {
    return;
  }
  boost::system::error_code ec;
  lowest.socket().shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  if (ec && ec != asio::error::not_connected) {
    pl::Log(pl::Level::kDebug, "ws", "socket shutdown failed",
            {{"error", ec.message()}});
  }
  lowest.close();
}

WsInbox::WsInbox(std::shared_ptr<WsChannel> channel,
                 std::function<void(const std::string&)> on_closing)
    : channel_(std::move(channel)), on_closing_(std::move(on_closing)) {}

WsInbox::~WsInbox() {
  if (thread_.joinable()) {
    channel_->Close(kCloseNormal, "");
    thread_.join();
  }
}

bool WsInbox::Start(std::string& error) {
  WsChannelHandlers handlers;
  handlers.on_text = [this](std::string text) {
    std::lock_guard<std::mutex> lock(mutex_);
    texts_.push_back(std::move(text));
    cv_.notify_all();
    if (texts_.size() >= kMaxPendingTexts) {
      paused_ = true;
      return false;
    }
    return true;
  };
  handlers.on_control = [this] {
    std::lock_guard<std::mutex> lock(mutex_);
    ++control_frames_;
    cv_.notify_all();
  };
  handlers.on_closing = on_closing_;
  try {
    thread_ = std::thread([this, handlers = std::move(handlers)]() mutable {
      channel_->Run(std::move(handlers));
      std::lock_guard<std::mutex> lock(mutex_);
      ended_ = true;
      cv_.notify_all();
    });
  } catch (const std::system_error& ex) {
    error = std::string("channel thread failed: ") + ex.what();
    return false;
  }
  return true;
}

InboxStatus WsInbox::Next(std::string& text, std::chrono::milliseconds timeout) {
  bool resume = false;
  InboxStatus status = InboxStatus::kEnded;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] {
          return !texts_.empty() || control_frames_ > 0 || ended_;
        })) {
      return InboxStatus::kTimeout;
    }
    if (!texts_.empty()) {
      text = std::move(texts_.front());
      texts_.pop_front();
      if (paused_ && texts_.size() <= kMaxPendingTexts / 2) {
        paused_ = false;
        resume = true;
      }
      status = InboxStatus::kText;
    } else if (control_frames_ > 0) {
      control_frames_ = 0;
      status = InboxStatus::kControl;
    }
  }
  if (resume) {
    channel_->ResumeReading();
  }
  return status;
}

void WsInbox::Join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

}  // namespace clipsync::server

#include "ws_client.h"

#include <chrono>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/beast/websocket/stream.hpp>

#include "platform_log.h"

namespace clipsync::client {

namespace {

namespace pl = platform::log;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

void RunPending(asio::io_context& ioc) {
  ioc.run();
  ioc.restart();
}

std::string DescribeClose(const server::WsCloseInfo& info) {
  if (!info.by_peer) {
    return info.reason;
  }
  return "server closed connection (" + std::to_string(info.peer_code) +
         (info.peer_reason.empty() ? "" : " " + info.peer_reason) + ")";
}

}  // namespace

WsClientLink::WsClientLink(std::shared_ptr<server::WsChannel> channel)
    : channel_(std::move(channel)), inbox_(channel_) {}

WsClientLink::~WsClientLink() {
  Close();
  inbox_.Join();
}

bool WsClientLink::Start(std::string& error) {
  return inbox_.Start(error);
}

bool WsClientLink::Send(const server::proto::Event& event, std::string& error) {
  if (closed_.load()) {
    error = "link closed";
    return false;
  }
  return channel_->SendText(server::proto::EncodeEvent(event), error);
}

bool WsClientLink::SendPing(std::string& error) {
  if (closed_.load()) {
    error = "link closed";
    return false;
  }
  return channel_->SendPing(error);
}

LinkReadStatus WsClientLink::Read(server::proto::Event& out,
                                  std::uint32_t timeout_ms,
                                  std::string& error) {
  std::string text;
  switch (inbox_.Next(text, std::chrono::milliseconds(timeout_ms))) {
    case server::InboxStatus::kText: {
      std::string decode_error;
      if (!server::proto::DecodeEvent(text, out, decode_error)) {
        pl::Log(pl::Level::kWarn, "link", "malformed event dropped",
                {{"error", decode_error}});
        return LinkReadStatus::kIgnored;
      }
      return LinkReadStatus::kEvent;
    }
    case server::InboxStatus::kControl:
      return LinkReadStatus::kIgnored;
    case server::InboxStatus::kTimeout:
      return LinkReadStatus::kTimeout;
    case server::InboxStatus::kEnded:
      break;
  }
  error = DescribeClose(channel_->close_info());
  closed_.store(true);
  return LinkReadStatus::kClosed;
}

void WsClientLink::Close() {
  bool expected = false;
  if (!closed_.compare_exchange_strong(expected, true)) {
    return;
  }
  channel_->Close(server::kCloseNormal, "client closed");
}

WsConnector::WsConnector(const ClientConfig& cfg)
    : connect_timeout_ms_(cfg.connect_timeout_ms),
      write_wait_ms_(cfg.write_wait_ms),
      max_message_bytes_(cfg.max_message_bytes) {
  if (common::ParseWsUrl(cfg.server_url, url_, url_error_)) {
    common::SetQueryValue(url_.query, "apiKey", cfg.api_key);
    common::SetQueryValue(url_.query, "hostname", cfg.hostname);
  }
}

std::shared_ptr<AgentLink> WsConnector::Connect(std::string& error) {
  if (!url_error_.empty()) {
    error = url_error_;
    return nullptr;
  }
  auto ioc = std::make_shared<asio::io_context>();
  const std::chrono::milliseconds connect_timeout(connect_timeout_ms_);

  beast::error_code ec;
  tcp::resolver resolver(*ioc);
  const auto endpoints =
      resolver.resolve(url_.host, std::to_string(url_.port), ec);
  if (ec) {
    error = "resolve " + url_.host + " failed: " + ec.message();
    return nullptr;
  }

  server::WsChannel::Stream ws(*ioc);
  auto& lowest = beast::get_lowest_layer(ws);
  lowest.expires_after(connect_timeout);
  lowest.async_connect(endpoints,
                       [&ec](const beast::error_code& e, const tcp::endpoint&) {
                         ec = e;
                       });
  RunPending(*ioc);
  if (ec) {
    error = "connect failed: " + ec.message();
    return nullptr;
  }
  lowest.socket().set_option(tcp::no_delay(true), ec);
  if (ec) {
    pl::Log(pl::Level::kDebug, "link", "nodelay not set",
            {{"error", ec.message()}});
  }

  lowest.expires_never();
  websocket::stream_base::timeout timeouts{};
  timeouts.handshake_timeout = connect_timeout;
  timeouts.idle_timeout = websocket::stream_base::none();
  timeouts.keep_alive_pings = false;
  ws.set_option(timeouts);
  websocket::response_type response;
  ws.async_handshake(response, common::HostHeader(url_),
                     common::RequestTarget(url_),
                     [&ec](const beast::error_code& e) { ec = e; });
  RunPending(*ioc);
  if (ec == websocket::error::upgrade_declined) {
    const auto reason = response.reason();
    error = "handshake rejected: " + std::to_string(response.result_int());
    if (!reason.empty()) {
      error += " " + std::string(reason.data(), reason.size());
    }
    return nullptr;
  }
  if (ec) {
    error = "handshake failed: " + ec.message();
    return nullptr;
  }

  server::WsChannelOptions options;
  options.write_wait = std::chrono::milliseconds(write_wait_ms_);
  options.max_message_bytes = max_message_bytes_;
  auto channel =
      std::make_shared<server::WsChannel>(ioc, std::move(ws), options);
  auto link = std::make_shared<WsClientLink>(std::move(channel));
  if (!link->Start(error)) {
    return nullptr;
  }
  return link;
}

}  // namespace clipsync::client

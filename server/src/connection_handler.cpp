#include "connection_handler.h"

#include <chrono>
#include <string_view>

#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/beast/websocket/stream.hpp>

#include "device_session.h"
#include "platform_log.h"
#include "url_codec.h"
#include "ws_channel.h"

namespace clipsync::server {

namespace {

namespace pl = platform::log;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;

constexpr const char* kForbiddenBody = "Forbidden: Invalid API Key";
constexpr const char* kServerName = "clipsync";
constexpr std::size_t kMaxHttpBodyBytes = 16u * 1024u;

// Drives the connection's context until the operation just started is done.
void RunPending(asio::io_context& ioc) {
  ioc.run();
  ioc.restart();
}

}  // namespace

ConnectionHandler::ConnectionHandler(SyncHub* hub) : hub_(hub) {}

void ConnectionHandler::Reply(beast::tcp_stream& stream, asio::io_context& ioc,
                              http::status status, const std::string& body,
                              bool head_only) {
  http::response<http::string_body> res{status, 11};
  res.set(http::field::server, kServerName);
  res.set(http::field::content_type, "text/plain; charset=utf-8");
  res.keep_alive(false);
  if (!head_only) {
    res.body() = body;
  }
  res.prepare_payload();

  stream.expires_after(
      std::chrono::milliseconds(hub_->config().server.write_wait_ms));
  beast::error_code ec;
  http::async_write(stream, res,
                    [&ec](const beast::error_code& e, std::size_t) { ec = e; });
  RunPending(ioc);
  if (ec) {
    pl::Log(pl::Level::kDebug, "http", "response not delivered",
            {{"status", std::to_string(res.result_int())},
             {"error", ec.message()}});
    return;
  }
  stream.socket().shutdown(asio::ip::tcp::socket::shutdown_send, ec);
  if (ec) {
    pl::Log(pl::Level::kDebug, "http", "shutdown after response failed",
            {{"error", ec.message()}});
  }
}

void ConnectionHandler::Serve(AcceptedConnection& conn) {
  const ServerSection& cfg = hub_->config().server;
  asio::io_context& ioc = *conn.ioc;
  const std::string remote_ip = conn.remote_ip;
  beast::tcp_stream stream(std::move(conn.socket));
  beast::flat_buffer buffer;
  http::request_parser<http::string_body> parser;
  parser.header_limit(static_cast<std::uint32_t>(kMaxHttpHeadBytes));
  parser.body_limit(kMaxHttpBodyBytes);

  beast::error_code ec;
  stream.expires_after(std::chrono::milliseconds(cfg.handshake_timeout_ms));
  http::async_read(stream, buffer, parser,
                   [&ec](const beast::error_code& e, std::size_t) { ec = e; });
  RunPending(ioc);
  if (ec) {
    bad_requests_.fetch_add(1);
    pl::Log(pl::Level::kDebug, "http", "request dropped",
            {{"remote", remote_ip}, {"error", ec.message()}});
    if (ec == http::error::header_limit) {
      Reply(stream, ioc, http::status::request_header_fields_too_large,
            "Request Header Fields Too Large", false);
    } else if (ec != beast::error::timeout && ec != http::error::end_of_stream &&
               ec != asio::error::eof) {
      Reply(stream, ioc, http::status::bad_request, "Bad Request", false);
    }
    return;
  }

  const http::request<http::string_body>& request = parser.get();
  const std::string_view target(request.target().data(),
                                request.target().size());
  const std::size_t qpos = target.find('?');
  const std::string path = common::UrlDecode(target.substr(0, qpos));
  const common::QueryParams query =
      qpos == std::string_view::npos ? common::QueryParams{}
                                     : common::ParseQuery(target.substr(qpos + 1));

  if (path == "/health") {
    health_checks_.fetch_add(1);
    const http::verb method = request.method();
    if (method != http::verb::get && method != http::verb::head) {
      Reply(stream, ioc, http::status::method_not_allowed, "Method Not Allowed",
            false);
    } else {
      Reply(stream, ioc, http::status::ok, "OK", method == http::verb::head);
    }
    return;
  }
  if (path != "/ws") {
    bad_requests_.fetch_add(1);
    Reply(stream, ioc, http::status::not_found, "Not Found", false);
    return;
  }
  if (!hub_->Authorize(common::QueryValue(query, "apiKey"))) {
    auth_failures_.fetch_add(1);
    pl::Log(pl::Level::kWarn, "http", "auth failed: invalid api key",
            {{"remote", remote_ip}});
    Reply(stream, ioc, http::status::forbidden, kForbiddenBody, false);
    return;
  }
  if (!websocket::is_upgrade(request)) {
    bad_requests_.fetch_add(1);
    pl::Log(pl::Level::kDebug, "http", "upgrade rejected",
            {{"remote", remote_ip}, {"error", "not a websocket upgrade"}});
    Reply(stream, ioc, http::status::bad_request, "Bad Request", false);
    return;
  }

  WsChannel::Stream ws(std::move(stream));
  beast::get_lowest_layer(ws).expires_never();
  websocket::stream_base::timeout timeouts{};
  timeouts.handshake_timeout = std::chrono::milliseconds(cfg.handshake_timeout_ms);
  timeouts.idle_timeout = websocket::stream_base::none();
  timeouts.keep_alive_pings = false;
  ws.set_option(timeouts);
  ws.set_option(websocket::stream_base::decorator(
      [](websocket::response_type& res) {
        res.set(http::field::server, kServerName);
      }));
  ws.async_accept(request, [&ec](const beast::error_code& e) { ec = e; });
  RunPending(ioc);
  if (ec) {
    bad_requests_.fetch_add(1);
    pl::Log(pl::Level::kDebug, "http", "upgrade failed",
            {{"remote", remote_ip}, {"error", ec.message()}});
    return;
  }
  beast::get_lowest_layer(ws).socket().set_option(asio::ip::tcp::no_delay(true),
                                                  ec);
  if (ec) {
    pl::Log(pl::Level::kDebug, "http", "nodelay not set",
            {{"error", ec.message()}});
  }
  upgrades_.fetch_add(1);

  auto channel = std::make_shared<WsChannel>(
      conn.ioc, std::move(ws),
      SessionChannelOptions(hub_->timings(), cfg.max_message_bytes));
  auto connection = std::make_shared<WsConnection>(channel);
  std::string device_id;
  std::string error;
  if (!hub_->AdmitDevice(common::QueryValue(query, "hostname"), connection,
                         device_id, error)) {
    pl::Log(pl::Level::kWarn, "http", "admission failed",
            {{"remote", remote_ip}, {"error", error}});
    channel->Close(kCloseGoingAway, "admission failed");
    channel->Run({});
    return;
  }
  pl::Log(pl::Level::kInfo, "http", "device connected",
          {{"device", device_id}, {"remote", remote_ip}});
  DeviceSession session(device_id, channel, *hub_);
  session.Run();
}

HandlerStats ConnectionHandler::stats() const {
  HandlerStats s;
  s.health_checks = health_checks_.load();
  s.upgrades = upgrades_.load();
  s.auth_failures = auth_failures_.load();
  s.bad_requests = bad_requests_.load();
  return s;
}

}  // namespace clipsync::server

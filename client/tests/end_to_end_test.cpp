#include <cassert>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>

#include "client_config.h"
#include "connection_handler.h"
#include "network_server.h"
#include "sync_agent.h"
#include "sync_hub.h"
#include "ws_client.h"

using namespace clipsync;
namespace proto = clipsync::server::proto;
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

template <typename Pred>
bool Eventually(Pred pred,
                std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return pred();
}

class MemoryClipboard final : public platform::ClipboardAccessor {
 public:
  bool Read(std::string& out, std::string& error) override {
    std::lock_guard<std::mutex> lock(mutex_);
    (void)error;
    out = value_;
    return true;
  }
  bool Write(const std::string& text, std::string& error) override {
    std::lock_guard<std::mutex> lock(mutex_);
    (void)error;
    value_ = text;
    return true;
  }
  std::string value() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return value_;
  }

 private:
  mutable std::mutex mutex_;
  std::string value_;
};

struct HttpResult {
  int status{0};
  std::string body;
};

HttpResult HttpRequest(std::uint16_t port, const std::string& target,
                       http::verb method = http::verb::get) {
  asio::io_context ioc;
  beast::tcp_stream stream(ioc);
  beast::error_code ec;
  stream.socket().connect(
      tcp::endpoint(asio::ip::make_address("127.0.0.1"), port), ec);
  if (ec) {
    return {};
  }
  http::request<http::empty_body> req{method, target, 11};
  req.set(http::field::host, "127.0.0.1");
  http::write(stream, req, ec);
  if (ec) {
    return {};
  }
  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(stream, buffer, res, ec);
  if (ec) {
    return {};
  }
  return {static_cast<int>(res.result_int()), res.body()};
}

client::ClientConfig ClientFor(std::uint16_t port, const std::string& key,
                               const std::string& hostname) {
  client::ClientConfig cfg;
  cfg.server_url = "ws://127.0.0.1:" + std::to_string(port) + "/ws";
  cfg.api_key = key;
  cfg.hostname = hostname;
  cfg.poll_interval_ms = 50;
  cfg.backoff_initial_ms = 50;
  cfg.backoff_max_ms = 200;
  cfg.connect_timeout_ms = 2000;
  std::string err;
  const bool ok = client::ValidateClientConfig(cfg, err);
  assert(ok);
  (void)ok;
  return cfg;
}

}  // namespace

int main() {
  server::ServerConfig scfg;
  scfg.server.api_key = "e2e-key";
  scfg.server.bind_address = "127.0.0.1";
  scfg.server.pong_wait_ms = 5000;
  server::SyncHub hub;
  std::string err;
  assert(hub.Init(scfg, err));
  server::ConnectionHandler handler(&hub);
  server::NetworkServer net(&handler, "127.0.0.1", 0);
  assert(net.Start(err));
  const std::uint16_t port = net.port();
  assert(port != 0);

  {
    const HttpResult health = HttpRequest(port, "/health");
    assert(health.status == 200);
    assert(health.body == "OK");
    assert(HttpRequest(port, "/health", http::verb::post).status == 405);
    assert(HttpRequest(port, "/nope").status == 404);
    const HttpResult forbidden = HttpRequest(port, "/ws?apiKey=nope");
    assert(forbidden.status == 403);
    assert(forbidden.body == "Forbidden: Invalid API Key");
    assert(HttpRequest(port, "/ws?apiKey=e2e-key").status == 400);
    assert(handler.stats().health_checks == 2);
  }

  {
    client::WsConnector bad(ClientFor(port, "wrong", "intruder"));
    auto link = bad.Connect(err);
    assert(!link);
    assert(err == "handshake rejected: 403 Forbidden");
    assert(handler.stats().auth_failures == 2);
  }

  {
    // Raw link: first frames are the empty history then the device list.
    client::WsConnector connector(ClientFor(port, "e2e-key", "watcher"));
    auto link = connector.Connect(err);
    assert(link);
    bool saw_history = false;
    bool saw_list = false;
    for (int i = 0; i < 10 && !(saw_history && saw_list); ++i) {
      proto::Event e;
      const auto st = link->Read(e, 2000, err);
      if (st != client::LinkReadStatus::kEvent) {
        continue;
      }
      if (proto::TypeOf(e) == proto::EventType::kClipboardHistory) {
        saw_history = true;
      }
      if (proto::TypeOf(e) == proto::EventType::kDeviceList) {
        const auto& devices = std::get<proto::DeviceList>(e.payload).devices;
        saw_list = devices.size() == 1 && devices[0].hostname == "watcher";
      }
    }
    assert(saw_history && saw_list);

    // Dropping the device on the hub reaches the client as a close frame.
    const auto devices = hub.registry()->Snapshot();
    assert(devices.size() == 1);
    hub.DisconnectDevice(devices[0].id, "kicked");
    client::LinkReadStatus st = client::LinkReadStatus::kTimeout;
    std::string close_error;
    for (int i = 0; i < 10 && st != client::LinkReadStatus::kClosed; ++i) {
      proto::Event e;
      st = link->Read(e, 2000, close_error);
    }
    assert(st == client::LinkReadStatus::kClosed);
    assert(close_error == "server closed connection (1000 closed by server)");
    link->Close();
    assert(Eventually([&] { return hub.registry()->Size() == 0; }));
  }

  {
    auto clip_a = std::make_shared<MemoryClipboard>();
    auto clip_b = std::make_shared<MemoryClipboard>();
    const auto cfg_a = ClientFor(port, "e2e-key", "alpha");
    const auto cfg_b = ClientFor(port, "e2e-key", "beta");
    client::SyncAgent agent_a(client::MakeAgentOptions(cfg_a),
                              std::make_shared<client::WsConnector>(cfg_a), clip_a);
    client::SyncAgent agent_b(client::MakeAgentOptions(cfg_b),
                              std::make_shared<client::WsConnector>(cfg_b), clip_b);
    assert(agent_a.Start(err));
    assert(agent_b.Start(err));
    assert(Eventually([&] {
      return agent_a.Status().devices.size() == 2 &&
             agent_b.Status().devices.size() == 2;
    }));

    std::string b_id;
    for (const auto& d : agent_a.Status().devices) {
      if (d.hostname == "beta") {
        b_id = d.id;
      }
    }
    assert(!b_id.empty());

    // Copy on A shows up on B through the poll loop; A is not echoed.
    assert(clip_a->Write("copied on alpha", err));
    assert(Eventually([&] { return clip_b->value() == "copied on alpha"; }));
    assert(agent_a.last_sent() == "copied on alpha");
    assert(agent_b.last_received() == "copied on alpha");
    assert(agent_b.last_sent().empty());
    assert(hub.store()->CurrentSnapshot() == "copied on alpha");

    // Offer handshake across the wire.
    assert(agent_a.OfferFile(b_id, "notes.txt", 42, err));
    assert(Eventually([&] { return agent_b.Status().pending_offer.has_value(); }));
    assert(agent_b.Status().pending_offer->offering_hostname == "alpha");
    assert(agent_b.AcceptPendingOffer(err));
    assert(Eventually([&] {
      return agent_a.Status().last_notice == "beta accepted notes.txt";
    }));

    agent_b.Stop();
    assert(Eventually([&] { return agent_a.Status().devices.size() == 1; }));
    agent_a.Stop();
  }

  hub.Shutdown();
  net.Stop();
  assert(net.active_connections() == 0);
  return 0;
}

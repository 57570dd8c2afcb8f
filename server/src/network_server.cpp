#include "network_server.h"

#include <system_error>
#include <utility>

#include <boost/asio/post.hpp>

#include "platform_log.h"

namespace clipsync::server {

namespace {

namespace pl = platform::log;
namespace asio = boost::asio;
using tcp = boost::asio::ip::tcp;

}  // namespace

NetworkServer::NetworkServer(ConnectionHandler* handler,
                             std::string bind_address, std::uint16_t port,
                             NetworkServerLimits limits)
    : handler_(handler),
      bind_address_(std::move(bind_address)),
      port_(port),
      limits_(limits) {}

NetworkServer::~NetworkServer() { Stop(); }

bool NetworkServer::Start(std::string& error) {
  error.clear();
  if (running_.load()) {
    return true;
  }
  if (!handler_) {
    error = "invalid handler";
    return false;
  }
  boost::system::error_code ec;
  tcp::resolver resolver(ioc_);
  const auto results = resolver.resolve(bind_address_, std::to_string(port_),
                                        tcp::resolver::passive, ec);
  if (ec || results.empty()) {
    error = "cannot resolve bind address " + bind_address_ +
            (ec ? ": " + ec.message() : std::string());
    return false;
  }
  const tcp::endpoint endpoint = results.begin()->endpoint();
  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor_.bind(endpoint, ec);
  }
  if (!ec) {
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    error = "listen on " + bind_address_ + ":" + std::to_string(port_) +
            " failed: " + ec.message();
    boost::system::error_code close_ec;
    acceptor_.close(close_ec);
    return false;
  }
  bound_port_ = acceptor_.local_endpoint(ec).port();
  if (ec) {
    bound_port_ = port_;
  }

  running_.store(true);
  ioc_.restart();
  DoAccept();
  try {
    worker_ = std::thread([this] { ioc_.run(); });
  } catch (const std::system_error& ex) {
    running_.store(false);
    acceptor_.close(ec);
    error = std::string("accept thread failed: ") + ex.what();
    return false;
  }
  pl::Log(pl::Level::kInfo, "net", "listening",
          {{"address", bind_address_}, {"port", std::to_string(bound_port_)}});
  return true;
}

void NetworkServer::Stop() {
  if (running_.exchange(false)) {
    asio::post(ioc_, [this] {
      boost::system::error_code ec;
      acceptor_.close(ec);
      if (ec) {
        pl::Log(pl::Level::kDebug, "net", "acceptor close failed",
                {{"error", ec.message()}});
      }
    });
  }
  if (worker_.joinable()) {
    worker_.join();
  }
  // Connection threads still reference this object.
  std::unique_lock<std::mutex> lock(conn_mutex_);
  drained_cv_.wait(lock, [this] {
    return active_connections_.load(std::memory_order_relaxed) == 0;
  });
}

bool NetworkServer::TryAcquireConnectionSlot(const std::string& remote_ip) {
  const std::uint32_t prev =
      active_connections_.fetch_add(1, std::memory_order_relaxed);
  if (prev >= limits_.max_connections) {
    active_connections_.fetch_sub(1, std::memory_order_relaxed);
    return false;
  }

  if (remote_ip.empty()) {
    return true;
  }
  std::lock_guard<std::mutex> lock(conn_mutex_);
  const auto it = connections_by_ip_.find(remote_ip);
  const std::uint32_t current =
      it == connections_by_ip_.end() ? 0u : it->second;
  if (current >= limits_.max_connections_per_ip) {
    active_connections_.fetch_sub(1, std::memory_order_relaxed);
    return false;
  }
  if (it == connections_by_ip_.end()) {
    connections_by_ip_.emplace(remote_ip, 1u);
  } else {
    it->second++;
  }
  return true;
}

void NetworkServer::ReleaseConnectionSlot(const std::string& remote_ip) {
  {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    active_connections_.fetch_sub(1, std::memory_order_relaxed);
    if (!remote_ip.empty()) {
      const auto it = connections_by_ip_.find(remote_ip);
      if (it != connections_by_ip_.end()) {
        if (it->second <= 1) {
          connections_by_ip_.erase(it);
        } else {
          it->second--;
        }
      }
    }
  }
  drained_cv_.notify_all();
}

void NetworkServer::DoAccept() {
  auto conn = std::make_shared<AcceptedConnection>(
      std::make_shared<asio::io_context>());
  acceptor_.async_accept(conn->socket,
                         [this, conn](const boost::system::error_code& ec) {
                           OnAccept(ec, conn);
                         });
}

void NetworkServer::OnAccept(const boost::system::error_code& ec,
                             std::shared_ptr<AcceptedConnection> conn) {
  if (!running_.load() || ec == asio::error::operation_aborted) {
    return;
  }
  if (ec) {
    pl::Log(pl::Level::kDebug, "net", "accept failed", {{"error", ec.message()}});
    DoAccept();
    return;
  }
  boost::system::error_code peer_ec;
  const tcp::endpoint peer = conn->socket.remote_endpoint(peer_ec);
  if (peer_ec) {
    pl::Log(pl::Level::kDebug, "net", "peer gone before accept completed",
            {{"error", peer_ec.message()}});
    DoAccept();
    return;
  }
  conn->remote_ip = peer.address().to_string();
  if (!TryAcquireConnectionSlot(conn->remote_ip)) {
    pl::Log(pl::Level::kWarn, "net", "connection limit reached",
            {{"remote", conn->remote_ip}});
    DoAccept();
    return;
  }

  try {
    std::thread([this, conn]() {
      struct SlotGuard {
        NetworkServer* server;
        std::string ip;
        ~SlotGuard() { server->ReleaseConnectionSlot(ip); }
      } slot{this, conn->remote_ip};
      handler_->Serve(*conn);
    }).detach();
  } catch (const std::system_error& ex) {
    pl::Log(pl::Level::kError, "net", "connection thread failed",
            {{"error", ex.what()}});
    ReleaseConnectionSlot(conn->remote_ip);
  }
  DoAccept();
}

}  // namespace clipsync::server

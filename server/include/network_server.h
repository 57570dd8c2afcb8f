#ifndef CLIPSYNC_SERVER_NETWORK_SERVER_H
#define CLIPSYNC_SERVER_NETWORK_SERVER_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "connection_handler.h"

namespace clipsync::server {

struct NetworkServerLimits {
  std::uint32_t max_connections{256};
  std::uint32_t max_connections_per_ip{64};
};

// Asio accept loop on a worker thread. Each accepted socket gets its own
// io_context and a detached thread; Stop waits for every one to finish.
class NetworkServer {
 public:
  NetworkServer(ConnectionHandler* handler, std::string bind_address,
                std::uint16_t port,
                NetworkServerLimits limits = NetworkServerLimits{});
  ~NetworkServer();

  NetworkServer(const NetworkServer&) = delete;
  NetworkServer& operator=(const NetworkServer&) = delete;

  bool Start(std::string& error);
  void Stop();

  // Actual listening port; differs from the requested one when that was 0.
  std::uint16_t port() const { return bound_port_; }
  std::uint32_t active_connections() const {
    return active_connections_.load(std::memory_order_relaxed);
  }

 private:
  void DoAccept();
  void OnAccept(const boost::system::error_code& ec,
                std::shared_ptr<AcceptedConnection> conn);
  bool TryAcquireConnectionSlot(const std::string& remote_ip);
  void ReleaseConnectionSlot(const std::string& remote_ip);

  ConnectionHandler* handler_;
  std::string bind_address_;
  std::uint16_t port_{0};
  std::uint16_t bound_port_{0};
  NetworkServerLimits limits_;
  std::atomic<bool> running_{false};
  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::acceptor acceptor_{ioc_};
  std::thread worker_;
  std::atomic<std::uint32_t> active_connections_{0};
  std::mutex conn_mutex_;
  std::condition_variable drained_cv_;
  std::unordered_map<std::string, std::uint32_t> connections_by_ip_;
};

}  // namespace clipsync::server

#endif  // CLIPSYNC_SERVER_NETWORK_SERVER_H

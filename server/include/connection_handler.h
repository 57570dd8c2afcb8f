#ifndef CLIPSYNC_SERVER_CONNECTION_HANDLER_H
#define CLIPSYNC_SERVER_CONNECTION_HANDLER_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/status.hpp>

#include "sync_hub.h"

namespace clipsync::server {

constexpr std::size_t kMaxHttpHeadBytes = 16u * 1024u;

// A socket accepted on its own io_context. The context is declared first so
// it outlives the socket.
struct AcceptedConnection {
  explicit AcceptedConnection(std::shared_ptr<boost::asio::io_context> context)
      : ioc(std::move(context)), socket(*ioc) {}

  std::shared_ptr<boost::asio::io_context> ioc;
  boost::asio::ip::tcp::socket socket;
  std::string remote_ip;
};

struct HandlerStats {
  std::uint64_t health_checks{0};
  std::uint64_t upgrades{0};
  std::uint64_t auth_failures{0};
  std::uint64_t bad_requests{0};
};

// HTTP front door for one accepted socket: `/health`, `/ws` upgrade with
// shared-secret check, then the device session until it ends.
class ConnectionHandler {
 public:
  explicit ConnectionHandler(SyncHub* hub);

  // Blocks until the connection is done. Nothing else may run conn.ioc.
  void Serve(AcceptedConnection& conn);

  HandlerStats stats() const;

 private:
  void Reply(boost::beast::tcp_stream& stream, boost::asio::io_context& ioc,
             boost::beast::http::status status, const std::string& body,
             bool head_only);

  SyncHub* hub_;
  std::atomic<std::uint64_t> health_checks_{0};
  std::atomic<std::uint64_t> upgrades_{0};
  std::atomic<std::uint64_t> auth_failures_{0};
  std::atomic<std::uint64_t> bad_requests_{0};
};

}  // namespace clipsync::server

#endif  // CLIPSYNC_SERVER_CONNECTION_HANDLER_H

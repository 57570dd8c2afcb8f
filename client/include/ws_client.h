#ifndef CLIPSYNC_CLIENT_WS_CLIENT_H
#define CLIPSYNC_CLIENT_WS_CLIENT_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "agent_link.h"
#include "client_config.h"
#include "url_codec.h"
#include "ws_channel.h"

namespace clipsync::client {

// AgentLink over a WsChannel running on the link's own thread. Control
// frames surface from Read as kIgnored so callers see the link is alive.
class WsClientLink final : public AgentLink {
 public:
  explicit WsClientLink(std::shared_ptr<server::WsChannel> channel);
  ~WsClientLink() override;

  // False when the channel thread could not be started.
  bool Start(std::string& error);

  bool Send(const server::proto::Event& event, std::string& error) override;
  bool SendPing(std::string& error) override;
  LinkReadStatus Read(server::proto::Event& out, std::uint32_t timeout_ms,
                      std::string& error) override;
  void Close() override;

 private:
  std::shared_ptr<server::WsChannel> channel_;
  server::WsInbox inbox_;
  std::atomic<bool> closed_{false};
};

// Dials `server_url` with apiKey and hostname query parameters and performs
// the WebSocket upgrade.
class WsConnector final : public AgentConnector {
 public:
  explicit WsConnector(const ClientConfig& cfg);

  std::shared_ptr<AgentLink> Connect(std::string& error) override;

 private:
  common::WsUrl url_;
  std::string url_error_;
  std::uint32_t connect_timeout_ms_;
  std::uint32_t write_wait_ms_;
  std::uint32_t max_message_bytes_;
};

}  // namespace clipsync::client

#endif  // CLIPSYNC_CLIENT_WS_CLIENT_H

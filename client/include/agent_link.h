#ifndef CLIPSYNC_CLIENT_AGENT_LINK_H
#define CLIPSYNC_CLIENT_AGENT_LINK_H

#include <cstdint>
#include <memory>
#include <string>

#include "protocol.h"

namespace clipsync::client {

enum class LinkReadStatus : std::uint8_t {
  kEvent = 0,
  kIgnored = 1,  // a frame arrived but carried no usable event
  kTimeout = 2,
  kClosed = 3
};

// One live connection to the hub. Read is called from a single thread; Send,
// SendPing and Close may be called from any thread.
class AgentLink {
 public:
  virtual ~AgentLink() = default;

  virtual bool Send(const server::proto::Event& event, std::string& error) = 0;
  virtual bool SendPing(std::string& error) = 0;
  virtual LinkReadStatus Read(server::proto::Event& out,
                              std::uint32_t timeout_ms, std::string& error) = 0;
  // Unblocks a pending Read. Idempotent.
  virtual void Close() = 0;
};

class AgentConnector {
 public:
  virtual ~AgentConnector() = default;

  virtual std::shared_ptr<AgentLink> Connect(std::string& error) = 0;
};

}  // namespace clipsync::client

#endif  // CLIPSYNC_CLIENT_AGENT_LINK_H

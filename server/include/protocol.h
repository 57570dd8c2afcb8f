#ifndef CLIPSYNC_SERVER_PROTOCOL_H
#define CLIPSYNC_SERVER_PROTOCOL_H

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace clipsync::server::proto {

enum class EventType : std::uint8_t {
  kClipboardUpdate = 0,
  kClipboardHistory = 1,
  kDeviceList = 2,
  kRequestDevices = 3,
  kFileOffer = 4,
  kFileAck = 5,
};

struct ClipboardUpdate {
  std::string content;
};

// Most recent first.
struct ClipboardHistory {
  std::vector<std::string> history;
};

struct DeviceInfo {
  std::string id;
  std::string hostname;
};

struct DeviceList {
  std::vector<DeviceInfo> devices;
};

struct RequestDevices {};

struct FileOffer {
  std::string filename;
  std::int64_t filesize{0};
  std::string target_id;  // empty: every other device
};

struct FileAck {
  std::string filename;
  bool allow{false};
  std::string source_id;
};

using Payload = std::variant<ClipboardUpdate,
                             ClipboardHistory,
                             DeviceList,
                             RequestDevices,
                             FileOffer,
                             FileAck>;

struct Event {
  Payload payload;
  std::string sender_id;
};

EventType TypeOf(const Payload& payload);
inline EventType TypeOf(const Event& event) { return TypeOf(event.payload); }

const char* EventTypeName(EventType type);
bool ParseEventType(std::string_view name, EventType& out);

// `{"type":..,"data":..,"senderId":..}`; senderId omitted when empty.
// Invalid UTF-8 in strings is replaced, never thrown.
std::string EncodeEvent(const Event& event);

// Missing payload fields take their zero value; present fields of the wrong
// JSON type, unknown tags and malformed JSON are errors.
bool DecodeEvent(std::string_view text, Event& out, std::string& error);

}  // namespace clipsync::server::proto

#endif  // CLIPSYNC_SERVER_PROTOCOL_H

#include "protocol.h"

#include <limits>
#include <utility>

#include <nlohmann/json.hpp>

namespace clipsync::server::proto {

namespace {

using json = nlohmann::json;

constexpr const char* kTypeNames[] = {
    "clipboard_update", "clipboard_history", "device_list",
    "request_devices",  "file_offer",        "file_ack",
};

struct TypeVisitor {
  EventType operator()(const ClipboardUpdate&) const {
    return EventType::kClipboardUpdate;
  }
  EventType operator()(const ClipboardHistory&) const {
    return EventType::kClipboardHistory;
  }
  EventType operator()(const DeviceList&) const {
    return EventType::kDeviceList;
  }
  EventType operator()(const RequestDevices&) const {
    return EventType::kRequestDevices;
  }
  EventType operator()(const FileOffer&) const { return EventType::kFileOffer; }
  EventType operator()(const FileAck&) const { return EventType::kFileAck; }
};

struct DataEncoder {
  json operator()(const ClipboardUpdate& p) const {
    return json{{"content", p.content}};
  }
  json operator()(const ClipboardHistory& p) const {
    return json{{"history", p.history}};
  }
  json operator()(const DeviceList& p) const {
    json devices = json::array();
    for (const auto& d : p.devices) {
      devices.push_back(json{{"id", d.id}, {"hostname", d.hostname}});
    }
    return json{{"devices", std::move(devices)}};
  }
  json operator()(const RequestDevices&) const { return nullptr; }
  json operator()(const FileOffer& p) const {
    json data{{"filename", p.filename}, {"filesize", p.filesize}};
    if (!p.target_id.empty()) {
      data["targetId"] = p.target_id;
    }
    return data;
  }
  json operator()(const FileAck& p) const {
    return json{{"filename", p.filename},
                {"allow", p.allow},
                {"sourceId", p.source_id}};
  }
};

bool ReadStringField(const json& data, const char* name, std::string& out,
                     std::string& error) {
  const auto it = data.find(name);
  if (it == data.end() || it->is_null()) {
    out.clear();
    return true;
  }
  if (!it->is_string()) {
    error = std::string("field ") + name + " must be a string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool ReadStringArray(const json& data, const char* name,
                     std::vector<std::string>& out, std::string& error) {
  out.clear();
  const auto it = data.find(name);
  if (it == data.end() || it->is_null()) {
    return true;
  }
  if (!it->is_array()) {
    error = std::string("field ") + name + " must be an array";
    return false;
  }
  out.reserve(it->size());
  for (const auto& item : *it) {
    if (!item.is_string()) {
      error = std::string("field ") + name + " must hold strings";
      return false;
    }
    out.push_back(item.get<std::string>());
  }
  return true;
}

bool DecodePayload(EventType type, const json& data, Payload& out,
                   std::string& error) {
  switch (type) {
    case EventType::kClipboardUpdate: {
      ClipboardUpdate p;
      if (!ReadStringField(data, "content", p.content, error)) {
        return false;
      }
      out = std::move(p);
      return true;
    }
    case EventType::kClipboardHistory: {
      ClipboardHistory p;
      if (!ReadStringArray(data, "history", p.history, error)) {
        return false;
      }
      out = std::move(p);
      return true;
    }
    case EventType::kDeviceList: {
      DeviceList p;
      const auto it = data.find("devices");
      if (it != data.end() && !it->is_null()) {
        if (!it->is_array()) {
          error = "field devices must be an array";
          return false;
        }
        for (const auto& item : *it) {
          if (!item.is_object()) {
            error = "device entry must be an object";
            return false;
          }
          DeviceInfo info;
          if (!ReadStringField(item, "id", info.id, error) ||
              !ReadStringField(item, "hostname", info.hostname, error)) {
            return false;
          }
          p.devices.push_back(std::move(info));
        }
      }
      out = std::move(p);
      return true;
    }
    case EventType::kRequestDevices:
      out = RequestDevices{};
      return true;
    case EventType::kFileOffer: {
      FileOffer p;
      if (!ReadStringField(data, "filename", p.filename, error) ||
          !ReadStringField(data, "targetId", p.target_id, error)) {
        return false;
      }
      const auto it = data.find("filesize");
      if (it != data.end() && !it->is_null()) {
        if (it->is_number_unsigned()) {
          const auto v = it->get<std::uint64_t>();
          if (v > static_cast<std::uint64_t>(
                      (std::numeric_limits<std::int64_t>::max)())) {
            error = "field filesize out of range";
            return false;
          }
          p.filesize = static_cast<std::int64_t>(v);
        } else if (it->is_number_integer()) {
          p.filesize = it->get<std::int64_t>();
        } else {
          error = "field filesize must be an integer";
          return false;
        }
        if (p.filesize < 0) {
          error = "field filesize must not be negative";
          return false;
        }
      }
      out = std::move(p);
      return true;
    }
    case EventType::kFileAck: {
      FileAck p;
      if (!ReadStringField(data, "filename", p.filename, error) ||
          !ReadStringField(data, "sourceId", p.source_id, error)) {
        return false;
      }
      const auto it = data.find("allow");
      if (it != data.end() && !it->is_null()) {
        if (!it->is_boolean()) {
          error = "field allow must be a boolean";
          return false;
        }
        p.allow = it->get<bool>();
      }
      out = std::move(p);
      return true;
    }
  }
  error = "unknown event type";
  return false;
}

}  // namespace

EventType TypeOf(const Payload& payload) {
  return std::visit(TypeVisitor{}, payload);
}

const char* EventTypeName(EventType type) {
  const auto idx = static_cast<std::size_t>(type);
  if (idx >= sizeof(kTypeNames) / sizeof(kTypeNames[0])) {
    return "unknown";
  }
  return kTypeNames[idx];
}

bool ParseEventType(std::string_view name, EventType& out) {
  for (std::size_t i = 0; i < sizeof(kTypeNames) / sizeof(kTypeNames[0]); ++i) {
    if (name == kTypeNames[i]) {
      out = static_cast<EventType>(i);
      return true;
    }
  }
  return false;
}

std::string EncodeEvent(const Event& event) {
  json envelope;
  envelope["type"] = EventTypeName(TypeOf(event));
  envelope["data"] = std::visit(DataEncoder{}, event.payload);
  if (!event.sender_id.empty()) {
    envelope["senderId"] = event.sender_id;
  }
  return envelope.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool DecodeEvent(std::string_view text, Event& out, std::string& error) {
  error.clear();
  const json envelope = json::parse(text.begin(), text.end(), nullptr, false);
  if (envelope.is_discarded()) {
    error = "malformed json";
    return false;
  }
  if (!envelope.is_object()) {
    error = "envelope must be an object";
    return false;
  }
  const auto type_it = envelope.find("type");
  if (type_it == envelope.end() || !type_it->is_string()) {
    error = "missing type";
    return false;
  }
  const std::string type_name = type_it->get<std::string>();
  EventType type{};
  if (!ParseEventType(type_name, type)) {
    error = "unknown type: " + type_name;
    return false;
  }
  static const json kEmptyObject = json::object();
  const json* data = &kEmptyObject;
  const auto data_it = envelope.find("data");
  if (data_it != envelope.end() && !data_it->is_null()) {
    if (!data_it->is_object()) {
      error = "data must be an object";
      return false;
    }
    data = &*data_it;
  }
  Event decoded;
  if (!DecodePayload(type, *data, decoded.payload, error)) {
    return false;
  }
  if (!ReadStringField(envelope, "senderId", decoded.sender_id, error)) {
    return false;
  }
  out = std::move(decoded);
  return true;
}

}  // namespace clipsync::server::proto

#include <cassert>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "protocol.h"

using namespace clipsync::server::proto;
using nlohmann::json;

int main() {
  {
    Event e;
    e.payload = ClipboardUpdate{"hello"};
    e.sender_id = "dev-1";
    const json j = json::parse(EncodeEvent(e));
    assert(j["type"] == "clipboard_update");
    assert(j["data"]["content"] == "hello");
    assert(j["senderId"] == "dev-1");
  }

  {
    Event e;
    e.payload = RequestDevices{};
    const json j = json::parse(EncodeEvent(e));
    assert(j["type"] == "request_devices");
    assert(j["data"].is_null());
    assert(j.find("senderId") == j.end());
  }

  {
    Event e;
    e.payload = FileOffer{"x.txt", 100, ""};
    const json j = json::parse(EncodeEvent(e));
    assert(j["data"]["filename"] == "x.txt");
    assert(j["data"]["filesize"] == 100);
    assert(j["data"].find("targetId") == j["data"].end());
  }

  {
    Event e;
    e.payload = DeviceList{{{"a", "laptop"}, {"b", "desk"}}};
    std::string err;
    Event back;
    assert(DecodeEvent(EncodeEvent(e), back, err));
    const auto& list = std::get<DeviceList>(back.payload);
    assert(list.devices.size() == 2);
    assert(list.devices[1].id == "b");
    assert(list.devices[1].hostname == "desk");
  }

  {
    Event e;
    std::string err;
    bool ok = DecodeEvent(
        R"({"type":"file_ack","data":{"filename":"f","allow":true,"sourceId":"s"}})",
        e, err);
    assert(ok);
    assert(TypeOf(e) == EventType::kFileAck);
    const auto& ack = std::get<FileAck>(e.payload);
    assert(ack.allow);
    assert(ack.source_id == "s");
    assert(e.sender_id.empty());
  }

  {
    Event e;
    std::string err;
    assert(DecodeEvent(R"({"type":"clipboard_update","data":{}})", e, err));
    assert(std::get<ClipboardUpdate>(e.payload).content.empty());
    assert(DecodeEvent(R"({"type":"request_devices"})", e, err));
    assert(TypeOf(e) == EventType::kRequestDevices);
    assert(DecodeEvent(R"({"type":"clipboard_history","data":{"history":null}})",
                       e, err));
    assert(std::get<ClipboardHistory>(e.payload).history.empty());
  }

  {
    Event e;
    std::string err;
    assert(!DecodeEvent("not json", e, err));
    assert(!DecodeEvent("[1,2]", e, err));
    assert(!DecodeEvent(R"({"data":{}})", e, err));
    assert(!DecodeEvent(R"({"type":"paste_bomb","data":{}})", e, err));
    assert(err.find("paste_bomb") != std::string::npos);
    assert(!DecodeEvent(R"({"type":"clipboard_update","data":"x"})", e, err));
    assert(!DecodeEvent(R"({"type":"clipboard_update","data":{"content":5}})",
                        e, err));
    assert(!DecodeEvent(R"({"type":"file_offer","data":{"filesize":-1}})", e,
                        err));
    assert(!DecodeEvent(R"({"type":"file_offer","data":{"filesize":"10"}})", e,
                        err));
    assert(!DecodeEvent(R"({"type":"file_ack","data":{"allow":"yes"}})", e,
                        err));
  }

  {
    Event e;
    e.payload = ClipboardUpdate{std::string("bad\xff utf8")};
    const std::string text = EncodeEvent(e);
    Event back;
    std::string err;
    assert(DecodeEvent(text, back, err));
  }

  {
    EventType t{};
    assert(ParseEventType("file_offer", t));
    assert(t == EventType::kFileOffer);
    assert(std::string(EventTypeName(EventType::kDeviceList)) == "device_list");
    assert(!ParseEventType("FILE_OFFER", t));
  }

  return 0;
}

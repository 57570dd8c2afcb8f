#include <cassert>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "sync_agent.h"

using namespace clipsync::client;
namespace proto = clipsync::server::proto;

namespace {

template <typename Pred>
bool Eventually(Pred pred,
                std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

class FakeLink final : public AgentLink {
 public:
  bool Send(const proto::Event& event, std::string& error) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      error = "link closed";
      return false;
    }
    sent_.push_back(event);
    return true;
  }

  bool SendPing(std::string& error) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      error = "link closed";
      return false;
    }
    ++pings_;
    return true;
  }

  LinkReadStatus Read(proto::Event& out, std::uint32_t timeout_ms,
                      std::string& error) override {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool ready = cv_.wait_for(
        lock, std::chrono::milliseconds(timeout_ms),
        [this] { return closed_ || drop_ || !inbound_.empty(); });
    if (!ready) {
      return LinkReadStatus::kTimeout;
    }
    if (!inbound_.empty()) {
      out = std::move(inbound_.front());
      inbound_.pop_front();
      return LinkReadStatus::kEvent;
    }
    error = drop_ ? "connection reset" : "link closed";
    return LinkReadStatus::kClosed;
  }

  void Close() override {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    cv_.notify_all();
  }

  void Deliver(proto::Payload payload, const std::string& sender = {}) {
    std::lock_guard<std::mutex> lock(mutex_);
    proto::Event e;
    e.payload = std::move(payload);
    e.sender_id = sender;
    inbound_.push_back(std::move(e));
    cv_.notify_all();
  }

  // Simulates the server vanishing.
  void Drop() {
    std::lock_guard<std::mutex> lock(mutex_);
    drop_ = true;
    cv_.notify_all();
  }

  std::vector<proto::Event> SentOf(proto::EventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<proto::Event> out;
    for (const auto& e : sent_) {
      if (proto::TypeOf(e) == type) {
        out.push_back(e);
      }
    }
    return out;
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<proto::Event> inbound_;
  std::vector<proto::Event> sent_;
  bool closed_{false};
  bool drop_{false};
  int pings_{0};
};

class FakeConnector final : public AgentConnector {
 public:
  explicit FakeConnector(int failures_first) : failures_left_(failures_first) {}

  std::shared_ptr<AgentLink> Connect(std::string& error) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++attempts_;
    if (always_fail_ || failures_left_ > 0) {
      --failures_left_;
      error = "connection refused";
      return nullptr;
    }
    links_.push_back(std::make_shared<FakeLink>());
    return links_.back();
  }

  void set_always_fail(bool v) {
    std::lock_guard<std::mutex> lock(mutex_);
    always_fail_ = v;
  }

  std::shared_ptr<FakeLink> link(std::size_t i) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return i < links_.size() ? links_[i] : nullptr;
  }

  int attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_;
  }

 private:
  mutable std::mutex mutex_;
  int failures_left_;
  bool always_fail_{false};
  int attempts_{0};
  std::vector<std::shared_ptr<FakeLink>> links_;
};

class FakeClipboard final : public clipsync::platform::ClipboardAccessor {
 public:
  bool Read(std::string& out, std::string& error) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_reads_) {
      error = "no display";
      return false;
    }
    out = value_;
    return true;
  }

  bool Write(const std::string& text, std::string& error) override {
    std::lock_guard<std::mutex> lock(mutex_);
    (void)error;
    value_ = text;
    writes_.push_back(text);
    return true;
  }

  void Set(const std::string& v) {
    std::lock_guard<std::mutex> lock(mutex_);
    value_ = v;
  }

  void set_fail_reads(bool v) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_reads_ = v;
  }

  std::vector<std::string> writes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
  }

 private:
  mutable std::mutex mutex_;
  std::string value_;
  std::vector<std::string> writes_;
  bool fail_reads_{false};
};

AgentOptions QuietOptions() {
  AgentOptions o;
  o.poll_interval_ms = 60000;
  o.ping_period_ms = 60000;
  o.pong_wait_ms = 120000;
  o.backoff_initial_ms = 10;
  o.backoff_max_ms = 40;
  return o;
}

std::size_t SentUpdates(const FakeLink& link) {
  return link.SentOf(proto::EventType::kClipboardUpdate).size();
}

}  // namespace

int main() {
  {
    // Not connected: local changes and actions fail cleanly.
    auto clipboard = std::make_shared<FakeClipboard>();
    SyncAgent agent(QuietOptions(), std::make_shared<FakeConnector>(0), clipboard);
    clipboard->Set("offline");
    agent.PollClipboardOnce();
    assert(agent.last_sent().empty());
    std::string err;
    assert(!agent.RequestDevices(err));
    assert(err == "not connected");
    assert(!agent.AcceptPendingOffer(err));
    assert(agent.state() == ConnectionState::kDisconnected);
  }

  {
    auto connector = std::make_shared<FakeConnector>(0);
    auto clipboard = std::make_shared<FakeClipboard>();
    SyncAgent agent(QuietOptions(), connector, clipboard);
    std::mutex seen_mutex;
    int notifications = 0;
    agent.SetObserver([&](const AgentStatus&) {
      std::lock_guard<std::mutex> lock(seen_mutex);
      ++notifications;
    });

    std::string err;
    assert(agent.Start(err));
    assert(!agent.Start(err));
    assert(Eventually([&] { return agent.state() == ConnectionState::kConnected; }));
    auto link = connector->link(0);
    assert(link);
    assert(Eventually([&] {
      return link->SentOf(proto::EventType::kRequestDevices).size() == 1;
    }));

    // A local change is sent once and remembered.
    clipboard->Set("local-1");
    agent.PollClipboardOnce();
    assert(SentUpdates(*link) == 1);
    assert(agent.last_sent() == "local-1");
    agent.PollClipboardOnce();
    assert(SentUpdates(*link) == 1);

    // An empty clipboard is never sent.
    clipboard->Set("");
    agent.PollClipboardOnce();
    assert(SentUpdates(*link) == 1);

    // A failing clipboard read is tolerated.
    clipboard->set_fail_reads(true);
    agent.PollClipboardOnce();
    clipboard->set_fail_reads(false);
    clipboard->Set("local-1");

    // The hub echoing our own value lands in history, not in the clipboard.
    link->Deliver(proto::ClipboardUpdate{"local-1"}, "dev-other");
    assert(Eventually([&] { return agent.last_received() == "local-1"; }));
    assert(clipboard->writes().empty());
    assert(agent.Status().history.size() == 1);

    // A remote value is written locally and not bounced back.
    link->Deliver(proto::ClipboardUpdate{"remote-1"}, "dev-other");
    assert(Eventually([&] { return clipboard->writes().size() == 1; }));
    assert(clipboard->writes()[0] == "remote-1");
    assert(agent.last_received() == "remote-1");
    agent.PollClipboardOnce();
    assert(SentUpdates(*link) == 1);

    // With sync off nothing is written or sent, but history still moves.
    agent.SetSyncEnabled(false);
    link->Deliver(proto::ClipboardUpdate{"remote-2"}, "dev-other");
    assert(Eventually([&] { return agent.last_received() == "remote-2"; }));
    assert(clipboard->writes().size() == 1);
    clipboard->Set("local-2");
    agent.PollClipboardOnce();
    assert(SentUpdates(*link) == 1);
    agent.SetSyncEnabled(true);
    agent.PollClipboardOnce();
    assert(SentUpdates(*link) == 2);
    assert(agent.last_sent() == "local-2");
    {
      const auto history = agent.Status().history;
      assert(history.size() == 3);
      assert(history[0] == "remote-2");
      assert(history[2] == "local-1");
    }

    // History replacement is capped at 20, updates keep the cap.
    {
      proto::ClipboardHistory h;
      for (int i = 0; i < 25; ++i) {
        h.history.push_back("h" + std::to_string(i));
      }
      link->Deliver(h);
      assert(Eventually([&] { return agent.Status().history.size() == 20; }));
      assert(agent.Status().history[0] == "h0");
      link->Deliver(proto::ClipboardUpdate{"newest"}, "dev-other");
      assert(Eventually([&] { return agent.last_received() == "newest"; }));
      const auto history = agent.Status().history;
      assert(history.size() == 20);
      assert(history[0] == "newest");
      assert(history[19] == "h18");
    }

    // Offers are labelled from the device list and answered with file_ack.
    link->Deliver(proto::DeviceList{{{"dev-self", "me"}, {"dev-b", "beta"}}});
    assert(Eventually([&] { return agent.Status().devices.size() == 2; }));
    link->Deliver(proto::FileOffer{"x.txt", 100, "dev-self"}, "dev-b");
    assert(Eventually([&] { return agent.Status().pending_offer.has_value(); }));
    {
      const auto offer = *agent.Status().pending_offer;
      assert(offer.filename == "x.txt");
      assert(offer.filesize == 100);
      assert(offer.offering_device_id == "dev-b");
      assert(offer.offering_hostname == "beta");
    }
    assert(agent.AcceptPendingOffer(err));
    assert(!agent.Status().pending_offer);
    assert(!agent.AcceptPendingOffer(err));
    {
      const auto acks = link->SentOf(proto::EventType::kFileAck);
      assert(acks.size() == 1);
      const auto& ack = std::get<proto::FileAck>(acks[0].payload);
      assert(ack.allow);
      assert(ack.filename == "x.txt");
      assert(ack.source_id == "dev-b");
    }

    link->Deliver(proto::FileOffer{"first.bin", 1, ""}, "dev-b");
    link->Deliver(proto::FileOffer{"second.bin", 2, ""}, "dev-unknown");
    assert(Eventually([&] {
      const auto s = agent.Status();
      return s.pending_offer && s.pending_offer->filename == "second.bin";
    }));
    assert(agent.Status().pending_offer->offering_hostname == "Unknown");
    assert(agent.RejectPendingOffer(err));
    {
      const auto acks = link->SentOf(proto::EventType::kFileAck);
      assert(acks.size() == 2);
      const auto& ack = std::get<proto::FileAck>(acks[1].payload);
      assert(!ack.allow);
      assert(ack.source_id == "dev-unknown");
    }

    link->Deliver(proto::FileAck{"mine.txt", true, "dev-self"}, "dev-b");
    assert(Eventually([&] {
      return agent.Status().last_notice == "beta accepted mine.txt";
    }));

    assert(agent.OfferFile("dev-b", "report.pdf", 2048, err));
    assert(!agent.OfferFile("dev-b", "", 1, err));
    assert(!agent.OfferFile("dev-b", "neg", -1, err));
    {
      const auto offers = link->SentOf(proto::EventType::kFileOffer);
      assert(offers.size() == 1);
      const auto& offer = std::get<proto::FileOffer>(offers[0].payload);
      assert(offer.target_id == "dev-b");
      assert(offer.filesize == 2048);
    }

    // A dropped connection cancels the attempt and a fresh link is dialled.
    link->Drop();
    assert(Eventually([&] { return link->closed(); }));
    assert(Eventually([&] { return connector->link(1) != nullptr; }));
    auto second = connector->link(1);
    assert(Eventually([&] { return agent.state() == ConnectionState::kConnected; }));
    assert(Eventually([&] {
      return second->SentOf(proto::EventType::kRequestDevices).size() == 1;
    }));
    assert(agent.Status().last_error.empty());
    clipboard->Set("after-reconnect");
    agent.PollClipboardOnce();
    assert(SentUpdates(*second) == 1);
    assert(SentUpdates(*link) == 2);

    agent.Stop();
    assert(second->closed());
    assert(agent.state() == ConnectionState::kDisconnected);
    std::lock_guard<std::mutex> lock(seen_mutex);
    assert(notifications > 0);
  }

  {
    // Repeated failures: connecting/disconnected alternate with a doubling,
    // capped delay; the agent never gives up.
    auto connector = std::make_shared<FakeConnector>(0);
    connector->set_always_fail(true);
    auto clipboard = std::make_shared<FakeClipboard>();
    SyncAgent agent(QuietOptions(), connector, clipboard);
    std::mutex mutex;
    std::vector<ConnectionState> states;
    std::vector<std::uint32_t> delays;
    agent.SetObserver([&](const AgentStatus& s) {
      std::lock_guard<std::mutex> lock(mutex);
      if (states.empty() || states.back() != s.state) {
        states.push_back(s.state);
      }
      if (s.state == ConnectionState::kDisconnected && s.next_retry_ms != 0) {
        delays.push_back(s.next_retry_ms);
      }
    });
    std::string err;
    assert(agent.Start(err));
    assert(Eventually([&] { return connector->attempts() >= 5; }));
    {
      std::lock_guard<std::mutex> lock(mutex);
      assert(delays.size() >= 4);
      assert(delays[0] == 10);
      assert(delays[1] == 20);
      assert(delays[2] == 40);
      assert(delays[3] == 40);
      assert(states[0] == ConnectionState::kConnecting);
      assert(states[1] == ConnectionState::kDisconnected);
      assert(states[2] == ConnectionState::kConnecting);
      assert(states[3] == ConnectionState::kDisconnected);
    }
    assert(agent.Status().last_error == "connection refused");

    // Recovery resets the delay.
    connector->set_always_fail(false);
    assert(Eventually([&] { return agent.state() == ConnectionState::kConnected; }));
    connector->link(0)->Drop();
    assert(Eventually([&] { return connector->link(1) != nullptr; }));
    {
      std::lock_guard<std::mutex> lock(mutex);
      bool saw_reset = false;
      for (std::size_t i = 1; i < delays.size(); ++i) {
        if (delays[i] == 10 && delays[i - 1] == 40) {
          saw_reset = true;
        }
      }
      assert(saw_reset);
    }
    const auto stop_started = std::chrono::steady_clock::now();
    agent.Stop();
    assert(std::chrono::steady_clock::now() - stop_started < std::chrono::seconds(2));
  }

  return 0;
}

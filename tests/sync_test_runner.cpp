#include <asio.hpp>

#include "discovery_transport.hpp"
#include "persistent_transport.hpp"
#include "protocol.hpp"
#include "sync_coordinator.hpp"
#include "test_runner_utils.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace clipsync::test;
using namespace std::chrono_literals;

namespace {

DiscoveryTransport::Options loopback_udp(uint16_t port, std::vector<uint16_t> fanout) {
  DiscoveryTransport::Options o;
  o.port = port;
  o.broadcast_ports = std::move(fanout);
  o.extra_addresses = {"127.0.0.1"};
  o.use_global_broadcast = false;
  o.use_subnet_broadcast = false;
  o.listen_ip = "127.0.0.1";
  o.bind_attempts = 1;
  o.heartbeat_interval = 200ms;
  o.sweep_interval = 100ms;
  o.join_timeout = 2000ms;
  return o;
}

SyncCoordinator::Options udp_node(const std::string& name, uint16_t port, uint16_t base) {
  SyncCoordinator::Options o;
  o.identity = DeviceIdentity{name, "127.0.0.1", "Linux"};
  o.transport = TransportKind::Udp;
  o.udp = loopback_udp(port, {base, static_cast<uint16_t>(base + 1)});
  return o;
}

SyncCoordinator::Options ws_node(const std::string& name, uint16_t port, const std::string& bootstrap) {
  SyncCoordinator::Options o;
  o.identity = DeviceIdentity{name, "127.0.0.1", "Linux"};
  o.transport = TransportKind::WebSocket;
  o.websocket.port = port;
  o.websocket.bind_attempts = 1;
  o.websocket.enable_discovery = false;
  o.websocket.bootstrap_peer = bootstrap;
  o.websocket.join_timeout = 2000ms;
  return o;
}

struct Received {
  std::mutex m;
  std::vector<std::pair<ClipboardPayload, std::string>> items;

  SyncCoordinator::ClipboardCallback callback() {
    return [this](const ClipboardPayload& p, const std::string& from){
      std::lock_guard lg(m);
      items.emplace_back(p, from);
    };
  }
  std::size_t size() {
    std::lock_guard lg(m);
    return items.size();
  }
};

// Minimal WebSocket client speaking the node protocol by hand, so a test can
// drop the TCP connection without a close handshake.
class RawWebSocketPeer {
public:
  bool connect(uint16_t port, const std::string& hello) {
    asio::error_code ec;
    socket_.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), port), ec);
    if(ec) return false;
    const std::string request =
      "GET / HTTP/1.1\r\n"
      "Host: 127.0.0.1:" + std::to_string(port) + "\r\n"
      "Upgrade: websocket\r\n"
      "Connection: Upgrade\r\n"
      "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
      "Sec-WebSocket-Version: 13\r\n"
      "Sec-WebSocket-Protocol: " + std::string(PersistentTransport::kProtocolName) + "\r\n\r\n";
    asio::write(socket_, asio::buffer(request), ec);
    if(ec) return false;
    asio::streambuf response;
    asio::read_until(socket_, response, "\r\n\r\n", ec);
    if(ec) return false;
    std::string head(asio::buffers_begin(response.data()), asio::buffers_end(response.data()));
    if(head.find(" 101 ") == std::string::npos) return false;
    return send_text(hello);
  }

  // Client frames are masked; FIN set, text opcode.
  bool send_text(const std::string& payload) {
    std::string frame;
    frame.push_back(static_cast<char>(0x81));
    if(payload.size() < 126) {
      frame.push_back(static_cast<char>(0x80 | payload.size()));
    } else {
      frame.push_back(static_cast<char>(0x80 | 126));
      frame.push_back(static_cast<char>((payload.size() >> 8) & 0xff));
      frame.push_back(static_cast<char>(payload.size() & 0xff));
    }
    const unsigned char mask[4] = {0x12, 0x34, 0x56, 0x78};
    for(unsigned char m : mask) frame.push_back(static_cast<char>(m));
    for(std::size_t i = 0; i < payload.size(); ++i) {
      frame.push_back(static_cast<char>(static_cast<unsigned char>(payload[i]) ^ mask[i % 4]));
    }
    asio::error_code ec;
    asio::write(socket_, asio::buffer(frame), ec);
    return !ec;
  }

  // Resets the connection: no close frame, no FIN.
  void cut() {
    asio::error_code ec;
    socket_.set_option(asio::socket_base::linger(true, 0), ec);
    socket_.close(ec);
  }

private:
  asio::io_context io_;
  asio::ip::tcp::socket socket_{io_};
};

// Throws a non-standard value on the first packet, then counts.
class FaultySink : public PacketSink {
public:
  void on_packet(const Packet&) override {
    if(calls++ == 0) throw 42;
  }
  std::atomic<int> calls{0};
};

bool sees(SyncCoordinator& node, const std::string& id) {
  return node.registry()->contains(id);
}

bool test_udp_discovery(TestContext& ctx) {
  const uint16_t base = test_port_base();
  auto a_log = std::make_shared<Logger>("node-a");
  ctx.logs.attach(a_log);
  SyncCoordinator a(udp_node("node-a", base, base), a_log);
  SyncCoordinator b(udp_node("node-b", base + 1, base));
  a.start();
  b.start();

  bool ok = check(wait_for_condition([&]{ return sees(a, "node-b@127.0.0.1") && sees(b, "node-a@127.0.0.1"); }, 3000ms),
                  "nodes did not discover each other");
  ok = check(!sees(a, "node-a@127.0.0.1"), "node lists itself") && ok;
  auto peer = a.registry()->find("node-b@127.0.0.1");
  ok = check(peer && peer->transport_port == base + 1, "advertised port recorded") && ok;

  b.stop();
  a.stop();
  return ok;
}

bool test_udp_clipboard_exchange(TestContext&) {
  const uint16_t base = test_port_base() + 2;
  SyncCoordinator a(udp_node("node-a", base, base));
  SyncCoordinator b(udp_node("node-b", base + 1, base));
  Received got;
  b.set_clipboard_callback(got.callback());
  a.start();
  b.start();
  wait_for_condition([&]{ return sees(a, "node-b@127.0.0.1"); }, 3000ms);

  a.on_local_capture(text_payload("shared over udp", 0.0, ""));
  bool ok = check(wait_for_condition([&]{ return got.size() == 1; }, 3000ms), "payload not received");
  std::this_thread::sleep_for(300ms);
  ok = check(got.size() == 1, "callback fired " + std::to_string(got.size()) + " times") && ok;
  {
    std::lock_guard lg(got.m);
    ok = check(!got.items.empty() && got.items[0].first.content == "shared over udp" &&
               got.items[0].first.device_name == "node-a" &&
               got.items[0].second == "node-a@127.0.0.1", "payload fields") && ok;
  }
  ok = check(b.history().size() == 1, "receiver history") && ok;

  b.stop();
  a.stop();
  return ok;
}

bool test_udp_device_times_out_once(TestContext&) {
  const uint16_t base = test_port_base() + 4;
  auto a_opts = udp_node("node-a", base, base);
  a_opts.device_timeout = 600ms;
  SyncCoordinator a(a_opts);
  SyncCoordinator b(udp_node("node-b", base + 1, base));
  EventRecorder events;
  a.subscribe_device_events(events.observer());
  a.start();
  b.start();

  bool ok = check(wait_for_condition([&]{ return sees(a, "node-b@127.0.0.1"); }, 3000ms), "b never seen");
  std::this_thread::sleep_for(900ms);
  ok = check(sees(a, "node-b@127.0.0.1"), "heartbeats keep b present") && ok;

  b.stop();
  ok = check(wait_for_condition([&]{ return events.count(DeviceEventKind::Left, "node-b@127.0.0.1") == 1; }, 3000ms),
             "no left event after b stopped") && ok;
  std::this_thread::sleep_for(500ms);
  ok = check(events.count(DeviceEventKind::Left, "node-b@127.0.0.1") == 1, "left fired more than once") && ok;
  ok = check(events.count(DeviceEventKind::Joined, "node-b@127.0.0.1") == 1, "joined fired more than once") && ok;
  a.stop();
  return ok;
}

bool test_udp_bind_next_free_port(TestContext&) {
  const uint16_t base = test_port_base() + 6;
  const DeviceIdentity id{"busy-port", "127.0.0.1", "Linux"};

  auto first_opts = loopback_udp(base, {base});
  first_opts.announce_on_start = false;
  DiscoveryTransport first(first_opts, id, nullptr);
  first.start();

  auto second_opts = first_opts;
  second_opts.bind_attempts = 3;
  DiscoveryTransport second(second_opts, id, nullptr);
  second.start();
  bool ok = check(second.bound_port() == base + 1, "second node moved to the next port");
  ok = check(second.state() == DiscoveryTransport::State::Listening, "second listening") && ok;

  auto third_opts = first_opts;
  third_opts.bind_attempts = 2;
  DiscoveryTransport third(third_opts, id, nullptr);
  bool threw = false;
  try {
    third.start();
  } catch(const TransportError&) {
    threw = true;
  }
  ok = check(threw, "exhausted ports should throw") && ok;
  ok = check(third.state() == DiscoveryTransport::State::Stopped, "failed transport is stopped") && ok;

  second.stop();
  first.stop();
  ok = check(first.state() == DiscoveryTransport::State::Stopped, "stop reaches Stopped") && ok;
  return ok;
}

bool test_udp_receive_survives_faulty_sink(TestContext& ctx) {
  const uint16_t base = test_port_base() + 10;
  auto logger = std::make_shared<Logger>("receiver");
  ctx.logs.attach(logger);
  DiscoveryTransport receiver(loopback_udp(base, {base}), DeviceIdentity{"receiver", "127.0.0.1", "Linux"},
                              nullptr, logger);
  FaultySink sink;
  receiver.set_sink(&sink);
  receiver.start();

  DiscoveryTransport sender(loopback_udp(base + 1, {base}), DeviceIdentity{"sender", "127.0.0.1", "Linux"}, nullptr);
  sender.start();  // announce + discover
  bool ok = check(wait_for_condition([&]{ return sink.calls.load() >= 2; }, 3000ms), "first packets not delivered");
  sender.broadcast(make_clipboard_packet(DeviceIdentity{"sender", "127.0.0.1"}, text_payload("still alive", 1.0, "sender")));
  ok = check(wait_for_condition([&]{ return sink.calls.load() >= 3; }, 3000ms),
             "receive loop stopped after the sink threw") && ok;
  ok = check(receiver.state() == DiscoveryTransport::State::Listening, "receiver still listening") && ok;
  ok = check(ctx.logs.contains("unknown exception"), "non-standard throw logged") && ok;

  sender.stop();
  receiver.stop();
  return ok;
}

bool test_udp_presence_without_sink(TestContext&) {
  const uint16_t base = test_port_base() + 12;
  auto a_opts = loopback_udp(base, {base, static_cast<uint16_t>(base + 1)});
  a_opts.heartbeat_interval = 10000ms;  // only the discover reply can reach b in time
  auto b_opts = loopback_udp(base + 1, {base, static_cast<uint16_t>(base + 1)});
  b_opts.heartbeat_interval = 10000ms;
  DiscoveryTransport a(a_opts, DeviceIdentity{"node-a", "127.0.0.1", "Linux"}, nullptr);
  DiscoveryTransport b(b_opts, DeviceIdentity{"node-b", "127.0.0.1", "Linux"}, nullptr);
  a.start();
  b.start();

  bool ok = check(wait_for_condition([&]{ return a.registry()->contains("node-b@127.0.0.1"); }, 3000ms),
                  "a did not record b's announce");
  ok = check(wait_for_condition([&]{ return b.registry()->contains("node-a@127.0.0.1"); }, 3000ms),
             "a did not answer b's discover") && ok;
  auto found = b.registry()->find("node-a@127.0.0.1");
  ok = check(found && found->transport_port == base, "reply carries a's port") && ok;

  b.stop();
  a.stop();
  return ok;
}

bool test_ws_disconnect_removes_device(TestContext&) {
  const uint16_t base = test_port_base() + 8;
  const std::string seed = "127.0.0.1:" + std::to_string(base);
  SyncCoordinator a(ws_node("node-a", base, ""));
  EventRecorder events;
  a.subscribe_device_events(events.observer());
  a.start();
  SyncCoordinator b(ws_node("node-b", base + 100, seed));
  SyncCoordinator c(ws_node("node-c", base + 101, seed));
  b.start();
  c.start();

  bool ok = check(wait_for_condition([&]{
    return sees(a, "node-b@127.0.0.1") && sees(a, "node-c@127.0.0.1");
  }, 5000ms), "a did not register b and c");
  ok = check(wait_for_condition([&]{ return sees(b, "node-a@127.0.0.1"); }, 5000ms), "b did not register a") && ok;

  b.stop();
  ok = check(wait_for_condition([&]{ return events.count(DeviceEventKind::Left, "node-b@127.0.0.1") == 1; }, 5000ms),
             "no left event for b") && ok;
  std::this_thread::sleep_for(300ms);
  ok = check(events.count(DeviceEventKind::Left) == 1, "only b left") && ok;
  ok = check(sees(a, "node-c@127.0.0.1"), "c still connected") && ok;

  c.stop();
  a.stop();
  return ok;
}

bool test_ws_clipboard_exchange(TestContext&) {
  const uint16_t base = test_port_base() + 150;
  SyncCoordinator a(ws_node("node-a", base, ""));
  SyncCoordinator b(ws_node("node-b", base + 1, "127.0.0.1:" + std::to_string(base)));
  Received at_a;
  Received at_b;
  a.set_clipboard_callback(at_a.callback());
  b.set_clipboard_callback(at_b.callback());
  a.start();
  b.start();

  bool ok = check(wait_for_condition([&]{ return sees(a, "node-b@127.0.0.1") && sees(b, "node-a@127.0.0.1"); }, 5000ms),
                  "connection not established");

  ClipboardPayload image;
  image.kind = ClipboardKind::Image;
  image.content.assign(200000, '\x7f');
  b.on_local_capture(image);
  a.on_local_capture(text_payload("over websocket", 0.0, ""));

  ok = check(wait_for_condition([&]{ return at_a.size() == 1 && at_b.size() == 1; }, 5000ms), "payloads not delivered") && ok;
  {
    std::lock_guard lg(at_a.m);
    ok = check(!at_a.items.empty() && at_a.items[0].first.kind == ClipboardKind::Image &&
               at_a.items[0].first.content.size() == 200000, "image arrived intact") && ok;
  }
  {
    std::lock_guard lg(at_b.m);
    ok = check(!at_b.items.empty() && at_b.items[0].first.content == "over websocket", "text arrived") && ok;
  }
  ok = check(a.stats().transport == TransportKind::WebSocket, "websocket transport selected") && ok;

  b.stop();
  a.stop();
  return ok;
}

bool test_ws_broken_peer_dropped_on_send(TestContext&) {
  const uint16_t base = test_port_base() + 160;
  SyncCoordinator a(ws_node("node-a", base, ""));
  SyncCoordinator b(ws_node("node-b", base + 1, "127.0.0.1:" + std::to_string(base)));
  EventRecorder events;
  a.subscribe_device_events(events.observer());
  Received at_b;
  b.set_clipboard_callback(at_b.callback());
  a.start();
  b.start();
  bool ok = check(wait_for_condition([&]{ return sees(a, "node-b@127.0.0.1"); }, 5000ms), "b not connected");

  RawWebSocketPeer raw;
  const DeviceIdentity raw_id{"node-raw", "127.0.0.1", "Linux"};
  ok = check(raw.connect(a.transport().bound_port(), encode_packet(make_device_info(raw_id, 0))),
             "raw peer handshake failed") && ok;
  ok = check(wait_for_condition([&]{ return sees(a, "node-raw@127.0.0.1"); }, 5000ms), "raw peer not registered") && ok;

  raw.cut();
  a.on_local_capture(text_payload("after the cut", 0.0, ""));

  ok = check(wait_for_condition([&]{ return events.count(DeviceEventKind::Left, "node-raw@127.0.0.1") == 1; }, 5000ms),
             "no left event for the broken peer") && ok;
  ok = check(wait_for_condition([&]{ return at_b.size() == 1; }, 5000ms), "healthy peer missed the payload") && ok;
  std::this_thread::sleep_for(300ms);
  ok = check(events.count(DeviceEventKind::Left) == 1, "only the broken peer left") && ok;
  ok = check(sees(a, "node-b@127.0.0.1"), "b still connected") && ok;

  b.stop();
  a.stop();
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"udp_discovery", test_udp_discovery},
    {"udp_clipboard_exchange", test_udp_clipboard_exchange},
    {"udp_device_times_out_once", test_udp_device_times_out_once},
    {"udp_bind_next_free_port", test_udp_bind_next_free_port},
    {"udp_receive_survives_faulty_sink", test_udp_receive_survives_faulty_sink},
    {"udp_presence_without_sink", test_udp_presence_without_sink},
    {"ws_disconnect_removes_device", test_ws_disconnect_removes_device},
    {"ws_clipboard_exchange", test_ws_clipboard_exchange},
    {"ws_broken_peer_dropped_on_send", test_ws_broken_peer_dropped_on_send}
  };
  return run_test_cases("sync", tests, argc, argv);
}

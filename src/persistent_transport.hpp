#pragma once
#include <libwebsockets.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "device_registry.hpp"
#include "discovery_transport.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "transport.hpp"
#include "utils.hpp"

// Side channel defaults: port 8766 moving upward when busy, fan-out to 8766..8770.
DiscoveryTransport::Options side_channel_options();

// Connection-oriented transport over WebSocket. Every node listens; the node
// with the smaller device id dials, so each pair shares one connection. Peer
// addresses come from a DiscoveryTransport side channel (or a bootstrap peer).
//
// Presence follows the connections: a device is registered when its
// device_info arrives and removed when its last connection closes.
class PersistentTransport : public Transport, private PacketSink {
public:
  struct Options {
    uint16_t port = 8765;
    int bind_attempts = 10;
    std::string bootstrap_peer;            // "host:port", optional
    bool enable_discovery = true;
    DiscoveryTransport::Options discovery = side_channel_options();
    uint16_t ping_after_idle_s = 20;
    uint16_t hangup_after_idle_s = 30;
    std::chrono::milliseconds join_timeout{5000};
    std::size_t max_message_bytes = 64 * 1024 * 1024;
  };

  static constexpr const char* kProtocolName = "clipsync";

  // `registry` receives device_info presence; give it a zero timeout.
  PersistentTransport(Options options,
                      DeviceIdentity identity,
                      std::shared_ptr<DeviceRegistry> registry,
                      std::shared_ptr<Logger> logger = nullptr);
  ~PersistentTransport() override;

  void start() override;
  void stop() override;

  void broadcast(const Packet& packet) override;
  void announce() override;
  void discover() override;

  void set_sink(PacketSink* sink) override { sink_.store(sink); }
  uint16_t bound_port() const override { return port_.load(); }
  TransportKind kind() const override { return TransportKind::WebSocket; }

  // Queues an outbound connection; safe from any thread.
  void dial(const std::string& host, uint16_t port);

  std::size_t connection_count() const;
  std::vector<std::string> connected_device_ids() const;
  // Devices heard on the side channel, connected or not.
  std::shared_ptr<DeviceRegistry> discovered() const { return discovered_; }

  static int lws_callback(struct lws* wsi,
                          enum lws_callback_reasons reason,
                          void* user, void* in, size_t len);

private:
  struct Session {
    bool outbound = false;
    std::string target;        // "host:port" for dialled sessions
    std::string device_id;     // set once device_info arrives
    std::deque<std::string> outbox;
    std::string rx;
    bool rx_overflow = false;
  };

  int handle_callback(struct lws* wsi, enum lws_callback_reasons reason, void* in, size_t len);

  void create_context();
  void service_loop();
  void service_pending();
  void open_session(struct lws* wsi, bool outbound);
  void close_session(struct lws* wsi);
  int receive_fragment(struct lws* wsi, const char* data, std::size_t len);
  void handle_message(struct lws* wsi, const std::string& text);
  int flush_one(struct lws* wsi);
  void queue_on(struct lws* wsi, std::string bytes);
  void wake();
  bool has_session_for(const std::string& device_id) const;

  // side channel
  void on_packet(const Packet& packet) override;
  bool should_dial(const std::string& remote_id) const;

  Options options_;
  DeviceIdentity identity_;
  std::shared_ptr<DeviceRegistry> registry_;
  std::shared_ptr<DeviceRegistry> discovered_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<DiscoveryTransport> discovery_;

  lws_retry_bo_t retry_{};
  struct lws_protocols protocols_[2]{};
  struct lws_context* context_ = nullptr;
  BackgroundThread service_thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stopped_{false};
  std::atomic<uint16_t> port_{0};
  std::atomic<PacketSink*> sink_{nullptr};

  mutable std::mutex sessions_mutex_;
  std::unordered_map<struct lws*, Session> sessions_;

  std::mutex dial_mutex_;
  std::vector<std::pair<std::string, uint16_t>> pending_dials_;
  // service thread only: targets with a connection attempt or session alive
  std::set<std::string> active_targets_;
  std::unordered_map<struct lws*, std::string> dialing_;
};

// Splits "host:port"; false when the port is missing or out of range.
bool parse_host_port(const std::string& text, std::string& host, uint16_t& port);

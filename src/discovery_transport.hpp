#pragma once
#include <asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "device_registry.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "transport.hpp"
#include "utils.hpp"

// Connectionless transport: every packet is a UDP datagram fanned out to the
// broadcast addresses on a set of well-known ports.
//
// Threads once listening: receive (asio read chain), heartbeat, sweep.
class DiscoveryTransport : public Transport {
public:
  enum class State { Init, Binding, Listening, Stopped };

  struct Options {
    uint16_t port = 5555;
    // Ports every datagram is also sent to, so nodes that had to bind upward
    // still hear each other.
    std::vector<uint16_t> broadcast_ports{5555, 5556, 5557, 5558, 5559};
    std::vector<std::string> extra_addresses;
    bool use_global_broadcast = true;
    bool use_subnet_broadcast = true;
    std::string listen_ip = "0.0.0.0";
    int bind_attempts = 10;
    bool reuse_address = false;
    // transport_port advertised in presence packets; 0 advertises the bound port
    uint16_t advertised_port = 0;
    bool announce_on_start = true;
    std::chrono::milliseconds heartbeat_interval{10000};
    std::chrono::milliseconds sweep_interval{2000};
    std::chrono::milliseconds join_timeout{5000};
  };

  static constexpr std::size_t kMaxDatagram = 65507;

  DiscoveryTransport(Options options,
                     DeviceIdentity identity,
                     std::shared_ptr<DeviceRegistry> registry,
                     std::shared_ptr<Logger> logger = nullptr);
  ~DiscoveryTransport() override;

  void start() override;
  void stop() override;

  void broadcast(const Packet& packet) override;
  void announce() override;
  void discover() override;

  // With a sink set, every packet goes to it and the sink owns presence
  // (registry upserts and discover replies). Without one the transport keeps
  // its own registry current and answers discover itself.
  void set_sink(PacketSink* sink) override { sink_.store(sink); }
  uint16_t bound_port() const override { return port_.load(); }
  TransportKind kind() const override { return TransportKind::Udp; }

  State state() const { return state_.load(); }
  std::vector<asio::ip::udp::endpoint> destinations() const;
  const std::shared_ptr<DeviceRegistry>& registry() const { return registry_; }

private:
  void bind_socket();
  void open_send_socket();
  void build_destinations();
  void do_receive();
  void handle_datagram(std::size_t length, const asio::ip::udp::endpoint& from);
  void handle_presence(const Packet& packet);
  void heartbeat_loop();
  void sweep_loop();
  bool wait_for_stop(std::chrono::milliseconds interval);
  void send_to_all(const std::string& bytes);
  void join_worker(BackgroundThread& worker);
  uint16_t presence_port() const;

  Options options_;
  DeviceIdentity identity_;
  std::shared_ptr<DeviceRegistry> registry_;
  std::shared_ptr<Logger> logger_;

  asio::io_context io_;
  asio::ip::udp::socket socket_;
  asio::ip::udp::endpoint remote_;
  std::array<char, 65536> recv_buf_{};

  mutable std::mutex send_mutex_;
  asio::ip::udp::socket send_socket_;
  std::vector<asio::ip::udp::endpoint> destinations_;

  BackgroundThread receive_thread_;
  BackgroundThread heartbeat_thread_;
  BackgroundThread sweep_thread_;

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::atomic<bool> running_{false};
  std::atomic<State> state_{State::Init};
  std::atomic<uint16_t> port_{0};
  std::atomic<PacketSink*> sink_{nullptr};
};

const char* discovery_state_name(DiscoveryTransport::State state);

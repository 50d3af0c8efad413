#include "discovery_transport.hpp"

#include <algorithm>
#include <exception>
#include <limits>

using udp = asio::ip::udp;

const char* discovery_state_name(DiscoveryTransport::State state) {
  switch(state) {
    case DiscoveryTransport::State::Init:      return "init";
    case DiscoveryTransport::State::Binding:   return "binding";
    case DiscoveryTransport::State::Listening: return "listening";
    case DiscoveryTransport::State::Stopped:   return "stopped";
  }
  return "unknown";
}

DiscoveryTransport::DiscoveryTransport(Options options,
                                       DeviceIdentity identity,
                                       std::shared_ptr<DeviceRegistry> registry,
                                       std::shared_ptr<Logger> logger)
: options_(std::move(options)),
  identity_(std::move(identity)),
  registry_(std::move(registry)),
  logger_(std::move(logger)),
  socket_(io_),
  send_socket_(io_)
{
  if(!registry_) {
    registry_ = std::make_shared<DeviceRegistry>(DeviceRegistry::kDefaultTimeout, logger_);
  }
}

DiscoveryTransport::~DiscoveryTransport() {
  stop();
}

void DiscoveryTransport::start() {
  State expected = State::Init;
  if(!state_.compare_exchange_strong(expected, State::Binding)) {
    if(expected == State::Listening) return;
    throw TransportError(std::string("discovery transport cannot start from state ") +
                         discovery_state_name(expected));
  }

  try {
    bind_socket();
    open_send_socket();
  } catch(const TransportError&) {
    std::error_code ec;
    socket_.close(ec);
    send_socket_.close(ec);
    state_ = State::Stopped;
    throw;
  }
  build_destinations();

  running_ = true;
  state_ = State::Listening;
  do_receive();

  receive_thread_.start("udp-receive", [this]{ io_.run(); });
  heartbeat_thread_.start("udp-heartbeat", [this]{ heartbeat_loop(); });
  sweep_thread_.start("udp-sweep", [this]{ sweep_loop(); });

  log_info(logger_.get(), "Listening for devices on UDP port {}", port_.load());

  if(options_.announce_on_start) {
    announce();
    discover();
  }
}

void DiscoveryTransport::bind_socket() {
  asio::error_code ec;
  auto address = asio::ip::make_address(options_.listen_ip, ec);
  if(ec) {
    throw TransportError("invalid listen address '" + options_.listen_ip + "'");
  }

  const int attempts = std::max(1, options_.bind_attempts);
  uint32_t candidate = options_.port;
  for(int attempt = 0; attempt < attempts; ++attempt, ++candidate) {
    if(candidate > std::numeric_limits<uint16_t>::max()) break;

    socket_.open(udp::v4(), ec);
    if(ec) throw TransportError("cannot open UDP socket: " + ec.message());
    if(options_.reuse_address) {
      socket_.set_option(udp::socket::reuse_address(true), ec);
    }
    socket_.bind(udp::endpoint(address, static_cast<uint16_t>(candidate)), ec);
    if(!ec) {
      port_ = socket_.local_endpoint().port();
      if(candidate != options_.port) {
        log_info(logger_.get(), "UDP port {} was busy, bound {} instead", options_.port, port_.load());
      }
      return;
    }

    asio::error_code close_ec;
    socket_.close(close_ec);
    if(ec != asio::error::address_in_use) {
      throw TransportError(fmt::format("cannot bind UDP port {}: {}", candidate, ec.message()));
    }
    log_debug(logger_.get(), "UDP port {} in use", candidate);
  }
  throw TransportError(fmt::format("no free UDP port in {}..{} after {} attempts",
                                   options_.port,
                                   options_.port + attempts - 1,
                                   attempts));
}

void DiscoveryTransport::open_send_socket() {
  asio::error_code ec;
  std::lock_guard lg(send_mutex_);
  send_socket_.open(udp::v4(), ec);
  if(ec) throw TransportError("cannot open UDP send socket: " + ec.message());
  send_socket_.set_option(asio::socket_base::broadcast(true), ec);
  if(ec) {
    log_warn(logger_.get(), "broadcast not permitted on send socket: {}", ec.message());
  }
}

void DiscoveryTransport::build_destinations() {
  std::vector<std::string> addresses;
  auto add_address = [&addresses](const std::string& a) {
    if(!a.empty() && std::find(addresses.begin(), addresses.end(), a) == addresses.end()) {
      addresses.push_back(a);
    }
  };
  if(options_.use_global_broadcast) add_address("255.255.255.255");
  if(options_.use_subnet_broadcast) {
    if(auto subnet = subnet_broadcast_for(identity_.ip)) add_address(*subnet);
  }
  for(const auto& extra : options_.extra_addresses) add_address(extra);

  std::vector<uint16_t> ports{port_.load()};
  for(auto p : options_.broadcast_ports) {
    if(p != 0 && std::find(ports.begin(), ports.end(), p) == ports.end()) ports.push_back(p);
  }

  std::vector<udp::endpoint> out;
  for(const auto& a : addresses) {
    asio::error_code ec;
    auto address = asio::ip::make_address_v4(a, ec);
    if(ec) {
      log_warn(logger_.get(), "ignoring broadcast address '{}': {}", a, ec.message());
      continue;
    }
    for(auto p : ports) out.emplace_back(address, p);
  }

  std::lock_guard lg(send_mutex_);
  destinations_ = std::move(out);
}

std::vector<udp::endpoint> DiscoveryTransport::destinations() const {
  std::lock_guard lg(send_mutex_);
  return destinations_;
}

void DiscoveryTransport::do_receive() {
  socket_.async_receive_from(
    asio::buffer(recv_buf_), remote_,
    [this](std::error_code ec, std::size_t length) {
      if(ec) {
        if(ec == asio::error::operation_aborted || !running_) return;
        log_debug(logger_.get(), "UDP receive error: {}", ec.message());
      } else {
        handle_datagram(length, remote_);
      }
      if(running_) do_receive();
    });
}

void DiscoveryTransport::handle_datagram(std::size_t length, const udp::endpoint& from) {
  Packet packet;
  std::string error;
  if(!decode_packet(std::string(recv_buf_.data(), length), packet, error)) {
    log_debug(logger_.get(), "dropped {} byte datagram from {}: {}",
              length, from.address().to_string(), error);
    return;
  }
  if(packet.sender_name == identity_.name && packet.sender_ip == identity_.ip) return;

  PacketSink* sink = sink_.load();
  if(!sink) {
    handle_presence(packet);
    return;
  }
  try {
    sink->on_packet(packet);
  } catch(const std::exception& e) {
    log_warn(logger_.get(), "handler for {} from {} threw: {}",
             packet_type_name(packet.type), packet.sender_id(), e.what());
  } catch(...) {
    log_warn(logger_.get(), "handler for {} from {} threw unknown exception",
             packet_type_name(packet.type), packet.sender_id());
  }
}

void DiscoveryTransport::handle_presence(const Packet& packet) {
  if(!is_presence_packet(packet.type)) return;
  registry_->upsert_from_packet(packet);
  if(packet.type == PacketType::Discover) announce();
}

bool DiscoveryTransport::wait_for_stop(std::chrono::milliseconds interval) {
  std::unique_lock lock(stop_mutex_);
  stop_cv_.wait_for(lock, interval, [this]{ return !running_; });
  return !running_;
}

void DiscoveryTransport::heartbeat_loop() {
  while(!wait_for_stop(options_.heartbeat_interval)) {
    broadcast(make_heartbeat(identity_, presence_port()));
  }
}

void DiscoveryTransport::sweep_loop() {
  while(!wait_for_stop(options_.sweep_interval)) {
    try {
      registry_->sweep(DeviceRegistry::Clock::now());
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "device sweep failed: {}", e.what());
    } catch(...) {
      log_warn(logger_.get(), "device sweep failed with unknown exception");
    }
  }
}

uint16_t DiscoveryTransport::presence_port() const {
  return options_.advertised_port != 0 ? options_.advertised_port : port_.load();
}

void DiscoveryTransport::broadcast(const Packet& packet) {
  if(!running_) return;
  std::string bytes;
  try {
    bytes = encode_packet(packet);
  } catch(const CodecError& e) {
    log_error(logger_.get(), "cannot encode {}: {}", packet_type_name(packet.type), e.what());
    return;
  }
  if(bytes.size() > kMaxDatagram) {
    log_warn(logger_.get(), "{} packet of {} bytes exceeds the datagram limit, not sent",
             packet_type_name(packet.type), bytes.size());
    return;
  }
  send_to_all(bytes);
}

void DiscoveryTransport::send_to_all(const std::string& bytes) {
  std::lock_guard lg(send_mutex_);
  if(!send_socket_.is_open()) return;
  for(const auto& dest : destinations_) {
    asio::error_code ec;
    send_socket_.send_to(asio::buffer(bytes), dest, 0, ec);
    if(ec) {
      log_debug(logger_.get(), "send to {}:{} failed: {}",
                dest.address().to_string(), dest.port(), ec.message());
    }
  }
}

void DiscoveryTransport::announce() {
  broadcast(make_announce(identity_, presence_port()));
}

void DiscoveryTransport::discover() {
  broadcast(make_discover(identity_, presence_port()));
}

void DiscoveryTransport::join_worker(BackgroundThread& worker) {
  if(!worker.joinable()) return;
  if(!worker.join_for(options_.join_timeout)) {
    log_warn(logger_.get(), "thread '{}' did not stop within {} ms, detached",
             worker.name(), options_.join_timeout.count());
  }
}

void DiscoveryTransport::stop() {
  {
    std::lock_guard lk(stop_mutex_);
    if(!running_) {
      State expected = State::Init;
      state_.compare_exchange_strong(expected, State::Stopped);
      return;
    }
    running_ = false;
  }
  stop_cv_.notify_all();

  // closing on the io thread cancels the pending receive and lets run() return
  asio::post(io_, [this]{
    asio::error_code ec;
    socket_.close(ec);
  });
  if(receive_thread_.joinable() && !receive_thread_.join_for(options_.join_timeout)) {
    log_warn(logger_.get(), "UDP receive loop did not stop within {} ms, detached",
             options_.join_timeout.count());
    io_.stop();
  }
  join_worker(heartbeat_thread_);
  join_worker(sweep_thread_);

  {
    std::lock_guard lg(send_mutex_);
    asio::error_code ec;
    send_socket_.close(ec);
  }
  state_ = State::Stopped;
  log_info(logger_.get(), "UDP transport on port {} stopped", port_.load());
}

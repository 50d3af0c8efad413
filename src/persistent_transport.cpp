#include "persistent_transport.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <exception>
#include <limits>

namespace {

constexpr std::size_t kRxChunkBytes = 65536;

void forward_lws_log(int level, const char* line) {
  std::string text(line ? line : "");
  while(!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();
  if(level & LLL_ERR) {
    log_warn(nullptr, "libwebsockets: {}", text);
  } else {
    log_debug(nullptr, "libwebsockets: {}", text);
  }
}

std::string bound_device_id(const Packet& packet, const DeviceInfoData& info) {
  const std::string& name = info.name.empty() ? packet.sender_name : info.name;
  const std::string& ip = info.ip.empty() ? packet.sender_ip : info.ip;
  return name + "@" + ip;
}

} // namespace

DiscoveryTransport::Options side_channel_options() {
  DiscoveryTransport::Options o;
  o.port = 8766;
  o.broadcast_ports = {8766, 8767, 8768, 8769, 8770};
  return o;
}

bool parse_host_port(const std::string& text, std::string& host, uint16_t& port) {
  auto colon = text.rfind(':');
  if(colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) return false;
  uint32_t value = 0;
  for(std::size_t i = colon + 1; i < text.size(); ++i) {
    if(!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
    value = value * 10 + static_cast<uint32_t>(text[i] - '0');
    if(value > std::numeric_limits<uint16_t>::max()) return false;
  }
  if(value == 0) return false;
  host = text.substr(0, colon);
  port = static_cast<uint16_t>(value);
  return true;
}

PersistentTransport::PersistentTransport(Options options,
                                         DeviceIdentity identity,
                                         std::shared_ptr<DeviceRegistry> registry,
                                         std::shared_ptr<Logger> logger)
: options_(std::move(options)),
  identity_(std::move(identity)),
  registry_(std::move(registry)),
  logger_(std::move(logger))
{
  if(!registry_) {
    registry_ = std::make_shared<DeviceRegistry>(std::chrono::milliseconds(0), logger_);
  }
  discovered_ = std::make_shared<DeviceRegistry>(DeviceRegistry::kDefaultTimeout,
                                                 logger_ ? logger_->child("discovered") : nullptr);
}

PersistentTransport::~PersistentTransport() {
  stop();
}

void PersistentTransport::start() {
  if(running_) return;
  if(stopped_) throw TransportError("WebSocket transport cannot be restarted");

  lws_set_log_level(LLL_ERR | LLL_WARN, forward_lws_log);

  protocols_[0].name = kProtocolName;
  protocols_[0].callback = &PersistentTransport::lws_callback;
  protocols_[0].per_session_data_size = 0;
  protocols_[0].rx_buffer_size = kRxChunkBytes;
  protocols_[1] = {};

  retry_.secs_since_valid_ping = options_.ping_after_idle_s;
  retry_.secs_since_valid_hangup = options_.hangup_after_idle_s;

  create_context();
  running_ = true;
  service_thread_.start("ws-service", [this]{ service_loop(); });
  log_info(logger_.get(), "WebSocket transport listening on port {}", port_.load());

  if(options_.enable_discovery) {
    auto side = options_.discovery;
    side.advertised_port = port_.load();
    discovery_ = std::make_unique<DiscoveryTransport>(
      side, identity_, discovered_, logger_ ? logger_->child("discovery") : nullptr);
    discovery_->set_sink(this);
    try {
      discovery_->start();
    } catch(const TransportError& e) {
      log_error(logger_.get(), "discovery side channel failed: {}", e.what());
      stop();
      throw;
    }
  }

  if(!options_.bootstrap_peer.empty()) {
    std::string host;
    uint16_t port = 0;
    if(parse_host_port(options_.bootstrap_peer, host, port)) {
      log_info(logger_.get(), "Dialling bootstrap peer {}", options_.bootstrap_peer);
      dial(host, port);
    } else {
      log_warn(logger_.get(), "ignoring bootstrap peer '{}', expected host:port", options_.bootstrap_peer);
    }
  }
}

void PersistentTransport::create_context() {
  const int attempts = std::max(1, options_.bind_attempts);
  uint32_t candidate = options_.port;
  for(int attempt = 0; attempt < attempts; ++attempt, ++candidate) {
    if(candidate > std::numeric_limits<uint16_t>::max()) break;

    struct lws_context_creation_info info;
    std::memset(&info, 0, sizeof(info));
    info.port = static_cast<int>(candidate);
    info.protocols = protocols_;
    info.gid = -1;
    info.uid = -1;
    info.user = this;
    info.retry_and_idle_policy = &retry_;
    info.options = LWS_SERVER_OPTION_FAIL_UPON_UNABLE_TO_BIND;

    struct lws_context* ctx = lws_create_context(&info);
    if(ctx) {
      uint16_t bound = static_cast<uint16_t>(candidate);
      if(bound == 0) {
        if(auto* vhost = lws_get_vhost_by_name(ctx, "default")) {
          bound = static_cast<uint16_t>(lws_get_vhost_listen_port(vhost));
        }
      }
      {
        std::lock_guard lg(dial_mutex_);
        context_ = ctx;
      }
      port_ = bound;
      if(candidate != options_.port) {
        log_info(logger_.get(), "WebSocket port {} was busy, bound {} instead", options_.port, bound);
      }
      return;
    }
    log_debug(logger_.get(), "WebSocket port {} unavailable", candidate);
  }
  throw TransportError(fmt::format("no free WebSocket port in {}..{} after {} attempts",
                                   options_.port, options_.port + attempts - 1, attempts));
}

void PersistentTransport::service_loop() {
  while(running_) {
    if(lws_service(context_, 50) < 0) {
      log_error(logger_.get(), "WebSocket service loop failed");
      break;
    }
  }
}

void PersistentTransport::wake() {
  std::lock_guard lg(dial_mutex_);
  if(context_) lws_cancel_service(context_);
}

void PersistentTransport::stop() {
  bool was_running = running_.exchange(false);
  stopped_ = true;
  if(discovery_) discovery_->stop();
  if(!was_running) return;

  wake();
  if(!service_thread_.join_for(options_.join_timeout)) {
    log_warn(logger_.get(), "WebSocket service thread did not stop within {} ms, detached",
             options_.join_timeout.count());
    std::lock_guard lg(dial_mutex_);
    context_ = nullptr;
    return;
  }

  struct lws_context* ctx = nullptr;
  {
    std::lock_guard lg(dial_mutex_);
    std::swap(ctx, context_);
    pending_dials_.clear();
  }
  // closes every live connection, each through close_session
  if(ctx) lws_context_destroy(ctx);

  std::vector<std::string> orphaned;
  {
    std::lock_guard lg(sessions_mutex_);
    for(const auto& entry : sessions_) {
      if(!entry.second.device_id.empty()) orphaned.push_back(entry.second.device_id);
    }
    sessions_.clear();
  }
  for(const auto& id : orphaned) registry_->remove(id);
  active_targets_.clear();
  dialing_.clear();
  log_info(logger_.get(), "WebSocket transport on port {} stopped", port_.load());
}

int PersistentTransport::lws_callback(struct lws* wsi,
                                      enum lws_callback_reasons reason,
                                      void* /*user*/, void* in, size_t len) {
  if(!wsi) return 0;
  struct lws_context* ctx = lws_get_context(wsi);
  auto* self = ctx ? static_cast<PersistentTransport*>(lws_context_user(ctx)) : nullptr;
  if(!self) return 0;
  return self->handle_callback(wsi, reason, in, len);
}

int PersistentTransport::handle_callback(struct lws* wsi,
                                         enum lws_callback_reasons reason,
                                         void* in, size_t len) {
  switch(reason) {
    case LWS_CALLBACK_ESTABLISHED:
      open_session(wsi, false);
      break;

    case LWS_CALLBACK_CLIENT_ESTABLISHED:
      open_session(wsi, true);
      break;

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
      auto it = dialing_.find(wsi);
      log_debug(logger_.get(), "connection to {} failed: {}",
                it != dialing_.end() ? it->second : std::string("peer"),
                in ? static_cast<const char*>(in) : "unknown error");
      if(it != dialing_.end()) {
        active_targets_.erase(it->second);
        dialing_.erase(it);
      }
      break;
    }

    case LWS_CALLBACK_RECEIVE:
    case LWS_CALLBACK_CLIENT_RECEIVE:
      return receive_fragment(wsi, static_cast<const char*>(in), len);

    case LWS_CALLBACK_SERVER_WRITEABLE:
    case LWS_CALLBACK_CLIENT_WRITEABLE:
      return flush_one(wsi);

    case LWS_CALLBACK_CLOSED:
    case LWS_CALLBACK_CLIENT_CLOSED:
      close_session(wsi);
      break;

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED:
      service_pending();
      break;

    default:
      break;
  }
  return 0;
}

void PersistentTransport::service_pending() {
  std::vector<std::pair<std::string, uint16_t>> dials;
  struct lws_context* ctx = nullptr;
  {
    std::lock_guard lg(dial_mutex_);
    dials.swap(pending_dials_);
    ctx = context_;
  }
  for(const auto& [host, port] : dials) {
    if(!running_ || !ctx) break;
    auto target = fmt::format("{}:{}", host, port);
    if(active_targets_.count(target)) continue;

    struct lws_client_connect_info ci;
    std::memset(&ci, 0, sizeof(ci));
    ci.context = ctx;
    ci.address = host.c_str();
    ci.port = port;
    ci.path = "/";
    ci.host = ci.address;
    ci.origin = ci.address;
    ci.protocol = kProtocolName;
    ci.local_protocol_name = kProtocolName;
    ci.retry_and_idle_policy = &retry_;

    struct lws* wsi = lws_client_connect_via_info(&ci);
    if(!wsi) {
      log_debug(logger_.get(), "cannot dial {}", target);
      continue;
    }
    log_debug(logger_.get(), "dialling {}", target);
    active_targets_.insert(target);
    dialing_[wsi] = target;
  }

  std::vector<struct lws*> writable;
  {
    std::lock_guard lg(sessions_mutex_);
    for(const auto& entry : sessions_) {
      if(!entry.second.outbox.empty()) writable.push_back(entry.first);
    }
  }
  for(auto* wsi : writable) lws_callback_on_writable(wsi);
}

void PersistentTransport::open_session(struct lws* wsi, bool outbound) {
  Session session;
  session.outbound = outbound;
  if(outbound) {
    auto it = dialing_.find(wsi);
    if(it != dialing_.end()) session.target = it->second;
  }
  try {
    session.outbox.push_back(encode_packet(make_device_info(identity_, port_.load())));
  } catch(const CodecError& e) {
    log_error(logger_.get(), "cannot encode device_info: {}", e.what());
  }

  char peer[128] = {0};
  lws_get_peer_simple(wsi, peer, sizeof(peer));
  {
    std::lock_guard lg(sessions_mutex_);
    sessions_[wsi] = std::move(session);
  }
  log_info(logger_.get(), "WebSocket connection {} {}", outbound ? "to" : "from", peer);
  lws_callback_on_writable(wsi);
}

void PersistentTransport::close_session(struct lws* wsi) {
  std::string device_id;
  bool existed = false;
  {
    std::lock_guard lg(sessions_mutex_);
    auto it = sessions_.find(wsi);
    if(it != sessions_.end()) {
      device_id = std::move(it->second.device_id);
      sessions_.erase(it);
      existed = true;
    }
  }
  auto dial = dialing_.find(wsi);
  if(dial != dialing_.end()) {
    active_targets_.erase(dial->second);
    dialing_.erase(dial);
  }
  if(!existed) return;

  log_info(logger_.get(), "WebSocket connection {} closed",
           device_id.empty() ? std::string("(unidentified)") : device_id);
  if(!device_id.empty() && !has_session_for(device_id)) {
    registry_->remove(device_id);
  }
}

int PersistentTransport::receive_fragment(struct lws* wsi, const char* data, std::size_t len) {
  std::string message;
  {
    std::lock_guard lg(sessions_mutex_);
    auto it = sessions_.find(wsi);
    if(it == sessions_.end()) return 0;
    auto& s = it->second;
    if(lws_is_first_fragment(wsi)) {
      s.rx.clear();
      s.rx_overflow = false;
    }
    if(!s.rx_overflow && len > 0) {
      if(s.rx.size() + len > options_.max_message_bytes) {
        s.rx_overflow = true;
        s.rx.clear();
      } else {
        s.rx.append(data, len);
      }
    }
    if(!lws_is_final_fragment(wsi) || lws_remaining_packet_payload(wsi) != 0) return 0;
    if(s.rx_overflow) {
      s.rx_overflow = false;
      log_warn(logger_.get(), "dropped WebSocket message larger than {} bytes",
               options_.max_message_bytes);
      return 0;
    }
    message.swap(s.rx);
  }
  handle_message(wsi, message);
  return 0;
}

void PersistentTransport::handle_message(struct lws* wsi, const std::string& text) {
  Packet packet;
  std::string error;
  if(!decode_packet(text, packet, error)) {
    log_debug(logger_.get(), "dropped {} byte WebSocket message: {}", text.size(), error);
    return;
  }
  if(packet.sender_name == identity_.name && packet.sender_ip == identity_.ip) return;

  if(const auto* info = packet.device_info()) {
    const auto id = bound_device_id(packet, *info);
    std::string previous;
    {
      std::lock_guard lg(sessions_mutex_);
      auto it = sessions_.find(wsi);
      if(it == sessions_.end()) return;
      previous = it->second.device_id;
      it->second.device_id = id;
    }
    if(!previous.empty() && previous != id && !has_session_for(previous)) {
      registry_->remove(previous);
    }
    registry_->upsert_from_packet(packet);
    return;
  }

  if(packet.type != PacketType::ClipboardData) {
    log_debug(logger_.get(), "ignoring {} on WebSocket channel", packet_type_name(packet.type));
    return;
  }

  PacketSink* sink = sink_.load();
  if(!sink) return;
  try {
    sink->on_packet(packet);
  } catch(const std::exception& e) {
    log_warn(logger_.get(), "handler for clipboard from {} threw: {}", packet.sender_id(), e.what());
  } catch(...) {
    log_warn(logger_.get(), "handler for clipboard from {} threw unknown exception", packet.sender_id());
  }
}

int PersistentTransport::flush_one(struct lws* wsi) {
  std::string bytes;
  bool more = false;
  {
    std::lock_guard lg(sessions_mutex_);
    auto it = sessions_.find(wsi);
    if(it == sessions_.end() || it->second.outbox.empty()) return 0;
    bytes = std::move(it->second.outbox.front());
    it->second.outbox.pop_front();
    more = !it->second.outbox.empty();
  }

  std::vector<unsigned char> buf(LWS_PRE + bytes.size());
  std::memcpy(buf.data() + LWS_PRE, bytes.data(), bytes.size());
  int written = lws_write(wsi, buf.data() + LWS_PRE, bytes.size(), LWS_WRITE_TEXT);
  if(written < static_cast<int>(bytes.size())) {
    log_warn(logger_.get(), "WebSocket send of {} bytes failed, closing connection", bytes.size());
    return -1;
  }
  if(more) lws_callback_on_writable(wsi);
  return 0;
}

void PersistentTransport::queue_on(struct lws* wsi, std::string bytes) {
  std::lock_guard lg(sessions_mutex_);
  auto it = sessions_.find(wsi);
  if(it != sessions_.end()) it->second.outbox.push_back(std::move(bytes));
}

void PersistentTransport::broadcast(const Packet& packet) {
  if(!running_) return;
  std::string bytes;
  try {
    bytes = encode_packet(packet);
  } catch(const CodecError& e) {
    log_error(logger_.get(), "cannot encode {}: {}", packet_type_name(packet.type), e.what());
    return;
  }
  std::vector<struct lws*> targets;
  {
    std::lock_guard lg(sessions_mutex_);
    for(const auto& entry : sessions_) targets.push_back(entry.first);
  }
  if(targets.empty()) {
    log_debug(logger_.get(), "no open connections, {} not sent", packet_type_name(packet.type));
    return;
  }
  for(auto* wsi : targets) queue_on(wsi, bytes);
  wake();
}

void PersistentTransport::announce() {
  if(discovery_) discovery_->announce();
}

void PersistentTransport::discover() {
  if(discovery_) discovery_->discover();
  std::string host;
  uint16_t port = 0;
  if(!options_.bootstrap_peer.empty() && parse_host_port(options_.bootstrap_peer, host, port)) {
    dial(host, port);
  }
}

void PersistentTransport::dial(const std::string& host, uint16_t port) {
  if(!running_) return;
  {
    std::lock_guard lg(dial_mutex_);
    pending_dials_.emplace_back(host, port);
  }
  wake();
}

std::size_t PersistentTransport::connection_count() const {
  std::lock_guard lg(sessions_mutex_);
  return sessions_.size();
}

std::vector<std::string> PersistentTransport::connected_device_ids() const {
  std::vector<std::string> out;
  {
    std::lock_guard lg(sessions_mutex_);
    for(const auto& entry : sessions_) {
      if(!entry.second.device_id.empty()) out.push_back(entry.second.device_id);
    }
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

bool PersistentTransport::has_session_for(const std::string& device_id) const {
  std::lock_guard lg(sessions_mutex_);
  return std::any_of(sessions_.begin(), sessions_.end(),
                     [&](const auto& entry){ return entry.second.device_id == device_id; });
}

bool PersistentTransport::should_dial(const std::string& remote_id) const {
  return identity_.id() < remote_id && !has_session_for(remote_id);
}

void PersistentTransport::on_packet(const Packet& packet) {
  if(!is_presence_packet(packet.type)) return;
  discovered_->upsert_from_packet(packet);
  if(packet.type == PacketType::Discover && discovery_) discovery_->announce();

  const auto* presence = packet.presence();
  if(!presence || presence->transport_port == 0) return;
  if(should_dial(packet.sender_id())) dial(packet.sender_ip, presence->transport_port);
}

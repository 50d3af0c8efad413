#include "sync_coordinator.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

std::shared_ptr<Logger> child_of(const std::shared_ptr<Logger>& logger, const char* name) {
  return logger ? logger->child(name) : nullptr;
}

bool same_content(const ClipboardPayload& a, const ClipboardPayload& b) {
  return a.kind == b.kind && a.content == b.content;
}

std::string describe_payload(const ClipboardPayload& payload) {
  if(payload.kind == ClipboardKind::Image) {
    return fmt::format("image, {} bytes", payload.content.size());
  }
  constexpr std::size_t kPreview = 40;
  std::string preview = payload.content.substr(0, kPreview);
  for(auto& c : preview) {
    if(c == '\n' || c == '\r' || c == '\t') c = ' ';
  }
  return fmt::format("text \"{}{}\"", preview, payload.content.size() > kPreview ? "..." : "");
}

} // namespace

SyncCoordinator::SyncCoordinator(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>(options_.identity.name)),
    dedup_(options_.dedup_capacity) {
  if(options_.transport == TransportKind::WebSocket) {
    // presence ends with the connection, never by timeout
    registry_ = std::make_shared<DeviceRegistry>(std::chrono::milliseconds(0), child_of(logger_, "devices"));
    transport_ = std::make_unique<PersistentTransport>(options_.websocket, options_.identity,
                                                       registry_, child_of(logger_, "ws"));
  } else {
    registry_ = std::make_shared<DeviceRegistry>(options_.device_timeout, child_of(logger_, "devices"));
    transport_ = std::make_unique<DiscoveryTransport>(options_.udp, options_.identity,
                                                      registry_, child_of(logger_, "udp"));
  }
}

SyncCoordinator::SyncCoordinator(Options options,
                                 std::unique_ptr<Transport> transport,
                                 std::shared_ptr<DeviceRegistry> registry,
                                 std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>(options_.identity.name)),
    registry_(std::move(registry)),
    transport_(std::move(transport)),
    dedup_(options_.dedup_capacity) {
  if(!transport_) throw std::invalid_argument("SyncCoordinator needs a transport");
  if(!registry_) {
    registry_ = std::make_shared<DeviceRegistry>(options_.device_timeout, child_of(logger_, "devices"));
  }
  options_.transport = transport_->kind();
}

SyncCoordinator::~SyncCoordinator() {
  stop();
}

void SyncCoordinator::start() {
  if(running_) return;
  transport_->set_sink(this);
  transport_->start();
  running_ = true;
  logger_->info("Clipboard sync started as {} over {} (port {})",
                options_.identity.id(), transport_kind_name(transport_->kind()), transport_->bound_port());
}

void SyncCoordinator::stop() {
  if(!running_.exchange(false)) return;
  detach_monitor();
  transport_->stop();
  transport_->set_sink(nullptr);
  logger_->info("Clipboard sync stopped");
}

bool SyncCoordinator::on_local_capture(ClipboardPayload payload) {
  if(payload.kind == ClipboardKind::Text && !is_valid_utf8(payload.content)) {
    logger_->warn("Ignoring local clipboard text that is not valid UTF-8");
    return false;
  }
  if(payload.timestamp <= 0.0) payload.timestamp = unix_time_now();
  if(payload.device_name.empty()) payload.device_name = options_.identity.name;

  if(payload.kind == ClipboardKind::Image) save_image(payload);
  append_history(payload);

  logger_->debug("Sending local clipboard ({})", describe_payload(payload));
  transport_->broadcast(make_clipboard_packet(options_.identity, std::move(payload)));
  ++sent_;
  return true;
}

void SyncCoordinator::on_remote_receive(const Packet& packet) {
  if(packet.sender_name == options_.identity.name && packet.sender_ip == options_.identity.ip) return;

  if(is_presence_packet(packet.type)) {
    registry_->upsert_from_packet(packet);
    if(packet.type == PacketType::Discover && running_) {
      transport_->announce();
    }
    return;
  }

  const auto* payload = packet.clipboard();
  if(!payload) {
    logger_->debug("Dropping {} from {} without clipboard payload",
                   packet_type_name(packet.type), packet.sender_id());
    return;
  }
  handle_clipboard(packet, *payload);
}

void SyncCoordinator::handle_clipboard(const Packet& packet, const ClipboardPayload& payload) {
  if(payload.kind == ClipboardKind::Text && !is_valid_utf8(payload.content)) {
    logger_->debug("Dropping clipboard text from {}: not valid UTF-8", packet.sender_id());
    return;
  }
  const auto sender = packet.sender_id();

  // a known device stays present while it keeps talking
  if(registry_->contains(sender)) {
    registry_->upsert_from_packet(packet);
  }

  if(dedup_.seen(dedup_key(sender, payload))) {
    ++duplicates_;
    logger_->debug("Duplicate clipboard from {} ignored", sender);
    return;
  }
  ++received_;
  logger_->info("Received clipboard from {} ({})", sender, describe_payload(payload));

  if(payload.kind == ClipboardKind::Image) save_image(payload);
  append_history(payload);

  ClipboardCallback callback;
  bool apply = false;
  {
    std::lock_guard lg(callback_mutex_);
    callback = clipboard_callback_;
    apply = apply_remote_;
  }

  if(apply && !write_to_monitor(payload)) {
    logger_->warn("Could not write received clipboard content locally");
  }

  if(callback) {
    try {
      callback(payload, sender);
    } catch(const std::exception& e) {
      logger_->warn("Clipboard callback threw: {}", e.what());
    } catch(...) {
      logger_->warn("Clipboard callback threw unknown exception");
    }
  }
}

bool SyncCoordinator::write_to_monitor(const ClipboardPayload& payload) {
  std::shared_ptr<ClipboardMonitor> monitor;
  {
    std::lock_guard lg(callback_mutex_);
    monitor = monitor_;
    if(!monitor) return false;
    last_applied_ = payload;
  }
  bool written = false;
  try {
    written = monitor->set_current(payload);
  } catch(const std::exception& e) {
    logger_->warn("Clipboard monitor failed to apply content: {}", e.what());
  } catch(...) {
    logger_->warn("Clipboard monitor failed to apply content: unknown exception");
  }
  if(!written) {
    std::lock_guard lg(callback_mutex_);
    last_applied_.reset();
  }
  return written;
}

bool SyncCoordinator::copy_to_clipboard(const ClipboardPayload& payload) {
  if(payload.kind == ClipboardKind::Text && !is_valid_utf8(payload.content)) {
    logger_->warn("Refusing to place clipboard text that is not valid UTF-8");
    return false;
  }
  if(!write_to_monitor(payload)) {
    logger_->warn("Could not place {} on the local clipboard", describe_payload(payload));
    return false;
  }
  logger_->debug("Placed history entry on the local clipboard ({})", describe_payload(payload));
  return true;
}

void SyncCoordinator::append_history(const ClipboardPayload& payload) {
  std::lock_guard lg(history_mutex_);
  history_.push_back(payload);
  while(history_.size() > std::max<std::size_t>(1, options_.history_capacity)) {
    history_.pop_front();
  }
}

void SyncCoordinator::save_image(const ClipboardPayload& payload) {
  std::shared_ptr<ImageStore> store;
  {
    std::lock_guard lg(callback_mutex_);
    store = image_store_;
  }
  if(!store) return;
  try {
    auto path = store->save(payload);
    if(path.empty()) {
      logger_->warn("Image store did not save {} byte image", payload.content.size());
    } else {
      logger_->debug("Image saved to {}", path);
    }
  } catch(const std::exception& e) {
    logger_->warn("Image store failed: {}", e.what());
  } catch(...) {
    logger_->warn("Image store failed with unknown exception");
  }
}

std::vector<ClipboardPayload> SyncCoordinator::history() const {
  std::lock_guard lg(history_mutex_);
  return {history_.begin(), history_.end()};
}

void SyncCoordinator::clear_history() {
  {
    std::lock_guard lg(history_mutex_);
    history_.clear();
  }
  std::shared_ptr<ImageStore> store;
  {
    std::lock_guard lg(callback_mutex_);
    store = image_store_;
  }
  if(store) {
    try {
      store->delete_all();
    } catch(const std::exception& e) {
      logger_->warn("Image store failed to delete images: {}", e.what());
    } catch(...) {
      logger_->warn("Image store failed to delete images: unknown exception");
    }
  }
  logger_->info("Clipboard history cleared");
}

std::vector<Device> SyncCoordinator::connected_devices() const {
  return registry_->list();
}

void SyncCoordinator::trigger_discovery() {
  if(!running_) return;
  transport_->discover();
  transport_->announce();
}

void SyncCoordinator::set_clipboard_callback(ClipboardCallback callback) {
  std::lock_guard lg(callback_mutex_);
  clipboard_callback_ = std::move(callback);
}

SubscriptionHandle SyncCoordinator::subscribe_device_events(DeviceObserver observer) {
  return registry_->subscribe(std::move(observer));
}

void SyncCoordinator::unsubscribe_device_events(SubscriptionHandle handle) {
  registry_->unsubscribe(handle);
}

void SyncCoordinator::set_image_store(std::shared_ptr<ImageStore> store) {
  std::lock_guard lg(callback_mutex_);
  image_store_ = std::move(store);
}

void SyncCoordinator::attach_monitor(std::shared_ptr<ClipboardMonitor> monitor, bool apply_remote) {
  detach_monitor();
  if(!monitor) return;
  monitor->on_change([this](const ClipboardPayload& payload){ handle_monitor_change(payload); });
  std::lock_guard lg(callback_mutex_);
  monitor_ = std::move(monitor);
  apply_remote_ = apply_remote;
}

void SyncCoordinator::detach_monitor() {
  std::shared_ptr<ClipboardMonitor> monitor;
  {
    std::lock_guard lg(callback_mutex_);
    monitor.swap(monitor_);
    apply_remote_ = false;
    last_applied_.reset();
  }
  if(monitor) monitor->on_change(nullptr);
}

void SyncCoordinator::handle_monitor_change(const ClipboardPayload& payload) {
  {
    std::lock_guard lg(callback_mutex_);
    if(last_applied_ && same_content(*last_applied_, payload)) {
      last_applied_.reset();
      return;
    }
  }
  on_local_capture(payload);
}

SyncCoordinator::Stats SyncCoordinator::stats() const {
  Stats s;
  s.devices = registry_->size();
  {
    std::lock_guard lg(history_mutex_);
    s.history = history_.size();
  }
  s.sent = sent_.load();
  s.received = received_.load();
  s.duplicates = duplicates_.load();
  s.port = transport_->bound_port();
  s.transport = transport_->kind();
  return s;
}

SyncCoordinator::Options load_sync_options(const SettingsManager& settings) {
  SyncCoordinator::Options o;
  o.identity.name = SettingsManager::trim_copy(settings.get<std::string>("device_name"));
  if(o.identity.name.empty()) o.identity.name = detect_hostname();
  o.identity.ip = SettingsManager::trim_copy(settings.get<std::string>("device_ip"));
  if(o.identity.ip.empty()) o.identity.ip = detect_local_ip();
  o.identity.platform = detect_platform();

  o.transport = parse_transport_kind(settings.get<std::string>("transport"));

  auto ms = [&settings](const char* key) {
    return std::chrono::milliseconds(settings.get<long long>(key));
  };
  auto port = [&settings](const char* key) {
    return static_cast<uint16_t>(settings.get<int>(key));
  };

  const auto extra_addresses = settings.get<std::vector<std::string>>("broadcast_addresses");
  const int bind_attempts = settings.get<int>("bind_attempts");
  const bool reuse = settings.get<bool>("reuse_address");

  o.udp.port = port("udp_port");
  o.udp.broadcast_ports.clear();
  for(int p : settings.get<std::vector<int>>("broadcast_ports")) {
    o.udp.broadcast_ports.push_back(static_cast<uint16_t>(p));
  }
  o.udp.extra_addresses = extra_addresses;
  o.udp.bind_attempts = bind_attempts;
  o.udp.reuse_address = reuse;
  o.udp.heartbeat_interval = ms("heartbeat_interval");
  o.udp.sweep_interval = ms("sweep_interval");

  o.websocket.port = port("websocket_port");
  o.websocket.bind_attempts = bind_attempts;
  o.websocket.bootstrap_peer = SettingsManager::trim_copy(settings.get<std::string>("bootstrap_peer"));
  o.websocket.enable_discovery = settings.get<bool>("enable_discovery");
  auto& side = o.websocket.discovery;
  side.port = port("discovery_port");
  side.broadcast_ports.clear();
  for(uint32_t p = side.port; p < side.port + 5u && p <= 65535; ++p) {
    side.broadcast_ports.push_back(static_cast<uint16_t>(p));
  }
  side.extra_addresses = extra_addresses;
  side.bind_attempts = bind_attempts;
  side.reuse_address = reuse;
  side.heartbeat_interval = o.udp.heartbeat_interval;
  side.sweep_interval = o.udp.sweep_interval;

  o.device_timeout = ms("device_timeout");
  o.dedup_capacity = static_cast<std::size_t>(settings.get<int>("dedup_capacity"));
  o.history_capacity = static_cast<std::size_t>(settings.get<int>("history_capacity"));
  return o;
}

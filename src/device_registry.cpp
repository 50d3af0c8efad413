#include "device_registry.hpp"

#include <algorithm>
#include <exception>

const char* device_event_name(DeviceEventKind kind) {
  return kind == DeviceEventKind::Joined ? "joined" : "left";
}

DeviceRegistry::DeviceRegistry(std::chrono::milliseconds timeout,
                               std::shared_ptr<Logger> logger)
  : timeout_(timeout),
    logger_(std::move(logger)) {}

bool DeviceRegistry::upsert(const Device& device) {
  std::lock_guard<std::recursive_mutex> events(event_mutex_);
  const auto id = device.id();
  bool is_new = false;
  Device snapshot;
  {
    std::lock_guard lg(m_);
    auto it = devices_.find(id);
    if(it == devices_.end()) {
      devices_[id] = device;
      snapshot = device;
      is_new = true;
    } else {
      auto& known = it->second;
      known.last_seen = std::max(known.last_seen, device.last_seen);
      if(!device.platform.empty() && device.platform != "Unknown" &&
         known.platform != device.platform) {
        known.platform = device.platform;
      }
      if(device.transport_port != 0 && known.transport_port != device.transport_port) {
        log_debug(logger_.get(), "Device {} transport port -> {}", id, device.transport_port);
        known.transport_port = device.transport_port;
      }
    }
  }
  if(is_new) {
    log_info(logger_.get(), "Device joined: {} ({})", id, snapshot.platform);
    notify(DeviceEvent{DeviceEventKind::Joined, snapshot});
  }
  return is_new;
}

bool DeviceRegistry::upsert_from_packet(const Packet& packet, Clock::time_point now) {
  Device device;
  device.name = packet.sender_name;
  device.ip = packet.sender_ip;
  device.last_seen = now;
  if(const auto* presence = packet.presence()) {
    device.platform = presence->platform;
    device.transport_port = presence->transport_port;
  } else if(const auto* info = packet.device_info()) {
    if(!info->name.empty()) device.name = info->name;
    if(!info->ip.empty()) device.ip = info->ip;
    device.platform = info->platform;
    device.transport_port = info->transport_port;
  }
  return upsert(device);
}

bool DeviceRegistry::remove(const std::string& id) {
  std::lock_guard<std::recursive_mutex> events(event_mutex_);
  Device removed;
  {
    std::lock_guard lg(m_);
    auto it = devices_.find(id);
    if(it == devices_.end()) return false;
    removed = std::move(it->second);
    devices_.erase(it);
  }
  log_info(logger_.get(), "Device left: {}", id);
  notify(DeviceEvent{DeviceEventKind::Left, removed});
  return true;
}

std::size_t DeviceRegistry::sweep(Clock::time_point now) {
  if(timeout_.count() <= 0) return 0;
  std::lock_guard<std::recursive_mutex> events(event_mutex_);
  std::vector<Device> expired;
  {
    std::lock_guard lg(m_);
    for(auto it = devices_.begin(); it != devices_.end();) {
      if(now - it->second.last_seen > timeout_) {
        expired.push_back(std::move(it->second));
        it = devices_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for(const auto& device : expired) {
    log_info(logger_.get(), "Device timed out: {}", device.id());
    notify(DeviceEvent{DeviceEventKind::Left, device});
  }
  return expired.size();
}

std::vector<Device> DeviceRegistry::list() const {
  std::lock_guard lg(m_);
  std::vector<Device> out;
  out.reserve(devices_.size());
  for(const auto& kv : devices_) out.push_back(kv.second);
  std::sort(out.begin(), out.end(),
            [](const Device& a, const Device& b){ return a.id() < b.id(); });
  return out;
}

std::optional<Device> DeviceRegistry::find(const std::string& id) const {
  std::lock_guard lg(m_);
  auto it = devices_.find(id);
  if(it == devices_.end()) return std::nullopt;
  return it->second;
}

bool DeviceRegistry::contains(const std::string& id) const {
  std::lock_guard lg(m_);
  return devices_.count(id) > 0;
}

std::size_t DeviceRegistry::size() const {
  std::lock_guard lg(m_);
  return devices_.size();
}

void DeviceRegistry::clear() {
  std::lock_guard<std::recursive_mutex> events(event_mutex_);
  std::lock_guard lg(m_);
  devices_.clear();
}

SubscriptionHandle DeviceRegistry::subscribe(DeviceObserver observer) {
  if(!observer) return 0;
  std::lock_guard lg(observer_mutex_);
  const auto handle = next_handle_++;
  observers_.emplace(handle, std::move(observer));
  return handle;
}

void DeviceRegistry::unsubscribe(SubscriptionHandle handle) {
  std::lock_guard lg(observer_mutex_);
  observers_.erase(handle);
}

void DeviceRegistry::notify(const DeviceEvent& event) {
  std::vector<std::pair<SubscriptionHandle, DeviceObserver>> snapshot;
  {
    std::lock_guard lg(observer_mutex_);
    snapshot.assign(observers_.begin(), observers_.end());
  }
  std::sort(snapshot.begin(), snapshot.end(),
            [](const auto& a, const auto& b){ return a.first < b.first; });
  for(auto& entry : snapshot) {
    try {
      entry.second(event);
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "Device observer {} threw on {} {}: {}",
               entry.first, device_event_name(event.kind), event.device.id(), e.what());
    } catch(...) {
      log_warn(logger_.get(), "Device observer {} threw unknown exception on {} {}",
               entry.first, device_event_name(event.kind), event.device.id());
    }
  }
}

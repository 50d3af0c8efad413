#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "log.hpp"
#include "protocol.hpp"

struct Device {
  std::string name;
  std::string ip;
  std::chrono::steady_clock::time_point last_seen{};
  std::string platform = "Unknown";
  uint16_t transport_port = 0;   // persistent transport port the peer listens on, 0 if unknown

  std::string id() const { return name + "@" + ip; }
};

enum class DeviceEventKind { Joined, Left };

const char* device_event_name(DeviceEventKind kind);

struct DeviceEvent {
  DeviceEventKind kind;
  Device device;
};

using DeviceObserver = std::function<void(const DeviceEvent&)>;
using SubscriptionHandle = std::size_t;

// Presence table of remote devices keyed by "name@ip".
//
// Observers are called synchronously, outside the table lock, in the order the
// changes were made. An observer may call back into the registry.
class DeviceRegistry {
public:
  using Clock = std::chrono::steady_clock;
  static constexpr std::chrono::milliseconds kDefaultTimeout{15000};

  // A zero timeout disables sweeping; devices then only leave through remove().
  explicit DeviceRegistry(std::chrono::milliseconds timeout = kDefaultTimeout,
                          std::shared_ptr<Logger> logger = nullptr);

  // Inserts or refreshes a device. Returns true when the device was absent,
  // in which case one Joined event is fired.
  bool upsert(const Device& device);

  // Builds the device from a presence or device_info packet and upserts it.
  bool upsert_from_packet(const Packet& packet, Clock::time_point now = Clock::now());

  // Explicit disconnect. Fires Left when the device was present.
  bool remove(const std::string& id);

  // Drops every device silent for longer than the timeout; one Left per removal.
  std::size_t sweep(Clock::time_point now = Clock::now());

  std::vector<Device> list() const;
  std::optional<Device> find(const std::string& id) const;
  bool contains(const std::string& id) const;
  std::size_t size() const;
  void clear();

  SubscriptionHandle subscribe(DeviceObserver observer);
  void unsubscribe(SubscriptionHandle handle);

  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  void notify(const DeviceEvent& event);

  const std::chrono::milliseconds timeout_;
  std::shared_ptr<Logger> logger_;

  // Held across a change and its notifications so observers see events in
  // order; recursive so an observer may mutate the registry.
  std::recursive_mutex event_mutex_;

  mutable std::mutex m_;
  std::unordered_map<std::string, Device> devices_;

  std::mutex observer_mutex_;
  std::unordered_map<SubscriptionHandle, DeviceObserver> observers_;
  SubscriptionHandle next_handle_ = 1;
};

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "clipboard.hpp"
#include "dedup_cache.hpp"
#include "device_registry.hpp"
#include "discovery_transport.hpp"
#include "log.hpp"
#include "persistent_transport.hpp"
#include "protocol.hpp"
#include "transport.hpp"

class SettingsManager;

// Bridges local clipboard captures to the network and received clipboard
// packets back to the UI layer. Owns the history buffer, the duplicate
// filter and the transport chosen by configuration.
class SyncCoordinator : private PacketSink {
public:
  struct Options {
    DeviceIdentity identity;
    TransportKind transport = TransportKind::Udp;
    DiscoveryTransport::Options udp;
    PersistentTransport::Options websocket;
    std::chrono::milliseconds device_timeout = DeviceRegistry::kDefaultTimeout;
    std::size_t dedup_capacity = DedupCache::kDefaultCapacity;
    std::size_t history_capacity = 5;
  };

  // Called once per novel remote clipboard payload, on a transport thread.
  using ClipboardCallback = std::function<void(const ClipboardPayload& payload,
                                               const std::string& sender_id)>;

  struct Stats {
    std::size_t devices = 0;
    std::size_t history = 0;
    std::size_t sent = 0;
    std::size_t received = 0;
    std::size_t duplicates = 0;
    uint16_t port = 0;
    TransportKind transport = TransportKind::Udp;
  };

  explicit SyncCoordinator(Options options, std::shared_ptr<Logger> logger = nullptr);
  // Runs over a caller supplied transport feeding `registry`.
  SyncCoordinator(Options options,
                  std::unique_ptr<Transport> transport,
                  std::shared_ptr<DeviceRegistry> registry,
                  std::shared_ptr<Logger> logger = nullptr);
  ~SyncCoordinator() override;

  SyncCoordinator(const SyncCoordinator&) = delete;
  SyncCoordinator& operator=(const SyncCoordinator&) = delete;

  // Throws TransportError when the transport cannot bind.
  void start();
  void stop();
  bool running() const { return running_.load(); }

  // Records and broadcasts a local clipboard change. Missing timestamp and
  // device name are filled in. Returns false for text that is not UTF-8.
  bool on_local_capture(ClipboardPayload payload);
  void on_remote_receive(const Packet& packet);

  std::vector<ClipboardPayload> history() const;
  // Writes `payload` (usually a history entry) to the attached monitor without
  // sending it back out. False when no monitor is attached or it refuses.
  bool copy_to_clipboard(const ClipboardPayload& payload);
  void clear_history();
  std::vector<Device> connected_devices() const;
  void trigger_discovery();

  void set_clipboard_callback(ClipboardCallback callback);
  SubscriptionHandle subscribe_device_events(DeviceObserver observer);
  void unsubscribe_device_events(SubscriptionHandle handle);

  void set_image_store(std::shared_ptr<ImageStore> store);
  // Local changes from `monitor` become captures; with apply_remote, received
  // payloads are written to it.
  void attach_monitor(std::shared_ptr<ClipboardMonitor> monitor, bool apply_remote);
  void detach_monitor();

  Stats stats() const;
  const DeviceIdentity& identity() const { return options_.identity; }
  const std::shared_ptr<DeviceRegistry>& registry() const { return registry_; }
  Transport& transport() { return *transport_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  void on_packet(const Packet& packet) override { on_remote_receive(packet); }
  void handle_clipboard(const Packet& packet, const ClipboardPayload& payload);
  void append_history(const ClipboardPayload& payload);
  bool write_to_monitor(const ClipboardPayload& payload);
  void handle_monitor_change(const ClipboardPayload& payload);
  void save_image(const ClipboardPayload& payload);

  Options options_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<DeviceRegistry> registry_;
  std::unique_ptr<Transport> transport_;
  DedupCache dedup_;
  std::atomic<bool> running_{false};

  mutable std::mutex history_mutex_;
  std::deque<ClipboardPayload> history_;

  std::mutex callback_mutex_;
  ClipboardCallback clipboard_callback_;
  std::shared_ptr<ImageStore> image_store_;
  std::shared_ptr<ClipboardMonitor> monitor_;
  bool apply_remote_ = false;
  // last payload written to the monitor; a capture equal to it is our own echo
  std::optional<ClipboardPayload> last_applied_;

  std::atomic<std::size_t> sent_{0};
  std::atomic<std::size_t> received_{0};
  std::atomic<std::size_t> duplicates_{0};
};

// Reads every sync setting. Empty device_name/device_ip are detected from the
// host. Throws std::invalid_argument for an unknown transport.
SyncCoordinator::Options load_sync_options(const SettingsManager& settings);

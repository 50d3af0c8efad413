#pragma once
#include <functional>
#include <optional>
#include <string>

#include "protocol.hpp"

// Access to the operating system clipboard. Implementations live outside the
// network core (GUI toolkits, platform shims, the console front end).
class ClipboardMonitor {
public:
  using ChangeCallback = std::function<void(const ClipboardPayload&)>;

  virtual ~ClipboardMonitor() = default;

  virtual std::optional<ClipboardPayload> get_current() = 0;
  // Returns false when the clipboard could not be written.
  virtual bool set_current(const ClipboardPayload& payload) = 0;
  // Replaces the callback fired for every local clipboard change.
  virtual void on_change(ChangeCallback callback) = 0;
};

// Persists received images; returns the path written, empty on failure.
class ImageStore {
public:
  virtual ~ImageStore() = default;

  virtual std::string save(const ClipboardPayload& payload) = 0;
  virtual void delete_all() = 0;
};

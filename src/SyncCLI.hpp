#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <readline/history.h>
#include <readline/readline.h>

#include "clipboard.hpp"
#include "settings_manager.hpp"
#include "sync_coordinator.hpp"
#include "utils.hpp"

// Clipboard stand-in for the console: "copy" changes it as a user would, and
// received content is written into it.
class ConsoleClipboard : public ClipboardMonitor {
public:
  std::optional<ClipboardPayload> get_current() override {
    std::lock_guard lg(m_);
    return current_;
  }

  bool set_current(const ClipboardPayload& payload) override {
    ChangeCallback cb;
    {
      std::lock_guard lg(m_);
      current_ = payload;
      cb = callback_;
    }
    // a real clipboard reports every write, including ours
    if(cb) cb(payload);
    return true;
  }

  void on_change(ChangeCallback callback) override {
    std::lock_guard lg(m_);
    callback_ = std::move(callback);
  }

  // Local user copy.
  void copy(const ClipboardPayload& payload) { set_current(payload); }

private:
  std::mutex m_;
  std::optional<ClipboardPayload> current_;
  ChangeCallback callback_;
};

// Writes received images under a directory as clip_<timestamp>.png.
class DirectoryImageStore : public ImageStore {
public:
  explicit DirectoryImageStore(std::filesystem::path root) : root_(std::move(root)) {}

  std::string save(const ClipboardPayload& payload) override {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if(ec) return "";
    auto stamp = static_cast<long long>(payload.timestamp * 1000.0);
    auto path = root_ / ("clip_" + std::to_string(stamp) + ".png");
    std::ofstream out(path, std::ios::binary);
    if(!out) return "";
    out.write(payload.content.data(), static_cast<std::streamsize>(payload.content.size()));
    return out ? path.string() : "";
  }

  void delete_all() override {
    std::error_code ec;
    if(!std::filesystem::exists(root_, ec)) return;
    for(const auto& entry : std::filesystem::directory_iterator(root_, ec)) {
      if(entry.path().filename().string().rfind("clip_", 0) == 0) {
        std::filesystem::remove(entry.path(), ec);
      }
    }
  }

  const std::filesystem::path& root() const { return root_; }

private:
  std::filesystem::path root_;
};

class SyncCLI {
public:
  SyncCLI(std::shared_ptr<SyncCoordinator> coordinator,
          std::shared_ptr<SettingsManager> settings,
          std::shared_ptr<ConsoleClipboard> clipboard)
    : coordinator_(std::move(coordinator)),
      settings_(std::move(settings)),
      clipboard_(std::move(clipboard)) {
    coordinator_->set_clipboard_callback([this](const ClipboardPayload& payload, const std::string& from){
      on_clipboard_received(payload, from);
    });
    device_subscription_ = coordinator_->subscribe_device_events([this](const DeviceEvent& event){
      std::lock_guard lg(output_mutex_);
      std::cout << "\n[" << device_event_name(event.kind) << "] " << event.device.id()
                << " (" << event.device.platform << ")\n";
      std::cout.flush();
    });
  }

  ~SyncCLI() {
    coordinator_->set_clipboard_callback(nullptr);
    coordinator_->unsubscribe_device_events(device_subscription_);
  }

  // Reads commands until quit or end of input.
  void run() {
    running_ = true;
    while(running_) {
      auto input = read_command_line("clipsync> ");
      if(!input) break;
      execute_command(*input);
    }
    running_ = false;
  }

  void stop() { running_ = false; }

  void execute_command(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;
    if(cmd.empty()) return;
    std::string args;
    std::getline(iss, args);
    args = SettingsManager::trim_copy(args);

    if(cmd == "copy" || cmd == "c" || cmd == "send") {
      copy_text(args);
    } else if(cmd == "image" || cmd == "img") {
      copy_image(args);
    } else if(cmd == "paste" || cmd == "p") {
      show_clipboard();
    } else if(cmd == "devices" || cmd == "d" || cmd == "peers") {
      list_devices();
    } else if(cmd == "history" || cmd == "hist") {
      list_history();
    } else if(cmd == "use" || cmd == "u") {
      use_history_entry(args);
    } else if(cmd == "discover") {
      coordinator_->trigger_discovery();
      std::cout << "Discovery request sent.\n";
    } else if(cmd == "clear") {
      coordinator_->clear_history();
      std::cout << "History cleared.\n";
    } else if(cmd == "status") {
      show_status();
    } else if(cmd == "settings" || cmd == "s") {
      handle_settings_command(args.empty() ? "list" : args);
    } else if(cmd == "set") {
      handle_settings_command(args.empty() ? "list" : "set " + args);
    } else if(cmd == "get") {
      handle_settings_command(args.empty() ? "get" : "get " + args);
    } else if(cmd == "help" || cmd == "h" || cmd == "?") {
      print_help();
    } else if(cmd == "quit" || cmd == "exit" || cmd == "q") {
      std::cout << "Quitting...\n";
      running_ = false;
    } else {
      print_help();
      std::cout << "Unknown command: " << cmd << "\n";
    }
  }

private:
  std::optional<std::string> read_command_line(const char* prompt) {
    char* line = readline(prompt);
    if(!line) return std::nullopt;
    std::string result(line);
    if(!result.empty()) add_history(result.c_str());
    std::free(line);
    return result;
  }

  void copy_text(const std::string& text) {
    if(text.empty()) {
      std::cout << "Usage: copy <text>\n";
      return;
    }
    if(!is_valid_utf8(text)) {
      std::cout << "Text is not valid UTF-8.\n";
      return;
    }
    ClipboardPayload payload;
    payload.kind = ClipboardKind::Text;
    payload.content = text;
    payload.timestamp = unix_time_now();
    payload.device_name = coordinator_->identity().name;
    clipboard_->copy(payload);
    std::cout << "Copied and sent " << text.size() << " bytes.\n";
  }

  void copy_image(const std::string& path) {
    if(path.empty()) {
      std::cout << "Usage: image <path>\n";
      return;
    }
    std::ifstream in(path, std::ios::binary);
    if(!in) {
      std::cout << "Cannot read " << path << "\n";
      return;
    }
    ClipboardPayload payload;
    payload.kind = ClipboardKind::Image;
    payload.content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    payload.timestamp = unix_time_now();
    payload.device_name = coordinator_->identity().name;
    clipboard_->copy(payload);
    std::cout << "Copied and sent image of " << payload.content.size() << " bytes.\n";
  }

  void show_clipboard() {
    auto current = clipboard_->get_current();
    if(!current) {
      std::cout << "Clipboard is empty.\n";
      return;
    }
    std::cout << describe(*current) << "\n";
  }

  void list_devices() {
    auto devices = coordinator_->connected_devices();
    if(devices.empty()) {
      std::cout << "No devices found.\n";
      return;
    }
    auto now = DeviceRegistry::Clock::now();
    std::cout << "Devices (" << devices.size() << "):\n";
    for(const auto& d : devices) {
      auto age = std::chrono::duration_cast<std::chrono::seconds>(now - d.last_seen).count();
      std::cout << "  " << std::left << std::setw(32) << d.id()
                << " " << std::setw(10) << d.platform
                << " seen " << age << "s ago";
      if(d.transport_port != 0) std::cout << ", port " << d.transport_port;
      std::cout << "\n";
    }
  }

  void list_history() {
    auto entries = coordinator_->history();
    if(entries.empty()) {
      std::cout << "History is empty.\n";
      return;
    }
    for(std::size_t i = entries.size(); i-- > 0;) {
      std::cout << "  [" << (entries.size() - i) << "] "
                << entries[i].device_name << ": " << describe(entries[i]) << "\n";
    }
  }

  // Entry numbers match list_history: 1 is the newest.
  void use_history_entry(const std::string& arg) {
    auto entries = coordinator_->history();
    std::size_t n = 0;
    try {
      n = static_cast<std::size_t>(std::stoul(arg));
    } catch(const std::exception&) {
      n = 0;
    }
    if(n == 0 || n > entries.size()) {
      std::cout << "Usage: use <n> with n between 1 and " << entries.size() << "\n";
      return;
    }
    const auto& entry = entries[entries.size() - n];
    if(coordinator_->copy_to_clipboard(entry)) {
      std::cout << "Clipboard now holds " << describe(entry) << "\n";
    } else {
      std::cout << "Could not place entry " << n << " on the clipboard.\n";
    }
  }

  void show_status() {
    auto s = coordinator_->stats();
    std::cout << "Device:     " << coordinator_->identity().id()
              << " (" << coordinator_->identity().platform << ")\n"
              << "Transport:  " << transport_kind_name(s.transport) << " on port " << s.port << "\n"
              << "Devices:    " << s.devices << "\n"
              << "History:    " << s.history << "\n"
              << "Sent:       " << s.sent << "\n"
              << "Received:   " << s.received << " (" << s.duplicates << " duplicates dropped)\n";
  }

  void on_clipboard_received(const ClipboardPayload& payload, const std::string& from) {
    std::lock_guard lg(output_mutex_);
    std::cout << "\n[" << from << "] " << describe(payload) << "\n";
    std::cout.flush();
  }

  static std::string describe(const ClipboardPayload& payload) {
    if(payload.kind == ClipboardKind::Image) {
      return "<image, " + std::to_string(payload.content.size()) + " bytes>";
    }
    constexpr std::size_t kPreview = 60;
    std::string text = payload.content.substr(0, kPreview);
    std::replace(text.begin(), text.end(), '\n', ' ');
    if(payload.content.size() > kPreview) text += "...";
    return text;
  }

  void handle_settings_command(const std::string& args) {
    std::istringstream iss(args);
    std::string action;
    iss >> action;

    if(action == "list") {
      auto keys = settings_->keys();
      std::sort(keys.begin(), keys.end());
      for(const auto& key : keys) {
        std::cout << "  " << std::left << std::setw(20) << key << " = "
                  << settings_->value_as_string(key) << "\n";
      }
      return;
    }

    if(action == "get") {
      std::string key;
      iss >> key;
      if(key.empty()) {
        std::cout << "Usage: settings get <key>\n";
        return;
      }
      auto resolved = settings_->resolve_key(key);
      if(!resolved) {
        std::cout << "Unknown setting '" << key << "'.\n";
        return;
      }
      std::cout << *resolved << " = " << settings_->value_as_string(*resolved) << "\n";
      return;
    }

    if(action == "set") {
      std::string key;
      iss >> key;
      std::string value;
      std::getline(iss, value);
      value = SettingsManager::trim_copy(value);
      if(key.empty() || value.empty()) {
        std::cout << "Usage: settings set <key> <value>\n";
        return;
      }
      auto resolved = settings_->resolve_key(key);
      if(!resolved) {
        std::cout << "Unknown setting '" << key << "'.\n";
        return;
      }
      std::string error;
      if(settings_->set_from_string(*resolved, value, error)) {
        std::cout << *resolved << " = " << settings_->value_as_string(*resolved)
                  << " (applies after restart)\n";
      } else {
        std::cout << "Failed to set " << *resolved << ": " << error << "\n";
      }
      return;
    }

    if(action == "save") {
      if(settings_->save()) {
        std::cout << "Saved settings to " << settings_->settings_path() << "\n";
      } else {
        std::cout << "Failed to save settings.\n";
      }
      return;
    }

    std::cout << "Unknown settings command.\n";
  }

  void print_help() {
    std::cout << "Available commands:\n";
    std::cout << "  help|h|?                      Show this help message\n";
    std::cout << "  quit|exit|q                   Stop syncing and exit\n";
    std::cout << "  copy|c <text>                 Put text on the clipboard and send it\n";
    std::cout << "  image <path>                  Put an image file on the clipboard and send it\n";
    std::cout << "  paste|p                       Show the current clipboard\n";
    std::cout << "  devices|d                     List devices on the network\n";
    std::cout << "  history                       Show recent clipboard entries\n";
    std::cout << "  use|u <n>                     Put history entry n back on the clipboard\n";
    std::cout << "  discover                      Ask devices on the network to announce\n";
    std::cout << "  clear                         Clear history and saved images\n";
    std::cout << "  status                        Show sync statistics\n";
    std::cout << "  settings [list|get|set|save]  Manage settings\n";
    std::cout << "  set <key> <value>             Shortcut for settings set\n";
    std::cout << "  get <key>                     Shortcut for settings get\n";
  }

  std::shared_ptr<SyncCoordinator> coordinator_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<ConsoleClipboard> clipboard_;
  SubscriptionHandle device_subscription_ = 0;
  std::atomic<bool> running_{false};
  std::mutex output_mutex_;
};

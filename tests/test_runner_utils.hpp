#pragma once

#include "clipboard.hpp"
#include "device_registry.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "transport.hpp"

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace clipsync::test {

class LogCapture {
public:
  LogCapture() = default;

  ~LogCapture() {
    detach_all();
  }

  void attach(const std::shared_ptr<Logger>& logger,
              const std::string& label = std::string()) {
    if(!logger) return;
    auto handle = logger->add_listener([this, label](const LogRecord& record) {
      std::lock_guard<std::mutex> lock(mutex_);
      lines_.emplace_back((label.empty() ? record.source : label) + ": " + record.message);
      cv_.notify_all();
      return false;
    });
    std::lock_guard<std::mutex> lock(attachments_mutex_);
    attachments_.push_back({logger, handle});
  }

  void detach_all() {
    std::vector<Attachment> pending;
    {
      std::lock_guard<std::mutex> lock(attachments_mutex_);
      pending.swap(attachments_);
    }
    for(auto& attachment : pending) {
      if(attachment.logger && attachment.handle != 0) {
        attachment.logger->remove_listener(attachment.handle);
      }
    }
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
  }

  bool contains(const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(),
      [&](const std::string& line){ return line.find(needle) != std::string::npos; });
  }

  bool wait_for_substring(const std::string& needle,
                          std::chrono::milliseconds timeout) {
    auto predicate = [&]{
      return std::any_of(lines_.begin(), lines_.end(),
        [&](const std::string& line){ return line.find(needle) != std::string::npos; });
    };
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while(!predicate()) {
      if(cv_.wait_until(lock, deadline) == std::cv_status::timeout) break;
    }
    return predicate();
  }

private:
  struct Attachment {
    std::shared_ptr<Logger> logger;
    LogListenerHandle handle = 0;
  };

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> lines_;
  std::mutex attachments_mutex_;
  std::vector<Attachment> attachments_;
};

inline bool wait_for_condition(std::function<bool()> predicate,
                               std::chrono::milliseconds timeout,
                               std::chrono::milliseconds interval = std::chrono::milliseconds(20)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    if(predicate()) return true;
    std::this_thread::sleep_for(interval);
  }
  return predicate();
}

// Prints the failed expectation so the runner output says which check broke.
inline bool check(bool condition, const std::string& what) {
  if(!condition) std::cout << "\n    check failed: " << what << "\n";
  return condition;
}

// Base port for network tests, spread by pid so parallel runs rarely collide.
inline uint16_t test_port_base() {
  if(const char* env = std::getenv("CLIPSYNC_TEST_PORT_BASE")) {
    return static_cast<uint16_t>(std::atoi(env));
  }
  return static_cast<uint16_t>(30000 + (::getpid() % 2000) * 10);
}

// Collects device events from a registry.
class EventRecorder {
public:
  DeviceObserver observer() {
    return [this](const DeviceEvent& event){
      std::lock_guard lg(m_);
      events_.push_back(event);
    };
  }

  std::size_t count(DeviceEventKind kind, const std::string& id = std::string()) const {
    std::lock_guard lg(m_);
    return static_cast<std::size_t>(std::count_if(events_.begin(), events_.end(),
      [&](const DeviceEvent& e){ return e.kind == kind && (id.empty() || e.device.id() == id); }));
  }

  std::vector<DeviceEvent> events() const {
    std::lock_guard lg(m_);
    return events_;
  }

private:
  mutable std::mutex m_;
  std::vector<DeviceEvent> events_;
};

// In-memory transport: records what the coordinator sends and lets the test
// inject packets as if they came off the network.
class FakeTransport : public Transport {
public:
  void start() override { started = true; }
  void stop() override { stopped = true; }

  void broadcast(const Packet& packet) override {
    std::lock_guard lg(m_);
    sent_.push_back(packet);
  }
  void announce() override { ++announces; }
  void discover() override { ++discovers; }

  void set_sink(PacketSink* sink) override { sink_ = sink; }
  uint16_t bound_port() const override { return 4242; }
  TransportKind kind() const override { return TransportKind::Udp; }

  void deliver(const Packet& packet) {
    if(sink_) sink_->on_packet(packet);
  }

  std::vector<Packet> sent() const {
    std::lock_guard lg(m_);
    return sent_;
  }

  std::atomic<bool> started{false};
  std::atomic<bool> stopped{false};
  std::atomic<int> announces{0};
  std::atomic<int> discovers{0};

private:
  mutable std::mutex m_;
  std::vector<Packet> sent_;
  PacketSink* sink_ = nullptr;
};

class FakeMonitor : public ClipboardMonitor {
public:
  std::optional<ClipboardPayload> get_current() override { return current; }

  bool set_current(const ClipboardPayload& payload) override {
    current = payload;
    ++writes;
    // report the write back like an OS clipboard watcher would
    if(callback) callback(payload);
    return true;
  }

  void on_change(ChangeCallback cb) override { callback = std::move(cb); }

  void user_copy(const ClipboardPayload& payload) {
    current = payload;
    if(callback) callback(payload);
  }

  std::optional<ClipboardPayload> current;
  ChangeCallback callback;
  int writes = 0;
};

class FakeImageStore : public ImageStore {
public:
  std::string save(const ClipboardPayload& payload) override {
    saved.push_back(payload);
    return "/tmp/fake_" + std::to_string(saved.size()) + ".png";
  }
  void delete_all() override { ++deletes; }

  std::vector<ClipboardPayload> saved;
  int deletes = 0;
};

inline ClipboardPayload text_payload(const std::string& text, double ts, const std::string& device) {
  ClipboardPayload p;
  p.kind = ClipboardKind::Text;
  p.content = text;
  p.timestamp = ts;
  p.device_name = device;
  return p;
}

struct TestContext {
  LogCapture& logs;
  bool verbose = false;
};

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

// Runs every case, printing '.' per pass and 'F' with captured log lines per
// failure. Returns the process exit code.
inline int run_test_cases(const char* suite, const std::vector<TestCase>& tests, int argc, char** argv) {
  bool verbose = (std::getenv("CLIPSYNC_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") verbose = true;
  }
  bool show_logs = (std::getenv("CLIPSYNC_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) set_log_passthrough(false);
  init(verbose);

  LogCapture logs;
  TestContext ctx{logs, verbose};
  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " " << suite << " tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) set_log_passthrough(true);
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}

} // namespace clipsync::test

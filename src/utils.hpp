#pragma once
#include <chrono>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

std::string base64_encode(const std::string& data);
// Strict decode: rejects characters outside the standard alphabet, missing
// padding and padding in the middle of the input.
bool base64_decode(const std::string& encoded, std::string& out);

bool is_valid_utf8(std::string_view text);

// Wall clock seconds since the epoch, as carried in packet timestamps.
double unix_time_now();

std::string detect_hostname();
std::string detect_platform();
// Address of the interface that would route to the public internet; falls back
// to the loopback address when there is no route.
std::string detect_local_ip();
// Directed broadcast for the interface owning `ip`, or the /24 guess when the
// interface cannot be found.
std::optional<std::string> subnet_broadcast_for(const std::string& ip);

// std::thread that can be waited on with a deadline. A thread that misses the
// deadline is detached.
class BackgroundThread {
public:
  BackgroundThread() = default;
  ~BackgroundThread();

  BackgroundThread(const BackgroundThread&) = delete;
  BackgroundThread& operator=(const BackgroundThread&) = delete;

  void start(std::string name, std::function<void()> body);
  bool join_for(std::chrono::milliseconds timeout);
  bool joinable() const { return thread_.joinable(); }
  const std::string& name() const { return name_; }

private:
  std::string name_;
  std::thread thread_;
  std::future<void> finished_;
};

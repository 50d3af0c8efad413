#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_set>

// Bounded memory of clipboard messages already delivered. When full, the key
// inserted longest ago is forgotten first.
class DedupCache {
public:
  static constexpr std::size_t kDefaultCapacity = 100;

  explicit DedupCache(std::size_t capacity = kDefaultCapacity);

  // Records `key`; returns true when it had been recorded before.
  bool seen(const std::string& key);

  bool contains(const std::string& key) const;
  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }
  void clear();

private:
  const std::size_t capacity_;
  mutable std::mutex m_;
  std::unordered_set<std::string> keys_;
  std::deque<std::string> order_;
};

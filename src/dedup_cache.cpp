#include "dedup_cache.hpp"

DedupCache::DedupCache(std::size_t capacity)
  : capacity_(capacity == 0 ? 1 : capacity) {}

bool DedupCache::seen(const std::string& key) {
  std::lock_guard lg(m_);
  if(keys_.count(key)) return true;
  keys_.insert(key);
  order_.push_back(key);
  while(order_.size() > capacity_) {
    keys_.erase(order_.front());
    order_.pop_front();
  }
  return false;
}

bool DedupCache::contains(const std::string& key) const {
  std::lock_guard lg(m_);
  return keys_.count(key) > 0;
}

std::size_t DedupCache::size() const {
  std::lock_guard lg(m_);
  return keys_.size();
}

void DedupCache::clear() {
  std::lock_guard lg(m_);
  keys_.clear();
  order_.clear();
}

#include "store/lru_tracker.hpp"

namespace cafs {
namespace store {

LruTracker::LruTracker(std::uint64_t capacity, EvictFn on_evict)
  : capacity_(capacity)
  , on_evict_(std::move(on_evict)) {}

void LruTracker::set(const std::string& key, std::uint64_t size) {
  remove(key);

  if (size > capacity_) {
    // Can never fit, report it as evicted right away
    if (on_evict_) {
      on_evict_(key, size);
    }
    return;
  }

  entries_.push_front(Entry{key, size});
  index_[key] = entries_.begin();
  total_ += size;
  trim();
}

std::optional<std::uint64_t> LruTracker::get(const std::string& key) {
  auto it = index_.find(key);
  if (it == index_.end()) {
    return std::nullopt;
  }

  // Move the entry to the front of the list
  entries_.splice(entries_.begin(), entries_, it->second);
  return it->second->size;
}

bool LruTracker::remove(const std::string& key) {
  auto it = index_.find(key);
  if (it == index_.end()) {
    return false;
  }

  total_ -= it->second->size;
  entries_.erase(it->second);
  index_.erase(it);
  return true;
}

std::optional<std::uint64_t> LruTracker::peek(const std::string& key) const {
  auto it = index_.find(key);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return it->second->size;
}

std::vector<std::string> LruTracker::keys() const {
  std::vector<std::string> keys;
  keys.reserve(entries_.size());
  for (const auto& entry : entries_) {
    keys.push_back(entry.key);
  }
  return keys;
}

void LruTracker::trim() {
  while (total_ > capacity_ && !entries_.empty()) {
    // Evict the last key in the list
    Entry evicted = entries_.back();
    entries_.pop_back();
    index_.erase(evicted.key);
    total_ -= evicted.size;

    if (on_evict_) {
      on_evict_(evicted.key, evicted.size);
    }
  }
}

} // namespace store
} // namespace cafs

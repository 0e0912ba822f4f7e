#pragma once

#include <cstdint>
#include <functional>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cafs {
namespace store {

// Recency-ordered set of key -> size entries bounded by a total byte capacity.
//
// Inserting or touching an entry evicts least recently used entries until the
// total fits again; each eviction is reported through the callback. An entry
// larger than the whole capacity is never kept. Not thread safe, the owner
// serializes access.
class LruTracker {
public:
  using EvictFn = std::function<void(const std::string& key, std::uint64_t size)>;

  LruTracker(std::uint64_t capacity, EvictFn on_evict);


  // ---- MUTATING OPERATIONS ----
  // Inserts or updates an entry and marks it most recently used
  void set(const std::string& key, std::uint64_t size);
  // Returns the size and marks the entry most recently used
  std::optional<std::uint64_t> get(const std::string& key);
  // Drops an entry without reporting it as evicted
  bool remove(const std::string& key);


  // ---- QUERY OPERATIONS ----
  // Returns the size without touching recency
  std::optional<std::uint64_t> peek(const std::string& key) const;
  bool contains(const std::string& key) const { return index_.count(key) > 0; }
  std::uint64_t total() const { return total_; }
  std::uint64_t capacity() const { return capacity_; }
  std::size_t size() const { return entries_.size(); }
  // Keys from most to least recently used
  std::vector<std::string> keys() const;

private:
  struct Entry {
    std::string key;
    std::uint64_t size;
  };

  std::uint64_t capacity_;
  std::uint64_t total_{0};
  EvictFn on_evict_;
  // Front is the most recently used entry
  std::list<Entry> entries_;
  std::unordered_map<std::string, std::list<Entry>::iterator> index_;

  void trim();
};

} // namespace store
} // namespace cafs

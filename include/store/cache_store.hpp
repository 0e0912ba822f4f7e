#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "logger/logger.hpp"
#include "store/lru_tracker.hpp"
#include "store/store.hpp"

namespace cafs {
namespace store {

struct CacheStoreOptions {
  // The quick store holding a limited amount of recently used blobs
  std::shared_ptr<Store> cache_tier;
  // The slower store holding all data
  std::shared_ptr<Store> fallback_tier;
  // Maximum amount of bytes to keep in the cache tier (defaults to 100 MiB)
  std::uint64_t byte_budget = 100ull * 1024 * 1024;
  // Operational messages, defaults to the trivial logger at info
  logging::LogFn log;
};

struct CacheStats {
  std::uint64_t used_bytes;
  std::uint64_t byte_budget;
  std::size_t entries;
};

// Store that keeps recently used blobs in a fast cache tier, LRU-bounded by a
// byte budget, while the fallback tier holds every blob.
//
// The fallback tier is the source of truth: existence checks only ask it and
// eviction only ever deletes from the cache tier. Capabilities registered on
// either tier are forwarded, resolved once at construction. A tier failing in
// the middle of a fan-out fails the operation without rolling back the other
// tier. The key is dropped from the cache tier and the next read-through
// repairs it.
class CacheStore : public Store {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit CacheStore(CacheStoreOptions options);


  // ---- CORE STORAGE OPERATIONS ----
  // Tees the source into both tiers, then tracks the blob in the cache
  void write(const std::string& key, utils::ByteSource& source) override;
  // Serves from the cache tier on a hit, otherwise from the fallback tier while populating the cache
  void read(const std::string& key, std::ostream& destination,
            const ReadOptions& options = ReadOptions()) override;
  // Renames on the fallback tier and, if present there, on the cache tier
  void rename(const std::string& source_key, const std::string& dest_key) override;
  // Asks the fallback tier only
  bool exists(const std::string& key) override;
  // Removes from both tiers, the fallback tier's outcome is the result
  void remove(const std::string& key) override;


  // ---- CACHE INSPECTION ----
  CacheStats stats() const;
  // "used/budget (pct%)", used in debug logs
  std::string stat_string() const;
  bool is_cached(const std::string& key) const;

  Store& cache_tier() { return *cache_tier_; }
  Store& fallback_tier() { return *fallback_tier_; }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<Store> cache_tier_;
  std::shared_ptr<Store> fallback_tier_;
  std::uint64_t byte_budget_;
  logging::LogFn log_;

  // Guards lru_, pending_renames_ and evicted_
  mutable std::mutex mutex_;
  LruTracker lru_;
  // source -> dest of renames in flight, an eviction of a source key here is a relocation
  std::unordered_map<std::string, std::string> pending_renames_;
  // Keys evicted under mutex_ that still need deleting from the cache tier
  std::vector<std::string> evicted_;


  // ---- CACHE BOOKKEEPING ----
  // Records a cached blob and deletes whatever it pushed out of the budget
  void track(const std::string& key, std::uint64_t size);
  // LRU eviction callback, runs under mutex_
  void on_evict(const std::string& key, std::uint64_t size);
  // Forgets `key` and drops it from the cache tier, so the next read goes to the fallback tier
  void invalidate(const std::string& key);
  // Takes the pending evictions, requires mutex_
  std::vector<std::string> take_evicted();
  // Deletes evicted keys from the cache tier, never touches the fallback tier
  void delete_from_cache(const std::vector<std::string>& keys);
  // Requires mutex_
  std::string stat_string_locked() const;


  // ---- READ PATHS ----
  void read_through(const std::string& key, std::ostream& destination);


  // ---- CAPABILITIES ----
  void forward_capabilities();
  // copy(source, dest): copies on the fallback tier and keeps cached copies tracked
  std::any copy(const CapabilityArgs& args);
};

} // namespace store
} // namespace cafs

#include "store/cache_store.hpp"
#include <cmath>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "utils/tee.hpp"

namespace cafs {
namespace store {

//==============================================
// CONSTRUCTOR
//==============================================

CacheStore::CacheStore(CacheStoreOptions options)
  : cache_tier_(std::move(options.cache_tier))
  , fallback_tier_(std::move(options.fallback_tier))
  , byte_budget_(options.byte_budget)
  , log_(options.log ? std::move(options.log) : logging::default_log())
  , lru_(options.byte_budget, [this](const std::string& key, std::uint64_t size) { on_evict(key, size); }) {

  if (!cache_tier_ || !fallback_tier_) {
    BOOST_LOG_TRIVIAL(error) << "Cache store: Both a cache tier and a fallback tier are required";
    throw std::invalid_argument("Cache store: Both a cache tier and a fallback tier are required");
  }

  // Own capabilities take precedence over forwarded ones
  if (fallback_tier_->has_capability("copy")) {
    register_capability("copy", [this](const CapabilityArgs& args) { return copy(args); });
  }
  forward_capabilities();

  BOOST_LOG_TRIVIAL(info) << "Cache store: Initialized with a budget of " << byte_budget_ << " bytes";
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void CacheStore::write(const std::string& key, utils::ByteSource& source) {
  log_("Ensuring " + key + " in cache and fallback");

  std::uint64_t size = 0;
  try {
    size = utils::fork(source, {
      [this, &key](utils::ByteSource& input) { fallback_tier_->write(key, input); },
      [this, &key](utils::ByteSource& input) { cache_tier_->write(key, input); }
    });
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Cache store: Failed to write " << key << ": " << e.what();
    invalidate(key);
    throw;
  }

  track(key, size);
}

void CacheStore::read(const std::string& key, std::ostream& destination, const ReadOptions& options) {
  BOOST_LOG_TRIVIAL(debug) << "Cache store: Checking for " << key << " in cache store";

  std::optional<std::uint64_t> size;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    size = lru_.get(key);
  }

  if (size) {
    log_("Cache hit for " + key + ", streaming directly from cache");
    try {
      cache_tier_->read(key, destination, options);
      return;
    }
    catch (const NotFoundError&) {
      // Lost a race with an eviction, the fallback tier still has it
      BOOST_LOG_TRIVIAL(warning) << "Cache store: Tracked key " << key << " is gone from the cache tier";
      std::lock_guard<std::mutex> lock(mutex_);
      lru_.remove(key);
    }
  }

  if (!options.is_full()) {
    log_("Cache miss for " + key + ", streaming range from fallback store");
    fallback_tier_->read(key, destination, options);
    return;
  }

  log_("Cache miss for " + key + ", streaming from fallback store");
  read_through(key, destination);
}

void CacheStore::rename(const std::string& source_key, const std::string& dest_key) {
  // Only a tracked source is moved on the cache tier, an untracked copy may be awaiting eviction
  bool source_tracked = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_renames_[source_key] = dest_key;
    source_tracked = lru_.contains(source_key);
  }

  bool cache_renamed = false;
  try {
    fallback_tier_->rename(source_key, dest_key);
    // Object may no longer exist in the cache tier due to eviction
    if (source_tracked && cache_tier_->exists(source_key)) {
      cache_tier_->rename(source_key, dest_key);
      cache_renamed = true;
    }
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Cache store: Failed to rename " << source_key << " to " << dest_key << ": " << e.what();
    std::lock_guard<std::mutex> lock(mutex_);
    pending_renames_.erase(source_key);
    throw;
  }

  std::vector<std::string> victims;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    // Gone if an eviction consumed it while the rename was in flight
    pending_renames_.erase(source_key);

    auto size = lru_.peek(source_key);
    if (size) {
      lru_.remove(source_key);
    }

    if (size && cache_renamed) {
      lru_.set(dest_key, *size);
    } else {
      if (size) {
        // Tracked again by a concurrent read but never moved, that copy is orphaned
        evicted_.push_back(source_key);
      }
      // The fallback tier's dest_key now holds the source's bytes, whatever the cache has there is stale
      bool stale = lru_.remove(dest_key);
      if (stale || cache_renamed) {
        evicted_.push_back(dest_key);
      }
    }
    victims = take_evicted();
  }

  log_("Renamed cache entry " + source_key + " to " + dest_key);
  delete_from_cache(victims);
}

bool CacheStore::exists(const std::string& key) {
  // The cache tier is not queried, the key may have been evicted there
  return fallback_tier_->exists(key);
}

void CacheStore::remove(const std::string& key) {
  log_("Unlink " + key);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    lru_.remove(key);
  }

  std::exception_ptr fallback_error;
  try {
    fallback_tier_->remove(key);
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Cache store: Failed to remove " << key << " from fallback store: " << e.what();
    fallback_error = std::current_exception();
  }

  try {
    if (cache_tier_->exists(key)) {
      cache_tier_->remove(key);
    }
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Cache store: Failed to remove " << key << " from cache store: " << e.what();
  }

  if (fallback_error) {
    std::rethrow_exception(fallback_error);
  }
}


//==============================================
// CACHE INSPECTION
//==============================================

CacheStats CacheStore::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CacheStats{lru_.total(), byte_budget_, lru_.size()};
}

std::string CacheStore::stat_string() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stat_string_locked();
}

bool CacheStore::is_cached(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lru_.contains(key);
}


//==============================================
// CACHE BOOKKEEPING
//==============================================

void CacheStore::track(const std::string& key, std::uint64_t size) {
  std::vector<std::string> victims;
  std::string stats;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    lru_.set(key, size);
    victims = take_evicted();
    stats = stat_string_locked();
  }

  log_("Cached " + key + " (" + std::to_string(size) + " bytes), cache size: " + stats);
  delete_from_cache(victims);
}

void CacheStore::on_evict(const std::string& key, std::uint64_t size) {
  // Do not unlink if the key is being moved
  auto pending = pending_renames_.find(key);
  if (pending != pending_renames_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "Cache store: Not deleting " << key << " (" << size
                             << " bytes), it is being renamed to " << pending->second;
    pending_renames_.erase(pending);
    return;
  }
  evicted_.push_back(key);
}

void CacheStore::invalidate(const std::string& key) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    lru_.remove(key);
  }

  try {
    if (cache_tier_->exists(key)) {
      cache_tier_->remove(key);
    }
  }
  catch (const StoreError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Cache store: Failed to invalidate " << key << " in cache store: " << e.what();
  }
}

std::vector<std::string> CacheStore::take_evicted() {
  std::vector<std::string> keys;
  keys.swap(evicted_);
  return keys;
}

void CacheStore::delete_from_cache(const std::vector<std::string>& keys) {
  for (const auto& key : keys) {
    log_("Evicting " + key + " from cache store");
    try {
      cache_tier_->remove(key);
      BOOST_LOG_TRIVIAL(debug) << "Cache store: Evicted " << key << " from cache store, cache size: " << stat_string();
    }
    catch (const StoreError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Cache store: Failed to evict " << key << ": " << e.what();
    }
  }
}

std::string CacheStore::stat_string_locked() const {
  double percent = byte_budget_ == 0
    ? 0.0
    : std::round(static_cast<double>(lru_.total()) / static_cast<double>(byte_budget_) * 10000.0) / 100.0;

  std::ostringstream ss;
  ss << lru_.total() << "/" << byte_budget_ << " (" << percent << "%)";
  return ss.str();
}


//==============================================
// READ PATHS
//==============================================

void CacheStore::read_through(const std::string& key, std::ostream& destination) {
  std::uint64_t size = utils::fork(
    [this, &key](utils::Tee& tee) {
      utils::TeeStreambuf buffer(tee);
      std::ostream output(&buffer);
      // Rethrow tee failures instead of only setting badbit
      output.exceptions(std::ios::badbit);
      fallback_tier_->read(key, output);
    },
    {
      [&destination](utils::ByteSource& input) { utils::copy(input, destination); },
      [this, &key](utils::ByteSource& input) { cache_tier_->write(key, input); }
    });

  log_("Caching " + key + " for future use");
  track(key, size);
}


//==============================================
// CAPABILITIES
//==============================================

void CacheStore::forward_capabilities() {
  // Proxy all capabilities of the cache tier, then try the fallback tier with the same name
  for (const auto& name : cache_tier_->capabilities()) {
    if (has_capability(name)) {
      continue;
    }

    bool on_fallback = fallback_tier_->has_capability(name);
    register_capability(name, [this, name, on_fallback](const CapabilityArgs& args) {
      BOOST_LOG_TRIVIAL(debug) << "Cache store: Proxying invocation of " << name << " to cache store";
      std::any result = cache_tier_->invoke(name, args);

      if (on_fallback) {
        fallback_tier_->invoke(name, args);
      } else {
        BOOST_LOG_TRIVIAL(debug) << "Cache store: Cannot proxy call of " << name << " to fallback store";
      }
      return result;
    });
  }

  // Proxy what is left on the fallback tier
  for (const auto& name : fallback_tier_->capabilities()) {
    if (has_capability(name)) {
      continue;
    }

    register_capability(name, [this, name](const CapabilityArgs& args) {
      BOOST_LOG_TRIVIAL(debug) << "Cache store: Proxying invocation of " << name << " to fallback store";
      return fallback_tier_->invoke(name, args);
    });
  }
}

std::any CacheStore::copy(const CapabilityArgs& args) {
  std::string source_key = capability_arg<std::string>(args, 0);
  std::string dest_key = capability_arg<std::string>(args, 1);

  fallback_tier_->invoke("copy", args);

  std::optional<std::uint64_t> size;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    size = lru_.peek(source_key);
  }

  if (size && cache_tier_->has_capability("copy") && cache_tier_->exists(source_key)) {
    cache_tier_->invoke("copy", args);
    track(dest_key, *size);
  } else {
    // Whatever the cache tier held under dest_key is stale now
    bool stale = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stale = lru_.remove(dest_key);
    }
    if (stale) {
      delete_from_cache({dest_key});
    }
  }

  log_("Copied " + source_key + " to " + dest_key);
  return {};
}

} // namespace store
} // namespace cafs

#include "store/memory_store.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace cafs {
namespace store {

MemoryStore::MemoryStore() {
  register_capability("copy", [this](const CapabilityArgs& args) -> std::any {
    copy(capability_arg<std::string>(args, 0), capability_arg<std::string>(args, 1));
    return {};
  });
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void MemoryStore::write(const std::string& key, utils::ByteSource& source) {
  // Buffer privately so a failing source never leaves a partial entry
  std::string buffer = utils::read_all(source);
  std::size_t length = buffer.size();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key] = std::move(buffer);
  }
  BOOST_LOG_TRIVIAL(debug) << "Memory store: Saved " << length << " bytes under " << key;
}

void MemoryStore::read(const std::string& key, std::ostream& destination, const ReadOptions& options) {
  std::string bytes;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) {
      throw NotFoundError(key, "Key '" + key + "' does not exist!");
    }

    const std::string& stored = it->second;
    if (options.offset < stored.size()) {
      std::uint64_t available = stored.size() - options.offset;
      std::uint64_t length = std::min(available, options.length.value_or(available));
      bytes = stored.substr(static_cast<std::size_t>(options.offset), static_cast<std::size_t>(length));
    }
  }

  destination.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!destination.good()) {
    throw StoreError("Memory store: Failed to write to output stream");
  }
  BOOST_LOG_TRIVIAL(debug) << "Memory store: Streamed " << bytes.size() << " bytes for key: " << key;
}

void MemoryStore::rename(const std::string& source_key, const std::string& dest_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = data_.find(source_key);
  if (it == data_.end()) {
    throw NotFoundError(source_key, "Key '" + source_key + "' does not exist!");
  }

  std::string buffer = std::move(it->second);
  data_.erase(it);
  data_[dest_key] = std::move(buffer);
  BOOST_LOG_TRIVIAL(debug) << "Memory store: Renamed entry " << source_key << " to " << dest_key;
}

bool MemoryStore::exists(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return data_.count(key) > 0;
}

void MemoryStore::remove(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  data_.erase(key);
  BOOST_LOG_TRIVIAL(debug) << "Memory store: Unlink " << key;
}

void MemoryStore::copy(const std::string& source_key, const std::string& dest_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = data_.find(source_key);
  if (it == data_.end()) {
    throw NotFoundError(source_key, "Key '" + source_key + "' does not exist!");
  }

  std::string buffer = it->second;
  data_[dest_key] = std::move(buffer);
  BOOST_LOG_TRIVIAL(debug) << "Memory store: Copied entry " << source_key << " to " << dest_key;
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::size_t MemoryStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return data_.size();
}

std::uint64_t MemoryStore::total_bytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::uint64_t total = 0;
  for (const auto& [key, buffer] : data_) {
    total += buffer.size();
  }
  return total;
}

std::vector<std::string> MemoryStore::keys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  keys.reserve(data_.size());
  for (const auto& [key, buffer] : data_) {
    keys.push_back(key);
  }
  return keys;
}

} // namespace store
} // namespace cafs

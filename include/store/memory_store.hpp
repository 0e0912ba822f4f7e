#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "store/store.hpp"

namespace cafs {
namespace store {

// Keeps every blob as a byte buffer in process memory. Meant for caching and tests.
//
// Extra capabilities:
//   copy(source_key, dest_key)
class MemoryStore : public Store {
public:
  MemoryStore();

  void write(const std::string& key, utils::ByteSource& source) override;
  void read(const std::string& key, std::ostream& destination,
            const ReadOptions& options = ReadOptions()) override;
  void rename(const std::string& source_key, const std::string& dest_key) override;
  bool exists(const std::string& key) override;
  // Removing an absent key is a no-op
  void remove(const std::string& key) override;

  void copy(const std::string& source_key, const std::string& dest_key);

  // ---- QUERY OPERATIONS ----
  std::size_t size() const;
  std::uint64_t total_bytes() const;
  std::vector<std::string> keys() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> data_;
};

} // namespace store
} // namespace cafs

#pragma once

#include <any>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "store/store_error.hpp"
#include "utils/byte_source.hpp"

namespace cafs {
namespace store {

// Byte range of a read, the whole blob by default
struct ReadOptions {
  std::uint64_t offset = 0;
  std::optional<std::uint64_t> length;

  bool is_full() const { return offset == 0 && !length; }
};

using CapabilityArgs = std::vector<std::any>;
using Capability = std::function<std::any(const CapabilityArgs&)>;

// Capability contract every storage backend satisfies.
//
// Besides the five core operations a backend may register extra named
// capabilities (e.g. "copy"), which callers reach through invoke().
//
// Registered capabilities refer back to the backend, so stores are not copyable.
class Store {
public:
  Store() = default;
  virtual ~Store() = default;

  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;


  // ---- CORE STORAGE OPERATIONS ----
  // Persists every byte of `source` under `key`, overwriting any existing entry.
  // Returns once the data is complete; if `source` throws, the exception
  // propagates and nothing is left under `key`.
  virtual void write(const std::string& key, utils::ByteSource& source) = 0;
  // Streams the bytes stored under `key` into `destination`, throws NotFoundError if absent
  virtual void read(const std::string& key, std::ostream& destination,
                    const ReadOptions& options = ReadOptions()) = 0;
  // Relocates an entry, overwriting `dest_key`; throws NotFoundError if `source_key` is absent
  virtual void rename(const std::string& source_key, const std::string& dest_key) = 0;
  // Never throws for a merely absent key
  virtual bool exists(const std::string& key) = 0;
  // Removes the entry. Behaviour for an absent key is up to the backend.
  virtual void remove(const std::string& key) = 0;


  // ---- EXTENSION CAPABILITIES ----
  bool has_capability(const std::string& name) const;
  // Registered capability names in sorted order
  std::vector<std::string> capabilities() const;
  // Calls a named capability, throws CapabilityNotFoundError if it is not registered
  std::any invoke(const std::string& name, const CapabilityArgs& args = CapabilityArgs());

protected:
  void register_capability(const std::string& name, Capability capability);

private:
  std::map<std::string, Capability> capabilities_;
};

// Unpacks a capability argument, throws std::invalid_argument when missing or of another type
template <typename T>
T capability_arg(const CapabilityArgs& args, std::size_t index) {
  if (index >= args.size()) {
    throw std::invalid_argument("Store: Missing capability argument " + std::to_string(index));
  }
  if (const T* value = std::any_cast<T>(&args[index])) {
    return *value;
  }
  throw std::invalid_argument("Store: Capability argument " + std::to_string(index) + " has the wrong type");
}

} // namespace store
} // namespace cafs

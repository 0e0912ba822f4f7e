#pragma once

#include <stdexcept>
#include <string>

namespace cafs {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// An absent key was read, renamed or deleted. The message always starts with "ENOENT:".
class NotFoundError : public StoreError {
public:
  NotFoundError(const std::string& key, const std::string& detail)
    : StoreError("ENOENT: " + detail)
    , key_(key) {}

  const std::string& key() const { return key_; }

private:
  std::string key_;
};

// A named extension capability is offered by none of the stores involved
class CapabilityNotFoundError : public StoreError {
public:
  explicit CapabilityNotFoundError(const std::string& name)
    : StoreError("Store: Capability not found: " + name)
    , name_(name) {}

  const std::string& name() const { return name_; }

private:
  std::string name_;
};

} // namespace store
} // namespace cafs

#include "store/store.hpp"
#include <boost/log/trivial.hpp>

namespace cafs {
namespace store {

//==============================================
// EXTENSION CAPABILITIES
//==============================================

bool Store::has_capability(const std::string& name) const {
  return capabilities_.count(name) > 0;
}

std::vector<std::string> Store::capabilities() const {
  std::vector<std::string> names;
  names.reserve(capabilities_.size());
  for (const auto& [name, capability] : capabilities_) {
    names.push_back(name);
  }
  return names;
}

std::any Store::invoke(const std::string& name, const CapabilityArgs& args) {
  auto it = capabilities_.find(name);
  if (it == capabilities_.end()) {
    BOOST_LOG_TRIVIAL(error) << "Store: Capability not found: " << name;
    throw CapabilityNotFoundError(name);
  }

  BOOST_LOG_TRIVIAL(trace) << "Store: Invoking capability " << name << " with " << args.size() << " arguments";
  return it->second(args);
}

void Store::register_capability(const std::string& name, Capability capability) {
  BOOST_LOG_TRIVIAL(debug) << "Store: Registering capability: " << name;
  capabilities_[name] = std::move(capability);
}

} // namespace store
} // namespace cafs

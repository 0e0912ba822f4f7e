#include "utils/uuid.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace cafs {
namespace utils {

std::string random_uuid() {
  // random_generator is not thread safe, one per call
  boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

} // namespace utils
} // namespace cafs

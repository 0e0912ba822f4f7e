#pragma once

#include <string>

namespace cafs {
namespace utils {

// Random RFC 4122 identifier in its canonical 36 character form
std::string random_uuid();

} // namespace utils
} // namespace cafs

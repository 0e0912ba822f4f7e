#include "content/temporary_file.hpp"
#include <system_error>
#include <boost/log/trivial.hpp>

namespace cafs {
namespace content {

TemporaryFile::TemporaryFile(std::filesystem::path path) : path_(std::move(path)) {}

TemporaryFile::~TemporaryFile() {
  release();
}

TemporaryFile::TemporaryFile(TemporaryFile&& other) noexcept : path_(std::move(other.path_)) {
  other.path_.clear();
}

TemporaryFile& TemporaryFile::operator=(TemporaryFile&& other) noexcept {
  if (this != &other) {
    release();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

void TemporaryFile::release() noexcept {
  if (path_.empty()) {
    return;
  }

  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Temporary file: Failed to delete " << path_.string() << ": " << ec.message();
  } else {
    BOOST_LOG_TRIVIAL(debug) << "Temporary file: Deleted " << path_.string();
  }
  path_.clear();
}

} // namespace content
} // namespace cafs

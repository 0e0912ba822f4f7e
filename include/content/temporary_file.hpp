#pragma once

#include <filesystem>

namespace cafs {
namespace content {

// Owns a file on local disk and deletes it when released or destroyed
class TemporaryFile {
public:
  TemporaryFile() = default;
  explicit TemporaryFile(std::filesystem::path path);
  ~TemporaryFile();

  TemporaryFile(TemporaryFile&& other) noexcept;
  TemporaryFile& operator=(TemporaryFile&& other) noexcept;
  TemporaryFile(const TemporaryFile&) = delete;
  TemporaryFile& operator=(const TemporaryFile&) = delete;

  const std::filesystem::path& path() const { return path_; }
  explicit operator bool() const { return !path_.empty(); }

  // Deletes the file now, safe to call more than once
  void release() noexcept;

private:
  std::filesystem::path path_;
};

} // namespace content
} // namespace cafs

#include "store/directory_store.hpp"
#include <algorithm>
#include <fstream>
#include <limits>
#include <vector>
#include <boost/log/trivial.hpp>
#include "utils/uuid.hpp"

namespace cafs {
namespace store {

//==============================================
// CONSTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
DirectoryStore::DirectoryStore(const std::filesystem::path& base_path)
  : base_path_(std::filesystem::absolute(base_path).lexically_normal()) {
  BOOST_LOG_TRIVIAL(info) << "Directory store: Initializing with base path: " << base_path_.string();
  check_directory_exists(base_path_);

  register_capability("copy", [this](const CapabilityArgs& args) -> std::any {
    copy(capability_arg<std::string>(args, 0), capability_arg<std::string>(args, 1));
    return {};
  });
  register_capability("size", [this](const CapabilityArgs& args) -> std::any {
    return size(capability_arg<std::string>(args, 0));
  });
  register_capability("full_path", [this](const CapabilityArgs& args) -> std::any {
    return full_path(capability_arg<std::string>(args, 0)).string();
  });
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void DirectoryStore::write(const std::string& key, utils::ByteSource& source) {
  BOOST_LOG_TRIVIAL(debug) << "Directory store: Writing key: " << key;

  std::filesystem::path file_path = full_path(key);
  std::filesystem::path partial_path = partial_path_for(file_path);
  check_directory_exists(file_path.parent_path());

  try {
    std::ofstream file(partial_path, std::ios::binary);
    if (!file) {
      // A concurrent remove may have pruned the freshly created parent
      check_directory_exists(file_path.parent_path());
      file.clear();
      file.open(partial_path, std::ios::binary);
    }
    if (!file) {
      throw StoreError("Directory store: Failed to create file: " + partial_path.string());
    }

    std::vector<char> buffer(utils::CHUNK_SIZE);
    std::uint64_t bytes_written = 0;

    // Read the source in chunks and write them to the partial file
    while (std::size_t n = source.read(buffer.data(), buffer.size())) {
      file.write(buffer.data(), static_cast<std::streamsize>(n));
      if (!file) {
        throw StoreError("Directory store: Failed to write file: " + partial_path.string());
      }
      bytes_written += n;
    }

    file.close();
    if (file.fail()) {
      throw StoreError("Directory store: Failed to flush file: " + partial_path.string());
    }

    std::error_code ec;
    std::filesystem::rename(partial_path, file_path, ec);
    if (ec) {
      throw StoreError("Directory store: Failed to move " + partial_path.string() + " into place: " + ec.message());
    }
    BOOST_LOG_TRIVIAL(debug) << "Directory store: Wrote " << bytes_written << " bytes for " << key
                             << " to " << file_path.string();
  }
  catch (...) {
    // Never leave a partial entry behind, the original error is what the caller sees
    std::error_code ec;
    std::filesystem::remove(partial_path, ec);
    BOOST_LOG_TRIVIAL(debug) << "Directory store: Discarded partial write for " << key;
    throw;
  }
}

void DirectoryStore::read(const std::string& key, std::ostream& destination, const ReadOptions& options) {
  std::filesystem::path file_path = full_path(key);
  BOOST_LOG_TRIVIAL(debug) << "Directory store: Reading " << key << " from " << file_path.string();
  verify_file_exists(key, file_path);

  // Open file in binary mode to handle all file types correctly
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw NotFoundError(key, "no such file or directory, open '" + file_path.string() + "'");
  }

  if (options.offset > 0) {
    file.seekg(static_cast<std::streamoff>(options.offset));
    if (!file) {
      // Offset past the end yields nothing
      return;
    }
  }

  std::uint64_t remaining = options.length.value_or(std::numeric_limits<std::uint64_t>::max());
  std::vector<char> buffer(utils::CHUNK_SIZE);
  std::uint64_t total_bytes = 0;

  // Read file in chunks to handle large files efficiently
  while (remaining > 0) {
    auto wanted = static_cast<std::streamsize>(std::min<std::uint64_t>(remaining, buffer.size()));
    file.read(buffer.data(), wanted);
    std::streamsize n = file.gcount();
    if (n <= 0) {
      break;
    }

    destination.write(buffer.data(), n);
    if (!destination.good()) {
      throw StoreError("Directory store: Failed to write to output stream");
    }
    total_bytes += static_cast<std::uint64_t>(n);
    remaining -= static_cast<std::uint64_t>(n);
  }

  if (file.bad()) {
    throw StoreError("Directory store: Failed to read file: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "Directory store: Streamed " << total_bytes << " bytes for key: " << key;
}

void DirectoryStore::rename(const std::string& source_key, const std::string& dest_key) {
  std::filesystem::path source_path = full_path(source_key);
  std::filesystem::path dest_path = full_path(dest_key);
  verify_file_exists(source_key, source_path);
  check_directory_exists(dest_path.parent_path());

  BOOST_LOG_TRIVIAL(debug) << "Directory store: Moving " << source_path.string() << " to " << dest_path.string();
  try {
    std::filesystem::rename(source_path, dest_path);
  }
  catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Directory store: Failed to move " << source_key << ": " << e.what();
    throw StoreError("Directory store: Failed to move " + source_key + " to " + dest_key + ": " + e.what());
  }
  remove_empty_parents(source_path.parent_path());
}

bool DirectoryStore::exists(const std::string& key) {
  std::filesystem::path file_path = full_path(key);
  std::error_code ec;
  bool exists = std::filesystem::is_regular_file(file_path, ec);

  BOOST_LOG_TRIVIAL(trace) << "Directory store: Key " << key << (exists ? " exists" : " not found")
                           << " at path: " << file_path.string();
  return exists;
}

void DirectoryStore::remove(const std::string& key) {
  BOOST_LOG_TRIVIAL(debug) << "Directory store: Removing key: " << key;

  std::filesystem::path file_path = full_path(key);
  verify_file_exists(key, file_path);

  std::error_code ec;
  if (!std::filesystem::remove(file_path, ec)) {
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "Directory store: Failed to remove " << key << ": " << ec.message();
      throw StoreError("Directory store: Failed to remove " + key + ": " + ec.message());
    }
    throw NotFoundError(key, "no such file or directory, unlink '" + file_path.string() + "'");
  }

  // Clean up empty parent directories up to base_path_
  remove_empty_parents(file_path.parent_path());
  BOOST_LOG_TRIVIAL(debug) << "Directory store: Removed key: " << key;
}


//==============================================
// EXTENDED OPERATIONS
//==============================================

void DirectoryStore::copy(const std::string& source_key, const std::string& dest_key) {
  std::filesystem::path source_path = full_path(source_key);
  std::filesystem::path dest_path = full_path(dest_key);
  verify_file_exists(source_key, source_path);
  check_directory_exists(dest_path.parent_path());

  BOOST_LOG_TRIVIAL(debug) << "Directory store: Copying " << source_path.string() << " to " << dest_path.string();
  try {
    std::filesystem::copy_file(source_path, dest_path, std::filesystem::copy_options::overwrite_existing);
  }
  catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Directory store: Failed to copy " << source_key << ": " << e.what();
    throw StoreError("Directory store: Failed to copy " + source_key + " to " + dest_key + ": " + e.what());
  }
}

std::uintmax_t DirectoryStore::size(const std::string& key) const {
  std::filesystem::path file_path = full_path(key);
  verify_file_exists(key, file_path);

  std::uintmax_t file_size = std::filesystem::file_size(file_path);
  BOOST_LOG_TRIVIAL(trace) << "Directory store: File size for key " << key << ": " << file_size << " bytes";
  return file_size;
}

std::filesystem::path DirectoryStore::full_path(const std::string& key) const {
  if (key.empty()) {
    throw StoreError("Directory store: Invalid empty key");
  }

  std::filesystem::path path = (base_path_ / key).lexically_normal();
  std::filesystem::path relative = path.lexically_relative(base_path_);

  // Keys must name a file strictly inside the base directory
  if (relative.empty() || relative == "." || *relative.begin() == ".." || !path.has_filename()) {
    BOOST_LOG_TRIVIAL(error) << "Directory store: Key escapes base directory: " << key;
    throw StoreError("Directory store: Invalid key: " + key);
  }
  return path;
}


//==============================================
// UTILITY METHODS
//==============================================

void DirectoryStore::check_directory_exists(const std::filesystem::path& path) const {
  try {
    if (!std::filesystem::exists(path)) {
      std::filesystem::create_directories(path);
    }
  }
  catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Directory store: Failed to create directory " << path.string() << ": " << e.what();
    throw StoreError("Directory store: Failed to create directory: " + path.string());
  }
}

void DirectoryStore::verify_file_exists(const std::string& key, const std::filesystem::path& file_path) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file_path, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "Directory store: File not found: " << file_path.string();
    throw NotFoundError(key, "no such file or directory, open '" + file_path.string() + "'");
  }
}

void DirectoryStore::remove_empty_parents(std::filesystem::path directory) const {
  std::error_code ec;
  while (directory != base_path_ && directory.string().size() > base_path_.string().size()) {
    if (!std::filesystem::is_empty(directory, ec) || ec) {
      break;
    }
    // Fails harmlessly if a concurrent write just repopulated the directory
    if (!std::filesystem::remove(directory, ec)) {
      break;
    }
    directory = directory.parent_path();
  }
}

std::filesystem::path DirectoryStore::partial_path_for(const std::filesystem::path& file_path) const {
  return file_path.parent_path() / ("." + file_path.filename().string() + ".partial-" + utils::random_uuid());
}

} // namespace store
} // namespace cafs

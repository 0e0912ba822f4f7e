#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "store/store.hpp"

namespace cafs {
namespace store {

// Stores each key as a file at the key's relative path under a base directory.
//
// Extra capabilities:
//   copy(source_key, dest_key)
//   size(key) -> std::uintmax_t
//   full_path(key) -> std::string
class DirectoryStore : public Store {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit DirectoryStore(const std::filesystem::path& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  void write(const std::string& key, utils::ByteSource& source) override;
  void read(const std::string& key, std::ostream& destination,
            const ReadOptions& options = ReadOptions()) override;
  void rename(const std::string& source_key, const std::string& dest_key) override;
  bool exists(const std::string& key) override;
  // Throws NotFoundError for an absent key
  void remove(const std::string& key) override;


  // ---- EXTENDED OPERATIONS ----
  void copy(const std::string& source_key, const std::string& dest_key);
  // Returns the size of the stored file in bytes
  std::uintmax_t size(const std::string& key) const;
  // Resolves a key to its absolute path, rejecting keys that leave the base directory
  std::filesystem::path full_path(const std::string& key) const;

  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all stored files
  std::filesystem::path base_path_;


  // ---- UTILITY METHODS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Throws NotFoundError if no file is stored at `file_path`
  void verify_file_exists(const std::string& key, const std::filesystem::path& file_path) const;
  // Removes empty directories from `directory` up to, not including, the base path
  void remove_empty_parents(std::filesystem::path directory) const;
  // Hidden sibling the data is streamed into before it is moved into place
  std::filesystem::path partial_path_for(const std::filesystem::path& file_path) const;
};

} // namespace store
} // namespace cafs

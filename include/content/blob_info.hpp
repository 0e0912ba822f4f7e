#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>

namespace cafs {
namespace content {

// Caller data carried with a put, opaque to storage and handed to key derivation
using BlobMetadata = std::map<std::string, std::string>;

// Record of a stored blob. hash and size are set once the content has been
// streamed through prepare_put and are always set after finalize_put.
struct BlobInfo {
  std::string key;
  std::optional<std::string> hash;
  std::optional<std::uint64_t> size;
  BlobMetadata meta;
};

// Maps {meta} to a temporary key and {hash, meta} to the final key.
// Must be deterministic for a given hash and metadata.
using KeyDerivation = std::function<std::string(const BlobInfo&)>;

// "tmp/<uuid>" before hashing, the hex hash afterwards; with keep_extension
// both get the "ext" metadata value appended
KeyDerivation default_key_derivation(bool keep_extension = false);

// {"name": filename, "ext": extension including the dot}
BlobMetadata metadata_for_filename(const std::string& filename);


// Either a bare key or a BlobInfo, accepted wherever a stored blob is referenced
class BlobRef {
public:
  BlobRef(std::string key) : key_(std::move(key)) {}
  BlobRef(const char* key) : key_(key) {}
  BlobRef(const BlobInfo& info) : key_(info.key), info_(info) {}

  const std::string& key() const { return key_; }
  const std::optional<BlobInfo>& info() const { return info_; }

private:
  std::string key_;
  std::optional<BlobInfo> info_;
};

std::ostream& operator<<(std::ostream& os, const BlobInfo& info);

} // namespace content
} // namespace cafs

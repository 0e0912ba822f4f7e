#include "content/blob_info.hpp"
#include <filesystem>
#include "utils/uuid.hpp"

namespace cafs {
namespace content {

KeyDerivation default_key_derivation(bool keep_extension) {
  return [keep_extension](const BlobInfo& info) -> std::string {
    std::string extension;
    if (keep_extension) {
      auto ext = info.meta.find("ext");
      if (ext != info.meta.end()) {
        extension = ext->second;
      }
    }

    if (!info.hash) {
      return "tmp/" + utils::random_uuid() + extension;
    }
    return *info.hash + extension;
  };
}

BlobMetadata metadata_for_filename(const std::string& filename) {
  BlobMetadata meta;
  meta["name"] = filename;
  meta["ext"] = std::filesystem::path(filename).extension().string();
  return meta;
}

std::ostream& operator<<(std::ostream& os, const BlobInfo& info) {
  os << "BlobInfo{key=" << info.key
     << ", hash=" << (info.hash ? *info.hash : "<pending>")
     << ", size=";
  if (info.size) {
    os << *info.size;
  } else {
    os << "<pending>";
  }
  return os << ", meta=" << info.meta.size() << " entries}";
}

} // namespace content
} // namespace cafs

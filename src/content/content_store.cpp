#include "content/content_store.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <boost/log/trivial.hpp>
#include "crypto/digest.hpp"
#include "utils/tee.hpp"
#include "utils/uuid.hpp"

namespace cafs {
namespace content {

//==============================================
// CONSTRUCTOR
//==============================================

ContentStore::ContentStore(ContentStoreOptions options)
  : store_(std::move(options.store))
  , hash_algorithm_(std::move(options.hash_algorithm))
  , key_derivation_(options.key_derivation
                      ? std::move(options.key_derivation)
                      : default_key_derivation(options.keep_extension))
  , log_(options.log ? std::move(options.log) : logging::default_log()) {

  if (!store_) {
    BOOST_LOG_TRIVIAL(error) << "Content store: No store configured";
    throw std::invalid_argument("Content store: A store is required");
  }
  if (!crypto::Digest::is_supported(hash_algorithm_)) {
    BOOST_LOG_TRIVIAL(error) << "Content store: Unsupported hash algorithm: " << hash_algorithm_;
    throw crypto::DigestError("Unsupported hash algorithm: " + hash_algorithm_);
  }

  BOOST_LOG_TRIVIAL(info) << "Content store: Initialized with " << hash_algorithm_ << " addressing";
}


//==============================================
// PUT OPERATIONS
//==============================================

std::future<BlobInfo> ContentStore::prepare_put(utils::ByteSourcePtr source, BlobMetadata meta) {
  return run_async("prepare_put", [this, source = std::move(source), meta = std::move(meta)] {
    if (!source) {
      throw std::invalid_argument("Content store: No source given");
    }
    return do_prepare_put(*source, meta);
  });
}

std::future<BlobInfo> ContentStore::finalize_put(BlobRef ref) {
  return run_async("finalize_put", [this, ref = std::move(ref)] {
    return do_finalize_put(ref);
  });
}

std::future<BlobInfo> ContentStore::put(utils::ByteSourcePtr source, BlobMetadata meta) {
  return run_async("put", [this, source = std::move(source), meta = std::move(meta)] {
    if (!source) {
      throw std::invalid_argument("Content store: No source given");
    }
    BlobInfo prepared = do_prepare_put(*source, meta);
    return do_finalize_put(prepared);
  });
}

std::future<void> ContentStore::abort_put(BlobRef ref) {
  return run_async("abort_put", [this, ref = std::move(ref)] {
    {
      std::lock_guard<std::mutex> lock(pending_mutex_);
      pending_.erase(ref.key());
    }
    log_("Aborting put of " + ref.key());
    store_->remove(ref.key());
  });
}

std::size_t ContentStore::pending_count() {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  return pending_.size();
}

BlobInfo ContentStore::do_prepare_put(utils::ByteSource& source, const BlobMetadata& meta) {
  BlobInfo info;
  info.meta = meta;
  info.key = derive_key(info);
  log_("Preparing " + info.key);

  std::pair<std::string, std::uint64_t> digest;
  try {
    // Storage and hashing observe the same bytes, the hash is only valid once both finish
    utils::fork(source, {
      [this, &info](utils::ByteSource& input) { store_->write(info.key, input); },
      [this, &digest](utils::ByteSource& input) { digest = hash_source(input); }
    });
  }
  catch (...) {
    discard_temporary(info.key);
    throw;
  }

  info.hash = digest.first;
  info.size = digest.second;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_[info.key] = info;
  }

  BOOST_LOG_TRIVIAL(debug) << "Content store: Prepared " << info;
  return info;
}

BlobInfo ContentStore::do_finalize_put(const BlobRef& ref) {
  BlobInfo info;
  if (ref.info() && ref.info()->hash) {
    info = *ref.info();
  } else {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_.find(ref.key());
    if (it == pending_.end()) {
      throw std::invalid_argument("Content store: Cannot finalize " + ref.key() + " without a content hash");
    }
    info = it->second;
  }

  std::string temporary_key = info.key;
  BlobInfo partial;
  partial.hash = info.hash;
  partial.meta = info.meta;
  info.key = derive_key(partial);

  // Renaming onto an existing key overwrites it, which is how identical content collapses
  if (info.key != temporary_key) {
    store_->rename(temporary_key, info.key);
  }

  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.erase(temporary_key);
  }

  log_("Stored " + info.key + " (" + std::to_string(info.size.value_or(0)) + " bytes)");
  return info;
}


//==============================================
// READ OPERATIONS
//==============================================

std::future<void> ContentStore::stream(BlobRef ref, std::ostream& destination, store::ReadOptions options) {
  return run_async("stream", [this, ref = std::move(ref), &destination, options] {
    store_->read(ref.key(), destination, options);
  });
}

std::future<std::string> ContentStore::read_file(BlobRef ref, store::ReadOptions options) {
  return run_async("read_file", [this, ref = std::move(ref), options] {
    std::ostringstream output;
    store_->read(ref.key(), output, options);
    return output.str();
  });
}

std::future<TemporaryFile> ContentStore::get_temporary_file(BlobRef ref, store::ReadOptions options) {
  return run_async("get_temporary_file", [this, ref = std::move(ref), options] {
    std::string extension;
    if (ref.info()) {
      auto ext = ref.info()->meta.find("ext");
      if (ext != ref.info()->meta.end()) {
        extension = ext->second;
      }
    }
    if (extension.empty()) {
      extension = std::filesystem::path(ref.key()).extension().string();
    }

    // The handle deletes the file on every exit path, including the throws below
    TemporaryFile file(std::filesystem::temp_directory_path() / ("cafs-" + utils::random_uuid() + extension));
    {
      std::ofstream output(file.path(), std::ios::binary);
      if (!output) {
        throw store::StoreError("Content store: Failed to create temporary file: " + file.path().string());
      }
      store_->read(ref.key(), output, options);
      output.close();
      if (output.fail()) {
        throw store::StoreError("Content store: Failed to write temporary file: " + file.path().string());
      }
    }

    BOOST_LOG_TRIVIAL(debug) << "Content store: Copied " << ref.key() << " to " << file.path().string();
    return file;
  });
}


//==============================================
// QUERY AND DELETE OPERATIONS
//==============================================

std::future<bool> ContentStore::has(BlobRef ref) {
  return run_async("has", [this, ref = std::move(ref)] {
    return store_->exists(ref.key());
  });
}

std::future<bool> ContentStore::has_content(utils::ByteSourcePtr source, BlobMetadata meta) {
  return run_async("has_content", [this, source = std::move(source), meta = std::move(meta)] {
    if (!source) {
      throw std::invalid_argument("Content store: No source given");
    }

    // No hash, no lookup: the source is consumed completely first
    BlobInfo partial;
    partial.hash = hash_source(*source).first;
    partial.meta = meta;
    return store_->exists(derive_key(partial));
  });
}

std::future<void> ContentStore::unlink(BlobRef ref) {
  return run_async("unlink", [this, ref = std::move(ref)] {
    {
      std::lock_guard<std::mutex> lock(pending_mutex_);
      pending_.erase(ref.key());
    }
    log_("Unlink " + ref.key());
    store_->remove(ref.key());
  });
}


//==============================================
// OPERATION HELPERS
//==============================================

std::pair<std::string, std::uint64_t> ContentStore::hash_source(utils::ByteSource& source) const {
  crypto::Digest digest(hash_algorithm_);
  std::vector<char> buffer(utils::CHUNK_SIZE);

  while (std::size_t n = source.read(buffer.data(), buffer.size())) {
    digest.update(buffer.data(), n);
  }
  std::string hash = digest.hex_digest();
  return {hash, digest.bytes()};
}

std::string ContentStore::derive_key(const BlobInfo& partial) const {
  std::string key = key_derivation_(partial);
  if (key.empty()) {
    throw store::StoreError("Content store: Key derivation produced an empty key");
  }
  return key;
}

void ContentStore::discard_temporary(const std::string& key) {
  try {
    store_->remove(key);
    BOOST_LOG_TRIVIAL(debug) << "Content store: Removed temporary entry " << key;
  }
  catch (const store::NotFoundError&) {
    BOOST_LOG_TRIVIAL(trace) << "Content store: No temporary entry left under " << key;
  }
  catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Content store: Failed to remove temporary entry " << key << ": " << e.what();
  }
}

template <typename Fn>
auto ContentStore::run_async(const char* operation, Fn fn) -> std::future<decltype(fn())> {
  return std::async(std::launch::async, [operation, fn = std::move(fn)]() mutable {
    try {
      return fn();
    }
    catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Content store: " << operation << " failed: " << e.what();
      throw;
    }
  });
}

} // namespace content
} // namespace cafs

#pragma once

#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <utility>
#include "content/blob_info.hpp"
#include "content/temporary_file.hpp"
#include "logger/logger.hpp"
#include "store/store.hpp"
#include "utils/byte_source.hpp"

namespace cafs {
namespace content {

struct ContentStoreOptions {
  // Backend all blobs go to, a plain backend or a CacheStore
  std::shared_ptr<store::Store> store;
  // Any digest name OpenSSL knows
  std::string hash_algorithm = "sha256";
  // Defaults to default_key_derivation(keep_extension)
  KeyDerivation key_derivation;
  bool keep_extension = false;
  // Operational messages, defaults to the trivial logger at info
  logging::LogFn log;
};

// Content-addressed front end over a Store.
//
// A put streams the source into the store under a temporary key while hashing
// it, then renames the entry to a key derived from the hash, so identical
// content always ends up under one key. Every operation runs asynchronously;
// failures are delivered through the returned future. The ContentStore must
// outlive the futures it hands out, and so must any stream passed by reference.
class ContentStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ContentStore(ContentStoreOptions options);


  // ---- PUT OPERATIONS ----
  // Streams `source` into the store under a temporary key while hashing it
  std::future<BlobInfo> prepare_put(utils::ByteSourcePtr source, BlobMetadata meta = BlobMetadata());
  // Moves a prepared blob to its content-derived key. A bare temporary key
  // works for blobs prepared by this instance.
  std::future<BlobInfo> finalize_put(BlobRef ref);
  // prepare_put followed by finalize_put
  std::future<BlobInfo> put(utils::ByteSourcePtr source, BlobMetadata meta = BlobMetadata());
  // Discards a prepared blob that will never be finalized. Until finalize_put
  // or abort_put runs, the prepared blob's record stays in memory.
  std::future<void> abort_put(BlobRef ref);
  // Prepared blobs still waiting for finalize_put or abort_put
  std::size_t pending_count();


  // ---- READ OPERATIONS ----
  std::future<void> stream(BlobRef ref, std::ostream& destination,
                           store::ReadOptions options = store::ReadOptions());
  std::future<std::string> read_file(BlobRef ref, store::ReadOptions options = store::ReadOptions());
  // Copies the blob into a fresh file in the system temp directory, deleted when the handle goes away
  std::future<TemporaryFile> get_temporary_file(BlobRef ref, store::ReadOptions options = store::ReadOptions());


  // ---- QUERY AND DELETE OPERATIONS ----
  std::future<bool> has(BlobRef ref);
  // Hashes `source` completely and checks whether its final key is stored
  std::future<bool> has_content(utils::ByteSourcePtr source, BlobMetadata meta = BlobMetadata());
  std::future<void> unlink(BlobRef ref);


  // ---- GETTERS ----
  store::Store& get_store() { return *store_; }
  const std::string& hash_algorithm() const { return hash_algorithm_; }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<store::Store> store_;
  std::string hash_algorithm_;
  KeyDerivation key_derivation_;
  logging::LogFn log_;
  // Prepared but not yet finalized blobs by temporary key
  std::mutex pending_mutex_;
  std::map<std::string, BlobInfo> pending_;


  // ---- OPERATION BODIES ----
  BlobInfo do_prepare_put(utils::ByteSource& source, const BlobMetadata& meta);
  BlobInfo do_finalize_put(const BlobRef& ref);
  std::pair<std::string, std::uint64_t> hash_source(utils::ByteSource& source) const;
  std::string derive_key(const BlobInfo& partial) const;
  // Best effort removal of a temporary entry after a failed prepare
  void discard_temporary(const std::string& key);

  template <typename Fn>
  auto run_async(const char* operation, Fn fn) -> std::future<decltype(fn())>;
};

} // namespace content
} // namespace cafs

#ifndef CAFS_CRYPTO_DIGEST_HPP
#define CAFS_CRYPTO_DIGEST_HPP

#include <cstdint>
#include <memory>
#include <string>
#include "crypto_error.hpp"

namespace cafs::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Incremental message digest over a byte stream, any algorithm OpenSSL knows by name
class Digest {
public:

  static constexpr const char* DEFAULT_ALGORITHM = "sha256";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Digest(const std::string& algorithm = DEFAULT_ALGORITHM);
  ~Digest();

  Digest(const Digest&) = delete;
  Digest& operator=(const Digest&) = delete;


  // ---- HASHING OPERATIONS ----
  // Feeds the next block of data
  void update(const char* data, std::size_t size);
  // Finalizes and returns the lowercase hex digest, no further updates are allowed
  std::string hex_digest();


  // ---- GETTERS ----
  const std::string& algorithm() const { return algorithm_; }
  std::uint64_t bytes() const { return bytes_; }


  // ---- UTILITIES ----
  static bool is_supported(const std::string& algorithm);
  // One-shot hex digest of `data`
  static std::string hex(const std::string& data, const std::string& algorithm = DEFAULT_ALGORITHM);

private:
  // ---- PARAMETERS ----
  std::string algorithm_;
  std::unique_ptr<DigestContext> context_;
  std::uint64_t bytes_ = 0;
  bool finalized_ = false;
};

} // namespace cafs::crypto

#endif // CAFS_CRYPTO_DIGEST_HPP

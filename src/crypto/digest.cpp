#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace cafs::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  // Create a new message digest context
  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Digest::Digest(const std::string& algorithm) : algorithm_(algorithm) {
  const EVP_MD* md = EVP_get_digestbyname(algorithm_.c_str());
  if (!md) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Unsupported hash algorithm: " << algorithm_;
    throw DigestError("Unsupported hash algorithm: " + algorithm_);
  }

  context_ = std::make_unique<DigestContext>();
  if (!EVP_DigestInit_ex(context_->get(), md, nullptr)) {
    throw DigestError("Failed to initialize hash context");
  }
  BOOST_LOG_TRIVIAL(trace) << "Digest: Initialized " << algorithm_ << " context";
}

Digest::~Digest() = default;


//==============================================
// HASHING OPERATIONS
//==============================================

void Digest::update(const char* data, std::size_t size) {
  if (finalized_) {
    throw DigestError("Update after finalization");
  }
  if (size == 0) {
    return;
  }

  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    throw DigestError("Failed to update hash");
  }
  bytes_ += size;
}

std::string Digest::hex_digest() {
  if (finalized_) {
    throw DigestError("Digest already finalized");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    throw DigestError("Failed to finalize hash");
  }
  finalized_ = true;

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }

  std::string result = ss.str();
  BOOST_LOG_TRIVIAL(debug) << "Digest: " << algorithm_ << " over " << bytes_ << " bytes: " << result;
  return result;
}


//==============================================
// UTILITIES
//==============================================

bool Digest::is_supported(const std::string& algorithm) {
  return EVP_get_digestbyname(algorithm.c_str()) != nullptr;
}

std::string Digest::hex(const std::string& data, const std::string& algorithm) {
  Digest digest(algorithm);
  digest.update(data.data(), data.size());
  return digest.hex_digest();
}

} // namespace cafs::crypto

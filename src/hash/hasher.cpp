#include "hash/hasher.hpp"
#include "common/error.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace bv {
namespace hash {

namespace {

//==============================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//==============================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw VaultError("Hasher: Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

const EVP_MD* evp_digest(HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::SHA256:      return EVP_sha256();
    case HashAlgorithm::SHA3_256:    return EVP_sha3_256();
    case HashAlgorithm::BLAKE2S_256: return EVP_blake2s256();
  }
  throw ConfigError("Hasher: Unsupported hash algorithm id " +
                    std::to_string(static_cast<int>(algorithm)));
}

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

Hasher::Hasher(HashAlgorithm algorithm) : algorithm_(algorithm) {
  // Fail at construction rather than on the first chunk
  const EVP_MD* md = evp_digest(algorithm_);
  if (EVP_MD_size(md) != static_cast<int>(DIGEST_SIZE)) {
    throw ConfigError(std::string("Hasher: Algorithm ") + algorithm_name(algorithm_) +
                      " does not produce a 256-bit digest");
  }
}


//==============================================
// HASHING
//==============================================

Digest Hasher::hash(const uint8_t* data, std::size_t size) const {
  DigestContext context;
  Digest digest{};
  unsigned int digest_len = 0;

  if (!EVP_DigestInit_ex(context.get(), evp_digest(algorithm_), nullptr)) {
    throw VaultError("Hasher: Failed to initialize hash context");
  }

  if (size > 0 && !EVP_DigestUpdate(context.get(), data, size)) {
    throw VaultError("Hasher: Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(context.get(), digest.data(), &digest_len)) {
    throw VaultError("Hasher: Failed to finalize hash");
  }

  if (digest_len != DIGEST_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Hasher: Unexpected digest length " << digest_len;
    throw VaultError("Hasher: Unexpected digest length");
  }

  return digest;
}

Digest Hasher::hash(const Bytes& data) const {
  return hash(data.data(), data.size());
}

} // namespace hash
} // namespace bv

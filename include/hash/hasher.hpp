#ifndef BV_HASH_HASHER_HPP
#define BV_HASH_HASHER_HPP

#include <cstddef>
#include "common/types.hpp"
#include "hash/digest.hpp"

namespace bv {
namespace hash {

// Stateless content hasher. Every call uses its own OpenSSL digest context,
// so one instance may be shared by any number of threads.
class Hasher {
public:
  // ---- CONSTRUCTOR ----
  explicit Hasher(HashAlgorithm algorithm = HashAlgorithm::SHA256);


  // ---- HASHING ----
  Digest hash(const uint8_t* data, std::size_t size) const;
  Digest hash(const Bytes& data) const;


  // ---- GETTERS ----
  HashAlgorithm algorithm() const { return algorithm_; }

private:
  HashAlgorithm algorithm_;
};

} // namespace hash
} // namespace bv

#endif // BV_HASH_HASHER_HPP

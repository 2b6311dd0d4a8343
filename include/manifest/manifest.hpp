#ifndef BV_MANIFEST_HPP
#define BV_MANIFEST_HPP

#include <cstdint>
#include <vector>
#include "hash/digest.hpp"

namespace bv {
namespace manifest {

// Root description of one backup. Immutable once built.
struct Manifest {
  uint64_t chunk_size = 0;
  uint64_t total_size = 0;
  hash::HashAlgorithm algorithm = hash::HashAlgorithm::SHA256;
  // Digest of chunk i at position i
  std::vector<hash::Digest> chunks;

  uint64_t chunk_count() const { return chunks.size(); }
  uint64_t chunk_offset(uint64_t index) const { return index * chunk_size; }
  // Length of chunk index; the last chunk holds the remainder
  uint64_t chunk_length(uint64_t index) const;
  // True if chunks.size() matches total_size and chunk_size
  bool is_consistent() const;

  static uint64_t expected_chunk_count(uint64_t total_size, uint64_t chunk_size);
};

bool operator==(const Manifest& lhs, const Manifest& rhs);
bool operator!=(const Manifest& lhs, const Manifest& rhs);

} // namespace manifest
} // namespace bv

#endif // BV_MANIFEST_HPP

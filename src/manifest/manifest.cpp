#include "manifest/manifest.hpp"
#include <stdexcept>
#include <string>

namespace bv {
namespace manifest {

uint64_t Manifest::chunk_length(uint64_t index) const {
  if (index >= chunks.size()) {
    throw std::out_of_range("Manifest: chunk index " + std::to_string(index) + " out of range");
  }
  if (index + 1 < chunks.size()) {
    return chunk_size;
  }
  return total_size - index * chunk_size;
}

bool Manifest::is_consistent() const {
  return chunk_size > 0 && chunks.size() == expected_chunk_count(total_size, chunk_size);
}

uint64_t Manifest::expected_chunk_count(uint64_t total_size, uint64_t chunk_size) {
  if (chunk_size == 0) {
    return 0;
  }
  return total_size / chunk_size + (total_size % chunk_size != 0 ? 1 : 0);
}

bool operator==(const Manifest& lhs, const Manifest& rhs) {
  return lhs.chunk_size == rhs.chunk_size &&
         lhs.total_size == rhs.total_size &&
         lhs.algorithm == rhs.algorithm &&
         lhs.chunks == rhs.chunks;
}

bool operator!=(const Manifest& lhs, const Manifest& rhs) {
  return !(lhs == rhs);
}

} // namespace manifest
} // namespace bv

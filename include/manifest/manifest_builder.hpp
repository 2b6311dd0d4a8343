#ifndef BV_MANIFEST_BUILDER_HPP
#define BV_MANIFEST_BUILDER_HPP

#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include "manifest/manifest.hpp"

namespace bv {
namespace manifest {

// Collects chunk digests that complete in any order and places each at its
// chunk index. Out-of-order results wait in a reorder buffer that is drained
// as soon as the contiguous prefix grows. Thread safe.
class ManifestBuilder {
public:
  // ---- CONSTRUCTOR ----
  ManifestBuilder(uint64_t chunk_size, hash::HashAlgorithm algorithm);


  // ---- COLLECTION ----
  // Throws std::logic_error if index was already recorded
  void record(uint64_t index, const hash::Digest& digest);
  // Blocks until index < contiguous() + window. Returns false if the build
  // was aborted while waiting.
  bool wait_for_window(uint64_t index, std::size_t window);
  // Wakes every waiter, used when a worker fails
  void abort();


  // ---- COMPLETION ----
  // Throws IntegrityError if any chunk below the expected count is missing
  Manifest finish(uint64_t total_size);


  // ---- GETTERS ----
  uint64_t contiguous() const;
  std::size_t pending() const;
  std::size_t peak_pending() const;
  bool aborted() const;

private:
  uint64_t chunk_size_;
  hash::HashAlgorithm algorithm_;

  mutable std::mutex mutex_;
  std::condition_variable progress_;
  std::vector<hash::Digest> ordered_;
  std::map<uint64_t, hash::Digest> pending_;
  std::size_t peak_pending_ = 0;
  bool aborted_ = false;
};

} // namespace manifest
} // namespace bv

#endif // BV_MANIFEST_BUILDER_HPP

#ifndef BV_PIPELINE_CONFIG_HPP
#define BV_PIPELINE_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace bv {
namespace pipeline {

static constexpr uint64_t DEFAULT_CHUNK_SIZE = 512 * 1024;
// Upper bound accepted by validation, one chunk is held in memory per slot
static constexpr uint64_t MAX_CHUNK_SIZE = 1024ull * 1024 * 1024;

struct PipelineConfig {
  uint64_t chunk_size = DEFAULT_CHUNK_SIZE;
  // Threads in the hashing and fetching pool
  std::size_t workers = 4;
  // Chunks read ahead of the contiguous prefix, bounds memory use
  std::size_t max_in_flight = 16;
  // Re-hash every fetched chunk during restore
  bool verify_on_restore = true;
};

} // namespace pipeline
} // namespace bv

#endif // BV_PIPELINE_CONFIG_HPP

#ifndef BV_PIPELINE_BACKUP_PIPELINE_HPP
#define BV_PIPELINE_BACKUP_PIPELINE_HPP

#include <cstdint>
#include <istream>
#include <boost/asio/thread_pool.hpp>
#include "hash/digest.hpp"
#include "pipeline/pipeline_config.hpp"
#include "store/content_store.hpp"
#include "utils/cancellation.hpp"

namespace bv {
namespace pipeline {

struct BackupResult {
  hash::Digest root{};
  uint64_t total_size = 0;
  uint64_t chunk_count = 0;
  // Chunks this backup added to the store
  uint64_t chunks_written = 0;
  // Chunks that were already present
  uint64_t dedup_hits = 0;
  uint64_t bytes_written = 0;
};

// Chunks a source, hashes and stores chunks on the pool and publishes the
// manifest. Chunk i is only read once i < contiguous prefix + max_in_flight.
class BackupPipeline {
public:
  BackupPipeline(store::ContentStore& store, boost::asio::thread_pool& pool,
                 const PipelineConfig& config);

  // Returns the root hash of the stored manifest. On any failure remaining
  // work is abandoned, running tasks are drained, the first error is rethrown
  // and no manifest is stored.
  BackupResult run(std::istream& source, const utils::CancellationToken& token);

private:
  store::ContentStore& store_;
  boost::asio::thread_pool& pool_;
  PipelineConfig config_;
};

} // namespace pipeline
} // namespace bv

#endif // BV_PIPELINE_BACKUP_PIPELINE_HPP

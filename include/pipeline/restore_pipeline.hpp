#ifndef BV_PIPELINE_RESTORE_PIPELINE_HPP
#define BV_PIPELINE_RESTORE_PIPELINE_HPP

#include <cstdint>
#include <boost/asio/thread_pool.hpp>
#include "hash/digest.hpp"
#include "hash/hasher.hpp"
#include "manifest/manifest.hpp"
#include "pipeline/pipeline_config.hpp"
#include "pipeline/sink.hpp"
#include "store/content_store.hpp"
#include "utils/cancellation.hpp"

namespace bv {
namespace pipeline {

struct RestoreResult {
  hash::Digest root{};
  uint64_t total_size = 0;
  uint64_t chunk_count = 0;
  bool verified = false;
};

// Rebuilds an image from its manifest. Chunks are fetched concurrently within
// a window of max_in_flight and written in ascending order.
class RestorePipeline {
public:
  RestorePipeline(const store::ContentStore& store, boost::asio::thread_pool& pool,
                  const PipelineConfig& config);

  // Fails fast with NotFound, IntegrityError or IoError; the sink is then
  // abandoned and reports itself incomplete.
  RestoreResult run(const hash::Digest& root, Sink& sink, const utils::CancellationToken& token);

private:
  const store::ContentStore& store_;
  boost::asio::thread_pool& pool_;
  PipelineConfig config_;

  Bytes fetch_chunk(const manifest::Manifest& manifest, const hash::Hasher& hasher,
                    uint64_t index) const;
};

} // namespace pipeline
} // namespace bv

#endif // BV_PIPELINE_RESTORE_PIPELINE_HPP

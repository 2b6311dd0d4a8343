#include "pipeline/backup_pipeline.hpp"
#include <atomic>
#include <utility>
#include <boost/log/trivial.hpp>
#include "chunker/chunker.hpp"
#include "common/error.hpp"
#include "manifest/manifest_builder.hpp"
#include "manifest/manifest_store.hpp"
#include "utils/task_group.hpp"

namespace bv {
namespace pipeline {

BackupPipeline::BackupPipeline(store::ContentStore& store, boost::asio::thread_pool& pool,
                               const PipelineConfig& config)
  : store_(store)
  , pool_(pool)
  , config_(config) {
  if (config_.max_in_flight == 0) {
    throw ConfigError("max_in_flight must be greater than zero");
  }
}

BackupResult BackupPipeline::run(std::istream& source, const utils::CancellationToken& token) {
  BOOST_LOG_TRIVIAL(info) << "Backup: Starting with chunk size " << config_.chunk_size
                          << ", algorithm " << hash::algorithm_name(store_.algorithm())
                          << ", window " << config_.max_in_flight;

  chunker::Chunker chunker(source, config_.chunk_size);
  manifest::ManifestBuilder builder(config_.chunk_size, store_.algorithm());
  std::atomic<uint64_t> chunks_written{0};
  std::atomic<uint64_t> dedup_hits{0};
  std::atomic<uint64_t> bytes_written{0};
  utils::TaskGroup group(pool_, config_.max_in_flight);

  try {
    uint64_t next_index = 0;
    while (true) {
      token.throw_if_cancelled("backup");
      if (!builder.wait_for_window(next_index, config_.max_in_flight)) {
        break;  // a worker failed
      }

      chunker::Chunk chunk;
      if (!chunker.next(chunk)) {
        break;
      }
      ++next_index;

      auto task = [this, &builder, &chunks_written, &dedup_hits, &bytes_written,
                   chunk = std::move(chunk)]() {
        try {
          const hash::Digest digest = store_.hasher().hash(chunk.data);
          if (store_.put_hashed(digest, chunk.data)) {
            ++chunks_written;
            bytes_written += chunk.size();
          } else {
            ++dedup_hits;
          }
          builder.record(chunk.index, digest);
          BOOST_LOG_TRIVIAL(debug) << "Backup: Chunk " << chunk.index << " -> " << hash::to_hex(digest);
        } catch (...) {
          // Release the producer before the group records the failure
          builder.abort();
          throw;
        }
      };
      if (!group.submit(std::move(task))) {
        break;
      }
    }

    group.wait();
    group.rethrow_if_failed();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Backup: Failed after " << chunker.chunks_produced()
                             << " chunks, no manifest stored: " << e.what();
    builder.abort();
    group.cancel();
    group.wait();
    throw;
  }

  const manifest::Manifest manifest = builder.finish(chunker.bytes_read());
  BackupResult result;
  result.root = manifest::store_manifest(store_, manifest);
  result.total_size = manifest.total_size;
  result.chunk_count = manifest.chunk_count();
  result.chunks_written = chunks_written;
  result.dedup_hits = dedup_hits;
  result.bytes_written = bytes_written;

  BOOST_LOG_TRIVIAL(info) << "Backup: Stored " << result.total_size << " bytes in "
                          << result.chunk_count << " chunks (" << result.chunks_written
                          << " new, " << result.dedup_hits << " deduplicated), root "
                          << hash::to_hex(result.root);
  return result;
}

} // namespace pipeline
} // namespace bv

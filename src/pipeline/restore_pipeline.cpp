#include "pipeline/restore_pipeline.hpp"
#include <deque>
#include <future>
#include <utility>
#include <boost/log/trivial.hpp>
#include "common/error.hpp"
#include "manifest/manifest_store.hpp"
#include "utils/task_group.hpp"

namespace bv {
namespace pipeline {

RestorePipeline::RestorePipeline(const store::ContentStore& store, boost::asio::thread_pool& pool,
                                 const PipelineConfig& config)
  : store_(store)
  , pool_(pool)
  , config_(config) {
  if (config_.max_in_flight == 0) {
    throw ConfigError("max_in_flight must be greater than zero");
  }
}


//==============================================
// RESTORE
//==============================================

RestoreResult RestorePipeline::run(const hash::Digest& root, Sink& sink,
                                   const utils::CancellationToken& token) {
  const std::string root_hex = hash::to_hex(root);
  BOOST_LOG_TRIVIAL(info) << "Restore: Starting from root " << root_hex
                          << (config_.verify_on_restore ? " with" : " without")
                          << " chunk verification";

  manifest::Manifest manifest;
  try {
    manifest = manifest::load_manifest(store_, root);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Restore: Cannot load manifest " << root_hex << ": " << e.what();
    sink.abandon();
    throw;
  }

  const hash::Hasher hasher(manifest.algorithm);
  const uint64_t count = manifest.chunk_count();
  std::deque<std::future<Bytes>> window;
  utils::TaskGroup group(pool_, config_.max_in_flight);

  try {
    sink.prepare(manifest.total_size);

    uint64_t next_fetch = 0;
    for (uint64_t index = 0; index < count; ++index) {
      token.throw_if_cancelled("restore");

      while (next_fetch < count && window.size() < config_.max_in_flight) {
        const uint64_t fetch_index = next_fetch++;
        std::packaged_task<Bytes()> task([this, &manifest, &hasher, fetch_index]() {
          return fetch_chunk(manifest, hasher, fetch_index);
        });
        window.push_back(task.get_future());
        if (!group.submit(std::move(task))) {
          throw OperationCancelled("restore");
        }
      }

      // Errors surface here in chunk order
      const Bytes data = window.front().get();
      window.pop_front();
      sink.write_at(manifest.chunk_offset(index), data.data(), data.size());
    }

    sink.finalize();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Restore: Failed for root " << root_hex << ": " << e.what();
    group.cancel();
    group.wait();
    sink.abandon();
    throw;
  }

  RestoreResult result;
  result.root = root;
  result.total_size = manifest.total_size;
  result.chunk_count = count;
  result.verified = config_.verify_on_restore;

  BOOST_LOG_TRIVIAL(info) << "Restore: Wrote " << result.total_size << " bytes in "
                          << result.chunk_count << " chunks";
  return result;
}

Bytes RestorePipeline::fetch_chunk(const manifest::Manifest& manifest, const hash::Hasher& hasher,
                                   uint64_t index) const {
  const hash::Digest& digest = manifest.chunks[index];
  const std::string hex = hash::to_hex(digest);

  Bytes data;
  try {
    data = store_.get(digest);
  } catch (const NotFound&) {
    throw NotFound("chunk " + std::to_string(index) + " (" + hex + ")", hex);
  }

  const uint64_t expected = manifest.chunk_length(index);
  if (data.size() != expected) {
    throw IntegrityError("chunk " + std::to_string(index) + " (" + hex + ") has " +
                         std::to_string(data.size()) + " bytes, expected " +
                         std::to_string(expected));
  }
  if (config_.verify_on_restore && hasher.hash(data) != digest) {
    throw IntegrityError("chunk " + std::to_string(index) + " (" + hex + ") does not match its hash");
  }
  BOOST_LOG_TRIVIAL(debug) << "Restore: Fetched chunk " << index;
  return data;
}

} // namespace pipeline
} // namespace bv

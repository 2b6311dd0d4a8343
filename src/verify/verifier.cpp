#include "verify/verifier.hpp"
#include <boost/log/trivial.hpp>
#include "chunker/chunker.hpp"
#include "common/error.hpp"
#include "hash/hasher.hpp"
#include "manifest/manifest_store.hpp"
#include "utils/task_group.hpp"

namespace bv {
namespace verify {

Verifier::Verifier(const store::ContentStore& store, boost::asio::thread_pool& pool,
                   const pipeline::PipelineConfig& config)
  : store_(store)
  , pool_(pool)
  , config_(config) {
  if (config_.max_in_flight == 0) {
    throw ConfigError("max_in_flight must be greater than zero");
  }
}


//==============================================
// VERIFICATION
//==============================================

VerificationReport Verifier::verify(const hash::Digest& root, const utils::CancellationToken& token) {
  const std::string root_hex = hash::to_hex(root);
  BOOST_LOG_TRIVIAL(info) << "Verifier: Checking backup " << root_hex;

  const manifest::Manifest manifest = manifest::load_manifest(store_, root);
  const hash::Hasher hasher(manifest.algorithm);
  const uint64_t count = manifest.chunk_count();

  // One slot per chunk, each written by exactly one task
  std::vector<ChunkStatus> slots(count, ChunkStatus::Ok);
  utils::TaskGroup group(pool_, config_.max_in_flight);

  try {
    for (uint64_t index = 0; index < count; ++index) {
      token.throw_if_cancelled("verify");
      const bool submitted = group.submit([this, &manifest, &hasher, &slots, index]() {
        const hash::Digest& digest = manifest.chunks[index];
        try {
          const Bytes data = store_.get(digest);
          if (data.size() != manifest.chunk_length(index) || hasher.hash(data) != digest) {
            slots[index] = ChunkStatus::Corrupt;
          }
        } catch (const NotFound&) {
          slots[index] = ChunkStatus::Missing;
        } catch (const IoError& e) {
          BOOST_LOG_TRIVIAL(warning) << "Verifier: Chunk " << index << " unreadable: " << e.what();
          slots[index] = ChunkStatus::Unreadable;
        }
      });
      if (!submitted) {
        break;
      }
    }
    group.wait();
    group.rethrow_if_failed();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Verifier: Aborted check of " << root_hex << ": " << e.what();
    group.cancel();
    group.wait();
    throw;
  }

  VerificationReport report;
  report.root = root;
  report.chunk_count = count;
  for (uint64_t index = 0; index < count; ++index) {
    switch (slots[index]) {
      case ChunkStatus::Missing:
        report.missing.push_back(index);
        break;
      case ChunkStatus::Corrupt:
        report.corrupt.push_back(index);
        break;
      case ChunkStatus::Unreadable:
        report.unreadable.push_back(index);
        break;
      case ChunkStatus::Ok:
        break;
    }
  }

  if (report.passed()) {
    BOOST_LOG_TRIVIAL(info) << "Verifier: All " << count << " chunks of " << root_hex << " are intact";
  } else {
    BOOST_LOG_TRIVIAL(warning) << "Verifier: Backup " << root_hex << " failed: "
                               << report.missing.size() << " missing, "
                               << report.corrupt.size() << " corrupt, "
                               << report.unreadable.size() << " unreadable";
  }
  return report;
}


//==============================================
// CHANGE DETECTION
//==============================================

ChangeReport Verifier::compare(const hash::Digest& root, std::istream& source,
                               const utils::CancellationToken& token) {
  const manifest::Manifest manifest = manifest::load_manifest(store_, root);
  const hash::Hasher hasher(manifest.algorithm);

  ChangeReport report;
  report.root = root;
  report.stored_size = manifest.total_size;

  chunker::Chunker chunker(source, manifest.chunk_size);
  chunker::Chunk chunk;
  while (chunker.next(chunk)) {
    token.throw_if_cancelled("compare");
    if (chunk.index >= manifest.chunk_count()) {
      report.added.push_back(chunk.index);
    } else if (hasher.hash(chunk.data) != manifest.chunks[chunk.index]) {
      report.changed.push_back(chunk.index);
    }
  }
  report.current_size = chunker.bytes_read();

  BOOST_LOG_TRIVIAL(info) << "Verifier: Compared image against " << hash::to_hex(root) << ": "
                          << report.changed.size() << " changed, " << report.added.size()
                          << " added chunks, size " << report.stored_size << " -> "
                          << report.current_size;
  return report;
}

} // namespace verify
} // namespace bv

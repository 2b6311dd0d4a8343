#ifndef BV_VERIFY_VERIFIER_HPP
#define BV_VERIFY_VERIFIER_HPP

#include <cstdint>
#include <istream>
#include <vector>
#include <boost/asio/thread_pool.hpp>
#include "hash/digest.hpp"
#include "pipeline/pipeline_config.hpp"
#include "store/content_store.hpp"
#include "utils/cancellation.hpp"

namespace bv {
namespace verify {

struct VerificationReport {
  hash::Digest root{};
  uint64_t chunk_count = 0;
  // Indices in ascending order
  std::vector<uint64_t> missing;
  std::vector<uint64_t> corrupt;
  std::vector<uint64_t> unreadable;

  bool passed() const { return missing.empty() && corrupt.empty() && unreadable.empty(); }
};

// Difference between a stored backup and a live image
struct ChangeReport {
  hash::Digest root{};
  uint64_t stored_size = 0;
  uint64_t current_size = 0;
  // Indices present in both whose content differs
  std::vector<uint64_t> changed;
  // Indices beyond the stored image
  std::vector<uint64_t> added;

  bool size_changed() const { return stored_size != current_size; }
  bool unchanged() const { return changed.empty() && added.empty() && !size_changed(); }
};

class Verifier {
public:
  Verifier(const store::ContentStore& store, boost::asio::thread_pool& pool,
           const pipeline::PipelineConfig& config);

  // Checks every chunk of the backup under root without stopping at the
  // first problem. Manifest load errors propagate.
  VerificationReport verify(const hash::Digest& root, const utils::CancellationToken& token);

  // Chunks source like the stored backup and lists the chunks that differ
  ChangeReport compare(const hash::Digest& root, std::istream& source,
                       const utils::CancellationToken& token);

private:
  enum class ChunkStatus : uint8_t {
    Ok,
    Missing,
    Corrupt,
    Unreadable
  };

  const store::ContentStore& store_;
  boost::asio::thread_pool& pool_;
  pipeline::PipelineConfig config_;
};

} // namespace verify
} // namespace bv

#endif // BV_VERIFY_VERIFIER_HPP

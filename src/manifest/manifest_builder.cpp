#include "manifest/manifest_builder.hpp"
#include "common/error.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace bv {
namespace manifest {

ManifestBuilder::ManifestBuilder(uint64_t chunk_size, hash::HashAlgorithm algorithm)
  : chunk_size_(chunk_size)
  , algorithm_(algorithm) {
  if (chunk_size_ == 0) {
    throw ConfigError("Manifest builder: chunk size must be greater than zero");
  }
}


//==============================================
// COLLECTION
//==============================================

void ManifestBuilder::record(uint64_t index, const hash::Digest& digest) {
  {
    std::lock_guard<std::mutex> lock(mutex_);

    if (index < ordered_.size() || pending_.count(index) > 0) {
      BOOST_LOG_TRIVIAL(error) << "Manifest builder: Chunk " << index << " recorded twice";
      throw std::logic_error("Manifest builder: chunk " + std::to_string(index) + " recorded twice");
    }

    pending_.emplace(index, digest);

    // Drain the longest ready prefix into its final position
    auto it = pending_.begin();
    while (it != pending_.end() && it->first == ordered_.size()) {
      ordered_.push_back(it->second);
      it = pending_.erase(it);
    }

    if (pending_.size() > peak_pending_) {
      peak_pending_ = pending_.size();
    }
  }
  progress_.notify_all();
}

bool ManifestBuilder::wait_for_window(uint64_t index, std::size_t window) {
  std::unique_lock<std::mutex> lock(mutex_);
  progress_.wait(lock, [&] { return aborted_ || index < ordered_.size() + window; });
  return !aborted_;
}

void ManifestBuilder::abort() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    aborted_ = true;
  }
  progress_.notify_all();
}


//==============================================
// COMPLETION
//==============================================

Manifest ManifestBuilder::finish(uint64_t total_size) {
  std::lock_guard<std::mutex> lock(mutex_);

  uint64_t expected = Manifest::expected_chunk_count(total_size, chunk_size_);
  if (!pending_.empty() || ordered_.size() != expected) {
    BOOST_LOG_TRIVIAL(error) << "Manifest builder: Incomplete manifest, " << ordered_.size()
                             << " contiguous and " << pending_.size() << " pending of "
                             << expected << " chunks";
    throw IntegrityError("Manifest builder: " + std::to_string(ordered_.size()) + " of " +
                         std::to_string(expected) + " chunks recorded in order");
  }

  Manifest manifest;
  manifest.chunk_size = chunk_size_;
  manifest.total_size = total_size;
  manifest.algorithm = algorithm_;
  manifest.chunks = ordered_;
  return manifest;
}


//==============================================
// GETTERS
//==============================================

uint64_t ManifestBuilder::contiguous() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ordered_.size();
}

std::size_t ManifestBuilder::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

std::size_t ManifestBuilder::peak_pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peak_pending_;
}

bool ManifestBuilder::aborted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return aborted_;
}

} // namespace manifest
} // namespace bv

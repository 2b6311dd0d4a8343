#include "store/content_store.hpp"
#include "common/error.hpp"
#include <boost/log/trivial.hpp>

namespace bv {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ContentStore::ContentStore(StorageBackend& backend, hash::HashAlgorithm algorithm,
                           const StoreConfig& config)
  : backend_(backend)
  , hasher_(algorithm)
  , verify_puts_(config.verify_puts)
  , compare_existing_(config.compare_existing) {
  BOOST_LOG_TRIVIAL(info) << "Content store: Initialized with algorithm " << hash::algorithm_name(algorithm)
                          << (verify_puts_ ? ", verifying puts" : "")
                          << (compare_existing_ ? ", comparing existing entries" : "");
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

bool ContentStore::exists(const hash::Digest& digest) const {
  return backend_.exists(hash::to_hex(digest));
}

bool ContentStore::put(const hash::Digest& digest, const Bytes& data) {
  if (verify_puts_) {
    verified_puts_++;
    if (hasher_.hash(data) != digest) {
      const std::string key = hash::to_hex(digest);
      put_requests_++;
      BOOST_LOG_TRIVIAL(error) << "Content store: Bytes offered for " << key << " hash to a different digest";
      throw IntegrityError("Content store: bytes do not match digest " + key);
    }
  }
  return put_hashed(digest, data);
}

bool ContentStore::put_hashed(const hash::Digest& digest, const Bytes& data) {
  const std::string key = hash::to_hex(digest);
  put_requests_++;

  Stripe& stripe = stripe_for(digest);
  claim(stripe, key);
  bool written = false;
  try {
    written = store_claimed(key, data);
  } catch (...) {
    release(stripe, key);
    throw;
  }
  release(stripe, key);
  return written;
}

Bytes ContentStore::get(const hash::Digest& digest) const {
  return backend_.get(hash::to_hex(digest));
}

void ContentStore::remove(const hash::Digest& digest) {
  const std::string key = hash::to_hex(digest);
  Stripe& stripe = stripe_for(digest);
  claim(stripe, key);
  try {
    backend_.remove(key);
  } catch (...) {
    release(stripe, key);
    throw;
  }
  release(stripe, key);
  BOOST_LOG_TRIVIAL(info) << "Content store: Removed " << key;
}


//==============================================
// GETTERS
//==============================================

ContentStore::Stats ContentStore::stats() const {
  Stats stats;
  stats.put_requests = put_requests_.load();
  stats.chunks_written = chunks_written_.load();
  stats.dedup_hits = dedup_hits_.load();
  stats.bytes_written = bytes_written_.load();
  stats.verified_puts = verified_puts_.load();
  return stats;
}

void ContentStore::reset_stats() {
  put_requests_ = 0;
  chunks_written_ = 0;
  dedup_hits_ = 0;
  bytes_written_ = 0;
  verified_puts_ = 0;
}


//==============================================
// UTILITY METHODS
//==============================================

ContentStore::Stripe& ContentStore::stripe_for(const hash::Digest& digest) const {
  return stripes_[digest[0] % LOCK_STRIPES];
}

void ContentStore::claim(Stripe& stripe, const std::string& key) {
  std::unique_lock<std::mutex> lock(stripe.mutex);
  stripe.released.wait(lock, [&] { return stripe.claimed.count(key) == 0; });
  stripe.claimed.insert(key);
}

void ContentStore::release(Stripe& stripe, const std::string& key) {
  std::lock_guard<std::mutex> lock(stripe.mutex);
  stripe.claimed.erase(key);
  stripe.released.notify_all();
}

bool ContentStore::store_claimed(const std::string& key, const Bytes& data) {
  if (backend_.exists(key)) {
    check_existing(key, data);
    dedup_hits_++;
    BOOST_LOG_TRIVIAL(trace) << "Content store: Dedup hit for " << key;
    return false;
  }

  backend_.put(key, data);
  chunks_written_++;
  bytes_written_ += data.size();
  BOOST_LOG_TRIVIAL(debug) << "Content store: Wrote " << data.size() << " bytes under " << key;
  return true;
}

void ContentStore::check_existing(const std::string& key, const Bytes& data) const {
  std::uintmax_t stored_size = backend_.size(key);
  if (stored_size != data.size()) {
    BOOST_LOG_TRIVIAL(error) << "Content store: Hash collision anomaly on " << key << ": stored "
                             << stored_size << " bytes, offered " << data.size();
    throw IntegrityError("Content store: hash collision anomaly on " + key +
                         " (stored " + std::to_string(stored_size) + " bytes, offered " +
                         std::to_string(data.size()) + ")");
  }

  if (compare_existing_ && backend_.get(key) != data) {
    BOOST_LOG_TRIVIAL(error) << "Content store: Hash collision anomaly on " << key << ": contents differ";
    throw IntegrityError("Content store: hash collision anomaly on " + key + " (contents differ)");
  }
}

} // namespace store
} // namespace bv

#ifndef BV_STORE_CONTENT_STORE_HPP
#define BV_STORE_CONTENT_STORE_HPP

#include <array>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <set>
#include <string>
#include "common/types.hpp"
#include "hash/digest.hpp"
#include "hash/hasher.hpp"
#include "store/backend.hpp"

namespace bv {
namespace store {

// Content-addressed view of a backend: every value is keyed by its digest,
// so a key always maps to the same bytes and rewrites are no-ops.
class ContentStore {
public:
  struct Stats {
    uint64_t put_requests = 0;
    uint64_t chunks_written = 0;
    uint64_t dedup_hits = 0;
    uint64_t bytes_written = 0;
    uint64_t verified_puts = 0;
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ContentStore(StorageBackend& backend, hash::HashAlgorithm algorithm,
               const StoreConfig& config = StoreConfig{});


  // ---- CORE STORAGE OPERATIONS ----
  bool exists(const hash::Digest& digest) const;
  // Stores data under digest unless already present. Returns true if bytes
  // were written, false on a dedup hit. Throws IntegrityError if data does
  // not belong under digest.
  bool put(const hash::Digest& digest, const Bytes& data);
  // Same as put, for callers that computed digest from data with hasher()
  bool put_hashed(const hash::Digest& digest, const Bytes& data);
  // Throws NotFound if absent, IoError on backend failure
  Bytes get(const hash::Digest& digest) const;
  // Throws NotFound if absent
  void remove(const hash::Digest& digest);


  // ---- GETTERS ----
  Stats stats() const;
  void reset_stats();
  const hash::Hasher& hasher() const { return hasher_; }
  hash::HashAlgorithm algorithm() const { return hasher_.algorithm(); }
  StorageBackend& backend() { return backend_; }

private:
  static constexpr std::size_t LOCK_STRIPES = 64;

  // ---- PARAMETERS ----
  StorageBackend& backend_;
  hash::Hasher hasher_;
  bool verify_puts_;
  bool compare_existing_;

  // Keys being written or removed. A stripe's mutex guards only its claim
  // set, backend I/O runs with the key claimed and the mutex released.
  struct Stripe {
    std::mutex mutex;
    std::condition_variable released;
    std::set<std::string> claimed;
  };
  mutable std::array<Stripe, LOCK_STRIPES> stripes_;

  std::atomic<uint64_t> put_requests_{0};
  std::atomic<uint64_t> chunks_written_{0};
  std::atomic<uint64_t> dedup_hits_{0};
  std::atomic<uint64_t> bytes_written_{0};
  std::atomic<uint64_t> verified_puts_{0};

  Stripe& stripe_for(const hash::Digest& digest) const;
  // Blocks until no other thread holds key, then holds it
  void claim(Stripe& stripe, const std::string& key);
  void release(Stripe& stripe, const std::string& key);
  bool store_claimed(const std::string& key, const Bytes& data);
  // Checks an existing entry against data about to be deduplicated
  void check_existing(const std::string& key, const Bytes& data) const;
};

} // namespace store
} // namespace bv

#endif // BV_STORE_CONTENT_STORE_HPP

#ifndef BV_STORE_REF_STORE_HPP
#define BV_STORE_REF_STORE_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "hash/digest.hpp"
#include "store/backend.hpp"

namespace bv {
namespace store {

struct RefEntry {
  int64_t timestamp = 0;  // seconds since the epoch
  hash::Digest root{};
};

// Named pointers to backups. Each name keeps an append-only history of root
// hashes stored as text under refs/<name>.
class RefStore {
public:
  explicit RefStore(StorageBackend& backend);

  // ---- UPDATES ----
  // Appends root to the history of name; timestamp 0 means now
  void record(const std::string& name, const hash::Digest& root, int64_t timestamp = 0);
  // Throws NotFound if name has no history
  void remove(const std::string& name);


  // ---- QUERIES ----
  std::optional<hash::Digest> latest(const std::string& name) const;
  // Oldest entry first, empty if name is unknown
  std::vector<RefEntry> history(const std::string& name) const;
  std::vector<std::string> names() const;

  // Names are limited to [A-Za-z0-9._-] and may not start with a dot
  static bool is_valid_name(const std::string& name);

private:
  static constexpr const char* PREFIX = "refs/";

  StorageBackend& backend_;
  mutable std::mutex mutex_;

  std::string key_for(const std::string& name) const;
  std::vector<RefEntry> parse(const std::string& name, const Bytes& data) const;
};

} // namespace store
} // namespace bv

#endif // BV_STORE_REF_STORE_HPP

#ifndef BV_STORE_BACKEND_HPP
#define BV_STORE_BACKEND_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "common/types.hpp"

namespace bv {
namespace store {

// Key/value contract every persistence backend fulfils. Implementations must
// be safe for concurrent calls on different keys.
class StorageBackend {
public:
  virtual ~StorageBackend() = default;

  // ---- CORE STORAGE OPERATIONS ----
  virtual bool exists(const std::string& key) const = 0;
  // Writes or replaces the value under key; throws IoError on failure
  virtual void put(const std::string& key, const Bytes& data) = 0;
  // Throws NotFound if absent, IoError on failure
  virtual Bytes get(const std::string& key) const = 0;
  // Throws NotFound if absent
  virtual void remove(const std::string& key) = 0;


  // ---- QUERY OPERATIONS ----
  // Size of the stored value in bytes, throws NotFound if absent
  virtual std::uintmax_t size(const std::string& key) const = 0;
  virtual std::vector<std::string> list() const = 0;
};

enum class BackendType {
  Memory,
  Filesystem
};

struct StoreConfig {
  BackendType backend = BackendType::Filesystem;
  // Root directory of the filesystem backend
  std::string path = "bv_store";
  // Re-hash bytes on put and reject ones that do not match their key
  bool verify_puts = true;
  // On a dedup hit, compare stored bytes instead of only their length
  bool compare_existing = false;
};

// Creates the backend selected by config
std::unique_ptr<StorageBackend> make_backend(const StoreConfig& config);

const char* backend_name(BackendType type);
// Throws ConfigError for unknown names
BackendType backend_from_name(const std::string& name);

} // namespace store
} // namespace bv

#endif // BV_STORE_BACKEND_HPP

#ifndef BV_STORE_MEMORY_BACKEND_HPP
#define BV_STORE_MEMORY_BACKEND_HPP

#include <mutex>
#include <unordered_map>
#include "store/backend.hpp"

namespace bv {
namespace store {

// Process-local backend, used for tests and dry runs
class MemoryBackend : public StorageBackend {
public:
  MemoryBackend() = default;

  bool exists(const std::string& key) const override;
  void put(const std::string& key, const Bytes& data) override;
  Bytes get(const std::string& key) const override;
  void remove(const std::string& key) override;

  std::uintmax_t size(const std::string& key) const override;
  std::vector<std::string> list() const override;

  std::size_t count() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Bytes> entries_;
};

} // namespace store
} // namespace bv

#endif // BV_STORE_MEMORY_BACKEND_HPP

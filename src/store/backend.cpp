#include "store/backend.hpp"
#include "store/filesystem_backend.hpp"
#include "store/memory_backend.hpp"
#include "common/error.hpp"
#include <boost/log/trivial.hpp>

namespace bv {
namespace store {

std::unique_ptr<StorageBackend> make_backend(const StoreConfig& config) {
  switch (config.backend) {
    case BackendType::Memory:
      BOOST_LOG_TRIVIAL(info) << "Backend: Using in-memory backend";
      return std::make_unique<MemoryBackend>();

    case BackendType::Filesystem:
      if (config.path.empty()) {
        throw ConfigError("Backend: filesystem backend requires a path");
      }
      BOOST_LOG_TRIVIAL(info) << "Backend: Using filesystem backend at " << config.path;
      return std::make_unique<FilesystemBackend>(config.path);
  }
  throw ConfigError("Backend: unsupported backend type");
}

const char* backend_name(BackendType type) {
  switch (type) {
    case BackendType::Memory:     return "memory";
    case BackendType::Filesystem: return "filesystem";
    default:                      return "unknown";
  }
}

BackendType backend_from_name(const std::string& name) {
  if (name == "memory")     return BackendType::Memory;
  if (name == "filesystem") return BackendType::Filesystem;
  throw ConfigError("Unknown storage backend: " + name);
}

} // namespace store
} // namespace bv

#include "store/memory_backend.hpp"
#include "common/error.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace bv {
namespace store {

bool MemoryBackend::exists(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(key) > 0;
}

void MemoryBackend::put(const std::string& key, const Bytes& data) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_[key] = data;
  BOOST_LOG_TRIVIAL(trace) << "Memory backend: Stored " << data.size() << " bytes under " << key;
}

Bytes MemoryBackend::get(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    throw NotFound("Memory backend: no entry for key " + key, key);
  }
  return it->second;
}

void MemoryBackend::remove(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.erase(key) == 0) {
    throw NotFound("Memory backend: no entry for key " + key, key);
  }
}

std::uintmax_t MemoryBackend::size(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    throw NotFound("Memory backend: no entry for key " + key, key);
  }
  return it->second.size();
}

std::vector<std::string> MemoryBackend::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  keys.reserve(entries_.size());
  for (const auto& entry : entries_) {
    keys.push_back(entry.first);
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

std::size_t MemoryBackend::count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace store
} // namespace bv

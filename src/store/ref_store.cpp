#include "store/ref_store.hpp"
#include "common/error.hpp"
#include <chrono>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace bv {
namespace store {

RefStore::RefStore(StorageBackend& backend) : backend_(backend) {}


//==============================================
// UPDATES
//==============================================

void RefStore::record(const std::string& name, const hash::Digest& root, int64_t timestamp) {
  const std::string key = key_for(name);
  if (timestamp == 0) {
    timestamp = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  }

  std::lock_guard<std::mutex> lock(mutex_);

  Bytes data;
  if (backend_.exists(key)) {
    data = backend_.get(key);
  }

  std::string line = std::to_string(timestamp) + " " + hash::to_hex(root) + "\n";
  data.insert(data.end(), line.begin(), line.end());
  backend_.put(key, data);

  BOOST_LOG_TRIVIAL(info) << "Ref store: " << name << " -> " << hash::to_hex(root);
}

void RefStore::remove(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  backend_.remove(key_for(name));
  BOOST_LOG_TRIVIAL(info) << "Ref store: Removed " << name;
}


//==============================================
// QUERIES
//==============================================

std::optional<hash::Digest> RefStore::latest(const std::string& name) const {
  auto entries = history(name);
  if (entries.empty()) {
    return std::nullopt;
  }
  return entries.back().root;
}

std::vector<RefEntry> RefStore::history(const std::string& name) const {
  const std::string key = key_for(name);
  std::lock_guard<std::mutex> lock(mutex_);
  if (!backend_.exists(key)) {
    return {};
  }
  return parse(name, backend_.get(key));
}

std::vector<std::string> RefStore::names() const {
  const std::string prefix(PREFIX);
  std::vector<std::string> result;
  for (const auto& key : backend_.list()) {
    if (key.compare(0, prefix.size(), prefix) == 0) {
      result.push_back(key.substr(prefix.size()));
    }
  }
  return result;
}

bool RefStore::is_valid_name(const std::string& name) {
  if (name.empty() || name.front() == '.') {
    return false;
  }
  for (char c : name) {
    bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
    if (!alnum && c != '.' && c != '_' && c != '-') {
      return false;
    }
  }
  return true;
}


//==============================================
// UTILITY METHODS
//==============================================

std::string RefStore::key_for(const std::string& name) const {
  if (!is_valid_name(name)) {
    throw ConfigError("Ref store: invalid backup name: " + name);
  }
  return std::string(PREFIX) + name;
}

std::vector<RefEntry> RefStore::parse(const std::string& name, const Bytes& data) const {
  std::vector<RefEntry> entries;
  std::istringstream input(std::string(data.begin(), data.end()));
  std::string line;

  while (std::getline(input, line)) {
    if (line.empty()) {
      continue;
    }
    std::istringstream fields(line);
    RefEntry entry;
    std::string hex;
    if (!(fields >> entry.timestamp >> hex) || !hash::is_digest_hex(hex)) {
      BOOST_LOG_TRIVIAL(error) << "Ref store: Malformed history line for " << name << ": " << line;
      throw IntegrityError("Ref store: malformed history for " + name);
    }
    entry.root = hash::digest_from_hex(hex);
    entries.push_back(entry);
  }
  return entries;
}

} // namespace store
} // namespace bv

#include "store/filesystem_backend.hpp"
#include "common/error.hpp"
#include "hash/digest.hpp"
#include <algorithm>
#include <atomic>
#include <fstream>
#include <functional>
#include <thread>
#include <boost/log/trivial.hpp>

namespace bv {
namespace store {

namespace {

constexpr const char* TEMP_MARKER = ".tmp.";

std::string temp_suffix() {
  static std::atomic<uint64_t> counter{0};
  auto thread_hash = std::hash<std::thread::id>{}(std::this_thread::get_id());
  return std::string(TEMP_MARKER) + std::to_string(thread_hash) + "." + std::to_string(counter++);
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize backend with base directory path and ensure it exists
FilesystemBackend::FilesystemBackend(const std::filesystem::path& base_path)
  : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Filesystem backend: Initializing with base path: " << base_path_.string();
  try {
    check_directory_exists(base_path_);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Filesystem backend: Cannot create base path: " << e.what();
    throw IoError("Filesystem backend: cannot create base path " + base_path_.string() + ": " + e.what());
  }
  BOOST_LOG_TRIVIAL(debug) << "Filesystem backend: Directory created/verified at: " << base_path_.string();
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

bool FilesystemBackend::exists(const std::string& key) const {
  std::filesystem::path file_path = path_for_key(key);
  std::error_code ec;
  bool found = std::filesystem::is_regular_file(file_path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    throw IoError("Filesystem backend: cannot stat " + file_path.string() + ": " + ec.message());
  }
  BOOST_LOG_TRIVIAL(trace) << "Filesystem backend: Key " << key << (found ? " exists" : " not found");
  return found;
}

void FilesystemBackend::put(const std::string& key, const Bytes& data) {
  std::filesystem::path file_path = path_for_key(key);
  std::filesystem::path temp_path = file_path;
  temp_path += temp_suffix();

  try {
    check_directory_exists(file_path.parent_path());
  } catch (const std::filesystem::filesystem_error& e) {
    throw IoError("Filesystem backend: cannot create directory for " + key + ": " + e.what());
  }

  {
    // Open output file in binary mode so bytes land unmodified
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      BOOST_LOG_TRIVIAL(error) << "Filesystem backend: Failed to create file: " << temp_path.string();
      throw IoError("Filesystem backend: failed to create file " + temp_path.string());
    }
    if (!data.empty()) {
      file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    file.close();
    if (!file) {
      std::error_code ignored;
      std::filesystem::remove(temp_path, ignored);
      BOOST_LOG_TRIVIAL(error) << "Filesystem backend: Failed to write file: " << temp_path.string();
      throw IoError("Filesystem backend: failed to write " + temp_path.string());
    }
  }

  // Rename is atomic, readers never observe a half-written object
  std::error_code ec;
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    BOOST_LOG_TRIVIAL(error) << "Filesystem backend: Failed to publish " << file_path.string() << ": " << ec.message();
    throw IoError("Filesystem backend: failed to publish " + file_path.string() + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(debug) << "Filesystem backend: Stored " << data.size() << " bytes with key: " << key;
}

Bytes FilesystemBackend::get(const std::string& key) const {
  std::filesystem::path file_path = path_for_key(key);
  verify_file_exists(file_path, key);

  std::ifstream file(file_path, std::ios::binary | std::ios::ate);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Filesystem backend: Failed to open file: " << file_path.string();
    throw IoError("Filesystem backend: failed to open " + file_path.string());
  }

  auto length = file.tellg();
  if (length < 0) {
    throw IoError("Filesystem backend: cannot determine size of " + file_path.string());
  }
  file.seekg(0);

  Bytes data(static_cast<std::size_t>(length));
  if (!data.empty() && !file.read(reinterpret_cast<char*>(data.data()), length)) {
    BOOST_LOG_TRIVIAL(error) << "Filesystem backend: Short read on " << file_path.string();
    throw IoError("Filesystem backend: short read on " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(trace) << "Filesystem backend: Read " << data.size() << " bytes for key: " << key;
  return data;
}

void FilesystemBackend::remove(const std::string& key) {
  BOOST_LOG_TRIVIAL(debug) << "Filesystem backend: Removing key: " << key;

  std::filesystem::path file_path = path_for_key(key);
  verify_file_exists(file_path, key);

  std::error_code ec;
  if (!std::filesystem::remove(file_path, ec) || ec) {
    BOOST_LOG_TRIVIAL(error) << "Filesystem backend: Failed to remove file with key: " << key;
    throw IoError("Filesystem backend: failed to remove " + file_path.string());
  }

  // Clean up empty parent directories up to base_path_
  auto current = file_path.parent_path();
  while (current != base_path_ && current.string().size() > base_path_.string().size()) {
    if (!std::filesystem::is_empty(current, ec) || ec) {
      break;
    }
    std::filesystem::remove(current, ec);
    current = current.parent_path();
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::uintmax_t FilesystemBackend::size(const std::string& key) const {
  std::filesystem::path file_path = path_for_key(key);
  verify_file_exists(file_path, key);

  std::error_code ec;
  std::uintmax_t file_size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    throw IoError("Filesystem backend: cannot stat " + file_path.string() + ": " + ec.message());
  }
  return file_size;
}

std::vector<std::string> FilesystemBackend::list() const {
  std::vector<std::string> keys;
  std::error_code ec;
  for (auto it = std::filesystem::recursive_directory_iterator(base_path_, ec);
       it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      throw IoError("Filesystem backend: cannot list " + base_path_.string() + ": " + ec.message());
    }
    if (!it->is_regular_file()) {
      continue;
    }
    // Skip writes still in progress
    if (it->path().filename().string().find(TEMP_MARKER) != std::string::npos) {
      continue;
    }
    keys.push_back(key_for_path(it->path()));
  }
  if (ec) {
    throw IoError("Filesystem backend: cannot list " + base_path_.string() + ": " + ec.message());
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}


//==============================================
// PATH SUPPORT
//==============================================

std::filesystem::path FilesystemBackend::path_for_key(const std::string& key) const {
  validate_key(key);

  if (!hash::is_digest_hex(key)) {
    return base_path_ / std::filesystem::path(key);
  }

  std::filesystem::path path = base_path_;
  for (std::size_t i = 0; i < 6; i += 2) {
    path /= key.substr(i, 2);
  }
  path /= key.substr(6);
  return path;
}

void FilesystemBackend::validate_key(const std::string& key) const {
  if (key.empty() || key.front() == '/' || key.find('\\') != std::string::npos ||
      key.find(TEMP_MARKER) != std::string::npos) {
    throw IoError("Filesystem backend: invalid key: " + key);
  }
  for (const auto& part : std::filesystem::path(key)) {
    if (part == ".." || part == ".") {
      throw IoError("Filesystem backend: invalid key: " + key);
    }
  }
}

std::string FilesystemBackend::key_for_path(const std::filesystem::path& file_path) const {
  std::filesystem::path relative = std::filesystem::relative(file_path, base_path_);

  std::vector<std::string> parts;
  for (const auto& part : relative) {
    parts.push_back(part.string());
  }

  // Sharded digest layout: three 2-character directories and the remainder
  if (parts.size() == 4 && parts[0].size() == 2 && parts[1].size() == 2 && parts[2].size() == 2) {
    std::string joined = parts[0] + parts[1] + parts[2] + parts[3];
    if (hash::is_digest_hex(joined)) {
      return joined;
    }
  }
  return relative.generic_string();
}


//==============================================
// UTILITY METHODS
//==============================================

void FilesystemBackend::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

void FilesystemBackend::verify_file_exists(const std::filesystem::path& file_path,
                                           const std::string& key) const {
  if (!std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(debug) << "Filesystem backend: File not found: " << file_path.string();
    throw NotFound("Filesystem backend: no object for key " + key, key);
  }
}

} // namespace store
} // namespace bv

#ifndef BV_STORE_FILESYSTEM_BACKEND_HPP
#define BV_STORE_FILESYSTEM_BACKEND_HPP

#include <filesystem>
#include "store/backend.hpp"

namespace bv {
namespace store {

// Local directory backend. Digest keys are sharded into
// {base_path}/{key[0:2]}/{key[2:4]}/{key[4:6]}/{key[6:]}, any other key is a
// relative path below base_path.
class FilesystemBackend : public StorageBackend {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FilesystemBackend(const std::filesystem::path& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  bool exists(const std::string& key) const override;
  // Writes to a temporary file and renames it into place
  void put(const std::string& key, const Bytes& data) override;
  Bytes get(const std::string& key) const override;
  // Removes the file and prunes shard directories left empty
  void remove(const std::string& key) override;


  // ---- QUERY OPERATIONS ----
  std::uintmax_t size(const std::string& key) const override;
  std::vector<std::string> list() const override;

  // Path a key is stored at
  std::filesystem::path path_for_key(const std::string& key) const;
  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;


  // ---- PATH SUPPORT ----
  // Rejects keys that would escape base_path
  void validate_key(const std::string& key) const;
  // Inverse of path_for_key for files found while listing
  std::string key_for_path(const std::filesystem::path& file_path) const;


  // ---- UTILITY METHODS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Throws NotFound if nothing is stored at file_path
  void verify_file_exists(const std::filesystem::path& file_path, const std::string& key) const;
};

} // namespace store
} // namespace bv

#endif // BV_STORE_FILESYSTEM_BACKEND_HPP

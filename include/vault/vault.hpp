#ifndef BV_VAULT_HPP
#define BV_VAULT_HPP

#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <boost/asio/thread_pool.hpp>
#include "config/config.hpp"
#include "hash/digest.hpp"
#include "pipeline/backup_pipeline.hpp"
#include "pipeline/restore_pipeline.hpp"
#include "pipeline/sink.hpp"
#include "store/backend.hpp"
#include "store/content_store.hpp"
#include "store/ref_store.hpp"
#include "utils/cancellation.hpp"
#include "verify/verifier.hpp"

namespace bv {
namespace vault {

// Entry point that owns the backend, the content store, the reference store
// and the worker pool shared by every operation.
class Vault {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Validates config and opens the backend it selects
  explicit Vault(const config::VaultConfig& config);
  // Uses backend instead of the one named in config
  Vault(const config::VaultConfig& config, std::unique_ptr<store::StorageBackend> backend);
  ~Vault();

  Vault(const Vault&) = delete;
  Vault& operator=(const Vault&) = delete;


  // ---- BACKUP ----
  // chunk_size 0 selects the configured chunk size
  pipeline::BackupResult backup(std::istream& source, uint64_t chunk_size = 0);
  // Backs up the file or device at path and records the root under ref_name
  // when it is not empty
  pipeline::BackupResult backup_file(const std::string& path, const std::string& ref_name = "",
                                     uint64_t chunk_size = 0);


  // ---- VERIFICATION ----
  verify::VerificationReport verify(const hash::Digest& root);
  verify::ChangeReport compare(const hash::Digest& root, std::istream& source);
  verify::ChangeReport compare_file(const hash::Digest& root, const std::string& path);


  // ---- RESTORE ----
  pipeline::RestoreResult restore(const hash::Digest& root, pipeline::Sink& destination);
  pipeline::RestoreResult restore_file(const hash::Digest& root, const std::string& path);


  // ---- REFERENCES ----
  // Accepts a 64 character root hash or a reference name. Throws NotFound if
  // the name has no history.
  hash::Digest resolve(const std::string& root_or_name) const;


  // ---- CONTROL ----
  // Aborts running and future operations until reset_cancellation()
  void cancel();
  void reset_cancellation();


  // ---- GETTERS ----
  store::ContentStore& store() { return *store_; }
  store::RefStore& refs() { return *refs_; }
  store::StorageBackend& backend() { return *backend_; }
  const config::VaultConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  config::VaultConfig config_;
  std::unique_ptr<store::StorageBackend> backend_;
  std::unique_ptr<store::ContentStore> store_;
  std::unique_ptr<store::RefStore> refs_;
  boost::asio::thread_pool pool_;
  utils::CancellationToken token_;

  void init_components();
};

} // namespace vault
} // namespace bv

#endif // BV_VAULT_HPP

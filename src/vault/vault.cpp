#include "vault/vault.hpp"
#include <fstream>
#include <boost/log/trivial.hpp>
#include "common/error.hpp"

namespace bv {
namespace vault {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Vault::Vault(const config::VaultConfig& config)
  : config_(config)
  , pool_(config.pipeline.workers == 0 ? 1 : config.pipeline.workers) {
  config_.validate();
  backend_ = store::make_backend(config_.store);
  init_components();
}

Vault::Vault(const config::VaultConfig& config, std::unique_ptr<store::StorageBackend> backend)
  : config_(config)
  , backend_(std::move(backend))
  , pool_(config.pipeline.workers == 0 ? 1 : config.pipeline.workers) {
  config_.validate();
  if (!backend_) {
    throw ConfigError("Vault: no storage backend supplied");
  }
  init_components();
}

Vault::~Vault() {
  token_.cancel();
  pool_.join();
  BOOST_LOG_TRIVIAL(debug) << "Vault: Shut down";
}

void Vault::init_components() {
  try {
    store_ = std::make_unique<store::ContentStore>(*backend_, config_.algorithm, config_.store);
    refs_ = std::make_unique<store::RefStore>(*backend_);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Vault: Failed to initialize components: " << e.what();
    throw;
  }
  BOOST_LOG_TRIVIAL(info) << "Vault: Ready with " << store::backend_name(config_.store.backend)
                          << " backend, " << hash::algorithm_name(config_.algorithm) << ", "
                          << config_.pipeline.workers << " workers";
}


//==============================================
// BACKUP
//==============================================

pipeline::BackupResult Vault::backup(std::istream& source, uint64_t chunk_size) {
  pipeline::PipelineConfig settings = config_.pipeline;
  if (chunk_size != 0) {
    if (chunk_size > pipeline::MAX_CHUNK_SIZE) {
      throw ConfigError("chunk size " + std::to_string(chunk_size) + " exceeds " +
                        std::to_string(pipeline::MAX_CHUNK_SIZE));
    }
    settings.chunk_size = chunk_size;
  }
  pipeline::BackupPipeline backup_pipeline(*store_, pool_, settings);
  return backup_pipeline.run(source, token_);
}

pipeline::BackupResult Vault::backup_file(const std::string& path, const std::string& ref_name,
                                          uint64_t chunk_size) {
  if (!ref_name.empty() && !store::RefStore::is_valid_name(ref_name)) {
    throw ConfigError("invalid reference name '" + ref_name + "'");
  }

  std::ifstream source(path, std::ios::binary);
  if (!source) {
    throw IoError("cannot open backup source " + path);
  }
  pipeline::BackupResult result = backup(source, chunk_size);

  if (!ref_name.empty()) {
    refs_->record(ref_name, result.root);
    BOOST_LOG_TRIVIAL(info) << "Vault: Recorded " << path << " as '" << ref_name << "'";
  }
  return result;
}


//==============================================
// VERIFICATION
//==============================================

verify::VerificationReport Vault::verify(const hash::Digest& root) {
  verify::Verifier verifier(*store_, pool_, config_.pipeline);
  return verifier.verify(root, token_);
}

verify::ChangeReport Vault::compare(const hash::Digest& root, std::istream& source) {
  verify::Verifier verifier(*store_, pool_, config_.pipeline);
  return verifier.compare(root, source, token_);
}

verify::ChangeReport Vault::compare_file(const hash::Digest& root, const std::string& path) {
  std::ifstream source(path, std::ios::binary);
  if (!source) {
    throw IoError("cannot open image " + path);
  }
  return compare(root, source);
}


//==============================================
// RESTORE
//==============================================

pipeline::RestoreResult Vault::restore(const hash::Digest& root, pipeline::Sink& destination) {
  pipeline::RestorePipeline restore_pipeline(*store_, pool_, config_.pipeline);
  return restore_pipeline.run(root, destination, token_);
}

pipeline::RestoreResult Vault::restore_file(const hash::Digest& root, const std::string& path) {
  pipeline::FileSink sink(path);
  return restore(root, sink);
}


//==============================================
// REFERENCES
//==============================================

hash::Digest Vault::resolve(const std::string& root_or_name) const {
  if (hash::is_digest_hex(root_or_name)) {
    return hash::digest_from_hex(root_or_name);
  }
  if (!store::RefStore::is_valid_name(root_or_name)) {
    throw ConfigError("'" + root_or_name + "' is neither a root hash nor a reference name");
  }
  const auto root = refs_->latest(root_or_name);
  if (!root) {
    throw NotFound("reference '" + root_or_name + "'", root_or_name);
  }
  return *root;
}


//==============================================
// CONTROL
//==============================================

void Vault::cancel() {
  BOOST_LOG_TRIVIAL(info) << "Vault: Cancellation requested";
  token_.cancel();
}

void Vault::reset_cancellation() {
  token_.reset();
}

} // namespace vault
} // namespace bv

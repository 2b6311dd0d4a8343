#ifndef BV_CONFIG_HPP
#define BV_CONFIG_HPP

#include <istream>
#include <string>
#include "hash/digest.hpp"
#include "logger/logger.hpp"
#include "pipeline/pipeline_config.hpp"
#include "store/backend.hpp"

namespace bv {
namespace config {

struct VaultConfig {
  store::StoreConfig store;
  pipeline::PipelineConfig pipeline;
  hash::HashAlgorithm algorithm = hash::HashAlgorithm::SHA256;
  logging::LogConfig log;

  // Throws ConfigError describing the first invalid setting
  void validate() const;
};

// Reads "key: value" lines over the defaults. Blank lines and lines starting
// with '#' are skipped, values may be double quoted. Throws ConfigError for
// unknown keys and malformed values.
VaultConfig parse_config(std::istream& in, const std::string& origin = "<stream>");

// Throws ConfigError if path cannot be opened
VaultConfig load_config_file(const std::string& path);

} // namespace config
} // namespace bv

#endif // BV_CONFIG_HPP

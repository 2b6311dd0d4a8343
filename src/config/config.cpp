#include "config/config.hpp"
#include <fstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include "common/error.hpp"

namespace bv {
namespace config {

namespace {

std::string trim(const std::string& s) {
  std::size_t a = 0;
  while (a < s.size() && (s[a] == ' ' || s[a] == '\t')) {
    ++a;
  }
  std::size_t b = s.size();
  while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r')) {
    --b;
  }
  return s.substr(a, b - a);
}

uint64_t parse_unsigned(const std::string& key, const std::string& value) {
  if (value.empty() || value[0] == '-') {
    throw ConfigError("'" + key + "' expects a non-negative integer, got '" + value + "'");
  }
  std::size_t used = 0;
  uint64_t result = 0;
  try {
    result = std::stoull(value, &used);
  } catch (const std::exception&) {
    throw ConfigError("'" + key + "' expects a non-negative integer, got '" + value + "'");
  }
  if (used != value.size()) {
    throw ConfigError("'" + key + "' expects a non-negative integer, got '" + value + "'");
  }
  return result;
}

bool parse_bool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "yes" || value == "on" || value == "1") {
    return true;
  }
  if (value == "false" || value == "no" || value == "off" || value == "0") {
    return false;
  }
  throw ConfigError("'" + key + "' expects true or false, got '" + value + "'");
}

} // anonymous namespace


//==============================================
// VALIDATION
//==============================================

void VaultConfig::validate() const {
  if (pipeline.chunk_size == 0) {
    throw ConfigError("chunk_size must be greater than zero");
  }
  if (pipeline.chunk_size > pipeline::MAX_CHUNK_SIZE) {
    throw ConfigError("chunk_size must not exceed " + std::to_string(pipeline::MAX_CHUNK_SIZE));
  }
  if (pipeline.workers == 0) {
    throw ConfigError("workers must be greater than zero");
  }
  if (pipeline.max_in_flight == 0) {
    throw ConfigError("max_in_flight must be greater than zero");
  }
  if (store.backend == store::BackendType::Filesystem && store.path.empty()) {
    throw ConfigError("store_path must be set for the filesystem backend");
  }
}


//==============================================
// PARSING
//==============================================

VaultConfig parse_config(std::istream& in, const std::string& origin) {
  VaultConfig cfg;

  std::string line;
  std::size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    line = trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }

    const auto pos = line.find(':');
    if (pos == std::string::npos) {
      throw ConfigError(origin + ":" + std::to_string(line_number) + ": expected 'key: value'");
    }

    const std::string key = trim(line.substr(0, pos));
    std::string val = trim(line.substr(pos + 1));
    if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
      val = val.substr(1, val.size() - 2);
    }

    if (key == "store_backend")
      cfg.store.backend = store::backend_from_name(val);
    else if (key == "store_path")
      cfg.store.path = val;
    else if (key == "verify_puts")
      cfg.store.verify_puts = parse_bool(key, val);
    else if (key == "compare_existing")
      cfg.store.compare_existing = parse_bool(key, val);
    else if (key == "chunk_size")
      cfg.pipeline.chunk_size = parse_unsigned(key, val);
    else if (key == "workers")
      cfg.pipeline.workers = static_cast<std::size_t>(parse_unsigned(key, val));
    else if (key == "max_in_flight")
      cfg.pipeline.max_in_flight = static_cast<std::size_t>(parse_unsigned(key, val));
    else if (key == "verify_on_restore")
      cfg.pipeline.verify_on_restore = parse_bool(key, val);
    else if (key == "hash_algorithm")
      cfg.algorithm = hash::algorithm_from_name(val);
    else if (key == "log_file")
      cfg.log.file = val;
    else if (key == "log_level")
      cfg.log.level = logging::parse_severity(val);
    else if (key == "log_console")
      cfg.log.console = parse_bool(key, val);
    else if (key == "log_rotation_size")
      cfg.log.rotation_size = static_cast<std::size_t>(parse_unsigned(key, val));
    else
      throw ConfigError(origin + ":" + std::to_string(line_number) + ": unknown key '" + key + "'");
  }

  return cfg;
}

VaultConfig load_config_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file " + path);
  }
  VaultConfig cfg = parse_config(in, path);
  BOOST_LOG_TRIVIAL(debug) << "Config: Loaded " << path;
  return cfg;
}

} // namespace config
} // namespace bv

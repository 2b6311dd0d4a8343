#ifndef BV_COMMON_ERROR_HPP
#define BV_COMMON_ERROR_HPP

#include <stdexcept>
#include <string>

namespace bv {

class VaultError : public std::runtime_error {
public:
  explicit VaultError(const std::string& message)
    : std::runtime_error(message) {}
};

// Source, destination or backend I/O failure
class IoError : public VaultError {
public:
  explicit IoError(const std::string& message)
    : VaultError("I/O error: " + message) {}
};

// Requested key is absent from the store
class NotFound : public VaultError {
public:
  NotFound(const std::string& message, const std::string& key)
    : VaultError("Not found: " + message)
    , key_(key) {}

  const std::string& key() const { return key_; }

private:
  std::string key_;
};

class CorruptManifest : public VaultError {
public:
  explicit CorruptManifest(const std::string& message)
    : VaultError("Corrupt manifest: " + message) {}
};

// Recomputed hash or stored length disagrees with what was recorded
class IntegrityError : public VaultError {
public:
  explicit IntegrityError(const std::string& message)
    : VaultError("Integrity error: " + message) {}
};

class ConfigError : public VaultError {
public:
  explicit ConfigError(const std::string& message)
    : VaultError("Configuration error: " + message) {}
};

class OperationCancelled : public VaultError {
public:
  explicit OperationCancelled(const std::string& message)
    : VaultError("Cancelled: " + message) {}
};

} // namespace bv

#endif // BV_COMMON_ERROR_HPP

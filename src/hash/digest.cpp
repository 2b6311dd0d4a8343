#include "hash/digest.hpp"
#include "common/error.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace bv {
namespace hash {

//==============================================
// ALGORITHM NAMES
//==============================================

const char* algorithm_name(HashAlgorithm algorithm) {
  switch (algorithm) {
    case HashAlgorithm::SHA256:      return "sha256";
    case HashAlgorithm::SHA3_256:    return "sha3-256";
    case HashAlgorithm::BLAKE2S_256: return "blake2s256";
    default:                         return "unknown";
  }
}

HashAlgorithm algorithm_from_name(const std::string& name) {
  if (name == "sha256")     return HashAlgorithm::SHA256;
  if (name == "sha3-256")   return HashAlgorithm::SHA3_256;
  if (name == "blake2s256") return HashAlgorithm::BLAKE2S_256;
  throw ConfigError("Unknown hash algorithm: " + name);
}

bool is_known_algorithm(uint8_t id) {
  return id >= static_cast<uint8_t>(HashAlgorithm::SHA256) &&
         id <= static_cast<uint8_t>(HashAlgorithm::BLAKE2S_256);
}


//==============================================
// HEX CONVERSION
//==============================================

std::string to_hex(const Digest& digest) {
  std::stringstream ss;
  for (uint8_t byte : digest) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

bool is_digest_hex(const std::string& text) {
  if (text.size() != DIGEST_SIZE * 2) {
    return false;
  }
  for (char c : text) {
    bool digit = c >= '0' && c <= '9';
    bool lower = c >= 'a' && c <= 'f';
    bool upper = c >= 'A' && c <= 'F';
    if (!digit && !lower && !upper) {
      return false;
    }
  }
  return true;
}

Digest digest_from_hex(const std::string& hex) {
  if (!is_digest_hex(hex)) {
    throw std::invalid_argument("Digest: not a 64 character hex string: " + hex);
  }

  Digest digest{};
  for (std::size_t i = 0; i < DIGEST_SIZE; ++i) {
    digest[i] = static_cast<uint8_t>(std::stoul(hex.substr(i * 2, 2), nullptr, 16));
  }
  return digest;
}

} // namespace hash
} // namespace bv

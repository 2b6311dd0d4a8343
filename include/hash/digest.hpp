#ifndef BV_HASH_DIGEST_HPP
#define BV_HASH_DIGEST_HPP

#include <array>
#include <cstdint>
#include <string>

namespace bv {
namespace hash {

static constexpr std::size_t DIGEST_SIZE = 32;  // 256-bit digests only

using Digest = std::array<uint8_t, DIGEST_SIZE>;

// Identifiers are persisted in manifests, never renumber them
enum class HashAlgorithm : uint8_t {
  SHA256 = 1,
  SHA3_256 = 2,
  BLAKE2S_256 = 3
};

// ---- ALGORITHM NAMES ----
const char* algorithm_name(HashAlgorithm algorithm);
// Throws ConfigError for unknown names
HashAlgorithm algorithm_from_name(const std::string& name);
// True if id names a supported algorithm
bool is_known_algorithm(uint8_t id);


// ---- HEX CONVERSION ----
std::string to_hex(const Digest& digest);
// Throws std::invalid_argument unless hex is 64 hex characters
Digest digest_from_hex(const std::string& hex);
bool is_digest_hex(const std::string& text);

} // namespace hash
} // namespace bv

#endif // BV_HASH_DIGEST_HPP

#ifndef BV_MANIFEST_CODEC_HPP
#define BV_MANIFEST_CODEC_HPP

#include <cstdint>
#include <boost/endian/conversion.hpp>
#include "common/types.hpp"
#include "manifest/manifest.hpp"

namespace bv {
namespace manifest {

// Deterministic binary encoding of a manifest, big-endian throughout:
//   magic "BVMF" | u16 version | u8 algorithm | u8 reserved (0)
//   u64 chunk_size | u64 total_size | u64 chunk_count | chunk_count * 32 byte digests
class ManifestCodec {
public:
  static constexpr uint16_t FORMAT_VERSION = 1;
  static constexpr std::size_t HEADER_SIZE = 32;
  static constexpr uint8_t MAGIC[4] = {'B', 'V', 'M', 'F'};

  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Identical manifests always encode to identical bytes
  static Bytes serialize(const Manifest& manifest);
  // Throws CorruptManifest if data is not a well-formed manifest
  static Manifest deserialize(const Bytes& data);

private:
  // ---- BUFFER OPERATIONS ----
  static void write_bytes(Bytes& output, const void* data, std::size_t size);
  // Throws CorruptManifest if fewer than size bytes remain
  static void read_bytes(const Bytes& input, std::size_t& offset, void* data, std::size_t size);

  template <typename T>
  static void write_be(Bytes& output, T value) {
    T network_value = boost::endian::native_to_big(value);
    write_bytes(output, &network_value, sizeof(network_value));
  }

  template <typename T>
  static T read_be(const Bytes& input, std::size_t& offset) {
    T network_value;
    read_bytes(input, offset, &network_value, sizeof(network_value));
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace manifest
} // namespace bv

#endif // BV_MANIFEST_CODEC_HPP

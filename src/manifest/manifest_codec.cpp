#include "manifest/manifest_codec.hpp"
#include "common/error.hpp"
#include <cstring>
#include <boost/log/trivial.hpp>

namespace bv {
namespace manifest {

//==============================================
// SERIALIZATION
//==============================================

Bytes ManifestCodec::serialize(const Manifest& manifest) {
  if (!manifest.is_consistent()) {
    BOOST_LOG_TRIVIAL(error) << "Manifest codec: Refusing to encode inconsistent manifest ("
                             << manifest.chunks.size() << " chunks for " << manifest.total_size
                             << " bytes at chunk size " << manifest.chunk_size << ")";
    throw IntegrityError("Manifest codec: chunk count does not match sizes");
  }

  Bytes output;
  output.reserve(HEADER_SIZE + manifest.chunks.size() * hash::DIGEST_SIZE);

  write_bytes(output, MAGIC, sizeof(MAGIC));
  write_be<uint16_t>(output, FORMAT_VERSION);
  uint8_t algorithm = static_cast<uint8_t>(manifest.algorithm);
  write_bytes(output, &algorithm, sizeof(algorithm));
  uint8_t reserved = 0;
  write_bytes(output, &reserved, sizeof(reserved));
  write_be<uint64_t>(output, manifest.chunk_size);
  write_be<uint64_t>(output, manifest.total_size);
  write_be<uint64_t>(output, manifest.chunks.size());

  for (const auto& digest : manifest.chunks) {
    write_bytes(output, digest.data(), digest.size());
  }

  BOOST_LOG_TRIVIAL(debug) << "Manifest codec: Encoded " << manifest.chunks.size()
                           << " chunks into " << output.size() << " bytes";
  return output;
}


//==============================================
// DESERIALIZATION
//==============================================

Manifest ManifestCodec::deserialize(const Bytes& data) {
  if (data.size() < HEADER_SIZE) {
    throw CorruptManifest("header truncated (" + std::to_string(data.size()) + " bytes)");
  }

  std::size_t offset = 0;
  uint8_t magic[sizeof(MAGIC)];
  read_bytes(data, offset, magic, sizeof(magic));
  if (std::memcmp(magic, MAGIC, sizeof(MAGIC)) != 0) {
    throw CorruptManifest("bad magic");
  }

  uint16_t version = read_be<uint16_t>(data, offset);
  if (version != FORMAT_VERSION) {
    throw CorruptManifest("unsupported format version " + std::to_string(version));
  }

  uint8_t algorithm = 0;
  read_bytes(data, offset, &algorithm, sizeof(algorithm));
  if (!hash::is_known_algorithm(algorithm)) {
    throw CorruptManifest("unknown hash algorithm id " + std::to_string(algorithm));
  }

  uint8_t reserved = 0;
  read_bytes(data, offset, &reserved, sizeof(reserved));
  if (reserved != 0) {
    throw CorruptManifest("reserved byte is not zero");
  }

  Manifest manifest;
  manifest.algorithm = static_cast<hash::HashAlgorithm>(algorithm);
  manifest.chunk_size = read_be<uint64_t>(data, offset);
  manifest.total_size = read_be<uint64_t>(data, offset);
  uint64_t count = read_be<uint64_t>(data, offset);

  if (manifest.chunk_size == 0) {
    throw CorruptManifest("chunk size is zero");
  }
  if (count != Manifest::expected_chunk_count(manifest.total_size, manifest.chunk_size)) {
    throw CorruptManifest("chunk count " + std::to_string(count) + " does not match total size " +
                          std::to_string(manifest.total_size));
  }

  // Check the body length before allocating anything sized by count
  std::size_t remaining = data.size() - offset;
  if (remaining % hash::DIGEST_SIZE != 0 || remaining / hash::DIGEST_SIZE != count) {
    throw CorruptManifest("body holds " + std::to_string(remaining) + " bytes, expected " +
                          std::to_string(count) + " digests");
  }

  manifest.chunks.resize(count);
  for (auto& digest : manifest.chunks) {
    read_bytes(data, offset, digest.data(), digest.size());
  }

  BOOST_LOG_TRIVIAL(debug) << "Manifest codec: Decoded " << count << " chunks, "
                           << manifest.total_size << " bytes";
  return manifest;
}


//==============================================
// BUFFER OPERATIONS
//==============================================

void ManifestCodec::write_bytes(Bytes& output, const void* data, std::size_t size) {
  const uint8_t* bytes = static_cast<const uint8_t*>(data);
  output.insert(output.end(), bytes, bytes + size);
}

void ManifestCodec::read_bytes(const Bytes& input, std::size_t& offset, void* data, std::size_t size) {
  if (input.size() - offset < size) {
    throw CorruptManifest("unexpected end of data at offset " + std::to_string(offset));
  }
  std::memcpy(data, input.data() + offset, size);
  offset += size;
}

} // namespace manifest
} // namespace bv

#include "manifest/manifest_store.hpp"
#include "manifest/manifest_codec.hpp"
#include "common/error.hpp"
#include "hash/hasher.hpp"
#include <boost/log/trivial.hpp>

namespace bv {
namespace manifest {

hash::Digest store_manifest(store::ContentStore& store, const Manifest& manifest) {
  if (manifest.algorithm != store.algorithm()) {
    throw ConfigError(std::string("Manifest store: manifest uses ") + hash::algorithm_name(manifest.algorithm) +
                      " but the store hashes with " + hash::algorithm_name(store.algorithm()));
  }

  Bytes encoded = ManifestCodec::serialize(manifest);
  hash::Digest root = store.hasher().hash(encoded);
  store.put_hashed(root, encoded);

  BOOST_LOG_TRIVIAL(info) << "Manifest store: Stored manifest of " << manifest.chunk_count()
                          << " chunks as root " << hash::to_hex(root);
  return root;
}

Manifest load_manifest(const store::ContentStore& store, const hash::Digest& root) {
  const std::string root_hex = hash::to_hex(root);
  BOOST_LOG_TRIVIAL(debug) << "Manifest store: Loading manifest " << root_hex;

  Bytes encoded;
  try {
    encoded = store.get(root);
  } catch (const NotFound&) {
    BOOST_LOG_TRIVIAL(error) << "Manifest store: No manifest under root " << root_hex;
    throw NotFound("manifest " + root_hex + " is not in the store", root_hex);
  }

  Manifest manifest = ManifestCodec::deserialize(encoded);

  // The manifest names its own algorithm, so it stays checkable after the
  // store default changes
  hash::Hasher hasher(manifest.algorithm);
  if (hasher.hash(encoded) != root) {
    BOOST_LOG_TRIVIAL(error) << "Manifest store: Manifest bytes do not hash to root " << root_hex;
    throw IntegrityError("manifest bytes do not hash to root " + root_hex);
  }

  BOOST_LOG_TRIVIAL(info) << "Manifest store: Loaded manifest " << root_hex << " with "
                          << manifest.chunk_count() << " chunks, " << manifest.total_size << " bytes";
  return manifest;
}

} // namespace manifest
} // namespace bv

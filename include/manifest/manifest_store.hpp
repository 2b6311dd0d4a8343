#ifndef BV_MANIFEST_STORE_HPP
#define BV_MANIFEST_STORE_HPP

#include "hash/digest.hpp"
#include "manifest/manifest.hpp"
#include "store/content_store.hpp"

namespace bv {
namespace manifest {

// Encodes manifest, stores it like any other chunk and returns its root hash.
// The root is computed with the store's algorithm, which must match the
// algorithm recorded in the manifest.
hash::Digest store_manifest(store::ContentStore& store, const Manifest& manifest);

// Fetches and decodes the manifest published under root. Throws NotFound or
// IoError from the store, CorruptManifest for malformed bytes and
// IntegrityError if the bytes do not hash to root.
Manifest load_manifest(const store::ContentStore& store, const hash::Digest& root);

} // namespace manifest
} // namespace bv

#endif // BV_MANIFEST_STORE_HPP

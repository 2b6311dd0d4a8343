#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <stdexcept>
#include <thread>
#include "common/error.hpp"
#include "hash/hasher.hpp"
#include "manifest/manifest.hpp"
#include "manifest/manifest_builder.hpp"
#include "manifest/manifest_codec.hpp"
#include "manifest/manifest_store.hpp"
#include "store/content_store.hpp"
#include "store/memory_backend.hpp"
#include "test_utils.hpp"

using namespace bv;
using namespace bv::manifest;

namespace {

Manifest make_manifest(uint64_t chunk_size, uint64_t total_size) {
  hash::Hasher hasher;
  Manifest manifest;
  manifest.chunk_size = chunk_size;
  manifest.total_size = total_size;
  const uint64_t count = Manifest::expected_chunk_count(total_size, chunk_size);
  for (uint64_t i = 0; i < count; ++i) {
    manifest.chunks.push_back(hasher.hash(test::to_bytes("chunk " + std::to_string(i))));
  }
  return manifest;
}

} // anonymous namespace

class ManifestTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging(boost::log::trivial::warning);
  }
};

TEST_F(ManifestTest, ChunkGeometry) {
  const Manifest manifest = make_manifest(4, 10);
  ASSERT_EQ(manifest.chunk_count(), 3u);
  EXPECT_EQ(manifest.chunk_offset(2), 8u);
  EXPECT_EQ(manifest.chunk_length(0), 4u);
  EXPECT_EQ(manifest.chunk_length(2), 2u);
  EXPECT_THROW(manifest.chunk_length(3), std::out_of_range);
  EXPECT_TRUE(manifest.is_consistent());

  EXPECT_EQ(Manifest::expected_chunk_count(0, 4), 0u);
  EXPECT_EQ(Manifest::expected_chunk_count(8, 4), 2u);
  EXPECT_EQ(Manifest::expected_chunk_count(9, 4), 3u);
}

TEST_F(ManifestTest, EncodingLayout) {
  const Manifest manifest = make_manifest(4, 10);
  const Bytes encoded = ManifestCodec::serialize(manifest);

  ASSERT_EQ(encoded.size(), ManifestCodec::HEADER_SIZE + 3 * hash::DIGEST_SIZE);
  EXPECT_EQ(test::to_string(Bytes(encoded.begin(), encoded.begin() + 4)), "BVMF");
  EXPECT_EQ(encoded[4], 0);
  EXPECT_EQ(encoded[5], 1);     // version, big endian
  EXPECT_EQ(encoded[6], 1);     // sha256
  EXPECT_EQ(encoded[7], 0);     // reserved
  EXPECT_EQ(encoded[15], 4);    // chunk size
  EXPECT_EQ(encoded[23], 10);   // total size
  EXPECT_EQ(encoded[31], 3);    // chunk count
  EXPECT_TRUE(std::equal(manifest.chunks[0].begin(), manifest.chunks[0].end(), encoded.begin() + 32));
}

TEST_F(ManifestTest, DecodeRestoresEveryField) {
  for (uint64_t total : {0ull, 1ull, 4ull, 5ull, 4096ull}) {
    Manifest manifest = make_manifest(4, total);
    manifest.algorithm = hash::HashAlgorithm::BLAKE2S_256;
    EXPECT_EQ(ManifestCodec::deserialize(ManifestCodec::serialize(manifest)), manifest) << total;
  }
}

TEST_F(ManifestTest, EncodingIsDeterministic) {
  EXPECT_EQ(ManifestCodec::serialize(make_manifest(512, 100000)),
            ManifestCodec::serialize(make_manifest(512, 100000)));
}

TEST_F(ManifestTest, RefusesToEncodeInconsistentManifest) {
  Manifest manifest = make_manifest(4, 10);
  manifest.chunks.pop_back();
  EXPECT_THROW(ManifestCodec::serialize(manifest), IntegrityError);
}

TEST_F(ManifestTest, RejectsMalformedEncodings) {
  const Bytes good = ManifestCodec::serialize(make_manifest(4, 10));

  auto corrupted = [&](std::size_t offset, uint8_t value) {
    Bytes copy = good;
    copy[offset] = value;
    return copy;
  };

  EXPECT_THROW(ManifestCodec::deserialize(Bytes(good.begin(), good.begin() + 20)), CorruptManifest);
  EXPECT_THROW(ManifestCodec::deserialize(corrupted(0, 'X')), CorruptManifest);
  EXPECT_THROW(ManifestCodec::deserialize(corrupted(5, 2)), CorruptManifest);
  EXPECT_THROW(ManifestCodec::deserialize(corrupted(6, 0)), CorruptManifest);
  EXPECT_THROW(ManifestCodec::deserialize(corrupted(6, 99)), CorruptManifest);
  EXPECT_THROW(ManifestCodec::deserialize(corrupted(7, 1)), CorruptManifest);
  EXPECT_THROW(ManifestCodec::deserialize(corrupted(15, 0)), CorruptManifest);
  EXPECT_THROW(ManifestCodec::deserialize(corrupted(31, 4)), CorruptManifest);
  EXPECT_THROW(ManifestCodec::deserialize(Bytes(good.begin(), good.end() - 1)), CorruptManifest);

  Bytes extended = good;
  extended.push_back(0);
  EXPECT_THROW(ManifestCodec::deserialize(extended), CorruptManifest);
}


class ManifestBuilderTest : public ManifestTest {
protected:
  hash::Hasher hasher;
  hash::Digest digest_for(uint64_t index) { return hasher.hash(test::to_bytes(std::to_string(index))); }
};

TEST_F(ManifestBuilderTest, PlacesOutOfOrderResultsByIndex) {
  ManifestBuilder builder(4, hash::HashAlgorithm::SHA256);
  builder.record(2, digest_for(2));
  builder.record(0, digest_for(0));
  EXPECT_EQ(builder.contiguous(), 1u);
  EXPECT_EQ(builder.pending(), 1u);

  builder.record(1, digest_for(1));
  EXPECT_EQ(builder.contiguous(), 3u);
  EXPECT_EQ(builder.pending(), 0u);
  EXPECT_EQ(builder.peak_pending(), 1u);

  const Manifest manifest = builder.finish(10);
  ASSERT_EQ(manifest.chunk_count(), 3u);
  for (uint64_t i = 0; i < 3; ++i) {
    EXPECT_EQ(manifest.chunks[i], digest_for(i));
  }
}

TEST_F(ManifestBuilderTest, RejectsDuplicatesAndGaps) {
  ManifestBuilder builder(4, hash::HashAlgorithm::SHA256);
  builder.record(0, digest_for(0));
  EXPECT_THROW(builder.record(0, digest_for(0)), std::logic_error);

  builder.record(2, digest_for(2));
  EXPECT_THROW(builder.finish(10), IntegrityError);
  EXPECT_THROW(ManifestBuilder(0, hash::HashAlgorithm::SHA256), ConfigError);
}

TEST_F(ManifestBuilderTest, EmptyImageHasNoChunks) {
  ManifestBuilder builder(4, hash::HashAlgorithm::SHA256);
  const Manifest manifest = builder.finish(0);
  EXPECT_EQ(manifest.chunk_count(), 0u);
  EXPECT_TRUE(manifest.is_consistent());
}

TEST_F(ManifestBuilderTest, WindowWaitsForPrefix) {
  ManifestBuilder builder(4, hash::HashAlgorithm::SHA256);
  std::atomic<bool> released{false};

  std::thread waiter([&] {
    EXPECT_TRUE(builder.wait_for_window(3, 2));
    released = true;
  });

  builder.record(1, digest_for(1));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(released);

  builder.record(0, digest_for(0));
  waiter.join();
  EXPECT_TRUE(released);
}

TEST_F(ManifestBuilderTest, AbortReleasesWaiters) {
  ManifestBuilder builder(4, hash::HashAlgorithm::SHA256);
  std::thread waiter([&] {
    EXPECT_FALSE(builder.wait_for_window(100, 1));
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  builder.abort();
  waiter.join();
  EXPECT_TRUE(builder.aborted());
}


class ManifestStoreTest : public ManifestTest {
protected:
  store::MemoryBackend backend;
  store::ContentStore content{backend, hash::HashAlgorithm::SHA256};
};

TEST_F(ManifestStoreTest, RootIsHashOfEncoding) {
  const Manifest manifest = make_manifest(4, 10);
  const hash::Digest root = store_manifest(content, manifest);

  EXPECT_EQ(root, hash::Hasher().hash(ManifestCodec::serialize(manifest)));
  EXPECT_EQ(load_manifest(content, root), manifest);
}

TEST_F(ManifestStoreTest, MissingRootThrowsNotFound) {
  const hash::Digest root = hash::Hasher().hash(test::to_bytes("nothing"));
  try {
    load_manifest(content, root);
    FAIL() << "Expected NotFound";
  } catch (const NotFound& e) {
    EXPECT_EQ(e.key(), hash::to_hex(root));
  }
}

TEST_F(ManifestStoreTest, GarbageUnderRootIsCorrupt) {
  const Bytes garbage = test::to_bytes("definitely not a manifest, just some bytes here");
  const hash::Digest root = hash::Hasher().hash(garbage);
  content.put(root, garbage);
  EXPECT_THROW(load_manifest(content, root), CorruptManifest);
}

TEST_F(ManifestStoreTest, TamperedManifestFailsIntegrity) {
  const Manifest manifest = make_manifest(4, 10);
  const hash::Digest root = store_manifest(content, manifest);

  Manifest other = manifest;
  other.chunks[1] = other.chunks[0];
  backend.put(hash::to_hex(root), ManifestCodec::serialize(other));
  EXPECT_THROW(load_manifest(content, root), IntegrityError);
}

TEST_F(ManifestStoreTest, AlgorithmMustMatchStore) {
  Manifest manifest = make_manifest(4, 10);
  manifest.algorithm = hash::HashAlgorithm::SHA3_256;
  EXPECT_THROW(store_manifest(content, manifest), ConfigError);
}

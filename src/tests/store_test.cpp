#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <memory>
#include <thread>
#include "common/error.hpp"
#include "hash/hasher.hpp"
#include "store/backend.hpp"
#include "store/filesystem_backend.hpp"
#include "store/memory_backend.hpp"
#include "test_utils.hpp"

using namespace bv;
using namespace bv::store;
using ::testing::ElementsAre;

// Contract checks run against every backend
class BackendTest : public ::testing::TestWithParam<BackendType> {
protected:
  std::unique_ptr<test::TempDir> dir;
  std::unique_ptr<StorageBackend> backend;

  void SetUp() override {
    init_logging(boost::log::trivial::warning);
    dir = std::make_unique<test::TempDir>("backend_test");
    StoreConfig config;
    config.backend = GetParam();
    config.path = (dir->path() / "store").string();
    backend = make_backend(config);
    ASSERT_NE(backend, nullptr);
  }

  void TearDown() override {
    backend.reset();
    dir.reset();
  }

  void store_and_verify(const std::string& key, const Bytes& data) {
    ASSERT_NO_THROW(backend->put(key, data)) << "Failed to store key: " << key;
    ASSERT_TRUE(backend->exists(key)) << "Key should exist after storing: " << key;
    ASSERT_EQ(backend->get(key), data) << "Data mismatch for key: " << key;
    ASSERT_EQ(backend->size(key), data.size());
  }
};

TEST_P(BackendTest, BasicOperations) {
  store_and_verify("test_key", test::to_bytes("Hello, Store!"));
  store_and_verify("empty_key", Bytes{});

  EXPECT_FALSE(backend->exists("nonexistent_key"));
  EXPECT_THROW(backend->get("nonexistent_key"), NotFound);
  EXPECT_THROW(backend->size("nonexistent_key"), NotFound);
}

TEST_P(BackendTest, OverwriteReplacesValue) {
  store_and_verify("key", test::to_bytes("first"));
  store_and_verify("key", test::to_bytes("second value"));
}

TEST_P(BackendTest, RemoveDeletesValue) {
  store_and_verify("key", test::to_bytes("data"));
  backend->remove("key");
  EXPECT_FALSE(backend->exists("key"));
  EXPECT_THROW(backend->remove("key"), NotFound);
}

TEST_P(BackendTest, NotFoundCarriesKey) {
  try {
    backend->get("missing");
    FAIL() << "Expected NotFound";
  } catch (const NotFound& e) {
    EXPECT_EQ(e.key(), "missing");
  }
}

TEST_P(BackendTest, ListReturnsSortedKeys) {
  const std::string digest_key = hash::to_hex(hash::Hasher().hash(test::to_bytes("chunk")));
  backend->put("refs/b", test::to_bytes("2"));
  backend->put("refs/a", test::to_bytes("1"));
  backend->put(digest_key, test::to_bytes("chunk"));

  std::vector<std::string> expected = {digest_key, "refs/a", "refs/b"};
  std::sort(expected.begin(), expected.end());
  EXPECT_EQ(backend->list(), expected);
}

TEST_P(BackendTest, ConcurrentPutsOfDistinctKeys) {
  const int num_threads = 8;
  const int per_thread = 25;
  std::vector<std::thread> threads;
  for (int t = 0; t < num_threads; ++t) {
    threads.emplace_back([this, t] {
      for (int i = 0; i < per_thread; ++i) {
        const std::string key = "key_" + std::to_string(t) + "_" + std::to_string(i);
        backend->put(key, test::random_bytes(64, static_cast<uint32_t>(t * 1000 + i)));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(backend->list().size(), static_cast<std::size_t>(num_threads * per_thread));
  EXPECT_EQ(backend->get("key_3_7"), test::random_bytes(64, 3007));
}

INSTANTIATE_TEST_SUITE_P(AllBackends, BackendTest,
                         ::testing::Values(BackendType::Memory, BackendType::Filesystem),
                         [](const ::testing::TestParamInfo<BackendType>& info) {
                           return std::string(backend_name(info.param));
                         });


class FilesystemBackendTest : public ::testing::Test {
protected:
  std::unique_ptr<test::TempDir> dir;
  std::unique_ptr<FilesystemBackend> backend;

  void SetUp() override {
    init_logging(boost::log::trivial::warning);
    dir = std::make_unique<test::TempDir>("fs_backend_test");
    backend = std::make_unique<FilesystemBackend>(dir->path() / "store");
  }
};

TEST_F(FilesystemBackendTest, ShardsDigestKeys) {
  const std::string key = hash::to_hex(hash::Hasher().hash(test::to_bytes("abc")));
  backend->put(key, test::to_bytes("abc"));

  const auto expected = dir->path() / "store" / "ba" / "78" / "16" / key.substr(6);
  EXPECT_EQ(backend->path_for_key(key), expected);
  EXPECT_TRUE(std::filesystem::is_regular_file(expected));
  EXPECT_THAT(backend->list(), ElementsAre(key));
}

TEST_F(FilesystemBackendTest, RemovePrunesEmptyShardDirectories) {
  const std::string key = hash::to_hex(hash::Hasher().hash(test::to_bytes("abc")));
  backend->put(key, test::to_bytes("abc"));
  backend->remove(key);

  EXPECT_FALSE(std::filesystem::exists(dir->path() / "store" / "ba"));
  EXPECT_TRUE(std::filesystem::exists(dir->path() / "store"));
}

TEST_F(FilesystemBackendTest, LeavesNoTemporaryFiles) {
  for (int i = 0; i < 10; ++i) {
    backend->put("key" + std::to_string(i), test::random_bytes(1000, static_cast<uint32_t>(i)));
  }
  for (const auto& entry : std::filesystem::recursive_directory_iterator(backend->base_path())) {
    EXPECT_EQ(entry.path().filename().string().find(".tmp."), std::string::npos) << entry.path();
  }
}

TEST_F(FilesystemBackendTest, RejectsEscapingKeys) {
  EXPECT_THROW(backend->put("../outside", test::to_bytes("x")), IoError);
  EXPECT_THROW(backend->put("/absolute", test::to_bytes("x")), IoError);
  EXPECT_THROW(backend->put("", test::to_bytes("x")), IoError);
  EXPECT_THROW(backend->put("a/./b", test::to_bytes("x")), IoError);
}

TEST_F(FilesystemBackendTest, DataSurvivesReopen) {
  backend->put("persistent", test::to_bytes("still here"));
  backend.reset();

  FilesystemBackend reopened(dir->path() / "store");
  EXPECT_EQ(reopened.get("persistent"), test::to_bytes("still here"));
}

TEST(BackendFactoryTest, Names) {
  EXPECT_EQ(backend_from_name("memory"), BackendType::Memory);
  EXPECT_EQ(backend_from_name("filesystem"), BackendType::Filesystem);
  EXPECT_THROW(backend_from_name("s3"), ConfigError);

  StoreConfig config;
  config.backend = BackendType::Filesystem;
  config.path.clear();
  EXPECT_THROW(make_backend(config), ConfigError);
}

#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include "common/error.hpp"
#include "hash/digest.hpp"
#include "hash/hasher.hpp"
#include "test_utils.hpp"

using namespace bv;
using namespace bv::hash;

class HasherTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging(boost::log::trivial::warning);
  }
};

TEST_F(HasherTest, Sha256KnownVectors) {
  Hasher hasher;
  EXPECT_EQ(hasher.algorithm(), HashAlgorithm::SHA256);
  EXPECT_EQ(to_hex(hasher.hash(test::to_bytes("abc"))),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(to_hex(hasher.hash(Bytes{})),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(HasherTest, AlternativeAlgorithms) {
  EXPECT_EQ(to_hex(Hasher(HashAlgorithm::SHA3_256).hash(test::to_bytes("abc"))),
            "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
  EXPECT_EQ(to_hex(Hasher(HashAlgorithm::BLAKE2S_256).hash(test::to_bytes("abc"))),
            "508c5e8c327c14e2e1a72ba34eeb452f37458b209ed63a294d999b4c86675982");
}

TEST_F(HasherTest, DeterministicAndDistinct) {
  Hasher hasher;
  const Bytes a = test::random_bytes(4096, 1);
  Bytes b = a;
  b[2048] ^= 0x01;

  EXPECT_EQ(hasher.hash(a), hasher.hash(a));
  EXPECT_NE(hasher.hash(a), hasher.hash(b));
  EXPECT_EQ(hasher.hash(a), hasher.hash(a.data(), a.size()));
}

TEST_F(HasherTest, ConcurrentHashingAgrees) {
  Hasher hasher;
  const Bytes data = test::random_bytes(64 * 1024, 7);
  const Digest expected = hasher.hash(data);

  std::vector<std::thread> threads;
  std::atomic<int> mismatches{0};
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      for (int j = 0; j < 20; ++j) {
        if (hasher.hash(data) != expected) {
          ++mismatches;
        }
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(mismatches, 0);
}

TEST(DigestTest, HexRoundTripAndValidation) {
  const std::string hex = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
  EXPECT_TRUE(is_digest_hex(hex));
  EXPECT_EQ(to_hex(digest_from_hex(hex)), hex);

  EXPECT_FALSE(is_digest_hex(hex.substr(1)));
  EXPECT_FALSE(is_digest_hex(std::string(64, 'g')));
  EXPECT_THROW(digest_from_hex("abc"), std::invalid_argument);
}

TEST(DigestTest, AlgorithmNames) {
  for (auto algorithm : {HashAlgorithm::SHA256, HashAlgorithm::SHA3_256, HashAlgorithm::BLAKE2S_256}) {
    EXPECT_EQ(algorithm_from_name(algorithm_name(algorithm)), algorithm);
    EXPECT_TRUE(is_known_algorithm(static_cast<uint8_t>(algorithm)));
  }
  EXPECT_FALSE(is_known_algorithm(0));
  EXPECT_FALSE(is_known_algorithm(42));
  EXPECT_THROW(algorithm_from_name("md5"), ConfigError);
}

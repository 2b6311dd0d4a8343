#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "common/error.hpp"
#include "pipeline_fixture.hpp"

using namespace bv;
using ::testing::HasSubstr;

class RestoreTest : public PipelineTest {
protected:
  pipeline::RestorePipeline make_pipeline() {
    return pipeline::RestorePipeline(store, pool, config);
  }
};

TEST_F(RestoreTest, RoundTripAtBoundarySizes) {
  config.chunk_size = 16;
  for (std::size_t size : {0u, 1u, 15u, 16u, 17u, 1000u}) {
    const Bytes data = test::random_bytes(size, static_cast<uint32_t>(size));
    const auto result = backup(data);
    EXPECT_EQ(restore(result.root), data) << "size " << size;
  }
}

TEST_F(RestoreTest, ReportsRestoredGeometry) {
  const auto backed_up = backup(test::to_bytes("ABCDEFGHIJ"));
  pipeline::MemorySink sink;
  const auto result = make_pipeline().run(backed_up.root, sink, token);

  EXPECT_EQ(result.root, backed_up.root);
  EXPECT_EQ(result.total_size, 10u);
  EXPECT_EQ(result.chunk_count, 3u);
  EXPECT_TRUE(result.verified);
  EXPECT_EQ(sink.bytes_written(), 10u);
}

TEST_F(RestoreTest, OrderSurvivesRandomLatency) {
  config.chunk_size = 32;
  config.max_in_flight = 6;
  const Bytes data = test::random_bytes(32 * 120 + 5, 51);
  const auto result = backup(data);

  backend.set_latency(300);
  EXPECT_EQ(restore(result.root), data);
}

TEST_F(RestoreTest, MissingChunkNamesIndexAndHash) {
  const auto result = backup(test::to_bytes("ABCDEFGHIJ"));
  const std::string missing = chunk_key(result.root, 1);
  backend.inner().remove(missing);

  pipeline::MemorySink sink;
  try {
    make_pipeline().run(result.root, sink, token);
    FAIL() << "Expected NotFound";
  } catch (const NotFound& e) {
    EXPECT_EQ(e.key(), missing);
    EXPECT_THAT(e.what(), HasSubstr("chunk 1"));
    EXPECT_THAT(e.what(), HasSubstr(missing));
  }
  EXPECT_FALSE(sink.complete());
}

TEST_F(RestoreTest, CorruptChunkFailsVerification) {
  const auto result = backup(test::to_bytes("ABCDEFGHIJ"));
  backend.inner().put(chunk_key(result.root, 0), test::to_bytes("ZZZZ"));

  pipeline::MemorySink sink;
  EXPECT_THROW(make_pipeline().run(result.root, sink, token), IntegrityError);
  EXPECT_FALSE(sink.complete());
}

TEST_F(RestoreTest, TrustModeSkipsHashButChecksLength) {
  const auto result = backup(test::to_bytes("ABCDEFGHIJ"));
  config.verify_on_restore = false;

  backend.inner().put(chunk_key(result.root, 0), test::to_bytes("ZZZZ"));
  pipeline::MemorySink trusted;
  const auto restored = make_pipeline().run(result.root, trusted, token);
  EXPECT_FALSE(restored.verified);
  EXPECT_EQ(test::to_string(trusted.data()), "ZZZZEFGHIJ");

  backend.inner().put(chunk_key(result.root, 2), test::to_bytes("IJK"));
  pipeline::MemorySink short_sink;
  EXPECT_THROW(make_pipeline().run(result.root, short_sink, token), IntegrityError);
  EXPECT_FALSE(short_sink.complete());
}

TEST_F(RestoreTest, UnreadableChunkIsIoError) {
  const auto result = backup(test::random_bytes(40, 52));
  backend.fail_get(chunk_key(result.root, 3));

  pipeline::MemorySink sink;
  EXPECT_THROW(make_pipeline().run(result.root, sink, token), IoError);
  EXPECT_FALSE(sink.complete());
}

TEST_F(RestoreTest, UnknownRootIsNotFound) {
  pipeline::MemorySink sink;
  EXPECT_THROW(make_pipeline().run(hasher.hash(test::to_bytes("nope")), sink, token), NotFound);
  EXPECT_FALSE(sink.complete());
}

TEST_F(RestoreTest, CancelledRestoreIsIncomplete) {
  const auto result = backup(test::random_bytes(40, 53));
  token.cancel();

  pipeline::MemorySink sink;
  EXPECT_THROW(make_pipeline().run(result.root, sink, token), OperationCancelled);
  EXPECT_FALSE(sink.complete());
}

TEST_F(RestoreTest, StreamSinkReceivesImage) {
  const Bytes data = test::random_bytes(103, 54);
  const auto result = backup(data);

  std::ostringstream out;
  pipeline::StreamSink sink(out);
  make_pipeline().run(result.root, sink, token);
  EXPECT_TRUE(sink.complete());
  EXPECT_EQ(out.str(), test::to_string(data));
}

TEST_F(RestoreTest, FileSinkRoundTripAndFailure) {
  test::TempDir dir("restore_test");
  const Bytes data = test::random_bytes(1000, 55);
  const auto result = backup(data);

  const std::string good_path = dir.file("good.img");
  pipeline::FileSink good(good_path);
  make_pipeline().run(result.root, good, token);
  std::ifstream in(good_path, std::ios::binary);
  EXPECT_EQ(Bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>()), data);

  backend.inner().remove(chunk_key(result.root, 100));
  const std::string bad_path = dir.file("bad.img");
  pipeline::FileSink bad(bad_path);
  EXPECT_THROW(make_pipeline().run(result.root, bad, token), NotFound);
  EXPECT_FALSE(bad.complete());
  EXPECT_FALSE(std::filesystem::exists(bad_path));
}

#include <gtest/gtest.h>
#include <numeric>
#include "encrypt/chunker.hpp"
#include "encrypt/encrypt_error.hpp"
#include "test_utils.hpp"

using namespace xornet::encrypt;
using xornet::test::random_bytes;

class ChunkerTest : public ::testing::Test {
protected:
  void SetUp() override {
    xornet::test::quiet_logging();
  }

  static ChunkerConfig range(size_t min, size_t max) {
    ChunkerConfig config;
    config.min_chunk_size = min;
    config.max_chunk_size = max;
    return config;
  }

  static std::vector<size_t> sizes_of(const std::vector<RawChunk>& chunks) {
    std::vector<size_t> sizes;
    for (const auto& chunk : chunks) {
      sizes.push_back(chunk.bytes.size());
    }
    return sizes;
  }
};

TEST_F(ChunkerTest, ThreeThousandBytesMakeThreeEqualChunks) {
  Chunker chunker(range(900, 1100));
  auto chunks = chunker.split(random_bytes(3000));

  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(sizes_of(chunks), (std::vector<size_t>{1000, 1000, 1000}));
}

TEST_F(ChunkerTest, RemainderGoesToLeadingChunks) {
  Chunker chunker(range(900, 1100));
  EXPECT_EQ(sizes_of(chunker.split(random_bytes(3002))), (std::vector<size_t>{1001, 1001, 1000}));

  Chunker small(range(100, 1000));
  auto chunks = small.split(random_bytes(10001));
  ASSERT_EQ(chunks.size(), 11u);
  EXPECT_EQ(chunks[0].bytes.size(), 910u);
  EXPECT_EQ(chunks[1].bytes.size(), 910u);
  EXPECT_EQ(chunks[2].bytes.size(), 909u);
  EXPECT_EQ(chunks[10].bytes.size(), 909u);
}

TEST_F(ChunkerTest, ChunksNeverExceedMaximum) {
  Chunker chunker(range(64, 256));
  for (size_t size : {768u, 769u, 1000u, 4096u, 5000u}) {
    auto chunks = chunker.split(random_bytes(size));
    EXPECT_EQ(chunks.size(), chunker.chunk_count(size));
    for (const auto& chunk : chunks) {
      EXPECT_LE(chunk.bytes.size(), 256u) << "payload size " << size;
      EXPECT_EQ(chunk.bytes.size(), chunker.chunk_size(size, chunk.index));
    }
  }
}

TEST_F(ChunkerTest, SmallPayloadRelaxesMinimumSize) {
  Chunker chunker(range(1024, 4096));
  auto chunks = chunker.split(random_bytes(5));
  EXPECT_EQ(sizes_of(chunks), (std::vector<size_t>{2, 2, 1}));
}

TEST_F(ChunkerTest, CoversPayloadExactlyOnce) {
  Chunker chunker(range(100, 300));
  auto payload = random_bytes(2345, 3);
  auto chunks = chunker.split(payload);

  uint64_t offset = 0;
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].index, i);
    EXPECT_EQ(chunks[i].offset, offset);
    EXPECT_EQ(chunks[i].plaintext_hash, xornet::crypto::ContentAddress::of(chunks[i].bytes));
    offset += chunks[i].bytes.size();
  }
  EXPECT_EQ(offset, payload.size());
  EXPECT_EQ(Chunker::reassemble(chunks), payload);
}

TEST_F(ChunkerTest, SplitIsDeterministic) {
  Chunker chunker(range(100, 300));
  auto payload = random_bytes(1500, 9);
  auto first = chunker.split(payload);
  auto second = chunker.split(payload);

  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].bytes, second[i].bytes);
  }
}

TEST_F(ChunkerTest, RejectsEmptyAndTinyPayloads) {
  Chunker chunker;
  EXPECT_THROW(chunker.split({}), EmptyInputError);
  EXPECT_THROW(chunker.split({0x01, 0x02}), InsufficientChunksError);
  EXPECT_NO_THROW(chunker.split({0x01, 0x02, 0x03}));
}

TEST_F(ChunkerTest, ReassembleRejectsGaps) {
  Chunker chunker(range(100, 300));
  auto chunks = chunker.split(random_bytes(900));
  chunks.erase(chunks.begin() + 1);
  EXPECT_THROW(Chunker::reassemble(chunks), ReconstructionError);
}

TEST_F(ChunkerTest, InvalidConfigurationIsRejected) {
  EXPECT_THROW(Chunker(range(0, 10)), std::invalid_argument);
  EXPECT_THROW(Chunker(range(20, 10)), std::invalid_argument);

  ChunkerConfig two_chunks = range(10, 20);
  two_chunks.min_chunks = 2;
  EXPECT_THROW(Chunker{two_chunks}, std::invalid_argument);
}

#include <gtest/gtest.h>
#include <algorithm>
#include <limits>
#include <set>
#include "encrypt/encrypt_error.hpp"
#include "encrypt/self_encryptor.hpp"
#include "test_utils.hpp"

using namespace xornet::encrypt;
using xornet::crypto::ContentAddress;
using xornet::test::random_bytes;

class SelfEncryptorTest : public ::testing::Test {
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

  SelfEncryptor encryptor{range(900, 1100), 4};
};

TEST_F(SelfEncryptorTest, RoundTripThreeChunks) {
  auto payload = random_bytes(3000);
  EncryptResult result = encryptor.encrypt(payload);

  ASSERT_EQ(result.chunks.size(), 3u);
  ASSERT_EQ(result.data_map.chunks.size(), 3u);
  EXPECT_EQ(result.data_map.level, DataMap::Level::Final);
  EXPECT_EQ(result.data_map.total_size(), 3000u);

  for (size_t i = 0; i < result.chunks.size(); ++i) {
    EXPECT_EQ(result.chunks[i].index, i);
    EXPECT_EQ(result.chunks[i].address, ContentAddress::of(result.chunks[i].content));
    EXPECT_EQ(result.data_map.chunks[i].address, result.chunks[i].address);
  }

  EXPECT_EQ(encryptor.decrypt(result.data_map, result.chunks), payload);
}

TEST_F(SelfEncryptorTest, ManyChunksOnThreadPool) {
  auto payload = random_bytes(25000, 5);
  EncryptResult result = encryptor.encrypt(payload);

  EXPECT_EQ(result.chunks.size(), 23u);
  EXPECT_EQ(encryptor.decrypt(result.data_map, result.chunks), payload);
}

TEST_F(SelfEncryptorTest, EncryptionIsConvergent) {
  auto payload = random_bytes(7000, 11);
  SelfEncryptor single_threaded(range(900, 1100), 1);

  EncryptResult first = encryptor.encrypt(payload);
  EncryptResult second = single_threaded.encrypt(payload);

  EXPECT_EQ(first.data_map, second.data_map);
  ASSERT_EQ(first.chunks.size(), second.chunks.size());
  for (size_t i = 0; i < first.chunks.size(); ++i) {
    EXPECT_EQ(first.chunks[i].content, second.chunks[i].content);
  }
}

TEST_F(SelfEncryptorTest, CiphertextHidesPlaintext) {
  auto payload = random_bytes(3000, 2);
  EncryptResult result = encryptor.encrypt(payload);

  for (const auto& chunk : result.chunks) {
    std::vector<uint8_t> plain(payload.begin() + chunk.index * 1000, payload.begin() + (chunk.index + 1) * 1000);
    EXPECT_NE(chunk.content.size(), 0u);
    EXPECT_NE(std::vector<uint8_t>(chunk.content.begin(), chunk.content.begin() + 1000), plain);
  }
}

TEST_F(SelfEncryptorTest, KeyIgnoresChunkOwnContent) {
  ContentAddress a = ContentAddress::of(xornet::test::to_bytes("a"));
  ContentAddress b = ContentAddress::of(xornet::test::to_bytes("b"));
  ContentAddress c = ContentAddress::of(xornet::test::to_bytes("c"));
  ContentAddress d = ContentAddress::of(xornet::test::to_bytes("d"));

  // Chunk 1 of four keys off chunks 0 and 2 only
  auto with_b = SelfEncryptor::key_material_for({a, b, c, d}, 1);
  auto with_d = SelfEncryptor::key_material_for({a, d, c, d}, 1);
  EXPECT_EQ(with_b, with_d);

  auto changed_neighbour = SelfEncryptor::key_material_for({a, b, d, d}, 1);
  EXPECT_NE(with_b, changed_neighbour);
}

TEST_F(SelfEncryptorTest, NeighboursWrapAround) {
  ContentAddress a = ContentAddress::of(xornet::test::to_bytes("a"));
  ContentAddress b = ContentAddress::of(xornet::test::to_bytes("b"));
  ContentAddress c = ContentAddress::of(xornet::test::to_bytes("c"));

  EXPECT_EQ(SelfEncryptor::key_material_for({a, b, c}, 0), SelfEncryptor::derive_key_material(c, b));
  EXPECT_EQ(SelfEncryptor::key_material_for({a, b, c}, 2), SelfEncryptor::derive_key_material(b, a));
  EXPECT_NE(SelfEncryptor::derive_key_material(a, b), SelfEncryptor::derive_key_material(b, a));
}

TEST_F(SelfEncryptorTest, KeyMaterialSizes) {
  auto material = SelfEncryptor::derive_key_material(ContentAddress(), ContentAddress());
  EXPECT_EQ(material.key.size(), 32u);
  EXPECT_EQ(material.iv.size(), 16u);
  EXPECT_THROW(SelfEncryptor::key_material_for({ContentAddress(), ContentAddress()}, 0),
               InsufficientChunksError);
}

TEST_F(SelfEncryptorTest, TamperedCiphertextIsRejected) {
  EncryptResult result = encryptor.encrypt(random_bytes(3000, 4));
  result.chunks[1].content[10] ^= 0xFF;

  EXPECT_THROW(encryptor.decrypt(result.data_map, result.chunks), ReconstructionError);
}

TEST_F(SelfEncryptorTest, TamperedDataMapIsRejected) {
  EncryptResult result = encryptor.encrypt(random_bytes(3000, 4));
  result.data_map.chunks[2].plaintext_hash = ContentAddress::of(xornet::test::to_bytes("other"));

  EXPECT_THROW(encryptor.decrypt(result.data_map, result.chunks), ReconstructionError);
}

TEST_F(SelfEncryptorTest, ImpossibleChunkSizesAreRejected) {
  EncryptResult result = encryptor.encrypt(random_bytes(3000, 4));
  DataMap oversized = result.data_map;
  for (auto& info : oversized.chunks) {
    info.plaintext_size = std::numeric_limits<uint64_t>::max() / 2;
  }
  EXPECT_THROW(encryptor.decrypt(oversized, result.chunks), ReconstructionError);

  DataMap just_over = result.data_map;
  just_over.chunks[0].plaintext_size = 1101;
  EXPECT_THROW(encryptor.check_layout(just_over), ReconstructionError);

  DataMap misplaced = result.data_map;
  std::swap(misplaced.chunks[0], misplaced.chunks[1]);
  EXPECT_THROW(encryptor.check_layout(misplaced), ReconstructionError);

  EXPECT_NO_THROW(encryptor.check_layout(result.data_map));
}

TEST_F(SelfEncryptorTest, MissingChunkIsRejected) {
  EncryptResult result = encryptor.encrypt(random_bytes(3000, 4));
  result.chunks.pop_back();

  EXPECT_THROW(encryptor.decrypt(result.data_map, result.chunks), ReconstructionError);
}

TEST_F(SelfEncryptorTest, ChunksMayArriveInAnyOrder) {
  auto payload = random_bytes(5000, 6);
  EncryptResult result = encryptor.encrypt(payload);
  std::reverse(result.chunks.begin(), result.chunks.end());

  EXPECT_EQ(encryptor.decrypt(result.data_map, result.chunks), payload);
}

TEST_F(SelfEncryptorTest, ChunkErrorsSurfaceFromEncrypt) {
  EXPECT_THROW(encryptor.encrypt({}), EmptyInputError);
  EXPECT_THROW(encryptor.encrypt({0x01, 0x02}), InsufficientChunksError);
}

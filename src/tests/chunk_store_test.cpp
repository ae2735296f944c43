#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <set>
#include <thread>
#include "store/chunk_store.hpp"
#include "store/disk_chunk_store.hpp"
#include "store/memory_chunk_store.hpp"
#include "test_utils.hpp"

using namespace xornet::store;
using xornet::test::random_bytes;
using xornet::test::to_bytes;

enum class Backend { Disk, Memory };

class ChunkStoreTest : public ::testing::TestWithParam<Backend> {
protected:
  std::filesystem::path test_dir;
  std::unique_ptr<ChunkStore> store;

  void SetUp() override {
    xornet::test::quiet_logging();
    if (GetParam() == Backend::Disk) {
      test_dir = xornet::test::unique_temp_dir("chunk_store_test");
      store = std::make_unique<DiskChunkStore>(test_dir.string());
    } else {
      store = std::make_unique<MemoryChunkStore>();
    }
    ASSERT_NE(store, nullptr);
  }

  void TearDown() override {
    store.reset();
    if (!test_dir.empty() && std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  // Stores bytes under their own address and checks they read back
  ContentAddress put_and_verify(const Bytes& bytes) {
    ContentAddress address = ContentAddress::of(bytes);
    EXPECT_NO_THROW(store->put(address, bytes)) << "Failed to store " << address;
    EXPECT_TRUE(store->has(address)) << "Chunk should exist after storing: " << address;
    EXPECT_EQ(store->get(address), bytes) << "Data mismatch for " << address;
    return address;
  }
};

TEST_P(ChunkStoreTest, BasicOperations) {
  ContentAddress address = put_and_verify(to_bytes("Hello, Store!"));
  EXPECT_EQ(store->size_of(address), 13u);
  EXPECT_EQ(store->count(), 1u);

  ContentAddress missing = ContentAddress::of(to_bytes("missing"));
  EXPECT_FALSE(store->has(missing));
  EXPECT_THROW(store->get(missing), ChunkNotFoundError);
  EXPECT_THROW(store->size_of(missing), ChunkNotFoundError);
}

TEST_P(ChunkStoreTest, PutIsIdempotent) {
  Bytes bytes = random_bytes(4096);
  ContentAddress address = ContentAddress::of(bytes);

  EXPECT_TRUE(store->put(address, bytes));
  EXPECT_FALSE(store->put(address, bytes));
  EXPECT_EQ(store->count(), 1u);
  EXPECT_EQ(store->get(address), bytes);
}

TEST_P(ChunkStoreTest, ConflictingContentIsRefused) {
  Bytes bytes = to_bytes("original");
  ContentAddress address = ContentAddress::of(bytes);
  store->put(address, bytes);

  EXPECT_THROW(store->put(address, to_bytes("replacement")), ChunkConflictError);
  EXPECT_EQ(store->get(address), bytes);
}

TEST_P(ChunkStoreTest, MultipleChunksAreListed) {
  std::set<ContentAddress> expected;
  for (uint32_t seed = 0; seed < 20; ++seed) {
    expected.insert(put_and_verify(random_bytes(100 + seed, seed)));
  }

  auto listed = store->addresses();
  EXPECT_EQ(std::set<ContentAddress>(listed.begin(), listed.end()), expected);
  EXPECT_EQ(store->count(), expected.size());
}

TEST_P(ChunkStoreTest, LargeAndEmptyChunks) {
  ContentAddress large = put_and_verify(Bytes(1024 * 1024, 'X'));
  EXPECT_EQ(store->size_of(large), 1024u * 1024u);

  ContentAddress empty = put_and_verify(Bytes{});
  EXPECT_EQ(store->size_of(empty), 0u);
}

TEST_P(ChunkStoreTest, ConcurrentAccess) {
  const size_t num_threads = 5;
  const size_t ops_per_thread = 50;
  std::atomic<size_t> successful_ops{0};
  std::vector<std::thread> threads;

  for (size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([this, i, ops_per_thread, &successful_ops]() {
      for (size_t j = 0; j < ops_per_thread; ++j) {
        try {
          Bytes bytes = to_bytes("concurrent_" + std::to_string(i) + "_" + std::to_string(j));
          ContentAddress address = ContentAddress::of(bytes);
          store->put(address, bytes);
          if (store->get(address) == bytes) {
            successful_ops++;
          }
        } catch (const std::exception& e) {
          ADD_FAILURE() << "Thread " << i << " failed: " << e.what();
        }
      }
    });
  }

  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(successful_ops, num_threads * ops_per_thread);
  EXPECT_EQ(store->count(), num_threads * ops_per_thread);
}

TEST_P(ChunkStoreTest, ConcurrentPutsOfSameChunkWriteOnce) {
  Bytes bytes = random_bytes(10000, 77);
  ContentAddress address = ContentAddress::of(bytes);
  std::atomic<size_t> fresh_writes{0};
  std::vector<std::thread> threads;

  for (size_t i = 0; i < 8; ++i) {
    threads.emplace_back([&]() {
      if (store->put(address, bytes)) {
        fresh_writes++;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(fresh_writes, 1u);
  EXPECT_EQ(store->get(address), bytes);
}

INSTANTIATE_TEST_SUITE_P(Backends, ChunkStoreTest, ::testing::Values(Backend::Disk, Backend::Memory),
                         [](const ::testing::TestParamInfo<Backend>& info) {
                           return info.param == Backend::Disk ? "Disk" : "Memory";
                         });


class DiskChunkStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;

  void SetUp() override {
    xornet::test::quiet_logging();
    test_dir = xornet::test::unique_temp_dir("disk_chunk_store_test");
  }

  void TearDown() override {
    std::filesystem::remove_all(test_dir);
  }
};

TEST_F(DiskChunkStoreTest, PathLayoutUsesHexPrefixes) {
  DiskChunkStore store(test_dir.string());
  ContentAddress address = ContentAddress::of(to_bytes("layout"));
  std::string hex = address.to_hex();

  auto expected = test_dir / hex.substr(0, 2) / hex.substr(2, 2) / hex.substr(4, 2) / hex.substr(6);
  EXPECT_EQ(store.path_for(address), expected);

  store.put(address, to_bytes("layout"));
  EXPECT_TRUE(std::filesystem::exists(expected));
}

TEST_F(DiskChunkStoreTest, ChunksSurviveReopen) {
  Bytes bytes = random_bytes(2048, 5);
  ContentAddress address = ContentAddress::of(bytes);
  {
    DiskChunkStore store(test_dir.string());
    store.put(address, bytes);
  }

  DiskChunkStore reopened(test_dir.string());
  EXPECT_TRUE(reopened.has(address));
  EXPECT_EQ(reopened.get(address), bytes);
  EXPECT_EQ(reopened.count(), 1u);
}

TEST_F(DiskChunkStoreTest, LeftoverTempFilesAreIgnored) {
  DiskChunkStore store(test_dir.string());
  ContentAddress address = ContentAddress::of(to_bytes("partial"));
  auto temp_path = store.path_for(address);
  temp_path += ".tmp";
  std::filesystem::create_directories(temp_path.parent_path());
  std::ofstream(temp_path) << "half written";

  EXPECT_FALSE(store.has(address));
  EXPECT_EQ(store.count(), 0u);
  EXPECT_TRUE(store.addresses().empty());
}

TEST(VerifyContentTest, AcceptsMatchingAndRejectsMismatchedBytes) {
  Bytes bytes = to_bytes("verified");
  ContentAddress address = ContentAddress::of(bytes);
  EXPECT_NO_THROW(verify_content(address, bytes));

  Bytes tampered = bytes;
  tampered[0] ^= 0x01;
  try {
    verify_content(address, tampered);
    FAIL() << "Expected ChunkMismatchError";
  } catch (const ChunkMismatchError& e) {
    EXPECT_EQ(e.expected(), address);
    EXPECT_EQ(e.actual(), ContentAddress::of(tampered));
  }
}

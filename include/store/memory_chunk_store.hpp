#pragma once

#include <map>
#include <mutex>
#include "store/chunk_store.hpp"

namespace xornet {
namespace store {

// In-process chunk store, used for a client's provisional chunks and in tests
class MemoryChunkStore : public ChunkStore {
public:
  MemoryChunkStore() = default;

  bool put(const ContentAddress& address, const Bytes& bytes) override;
  Bytes get(const ContentAddress& address) const override;

  bool has(const ContentAddress& address) const override;
  uint64_t size_of(const ContentAddress& address) const override;
  size_t count() const override;
  std::vector<ContentAddress> addresses() const override;

private:
  std::map<ContentAddress, Bytes> chunks_;
  mutable std::mutex mutex_;
};

} // namespace store
} // namespace xornet

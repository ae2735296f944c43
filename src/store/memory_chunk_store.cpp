#include "store/memory_chunk_store.hpp"
#include <boost/log/trivial.hpp>

namespace xornet {
namespace store {

bool MemoryChunkStore::put(const ContentAddress& address, const Bytes& bytes) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = chunks_.find(address);
  if (it != chunks_.end()) {
    if (it->second == bytes) {
      return false;
    }
    BOOST_LOG_TRIVIAL(error) << "Memory store: Refusing to overwrite " << address << " with different content";
    throw ChunkConflictError(address);
  }

  chunks_.emplace(address, bytes);
  BOOST_LOG_TRIVIAL(debug) << "Memory store: Stored " << bytes.size() << " bytes under " << address;
  return true;
}

Bytes MemoryChunkStore::get(const ContentAddress& address) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = chunks_.find(address);
  if (it == chunks_.end()) {
    throw ChunkNotFoundError(address);
  }
  return it->second;
}

bool MemoryChunkStore::has(const ContentAddress& address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.count(address) > 0;
}

uint64_t MemoryChunkStore::size_of(const ContentAddress& address) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = chunks_.find(address);
  if (it == chunks_.end()) {
    throw ChunkNotFoundError(address);
  }
  return it->second.size();
}

size_t MemoryChunkStore::count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.size();
}

std::vector<ContentAddress> MemoryChunkStore::addresses() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<ContentAddress> result;
  result.reserve(chunks_.size());
  for (const auto& entry : chunks_) {
    result.push_back(entry.first);
  }
  return result;
}

} // namespace store
} // namespace xornet

#ifndef XORNET_DATA_MAP_HPP
#define XORNET_DATA_MAP_HPP

#include <cstdint>
#include <vector>
#include "crypto/content_address.hpp"

namespace xornet {
namespace encrypt {

using crypto::Bytes;
using crypto::ContentAddress;

// One entry per raw chunk, in original payload order
struct ChunkInfo {
  uint32_t index = 0;
  ContentAddress plaintext_hash;   // SHA-256 of the raw chunk
  uint64_t plaintext_size = 0;
  ContentAddress address;          // SHA-256 of the encrypted chunk

  bool operator==(const ChunkInfo& other) const {
    return index == other.index && plaintext_hash == other.plaintext_hash &&
           plaintext_size == other.plaintext_size && address == other.address;
  }
  bool operator!=(const ChunkInfo& other) const { return !(*this == other); }
};

// Manifest needed to decrypt and reassemble a payload. A Final map references payload
// chunks; an Indirect map references the chunks of a serialized child map.
struct DataMap {
  enum class Level : uint8_t {
    Final = 0,
    Indirect = 1
  };

  static constexpr uint8_t VERSION = 1;
  static constexpr size_t HEADER_SIZE = 4 + 1 + 1 + 4;   // magic, version, level, count
  static constexpr size_t ENTRY_SIZE = 4 + 8 + ContentAddress::SIZE * 2;

  Level level = Level::Final;
  std::vector<ChunkInfo> chunks;

  uint64_t total_size() const;
  std::vector<ContentAddress> addresses() const;
  bool empty() const { return chunks.empty(); }
  size_t serialized_size() const { return HEADER_SIZE + chunks.size() * ENTRY_SIZE; }

  // ---- SERIALIZATION ----
  Bytes serialize() const;
  // Throws DataMapError on malformed input
  static DataMap deserialize(const Bytes& data);

  bool operator==(const DataMap& other) const {
    return level == other.level && chunks == other.chunks;
  }
  bool operator!=(const DataMap& other) const { return !(*this == other); }
};

const char* to_string(DataMap::Level level);

} // namespace encrypt
} // namespace xornet

#endif // XORNET_DATA_MAP_HPP

#ifndef XORNET_DATA_MAP_PACKER_HPP
#define XORNET_DATA_MAP_PACKER_HPP

#include <functional>
#include <vector>
#include "encrypt/data_map.hpp"
#include "encrypt/self_encryptor.hpp"

namespace xornet {
namespace encrypt {

struct PackedData {
  DataMap root;                         // fits in one chunk
  std::vector<EncryptedChunk> chunks;   // payload chunks followed by map chunks
  size_t depth = 0;                     // number of Indirect levels above the Final map
};

// Wraps a SelfEncryptor and nests oversized data maps until the root fits one chunk.
class DataMapPacker {
public:
  static constexpr size_t MAX_DEPTH = 16;

  // Returns the ciphertext for one chunk entry; it must already hash to info.address
  using ChunkFetcher = std::function<Bytes(const ChunkInfo& info)>;

  // Throws std::invalid_argument if a three-entry map cannot fit in max_chunk_size
  explicit DataMapPacker(const SelfEncryptor& encryptor);

  PackedData pack(const Bytes& payload) const;
  // Resolves Indirect levels iteratively down to the payload
  Bytes unpack(const DataMap& root, const ChunkFetcher& fetch) const;

  // Every chunk of a single map level, fetched and decrypted
  Bytes resolve_level(const DataMap& data_map, const ChunkFetcher& fetch) const;

private:
  const SelfEncryptor& encryptor_;
};

} // namespace encrypt
} // namespace xornet

#endif // XORNET_DATA_MAP_PACKER_HPP

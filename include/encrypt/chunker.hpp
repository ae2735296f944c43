#ifndef XORNET_CHUNKER_HPP
#define XORNET_CHUNKER_HPP

#include <cstdint>
#include <vector>
#include "crypto/content_address.hpp"

namespace xornet {
namespace encrypt {

using crypto::Bytes;
using crypto::ContentAddress;

struct ChunkerConfig {
  static constexpr size_t kMinChunks = 3;

  size_t min_chunk_size = 1024;              // bytes
  size_t max_chunk_size = 1024 * 1024;       // bytes
  size_t min_chunks = kMinChunks;

  // Throws std::invalid_argument when the bounds are inconsistent
  void validate() const;
};

// Contiguous slice of the original payload. Never stored or transmitted.
struct RawChunk {
  uint32_t index = 0;
  uint64_t offset = 0;
  Bytes bytes;
  ContentAddress plaintext_hash;
};

class Chunker {
public:
  // ---- CONSTRUCTOR ----
  explicit Chunker(ChunkerConfig config = {});


  // ---- CHUNKING ----
  // Splits by even division into max(min_chunks, ceil(size / max_chunk_size)) chunks.
  // Throws EmptyInputError or InsufficientChunksError.
  std::vector<RawChunk> split(const Bytes& payload) const;
  // Concatenates chunks in index order; throws ReconstructionError on gaps
  static Bytes reassemble(const std::vector<RawChunk>& chunks);


  // ---- QUERY OPERATIONS ----
  size_t chunk_count(size_t payload_size) const;
  // Size of chunk `index` for a payload of `payload_size` bytes
  size_t chunk_size(size_t payload_size, size_t index) const;
  const ChunkerConfig& config() const { return config_; }

private:
  ChunkerConfig config_;
};

} // namespace encrypt
} // namespace xornet

#endif // XORNET_CHUNKER_HPP

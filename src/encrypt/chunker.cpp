#include "encrypt/chunker.hpp"
#include "encrypt/encrypt_error.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <boost/log/trivial.hpp>

namespace xornet {
namespace encrypt {

void ChunkerConfig::validate() const {
  if (min_chunk_size == 0) {
    throw std::invalid_argument("Chunker: min_chunk_size must be positive");
  }
  if (min_chunk_size > max_chunk_size) {
    throw std::invalid_argument("Chunker: min_chunk_size " + std::to_string(min_chunk_size) +
                                " exceeds max_chunk_size " + std::to_string(max_chunk_size));
  }
  if (min_chunks < kMinChunks) {
    throw std::invalid_argument("Chunker: at least " + std::to_string(kMinChunks) +
                                " chunks are required");
  }
}

Chunker::Chunker(ChunkerConfig config) : config_(config) {
  config_.validate();
  BOOST_LOG_TRIVIAL(debug) << "Chunker: Configured with chunk size range [" << config_.min_chunk_size
                           << ", " << config_.max_chunk_size << "], minimum " << config_.min_chunks << " chunks";
}

//==============================================
// QUERY OPERATIONS
//==============================================

size_t Chunker::chunk_count(size_t payload_size) const {
  size_t by_max = (payload_size + config_.max_chunk_size - 1) / config_.max_chunk_size;
  return std::max(config_.min_chunks, by_max);
}

size_t Chunker::chunk_size(size_t payload_size, size_t index) const {
  size_t count = chunk_count(payload_size);
  size_t base = payload_size / count;
  // The first (size % count) chunks carry one extra byte
  return index < payload_size % count ? base + 1 : base;
}

//==============================================
// CHUNKING
//==============================================

std::vector<RawChunk> Chunker::split(const Bytes& payload) const {
  if (payload.empty()) {
    BOOST_LOG_TRIVIAL(error) << "Chunker: Refusing to chunk an empty payload";
    throw EmptyInputError("payload has no bytes");
  }

  if (payload.size() < config_.min_chunks) {
    BOOST_LOG_TRIVIAL(error) << "Chunker: Payload of " << payload.size()
                             << " bytes cannot form " << config_.min_chunks << " chunks";
    throw InsufficientChunksError("payload of " + std::to_string(payload.size()) +
                                  " bytes cannot form " + std::to_string(config_.min_chunks) + " chunks");
  }

  if (payload.size() < config_.min_chunks * config_.min_chunk_size) {
    BOOST_LOG_TRIVIAL(debug) << "Chunker: Payload of " << payload.size()
                             << " bytes is below the minimum chunk size budget, relaxing minimum";
  }

  size_t count = chunk_count(payload.size());
  std::vector<RawChunk> chunks;
  chunks.reserve(count);

  uint64_t offset = 0;
  for (size_t i = 0; i < count; ++i) {
    size_t length = chunk_size(payload.size(), i);

    RawChunk chunk;
    chunk.index = static_cast<uint32_t>(i);
    chunk.offset = offset;
    chunk.bytes.assign(payload.begin() + offset, payload.begin() + offset + length);
    chunk.plaintext_hash = ContentAddress::of(chunk.bytes);
    chunks.push_back(std::move(chunk));

    offset += length;
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunker: Split " << payload.size() << " bytes into " << count << " chunks";
  return chunks;
}

Bytes Chunker::reassemble(const std::vector<RawChunk>& chunks) {
  Bytes payload;
  uint64_t expected_offset = 0;

  for (size_t i = 0; i < chunks.size(); ++i) {
    const auto& chunk = chunks[i];
    if (chunk.index != i || chunk.offset != expected_offset) {
      BOOST_LOG_TRIVIAL(error) << "Chunker: Chunk " << chunk.index << " out of place at position " << i;
      throw ReconstructionError("chunk sequence has a gap or overlap at position " + std::to_string(i));
    }
    payload.insert(payload.end(), chunk.bytes.begin(), chunk.bytes.end());
    expected_offset += chunk.bytes.size();
  }

  return payload;
}

} // namespace encrypt
} // namespace xornet

#include "encrypt/data_map_packer.hpp"
#include "encrypt/encrypt_error.hpp"
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <boost/log/trivial.hpp>

namespace xornet {
namespace encrypt {

DataMapPacker::DataMapPacker(const SelfEncryptor& encryptor)
  : encryptor_(encryptor) {
  const auto& config = encryptor_.chunker().config();
  size_t smallest_map = DataMap::HEADER_SIZE + config.min_chunks * DataMap::ENTRY_SIZE;
  if (config.max_chunk_size < smallest_map) {
    BOOST_LOG_TRIVIAL(error) << "Data map packer: max_chunk_size " << config.max_chunk_size
                             << " cannot hold a " << config.min_chunks << "-entry map (" << smallest_map << " bytes)";
    throw std::invalid_argument("Data map packer: max_chunk_size too small to hold a data map");
  }
}

PackedData DataMapPacker::pack(const Bytes& payload) const {
  const size_t budget = encryptor_.chunker().config().max_chunk_size;

  EncryptResult level = encryptor_.encrypt(payload, DataMap::Level::Final);
  PackedData packed;
  packed.chunks = std::move(level.chunks);
  DataMap current = std::move(level.data_map);

  // Each pass shrinks the map, see the constructor's size check
  while (current.serialized_size() > budget) {
    if (packed.depth >= MAX_DEPTH) {
      throw EncryptError("Data map packer: nesting exceeded " + std::to_string(MAX_DEPTH) + " levels");
    }

    BOOST_LOG_TRIVIAL(debug) << "Data map packer: Map of " << current.chunks.size() << " entries ("
                             << current.serialized_size() << " bytes) exceeds chunk budget " << budget << ", nesting";

    EncryptResult nested = encryptor_.encrypt(current.serialize(), DataMap::Level::Indirect);
    packed.chunks.insert(packed.chunks.end(),
                         std::make_move_iterator(nested.chunks.begin()),
                         std::make_move_iterator(nested.chunks.end()));
    current = std::move(nested.data_map);
    ++packed.depth;
  }

  packed.root = std::move(current);
  BOOST_LOG_TRIVIAL(info) << "Data map packer: Packed " << payload.size() << " bytes into "
                          << packed.chunks.size() << " chunks, depth " << packed.depth;
  return packed;
}

Bytes DataMapPacker::resolve_level(const DataMap& data_map, const ChunkFetcher& fetch) const {
  encryptor_.check_layout(data_map);

  std::vector<RawChunk> pieces;
  pieces.reserve(data_map.chunks.size());
  uint64_t offset = 0;
  for (const auto& info : data_map.chunks) {
    RawChunk piece;
    piece.index = info.index;
    piece.offset = offset;
    piece.bytes = encryptor_.decrypt_chunk(data_map, info.index, fetch(info));
    piece.plaintext_hash = info.plaintext_hash;
    offset += piece.bytes.size();
    pieces.push_back(std::move(piece));
  }
  return Chunker::reassemble(pieces);
}

Bytes DataMapPacker::unpack(const DataMap& root, const ChunkFetcher& fetch) const {
  DataMap current = root;

  for (size_t depth = 0; depth <= MAX_DEPTH; ++depth) {
    Bytes content = resolve_level(current, fetch);

    if (current.level == DataMap::Level::Final) {
      BOOST_LOG_TRIVIAL(info) << "Data map packer: Resolved " << content.size() << " bytes through "
                              << depth << " indirect levels";
      return content;
    }

    try {
      current = DataMap::deserialize(content);
    } catch (const DataMapError& e) {
      BOOST_LOG_TRIVIAL(error) << "Data map packer: Child map at depth " << depth << " is malformed: " << e.what();
      throw ReconstructionError(std::string("child data map malformed: ") + e.what());
    }
  }

  throw ReconstructionError("data map nesting exceeded " + std::to_string(MAX_DEPTH) + " levels");
}

} // namespace encrypt
} // namespace xornet

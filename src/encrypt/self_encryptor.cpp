#include "encrypt/self_encryptor.hpp"
#include "encrypt/encrypt_error.hpp"
#include "crypto/aes_cipher.hpp"
#include <algorithm>
#include <exception>
#include <map>
#include <string>
#include <thread>
#include <utility>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/log/trivial.hpp>

namespace xornet {
namespace encrypt {

namespace {

std::vector<ContentAddress> plaintext_hashes(const DataMap& data_map) {
  std::vector<ContentAddress> hashes;
  hashes.reserve(data_map.chunks.size());
  for (const auto& info : data_map.chunks) {
    hashes.push_back(info.plaintext_hash);
  }
  return hashes;
}

} // namespace

SelfEncryptor::SelfEncryptor(ChunkerConfig config, size_t worker_count)
  : chunker_(config)
  , worker_count_(worker_count == 0 ? std::max(1u, std::thread::hardware_concurrency()) : worker_count) {
}

//==============================================
// KEY DERIVATION
//==============================================

SelfEncryptor::KeyMaterial SelfEncryptor::derive_key_material(const ContentAddress& previous_hash,
                                                              const ContentAddress& next_hash) {
  const Bytes previous(previous_hash.value().begin(), previous_hash.value().end());
  const Bytes next(next_hash.value().begin(), next_hash.value().end());

  // Key and IV from H(prev || next), pad from H(next || prev)
  auto material = crypto::sha512({&previous, &next});
  auto pad = crypto::sha512({&next, &previous});

  KeyMaterial result;
  result.key.assign(material.begin(), material.begin() + crypto::AesCipher::KEY_SIZE);
  result.iv.assign(material.begin() + crypto::AesCipher::KEY_SIZE,
                   material.begin() + crypto::AesCipher::KEY_SIZE + crypto::AesCipher::IV_SIZE);
  result.pad = pad;
  return result;
}

SelfEncryptor::KeyMaterial SelfEncryptor::key_material_for(const std::vector<ContentAddress>& hashes,
                                                           size_t index) {
  const size_t count = hashes.size();
  if (count < ChunkerConfig::kMinChunks) {
    throw InsufficientChunksError(std::to_string(count) + " chunks, need at least " +
                                  std::to_string(ChunkerConfig::kMinChunks));
  }
  if (index >= count) {
    throw std::out_of_range("Self encryptor: chunk index " + std::to_string(index) + " out of range");
  }

  const size_t previous = (index + count - 1) % count;
  const size_t next = (index + 1) % count;
  return derive_key_material(hashes[previous], hashes[next]);
}

//==============================================
// CHUNK TRANSFORMS
//==============================================

void SelfEncryptor::apply_pad(Bytes& data, const std::array<uint8_t, PAD_SIZE>& pad) {
  for (size_t i = 0; i < data.size(); ++i) {
    data[i] ^= pad[i % PAD_SIZE];
  }
}

Bytes SelfEncryptor::encrypt_chunk(const RawChunk& chunk, const KeyMaterial& material) {
  crypto::AesCipher cipher;
  cipher.initialize(material.key, material.iv);
  Bytes content = cipher.encrypt(chunk.bytes);
  apply_pad(content, material.pad);
  return content;
}

Bytes SelfEncryptor::decrypt_chunk_bytes(const Bytes& ciphertext, const KeyMaterial& material) {
  Bytes unpadded = ciphertext;
  apply_pad(unpadded, material.pad);

  crypto::AesCipher cipher;
  cipher.initialize(material.key, material.iv);
  return cipher.decrypt(unpadded);
}

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

EncryptResult SelfEncryptor::encrypt(const Bytes& payload, DataMap::Level level) const {
  BOOST_LOG_TRIVIAL(info) << "Self encryptor: Encrypting " << payload.size() << " bytes";

  // All plaintext hashes are known once chunking completes
  std::vector<RawChunk> raw_chunks = chunker_.split(payload);
  std::vector<ContentAddress> hashes;
  hashes.reserve(raw_chunks.size());
  for (const auto& chunk : raw_chunks) {
    hashes.push_back(chunk.plaintext_hash);
  }

  EncryptResult result;
  result.data_map.level = level;
  result.data_map.chunks.resize(raw_chunks.size());
  result.chunks.resize(raw_chunks.size());
  std::vector<std::exception_ptr> failures(raw_chunks.size());

  auto encrypt_one = [&](size_t i) {
    try {
      const RawChunk& raw = raw_chunks[i];
      EncryptedChunk encrypted;
      encrypted.index = raw.index;
      encrypted.content = encrypt_chunk(raw, key_material_for(hashes, i));
      encrypted.address = ContentAddress::of(encrypted.content);

      ChunkInfo& info = result.data_map.chunks[i];
      info.index = raw.index;
      info.plaintext_hash = raw.plaintext_hash;
      info.plaintext_size = raw.bytes.size();
      info.address = encrypted.address;

      result.chunks[i] = std::move(encrypted);
    } catch (...) {
      failures[i] = std::current_exception();
    }
  };

  const size_t workers = std::min(worker_count_, raw_chunks.size());
  if (workers <= 1) {
    for (size_t i = 0; i < raw_chunks.size(); ++i) {
      encrypt_one(i);
    }
  } else {
    // Each task writes only its own slot, no further synchronisation needed
    boost::asio::thread_pool pool(workers);
    for (size_t i = 0; i < raw_chunks.size(); ++i) {
      boost::asio::post(pool, [&encrypt_one, i]() { encrypt_one(i); });
    }
    pool.join();
  }

  for (size_t i = 0; i < failures.size(); ++i) {
    if (failures[i]) {
      BOOST_LOG_TRIVIAL(error) << "Self encryptor: Failed to encrypt chunk " << i;
      std::rethrow_exception(failures[i]);
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Self encryptor: Produced " << result.chunks.size() << " encrypted chunks ("
                          << to_string(level) << " map)";
  return result;
}

Bytes SelfEncryptor::decrypt_chunk(const DataMap& data_map, uint32_t index, const Bytes& ciphertext) const {
  if (index >= data_map.chunks.size()) {
    throw ReconstructionError("chunk index " + std::to_string(index) + " not in data map");
  }

  const ChunkInfo& info = data_map.chunks[index];
  if (ContentAddress::of(ciphertext) != info.address) {
    BOOST_LOG_TRIVIAL(error) << "Self encryptor: Ciphertext for chunk " << index
                             << " does not match address " << info.address;
    throw ReconstructionError("ciphertext of chunk " + std::to_string(index) + " does not match its address");
  }

  Bytes plaintext;
  try {
    plaintext = decrypt_chunk_bytes(ciphertext, key_material_for(plaintext_hashes(data_map), index));
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Self encryptor: Chunk " << index << " failed to decrypt: " << e.what();
    throw ReconstructionError("chunk " + std::to_string(index) + " failed to decrypt");
  }

  if (plaintext.size() != info.plaintext_size || ContentAddress::of(plaintext) != info.plaintext_hash) {
    BOOST_LOG_TRIVIAL(error) << "Self encryptor: Chunk " << index << " decrypted to unexpected content";
    throw ReconstructionError("chunk " + std::to_string(index) + " plaintext hash mismatch");
  }

  return plaintext;
}

void SelfEncryptor::check_layout(const DataMap& data_map) const {
  if (data_map.chunks.size() < ChunkerConfig::kMinChunks) {
    throw ReconstructionError("data map holds " + std::to_string(data_map.chunks.size()) + " chunks");
  }

  const size_t max_chunk_size = chunker_.config().max_chunk_size;
  for (size_t i = 0; i < data_map.chunks.size(); ++i) {
    const ChunkInfo& info = data_map.chunks[i];
    if (info.index != i) {
      throw ReconstructionError("data map entry " + std::to_string(i) + " carries index " +
                                std::to_string(info.index));
    }
    if (info.plaintext_size == 0 || info.plaintext_size > max_chunk_size) {
      BOOST_LOG_TRIVIAL(error) << "Self encryptor: Chunk " << i << " claims " << info.plaintext_size
                               << " bytes, limit is " << max_chunk_size;
      throw ReconstructionError("chunk " + std::to_string(i) + " claims an impossible size");
    }
  }
}

Bytes SelfEncryptor::decrypt(const DataMap& data_map, const std::vector<EncryptedChunk>& chunks) const {
  BOOST_LOG_TRIVIAL(info) << "Self encryptor: Decrypting " << data_map.chunks.size() << " chunks";
  check_layout(data_map);

  std::map<uint32_t, const EncryptedChunk*> by_index;
  for (const auto& chunk : chunks) {
    by_index[chunk.index] = &chunk;
  }

  std::vector<RawChunk> pieces;
  pieces.reserve(data_map.chunks.size());
  uint64_t offset = 0;
  for (const auto& info : data_map.chunks) {
    auto it = by_index.find(info.index);
    if (it == by_index.end()) {
      BOOST_LOG_TRIVIAL(error) << "Self encryptor: Missing chunk " << info.index;
      throw ReconstructionError("missing chunk " + std::to_string(info.index));
    }

    RawChunk piece;
    piece.index = info.index;
    piece.offset = offset;
    piece.bytes = decrypt_chunk(data_map, info.index, it->second->content);
    piece.plaintext_hash = info.plaintext_hash;
    offset += piece.bytes.size();
    pieces.push_back(std::move(piece));
  }

  return Chunker::reassemble(pieces);
}

} // namespace encrypt
} // namespace xornet

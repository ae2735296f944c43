#ifndef XORNET_SELF_ENCRYPTOR_HPP
#define XORNET_SELF_ENCRYPTOR_HPP

#include <array>
#include <cstdint>
#include <vector>
#include "crypto/content_address.hpp"
#include "encrypt/chunker.hpp"
#include "encrypt/data_map.hpp"

namespace xornet {
namespace encrypt {

// Network-stored unit, addressed by the SHA-256 of its own ciphertext
struct EncryptedChunk {
  uint32_t index = 0;
  ContentAddress address;
  Bytes content;
};

struct EncryptResult {
  DataMap data_map;
  std::vector<EncryptedChunk> chunks;   // same order as data_map.chunks
};

// Encrypts each chunk under a key derived from the plaintext hashes of its previous and
// next chunk (cyclically). No external secret is involved, so identical payloads
// always produce identical data maps and ciphertexts.
class SelfEncryptor {
public:
  static constexpr size_t PAD_SIZE = 64;

  struct KeyMaterial {
    std::vector<uint8_t> key;            // AesCipher::KEY_SIZE bytes
    std::vector<uint8_t> iv;             // AesCipher::IV_SIZE bytes
    std::array<uint8_t, PAD_SIZE> pad;   // XORed over the ciphertext

    bool operator==(const KeyMaterial& other) const {
      return key == other.key && iv == other.iv && pad == other.pad;
    }
    bool operator!=(const KeyMaterial& other) const { return !(*this == other); }
  };

  // ---- CONSTRUCTOR ----
  // worker_count == 0 uses the hardware concurrency
  explicit SelfEncryptor(ChunkerConfig config = {}, size_t worker_count = 0);


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  EncryptResult encrypt(const Bytes& payload, DataMap::Level level = DataMap::Level::Final) const;
  // Needs every chunk the map references, in any order. Throws ReconstructionError.
  Bytes decrypt(const DataMap& data_map, const std::vector<EncryptedChunk>& chunks) const;
  // Decrypts and verifies chunk `index` of the map
  Bytes decrypt_chunk(const DataMap& data_map, uint32_t index, const Bytes& ciphertext) const;
  // Rejects maps this encryptor could not have produced before anything is fetched:
  // fewer than kMinChunks entries, indices out of position, or an entry larger than
  // max_chunk_size. Throws ReconstructionError.
  void check_layout(const DataMap& data_map) const;


  // ---- KEY DERIVATION ----
  static KeyMaterial derive_key_material(const ContentAddress& previous_hash,
                                         const ContentAddress& next_hash);
  // Material for chunk `index` given every chunk's plaintext hash
  static KeyMaterial key_material_for(const std::vector<ContentAddress>& plaintext_hashes, size_t index);


  const Chunker& chunker() const { return chunker_; }

private:
  Chunker chunker_;
  size_t worker_count_;

  static Bytes encrypt_chunk(const RawChunk& chunk, const KeyMaterial& material);
  static Bytes decrypt_chunk_bytes(const Bytes& ciphertext, const KeyMaterial& material);
  static void apply_pad(Bytes& data, const std::array<uint8_t, PAD_SIZE>& pad);
};

} // namespace encrypt
} // namespace xornet

#endif // XORNET_SELF_ENCRYPTOR_HPP

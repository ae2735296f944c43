#ifndef XORNET_AES_CIPHER_HPP
#define XORNET_AES_CIPHER_HPP

#include <cstdint>
#include <memory>
#include <vector>
#include "crypto/crypto_error.hpp"

namespace xornet::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// AES-256-CBC with PKCS#7 padding over whole buffers. Key and IV are supplied by the
// caller; the self-encryptor derives both from neighbouring chunk hashes.
class AesCipher {
public:
  static constexpr size_t KEY_SIZE = 32;     // 256 bits for AES-256
  static constexpr size_t IV_SIZE = 16;      // 128 bits for CBC mode
  static constexpr size_t BLOCK_SIZE = 16;   // AES block size

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  AesCipher();
  ~AesCipher();
  AesCipher(const AesCipher&) = delete;
  AesCipher& operator=(const AesCipher&) = delete;


  // ---- INITIALIZATION ----
  // Throws InitializationError on a wrong key or IV length
  void initialize(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv);
  bool is_initialized() const { return is_initialized_; }


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext);
  // Throws DecryptionError when the padding does not check out
  std::vector<uint8_t> decrypt(const std::vector<uint8_t>& ciphertext);

  // Ciphertext length for a plaintext of the given size
  static size_t padded_size(size_t plaintext_size) {
    return (plaintext_size / BLOCK_SIZE + 1) * BLOCK_SIZE;
  }

private:
  std::vector<uint8_t> key_;
  std::vector<uint8_t> iv_;
  std::unique_ptr<CipherContext> context_;
  bool is_initialized_ = false;

  void reset_context(bool encrypting);
  std::vector<uint8_t> run(const std::vector<uint8_t>& input, bool encrypting);
};

} // namespace xornet::crypto

#endif // XORNET_AES_CIPHER_HPP

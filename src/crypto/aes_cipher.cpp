#include "crypto/aes_cipher.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <string>
#include <boost/log/trivial.hpp>

namespace xornet::crypto {

// Owns one EVP_CIPHER_CTX for the lifetime of an AesCipher
struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() : ctx(EVP_CIPHER_CTX_new()) {
    if (!ctx) {
      throw InitializationError("AES cipher: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    EVP_CIPHER_CTX_free(ctx);
  }

  EVP_CIPHER_CTX* get() { return ctx; }
};


AesCipher::AesCipher() : context_(std::make_unique<CipherContext>()) {}

AesCipher::~AesCipher() = default;

void AesCipher::initialize(const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv) {
  if (key.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "AES cipher: Key is " << key.size() << " bytes, expected " << KEY_SIZE;
    throw InitializationError("AES cipher: key must be " + std::to_string(KEY_SIZE) + " bytes");
  }
  if (iv.size() != IV_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "AES cipher: IV is " << iv.size() << " bytes, expected " << IV_SIZE;
    throw InitializationError("AES cipher: IV must be " + std::to_string(IV_SIZE) + " bytes");
  }

  key_ = key;
  iv_ = iv;
  is_initialized_ = true;
}

std::vector<uint8_t> AesCipher::encrypt(const std::vector<uint8_t>& plaintext) {
  return run(plaintext, true);
}

std::vector<uint8_t> AesCipher::decrypt(const std::vector<uint8_t>& ciphertext) {
  return run(ciphertext, false);
}

void AesCipher::reset_context(bool encrypting) {
  if (!is_initialized_) {
    throw InitializationError("AES cipher: key and IV not set");
  }

  // One instance may run several operations
  EVP_CIPHER_CTX_reset(context_->get());

  int ok = encrypting
    ? EVP_EncryptInit_ex(context_->get(), EVP_aes_256_cbc(), nullptr, key_.data(), iv_.data())
    : EVP_DecryptInit_ex(context_->get(), EVP_aes_256_cbc(), nullptr, key_.data(), iv_.data());
  if (!ok) {
    if (encrypting) {
      throw EncryptionError("AES cipher: Failed to initialize encryption");
    }
    throw DecryptionError("AES cipher: Failed to initialize decryption");
  }
}

std::vector<uint8_t> AesCipher::run(const std::vector<uint8_t>& input, bool encrypting) {
  reset_context(encrypting);

  std::vector<uint8_t> output(input.size() + EVP_MAX_BLOCK_LENGTH);
  int written = 0;
  if (!input.empty()) {
    int ok = encrypting
      ? EVP_EncryptUpdate(context_->get(), output.data(), &written, input.data(), static_cast<int>(input.size()))
      : EVP_DecryptUpdate(context_->get(), output.data(), &written, input.data(), static_cast<int>(input.size()));
    if (!ok) {
      if (encrypting) {
        throw EncryptionError("AES cipher: Failed to encrypt block");
      }
      throw DecryptionError("AES cipher: Failed to decrypt block");
    }
  }

  int final_written = 0;
  if (encrypting) {
    if (!EVP_EncryptFinal_ex(context_->get(), output.data() + written, &final_written)) {
      throw EncryptionError("AES cipher: Failed to finalize encryption");
    }
  } else if (!EVP_DecryptFinal_ex(context_->get(), output.data() + written, &final_written)) {
    ERR_clear_error();
    BOOST_LOG_TRIVIAL(debug) << "AES cipher: Padding check failed on " << input.size() << " bytes";
    throw DecryptionError("AES cipher: Failed to finalize decryption");
  }

  output.resize(static_cast<size_t>(written + final_written));
  return output;
}

} // namespace xornet::crypto

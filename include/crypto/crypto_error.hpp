#ifndef XORNET_CRYPTO_ERROR_HPP
#define XORNET_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace xornet::crypto {

// Base for OpenSSL-backed failures: hashing, cipher setup, encryption, decryption
class CryptoError : public std::runtime_error {
public:
  explicit CryptoError(const std::string& message) : std::runtime_error(message) {}
};

// Context allocation failed or key/IV have the wrong length
class InitializationError : public CryptoError {
public:
  explicit InitializationError(const std::string& message) : CryptoError(message) {}
};

class EncryptionError : public CryptoError {
public:
  explicit EncryptionError(const std::string& message) : CryptoError(message) {}
};

// Wrong key material or corrupted ciphertext, usually seen as a padding failure
class DecryptionError : public CryptoError {
public:
  explicit DecryptionError(const std::string& message) : CryptoError(message) {}
};

} // namespace xornet::crypto

#endif // XORNET_CRYPTO_ERROR_HPP

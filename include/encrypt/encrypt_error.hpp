#ifndef XORNET_ENCRYPT_ERROR_HPP
#define XORNET_ENCRYPT_ERROR_HPP

#include <stdexcept>
#include <string>

namespace xornet {
namespace encrypt {

class EncryptError : public std::runtime_error {
public:
  explicit EncryptError(const std::string& message) : std::runtime_error(message) {}
};

// Payload has no bytes
class EmptyInputError : public EncryptError {
public:
  explicit EmptyInputError(const std::string& message)
    : EncryptError("Empty input: " + message) {}
};

// Payload or data map cannot provide the three chunks key derivation needs
class InsufficientChunksError : public EncryptError {
public:
  explicit InsufficientChunksError(const std::string& message)
    : EncryptError("Insufficient chunks: " + message) {}
};

// Decode-time failure; no partial payload is ever returned alongside it
class ReconstructionError : public EncryptError {
public:
  explicit ReconstructionError(const std::string& message)
    : EncryptError("Reconstruction failed: " + message) {}
};

// Malformed serialized data map
class DataMapError : public EncryptError {
public:
  explicit DataMapError(const std::string& message)
    : EncryptError("Data map: " + message) {}
};

} // namespace encrypt
} // namespace xornet

#endif // XORNET_ENCRYPT_ERROR_HPP

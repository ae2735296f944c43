#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "crypto/content_address.hpp"

namespace xornet {
namespace store {

using crypto::Bytes;
using crypto::ContentAddress;

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// No chunk under the requested address
class ChunkNotFoundError : public StoreError {
public:
  explicit ChunkNotFoundError(const ContentAddress& address)
    : StoreError("Chunk not found: " + address.to_hex()) {}
};

// Different bytes offered for an address that is already committed
class ChunkConflictError : public StoreError {
public:
  explicit ChunkConflictError(const ContentAddress& address)
    : StoreError("Conflicting content for chunk: " + address.to_hex()) {}
};

// Bytes do not hash to the address they were stored or fetched under
class ChunkMismatchError : public StoreError {
public:
  ChunkMismatchError(const ContentAddress& expected, const ContentAddress& actual)
    : StoreError("Chunk content mismatch: expected " + expected.to_hex() + ", got " + actual.to_hex())
    , expected_(expected)
    , actual_(actual) {}

  const ContentAddress& expected() const { return expected_; }
  const ContentAddress& actual() const { return actual_; }

private:
  ContentAddress expected_;
  ContentAddress actual_;
};

// Throws ChunkMismatchError unless SHA-256(bytes) == address
void verify_content(const ContentAddress& address, const Bytes& bytes);

// Content-addressed, append-only chunk storage. Operations on one address linearize;
// operations on distinct addresses are independent.
class ChunkStore {
public:
  virtual ~ChunkStore() = default;

  // ---- CORE STORAGE OPERATIONS ----
  // Returns true if the chunk was newly written, false if identical bytes were present.
  // Throws ChunkConflictError if different bytes are already stored.
  virtual bool put(const ContentAddress& address, const Bytes& bytes) = 0;
  // Throws ChunkNotFoundError on a miss
  virtual Bytes get(const ContentAddress& address) const = 0;

  // ---- QUERY OPERATIONS ----
  virtual bool has(const ContentAddress& address) const = 0;
  virtual uint64_t size_of(const ContentAddress& address) const = 0;
  virtual size_t count() const = 0;
  virtual std::vector<ContentAddress> addresses() const = 0;
};

// Fixed set of mutexes selected by address, so same-address operations serialize
// without one global lock
class AddressLocks {
public:
  static constexpr size_t STRIPES = 64;

  std::mutex& for_address(const ContentAddress& address) const {
    return stripes_[address[0] % STRIPES];
  }

private:
  mutable std::array<std::mutex, STRIPES> stripes_;
};

} // namespace store
} // namespace xornet

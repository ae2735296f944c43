#ifndef XORNET_CONTENT_ADDRESS_HPP
#define XORNET_CONTENT_ADDRESS_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace xornet::crypto {

using Bytes = std::vector<uint8_t>;

// Fixed-width identifier of immutable bytes. Node ids live in the same space.
class ContentAddress {
public:
  static constexpr size_t SIZE = 32;       // 256 bits
  static constexpr size_t BITS = SIZE * 8;
  using Value = std::array<uint8_t, SIZE>;

  // ---- CONSTRUCTION ----
  ContentAddress() : value_{} {}
  explicit ContentAddress(const Value& value) : value_(value) {}

  // SHA-256 of the given bytes
  static ContentAddress of(const Bytes& data);
  static ContentAddress of(const uint8_t* data, size_t length);
  // Parses 64 hex characters, throws std::invalid_argument otherwise
  static ContentAddress from_hex(const std::string& hex);


  // ---- ACCESSORS ----
  const Value& value() const { return value_; }
  const uint8_t* data() const { return value_.data(); }
  uint8_t operator[](size_t i) const { return value_[i]; }
  bool is_zero() const;

  std::string to_hex() const;
  // First 8 hex characters, used in log lines
  std::string short_hex() const;


  // ---- XOR METRIC ----
  // Bytewise XOR; distances compare as big-endian integers
  static ContentAddress distance(const ContentAddress& lhs, const ContentAddress& rhs);
  // Number of leading zero bits, BITS for the zero value
  size_t leading_zero_bits() const;
  // floor(log2(lhs ^ rhs)), empty when lhs == rhs
  static std::optional<size_t> bucket_index(const ContentAddress& lhs, const ContentAddress& rhs);

  bool operator==(const ContentAddress& other) const { return value_ == other.value_; }
  bool operator!=(const ContentAddress& other) const { return value_ != other.value_; }
  bool operator<(const ContentAddress& other) const { return value_ < other.value_; }

private:
  Value value_;
};

using NodeId = ContentAddress;

std::ostream& operator<<(std::ostream& os, const ContentAddress& address);

// 64-byte SHA-512 digest of the concatenation of the given parts
std::array<uint8_t, 64> sha512(const std::vector<const Bytes*>& parts);

} // namespace xornet::crypto

#endif // XORNET_CONTENT_ADDRESS_HPP

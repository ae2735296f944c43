#include "crypto/content_address.hpp"
#include "crypto/crypto_error.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <boost/algorithm/hex.hpp>
#include <boost/log/trivial.hpp>

namespace xornet::crypto {

namespace {

// Owns an EVP_MD_CTX for the lifetime of one digest computation
struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw CryptoError("Content address: Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

void digest(const EVP_MD* md, const std::vector<std::pair<const uint8_t*, size_t>>& parts,
            unsigned char* out, unsigned int& out_len) {
  DigestContext ctx;

  if (!EVP_DigestInit_ex(ctx.get(), md, nullptr)) {
    throw CryptoError("Content address: Failed to initialize hash context");
  }

  for (const auto& [data, length] : parts) {
    if (length > 0 && !EVP_DigestUpdate(ctx.get(), data, length)) {
      throw CryptoError("Content address: Failed to update hash");
    }
  }

  if (!EVP_DigestFinal_ex(ctx.get(), out, &out_len)) {
    throw CryptoError("Content address: Failed to finalize hash");
  }
}

} // namespace

//==============================================
// CONSTRUCTION
//==============================================

ContentAddress ContentAddress::of(const Bytes& data) {
  return of(data.data(), data.size());
}

ContentAddress ContentAddress::of(const uint8_t* data, size_t length) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  digest(EVP_sha256(), {{data, length}}, hash, hash_len);

  if (hash_len != SIZE) {
    throw CryptoError("Content address: Unexpected digest length");
  }

  Value value{};
  std::copy(hash, hash + SIZE, value.begin());
  return ContentAddress(value);
}

ContentAddress ContentAddress::from_hex(const std::string& hex) {
  if (hex.size() != SIZE * 2) {
    throw std::invalid_argument("Content address: Expected " + std::to_string(SIZE * 2) +
                                " hex characters, got " + std::to_string(hex.size()));
  }

  Value value{};
  try {
    boost::algorithm::unhex(hex.begin(), hex.end(), value.begin());
  } catch (const boost::algorithm::hex_decode_error&) {
    throw std::invalid_argument("Content address: Invalid hex character in " + hex);
  }
  return ContentAddress(value);
}

//==============================================
// ACCESSORS
//==============================================

bool ContentAddress::is_zero() const {
  for (auto byte : value_) {
    if (byte != 0) return false;
  }
  return true;
}

std::string ContentAddress::to_hex() const {
  std::string hex;
  hex.reserve(SIZE * 2);
  boost::algorithm::hex_lower(value_.begin(), value_.end(), std::back_inserter(hex));
  return hex;
}

std::string ContentAddress::short_hex() const {
  return to_hex().substr(0, 8);
}

//==============================================
// XOR METRIC
//==============================================

ContentAddress ContentAddress::distance(const ContentAddress& lhs, const ContentAddress& rhs) {
  Value result{};
  for (size_t i = 0; i < SIZE; ++i) {
    result[i] = static_cast<uint8_t>(lhs.value_[i] ^ rhs.value_[i]);
  }
  return ContentAddress(result);
}

size_t ContentAddress::leading_zero_bits() const {
  size_t zeros = 0;
  for (auto byte : value_) {
    if (byte == 0) {
      zeros += 8;
      continue;
    }
    for (int bit = 7; bit >= 0; --bit) {
      if (byte & (1u << bit)) {
        return zeros;
      }
      ++zeros;
    }
  }
  return zeros;
}

std::optional<size_t> ContentAddress::bucket_index(const ContentAddress& lhs, const ContentAddress& rhs) {
  size_t zeros = distance(lhs, rhs).leading_zero_bits();
  if (zeros >= BITS) {
    return std::nullopt;
  }
  return BITS - zeros - 1;
}

std::ostream& operator<<(std::ostream& os, const ContentAddress& address) {
  return os << address.short_hex();
}

//==============================================
// KEY DERIVATION SUPPORT
//==============================================

std::array<uint8_t, 64> sha512(const std::vector<const Bytes*>& parts) {
  std::vector<std::pair<const uint8_t*, size_t>> views;
  views.reserve(parts.size());
  for (const auto* part : parts) {
    views.emplace_back(part->data(), part->size());
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  digest(EVP_sha512(), views, hash, hash_len);

  std::array<uint8_t, 64> result{};
  if (hash_len != result.size()) {
    BOOST_LOG_TRIVIAL(error) << "Content address: SHA-512 produced " << hash_len << " bytes";
    throw CryptoError("Content address: Unexpected SHA-512 digest length");
  }
  std::copy(hash, hash + result.size(), result.begin());
  return result;
}

} // namespace xornet::crypto

#include "encrypt/data_map.hpp"
#include "encrypt/encrypt_error.hpp"
#include <algorithm>
#include <cstring>
#include <string>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace xornet {
namespace encrypt {

namespace {

constexpr uint8_t MAGIC[4] = {'X', 'N', 'D', 'M'};

template <typename T>
void write_int(Bytes& out, T value) {
  T network_value = boost::endian::native_to_big(value);
  const auto* raw = reinterpret_cast<const uint8_t*>(&network_value);
  out.insert(out.end(), raw, raw + sizeof(T));
}

template <typename T>
T read_int(const Bytes& data, size_t& offset) {
  T network_value;
  std::memcpy(&network_value, data.data() + offset, sizeof(T));
  offset += sizeof(T);
  return boost::endian::big_to_native(network_value);
}

ContentAddress read_address(const Bytes& data, size_t& offset) {
  ContentAddress::Value value{};
  std::copy(data.begin() + offset, data.begin() + offset + ContentAddress::SIZE, value.begin());
  offset += ContentAddress::SIZE;
  return ContentAddress(value);
}

} // namespace

const char* to_string(DataMap::Level level) {
  switch (level) {
    case DataMap::Level::Final: return "final";
    case DataMap::Level::Indirect: return "indirect";
    default: return "unknown";
  }
}

uint64_t DataMap::total_size() const {
  uint64_t total = 0;
  for (const auto& chunk : chunks) {
    total += chunk.plaintext_size;
  }
  return total;
}

std::vector<ContentAddress> DataMap::addresses() const {
  std::vector<ContentAddress> result;
  result.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    result.push_back(chunk.address);
  }
  return result;
}

//==============================================
// SERIALIZATION
//==============================================

Bytes DataMap::serialize() const {
  Bytes out;
  out.reserve(serialized_size());

  out.insert(out.end(), std::begin(MAGIC), std::end(MAGIC));
  out.push_back(VERSION);
  out.push_back(static_cast<uint8_t>(level));
  write_int<uint32_t>(out, static_cast<uint32_t>(chunks.size()));

  for (const auto& chunk : chunks) {
    write_int<uint32_t>(out, chunk.index);
    write_int<uint64_t>(out, chunk.plaintext_size);
    out.insert(out.end(), chunk.plaintext_hash.value().begin(), chunk.plaintext_hash.value().end());
    out.insert(out.end(), chunk.address.value().begin(), chunk.address.value().end());
  }

  return out;
}

DataMap DataMap::deserialize(const Bytes& data) {
  if (data.size() < HEADER_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Data map: Serialized map too short: " << data.size() << " bytes";
    throw DataMapError("serialized map shorter than header");
  }

  if (!std::equal(std::begin(MAGIC), std::end(MAGIC), data.begin())) {
    throw DataMapError("bad magic");
  }

  size_t offset = sizeof(MAGIC);
  uint8_t version = data[offset++];
  if (version != VERSION) {
    throw DataMapError("unsupported version " + std::to_string(version));
  }

  uint8_t level = data[offset++];
  if (level > static_cast<uint8_t>(Level::Indirect)) {
    throw DataMapError("unknown level " + std::to_string(level));
  }

  uint32_t count = read_int<uint32_t>(data, offset);
  if (data.size() != HEADER_SIZE + static_cast<size_t>(count) * ENTRY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Data map: Length " << data.size() << " does not match " << count << " entries";
    throw DataMapError("length does not match entry count");
  }

  DataMap map;
  map.level = static_cast<Level>(level);
  map.chunks.reserve(count);

  for (uint32_t i = 0; i < count; ++i) {
    ChunkInfo info;
    info.index = read_int<uint32_t>(data, offset);
    info.plaintext_size = read_int<uint64_t>(data, offset);
    info.plaintext_hash = read_address(data, offset);
    info.address = read_address(data, offset);

    if (info.index != i) {
      throw DataMapError("entry " + std::to_string(i) + " carries index " + std::to_string(info.index));
    }
    map.chunks.push_back(info);
  }

  return map;
}

} // namespace encrypt
} // namespace xornet

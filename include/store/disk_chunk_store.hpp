#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include "store/chunk_store.hpp"

namespace xornet {
namespace store {

// Chunks as files under {base}/{hex[0:2]}/{hex[2:4]}/{hex[4:6]}/{remaining_hex}
class DiskChunkStore : public ChunkStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit DiskChunkStore(const std::string& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  bool put(const ContentAddress& address, const Bytes& bytes) override;
  Bytes get(const ContentAddress& address) const override;


  // ---- QUERY OPERATIONS ----
  bool has(const ContentAddress& address) const override;
  uint64_t size_of(const ContentAddress& address) const override;
  size_t count() const override;
  std::vector<ContentAddress> addresses() const override;

  const std::filesystem::path& base_path() const { return base_path_; }
  std::filesystem::path path_for(const ContentAddress& address) const;

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;
  AddressLocks locks_;


  // ---- FILE SUPPORT ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  Bytes read_file(const std::filesystem::path& file_path) const;
  void write_file(const std::filesystem::path& file_path, const Bytes& bytes) const;
};

} // namespace store
} // namespace xornet

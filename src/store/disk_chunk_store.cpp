#include "store/disk_chunk_store.hpp"
#include <boost/log/trivial.hpp>

namespace xornet {
namespace store {
  
//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================
  
DiskChunkStore::DiskChunkStore(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Disk store: Initializing store with base path: " << base_path;
  check_directory_exists(base_path_);
  BOOST_LOG_TRIVIAL(debug) << "Disk store: Store directory created/verified at: " << base_path;
}

  
//==============================================
// CORE STORAGE OPERATIONS
//==============================================

bool DiskChunkStore::put(const ContentAddress& address, const Bytes& bytes) {
  std::lock_guard<std::mutex> lock(locks_.for_address(address));
  BOOST_LOG_TRIVIAL(debug) << "Disk store: Storing " << bytes.size() << " bytes under " << address;

  std::filesystem::path file_path = path_for(address);

  if (std::filesystem::exists(file_path)) {
    if (read_file(file_path) == bytes) {
      BOOST_LOG_TRIVIAL(debug) << "Disk store: Chunk " << address << " already present";
      return false;
    }
    BOOST_LOG_TRIVIAL(error) << "Disk store: Refusing to overwrite " << address << " with different content";
    throw ChunkConflictError(address);
  }

  check_directory_exists(file_path.parent_path());

  // Write beside the target and rename, so readers never see a partial chunk
  std::filesystem::path temp_path = file_path;
  temp_path += ".tmp";
  write_file(temp_path, bytes);
  std::filesystem::rename(temp_path, file_path);

  BOOST_LOG_TRIVIAL(info) << "Disk store: Stored " << bytes.size() << " bytes under " << address;
  return true;
}

Bytes DiskChunkStore::get(const ContentAddress& address) const {
  std::lock_guard<std::mutex> lock(locks_.for_address(address));

  std::filesystem::path file_path = path_for(address);
  if (!std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(debug) << "Disk store: Chunk not found: " << address;
    throw ChunkNotFoundError(address);
  }

  Bytes bytes = read_file(file_path);
  BOOST_LOG_TRIVIAL(debug) << "Disk store: Read " << bytes.size() << " bytes for " << address;
  return bytes;
}

  
//==============================================
// QUERY OPERATIONS
//==============================================

bool DiskChunkStore::has(const ContentAddress& address) const {
  std::lock_guard<std::mutex> lock(locks_.for_address(address));
  return std::filesystem::exists(path_for(address));
}

uint64_t DiskChunkStore::size_of(const ContentAddress& address) const {
  std::lock_guard<std::mutex> lock(locks_.for_address(address));

  std::filesystem::path file_path = path_for(address);
  if (!std::filesystem::exists(file_path)) {
    throw ChunkNotFoundError(address);
  }
  return std::filesystem::file_size(file_path);
}

size_t DiskChunkStore::count() const {
  return addresses().size();
}

std::vector<ContentAddress> DiskChunkStore::addresses() const {
  std::vector<ContentAddress> result;
  for (const auto& entry : std::filesystem::recursive_directory_iterator(base_path_)) {
    if (!entry.is_regular_file() || entry.path().extension() == ".tmp") {
      continue;
    }

    // Rebuild the hex address from the three prefix directories and the file name
    std::filesystem::path relative = std::filesystem::relative(entry.path(), base_path_);
    std::string hex;
    for (const auto& part : relative) {
      hex += part.string();
    }

    try {
      result.push_back(ContentAddress::from_hex(hex));
    } catch (const std::invalid_argument&) {
      BOOST_LOG_TRIVIAL(warning) << "Disk store: Ignoring foreign file: " << entry.path().string();
    }
  }
  return result;
}

std::filesystem::path DiskChunkStore::path_for(const ContentAddress& address) const {
  std::string hash = address.to_hex();
  std::filesystem::path path = base_path_;
  
  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }
  
  path /= hash.substr(6);
  return path;
}
  

//==============================================
// FILE SUPPORT
//==============================================
  
void DiskChunkStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

Bytes DiskChunkStore::read_file(const std::filesystem::path& file_path) const {
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw StoreError("Disk store: Failed to open file: " + file_path.string());
  }

  Bytes bytes(std::filesystem::file_size(file_path));
  if (!bytes.empty() && !file.read(reinterpret_cast<char*>(bytes.data()), bytes.size())) {
    throw StoreError("Disk store: Failed to read file: " + file_path.string());
  }
  return bytes;
}

void DiskChunkStore::write_file(const std::filesystem::path& file_path, const Bytes& bytes) const {
  std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw StoreError("Disk store: Failed to create file: " + file_path.string());
  }

  file.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
  file.close();
  if (!file) {
    throw StoreError("Disk store: Failed to write file: " + file_path.string());
  }
}

} // namespace store
} // namespace xornet

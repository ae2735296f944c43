#include "store/chunk_store.hpp"
#include <boost/log/trivial.hpp>

namespace xornet {
namespace store {

void verify_content(const ContentAddress& address, const Bytes& bytes) {
  ContentAddress actual = ContentAddress::of(bytes);
  if (actual != address) {
    BOOST_LOG_TRIVIAL(warning) << "Store: Content of " << bytes.size() << " bytes hashes to " << actual
                               << ", expected " << address;
    throw ChunkMismatchError(address, actual);
  }
}

} // namespace store
} // namespace xornet

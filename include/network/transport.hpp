#ifndef XORNET_TRANSPORT_HPP
#define XORNET_TRANSPORT_HPP

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>
#include "crypto/content_address.hpp"
#include "dht/routing_table.hpp"
#include "network/network_error.hpp"

namespace xornet {
namespace network {

using crypto::Bytes;
using crypto::ContentAddress;
using crypto::NodeId;
using dht::PeerInfo;

// Moves chunk bytes between nodes. Implementations report failures through
// NetworkError rather than exceptions.
class Transport {
public:
  virtual ~Transport() = default;

  // Pushes a chunk to a peer's replica store
  virtual NetworkError send(const PeerInfo& peer, const ContentAddress& address,
                            const Bytes& bytes, std::chrono::milliseconds timeout) = 0;
  // Fetches a chunk; `out` is only written on SUCCESS and is not verified
  virtual NetworkError request(const PeerInfo& peer, const ContentAddress& address,
                               Bytes& out, std::chrono::milliseconds timeout) = 0;
  virtual bool ping(const PeerInfo& peer, std::chrono::milliseconds timeout) = 0;
};

// Receiving side of a Transport, implemented by nodes
class ChunkHandler {
public:
  virtual ~ChunkHandler() = default;

  // Throws store::ChunkMismatchError or store::ChunkConflictError to refuse
  virtual void handle_store(const ContentAddress& address, const Bytes& bytes) = 0;
  // Throws store::ChunkNotFoundError on a miss
  virtual Bytes handle_fetch(const ContentAddress& address) const = 0;
};


struct PaymentProof {
  std::vector<ContentAddress> addresses;
  std::string receipt;   // opaque to the storage core
};

// Thrown by a PaymentGate to refuse a store
class PaymentError : public std::runtime_error {
public:
  explicit PaymentError(const std::string& message) : std::runtime_error(message) {}
};

// Consulted before any chunk of an upload leaves the node
class PaymentGate {
public:
  virtual ~PaymentGate() = default;

  virtual PaymentProof pay(const std::vector<ContentAddress>& addresses) = 0;
};

} // namespace network
} // namespace xornet

#endif // XORNET_TRANSPORT_HPP

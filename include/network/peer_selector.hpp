#ifndef XORNET_PEER_SELECTOR_HPP
#define XORNET_PEER_SELECTOR_HPP

#include <vector>
#include "dht/routing_table.hpp"
#include "network/peer_health.hpp"

namespace xornet {
namespace network {

using crypto::ContentAddress;
using dht::PeerInfo;

struct StoreSelection {
  std::vector<PeerInfo> peers;   // closest first
  bool degraded = false;         // fewer than the replication factor were available
};

// Picks replica holders for an address from the routing table, skipping banned peers.
// Holds no state of its own between calls.
class PeerSelector {
public:
  static constexpr size_t DEFAULT_REPLICATION = 5;

  PeerSelector(const dht::RoutingTable& table, const PeerHealth& health,
               size_t replication = DEFAULT_REPLICATION);

  StoreSelection select_for_store(const ContentAddress& address) const;
  // Healthy peers closest first, then banned peers as a last resort
  std::vector<PeerInfo> select_for_fetch(const ContentAddress& address) const;

  size_t replication() const { return replication_; }

private:
  const dht::RoutingTable& table_;
  const PeerHealth& health_;
  size_t replication_;
};

} // namespace network
} // namespace xornet

#endif // XORNET_PEER_SELECTOR_HPP

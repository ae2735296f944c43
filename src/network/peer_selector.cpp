#include "network/peer_selector.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace xornet {
namespace network {

PeerSelector::PeerSelector(const dht::RoutingTable& table, const PeerHealth& health, size_t replication)
  : table_(table)
  , health_(health)
  , replication_(replication) {
  if (replication_ == 0) {
    throw std::invalid_argument("Peer selector: replication factor must be at least 1");
  }
}

StoreSelection PeerSelector::select_for_store(const ContentAddress& address) const {
  StoreSelection selection;

  for (auto& peer : table_.closest(address, table_.size())) {
    if (selection.peers.size() == replication_) {
      break;
    }
    if (health_.is_healthy(peer.id)) {
      selection.peers.push_back(std::move(peer));
    }
  }

  if (selection.peers.size() < replication_) {
    selection.degraded = true;
    BOOST_LOG_TRIVIAL(warning) << "Peer selector: Degraded replication for " << address.short_hex()
                               << ": " << selection.peers.size() << " of " << replication_ << " peers available";
  }
  return selection;
}

std::vector<PeerInfo> PeerSelector::select_for_fetch(const ContentAddress& address) const {
  std::vector<PeerInfo> healthy;
  std::vector<PeerInfo> banned;

  for (auto& peer : table_.closest(address, table_.size())) {
    if (health_.is_healthy(peer.id)) {
      healthy.push_back(std::move(peer));
    } else {
      banned.push_back(std::move(peer));
    }
  }

  healthy.insert(healthy.end(), banned.begin(), banned.end());
  return healthy;
}

} // namespace network
} // namespace xornet

#ifndef XORNET_LOCAL_NETWORK_HPP
#define XORNET_LOCAL_NETWORK_HPP

#include <memory>
#include <string>
#include <vector>
#include "network/local_transport.hpp"
#include "node/node.hpp"

namespace xornet {
namespace node {

// A set of nodes wired together through one LocalTransport, each bootstrapped with
// every other node. Node ids are derived from their position, so runs are repeatable.
class LocalNetwork {
public:
  // With a non-empty store_root every node keeps replicas under store_root/node-<i>
  LocalNetwork(size_t node_count, const NodeConfig& config, const std::string& store_root = "");
  ~LocalNetwork();
  LocalNetwork(const LocalNetwork&) = delete;
  LocalNetwork& operator=(const LocalNetwork&) = delete;

  Node& node(size_t index);
  size_t size() const { return nodes_.size(); }

  // Nodes that currently hold a replica of the address
  std::vector<Node*> holders(const ContentAddress& address);

  network::LocalTransport& transport() { return transport_; }
  network::LocalPaymentGate& payment() { return payment_; }

  static NodeId node_id_for(size_t index);

private:
  network::LocalTransport transport_;
  network::LocalPaymentGate payment_;
  std::vector<std::unique_ptr<Node>> nodes_;
};

} // namespace node
} // namespace xornet

#endif // XORNET_LOCAL_NETWORK_HPP

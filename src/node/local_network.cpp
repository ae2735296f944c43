#include "node/local_network.hpp"
#include <filesystem>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace xornet {
namespace node {

LocalNetwork::LocalNetwork(size_t node_count, const NodeConfig& config, const std::string& store_root) {
  if (node_count == 0) {
    throw std::invalid_argument("Local network: at least one node is required");
  }

  nodes_.reserve(node_count);
  for (size_t i = 0; i < node_count; ++i) {
    NodeConfig node_config = config;
    if (!store_root.empty()) {
      node_config.store_path = (std::filesystem::path(store_root) / ("node-" + std::to_string(i))).string();
    }
    auto node = std::make_unique<Node>(node_id_for(i), "local:" + std::to_string(i), node_config,
                                       transport_, &payment_);
    transport_.register_handler(node->id(), *node);
    nodes_.push_back(std::move(node));
  }

  std::vector<dht::PeerInfo> contacts;
  for (const auto& node : nodes_) {
    contacts.push_back(node->info());
  }
  for (auto& node : nodes_) {
    node->bootstrap(contacts);
  }

  BOOST_LOG_TRIVIAL(info) << "Local network: Started " << node_count << " nodes";
}

LocalNetwork::~LocalNetwork() {
  for (const auto& node : nodes_) {
    transport_.unregister_handler(node->id());
  }
}

Node& LocalNetwork::node(size_t index) {
  if (index >= nodes_.size()) {
    throw std::out_of_range("Local network: no node " + std::to_string(index));
  }
  return *nodes_[index];
}

std::vector<Node*> LocalNetwork::holders(const ContentAddress& address) {
  std::vector<Node*> result;
  for (auto& node : nodes_) {
    if (node->replica_store().has(address)) {
      result.push_back(node.get());
    }
  }
  return result;
}

NodeId LocalNetwork::node_id_for(size_t index) {
  std::string seed = "xornet-local-node-" + std::to_string(index);
  return ContentAddress::of(reinterpret_cast<const uint8_t*>(seed.data()), seed.size());
}

} // namespace node
} // namespace xornet

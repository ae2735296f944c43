#ifndef XORNET_NODE_HPP
#define XORNET_NODE_HPP

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "crypto/content_address.hpp"
#include "dht/routing_table.hpp"
#include "encrypt/chunker.hpp"
#include "encrypt/data_map.hpp"
#include "encrypt/data_map_packer.hpp"
#include "encrypt/self_encryptor.hpp"
#include "network/peer_health.hpp"
#include "network/peer_selector.hpp"
#include "network/transport.hpp"
#include "store/chunk_store.hpp"

namespace xornet {
namespace node {

using crypto::Bytes;
using crypto::ContentAddress;
using crypto::NodeId;

// Raised when a chunk of an upload could not be placed on any peer
class UploadError : public std::runtime_error {
public:
  explicit UploadError(const std::string& message) : std::runtime_error("Upload error: " + message) {}
};

struct NodeConfig {
  encrypt::ChunkerConfig chunker;
  dht::RoutingConfig routing;
  network::PeerHealthConfig health;
  size_t replication = network::PeerSelector::DEFAULT_REPLICATION;
  size_t worker_count = 0;                         // encryption threads, 0 = hardware
  std::chrono::milliseconds request_timeout{5000};
  std::string store_path;                          // replica directory, empty keeps replicas in memory

  // Throws std::invalid_argument
  void validate() const;
};

struct UploadResult {
  encrypt::DataMap data_map;     // root map, fits in one chunk
  size_t chunks = 0;             // chunks pushed, including nested map chunks
  size_t stored = 0;             // replicas accepted by peers
  size_t depth = 0;              // Indirect levels above the Final map
  bool degraded = false;         // some chunk got fewer than `replication` replicas
};

// One storage participant: serves replicas to peers and uploads/downloads payloads
// through the peers its routing table knows.
class Node : public network::ChunkHandler {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // `payment` may be null, in which case stores are not gated
  Node(const NodeId& id, const std::string& endpoint, NodeConfig config,
       network::Transport& transport, network::PaymentGate* payment = nullptr);
  ~Node() override;
  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;


  // ---- CLIENT OPERATIONS ----
  // Throws UploadError, network::PaymentError, or the chunker's errors
  UploadResult upload(const Bytes& payload);
  // Uploads, then stores the root map as a chunk of its own; returns that chunk's address
  ContentAddress upload_public(const Bytes& payload);
  // Throws encrypt::ReconstructionError when any chunk cannot be recovered
  Bytes download(const encrypt::DataMap& data_map);
  Bytes download(const ContentAddress& data_map_address);


  // ---- PEER OPERATIONS ----
  void handle_store(const ContentAddress& address, const Bytes& bytes) override;
  Bytes handle_fetch(const ContentAddress& address) const override;


  // ---- ROUTING ----
  // Observes every contact, probing full buckets over the transport. Returns how many
  // contacts ended up in the routing table.
  size_t bootstrap(const std::vector<dht::PeerInfo>& contacts);
  dht::ObserveResult observe(const NodeId& id, const std::string& endpoint);
  std::vector<dht::BucketSnapshot> routing_snapshot() const { return routing_table_.routing_snapshot(); }


  // ---- GETTERS ----
  const NodeId& id() const { return id_; }
  const std::string& endpoint() const { return endpoint_; }
  dht::PeerInfo info() const;
  const NodeConfig& config() const { return config_; }
  store::ChunkStore& replica_store() { return *replica_store_; }
  dht::RoutingTable& routing_table() { return routing_table_; }
  network::PeerHealth& peer_health() { return peer_health_; }

private:
  NodeId id_;
  std::string endpoint_;
  NodeConfig config_;

  network::Transport& transport_;
  network::PaymentGate* payment_;

  dht::RoutingTable routing_table_;
  network::PeerHealth peer_health_;
  network::PeerSelector selector_;
  std::unique_ptr<store::ChunkStore> replica_store_;

  encrypt::SelfEncryptor encryptor_;
  encrypt::DataMapPacker packer_;

  // Pushes one chunk to its selected peers; returns accepted replicas
  size_t replicate(const ContentAddress& address, const Bytes& bytes, bool& degraded);
  // Fetches and verifies one chunk, failing over across candidates
  Bytes fetch_chunk(const ContentAddress& address);
  void note_transport_failure(const dht::PeerInfo& peer, network::NetworkError error);
  bool probe(const dht::PeerInfo& peer);
};

} // namespace node
} // namespace xornet

#endif // XORNET_NODE_HPP

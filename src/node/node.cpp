#include "node/node.hpp"
#include "encrypt/encrypt_error.hpp"
#include "store/disk_chunk_store.hpp"
#include "store/memory_chunk_store.hpp"
#include <string>
#include <utility>
#include <boost/log/trivial.hpp>

namespace xornet {
namespace node {

namespace {

NodeConfig validated(NodeConfig config) {
  config.validate();
  return config;
}

} // namespace

void NodeConfig::validate() const {
  chunker.validate();
  if (replication == 0) {
    throw std::invalid_argument("Node: replication factor must be at least 1");
  }
  if (routing.k == 0) {
    throw std::invalid_argument("Node: bucket capacity must be at least 1");
  }
  if (request_timeout.count() <= 0) {
    throw std::invalid_argument("Node: request timeout must be positive");
  }
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Node::Node(const NodeId& id, const std::string& endpoint, NodeConfig config,
           network::Transport& transport, network::PaymentGate* payment)
  : id_(id)
  , endpoint_(endpoint)
  , config_(validated(std::move(config)))
  , transport_(transport)
  , payment_(payment)
  , routing_table_(id_, config_.routing)
  , peer_health_(config_.health)
  , selector_(routing_table_, peer_health_, config_.replication)
  , encryptor_(config_.chunker, config_.worker_count)
  , packer_(encryptor_) {

  if (config_.store_path.empty()) {
    replica_store_ = std::make_unique<store::MemoryChunkStore>();
  } else {
    replica_store_ = std::make_unique<store::DiskChunkStore>(config_.store_path);
  }

  BOOST_LOG_TRIVIAL(info) << "Node " << id_.short_hex() << ": Started at " << endpoint_
                          << " with replication " << config_.replication;
}

Node::~Node() {
  BOOST_LOG_TRIVIAL(debug) << "Node " << id_.short_hex() << ": Shutting down";
}

dht::PeerInfo Node::info() const {
  dht::PeerInfo peer;
  peer.id = id_;
  peer.endpoint = endpoint_;
  return peer;
}


//==============================================
// CLIENT OPERATIONS
//==============================================

UploadResult Node::upload(const Bytes& payload) {
  BOOST_LOG_TRIVIAL(info) << "Node " << id_.short_hex() << ": Uploading " << payload.size() << " bytes";

  encrypt::PackedData packed = packer_.pack(payload);

  // Chunks wait here until every one has been pushed
  store::MemoryChunkStore provisional;
  std::vector<ContentAddress> addresses;
  addresses.reserve(packed.chunks.size());
  for (const auto& chunk : packed.chunks) {
    provisional.put(chunk.address, chunk.content);
    addresses.push_back(chunk.address);
  }

  if (payment_) {
    network::PaymentProof proof = payment_->pay(addresses);
    BOOST_LOG_TRIVIAL(debug) << "Node " << id_.short_hex() << ": Payment accepted, receipt " << proof.receipt;
  }

  UploadResult result;
  result.depth = packed.depth;
  for (const auto& address : addresses) {
    size_t replicas = replicate(address, provisional.get(address), result.degraded);
    if (replicas == 0) {
      BOOST_LOG_TRIVIAL(error) << "Node " << id_.short_hex() << ": No peer accepted chunk " << address;
      throw UploadError("no peer accepted chunk " + address.to_hex());
    }
    result.stored += replicas;
    ++result.chunks;
  }

  result.data_map = std::move(packed.root);
  BOOST_LOG_TRIVIAL(info) << "Node " << id_.short_hex() << ": Uploaded " << result.chunks << " chunks as "
                          << result.stored << " replicas" << (result.degraded ? " (degraded)" : "");
  return result;
}

ContentAddress Node::upload_public(const Bytes& payload) {
  UploadResult result = upload(payload);

  Bytes map_bytes = result.data_map.serialize();
  ContentAddress address = ContentAddress::of(map_bytes);
  if (payment_) {
    payment_->pay({address});
  }

  bool degraded = false;
  if (replicate(address, map_bytes, degraded) == 0) {
    throw UploadError("no peer accepted data map chunk " + address.to_hex());
  }

  BOOST_LOG_TRIVIAL(info) << "Node " << id_.short_hex() << ": Published data map at " << address;
  return address;
}

Bytes Node::download(const encrypt::DataMap& data_map) {
  BOOST_LOG_TRIVIAL(info) << "Node " << id_.short_hex() << ": Downloading " << data_map.total_size()
                          << " bytes in " << data_map.chunks.size() << " chunks";

  return packer_.unpack(data_map, [this](const encrypt::ChunkInfo& info) {
    return fetch_chunk(info.address);
  });
}

Bytes Node::download(const ContentAddress& data_map_address) {
  Bytes map_bytes = fetch_chunk(data_map_address);

  encrypt::DataMap data_map;
  try {
    data_map = encrypt::DataMap::deserialize(map_bytes);
  } catch (const encrypt::DataMapError& e) {
    BOOST_LOG_TRIVIAL(error) << "Node " << id_.short_hex() << ": Chunk " << data_map_address
                             << " is not a data map: " << e.what();
    throw encrypt::ReconstructionError(std::string("chunk is not a data map: ") + e.what());
  }
  return download(data_map);
}


//==============================================
// PEER OPERATIONS
//==============================================

void Node::handle_store(const ContentAddress& address, const Bytes& bytes) {
  store::verify_content(address, bytes);
  replica_store_->put(address, bytes);
}

Bytes Node::handle_fetch(const ContentAddress& address) const {
  return replica_store_->get(address);
}


//==============================================
// ROUTING
//==============================================

size_t Node::bootstrap(const std::vector<dht::PeerInfo>& contacts) {
  size_t admitted = 0;
  for (const auto& contact : contacts) {
    if (contact.id == id_) {
      continue;
    }
    observe(contact.id, contact.endpoint);
    if (routing_table_.contains(contact.id)) {
      ++admitted;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Node " << id_.short_hex() << ": Bootstrapped with " << admitted << " of "
                          << contacts.size() << " contacts, table holds " << routing_table_.size();
  return admitted;
}

dht::ObserveResult Node::observe(const NodeId& id, const std::string& endpoint) {
  return routing_table_.observe(id, endpoint, [this](const dht::PeerInfo& peer) { return probe(peer); });
}

bool Node::probe(const dht::PeerInfo& peer) {
  return transport_.ping(peer, config_.request_timeout);
}


//==============================================
// HELPERS
//==============================================

size_t Node::replicate(const ContentAddress& address, const Bytes& bytes, bool& degraded) {
  network::StoreSelection selection = selector_.select_for_store(address);
  degraded = degraded || selection.degraded;

  size_t accepted = 0;
  for (const auto& peer : selection.peers) {
    network::NetworkError error = transport_.send(peer, address, bytes, config_.request_timeout);
    if (error == network::NetworkError::SUCCESS) {
      peer_health_.record_success(peer.id);
      ++accepted;
      continue;
    }
    BOOST_LOG_TRIVIAL(warning) << "Node " << id_.short_hex() << ": Store of " << address.short_hex()
                               << " on " << peer.id.short_hex() << " failed: " << network::to_string(error);
    note_transport_failure(peer, error);
  }

  if (accepted < config_.replication) {
    degraded = true;
  }
  return accepted;
}

Bytes Node::fetch_chunk(const ContentAddress& address) {
  if (replica_store_->has(address)) {
    Bytes local = replica_store_->get(address);
    try {
      store::verify_content(address, local);
      return local;
    } catch (const store::ChunkMismatchError& e) {
      BOOST_LOG_TRIVIAL(error) << "Node " << id_.short_hex() << ": Local replica corrupted: " << e.what();
    }
  }

  std::vector<dht::PeerInfo> candidates = selector_.select_for_fetch(address);
  for (const auto& peer : candidates) {
    Bytes bytes;
    network::NetworkError error = transport_.request(peer, address, bytes, config_.request_timeout);

    if (error == network::NetworkError::NOT_FOUND) {
      BOOST_LOG_TRIVIAL(debug) << "Node " << id_.short_hex() << ": " << peer.id.short_hex()
                               << " does not hold " << address.short_hex();
      continue;
    }
    if (error != network::NetworkError::SUCCESS) {
      BOOST_LOG_TRIVIAL(warning) << "Node " << id_.short_hex() << ": Fetch of " << address.short_hex()
                                 << " from " << peer.id.short_hex() << " failed: " << network::to_string(error);
      note_transport_failure(peer, error);
      continue;
    }

    try {
      store::verify_content(address, bytes);
    } catch (const store::ChunkMismatchError& e) {
      // Never retried against this peer within the download
      BOOST_LOG_TRIVIAL(warning) << "Node " << id_.short_hex() << ": Peer " << peer.id.short_hex()
                                 << " served bad content: " << e.what();
      peer_health_.record_failure(peer.id);
      continue;
    }

    peer_health_.record_success(peer.id);
    return bytes;
  }

  BOOST_LOG_TRIVIAL(error) << "Node " << id_.short_hex() << ": Chunk " << address << " unavailable from "
                           << candidates.size() << " candidates";
  throw encrypt::ReconstructionError("chunk " + address.to_hex() + " unavailable from " +
                                     std::to_string(candidates.size()) + " candidates");
}

void Node::note_transport_failure(const dht::PeerInfo& peer, network::NetworkError error) {
  if (error == network::NetworkError::REJECTED) {
    return;
  }
  if (peer_health_.record_failure(peer.id) &&
      (error == network::NetworkError::CONNECTION_FAILED || error == network::NetworkError::TIMEOUT)) {
    routing_table_.mark_unresponsive(peer.id);
  }
}

} // namespace node
} // namespace xornet

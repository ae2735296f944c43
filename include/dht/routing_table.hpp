#ifndef XORNET_ROUTING_TABLE_HPP
#define XORNET_ROUTING_TABLE_HPP

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "crypto/content_address.hpp"

namespace xornet {
namespace dht {

using crypto::ContentAddress;
using crypto::NodeId;

struct PeerInfo {
  NodeId id;
  std::string endpoint;                              // network location, e.g. "10.0.0.7:4100"
  std::chrono::steady_clock::time_point last_seen{};
  uint64_t first_seen_seq = 0;                       // observation order, breaks distance ties
};

enum class ObserveResult {
  Inserted,    // new peer placed in a bucket with room
  Refreshed,   // known peer moved to most-recently-seen
  Replaced,    // unresponsive least-recently-seen peer evicted for the newcomer
  Dropped,     // bucket full of responsive peers, newcomer discarded
  Ignored      // local id or permanently removed peer
};

const char* to_string(ObserveResult result);

// Returns true if the peer answered a liveness check. Called without any table lock held.
using LivenessProbe = std::function<bool(const PeerInfo& peer)>;

struct RoutingConfig {
  size_t k = 20;                   // bucket capacity
  size_t max_probe_rounds = 3;     // retries when a bucket changes during a probe
};

struct BucketSnapshot {
  size_t index = 0;                // floor(log2(distance to the local id))
  std::vector<PeerInfo> peers;     // least recently seen first
};

// Kademlia-style k-bucket table owned by one local node identity.
class RoutingTable {
public:
  // ---- CONSTRUCTOR ----
  explicit RoutingTable(const NodeId& local_id, RoutingConfig config = {});
  RoutingTable(const RoutingTable&) = delete;
  RoutingTable& operator=(const RoutingTable&) = delete;


  // ---- MUTATIONS ----
  // Inserts or refreshes a peer. When its bucket is full the least-recently-seen entry
  // is probed; it is evicted only if the probe fails. Without a probe the existing
  // entry is assumed alive.
  ObserveResult observe(const NodeId& id, const std::string& endpoint,
                        const LivenessProbe& probe = LivenessProbe());
  // Evicts a peer after sustained unresponsiveness; it may be observed again later
  bool mark_unresponsive(const NodeId& id);
  // Evicts a peer and refuses it from now on
  bool remove(const NodeId& id);


  // ---- QUERIES ----
  // Up to `count` peers in non-decreasing XOR distance to `target`
  std::vector<PeerInfo> closest(const ContentAddress& target, size_t count) const;
  std::optional<PeerInfo> find(const NodeId& id) const;
  bool contains(const NodeId& id) const { return find(id).has_value(); }
  bool is_blocked(const NodeId& id) const;
  std::vector<BucketSnapshot> routing_snapshot() const;
  size_t size() const;
  size_t bucket_size(size_t index) const;

  const NodeId& local_id() const { return local_id_; }
  const RoutingConfig& config() const { return config_; }

private:
  // Front holds the least recently seen peer
  struct Bucket {
    std::deque<PeerInfo> entries;
    mutable std::mutex mutex;
  };

  NodeId local_id_;
  RoutingConfig config_;
  std::array<Bucket, ContentAddress::BITS> buckets_;
  std::atomic<uint64_t> sequence_{0};

  std::set<NodeId> blocked_;
  mutable std::mutex blocked_mutex_;

  std::optional<size_t> bucket_for(const NodeId& id) const;
  std::vector<PeerInfo> bucket_copy(size_t index) const;
  bool erase_from_bucket(const NodeId& id);
  // Order of bucket groups to visit for a target, nearest group first
  std::vector<std::vector<size_t>> scan_order(const ContentAddress& target) const;
  static std::deque<PeerInfo>::iterator locate(std::deque<PeerInfo>& entries, const NodeId& id);
};

} // namespace dht
} // namespace xornet

#endif // XORNET_ROUTING_TABLE_HPP

#include "dht/routing_table.hpp"
#include <algorithm>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace xornet {
namespace dht {

const char* to_string(ObserveResult result) {
  switch (result) {
    case ObserveResult::Inserted: return "inserted";
    case ObserveResult::Refreshed: return "refreshed";
    case ObserveResult::Replaced: return "replaced";
    case ObserveResult::Dropped: return "dropped";
    case ObserveResult::Ignored: return "ignored";
    default: return "unknown";
  }
}


//==============================================
// CONSTRUCTOR
//==============================================

RoutingTable::RoutingTable(const NodeId& local_id, RoutingConfig config)
  : local_id_(local_id)
  , config_(config) {

  if (config_.k == 0) {
    BOOST_LOG_TRIVIAL(error) << "Routing table: Bucket capacity must be positive";
    throw std::invalid_argument("Routing table: k must be at least 1");
  }
  if (config_.max_probe_rounds == 0) {
    config_.max_probe_rounds = 1;
  }

  BOOST_LOG_TRIVIAL(info) << "Routing table: Initialized for " << local_id_.short_hex()
                          << " with k=" << config_.k;
}


//==============================================
// MUTATIONS
//==============================================

ObserveResult RoutingTable::observe(const NodeId& id, const std::string& endpoint, const LivenessProbe& probe) {
  std::optional<size_t> index = bucket_for(id);
  if (!index) {
    return ObserveResult::Ignored;
  }

  Bucket& bucket = buckets_[*index];

  // remove() blocks under the bucket lock, so every check below is made under it too
  for (size_t round = 0; round < config_.max_probe_rounds; ++round) {
    PeerInfo candidate;
    {
      std::lock_guard<std::mutex> lock(bucket.mutex);
      if (is_blocked(id)) {
        BOOST_LOG_TRIVIAL(debug) << "Routing table: Ignoring removed peer " << id.short_hex();
        return ObserveResult::Ignored;
      }

      auto existing = locate(bucket.entries, id);
      if (existing != bucket.entries.end()) {
        PeerInfo refreshed = *existing;
        refreshed.endpoint = endpoint;
        refreshed.last_seen = std::chrono::steady_clock::now();
        bucket.entries.erase(existing);
        bucket.entries.push_back(refreshed);
        return ObserveResult::Refreshed;
      }

      if (bucket.entries.size() < config_.k) {
        bucket.entries.push_back(PeerInfo{id, endpoint, std::chrono::steady_clock::now(), sequence_++});
        BOOST_LOG_TRIVIAL(debug) << "Routing table: Inserted " << id.short_hex() << " into bucket " << *index;
        return ObserveResult::Inserted;
      }

      candidate = bucket.entries.front();
    }

    // Probe without holding the bucket lock; the bucket may change meanwhile
    bool alive = probe ? probe(candidate) : true;

    std::lock_guard<std::mutex> lock(bucket.mutex);
    if (is_blocked(id)) {
      BOOST_LOG_TRIVIAL(debug) << "Routing table: Peer " << id.short_hex() << " removed during probe, ignoring";
      return ObserveResult::Ignored;
    }

    auto existing = locate(bucket.entries, id);
    if (existing != bucket.entries.end()) {
      existing->endpoint = endpoint;
      existing->last_seen = std::chrono::steady_clock::now();
      PeerInfo refreshed = *existing;
      bucket.entries.erase(existing);
      bucket.entries.push_back(refreshed);
      return ObserveResult::Refreshed;
    }

    auto probed = locate(bucket.entries, candidate.id);
    if (probed == bucket.entries.end()) {
      if (bucket.entries.size() < config_.k) {
        bucket.entries.push_back(PeerInfo{id, endpoint, std::chrono::steady_clock::now(), sequence_++});
        return ObserveResult::Inserted;
      }
      continue;
    }

    if (alive) {
      PeerInfo refreshed = *probed;
      refreshed.last_seen = std::chrono::steady_clock::now();
      bucket.entries.erase(probed);
      bucket.entries.push_back(refreshed);
      BOOST_LOG_TRIVIAL(debug) << "Routing table: Bucket " << *index << " full, dropped " << id.short_hex();
      return ObserveResult::Dropped;
    }

    bucket.entries.erase(probed);
    bucket.entries.push_back(PeerInfo{id, endpoint, std::chrono::steady_clock::now(), sequence_++});
    BOOST_LOG_TRIVIAL(info) << "Routing table: Replaced unresponsive " << candidate.id.short_hex()
                            << " with " << id.short_hex() << " in bucket " << *index;
    return ObserveResult::Replaced;
  }

  BOOST_LOG_TRIVIAL(debug) << "Routing table: Bucket " << *index << " kept changing, dropped " << id.short_hex();
  return ObserveResult::Dropped;
}

bool RoutingTable::mark_unresponsive(const NodeId& id) {
  bool erased = erase_from_bucket(id);
  if (erased) {
    BOOST_LOG_TRIVIAL(info) << "Routing table: Evicted unresponsive peer " << id.short_hex();
  }
  return erased;
}

bool RoutingTable::remove(const NodeId& id) {
  if (id == local_id_) {
    return false;
  }
  std::optional<size_t> index = bucket_for(id);
  Bucket& bucket = buckets_[*index];

  bool erased = false;
  {
    std::lock_guard<std::mutex> lock(bucket.mutex);
    {
      std::lock_guard<std::mutex> blocked_lock(blocked_mutex_);
      blocked_.insert(id);
    }
    auto it = locate(bucket.entries, id);
    if (it != bucket.entries.end()) {
      bucket.entries.erase(it);
      erased = true;
    }
  }
  BOOST_LOG_TRIVIAL(info) << "Routing table: Removed peer " << id.short_hex() << " permanently";
  return erased;
}


//==============================================
// QUERIES
//==============================================

std::vector<PeerInfo> RoutingTable::closest(const ContentAddress& target, size_t count) const {
  std::vector<PeerInfo> result;
  if (count == 0) {
    return result;
  }

  auto nearer = [&target](const PeerInfo& lhs, const PeerInfo& rhs) {
    ContentAddress lhs_distance = ContentAddress::distance(lhs.id, target);
    ContentAddress rhs_distance = ContentAddress::distance(rhs.id, target);
    if (lhs_distance != rhs_distance) {
      return lhs_distance < rhs_distance;
    }
    return lhs.first_seen_seq < rhs.first_seen_seq;
  };

  for (const auto& group : scan_order(target)) {
    std::vector<PeerInfo> candidates;
    for (size_t index : group) {
      std::vector<PeerInfo> peers = bucket_copy(index);
      candidates.insert(candidates.end(), peers.begin(), peers.end());
    }
    std::sort(candidates.begin(), candidates.end(), nearer);
    result.insert(result.end(), candidates.begin(), candidates.end());
    if (result.size() >= count) {
      break;
    }
  }

  if (result.size() > count) {
    result.resize(count);
  }
  return result;
}

std::optional<PeerInfo> RoutingTable::find(const NodeId& id) const {
  std::optional<size_t> index = bucket_for(id);
  if (!index) {
    return std::nullopt;
  }
  const Bucket& bucket = buckets_[*index];
  std::lock_guard<std::mutex> lock(bucket.mutex);
  for (const auto& peer : bucket.entries) {
    if (peer.id == id) {
      return peer;
    }
  }
  return std::nullopt;
}

bool RoutingTable::is_blocked(const NodeId& id) const {
  std::lock_guard<std::mutex> lock(blocked_mutex_);
  return blocked_.count(id) > 0;
}

std::vector<BucketSnapshot> RoutingTable::routing_snapshot() const {
  std::vector<BucketSnapshot> snapshot;
  for (size_t index = 0; index < buckets_.size(); ++index) {
    std::vector<PeerInfo> peers = bucket_copy(index);
    if (!peers.empty()) {
      snapshot.push_back(BucketSnapshot{index, std::move(peers)});
    }
  }
  return snapshot;
}

size_t RoutingTable::size() const {
  size_t total = 0;
  for (const auto& bucket : buckets_) {
    std::lock_guard<std::mutex> lock(bucket.mutex);
    total += bucket.entries.size();
  }
  return total;
}

size_t RoutingTable::bucket_size(size_t index) const {
  if (index >= buckets_.size()) {
    throw std::out_of_range("Routing table: bucket index out of range");
  }
  std::lock_guard<std::mutex> lock(buckets_[index].mutex);
  return buckets_[index].entries.size();
}


//==============================================
// HELPERS
//==============================================

std::optional<size_t> RoutingTable::bucket_for(const NodeId& id) const {
  return ContentAddress::bucket_index(local_id_, id);
}

std::vector<PeerInfo> RoutingTable::bucket_copy(size_t index) const {
  const Bucket& bucket = buckets_[index];
  std::lock_guard<std::mutex> lock(bucket.mutex);
  return std::vector<PeerInfo>(bucket.entries.begin(), bucket.entries.end());
}

bool RoutingTable::erase_from_bucket(const NodeId& id) {
  std::optional<size_t> index = bucket_for(id);
  if (!index) {
    return false;
  }
  Bucket& bucket = buckets_[*index];
  std::lock_guard<std::mutex> lock(bucket.mutex);
  auto it = locate(bucket.entries, id);
  if (it == bucket.entries.end()) {
    return false;
  }
  bucket.entries.erase(it);
  return true;
}

// Peers in bucket b share the target's highest differing bit with the local id, so they
// are nearest. Lower buckets all sit at the same top-bit distance and are merged, higher
// buckets grow farther one bit at a time.
std::vector<std::vector<size_t>> RoutingTable::scan_order(const ContentAddress& target) const {
  std::vector<std::vector<size_t>> groups;
  std::optional<size_t> start = ContentAddress::bucket_index(local_id_, target);

  if (!start) {
    for (size_t index = 0; index < ContentAddress::BITS; ++index) {
      groups.push_back({index});
    }
    return groups;
  }

  groups.push_back({*start});
  std::vector<size_t> lower;
  for (size_t index = *start; index > 0; --index) {
    lower.push_back(index - 1);
  }
  if (!lower.empty()) {
    groups.push_back(std::move(lower));
  }
  for (size_t index = *start + 1; index < ContentAddress::BITS; ++index) {
    groups.push_back({index});
  }
  return groups;
}

std::deque<PeerInfo>::iterator RoutingTable::locate(std::deque<PeerInfo>& entries, const NodeId& id) {
  return std::find_if(entries.begin(), entries.end(),
                      [&id](const PeerInfo& peer) { return peer.id == id; });
}

} // namespace dht
} // namespace xornet

#ifndef XORNET_PEER_HEALTH_HPP
#define XORNET_PEER_HEALTH_HPP

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include "crypto/content_address.hpp"

namespace xornet {
namespace network {

using crypto::NodeId;

struct PeerHealthConfig {
  size_t max_failed_attempts = 3;
  std::chrono::seconds ban_duration{300};
};

// Counts consecutive failures per peer. A peer that reaches max_failed_attempts is
// banned for ban_duration, after which it starts over with a clean record.
class PeerHealth {
public:
  using Clock = std::chrono::steady_clock;
  using TimeSource = std::function<Clock::time_point()>;

  explicit PeerHealth(PeerHealthConfig config = {}, TimeSource now = &Clock::now);
  PeerHealth(const PeerHealth&) = delete;
  PeerHealth& operator=(const PeerHealth&) = delete;

  void record_success(const NodeId& id);
  // Returns true if this failure started a ban
  bool record_failure(const NodeId& id);

  bool is_healthy(const NodeId& id) const;
  size_t failure_count(const NodeId& id) const;

  const PeerHealthConfig& config() const { return config_; }

private:
  struct Record {
    size_t failures = 0;
    Clock::time_point banned_until{};
  };

  PeerHealthConfig config_;
  TimeSource now_;
  std::map<NodeId, Record> records_;
  mutable std::mutex mutex_;
};

} // namespace network
} // namespace xornet

#endif // XORNET_PEER_HEALTH_HPP

#include "network/peer_health.hpp"
#include <stdexcept>
#include <utility>
#include <boost/log/trivial.hpp>

namespace xornet {
namespace network {

PeerHealth::PeerHealth(PeerHealthConfig config, TimeSource now)
  : config_(config)
  , now_(std::move(now)) {
  if (config_.max_failed_attempts == 0) {
    throw std::invalid_argument("Peer health: max_failed_attempts must be at least 1");
  }
  if (!now_) {
    throw std::invalid_argument("Peer health: time source must be set");
  }
}

void PeerHealth::record_success(const NodeId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it != records_.end()) {
    it->second.failures = 0;
  }
}

bool PeerHealth::record_failure(const NodeId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Record& record = records_[id];
  Clock::time_point now = now_();

  if (record.banned_until > now) {
    return false;
  }

  ++record.failures;
  if (record.failures < config_.max_failed_attempts) {
    BOOST_LOG_TRIVIAL(debug) << "Peer health: Peer " << id.short_hex() << " failed "
                             << record.failures << " time(s)";
    return false;
  }

  record.failures = 0;
  record.banned_until = now + config_.ban_duration;
  BOOST_LOG_TRIVIAL(warning) << "Peer health: Peer " << id.short_hex() << " banned for "
                             << config_.ban_duration.count() << "s after "
                             << config_.max_failed_attempts << " failed attempts";
  return true;
}

bool PeerHealth::is_healthy(const NodeId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return true;
  }
  return it->second.banned_until <= now_();
}

size_t PeerHealth::failure_count(const NodeId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  return it == records_.end() ? 0 : it->second.failures;
}

} // namespace network
} // namespace xornet

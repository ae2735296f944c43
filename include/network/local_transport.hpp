#ifndef XORNET_LOCAL_TRANSPORT_HPP
#define XORNET_LOCAL_TRANSPORT_HPP

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include "network/transport.hpp"

namespace xornet {
namespace network {

// In-process Transport that delivers directly to registered handlers. Timeouts are
// not simulated; offline peers fail with CONNECTION_FAILED.
class LocalTransport : public Transport {
public:
  LocalTransport() = default;
  LocalTransport(const LocalTransport&) = delete;
  LocalTransport& operator=(const LocalTransport&) = delete;

  // ---- REGISTRATION ----
  void register_handler(const NodeId& id, ChunkHandler& handler);
  void unregister_handler(const NodeId& id);
  void set_online(const NodeId& id, bool online);
  bool is_online(const NodeId& id) const;


  // ---- TRANSPORT ----
  NetworkError send(const PeerInfo& peer, const ContentAddress& address,
                    const Bytes& bytes, std::chrono::milliseconds timeout) override;
  NetworkError request(const PeerInfo& peer, const ContentAddress& address,
                       Bytes& out, std::chrono::milliseconds timeout) override;
  bool ping(const PeerInfo& peer, std::chrono::milliseconds timeout) override;


  size_t sends() const { return sends_; }
  size_t requests() const { return requests_; }

private:
  std::map<NodeId, ChunkHandler*> handlers_;
  std::set<NodeId> offline_;
  mutable std::mutex mutex_;

  std::atomic<size_t> sends_{0};
  std::atomic<size_t> requests_{0};

  // Null when the peer is unknown or offline; `error` says which
  ChunkHandler* reach(const NodeId& id, NetworkError& error) const;
};

// Grants every payment with a sequential receipt unless switched to refuse
class LocalPaymentGate : public PaymentGate {
public:
  PaymentProof pay(const std::vector<ContentAddress>& addresses) override;

  void set_refusing(bool refusing) { refusing_ = refusing; }
  size_t paid_chunks() const { return paid_chunks_; }

private:
  std::atomic<bool> refusing_{false};
  std::atomic<size_t> paid_chunks_{0};
  std::atomic<uint64_t> receipts_{0};
};

} // namespace network
} // namespace xornet

#endif // XORNET_LOCAL_TRANSPORT_HPP

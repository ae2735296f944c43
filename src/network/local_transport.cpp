#include "network/local_transport.hpp"
#include "store/chunk_store.hpp"
#include <string>
#include <boost/log/trivial.hpp>

namespace xornet {
namespace network {

//==============================================
// REGISTRATION
//==============================================

void LocalTransport::register_handler(const NodeId& id, ChunkHandler& handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_[id] = &handler;
  offline_.erase(id);
  BOOST_LOG_TRIVIAL(debug) << "Local transport: Registered node " << id.short_hex();
}

void LocalTransport::unregister_handler(const NodeId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_.erase(id);
  offline_.erase(id);
}

void LocalTransport::set_online(const NodeId& id, bool online) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (online) {
    offline_.erase(id);
  } else {
    offline_.insert(id);
  }
  BOOST_LOG_TRIVIAL(info) << "Local transport: Node " << id.short_hex() << (online ? " online" : " offline");
}

bool LocalTransport::is_online(const NodeId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.count(id) > 0 && offline_.count(id) == 0;
}

ChunkHandler* LocalTransport::reach(const NodeId& id, NetworkError& error) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = handlers_.find(id);
  if (it == handlers_.end()) {
    error = NetworkError::INVALID_PEER;
    return nullptr;
  }
  if (offline_.count(id) > 0) {
    error = NetworkError::CONNECTION_FAILED;
    return nullptr;
  }
  error = NetworkError::SUCCESS;
  return it->second;
}


//==============================================
// TRANSPORT
//==============================================

NetworkError LocalTransport::send(const PeerInfo& peer, const ContentAddress& address,
                                  const Bytes& bytes, std::chrono::milliseconds /*timeout*/) {
  ++sends_;
  NetworkError error;
  ChunkHandler* handler = reach(peer.id, error);
  if (!handler) {
    BOOST_LOG_TRIVIAL(debug) << "Local transport: Send of " << address.short_hex() << " to "
                             << peer.id.short_hex() << " failed: " << to_string(error);
    return error;
  }

  try {
    handler->handle_store(address, bytes);
    return NetworkError::SUCCESS;
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Local transport: Peer " << peer.id.short_hex() << " rejected "
                               << address.short_hex() << ": " << e.what();
    return NetworkError::REJECTED;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Local transport: Peer " << peer.id.short_hex() << " failed storing "
                             << address.short_hex() << ": " << e.what();
    return NetworkError::UNKNOWN_ERROR;
  }
}

NetworkError LocalTransport::request(const PeerInfo& peer, const ContentAddress& address,
                                     Bytes& out, std::chrono::milliseconds /*timeout*/) {
  ++requests_;
  NetworkError error;
  ChunkHandler* handler = reach(peer.id, error);
  if (!handler) {
    return error;
  }

  try {
    out = handler->handle_fetch(address);
    return NetworkError::SUCCESS;
  } catch (const store::ChunkNotFoundError&) {
    return NetworkError::NOT_FOUND;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Local transport: Peer " << peer.id.short_hex() << " failed serving "
                             << address.short_hex() << ": " << e.what();
    return NetworkError::UNKNOWN_ERROR;
  }
}

bool LocalTransport::ping(const PeerInfo& peer, std::chrono::milliseconds /*timeout*/) {
  return is_online(peer.id);
}


//==============================================
// PAYMENT
//==============================================

PaymentProof LocalPaymentGate::pay(const std::vector<ContentAddress>& addresses) {
  if (refusing_) {
    BOOST_LOG_TRIVIAL(warning) << "Payment gate: Refused payment for " << addresses.size() << " chunks";
    throw PaymentError("payment refused for " + std::to_string(addresses.size()) + " chunks");
  }

  paid_chunks_ += addresses.size();
  PaymentProof proof;
  proof.addresses = addresses;
  proof.receipt = "local-receipt-" + std::to_string(++receipts_);
  BOOST_LOG_TRIVIAL(debug) << "Payment gate: Issued " << proof.receipt << " for " << addresses.size() << " chunks";
  return proof;
}

} // namespace network
} // namespace xornet

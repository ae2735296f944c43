#include <gtest/gtest.h>
#include <string>
#include "dht/routing_table.hpp"
#include "network/peer_health.hpp"
#include "network/peer_selector.hpp"
#include "test_utils.hpp"

using namespace xornet::network;
using xornet::crypto::ContentAddress;
using xornet::crypto::NodeId;
using xornet::dht::RoutingTable;

namespace {

NodeId peer_id(size_t n) {
  return ContentAddress::of(xornet::test::to_bytes("selector-peer-" + std::to_string(n)));
}

} // namespace

class PeerHealthTest : public ::testing::Test {
protected:
  PeerHealth::Clock::time_point now = PeerHealth::Clock::time_point{} + std::chrono::hours(1);
  PeerHealth health{PeerHealthConfig{}, [this]() { return now; }};

  void SetUp() override {
    xornet::test::quiet_logging();
  }
};

TEST_F(PeerHealthTest, UnknownPeersAreHealthy) {
  EXPECT_TRUE(health.is_healthy(peer_id(1)));
  EXPECT_EQ(health.failure_count(peer_id(1)), 0u);
}

TEST_F(PeerHealthTest, ThirdFailureBansForFiveMinutes) {
  NodeId peer = peer_id(1);
  EXPECT_FALSE(health.record_failure(peer));
  EXPECT_FALSE(health.record_failure(peer));
  EXPECT_TRUE(health.is_healthy(peer));
  EXPECT_TRUE(health.record_failure(peer));
  EXPECT_FALSE(health.is_healthy(peer));

  now += std::chrono::minutes(4);
  EXPECT_FALSE(health.is_healthy(peer));
  now += std::chrono::minutes(1);
  EXPECT_TRUE(health.is_healthy(peer));
  EXPECT_EQ(health.failure_count(peer), 0u);
}

TEST_F(PeerHealthTest, SuccessResetsFailures) {
  NodeId peer = peer_id(2);
  health.record_failure(peer);
  health.record_failure(peer);
  health.record_success(peer);
  EXPECT_EQ(health.failure_count(peer), 0u);
  EXPECT_FALSE(health.record_failure(peer));
  EXPECT_TRUE(health.is_healthy(peer));
}


class PeerSelectorTest : public ::testing::Test {
protected:
  NodeId local = ContentAddress::of(xornet::test::to_bytes("selector-local"));
  RoutingTable table{local};
  PeerHealth health;

  void SetUp() override {
    xornet::test::quiet_logging();
  }

  void add_peers(size_t count) {
    for (size_t n = 0; n < count; ++n) {
      table.observe(peer_id(n), "peer-" + std::to_string(n));
    }
  }

  void ban(const NodeId& id) {
    for (size_t i = 0; i < health.config().max_failed_attempts; ++i) {
      health.record_failure(id);
    }
  }
};

TEST_F(PeerSelectorTest, SelectsReplicationClosestPeers) {
  add_peers(12);
  PeerSelector selector(table, health);
  ContentAddress address = ContentAddress::of(xornet::test::to_bytes("chunk"));

  StoreSelection selection = selector.select_for_store(address);
  EXPECT_FALSE(selection.degraded);
  ASSERT_EQ(selection.peers.size(), PeerSelector::DEFAULT_REPLICATION);

  auto closest = table.closest(address, PeerSelector::DEFAULT_REPLICATION);
  for (size_t i = 0; i < closest.size(); ++i) {
    EXPECT_EQ(selection.peers[i].id, closest[i].id);
  }
}

TEST_F(PeerSelectorTest, FewPeersGiveDegradedSelection) {
  add_peers(3);
  PeerSelector selector(table, health);

  StoreSelection selection = selector.select_for_store(ContentAddress());
  EXPECT_TRUE(selection.degraded);
  EXPECT_EQ(selection.peers.size(), 3u);
}

TEST_F(PeerSelectorTest, BannedPeersAreSkippedForStore) {
  add_peers(6);
  PeerSelector selector(table, health, 3);
  ContentAddress address = ContentAddress::of(xornet::test::to_bytes("chunk"));
  auto closest = table.closest(address, 6);

  ban(closest[0].id);
  StoreSelection selection = selector.select_for_store(address);
  ASSERT_EQ(selection.peers.size(), 3u);
  EXPECT_FALSE(selection.degraded);
  EXPECT_EQ(selection.peers[0].id, closest[1].id);
  EXPECT_EQ(selection.peers[2].id, closest[3].id);
}

TEST_F(PeerSelectorTest, FetchOrderPutsBannedPeersLast) {
  add_peers(6);
  PeerSelector selector(table, health, 3);
  ContentAddress address = ContentAddress::of(xornet::test::to_bytes("chunk"));
  auto closest = table.closest(address, 6);

  ban(closest[0].id);
  auto candidates = selector.select_for_fetch(address);
  ASSERT_EQ(candidates.size(), 6u);
  EXPECT_EQ(candidates[0].id, closest[1].id);
  EXPECT_EQ(candidates.back().id, closest[0].id);
}

TEST_F(PeerSelectorTest, ZeroReplicationIsRejected) {
  EXPECT_THROW(PeerSelector(table, health, 0), std::invalid_argument);
}

#include "../NodeServer.h"
#include "../Replicator.h"
#include <gtest/gtest.h>
#include <httplib.h>

#include <filesystem>
#include <future>
#include <memory>
#include <thread>

using namespace cl;

namespace {

Transaction makeCreation(const std::string &itemId) {
  Transaction tx;
  tx.kind = Transaction::Kind::CREATION;
  tx.itemId = itemId;
  tx.description = "desc";
  tx.actor = "A";
  tx.location = "Locker";
  tx.itemType = "Physical";
  tx.contentHash = "h";
  tx.timestamp = "2024-01-01T00:00:00";
  tx.node = "node-t";
  return tx;
}

Replicator::Candidate makeCandidate(const std::string &source, size_t length) {
  Replicator::Candidate candidate;
  candidate.source = source;
  candidate.blocks.push_back(Block::makeGenesis(source, 1.0));
  for (size_t i = 1; i < length; ++i) {
    candidate.blocks.push_back(
        Block::seal(i, 1.0 + i, {makeCreation(source + "-" + std::to_string(i))},
                    candidate.blocks.back().hash));
  }
  return candidate;
}

Ledger::CreationRequest creationRequest(const std::string &itemId) {
  Ledger::CreationRequest request;
  request.itemId = itemId;
  request.description = "Evidence " + itemId;
  request.actor = "A";
  request.location = "Locker 1";
  request.itemType = "Physical";
  return request;
}

} // namespace

// --- selectCandidate ---

TEST(ReplicatorSelectTest, LongestStrictlyLongerWins) {
  std::vector<Replicator::Candidate> candidates = {
      makeCandidate("p1", 4), makeCandidate("p2", 6), makeCandidate("p3", 5)};
  auto selected = Replicator::selectCandidate(
      3, candidates, Replicator::AdoptionPolicy::TRUST_LONGER);
  ASSERT_TRUE(selected.has_value());
  EXPECT_EQ(*selected, 1u);
}

TEST(ReplicatorSelectTest, EqualLengthKeepsLocal) {
  std::vector<Replicator::Candidate> candidates = {makeCandidate("p1", 3),
                                                   makeCandidate("p2", 2)};
  EXPECT_FALSE(Replicator::selectCandidate(
                   3, candidates, Replicator::AdoptionPolicy::TRUST_LONGER)
                   .has_value());
  EXPECT_FALSE(Replicator::selectCandidate(
                   3, {}, Replicator::AdoptionPolicy::TRUST_LONGER)
                   .has_value());
}

TEST(ReplicatorSelectTest, FirstSeenWinsATie) {
  std::vector<Replicator::Candidate> candidates = {makeCandidate("p1", 5),
                                                   makeCandidate("p2", 5)};
  auto selected = Replicator::selectCandidate(
      2, candidates, Replicator::AdoptionPolicy::TRUST_LONGER);
  ASSERT_TRUE(selected.has_value());
  EXPECT_EQ(*selected, 0u);
}

TEST(ReplicatorSelectTest, TrustAdoptsBrokenChain) {
  std::vector<Replicator::Candidate> candidates = {makeCandidate("p1", 5)};
  candidates[0].blocks[2].hash = "forged";
  auto selected = Replicator::selectCandidate(
      2, candidates, Replicator::AdoptionPolicy::TRUST_LONGER);
  ASSERT_TRUE(selected.has_value());
  EXPECT_EQ(*selected, 0u);
}

TEST(ReplicatorSelectTest, ValidateFallsBackToNextLongestValid) {
  std::vector<Replicator::Candidate> candidates = {
      makeCandidate("p1", 4), makeCandidate("p2", 6), makeCandidate("p3", 5)};
  candidates[1].blocks[3].payload = nlohmann::json::array();

  auto selected = Replicator::selectCandidate(
      3, candidates, Replicator::AdoptionPolicy::VALIDATE_FIRST);
  ASSERT_TRUE(selected.has_value());
  EXPECT_EQ(*selected, 2u);

  candidates[2].blocks[1].previousHash = "0";
  candidates[0].blocks[3].hash = "forged";
  EXPECT_FALSE(Replicator::selectCandidate(
                   3, candidates, Replicator::AdoptionPolicy::VALIDATE_FIRST)
                   .has_value());
}

TEST(ReplicatorSelectTest, PolicyNames) {
  Replicator::AdoptionPolicy policy;
  ASSERT_TRUE(Replicator::parsePolicy("validate", policy));
  EXPECT_EQ(policy, Replicator::AdoptionPolicy::VALIDATE_FIRST);
  ASSERT_TRUE(Replicator::parsePolicy("trust", policy));
  EXPECT_EQ(policy, Replicator::AdoptionPolicy::TRUST_LONGER);
  EXPECT_FALSE(Replicator::parsePolicy("longest", policy));
  EXPECT_STREQ(Replicator::policyName(Replicator::AdoptionPolicy::VALIDATE_FIRST),
               "validate");
}

TEST(ReplicatorSelectTest, SyncResultJson) {
  Replicator::SyncResult upToDate;
  upToDate.message = "Chain is up to date";
  auto j = upToDate.toJson();
  EXPECT_FALSE(j["synced"].get<bool>());
  EXPECT_FALSE(j.contains("new_length"));

  Replicator::SyncResult synced;
  synced.synced = true;
  synced.newLength = 5;
  synced.source = "http://127.0.0.1:5001";
  j = synced.toJson();
  EXPECT_EQ(j["new_length"], 5);
  EXPECT_EQ(j["source"], "http://127.0.0.1:5001");
}

// --- two nodes over loopback ---

class ReplicatorNodesTest : public ::testing::Test {
protected:
  void SetUp() override {
    testDir_ = std::filesystem::temp_directory_path() / "cl_replicator_test";
    std::error_code ec;
    std::filesystem::remove_all(testDir_, ec);
  }

  void TearDown() override {
    nodes_.clear();
    std::error_code ec;
    std::filesystem::remove_all(testDir_, ec);
  }

  NodeServer &startNode(const std::string &nodeId,
                        const std::string &policy = "trust",
                        uint64_t syncIntervalSec = 0) {
    NodeServer::Config config;
    config.nodeId = nodeId;
    config.host = "127.0.0.1";
    config.port = 0;
    config.syncIntervalSec = syncIntervalSec;
    config.peerTimeoutMs = 2000;
    config.adoptionPolicy = policy;
    config.workDir = (testDir_ / nodeId).string();

    auto node = std::make_unique<NodeServer>();
    node->setConfig(config);
    auto result = node->start();
    EXPECT_TRUE(result.isOk()) << result.error().message;
    nodes_.push_back(std::move(node));
    return *nodes_.back();
  }

  static void addItems(NodeServer &node, const std::string &prefix, int count) {
    for (int i = 0; i < count; ++i) {
      auto result = node.getLedger().addCreation(
          creationRequest(prefix + std::to_string(i)));
      ASSERT_TRUE(result.isOk()) << result.error().message;
    }
  }

  static bool waitForLength(NodeServer &node, size_t length) {
    for (int i = 0; i < 100; ++i) {
      if (node.getLedger().getChainLength() == length) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return false;
  }

  std::filesystem::path testDir_;
  std::vector<std::unique_ptr<NodeServer>> nodes_;
};

TEST_F(ReplicatorNodesTest, ShorterNodeAdoptsLongerChain) {
  NodeServer &x = startNode("node_x");
  NodeServer &y = startNode("node_y");
  addItems(x, "X-", 2);
  addItems(y, "Y-", 4);
  ASSERT_EQ(x.getLedger().getChainLength(), 3u);
  ASSERT_EQ(y.getLedger().getChainLength(), 5u);

  ASSERT_TRUE(x.getPeers().add(y.getUrl()).isOk());
  auto result = x.getReplicator().requestReconcile();
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_TRUE(result.value().synced);
  EXPECT_EQ(result.value().newLength, 5u);
  EXPECT_EQ(result.value().source, y.getUrl());

  EXPECT_EQ(x.getLedger().getChainLength(), 5u);
  EXPECT_EQ(x.getLedger().getLatestBlock().value().hash,
            y.getLedger().getLatestBlock().value().hash);
  EXPECT_TRUE(x.getLedger().validateChain());

  // Projection is rebuilt from the adopted chain
  auto items = x.getLedger().getAllItems();
  ASSERT_TRUE(items.isOk());
  EXPECT_EQ(items.value().size(), 4u);
  EXPECT_FALSE(x.getLedger().getItem("X-0").value().has_value());

  // The longer node is left alone
  ASSERT_TRUE(y.getPeers().add(x.getUrl()).isOk());
  auto back = y.getReplicator().requestReconcile();
  ASSERT_TRUE(back.isOk());
  EXPECT_FALSE(back.value().synced);
  EXPECT_EQ(back.value().message, "Chain is up to date");
  EXPECT_EQ(y.getLedger().getChainLength(), 5u);
}

TEST_F(ReplicatorNodesTest, UnreachablePeerIsSkipped) {
  NodeServer &x = startNode("node_x");
  NodeServer &y = startNode("node_y");
  addItems(y, "Y-", 2);

  ASSERT_TRUE(x.getPeers().add("http://127.0.0.1:1").isOk());
  ASSERT_TRUE(x.getPeers().add(y.getUrl()).isOk());

  auto result = x.getReplicator().requestReconcile();
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_TRUE(result.value().synced);
  EXPECT_EQ(x.getLedger().getChainLength(), 3u);
}

TEST_F(ReplicatorNodesTest, ValidatePolicyRejectsTamperedPeer) {
  NodeServer &x = startNode("node_x", "validate");
  NodeServer &y = startNode("node_y");
  addItems(y, "Y-", 3);

  auto tampered = y.getLedger().getChain();
  tampered[2].payload[0]["actor"] = "Mallory";
  ASSERT_TRUE(y.getLedger().replaceChain(tampered).isOk());
  ASSERT_FALSE(y.getLedger().validateChain());

  ASSERT_TRUE(x.getPeers().add(y.getUrl()).isOk());
  auto result = x.getReplicator().requestReconcile();
  ASSERT_TRUE(result.isOk());
  EXPECT_FALSE(result.value().synced);
  EXPECT_EQ(x.getLedger().getChainLength(), 1u);
}

TEST_F(ReplicatorNodesTest, BroadcastSealsOnPeer) {
  NodeServer &x = startNode("node_x");
  NodeServer &y = startNode("node_y");
  ASSERT_TRUE(x.getPeers().add(y.getUrl()).isOk());

  auto submitted = x.getLedger().addCreation(creationRequest("EV-1"));
  ASSERT_TRUE(submitted.isOk());
  x.getReplicator().broadcast(submitted.value().transaction);

  ASSERT_TRUE(waitForLength(y, 2u));
  auto item = y.getLedger().getItem("EV-1");
  ASSERT_TRUE(item.isOk());
  ASSERT_TRUE(item.value().has_value());
  EXPECT_EQ(item.value()->currentCustodian, "A");
  EXPECT_EQ(item.value()->originNode, "node_x");
}

TEST_F(ReplicatorNodesTest, ConnectRegistersBothWays) {
  NodeServer &x = startNode("node_x");
  NodeServer &y = startNode("node_y");

  ASSERT_TRUE(x.getPeers()
                  .connect(y.getUrl(), std::chrono::milliseconds(2000))
                  .isOk());
  EXPECT_TRUE(x.getPeers().contains(y.getUrl()));
  EXPECT_TRUE(y.getPeers().contains(x.getUrl()));
}

TEST_F(ReplicatorNodesTest, PeriodicSyncConvergesWithoutRequest) {
  NodeServer &x = startNode("node_x", "trust", 1);
  NodeServer &y = startNode("node_y");
  addItems(y, "Y-", 3);

  ASSERT_TRUE(x.getPeers().add(y.getUrl()).isOk());
  ASSERT_TRUE(waitForLength(x, 4u));
  EXPECT_EQ(x.getLedger().getLatestBlock().value().hash,
            y.getLedger().getLatestBlock().value().hash);
  EXPECT_TRUE(x.getLedger().getItem("Y-2").value().has_value());
}

TEST_F(ReplicatorNodesTest, LocalBlocksSealedDuringFetchAreKept) {
  NodeServer &x = startNode("node_x");
  NodeServer &y = startNode("node_y");
  addItems(y, "Y-", 3);
  nlohmann::json chain = nlohmann::json::array();
  for (const auto &block : y.getLedger().getChain()) {
    chain.push_back(block.toJson());
  }

  // Peer that answers /chain only after local submissions have landed
  httplib::Server slowPeer;
  slowPeer.Get("/chain", [&chain](const httplib::Request &,
                                  httplib::Response &res) {
    std::this_thread::sleep_for(std::chrono::milliseconds(800));
    nlohmann::json body = {{"length", chain.size()}, {"chain", chain}};
    res.set_content(body.dump(), "application/json");
  });
  int port = slowPeer.bind_to_any_port("127.0.0.1");
  ASSERT_GT(port, 0);
  std::thread serverThread([&slowPeer] { slowPeer.listen_after_bind(); });

  ASSERT_TRUE(x.getPeers().add("http://127.0.0.1:" + std::to_string(port)).isOk());
  ASSERT_EQ(x.getLedger().getChainLength(), 1u);
  auto pending = std::async(std::launch::async,
                            [&x] { return x.getReplicator().requestReconcile(); });

  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  addItems(x, "X-", 4);
  ASSERT_EQ(x.getLedger().getChainLength(), 5u);

  auto result = pending.get();
  slowPeer.stop();
  serverThread.join();

  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_FALSE(result.value().synced);
  EXPECT_EQ(result.value().message, "Chain is up to date");
  EXPECT_EQ(x.getLedger().getChainLength(), 5u);
  EXPECT_TRUE(x.getLedger().getItem("X-3").value().has_value());
  EXPECT_FALSE(x.getLedger().getItem("Y-0").value().has_value());
}

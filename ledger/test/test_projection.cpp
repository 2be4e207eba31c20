#include "../Projection.h"
#include <gtest/gtest.h>

using namespace cl;

namespace {

Transaction creation(const std::string &itemId, const std::string &actor,
                     const std::string &timestamp) {
  Transaction tx;
  tx.kind = Transaction::Kind::CREATION;
  tx.itemId = itemId;
  tx.description = "desc " + itemId;
  tx.actor = actor;
  tx.location = "Locker";
  tx.itemType = "Physical";
  tx.contentHash = "hash";
  tx.timestamp = timestamp;
  tx.node = "node-a";
  return tx;
}

Transaction transfer(const std::string &itemId, const std::string &from,
                     const std::string &to, const std::string &timestamp) {
  Transaction tx;
  tx.kind = Transaction::Kind::TRANSFER;
  tx.itemId = itemId;
  tx.fromActor = from;
  tx.toActor = to;
  tx.reason = "review";
  tx.timestamp = timestamp;
  tx.node = "node-b";
  return tx;
}

} // namespace

TEST(ProjectionTest, TransferMovesCustody) {
  Projection projection;
  projection.applyTransaction(creation("EV-1", "A", "2024-01-01T00:00:01"), 1, 0);
  projection.applyTransaction(transfer("EV-1", "A", "B", "2024-01-01T00:00:02"), 2, 0);

  auto item = projection.getItem("EV-1");
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->currentCustodian, "B");
  EXPECT_EQ(item->createdBy, "A");
  EXPECT_EQ(item->createdAt, "2024-01-01T00:00:01");
  EXPECT_EQ(item->lastAction, "Transferred");
  EXPECT_EQ(item->lastUpdated, "2024-01-01T00:00:02");
  EXPECT_EQ(item->originNode, "node-a");
  EXPECT_EQ(item->blockIndex, 1u);

  auto transfers = projection.getTransfers("EV-1");
  ASSERT_EQ(transfers.size(), 1u);
  EXPECT_EQ(transfers[0].fromActor, "A");
  EXPECT_EQ(transfers[0].toActor, "B");
  EXPECT_EQ(transfers[0].originNode, "node-b");
  EXPECT_EQ(transfers[0].blockIndex, 2u);
}

TEST(ProjectionTest, TransferOfUnknownItemIsLoggedOnly) {
  Projection projection;
  projection.applyTransaction(transfer("GHOST", "X", "Y", "2024-01-01T00:00:01"), 1, 0);

  EXPECT_FALSE(projection.getItem("GHOST").has_value());
  EXPECT_EQ(projection.getItemCount(), 0u);
  EXPECT_EQ(projection.getTransfers("GHOST").size(), 1u);
}

TEST(ProjectionTest, RecreationOverwritesItem) {
  Projection projection;
  projection.applyTransaction(creation("EV-1", "A", "2024-01-01T00:00:01"), 1, 0);
  projection.applyTransaction(transfer("EV-1", "A", "B", "2024-01-01T00:00:02"), 2, 0);
  projection.applyTransaction(creation("EV-1", "C", "2024-01-01T00:00:03"), 3, 0);

  auto item = projection.getItem("EV-1");
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->currentCustodian, "C");
  EXPECT_EQ(item->lastAction, "Created");
  EXPECT_EQ(item->blockIndex, 3u);
  // Earlier transfers stay in the log
  EXPECT_EQ(projection.getTransfers("EV-1").size(), 1u);
}

TEST(ProjectionTest, ItemsNewestFirstThenById) {
  Projection projection;
  projection.applyTransaction(creation("B", "A", "2024-01-01T00:00:01"), 1, 0);
  projection.applyTransaction(creation("A", "A", "2024-01-01T00:00:01"), 1, 1);
  projection.applyTransaction(creation("C", "A", "2024-01-02T00:00:00"), 2, 0);

  auto items = projection.getItems();
  ASSERT_EQ(items.size(), 3u);
  EXPECT_EQ(items[0].itemId, "C");
  EXPECT_EQ(items[1].itemId, "A");
  EXPECT_EQ(items[2].itemId, "B");
}

TEST(ProjectionTest, FromChainSkipsGenesis) {
  std::vector<Block> chain;
  chain.push_back(Block::makeGenesis("node-a", 10.0));
  chain.push_back(Block::seal(1, 11.0,
                              {creation("EV-1", "A", "2024-01-01T00:00:01"),
                               transfer("EV-1", "A", "B", "2024-01-01T00:00:01")},
                              chain.back().hash));

  auto projection = Projection::fromChain(chain);
  ASSERT_TRUE(projection.isOk());
  EXPECT_EQ(projection.value().getItemCount(), 1u);
  EXPECT_EQ(projection.value().getTransferCount(), 1u);
  EXPECT_EQ(projection.value().getTransfers("EV-1")[0].position, 1u);
}

TEST(ProjectionTest, MalformedBlockIsReported) {
  Block bad;
  bad.index = 1;
  bad.payload = "oops";

  Projection projection;
  auto result = projection.applyBlock(bad);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Projection::E_BLOCK);
}

TEST(ProjectionTest, CollectHistoryInTransactionOrder) {
  Block block = Block::seal(4, 40.0,
                            {creation("EV-1", "A", "t1"),
                             creation("EV-2", "Q", "t1"),
                             transfer("EV-1", "A", "B", "t2")},
                            "prev");

  std::vector<HistoryEntry> history;
  ASSERT_TRUE(Projection::collectHistory(block, "EV-1", history).isOk());
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].blockIndex, 4u);
  EXPECT_EQ(history[0].action, "Created");
  EXPECT_EQ(history[0].actor, "A");
  EXPECT_EQ(history[1].action, "Transferred");
  EXPECT_EQ(history[1].actor, "B");
  EXPECT_EQ(history[1].details["from_actor"], "A");
}

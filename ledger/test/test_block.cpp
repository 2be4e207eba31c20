#include "../Block.h"
#include "../Transaction.h"
#include <gtest/gtest.h>

using namespace cl;

namespace {

Transaction makeCreation(const std::string &itemId, const std::string &actor) {
  Transaction tx;
  tx.kind = Transaction::Kind::CREATION;
  tx.itemId = itemId;
  tx.description = "Knife";
  tx.actor = actor;
  tx.location = "Room 1";
  tx.itemType = "Physical";
  tx.contentHash = "abc";
  tx.timestamp = "2024-01-01T10:00:00.000000";
  tx.node = "node-a";
  return tx;
}

} // namespace

TEST(BlockTest, GenesisShape) {
  Block genesis = Block::makeGenesis("node-a", 1700000000.5);
  EXPECT_EQ(genesis.index, 0u);
  EXPECT_EQ(genesis.previousHash, "0");
  EXPECT_EQ(genesis.nonce, 0u);
  EXPECT_TRUE(genesis.isGenesis());
  EXPECT_EQ(genesis.payload["message"], "ChainLedger Genesis Block");
  EXPECT_EQ(genesis.payload["node"], "node-a");
  EXPECT_EQ(genesis.hash, genesis.calculateHash());

  auto txes = genesis.getTransactions();
  ASSERT_TRUE(txes.isOk());
  EXPECT_TRUE(txes.value().empty());
}

TEST(BlockTest, HashIsDeterministic) {
  Block a = Block::seal(1, 1700000001.25, {makeCreation("EV-1", "A")}, "prev");
  Block b = Block::seal(1, 1700000001.25, {makeCreation("EV-1", "A")}, "prev");
  EXPECT_EQ(a.hash, b.hash);
  EXPECT_EQ(a.hash.size(), 64u);
}

TEST(BlockTest, AnySingleFieldChangeChangesHash) {
  Block base = Block::seal(1, 1700000001.25, {makeCreation("EV-1", "A")}, "prev");

  Block changed = base;
  changed.index = 2;
  EXPECT_NE(changed.calculateHash(), base.hash);

  changed = base;
  changed.timestamp += 0.001;
  EXPECT_NE(changed.calculateHash(), base.hash);

  changed = base;
  changed.payload[0]["actor"] = "B";
  EXPECT_NE(changed.calculateHash(), base.hash);

  changed = base;
  changed.previousHash = "other";
  EXPECT_NE(changed.calculateHash(), base.hash);

  changed = base;
  changed.nonce = 1;
  EXPECT_NE(changed.calculateHash(), base.hash);
}

TEST(BlockTest, JsonWireFormPreservesHash) {
  Block block = Block::seal(3, 1700000123.456789, {makeCreation("EV-9", "A")},
                            "prevhash");
  nlohmann::json j = block.toJson();

  EXPECT_EQ(j.size(), 6u);
  for (const char *key :
       {"index", "timestamp", "payload", "previous_hash", "nonce", "hash"}) {
    EXPECT_TRUE(j.contains(key)) << key;
  }

  // Through text, as it travels between nodes
  auto parsed = Block::fromJson(nlohmann::json::parse(j.dump()));
  ASSERT_TRUE(parsed.isOk()) << parsed.error().message;
  EXPECT_EQ(parsed.value().hash, block.hash);
  EXPECT_EQ(parsed.value().calculateHash(), block.hash);
}

TEST(BlockTest, FromJsonRejectsMalformed) {
  EXPECT_TRUE(Block::fromJson(nlohmann::json::array()).isError());

  nlohmann::json j = Block::makeGenesis("n", 1.0).toJson();
  j.erase("hash");
  EXPECT_TRUE(Block::fromJson(j).isError());

  j = Block::makeGenesis("n", 1.0).toJson();
  j["index"] = "zero";
  EXPECT_TRUE(Block::fromJson(j).isError());
}

TEST(BlockTest, TransactionsDecodeInOrder) {
  Transaction transfer;
  transfer.kind = Transaction::Kind::TRANSFER;
  transfer.itemId = "EV-1";
  transfer.fromActor = "A";
  transfer.toActor = "B";
  transfer.reason = "lab";

  Block block = Block::seal(1, 1.0, {makeCreation("EV-1", "A"), transfer}, "p");
  EXPECT_FALSE(block.isGenesis());

  auto txes = block.getTransactions();
  ASSERT_TRUE(txes.isOk());
  ASSERT_EQ(txes.value().size(), 2u);
  EXPECT_TRUE(txes.value()[0].isCreation());
  EXPECT_TRUE(txes.value()[1].isTransfer());
  EXPECT_EQ(txes.value()[1].toActor, "B");
}

TEST(BlockTest, BadPayloadIsReported) {
  Block block;
  block.index = 4;
  block.payload = {{"unexpected", true}};
  EXPECT_TRUE(block.getTransactions().isError());
}

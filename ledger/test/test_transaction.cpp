#include "../Transaction.h"
#include <gtest/gtest.h>

using namespace cl;

TEST(TransactionTest, CreationJsonFields) {
  Transaction tx;
  tx.kind = Transaction::Kind::CREATION;
  tx.itemId = "EV-1";
  tx.description = "Knife";
  tx.actor = "A";
  tx.location = "Room 1";
  tx.itemType = "Physical";
  tx.contentHash = "h";
  tx.timestamp = "2024-01-01T00:00:00.000000";
  tx.node = "node-a";

  nlohmann::json j = tx.toJson();
  EXPECT_EQ(j["type"], "item_creation");
  EXPECT_EQ(j["action"], "Created");
  EXPECT_EQ(j["item_id"], "EV-1");
  EXPECT_EQ(j["item_type"], "Physical");
  EXPECT_EQ(j["content_hash"], "h");
  EXPECT_EQ(j["node"], "node-a");
  EXPECT_FALSE(j.contains("to_actor"));
  EXPECT_EQ(tx.custodian(), "A");
}

TEST(TransactionTest, TransferParsesFromWire) {
  nlohmann::json j = {{"type", "item_transfer"}, {"item_id", "EV-1"},
                      {"from_actor", "A"},       {"to_actor", "B"},
                      {"reason", "Lab"},         {"action", "Transferred"},
                      {"timestamp", "t"},        {"node", "node-b"}};
  auto tx = Transaction::fromJson(j);
  ASSERT_TRUE(tx.isOk()) << tx.error().message;
  EXPECT_TRUE(tx.value().isTransfer());
  EXPECT_EQ(tx.value().custodian(), "B");
  EXPECT_EQ(tx.value().node, "node-b");
  EXPECT_EQ(tx.value().toJson(), j);
}

TEST(TransactionTest, FromJsonRejectsBadInput) {
  EXPECT_EQ(Transaction::fromJson(nlohmann::json::array()).error().code,
            Transaction::E_FORMAT);
  EXPECT_EQ(Transaction::fromJson({{"item_id", "x"}}).error().code,
            Transaction::E_MISSING_FIELD);
  EXPECT_EQ(Transaction::fromJson({{"type", "mint"}, {"item_id", "x"}})
                .error()
                .code,
            Transaction::E_UNKNOWN_TYPE);

  nlohmann::json missingTo = {
      {"type", "item_transfer"}, {"item_id", "EV-1"}, {"from_actor", "A"}};
  EXPECT_EQ(Transaction::fromJson(missingTo).error().code,
            Transaction::E_MISSING_FIELD);

  nlohmann::json wrongType = {{"type", "item_transfer"},
                              {"item_id", 7},
                              {"from_actor", "A"},
                              {"to_actor", "B"}};
  EXPECT_EQ(Transaction::fromJson(wrongType).error().code,
            Transaction::E_FORMAT);
}

TEST(TransactionTest, ValidateRequiresFields) {
  Transaction tx;
  tx.kind = Transaction::Kind::TRANSFER;
  tx.itemId = "EV-1";
  tx.fromActor = "A";
  EXPECT_TRUE(tx.validate().isError());
  tx.toActor = "B";
  EXPECT_TRUE(tx.validate().isOk());
  tx.itemId.clear();
  EXPECT_TRUE(tx.validate().isError());

  Transaction creation;
  creation.kind = Transaction::Kind::CREATION;
  creation.itemId = "EV-2";
  creation.actor = "A";
  creation.description = "d";
  creation.location = "l";
  EXPECT_TRUE(creation.validate().isError());
  creation.itemType = "Digital";
  EXPECT_TRUE(creation.validate().isOk());
}

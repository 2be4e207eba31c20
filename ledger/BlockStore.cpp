#include "BlockStore.h"

#include <sqlite3.h>

namespace cl {

namespace {

const char *const SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS blocks (
  index_num INTEGER PRIMARY KEY,
  timestamp REAL NOT NULL,
  data TEXT NOT NULL,
  previous_hash TEXT NOT NULL,
  nonce INTEGER NOT NULL,
  hash TEXT NOT NULL,
  node_id TEXT,
  created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
);
CREATE TABLE IF NOT EXISTS items (
  item_id TEXT PRIMARY KEY,
  description TEXT,
  item_type TEXT,
  current_custodian TEXT,
  location TEXT,
  created_by TEXT,
  created_at TEXT,
  last_action TEXT,
  last_updated TEXT,
  content_hash TEXT,
  origin_node TEXT,
  block_index INTEGER
);
CREATE TABLE IF NOT EXISTS transfers (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  item_id TEXT NOT NULL,
  from_actor TEXT,
  to_actor TEXT,
  reason TEXT,
  timestamp TEXT,
  origin_node TEXT,
  block_index INTEGER,
  tx_position INTEGER
);
CREATE TABLE IF NOT EXISTS node_info (
  node_id TEXT PRIMARY KEY,
  last_active TIMESTAMP,
  chain_length INTEGER
);
CREATE INDEX IF NOT EXISTS idx_items_custodian ON items(current_custodian);
CREATE INDEX IF NOT EXISTS idx_transfers_item ON transfers(item_id);
CREATE INDEX IF NOT EXISTS idx_blocks_hash ON blocks(hash);
)SQL";

const char *const BLOCK_COLUMNS =
    "index_num, timestamp, data, previous_hash, nonce, hash";

const char *const ITEM_COLUMNS =
    "item_id, description, item_type, current_custodian, location, "
    "created_by, created_at, last_action, last_updated, content_hash, "
    "origin_node, block_index";

// Prepared statement, finalized on scope exit
class Statement {
public:
  Statement(sqlite3 *db, const std::string &sql) {
    rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
  }
  ~Statement() {
    if (stmt_) {
      sqlite3_finalize(stmt_);
    }
  }

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  bool isOk() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }

  void bindText(int i, const std::string &value) {
    sqlite3_bind_text(stmt_, i, value.data(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
  }
  void bindInt64(int i, uint64_t value) {
    sqlite3_bind_int64(stmt_, i, static_cast<sqlite3_int64>(value));
  }
  void bindDouble(int i, double value) { sqlite3_bind_double(stmt_, i, value); }

  int step() { return sqlite3_step(stmt_); }

  std::string columnText(int i) const {
    const unsigned char *text = sqlite3_column_text(stmt_, i);
    if (text == nullptr) {
      return "";
    }
    return std::string(reinterpret_cast<const char *>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, i)));
  }
  uint64_t columnUInt64(int i) const {
    return static_cast<uint64_t>(sqlite3_column_int64(stmt_, i));
  }
  double columnDouble(int i) const { return sqlite3_column_double(stmt_, i); }

private:
  sqlite3_stmt *stmt_{ nullptr };
  int rc_{ SQLITE_ERROR };
};

BlockStore::Roe<Block> readBlockRow(const Statement &stmt) {
  Block block;
  block.index = stmt.columnUInt64(0);
  block.timestamp = stmt.columnDouble(1);
  try {
    block.payload = nlohmann::json::parse(stmt.columnText(2));
  } catch (const nlohmann::json::parse_error &e) {
    return BlockStore::Error(BlockStore::E_DECODE,
                             "Block " + std::to_string(block.index) +
                                 " has unreadable payload: " + e.what());
  }
  block.previousHash = stmt.columnText(3);
  block.nonce = stmt.columnUInt64(4);
  block.hash = stmt.columnText(5);
  return block;
}

ItemRecord readItemRow(const Statement &stmt) {
  ItemRecord record;
  record.itemId = stmt.columnText(0);
  record.description = stmt.columnText(1);
  record.itemType = stmt.columnText(2);
  record.currentCustodian = stmt.columnText(3);
  record.location = stmt.columnText(4);
  record.createdBy = stmt.columnText(5);
  record.createdAt = stmt.columnText(6);
  record.lastAction = stmt.columnText(7);
  record.lastUpdated = stmt.columnText(8);
  record.contentHash = stmt.columnText(9);
  record.originNode = stmt.columnText(10);
  record.blockIndex = stmt.columnUInt64(11);
  return record;
}

} // namespace

/**
 * BEGIN on construction, ROLLBACK on destruction unless commit() succeeded
 */
class BlockStore::TxGuard {
public:
  explicit TxGuard(sqlite3 *db) : db_(db) {
    active_ = sqlite3_exec(db_, "BEGIN TRANSACTION", nullptr, nullptr,
                           nullptr) == SQLITE_OK;
  }

  ~TxGuard() {
    if (active_ && !committed_) {
      sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }
  }

  TxGuard(const TxGuard &) = delete;
  TxGuard &operator=(const TxGuard &) = delete;

  bool isActive() const { return active_; }

  bool commit() {
    if (!active_ || committed_) {
      return false;
    }
    committed_ =
        sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) == SQLITE_OK;
    return committed_;
  }

private:
  sqlite3 *db_;
  bool active_{ false };
  bool committed_{ false };
};

nlohmann::json BlockStore::Stats::toJson() const {
  return {{"blocks", blocks}, {"items", items}, {"transfers", transfers}};
}

BlockStore::BlockStore() : Module("cl.BlockStore") {}

BlockStore::~BlockStore() { close(); }

BlockStore::Roe<void> BlockStore::open(const std::string &path) {
  close();

  int rc = sqlite3_open_v2(path.c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                               SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    close();
    return Error(E_OPEN, "Failed to open database " + path + ": " + message);
  }
  path_ = path;

  sqlite3_busy_timeout(db_, 5000);

  auto schemaResult = createSchema();
  if (!schemaResult) {
    close();
    return schemaResult.error();
  }

  log().info << "Opened block store: " << path;
  return {};
}

void BlockStore::close() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

BlockStore::Error BlockStore::sqlError(const std::string &context) const {
  return Error(E_SQL, context + ": " + sqlite3_errmsg(db_));
}

BlockStore::Roe<void> BlockStore::checkOpen() const {
  if (!db_) {
    return Error(E_CLOSED, "Block store is not open");
  }
  return {};
}

BlockStore::Roe<void> BlockStore::exec(const std::string &sql) const {
  char *errMsg = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
  if (rc != SQLITE_OK) {
    std::string message = errMsg ? errMsg : sqlite3_errstr(rc);
    sqlite3_free(errMsg);
    return Error(E_SQL, message);
  }
  return {};
}

BlockStore::Roe<void> BlockStore::createSchema() {
  auto result = exec(SCHEMA_SQL);
  if (!result) {
    return Error(E_SQL, "Failed to create schema: " + result.error().message);
  }
  return {};
}

BlockStore::Roe<void> BlockStore::writeBlock(const Block &block,
                                             const std::string &nodeId) {
  Statement stmt(db_, "INSERT OR REPLACE INTO blocks (index_num, timestamp, "
                      "data, previous_hash, nonce, hash, node_id) "
                      "VALUES (?, ?, ?, ?, ?, ?, ?)");
  if (!stmt.isOk()) {
    return sqlError("Failed to prepare block insert");
  }
  stmt.bindInt64(1, block.index);
  stmt.bindDouble(2, block.timestamp);
  stmt.bindText(3, block.payload.dump());
  stmt.bindText(4, block.previousHash);
  stmt.bindInt64(5, block.nonce);
  stmt.bindText(6, block.hash);
  stmt.bindText(7, nodeId);
  if (stmt.step() != SQLITE_DONE) {
    return sqlError("Failed to write block " + std::to_string(block.index));
  }
  return {};
}

BlockStore::Roe<void> BlockStore::writeProjection(const Block &block) {
  auto txResult = block.getTransactions();
  if (!txResult) {
    return Error(E_DECODE, txResult.error().message);
  }
  const auto &txes = txResult.value();

  for (size_t position = 0; position < txes.size(); ++position) {
    const auto &tx = txes[position];
    if (tx.isCreation()) {
      Statement stmt(db_, std::string("INSERT OR REPLACE INTO items (") +
                              ITEM_COLUMNS +
                              ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
      if (!stmt.isOk()) {
        return sqlError("Failed to prepare item insert");
      }
      stmt.bindText(1, tx.itemId);
      stmt.bindText(2, tx.description);
      stmt.bindText(3, tx.itemType);
      stmt.bindText(4, tx.actor);
      stmt.bindText(5, tx.location);
      stmt.bindText(6, tx.actor);
      stmt.bindText(7, tx.timestamp);
      stmt.bindText(8, tx.action());
      stmt.bindText(9, tx.timestamp);
      stmt.bindText(10, tx.contentHash);
      stmt.bindText(11, tx.node);
      stmt.bindInt64(12, block.index);
      if (stmt.step() != SQLITE_DONE) {
        return sqlError("Failed to write item " + tx.itemId);
      }
      continue;
    }

    // Unknown items are left without a row; the transfer is still logged
    Statement update(db_, "UPDATE items SET current_custodian = ?, "
                          "last_action = ?, last_updated = ? WHERE item_id = ?");
    if (!update.isOk()) {
      return sqlError("Failed to prepare item update");
    }
    update.bindText(1, tx.toActor);
    update.bindText(2, tx.action());
    update.bindText(3, tx.timestamp);
    update.bindText(4, tx.itemId);
    if (update.step() != SQLITE_DONE) {
      return sqlError("Failed to update item " + tx.itemId);
    }

    Statement insert(db_, "INSERT INTO transfers (item_id, from_actor, "
                          "to_actor, reason, timestamp, origin_node, "
                          "block_index, tx_position) "
                          "VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
    if (!insert.isOk()) {
      return sqlError("Failed to prepare transfer insert");
    }
    insert.bindText(1, tx.itemId);
    insert.bindText(2, tx.fromActor);
    insert.bindText(3, tx.toActor);
    insert.bindText(4, tx.reason);
    insert.bindText(5, tx.timestamp);
    insert.bindText(6, tx.node);
    insert.bindInt64(7, block.index);
    insert.bindInt64(8, position);
    if (insert.step() != SQLITE_DONE) {
      return sqlError("Failed to log transfer of " + tx.itemId);
    }
  }
  return {};
}

BlockStore::Roe<void> BlockStore::updateNodeInfo(const std::string &nodeId) {
  Statement stmt(db_, "INSERT OR REPLACE INTO node_info (node_id, last_active, "
                      "chain_length) VALUES (?, CURRENT_TIMESTAMP, "
                      "(SELECT COUNT(*) FROM blocks))");
  if (!stmt.isOk()) {
    return sqlError("Failed to prepare node info update");
  }
  stmt.bindText(1, nodeId);
  if (stmt.step() != SQLITE_DONE) {
    return sqlError("Failed to update node info");
  }
  return {};
}

BlockStore::Roe<void> BlockStore::appendBlock(const Block &block,
                                              const std::string &nodeId) {
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult;
  }

  TxGuard guard(db_);
  if (!guard.isActive()) {
    return sqlError("Failed to begin transaction");
  }

  auto result = writeBlock(block, nodeId);
  if (!result) {
    return result;
  }

  Statement clear(db_, "DELETE FROM transfers WHERE block_index = ?");
  if (!clear.isOk()) {
    return sqlError("Failed to prepare transfer cleanup");
  }
  clear.bindInt64(1, block.index);
  if (clear.step() != SQLITE_DONE) {
    return sqlError("Failed to clear transfers of block " +
                    std::to_string(block.index));
  }

  result = writeProjection(block);
  if (!result) {
    return result;
  }
  result = updateNodeInfo(nodeId);
  if (!result) {
    return result;
  }

  if (!guard.commit()) {
    return sqlError("Failed to commit block " + std::to_string(block.index));
  }
  log().debug << "Stored block " << block.index;
  return {};
}

BlockStore::Roe<void> BlockStore::replaceChain(const std::vector<Block> &blocks,
                                               const std::string &nodeId) {
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult;
  }

  TxGuard guard(db_);
  if (!guard.isActive()) {
    return sqlError("Failed to begin transaction");
  }

  auto result = exec("DELETE FROM blocks; DELETE FROM items; "
                     "DELETE FROM transfers;");
  if (!result) {
    return Error(E_SQL, "Failed to clear tables: " + result.error().message);
  }

  for (const auto &block : blocks) {
    result = writeBlock(block, nodeId);
    if (!result) {
      return result;
    }
    result = writeProjection(block);
    if (!result) {
      return result;
    }
  }

  result = updateNodeInfo(nodeId);
  if (!result) {
    return result;
  }

  if (!guard.commit()) {
    return sqlError("Failed to commit chain replacement");
  }
  log().info << "Replaced stored chain with " << blocks.size() << " blocks";
  return {};
}

BlockStore::Roe<std::vector<Block>> BlockStore::loadChain() const {
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult.error();
  }

  Statement stmt(db_, std::string("SELECT ") + BLOCK_COLUMNS +
                          " FROM blocks ORDER BY index_num");
  if (!stmt.isOk()) {
    return sqlError("Failed to prepare chain load");
  }

  std::vector<Block> blocks;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    auto blockResult = readBlockRow(stmt);
    if (!blockResult) {
      return blockResult.error();
    }
    blocks.push_back(std::move(blockResult.value()));
  }
  if (rc != SQLITE_DONE) {
    return sqlError("Failed to read blocks");
  }
  return blocks;
}

BlockStore::Roe<uint64_t> BlockStore::countRows(const char *table) const {
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult.error();
  }

  Statement stmt(db_, std::string("SELECT COUNT(*) FROM ") + table);
  if (!stmt.isOk() || stmt.step() != SQLITE_ROW) {
    return sqlError(std::string("Failed to count ") + table);
  }
  return stmt.columnUInt64(0);
}

BlockStore::Roe<uint64_t> BlockStore::getBlockCount() const {
  return countRows("blocks");
}

BlockStore::Roe<std::optional<ItemRecord>>
BlockStore::queryItem(const std::string &itemId) const {
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult.error();
  }

  Statement stmt(db_, std::string("SELECT ") + ITEM_COLUMNS +
                          " FROM items WHERE item_id = ?");
  if (!stmt.isOk()) {
    return sqlError("Failed to prepare item query");
  }
  stmt.bindText(1, itemId);

  int rc = stmt.step();
  if (rc == SQLITE_ROW) {
    return std::optional<ItemRecord>(readItemRow(stmt));
  }
  if (rc != SQLITE_DONE) {
    return sqlError("Failed to query item " + itemId);
  }
  return std::optional<ItemRecord>();
}

BlockStore::Roe<std::vector<HistoryEntry>>
BlockStore::queryItemHistory(const std::string &itemId) const {
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult.error();
  }

  // Narrow by the JSON-encoded id, then decode and match exactly
  Statement stmt(db_, std::string("SELECT ") + BLOCK_COLUMNS +
                          " FROM blocks WHERE index_num > 0 AND "
                          "instr(data, ?) > 0 ORDER BY index_num");
  if (!stmt.isOk()) {
    return sqlError("Failed to prepare history query");
  }
  stmt.bindText(1, nlohmann::json(itemId).dump());

  std::vector<HistoryEntry> history;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    auto blockResult = readBlockRow(stmt);
    if (!blockResult) {
      return blockResult.error();
    }
    auto collectResult =
        Projection::collectHistory(blockResult.value(), itemId, history);
    if (!collectResult) {
      return Error(E_DECODE, collectResult.error().message);
    }
  }
  if (rc != SQLITE_DONE) {
    return sqlError("Failed to query history of " + itemId);
  }
  return history;
}

BlockStore::Roe<std::vector<ItemRecord>> BlockStore::queryAllItems() const {
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult.error();
  }

  Statement stmt(db_, std::string("SELECT ") + ITEM_COLUMNS +
                          " FROM items ORDER BY created_at DESC, item_id ASC");
  if (!stmt.isOk()) {
    return sqlError("Failed to prepare item listing");
  }

  std::vector<ItemRecord> items;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    items.push_back(readItemRow(stmt));
  }
  if (rc != SQLITE_DONE) {
    return sqlError("Failed to list items");
  }
  return items;
}

BlockStore::Roe<std::vector<TransferRecord>>
BlockStore::queryTransfers(const std::string &itemId) const {
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult.error();
  }

  Statement stmt(db_, "SELECT item_id, from_actor, to_actor, reason, "
                      "timestamp, origin_node, block_index, tx_position "
                      "FROM transfers WHERE item_id = ? "
                      "ORDER BY block_index, tx_position, id");
  if (!stmt.isOk()) {
    return sqlError("Failed to prepare transfer query");
  }
  stmt.bindText(1, itemId);

  std::vector<TransferRecord> transfers;
  int rc = SQLITE_ROW;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    TransferRecord record;
    record.itemId = stmt.columnText(0);
    record.fromActor = stmt.columnText(1);
    record.toActor = stmt.columnText(2);
    record.reason = stmt.columnText(3);
    record.timestamp = stmt.columnText(4);
    record.originNode = stmt.columnText(5);
    record.blockIndex = stmt.columnUInt64(6);
    record.position = static_cast<uint32_t>(stmt.columnUInt64(7));
    transfers.push_back(record);
  }
  if (rc != SQLITE_DONE) {
    return sqlError("Failed to query transfers of " + itemId);
  }
  return transfers;
}

BlockStore::Roe<BlockStore::Stats> BlockStore::getStats() const {
  Stats stats;
  auto blocks = countRows("blocks");
  if (!blocks) {
    return blocks.error();
  }
  auto items = countRows("items");
  if (!items) {
    return items.error();
  }
  auto transfers = countRows("transfers");
  if (!transfers) {
    return transfers.error();
  }
  stats.blocks = blocks.value();
  stats.items = items.value();
  stats.transfers = transfers.value();
  return stats;
}

BlockStore::Roe<std::optional<BlockStore::NodeInfo>>
BlockStore::getNodeInfo(const std::string &nodeId) const {
  auto openResult = checkOpen();
  if (!openResult) {
    return openResult.error();
  }

  Statement stmt(db_, "SELECT node_id, last_active, chain_length FROM "
                      "node_info WHERE node_id = ?");
  if (!stmt.isOk()) {
    return sqlError("Failed to prepare node info query");
  }
  stmt.bindText(1, nodeId);

  int rc = stmt.step();
  if (rc == SQLITE_ROW) {
    NodeInfo info;
    info.nodeId = stmt.columnText(0);
    info.lastActive = stmt.columnText(1);
    info.chainLength = stmt.columnUInt64(2);
    return std::optional<NodeInfo>(info);
  }
  if (rc != SQLITE_DONE) {
    return sqlError("Failed to query node info");
  }
  return std::optional<NodeInfo>();
}

} // namespace cl

#ifndef CHAIN_LEDGER_BLOCK_STORE_H
#define CHAIN_LEDGER_BLOCK_STORE_H

#include "../lib/Module.h"
#include "../lib/ResultOrError.h"
#include "Block.h"
#include "Projection.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace cl {

/**
 * SQLite persistence for blocks plus the derived item and transfer tables.
 *
 * Every write runs in a single SQL transaction; on failure it is rolled back
 * and the database is left as it was. Not thread-safe: the owning Ledger
 * serializes access.
 */
class BlockStore : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const int32_t E_OPEN = 1;
  static constexpr const int32_t E_SQL = 2;
  static constexpr const int32_t E_DECODE = 3;
  static constexpr const int32_t E_CLOSED = 4;

  struct Stats {
    uint64_t blocks{ 0 };
    uint64_t items{ 0 };
    uint64_t transfers{ 0 };

    nlohmann::json toJson() const;
  };

  struct NodeInfo {
    std::string nodeId;
    std::string lastActive;
    uint64_t chainLength{ 0 };
  };

  BlockStore();
  ~BlockStore() override;

  /**
   * Open (creating if needed) the database and its schema.
   * @param path File path, or ":memory:"
   */
  Roe<void> open(const std::string &path);
  void close();
  bool isOpen() const { return db_ != nullptr; }
  const std::string &getPath() const { return path_; }

  /**
   * Write one block and derive its item/transfer rows. Retrying the latest
   * append leaves the tables unchanged.
   */
  Roe<void> appendBlock(const Block &block, const std::string &nodeId);

  // Clear every table and write `blocks` in their place
  Roe<void> replaceChain(const std::vector<Block> &blocks,
                         const std::string &nodeId);

  // All blocks ordered by index; empty for a fresh store
  Roe<std::vector<Block>> loadChain() const;
  Roe<uint64_t> getBlockCount() const;

  Roe<std::optional<ItemRecord>> queryItem(const std::string &itemId) const;
  Roe<std::vector<HistoryEntry>>
  queryItemHistory(const std::string &itemId) const;
  Roe<std::vector<ItemRecord>> queryAllItems() const;
  Roe<std::vector<TransferRecord>>
  queryTransfers(const std::string &itemId) const;

  Roe<Stats> getStats() const;
  Roe<std::optional<NodeInfo>> getNodeInfo(const std::string &nodeId) const;

private:
  class TxGuard;

  Roe<void> exec(const std::string &sql) const;
  Roe<void> createSchema();
  Roe<void> checkOpen() const;
  Roe<void> writeBlock(const Block &block, const std::string &nodeId);
  Roe<void> writeProjection(const Block &block);
  Roe<void> updateNodeInfo(const std::string &nodeId);
  Roe<uint64_t> countRows(const char *table) const;
  Error sqlError(const std::string &context) const;

  sqlite3 *db_{ nullptr };
  std::string path_;
};

} // namespace cl

#endif // CHAIN_LEDGER_BLOCK_STORE_H

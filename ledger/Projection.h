#ifndef CHAIN_LEDGER_PROJECTION_H
#define CHAIN_LEDGER_PROJECTION_H

#include "Block.h"

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cl {

// Current state of one tracked item
struct ItemRecord {
  std::string itemId;
  std::string description;
  std::string itemType;
  std::string currentCustodian;
  std::string location;
  std::string createdBy;
  std::string createdAt;
  std::string lastAction;
  std::string lastUpdated;
  std::string contentHash;
  std::string originNode;
  uint64_t blockIndex{ 0 }; // block holding the creation

  nlohmann::json toJson() const;
  bool operator==(const ItemRecord &other) const;
};

struct TransferRecord {
  std::string itemId;
  std::string fromActor;
  std::string toActor;
  std::string reason;
  std::string timestamp;
  std::string originNode;
  uint64_t blockIndex{ 0 };
  uint32_t position{ 0 }; // index of the transaction inside its block

  nlohmann::json toJson() const;
  bool operator==(const TransferRecord &other) const;
};

struct HistoryEntry {
  uint64_t blockIndex{ 0 };
  std::string timestamp;
  std::string action;
  std::string actor; // creator, or receiver of a transfer
  nlohmann::json details;

  nlohmann::json toJson() const;
};

/**
 * In-memory item projection built by scanning blocks in order.
 *
 * Rules:
 * - creation inserts or overwrites the item row, custodian = actor
 * - transfer of a known item moves custody to to_actor and logs the transfer
 * - transfer of an unknown item is logged but creates no item row
 *
 * The SQLite store materializes the same rules; see BlockStore.
 */
class Projection {
public:
  static constexpr const int32_t E_BLOCK = 20;

  Projection() = default;

  static Roe<Projection> fromChain(const std::vector<Block> &chain);

  Roe<void> applyBlock(const Block &block);
  void applyTransaction(const Transaction &tx, uint64_t blockIndex,
                        uint32_t position);

  // Newest creation first, ties by item id
  std::vector<ItemRecord> getItems() const;
  std::optional<ItemRecord> getItem(const std::string &itemId) const;
  // Chain order
  std::vector<TransferRecord> getTransfers(const std::string &itemId) const;

  size_t getItemCount() const { return items_.size(); }
  size_t getTransferCount() const { return transfers_.size(); }

  /**
   * Append the events of `block` that concern `itemId` to `history`,
   * in transaction order
   */
  static Roe<void> collectHistory(const Block &block, const std::string &itemId,
                                  std::vector<HistoryEntry> &history);

  static void sortItems(std::vector<ItemRecord> &items);

private:
  std::map<std::string, ItemRecord> items_;
  std::vector<TransferRecord> transfers_;
};

} // namespace cl

#endif // CHAIN_LEDGER_PROJECTION_H

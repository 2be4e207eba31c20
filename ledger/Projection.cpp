#include "Projection.h"

#include <algorithm>
#include <tuple>

namespace cl {

nlohmann::json ItemRecord::toJson() const {
  nlohmann::json j;
  j["item_id"] = itemId;
  j["description"] = description;
  j["item_type"] = itemType;
  j["current_custodian"] = currentCustodian;
  j["location"] = location;
  j["created_by"] = createdBy;
  j["created_at"] = createdAt;
  j["last_action"] = lastAction;
  j["last_updated"] = lastUpdated;
  j["content_hash"] = contentHash;
  j["node"] = originNode;
  j["block_index"] = blockIndex;
  return j;
}

bool ItemRecord::operator==(const ItemRecord &other) const {
  return std::tie(itemId, description, itemType, currentCustodian, location,
                  createdBy, createdAt, lastAction, lastUpdated, contentHash,
                  originNode, blockIndex) ==
         std::tie(other.itemId, other.description, other.itemType,
                  other.currentCustodian, other.location, other.createdBy,
                  other.createdAt, other.lastAction, other.lastUpdated,
                  other.contentHash, other.originNode, other.blockIndex);
}

nlohmann::json TransferRecord::toJson() const {
  nlohmann::json j;
  j["item_id"] = itemId;
  j["from_actor"] = fromActor;
  j["to_actor"] = toActor;
  j["reason"] = reason;
  j["timestamp"] = timestamp;
  j["node"] = originNode;
  j["block_index"] = blockIndex;
  return j;
}

bool TransferRecord::operator==(const TransferRecord &other) const {
  return std::tie(itemId, fromActor, toActor, reason, timestamp, originNode,
                  blockIndex, position) ==
         std::tie(other.itemId, other.fromActor, other.toActor, other.reason,
                  other.timestamp, other.originNode, other.blockIndex,
                  other.position);
}

nlohmann::json HistoryEntry::toJson() const {
  nlohmann::json j;
  j["block_index"] = blockIndex;
  j["timestamp"] = timestamp;
  j["action"] = action;
  j["actor"] = actor;
  j["details"] = details;
  return j;
}

Roe<Projection> Projection::fromChain(const std::vector<Block> &chain) {
  Projection projection;
  for (const auto &block : chain) {
    auto result = projection.applyBlock(block);
    if (!result) {
      return result.error();
    }
  }
  return projection;
}

Roe<void> Projection::applyBlock(const Block &block) {
  auto txResult = block.getTransactions();
  if (!txResult) {
    return Error(E_BLOCK, txResult.error().message);
  }
  const auto &txes = txResult.value();
  for (size_t i = 0; i < txes.size(); ++i) {
    applyTransaction(txes[i], block.index, static_cast<uint32_t>(i));
  }
  return {};
}

void Projection::applyTransaction(const Transaction &tx, uint64_t blockIndex,
                                  uint32_t position) {
  if (tx.isCreation()) {
    ItemRecord record;
    record.itemId = tx.itemId;
    record.description = tx.description;
    record.itemType = tx.itemType;
    record.currentCustodian = tx.actor;
    record.location = tx.location;
    record.createdBy = tx.actor;
    record.createdAt = tx.timestamp;
    record.lastAction = tx.action();
    record.lastUpdated = tx.timestamp;
    record.contentHash = tx.contentHash;
    record.originNode = tx.node;
    record.blockIndex = blockIndex;
    items_[tx.itemId] = record;
    return;
  }

  auto it = items_.find(tx.itemId);
  if (it != items_.end()) {
    it->second.currentCustodian = tx.toActor;
    it->second.lastAction = tx.action();
    it->second.lastUpdated = tx.timestamp;
  }

  TransferRecord transfer;
  transfer.itemId = tx.itemId;
  transfer.fromActor = tx.fromActor;
  transfer.toActor = tx.toActor;
  transfer.reason = tx.reason;
  transfer.timestamp = tx.timestamp;
  transfer.originNode = tx.node;
  transfer.blockIndex = blockIndex;
  transfer.position = position;
  transfers_.push_back(transfer);
}

void Projection::sortItems(std::vector<ItemRecord> &items) {
  std::sort(items.begin(), items.end(),
            [](const ItemRecord &a, const ItemRecord &b) {
              if (a.createdAt != b.createdAt) {
                return a.createdAt > b.createdAt;
              }
              return a.itemId < b.itemId;
            });
}

std::vector<ItemRecord> Projection::getItems() const {
  std::vector<ItemRecord> items;
  items.reserve(items_.size());
  for (const auto &entry : items_) {
    items.push_back(entry.second);
  }
  sortItems(items);
  return items;
}

std::optional<ItemRecord> Projection::getItem(const std::string &itemId) const {
  auto it = items_.find(itemId);
  if (it == items_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<TransferRecord>
Projection::getTransfers(const std::string &itemId) const {
  std::vector<TransferRecord> result;
  for (const auto &transfer : transfers_) {
    if (transfer.itemId == itemId) {
      result.push_back(transfer);
    }
  }
  return result;
}

Roe<void> Projection::collectHistory(const Block &block,
                                     const std::string &itemId,
                                     std::vector<HistoryEntry> &history) {
  auto txResult = block.getTransactions();
  if (!txResult) {
    return Error(E_BLOCK, txResult.error().message);
  }
  for (const auto &tx : txResult.value()) {
    if (tx.itemId != itemId) {
      continue;
    }
    HistoryEntry entry;
    entry.blockIndex = block.index;
    entry.timestamp = tx.timestamp;
    entry.action = tx.action();
    entry.actor = tx.custodian();
    entry.details = tx.toJson();
    history.push_back(entry);
  }
  return {};
}

} // namespace cl

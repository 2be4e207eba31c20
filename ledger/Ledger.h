#pragma once

#include "Block.h"
#include "BlockStore.h"
#include "../lib/Module.h"
#include "Projection.h"
#include "../lib/ResultOrError.h"
#include "Transaction.h"

#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cl {

/**
 * The node's chain: owns the in-memory blocks, the pending buffer and the
 * backing BlockStore. All public methods are thread-safe; submissions and
 * chain replacement are serialized by one mutex.
 */
class Ledger : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const int32_t E_NOT_MOUNTED = 1;
  static constexpr const int32_t E_INVALID_INPUT = 2;
  static constexpr const int32_t E_STORAGE = 3;
  static constexpr const int32_t E_EMPTY_CHAIN = 4;
  static constexpr const int32_t E_DECODE = 5;
  static constexpr const int32_t E_STALE = 6;

  struct Config {
    std::string nodeId;
    std::string dbPath; // ":memory:" for a throwaway store
  };

  // Local submission of a new item. contentHash is derived when empty.
  struct CreationRequest {
    std::string itemId;
    std::string description;
    std::string actor;
    std::string location;
    std::string itemType;
    std::string contentHash;

    static Roe<CreationRequest> fromJson(const nlohmann::json &j);
  };

  struct TransferRequest {
    std::string itemId;
    std::string fromActor;
    std::string toActor;
    std::string reason;

    static Roe<TransferRequest> fromJson(const nlohmann::json &j);
  };

  struct SubmitResult {
    Block block;
    Transaction transaction;

    nlohmann::json toJson() const;
  };

  Ledger();
  ~Ledger() override;

  /**
   * Open the store and load its chain. A fresh store gets a genesis block;
   * a non-empty one is loaded as is.
   */
  Roe<void> mount(const Config &config);
  void unmount();
  bool isMounted() const;

  const std::string &getNodeId() const { return config_.nodeId; }

  // Build a transaction stamped with this node's id and the current time
  Roe<SubmitResult> addCreation(const CreationRequest &request);
  Roe<SubmitResult> addTransfer(const TransferRequest &request);

  /**
   * Validate `tx`, add it to the pending buffer and seal the whole buffer
   * into exactly one new block. The block is persisted before it joins the
   * in-memory chain; if persisting fails the chain is unchanged and the
   * pending buffer is dropped.
   */
  Roe<SubmitResult> submitTransaction(const Transaction &tx);

  /**
   * Recompute every hash and link from index 1 on. Never repairs.
   */
  bool validateChain() const;
  static bool validateBlocks(const std::vector<Block> &blocks);

  /**
   * Swap the whole chain, store first and memory second. Hash links are not
   * checked here; that is the caller's adoption policy.
   */
  Roe<void> replaceChain(const std::vector<Block> &blocks);
  // Same, but E_STALE unless blocks is strictly longer than the chain held
  // at the moment of the swap
  Roe<void> replaceChainIfLonger(const std::vector<Block> &blocks);

  std::vector<Block> getChain() const;
  size_t getChainLength() const;
  Roe<Block> getLatestBlock() const;
  size_t getPendingCount() const;

  // Reads against the materialized tables
  Roe<std::optional<ItemRecord>> getItem(const std::string &itemId) const;
  Roe<std::vector<HistoryEntry>> getItemHistory(const std::string &itemId) const;
  Roe<std::vector<ItemRecord>> getAllItems() const;
  Roe<std::vector<TransferRecord>> getTransfers(const std::string &itemId) const;
  Roe<BlockStore::Stats> getStats() const;

  // Same reads answered by scanning the in-memory chain
  Roe<std::vector<ItemRecord>> scanItems() const;
  Roe<std::vector<HistoryEntry>> scanItemHistory(const std::string &itemId) const;
  Roe<std::vector<TransferRecord>> scanTransfers(const std::string &itemId) const;

private:
  Roe<void> checkMounted() const;
  Roe<void> createGenesis();
  Roe<Projection> scanProjection() const;
  Roe<void> replaceChainLocked(const std::vector<Block> &blocks);
  static Error storageError(const BlockStore::Error &error);

  Config config_;
  BlockStore store_;
  std::vector<Block> chain_;
  std::vector<Transaction> pending_;
  bool mounted_{ false };
  mutable std::mutex mutex_;
};

} // namespace cl

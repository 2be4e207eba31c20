#pragma once

#include "Transaction.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace cl {

/**
 * One link of the chain. The payload is either the genesis marker object or
 * an array of transaction objects; it is kept as JSON so that a block read
 * back from a peer or from disk hashes exactly as it was sealed.
 */
struct Block {
  static constexpr const char *GENESIS_TYPE = "genesis";
  static constexpr const char *GENESIS_MESSAGE = "ChainLedger Genesis Block";
  static constexpr const char *GENESIS_PREVIOUS_HASH = "0";

  static constexpr const int32_t E_FORMAT = 10;
  static constexpr const int32_t E_PAYLOAD = 11;

  uint64_t index{ 0 };
  double timestamp{ 0 };
  nlohmann::json payload;
  std::string previousHash;
  uint64_t nonce{ 0 };
  std::string hash;

  /**
   * SHA-256 hex digest of the key-sorted JSON of
   * {index, timestamp, payload, previous_hash, nonce}
   */
  std::string calculateHash() const;

  bool isGenesis() const;

  // Transactions of a regular block; empty for genesis
  Roe<std::vector<Transaction>> getTransactions() const;

  nlohmann::json toJson() const;
  static Roe<Block> fromJson(const nlohmann::json &j);

  static Block makeGenesis(const std::string &nodeId, double timestamp);

  // Build and hash a regular block
  static Block seal(uint64_t index, double timestamp,
                    const std::vector<Transaction> &txes,
                    const std::string &previousHash);
};

} // namespace cl

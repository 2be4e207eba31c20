#include "Ledger.h"
#include "../lib/Utilities.h"

namespace cl {

namespace {

bool readString(const nlohmann::json &j, const char *key, std::string &out,
                bool required, std::string &missing) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    if (required) {
      missing = key;
      return false;
    }
    return true;
  }
  if (!it->is_string()) {
    missing = key;
    return false;
  }
  out = it->get<std::string>();
  return true;
}

std::string deriveContentHash(const std::string &itemId,
                              const std::string &description,
                              const std::string &timestamp) {
  return utl::sha256(itemId + description + timestamp);
}

} // namespace

Ledger::Roe<Ledger::CreationRequest>
Ledger::CreationRequest::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return Error(E_INVALID_INPUT, "Request body must be a JSON object");
  }
  CreationRequest request;
  std::string bad;
  if (!readString(j, "item_id", request.itemId, true, bad) ||
      !readString(j, "description", request.description, true, bad) ||
      !readString(j, "actor", request.actor, true, bad) ||
      !readString(j, "location", request.location, true, bad) ||
      !readString(j, "item_type", request.itemType, true, bad) ||
      !readString(j, "content_hash", request.contentHash, false, bad)) {
    return Error(E_INVALID_INPUT, "Missing or invalid field: " + bad);
  }
  return request;
}

Ledger::Roe<Ledger::TransferRequest>
Ledger::TransferRequest::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return Error(E_INVALID_INPUT, "Request body must be a JSON object");
  }
  TransferRequest request;
  std::string bad;
  if (!readString(j, "item_id", request.itemId, true, bad) ||
      !readString(j, "from_actor", request.fromActor, true, bad) ||
      !readString(j, "to_actor", request.toActor, true, bad) ||
      !readString(j, "reason", request.reason, false, bad)) {
    return Error(E_INVALID_INPUT, "Missing or invalid field: " + bad);
  }
  return request;
}

nlohmann::json Ledger::SubmitResult::toJson() const {
  return {{"success", true},
          {"block", block.toJson()},
          {"transaction", transaction.toJson()}};
}

Ledger::Ledger() : Module("cl.Ledger") {}

Ledger::~Ledger() { unmount(); }

Ledger::Error Ledger::storageError(const BlockStore::Error &error) {
  return Error(E_STORAGE, "Storage failure: " + error.message);
}

Ledger::Roe<void> Ledger::mount(const Config &config) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (mounted_) {
    store_.close();
    mounted_ = false;
  }
  if (config.nodeId.empty()) {
    return Error(E_INVALID_INPUT, "Node id must not be empty");
  }

  config_ = config;
  chain_.clear();
  pending_.clear();

  auto openResult = store_.open(config_.dbPath);
  if (!openResult) {
    return storageError(openResult.error());
  }

  auto loadResult = store_.loadChain();
  if (!loadResult) {
    store_.close();
    return storageError(loadResult.error());
  }

  if (loadResult.value().empty()) {
    auto genesisResult = createGenesis();
    if (!genesisResult) {
      store_.close();
      return genesisResult;
    }
  } else {
    chain_ = std::move(loadResult.value());
    log().info << "Loaded " << chain_.size() << " blocks from "
               << config_.dbPath;
    if (!validateBlocks(chain_)) {
      log().warning << "Stored chain fails hash validation";
    }
  }

  mounted_ = true;
  return {};
}

void Ledger::unmount() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!mounted_) {
    return;
  }
  store_.close();
  chain_.clear();
  pending_.clear();
  mounted_ = false;
  log().info << "Ledger unmounted";
}

bool Ledger::isMounted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mounted_;
}

Ledger::Roe<void> Ledger::checkMounted() const {
  if (!mounted_) {
    return Error(E_NOT_MOUNTED, "Ledger is not mounted");
  }
  return {};
}

Ledger::Roe<void> Ledger::createGenesis() {
  Block genesis = Block::makeGenesis(config_.nodeId, utl::currentTimeSeconds());
  auto result = store_.appendBlock(genesis, config_.nodeId);
  if (!result) {
    return storageError(result.error());
  }
  chain_.push_back(genesis);
  log().info << "Created genesis block " << genesis.hash;
  return {};
}

Ledger::Roe<Ledger::SubmitResult>
Ledger::addCreation(const CreationRequest &request) {
  Transaction tx;
  tx.kind = Transaction::Kind::CREATION;
  tx.itemId = request.itemId;
  tx.description = request.description;
  tx.actor = request.actor;
  tx.location = request.location;
  tx.itemType = request.itemType;
  tx.timestamp = utl::formatIsoTimestamp();
  tx.contentHash = request.contentHash.empty()
                       ? deriveContentHash(request.itemId, request.description,
                                           tx.timestamp)
                       : request.contentHash;
  tx.node = config_.nodeId;
  return submitTransaction(tx);
}

Ledger::Roe<Ledger::SubmitResult>
Ledger::addTransfer(const TransferRequest &request) {
  Transaction tx;
  tx.kind = Transaction::Kind::TRANSFER;
  tx.itemId = request.itemId;
  tx.fromActor = request.fromActor;
  tx.toActor = request.toActor;
  tx.reason = request.reason;
  tx.timestamp = utl::formatIsoTimestamp();
  tx.node = config_.nodeId;
  return submitTransaction(tx);
}

Ledger::Roe<Ledger::SubmitResult>
Ledger::submitTransaction(const Transaction &tx) {
  auto validation = tx.validate();
  if (!validation) {
    return Error(E_INVALID_INPUT, validation.error().message);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto mountedResult = checkMounted();
  if (!mountedResult) {
    return mountedResult.error();
  }

  pending_.push_back(tx);
  const Block &latest = chain_.back();
  Block block = Block::seal(chain_.size(), utl::currentTimeSeconds(), pending_,
                            latest.hash);

  auto storeResult = store_.appendBlock(block, config_.nodeId);
  if (!storeResult) {
    pending_.clear();
    log().error << "Failed to persist block " << block.index << ": "
                << storeResult.error().message;
    return storageError(storeResult.error());
  }

  chain_.push_back(block);
  pending_.clear();

  log().info << "Sealed block " << block.index << " with " << tx.action()
             << " of " << tx.itemId << " from node " << tx.node;

  SubmitResult result;
  result.block = block;
  result.transaction = tx;
  return result;
}

bool Ledger::validateBlocks(const std::vector<Block> &blocks) {
  for (size_t i = 1; i < blocks.size(); ++i) {
    const Block &current = blocks[i];
    const Block &previous = blocks[i - 1];
    if (current.hash != current.calculateHash()) {
      return false;
    }
    if (current.previousHash != previous.hash) {
      return false;
    }
  }
  return true;
}

bool Ledger::validateChain() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return validateBlocks(chain_);
}

Ledger::Roe<void> Ledger::replaceChain(const std::vector<Block> &blocks) {
  if (blocks.empty()) {
    return Error(E_EMPTY_CHAIN, "Refusing to replace chain with an empty one");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  return replaceChainLocked(blocks);
}

Ledger::Roe<void>
Ledger::replaceChainIfLonger(const std::vector<Block> &blocks) {
  if (blocks.empty()) {
    return Error(E_EMPTY_CHAIN, "Refusing to replace chain with an empty one");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (chain_.size() >= blocks.size()) {
    return Error(E_STALE, "Local chain grew to " +
                              std::to_string(chain_.size()) +
                              " blocks, candidate has " +
                              std::to_string(blocks.size()));
  }
  return replaceChainLocked(blocks);
}

Ledger::Roe<void>
Ledger::replaceChainLocked(const std::vector<Block> &blocks) {
  auto mountedResult = checkMounted();
  if (!mountedResult) {
    return mountedResult;
  }

  auto storeResult = store_.replaceChain(blocks, config_.nodeId);
  if (!storeResult) {
    log().error << "Chain replacement failed: " << storeResult.error().message;
    return storageError(storeResult.error());
  }

  size_t oldLength = chain_.size();
  chain_ = blocks;
  pending_.clear();
  log().info << "Replaced chain: " << oldLength << " -> " << chain_.size()
             << " blocks";
  return {};
}

std::vector<Block> Ledger::getChain() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_;
}

size_t Ledger::getChainLength() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_.size();
}

Ledger::Roe<Block> Ledger::getLatestBlock() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (chain_.empty()) {
    return Error(E_NOT_MOUNTED, "Chain is empty");
  }
  return chain_.back();
}

size_t Ledger::getPendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

Ledger::Roe<std::optional<ItemRecord>>
Ledger::getItem(const std::string &itemId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = store_.queryItem(itemId);
  if (!result) {
    return storageError(result.error());
  }
  return result.value();
}

Ledger::Roe<std::vector<HistoryEntry>>
Ledger::getItemHistory(const std::string &itemId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = store_.queryItemHistory(itemId);
  if (!result) {
    return storageError(result.error());
  }
  return result.value();
}

Ledger::Roe<std::vector<ItemRecord>> Ledger::getAllItems() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = store_.queryAllItems();
  if (!result) {
    return storageError(result.error());
  }
  return result.value();
}

Ledger::Roe<std::vector<TransferRecord>>
Ledger::getTransfers(const std::string &itemId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = store_.queryTransfers(itemId);
  if (!result) {
    return storageError(result.error());
  }
  return result.value();
}

Ledger::Roe<BlockStore::Stats> Ledger::getStats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = store_.getStats();
  if (!result) {
    return storageError(result.error());
  }
  return result.value();
}

Ledger::Roe<Projection> Ledger::scanProjection() const {
  auto result = Projection::fromChain(chain_);
  if (!result) {
    return Error(E_DECODE, result.error().message);
  }
  return result.value();
}

Ledger::Roe<std::vector<ItemRecord>> Ledger::scanItems() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto projection = scanProjection();
  if (!projection) {
    return projection.error();
  }
  return projection.value().getItems();
}

Ledger::Roe<std::vector<HistoryEntry>>
Ledger::scanItemHistory(const std::string &itemId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<HistoryEntry> history;
  for (const auto &block : chain_) {
    auto result = Projection::collectHistory(block, itemId, history);
    if (!result) {
      return Error(E_DECODE, result.error().message);
    }
  }
  return history;
}

Ledger::Roe<std::vector<TransferRecord>>
Ledger::scanTransfers(const std::string &itemId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto projection = scanProjection();
  if (!projection) {
    return projection.error();
  }
  return projection.value().getTransfers(itemId);
}

} // namespace cl

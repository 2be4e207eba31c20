#include "Block.h"

#include <iomanip>
#include <openssl/evp.h>
#include <sstream>
#include <stdexcept>

namespace cl {

// SHA-256 through the OpenSSL 3 EVP API, lowercase hex
static std::string digestSha256(const std::string &input) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hashLen = 0;

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  if (EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  if (EVP_DigestFinal_ex(mdctx, hash, &hashLen) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hashLen; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string Block::calculateHash() const {
  // nlohmann::json objects are std::map backed, so dump() is key-sorted
  nlohmann::json j;
  j["index"] = index;
  j["timestamp"] = timestamp;
  j["payload"] = payload;
  j["previous_hash"] = previousHash;
  j["nonce"] = nonce;
  return digestSha256(j.dump());
}

bool Block::isGenesis() const {
  if (!payload.is_object()) {
    return false;
  }
  auto it = payload.find("type");
  return it != payload.end() && it->is_string() &&
         it->get<std::string>() == GENESIS_TYPE;
}

Roe<std::vector<Transaction>> Block::getTransactions() const {
  std::vector<Transaction> txes;
  if (isGenesis()) {
    return txes;
  }
  if (!payload.is_array()) {
    return Error(E_PAYLOAD, "Block " + std::to_string(index) +
                                " payload is not a transaction list");
  }
  for (const auto &item : payload) {
    auto txResult = Transaction::fromJson(item);
    if (!txResult) {
      return Error(E_PAYLOAD, "Block " + std::to_string(index) + ": " +
                                  txResult.error().message);
    }
    txes.push_back(txResult.value());
  }
  return txes;
}

nlohmann::json Block::toJson() const {
  nlohmann::json j;
  j["index"] = index;
  j["timestamp"] = timestamp;
  j["payload"] = payload;
  j["previous_hash"] = previousHash;
  j["nonce"] = nonce;
  j["hash"] = hash;
  return j;
}

Roe<Block> Block::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return Error(E_FORMAT, "Block must be a JSON object");
  }
  for (const char *key :
       {"index", "timestamp", "payload", "previous_hash", "nonce", "hash"}) {
    if (!j.contains(key)) {
      return Error(E_FORMAT, std::string("Block missing field: ") + key);
    }
  }
  if (!j["index"].is_number_unsigned() || !j["timestamp"].is_number() ||
      !j["previous_hash"].is_string() || !j["nonce"].is_number_unsigned() ||
      !j["hash"].is_string()) {
    return Error(E_FORMAT, "Block field has the wrong type");
  }

  Block block;
  block.index = j["index"].get<uint64_t>();
  block.timestamp = j["timestamp"].get<double>();
  block.payload = j["payload"];
  block.previousHash = j["previous_hash"].get<std::string>();
  block.nonce = j["nonce"].get<uint64_t>();
  block.hash = j["hash"].get<std::string>();
  return block;
}

Block Block::makeGenesis(const std::string &nodeId, double timestamp) {
  Block block;
  block.index = 0;
  block.timestamp = timestamp;
  block.payload = {{"type", GENESIS_TYPE},
                   {"message", GENESIS_MESSAGE},
                   {"node", nodeId}};
  block.previousHash = GENESIS_PREVIOUS_HASH;
  block.nonce = 0;
  block.hash = block.calculateHash();
  return block;
}

Block Block::seal(uint64_t index, double timestamp,
                  const std::vector<Transaction> &txes,
                  const std::string &previousHash) {
  Block block;
  block.index = index;
  block.timestamp = timestamp;
  block.payload = nlohmann::json::array();
  for (const auto &tx : txes) {
    block.payload.push_back(tx.toJson());
  }
  block.previousHash = previousHash;
  block.nonce = 0;
  block.hash = block.calculateHash();
  return block;
}

} // namespace cl

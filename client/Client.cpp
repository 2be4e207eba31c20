#include "Client.h"
#include "../lib/Utilities.h"

#include <httplib.h>

namespace cl {

namespace {

void applyTimeout(httplib::Client &cli, std::chrono::milliseconds timeout) {
  cli.set_connection_timeout(timeout);
  cli.set_read_timeout(timeout);
  cli.set_write_timeout(timeout);
}

} // namespace

Client::Client() : Module("cl.Client") {}

Client::Roe<void> Client::setBaseUrl(const std::string &baseUrl) {
  std::string url = utl::normalizePeerUrl(baseUrl);
  const std::string scheme = "http://";
  if (url.compare(0, scheme.size(), scheme) != 0 || url.size() == scheme.size()) {
    return Error(E_INVALID_URL, "Invalid node URL: " + baseUrl);
  }
  baseUrl_ = url;
  return {};
}

Client::Roe<nlohmann::json> Client::decodeResponse(const std::string &method,
                                                   const std::string &path,
                                                   int status,
                                                   const std::string &text) const {
  bool ok = status >= 200 && status < 300;
  nlohmann::json body = nlohmann::json::parse(text, nullptr, false);
  if (!ok) {
    // Error bodies may be empty or plain text
    std::string message = !body.is_discarded() && body.is_object() &&
                                   body.contains("error")
                               ? body["error"].dump()
                               : text;
    return Error(E_SERVER_ERROR, method + " " + path + " returned " +
                                     std::to_string(status) + ": " + message);
  }
  if (body.is_discarded()) {
    return Error(E_PARSE_ERROR, "Invalid JSON from " + baseUrl_ + path);
  }
  return body;
}

Client::Roe<nlohmann::json> Client::get(const std::string &path) {
  if (baseUrl_.empty()) {
    return Error(E_NOT_CONNECTED, "No node URL set");
  }

  httplib::Client cli(baseUrl_);
  applyTimeout(cli, timeout_);
  auto res = cli.Get(path);
  if (!res) {
    return Error(E_REQUEST_FAILED, "GET " + baseUrl_ + path + " failed: " +
                                       httplib::to_string(res.error()));
  }

  return decodeResponse("GET", path, res->status, res->body);
}

Client::Roe<nlohmann::json> Client::post(const std::string &path,
                                         const nlohmann::json &request) {
  if (baseUrl_.empty()) {
    return Error(E_NOT_CONNECTED, "No node URL set");
  }

  httplib::Client cli(baseUrl_);
  applyTimeout(cli, timeout_);
  auto res = cli.Post(path, request.dump(), "application/json");
  if (!res) {
    return Error(E_REQUEST_FAILED, "POST " + baseUrl_ + path + " failed: " +
                                       httplib::to_string(res.error()));
  }

  return decodeResponse("POST", path, res->status, res->body);
}

Client::Roe<std::vector<Block>>
Client::parseBlocks(const nlohmann::json &array) {
  if (!array.is_array()) {
    return Error(E_INVALID_RESPONSE, "Expected a list of blocks");
  }
  std::vector<Block> blocks;
  blocks.reserve(array.size());
  for (const auto &item : array) {
    auto blockResult = Block::fromJson(item);
    if (!blockResult) {
      return Error(E_INVALID_RESPONSE, blockResult.error().message);
    }
    blocks.push_back(std::move(blockResult.value()));
  }
  return blocks;
}

Client::Roe<Client::PingInfo> Client::ping() {
  auto result = get("/ping");
  if (!result) {
    return result.error();
  }
  const auto &body = result.value();
  if (!body.is_object() || !body.contains("status")) {
    return Error(E_INVALID_RESPONSE, "Malformed ping response");
  }
  PingInfo info;
  info.status = body.value("status", "");
  info.nodeId = body.value("node_id", "");
  return info;
}

Client::Roe<std::vector<Block>> Client::fetchChain() {
  auto result = get("/chain");
  if (!result) {
    return result.error();
  }
  const auto &body = result.value();
  if (!body.is_object() || !body.contains("chain")) {
    return Error(E_INVALID_RESPONSE, "Malformed chain response");
  }
  return parseBlocks(body["chain"]);
}

Client::Roe<std::vector<Block>> Client::fetchBlocks() {
  auto result = get("/blocks");
  if (!result) {
    return result.error();
  }
  const auto &body = result.value();
  if (!body.is_object() || !body.contains("blocks")) {
    return Error(E_INVALID_RESPONSE, "Malformed blocks response");
  }
  return parseBlocks(body["blocks"]);
}

Client::Roe<std::vector<std::string>> Client::fetchPeers() {
  auto result = get("/peers");
  if (!result) {
    return result.error();
  }
  const auto &body = result.value();
  if (!body.is_object() || !body.contains("peers") || !body["peers"].is_array()) {
    return Error(E_INVALID_RESPONSE, "Malformed peers response");
  }
  try {
    return body["peers"].get<std::vector<std::string>>();
  } catch (const nlohmann::json::exception &e) {
    return Error(E_INVALID_RESPONSE, std::string("Bad peer list: ") + e.what());
  }
}

Client::Roe<nlohmann::json> Client::fetchInfo() { return get("/info"); }

Client::Roe<bool> Client::fetchValidation() {
  auto result = get("/validate");
  if (!result) {
    return result.error();
  }
  const auto &body = result.value();
  if (!body.is_object() || !body.contains("valid") || !body["valid"].is_boolean()) {
    return Error(E_INVALID_RESPONSE, "Malformed validate response");
  }
  return body["valid"].get<bool>();
}

Client::Roe<std::vector<HistoryEntry>>
Client::fetchItemHistory(const std::string &itemId) {
  auto result = get("/items/" + httplib::detail::encode_url(itemId));
  if (!result) {
    return result.error();
  }
  const auto &body = result.value();
  if (!body.is_object() || !body.contains("history") ||
      !body["history"].is_array()) {
    return Error(E_INVALID_RESPONSE, "Malformed history response");
  }

  std::vector<HistoryEntry> history;
  try {
    for (const auto &item : body["history"]) {
      HistoryEntry entry;
      entry.blockIndex = item.at("block_index").get<uint64_t>();
      entry.timestamp = item.at("timestamp").get<std::string>();
      entry.action = item.at("action").get<std::string>();
      entry.actor = item.at("actor").get<std::string>();
      entry.details = item.value("details", nlohmann::json::object());
      history.push_back(entry);
    }
  } catch (const nlohmann::json::exception &e) {
    return Error(E_INVALID_RESPONSE, std::string("Bad history entry: ") + e.what());
  }
  return history;
}

Client::Roe<nlohmann::json>
Client::submitCreation(const Ledger::CreationRequest &request) {
  nlohmann::json body = {{"item_id", request.itemId},
                         {"description", request.description},
                         {"actor", request.actor},
                         {"location", request.location},
                         {"item_type", request.itemType}};
  if (!request.contentHash.empty()) {
    body["content_hash"] = request.contentHash;
  }
  return post("/items", body);
}

Client::Roe<nlohmann::json>
Client::submitTransfer(const Ledger::TransferRequest &request) {
  return post("/transfer", {{"item_id", request.itemId},
                            {"from_actor", request.fromActor},
                            {"to_actor", request.toActor},
                            {"reason", request.reason}});
}

Client::Roe<void> Client::sendTransaction(const Transaction &tx) {
  auto result = post("/transaction/receive", {{"transaction", tx.toJson()}});
  if (!result) {
    return result.error();
  }
  return {};
}

Client::Roe<std::vector<std::string>>
Client::registerPeer(const std::string &peerUrl) {
  auto result = post("/peers/add", {{"peer_url", peerUrl}});
  if (!result) {
    return result.error();
  }
  const auto &body = result.value();
  if (!body.is_object() || !body.contains("peers") || !body["peers"].is_array()) {
    return Error(E_INVALID_RESPONSE, "Malformed peer registration response");
  }
  try {
    return body["peers"].get<std::vector<std::string>>();
  } catch (const nlohmann::json::exception &e) {
    return Error(E_INVALID_RESPONSE, std::string("Bad peer list: ") + e.what());
  }
}

Client::Roe<nlohmann::json> Client::requestSync() {
  return post("/sync", nlohmann::json::object());
}

} // namespace cl

#include "NodeServer.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"

#include <httplib.h>

#include <filesystem>
#include <thread>

namespace cl {

using json = nlohmann::json;

namespace {

void setJson(httplib::Response &res, const json &body) {
  res.set_content(body.dump(), "application/json");
}

void setJsonError(httplib::Response &res, int status,
                  const std::string &message) {
  res.status = status;
  res.set_content(json{{"error", message}}.dump(), "application/json");
}

// Malformed input is the caller's fault, anything else is ours
int statusFor(const Ledger::Error &error) {
  switch (error.code) {
  case Ledger::E_INVALID_INPUT:
  case Ledger::E_DECODE:
    return 400;
  default:
    return 500;
  }
}

bool readPeerUrl(const httplib::Request &req, httplib::Response &res,
                 std::string &peerUrl) {
  auto body = utl::parseJsonObject(req.body);
  if (!body) {
    setJsonError(res, 400, body.error().message);
    return false;
  }
  const json &jd = body.value();
  if (!jd.contains("peer_url") || !jd["peer_url"].is_string()) {
    setJsonError(res, 400, "Missing or invalid field: peer_url");
    return false;
  }
  peerUrl = jd["peer_url"].get<std::string>();
  return true;
}

} // namespace

// ============ Config methods ============

json NodeServer::Config::ltsToJson() const {
  json j;
  j["nodeId"] = nodeId;
  j["host"] = host;
  j["port"] = port;
  j["advertiseUrl"] = advertiseUrl;
  j["peers"] = peers;
  j["syncIntervalSec"] = syncIntervalSec;
  j["peerTimeoutMs"] = peerTimeoutMs;
  j["adoptionPolicy"] = adoptionPolicy;
  j["logLevel"] = logLevel;
  return j;
}

NodeServer::Roe<void> NodeServer::Config::ltsFromJson(const json &jd) {
  try {
    if (!jd.is_object()) {
      return Error(E_CONFIG, "Configuration must be a JSON object");
    }

    if (jd.contains("nodeId")) {
      if (!jd["nodeId"].is_string()) {
        return Error(E_CONFIG, "Field 'nodeId' must be a string");
      }
      nodeId = jd["nodeId"].get<std::string>();
    }
    if (nodeId.empty()) {
      return Error(E_CONFIG, "Field 'nodeId' cannot be empty");
    }

    if (jd.contains("host")) {
      if (!jd["host"].is_string()) {
        return Error(E_CONFIG, "Field 'host' must be a string");
      }
      host = jd["host"].get<std::string>();
      if (host.empty()) {
        return Error(E_CONFIG, "Field 'host' cannot be empty");
      }
    }

    if (jd.contains("port")) {
      if (!jd["port"].is_number_unsigned()) {
        return Error(E_CONFIG, "Field 'port' must be a positive number");
      }
      uint64_t portValue = jd["port"].get<uint64_t>();
      if (portValue > 65535) {
        return Error(E_CONFIG, "Field 'port' must be between 0 and 65535");
      }
      port = static_cast<uint16_t>(portValue);
    }

    if (jd.contains("advertiseUrl")) {
      if (!jd["advertiseUrl"].is_string()) {
        return Error(E_CONFIG, "Field 'advertiseUrl' must be a string");
      }
      advertiseUrl = utl::normalizePeerUrl(jd["advertiseUrl"].get<std::string>());
    }

    if (jd.contains("peers")) {
      if (!jd["peers"].is_array()) {
        return Error(E_CONFIG, "Field 'peers' must be an array");
      }
      peers.clear();
      for (const auto &peer : jd["peers"]) {
        if (!peer.is_string()) {
          return Error(E_CONFIG, "Field 'peers' must contain only strings");
        }
        peers.push_back(utl::normalizePeerUrl(peer.get<std::string>()));
      }
    }

    if (jd.contains("syncIntervalSec")) {
      if (!jd["syncIntervalSec"].is_number_unsigned()) {
        return Error(E_CONFIG, "Field 'syncIntervalSec' must be a non-negative number");
      }
      syncIntervalSec = jd["syncIntervalSec"].get<uint64_t>();
    }

    if (jd.contains("peerTimeoutMs")) {
      if (!jd["peerTimeoutMs"].is_number_unsigned() ||
          jd["peerTimeoutMs"].get<uint64_t>() == 0) {
        return Error(E_CONFIG, "Field 'peerTimeoutMs' must be a positive number");
      }
      peerTimeoutMs = jd["peerTimeoutMs"].get<uint64_t>();
    }

    if (jd.contains("adoptionPolicy")) {
      if (!jd["adoptionPolicy"].is_string()) {
        return Error(E_CONFIG, "Field 'adoptionPolicy' must be a string");
      }
      adoptionPolicy = jd["adoptionPolicy"].get<std::string>();
    }
    Replicator::AdoptionPolicy policy;
    if (!Replicator::parsePolicy(adoptionPolicy, policy)) {
      return Error(E_CONFIG, "Field 'adoptionPolicy' must be 'trust' or 'validate'");
    }

    if (jd.contains("logLevel")) {
      if (!jd["logLevel"].is_string()) {
        return Error(E_CONFIG, "Field 'logLevel' must be a string");
      }
      logLevel = jd["logLevel"].get<std::string>();
    }
    logging::Level level;
    if (!logging::parseLevel(logLevel, level)) {
      return Error(E_CONFIG, "Unknown log level: " + logLevel);
    }

    return {};
  } catch (const std::exception &e) {
    return Error(E_CONFIG,
                 "Failed to parse node configuration: " + std::string(e.what()));
  }
}

NodeServer::Roe<NodeServer::Config>
NodeServer::loadConfigFile(const std::string &workDir) {
  std::filesystem::path configPath = std::filesystem::path(workDir) / FILE_CONFIG;
  std::string configPathStr = configPath.string();

  Config config;
  config.workDir = workDir;

  std::error_code ec;
  if (!std::filesystem::exists(configPath, ec)) {
    auto writeResult = utl::writeJsonFile(configPathStr, config.ltsToJson());
    if (!writeResult) {
      return Error(E_CONFIG, "Failed to create " + configPathStr + ": " +
                                 writeResult.error().message);
    }
    logging::getLogger("cl.NodeServer").info
        << "No " << FILE_CONFIG << " found, created " << configPathStr
        << " with default values";
    return config;
  }

  auto jsonResult = utl::loadJsonFile(configPathStr);
  if (!jsonResult) {
    return Error(E_CONFIG,
                 "Failed to load config file: " + jsonResult.error().message);
  }
  auto parseResult = config.ltsFromJson(jsonResult.value());
  if (!parseResult) {
    return Error(E_CONFIG,
                 "Failed to parse config file: " + parseResult.error().message);
  }
  return config;
}

// ============ NodeServer ============

NodeServer::NodeServer()
    : Service("cl.NodeServer"), replicator_(ledger_, peers_) {
  ledger_.redirectLogger(log().getFullName() + ".Ledger");
  peers_.redirectLogger(log().getFullName() + ".Peers");
  replicator_.redirectLogger(log().getFullName() + ".Replicator");
}

NodeServer::~NodeServer() { stop(); }

std::string NodeServer::resolveDbPath() const {
  if (!config_.dbPath.empty()) {
    return config_.dbPath;
  }
  return (std::filesystem::path(config_.workDir) /
          ("chainledger_" + config_.nodeId + ".db"))
      .string();
}

Service::Roe<void> NodeServer::onStart() {
  Replicator::Config replicatorConfig;
  if (!Replicator::parsePolicy(config_.adoptionPolicy, replicatorConfig.policy)) {
    return Service::Error(E_CONFIG,
                          "Unknown adoption policy: " + config_.adoptionPolicy);
  }
  replicatorConfig.syncInterval = std::chrono::seconds(config_.syncIntervalSec);
  replicatorConfig.peerTimeout = std::chrono::milliseconds(config_.peerTimeoutMs);
  replicator_.setConfig(replicatorConfig);

  std::error_code ec;
  std::filesystem::create_directories(config_.workDir, ec);
  if (ec) {
    return Service::Error(E_CONFIG, "Failed to create work directory " +
                                        config_.workDir + ": " + ec.message());
  }

  Ledger::Config ledgerConfig;
  ledgerConfig.nodeId = config_.nodeId;
  ledgerConfig.dbPath = resolveDbPath();
  auto mountResult = ledger_.mount(ledgerConfig);
  if (!mountResult) {
    return Service::Error(E_LEDGER, "Failed to mount ledger: " +
                                        mountResult.error().message);
  }

  svr_ = std::make_unique<httplib::Server>();
  setupRoutes();

  if (config_.port == 0) {
    int bound = svr_->bind_to_any_port(config_.host);
    if (bound <= 0) {
      ledger_.unmount();
      return Service::Error(E_BIND, "Failed to bind " + config_.host);
    }
    port_ = static_cast<uint16_t>(bound);
  } else {
    if (!svr_->bind_to_port(config_.host, config_.port)) {
      ledger_.unmount();
      return Service::Error(E_BIND, "Failed to bind " + config_.host + ":" +
                                        std::to_string(config_.port));
    }
    port_ = config_.port;
  }

  if (!config_.advertiseUrl.empty()) {
    url_ = utl::normalizePeerUrl(config_.advertiseUrl);
  } else {
    std::string host = config_.host == "0.0.0.0" ? "127.0.0.1" : config_.host;
    url_ = "http://" + host + ":" + std::to_string(port_);
  }
  peers_.setSelfUrl(url_);

  auto replicatorResult = replicator_.start();
  if (!replicatorResult) {
    ledger_.unmount();
    return Service::Error(E_REPLICATOR, "Failed to start replicator: " +
                                            replicatorResult.error().message);
  }

  for (const auto &peer : config_.peers) {
    replicator_.connectPeer(peer);
  }

  log().info << "Node " << config_.nodeId << " listening on " << config_.host
             << ":" << port_ << " as " << url_;
  log().info << "Chain length " << ledger_.getChainLength() << ", database "
             << ledgerConfig.dbPath;
  return {};
}

void NodeServer::runLoop() {
  if (!svr_->listen_after_bind()) {
    if (!isStopSet()) {
      log().error << "HTTP server stopped unexpectedly";
    }
  }
}

void NodeServer::onStopping() {
  if (!svr_) {
    return;
  }
  // listen_after_bind() may not have entered its accept loop yet
  for (int i = 0; i < 100 && !svr_->is_running(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  svr_->stop();
}

void NodeServer::onStop() {
  replicator_.stop();
  ledger_.unmount();
  svr_.reset();
}

void NodeServer::setupRoutes() {
  httplib::Server &svr = *svr_;

  auto httpLog = logging::getLogger(log().getFullName() + ".Http");
  svr.set_logger([httpLog](const httplib::Request &req,
                           const httplib::Response &res) mutable {
    httpLog.debug << req.method << " " << req.path << " " << res.status << " ("
                  << (req.remote_addr.empty() ? "-" : req.remote_addr) << ")";
  });
  svr.set_error_logger([httpLog](const httplib::Error &err,
                                 const httplib::Request *req) mutable {
    std::string path = req ? req->path : "-";
    httpLog.error << "HTTP error " << httplib::to_string(err) << " path=" << path;
  });

  // GET /ping
  svr.Get("/ping", [this](const httplib::Request &, httplib::Response &res) {
    setJson(res, {{"status", "online"}, {"node_id", config_.nodeId}});
  });

  // GET /chain
  svr.Get("/chain", [this](const httplib::Request &, httplib::Response &res) {
    json chain = json::array();
    for (const auto &block : ledger_.getChain()) {
      chain.push_back(block.toJson());
    }
    setJson(res, {{"length", chain.size()}, {"chain", chain}});
  });

  // GET /blocks
  svr.Get("/blocks", [this](const httplib::Request &, httplib::Response &res) {
    json blocks = json::array();
    for (const auto &block : ledger_.getChain()) {
      blocks.push_back(block.toJson());
    }
    setJson(res, {{"blocks", blocks}, {"count", blocks.size()}});
  });

  // POST /items
  svr.Post("/items", [this](const httplib::Request &req, httplib::Response &res) {
    auto body = utl::parseJsonObject(req.body);
    if (!body) {
      setJsonError(res, 400, body.error().message);
      return;
    }
    auto request = Ledger::CreationRequest::fromJson(body.value());
    if (!request) {
      setJsonError(res, 400, request.error().message);
      return;
    }
    auto result = ledger_.addCreation(request.value());
    if (!result) {
      setJsonError(res, statusFor(result.error()), result.error().message);
      return;
    }
    replicator_.broadcast(result.value().transaction);
    setJson(res, result.value().toJson());
  });

  // POST /transfer
  svr.Post("/transfer", [this](const httplib::Request &req, httplib::Response &res) {
    auto body = utl::parseJsonObject(req.body);
    if (!body) {
      setJsonError(res, 400, body.error().message);
      return;
    }
    auto request = Ledger::TransferRequest::fromJson(body.value());
    if (!request) {
      setJsonError(res, 400, request.error().message);
      return;
    }
    auto result = ledger_.addTransfer(request.value());
    if (!result) {
      setJsonError(res, statusFor(result.error()), result.error().message);
      return;
    }
    replicator_.broadcast(result.value().transaction);
    setJson(res, result.value().toJson());
  });

  // POST /transaction/receive
  svr.Post("/transaction/receive",
           [this](const httplib::Request &req, httplib::Response &res) {
    auto body = utl::parseJsonObject(req.body);
    if (!body) {
      setJsonError(res, 400, body.error().message);
      return;
    }
    if (!body.value().contains("transaction")) {
      setJsonError(res, 400, "Missing or invalid field: transaction");
      return;
    }
    auto tx = Transaction::fromJson(body.value()["transaction"]);
    if (!tx) {
      setJsonError(res, 400, tx.error().message);
      return;
    }
    auto result = replicator_.receive(tx.value());
    if (!result) {
      setJsonError(res, statusFor(result.error()), result.error().message);
      return;
    }
    setJson(res, {{"status", "Transaction received"}});
  });

  // GET /peers
  svr.Get("/peers", [this](const httplib::Request &, httplib::Response &res) {
    auto peers = peers_.list();
    setJson(res, {{"peers", peers}, {"count", peers.size()}});
  });

  // POST /peers/add
  svr.Post("/peers/add", [this](const httplib::Request &req, httplib::Response &res) {
    std::string peerUrl;
    if (!readPeerUrl(req, res, peerUrl)) {
      return;
    }
    auto result = peers_.add(peerUrl);
    if (!result) {
      setJsonError(res, 400, result.error().message);
      return;
    }
    setJson(res, {{"peers", peers_.list()}});
  });

  // POST /peers/connect
  svr.Post("/peers/connect",
           [this](const httplib::Request &req, httplib::Response &res) {
    std::string peerUrl;
    if (!readPeerUrl(req, res, peerUrl)) {
      return;
    }
    std::string normalized = utl::normalizePeerUrl(peerUrl);
    if (!PeerRegistry::isValidUrl(normalized)) {
      setJsonError(res, 400, "Invalid peer URL: " + peerUrl);
      return;
    }

    json response;
    if (peers_.contains(normalized)) {
      response["success"] = true;
      response["message"] = "Peer already connected";
    } else {
      auto result = peers_.connect(
          normalized, std::chrono::milliseconds(config_.peerTimeoutMs));
      response["success"] = result.isOk();
      response["message"] = result ? "Connected to " + normalized
                                   : "Error connecting: " + result.error().message;
    }
    response["peers"] = peers_.list();
    setJson(res, response);
  });

  // POST /sync
  svr.Post("/sync", [this](const httplib::Request &, httplib::Response &res) {
    auto result = replicator_.requestReconcile();
    if (!result) {
      setJsonError(res, 500, result.error().message);
      return;
    }
    setJson(res, result.value().toJson());
  });

  // GET /items
  svr.Get("/items", [this](const httplib::Request &, httplib::Response &res) {
    auto items = ledger_.getAllItems();
    if (!items) {
      setJsonError(res, 500, items.error().message);
      return;
    }
    json list = json::array();
    for (const auto &item : items.value()) {
      list.push_back(item.toJson());
    }
    setJson(res, {{"items", list}, {"count", list.size()}});
  });

  // GET /items/<id>/transfers
  svr.Get(R"(/items/([^/]+)/transfers)",
          [this](const httplib::Request &req, httplib::Response &res) {
    std::string itemId = req.matches[1];
    auto item = ledger_.getItem(itemId);
    auto transfers = ledger_.getTransfers(itemId);
    if (!item || !transfers) {
      setJsonError(res, 500, !item ? item.error().message
                                   : transfers.error().message);
      return;
    }
    if (!item.value() && transfers.value().empty()) {
      setJsonError(res, 404, "Unknown item: " + itemId);
      return;
    }
    json list = json::array();
    for (const auto &transfer : transfers.value()) {
      list.push_back(transfer.toJson());
    }
    setJson(res, {{"item_id", itemId}, {"transfers", list}, {"count", list.size()}});
  });

  // GET /items/<id>
  svr.Get(R"(/items/([^/]+))",
          [this](const httplib::Request &req, httplib::Response &res) {
    std::string itemId = req.matches[1];
    auto history = ledger_.getItemHistory(itemId);
    if (!history) {
      setJsonError(res, 500, history.error().message);
      return;
    }
    json list = json::array();
    for (const auto &entry : history.value()) {
      list.push_back(entry.toJson());
    }
    setJson(res, {{"item_id", itemId}, {"history", list}});
  });

  // GET /validate
  svr.Get("/validate", [this](const httplib::Request &, httplib::Response &res) {
    setJson(res, {{"valid", ledger_.validateChain()},
                  {"chain_length", ledger_.getChainLength()}});
  });

  // GET /info
  svr.Get("/info", [this](const httplib::Request &, httplib::Response &res) {
    auto stats = ledger_.getStats();
    if (!stats) {
      setJsonError(res, 500, stats.error().message);
      return;
    }
    json info = stats.value().toJson();
    info["node_id"] = config_.nodeId;
    info["url"] = url_;
    info["chain_length"] = ledger_.getChainLength();
    info["peers"] = peers_.size();
    info["pending"] = ledger_.getPendingCount();
    info["adoption_policy"] = config_.adoptionPolicy;
    setJson(res, info);
  });
}

} // namespace cl

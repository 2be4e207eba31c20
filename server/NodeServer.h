#ifndef CHAIN_LEDGER_NODE_SERVER_H
#define CHAIN_LEDGER_NODE_SERVER_H

#include "PeerRegistry.h"
#include "Replicator.h"
#include "../ledger/Ledger.h"
#include "../lib/Service.h"

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace httplib {
class Server;
}

namespace cl {

/**
 * One chain-ledger node: the Ledger, its peers, the Replicator and the HTTP
 * API in front of them. The HTTP server runs on the service thread.
 */
class NodeServer : public Service {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const int32_t E_CONFIG = 1;
  static constexpr const int32_t E_LEDGER = 2;
  static constexpr const int32_t E_BIND = 3;
  static constexpr const int32_t E_REPLICATOR = 4;

  constexpr static const char *FILE_CONFIG = "config.json";
  constexpr static const char *FILE_LOG = "node.log";
  static constexpr const uint16_t DEFAULT_PORT = 5000;

  struct Config {
    std::string nodeId{ "node_a" };
    std::string host{ "127.0.0.1" };
    uint16_t port{ DEFAULT_PORT }; // 0 picks a free port
    std::string advertiseUrl;      // derived from host and port when empty
    std::vector<std::string> peers;
    uint64_t syncIntervalSec{ 10 };
    uint64_t peerTimeoutMs{ 5000 };
    std::string adoptionPolicy{ "trust" };
    std::string logLevel{ "info" };

    // Runtime only, not part of config.json
    std::string workDir{ "." };
    std::string dbPath; // defaults to <workDir>/chainledger_<nodeId>.db

    nlohmann::json ltsToJson() const;
    Roe<void> ltsFromJson(const nlohmann::json &jd);
  };

  /**
   * Read <workDir>/config.json, writing one with default values first if
   * it does not exist.
   */
  static Roe<Config> loadConfigFile(const std::string &workDir);

  NodeServer();
  ~NodeServer() override;

  void setConfig(const Config &config) { config_ = config; }
  const Config &getConfig() const { return config_; }

  // Valid while running
  uint16_t getPort() const { return port_; }
  std::string getUrl() const { return url_; }

  Ledger &getLedger() { return ledger_; }
  PeerRegistry &getPeers() { return peers_; }
  Replicator &getReplicator() { return replicator_; }

protected:
  Service::Roe<void> onStart() override;
  void runLoop() override;
  void onStopping() override;
  void onStop() override;

private:
  void setupRoutes();
  std::string resolveDbPath() const;

  Config config_;
  Ledger ledger_;
  PeerRegistry peers_;
  Replicator replicator_;
  std::unique_ptr<httplib::Server> svr_;
  uint16_t port_{ 0 };
  std::string url_;
};

} // namespace cl

#endif // CHAIN_LEDGER_NODE_SERVER_H

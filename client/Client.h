#ifndef CHAIN_LEDGER_CLIENT_H
#define CHAIN_LEDGER_CLIENT_H

#include "../ledger/Block.h"
#include "../ledger/Ledger.h"
#include "../ledger/Transaction.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.h"

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace cl {

/**
 * HTTP client for one chain-ledger node. Every call opens its own
 * connection, so one Client may be shared between threads once its base URL
 * is set.
 */
class Client : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const int32_t E_NOT_CONNECTED = 1;
  static constexpr const int32_t E_INVALID_RESPONSE = 2;
  static constexpr const int32_t E_SERVER_ERROR = 3;
  static constexpr const int32_t E_PARSE_ERROR = 4;
  static constexpr const int32_t E_REQUEST_FAILED = 5;
  static constexpr const int32_t E_INVALID_URL = 6;

  // Applies to both connect and read
  static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{ 5000 };

  struct PingInfo {
    std::string status;
    std::string nodeId;
  };

  Client();
  ~Client() override = default;

  /**
   * @param baseUrl "http://host:port", trailing slashes are ignored
   */
  Roe<void> setBaseUrl(const std::string &baseUrl);
  const std::string &getBaseUrl() const { return baseUrl_; }

  void setTimeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }
  std::chrono::milliseconds getTimeout() const { return timeout_; }

  Roe<PingInfo> ping();
  Roe<std::vector<Block>> fetchChain();
  Roe<std::vector<Block>> fetchBlocks();
  Roe<std::vector<std::string>> fetchPeers();
  Roe<nlohmann::json> fetchInfo();
  Roe<bool> fetchValidation();

  Roe<std::vector<HistoryEntry>> fetchItemHistory(const std::string &itemId);

  Roe<nlohmann::json> submitCreation(const Ledger::CreationRequest &request);
  Roe<nlohmann::json> submitTransfer(const Ledger::TransferRequest &request);

  // Hand a transaction sealed elsewhere to the node's receive endpoint
  Roe<void> sendTransaction(const Transaction &tx);

  /**
   * Ask the node to add `peerUrl` to its registry
   * @return The node's peer list after the call
   */
  Roe<std::vector<std::string>> registerPeer(const std::string &peerUrl);

  Roe<nlohmann::json> requestSync();

private:
  Roe<nlohmann::json> get(const std::string &path);
  Roe<nlohmann::json> post(const std::string &path, const nlohmann::json &body);
  Roe<nlohmann::json> decodeResponse(const std::string &method,
                                     const std::string &path, int status,
                                     const std::string &text) const;
  static Roe<std::vector<Block>> parseBlocks(const nlohmann::json &array);

  std::string baseUrl_;
  std::chrono::milliseconds timeout_{ DEFAULT_TIMEOUT };
};

} // namespace cl

#endif // CHAIN_LEDGER_CLIENT_H

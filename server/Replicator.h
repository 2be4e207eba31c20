#ifndef CHAIN_LEDGER_REPLICATOR_H
#define CHAIN_LEDGER_REPLICATOR_H

#include "PeerRegistry.h"
#include "../ledger/Block.h"
#include "../ledger/Ledger.h"
#include "../ledger/Transaction.h"
#include "../lib/Service.h"
#include "../lib/ThreadSafeQueue.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cl {

/**
 * Replicator - moves transactions and chains between this node and its
 * peers.
 *
 * Broadcasts, peer connects and reconciliation requests are queued and run
 * on the service thread; each outbound call to a peer runs in its own
 * std::async task with the configured timeout. Unreachable peers are logged
 * and skipped.
 */
class Replicator : public Service {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const int32_t E_LEDGER = 1;
  static constexpr const int32_t E_STOPPED = 2;
  static constexpr const int32_t E_POLICY = 3;

  enum class AdoptionPolicy {
    TRUST_LONGER,   // Any strictly longer chain replaces ours unchecked
    VALIDATE_FIRST, // Candidates must pass hash-chain validation
  };

  static bool parsePolicy(const std::string &name, AdoptionPolicy &policy);
  static const char *policyName(AdoptionPolicy policy);

  struct Config {
    std::chrono::seconds syncInterval{ 10 }; // 0 disables periodic sync
    AdoptionPolicy policy{ AdoptionPolicy::TRUST_LONGER };
    std::chrono::milliseconds peerTimeout{ 5000 };
  };

  struct Candidate {
    std::string source;
    std::vector<Block> blocks;
  };

  struct SyncResult {
    bool synced{ false };
    size_t newLength{ 0 };
    std::string source;
    std::string message;

    nlohmann::json toJson() const;
  };

  Replicator(Ledger &ledger, PeerRegistry &peers);
  ~Replicator() override;

  void setConfig(const Config &config);
  const Config &getConfig() const { return config_; }

  // Queue `tx` for delivery to every registered peer
  void broadcast(const Transaction &tx);

  // Queue a connect (ping + mutual registration) to `url`
  void connectPeer(const std::string &url);

  // Seal a transaction received from a peer into a new local block
  Ledger::Roe<Ledger::SubmitResult> receive(const Transaction &tx);

  /**
   * Run reconciliation on the service thread and wait for its result.
   * Runs inline when the service is not running.
   */
  Roe<SyncResult> requestReconcile();

  // Fetch every peer's chain and adopt the winner, in the caller's thread
  Roe<SyncResult> reconcile();

  /**
   * Pick the chain to adopt among `candidates`.
   * Only candidates strictly longer than `localLength` qualify; the longest
   * wins and the first one seen wins a tie. Under VALIDATE_FIRST a candidate
   * that fails validation is skipped for the next-longest valid one.
   * @return Index into `candidates`, or nullopt to keep the local chain
   */
  static std::optional<size_t>
  selectCandidate(size_t localLength, const std::vector<Candidate> &candidates,
                  AdoptionPolicy policy);

protected:
  void runLoop() override;
  void onStop() override;

private:
  struct Job {
    enum class Kind { BROADCAST, CONNECT, SYNC };

    Kind kind{ Kind::BROADCAST };
    Transaction tx;
    std::string url;
    std::shared_ptr<std::promise<Roe<SyncResult>>> spResult;
  };

  void processJob(Job &job);
  void deliver(const Transaction &tx);
  std::vector<Candidate> fetchCandidates(const std::vector<std::string> &peers);

  Ledger &ledger_;
  PeerRegistry &peers_;
  Config config_;
  ThreadSafeQueue<Job> jobs_;
  std::mutex syncMutex_;
  std::chrono::steady_clock::time_point lastSync_;
};

} // namespace cl

#endif // CHAIN_LEDGER_REPLICATOR_H

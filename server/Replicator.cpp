#include "Replicator.h"
#include "../client/Client.h"

#include <algorithm>

namespace cl {

namespace {

std::unique_ptr<Client> makePeerClient(const std::string &url,
                                       std::chrono::milliseconds timeout) {
  auto spClient = std::make_unique<Client>();
  if (!spClient->setBaseUrl(url)) {
    return nullptr;
  }
  spClient->setTimeout(timeout);
  return spClient;
}

} // namespace

bool Replicator::parsePolicy(const std::string &name, AdoptionPolicy &policy) {
  if (name == "trust") {
    policy = AdoptionPolicy::TRUST_LONGER;
    return true;
  }
  if (name == "validate") {
    policy = AdoptionPolicy::VALIDATE_FIRST;
    return true;
  }
  return false;
}

const char *Replicator::policyName(AdoptionPolicy policy) {
  switch (policy) {
  case AdoptionPolicy::TRUST_LONGER:
    return "trust";
  case AdoptionPolicy::VALIDATE_FIRST:
    return "validate";
  }
  return "unknown";
}

nlohmann::json Replicator::SyncResult::toJson() const {
  nlohmann::json j;
  j["message"] = message;
  j["synced"] = synced;
  if (synced) {
    j["new_length"] = newLength;
    j["source"] = source;
  }
  return j;
}

Replicator::Replicator(Ledger &ledger, PeerRegistry &peers)
    : Service("cl.Replicator"), ledger_(ledger), peers_(peers),
      lastSync_(std::chrono::steady_clock::now()) {}

Replicator::~Replicator() { stop(); }

void Replicator::setConfig(const Config &config) { config_ = config; }

void Replicator::broadcast(const Transaction &tx) {
  Job job;
  job.kind = Job::Kind::BROADCAST;
  job.tx = tx;
  jobs_.push(std::move(job));
}

void Replicator::connectPeer(const std::string &url) {
  Job job;
  job.kind = Job::Kind::CONNECT;
  job.url = url;
  jobs_.push(std::move(job));
}

Ledger::Roe<Ledger::SubmitResult> Replicator::receive(const Transaction &tx) {
  log().info << "Received " << tx.typeName() << " for " << tx.itemId
             << " from node " << tx.node;
  return ledger_.submitTransaction(tx);
}

Replicator::Roe<Replicator::SyncResult> Replicator::requestReconcile() {
  if (!isRunning() || isStopSet()) {
    return reconcile();
  }

  Job job;
  job.kind = Job::Kind::SYNC;
  job.spResult = std::make_shared<std::promise<Roe<SyncResult>>>();
  auto future = job.spResult->get_future();
  jobs_.push(std::move(job));

  while (future.wait_for(std::chrono::milliseconds(100)) !=
         std::future_status::ready) {
    if (!isRunning()) {
      return Error(E_STOPPED, "Replicator stopped before sync completed");
    }
  }
  return future.get();
}

Replicator::Roe<Replicator::SyncResult> Replicator::reconcile() {
  std::lock_guard<std::mutex> lock(syncMutex_);

  std::vector<std::string> peers = peers_.list();
  size_t localLength = ledger_.getChainLength();

  SyncResult result;
  result.newLength = localLength;
  result.message = "Chain is up to date";
  if (peers.empty()) {
    return result;
  }

  std::vector<Candidate> candidates = fetchCandidates(peers);
  auto selected = selectCandidate(localLength, candidates, config_.policy);
  if (!selected) {
    log().debug << "No longer chain among " << candidates.size()
                << " candidate(s), local length " << localLength;
    return result;
  }

  const Candidate &winner = candidates[*selected];
  // Local blocks sealed while peers were being fetched must not be dropped
  auto replaceResult = ledger_.replaceChainIfLonger(winner.blocks);
  if (!replaceResult && replaceResult.error().code == Ledger::E_STALE) {
    log().info << "Skipping chain from " << winner.source << ": "
               << replaceResult.error().message;
    result.newLength = ledger_.getChainLength();
    return result;
  }
  if (!replaceResult) {
    return Error(E_LEDGER, "Failed to adopt chain from " + winner.source +
                               ": " + replaceResult.error().message);
  }

  result.synced = true;
  result.newLength = winner.blocks.size();
  result.source = winner.source;
  result.message = "Chain synchronized from " + winner.source;
  log().info << "Adopted chain of length " << result.newLength << " from "
             << winner.source << " (was " << localLength << ")";
  return result;
}

std::optional<size_t>
Replicator::selectCandidate(size_t localLength,
                            const std::vector<Candidate> &candidates,
                            AdoptionPolicy policy) {
  std::vector<size_t> order;
  for (size_t i = 0; i < candidates.size(); ++i) {
    if (candidates[i].blocks.size() > localLength) {
      order.push_back(i);
    }
  }
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return candidates[a].blocks.size() > candidates[b].blocks.size();
  });

  for (size_t i : order) {
    if (policy == AdoptionPolicy::TRUST_LONGER ||
        Ledger::validateBlocks(candidates[i].blocks)) {
      return i;
    }
  }
  return std::nullopt;
}

std::vector<Replicator::Candidate>
Replicator::fetchCandidates(const std::vector<std::string> &peers) {
  std::vector<std::future<Client::Roe<std::vector<Block>>>> futures;
  futures.reserve(peers.size());
  auto timeout = config_.peerTimeout;
  for (const auto &peer : peers) {
    futures.push_back(std::async(std::launch::async, [peer, timeout]() {
      auto spClient = makePeerClient(peer, timeout);
      if (!spClient) {
        return Client::Roe<std::vector<Block>>(
            Client::Error(Client::E_INVALID_URL, "Invalid peer URL " + peer));
      }
      return spClient->fetchChain();
    }));
  }

  std::vector<Candidate> candidates;
  for (size_t i = 0; i < peers.size(); ++i) {
    auto chainResult = futures[i].get();
    if (!chainResult) {
      log().error << "Error syncing with " << peers[i] << ": "
                  << chainResult.error().message;
      continue;
    }
    Candidate candidate;
    candidate.source = peers[i];
    candidate.blocks = std::move(chainResult.value());
    candidates.push_back(std::move(candidate));
  }
  return candidates;
}

void Replicator::deliver(const Transaction &tx) {
  std::vector<std::string> peers = peers_.list();
  if (peers.empty()) {
    return;
  }

  std::vector<std::future<Client::Roe<void>>> futures;
  futures.reserve(peers.size());
  auto timeout = config_.peerTimeout;
  for (const auto &peer : peers) {
    futures.push_back(std::async(std::launch::async, [peer, timeout, tx]() {
      auto spClient = makePeerClient(peer, timeout);
      if (!spClient) {
        return Client::Roe<void>(
            Client::Error(Client::E_INVALID_URL, "Invalid peer URL " + peer));
      }
      return spClient->sendTransaction(tx);
    }));
  }

  for (size_t i = 0; i < peers.size(); ++i) {
    auto sendResult = futures[i].get();
    if (sendResult) {
      log().info << "Broadcasted transaction to " << peers[i];
    } else {
      log().error << "Error broadcasting to " << peers[i] << ": "
                  << sendResult.error().message;
    }
  }
}

void Replicator::processJob(Job &job) {
  switch (job.kind) {
  case Job::Kind::BROADCAST:
    deliver(job.tx);
    break;
  case Job::Kind::CONNECT: {
    auto result = peers_.connect(job.url, config_.peerTimeout);
    if (!result) {
      log().warning << "Connect to " << job.url
                    << " failed: " << result.error().message;
    }
    break;
  }
  case Job::Kind::SYNC:
    job.spResult->set_value(reconcile());
    lastSync_ = std::chrono::steady_clock::now();
    break;
  }
}

void Replicator::runLoop() {
  log().info << "Replicator running, policy " << policyName(config_.policy)
             << ", sync interval " << config_.syncInterval.count() << "s";

  while (!isStopSet()) {
    Job job;
    if (jobs_.poll(job)) {
      processJob(job);
      continue;
    }

    auto now = std::chrono::steady_clock::now();
    if (config_.syncInterval.count() > 0 &&
        now - lastSync_ >= config_.syncInterval) {
      lastSync_ = now;
      if (peers_.size() > 0) {
        auto result = reconcile();
        if (!result) {
          log().error << "Periodic sync failed: " << result.error().message;
        }
      }
    }

    sleepUnlessStopped(std::chrono::milliseconds(50));
  }
}

void Replicator::onStop() {
  Job job;
  while (jobs_.poll(job)) {
    if (job.kind == Job::Kind::SYNC) {
      job.spResult->set_value(
          Error(E_STOPPED, "Replicator stopped before sync completed"));
    } else if (job.kind == Job::Kind::BROADCAST) {
      log().warning << "Dropping broadcast of " << job.tx.itemId
                    << " on shutdown";
    }
  }
}

} // namespace cl

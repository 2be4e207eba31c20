#include "PeerRegistry.h"
#include "../client/Client.h"
#include "../lib/Utilities.h"

#include <algorithm>

namespace cl {

PeerRegistry::PeerRegistry() : Module("cl.PeerRegistry") {}

void PeerRegistry::setSelfUrl(const std::string &url) {
  std::lock_guard<std::mutex> lock(mutex_);
  selfUrl_ = utl::normalizePeerUrl(url);
}

std::string PeerRegistry::getSelfUrl() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return selfUrl_;
}

bool PeerRegistry::isValidUrl(const std::string &url) {
  const std::string scheme = "http://";
  return url.size() > scheme.size() &&
         url.compare(0, scheme.size(), scheme) == 0;
}

PeerRegistry::Roe<bool> PeerRegistry::add(const std::string &url) {
  std::string peer = utl::normalizePeerUrl(url);
  if (!isValidUrl(peer)) {
    return Error(E_INVALID_URL, "Invalid peer URL: " + url);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (peer == selfUrl_) {
    log().debug << "Ignoring own URL " << peer;
    return false;
  }
  if (std::find(peers_.begin(), peers_.end(), peer) != peers_.end()) {
    return false;
  }
  peers_.push_back(peer);
  log().info << "Added peer: " << peer;
  return true;
}

bool PeerRegistry::remove(const std::string &url) {
  std::string peer = utl::normalizePeerUrl(url);
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find(peers_.begin(), peers_.end(), peer);
  if (it == peers_.end()) {
    return false;
  }
  peers_.erase(it);
  log().info << "Removed peer: " << peer;
  return true;
}

bool PeerRegistry::contains(const std::string &url) const {
  std::string peer = utl::normalizePeerUrl(url);
  std::lock_guard<std::mutex> lock(mutex_);
  return std::find(peers_.begin(), peers_.end(), peer) != peers_.end();
}

std::vector<std::string> PeerRegistry::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_;
}

size_t PeerRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

PeerRegistry::Roe<void>
PeerRegistry::connect(const std::string &url,
                      std::chrono::milliseconds timeout) {
  std::string peer = utl::normalizePeerUrl(url);
  if (contains(peer)) {
    log().info << "Already connected to " << peer;
    return {};
  }

  Client client;
  client.redirectLogger(log().getFullName() + ".Client");
  auto urlResult = client.setBaseUrl(peer);
  if (!urlResult) {
    return Error(E_INVALID_URL, urlResult.error().message);
  }
  client.setTimeout(timeout);

  auto pingResult = client.ping();
  if (!pingResult) {
    log().error << "Failed to connect to " << peer << ": "
                << pingResult.error().message;
    return Error(E_UNREACHABLE, "Peer " + peer + " is unreachable: " +
                                    pingResult.error().message);
  }

  auto addResult = add(peer);
  if (!addResult) {
    return addResult.error();
  }
  if (!addResult.value() && !contains(peer)) {
    return Error(E_SELF, "Peer " + peer + " is this node");
  }

  std::string self = getSelfUrl();
  if (!self.empty()) {
    auto registerResult = client.registerPeer(self);
    if (!registerResult) {
      log().warning << "Peer " << peer << " did not register us back: "
                    << registerResult.error().message;
    }
  }

  log().info << "Connected to peer: " << peer << " (node "
             << pingResult.value().nodeId << ")";
  return {};
}

} // namespace cl

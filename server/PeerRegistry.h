#ifndef CHAIN_LEDGER_PEER_REGISTRY_H
#define CHAIN_LEDGER_PEER_REGISTRY_H

#include "../lib/Module.h"
#include "../lib/ResultOrError.h"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace cl {

/**
 * De-duplicated, insertion-ordered list of peer base URLs.
 * URLs are stored in canonical form (trimmed, no trailing slash).
 */
class PeerRegistry : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const int32_t E_INVALID_URL = 1;
  static constexpr const int32_t E_UNREACHABLE = 2;
  static constexpr const int32_t E_SELF = 3;

  PeerRegistry();
  ~PeerRegistry() override = default;

  // Our own advertised URL; never added as a peer
  void setSelfUrl(const std::string &url);
  std::string getSelfUrl() const;

  /**
   * @return true if the peer was added, false if already known or our own URL
   */
  Roe<bool> add(const std::string &url);
  bool remove(const std::string &url);
  bool contains(const std::string &url) const;
  std::vector<std::string> list() const;
  size_t size() const;

  /**
   * Ping `url`, add it, then ask it to register our own URL in return.
   * Failure of the return registration is only logged.
   */
  Roe<void> connect(const std::string &url, std::chrono::milliseconds timeout);

  static bool isValidUrl(const std::string &url);

private:
  std::string selfUrl_;
  std::vector<std::string> peers_;
  mutable std::mutex mutex_;
};

} // namespace cl

#endif // CHAIN_LEDGER_PEER_REGISTRY_H

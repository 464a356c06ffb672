#ifndef QCHAIN_PEER_REGISTRY_H
#define QCHAIN_PEER_REGISTRY_H

#include "Module.h"
#include "ResultOrError.hpp"
#include "Types.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace qc {
namespace network {

/**
 * Bounded set of known peers keyed by (host, port).
 */
class PeerRegistry : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_READ = 1;
  constexpr static int32_t E_WRITE = 2;
  constexpr static int32_t E_FORMAT = 3;

  constexpr static size_t DEFAULT_MAX_PEERS = 8;

  // Returns false for endpoints that must not be registered
  using Filter = std::function<bool(const TcpEndpoint &)>;

  struct Peer {
    TcpEndpoint endpoint;
    double lastSeen{0};
  };

  explicit PeerRegistry(size_t maxPeers = DEFAULT_MAX_PEERS);
  ~PeerRegistry() override = default;

  size_t getMaxPeers() const;
  // Lowering the cap keeps existing peers; it only blocks further adds
  void setMaxPeers(size_t maxPeers);

  // False when the peer is already known or the registry is full
  bool add(const TcpEndpoint &endpoint);
  bool remove(const TcpEndpoint &endpoint);
  bool contains(const TcpEndpoint &endpoint) const;
  void markSeen(const TcpEndpoint &endpoint);

  std::vector<Peer> getPeers() const;
  std::vector<TcpEndpoint> getEndpoints() const;
  size_t size() const;
  bool isFull() const;
  std::optional<TcpEndpoint> pickRandom() const;

  nlohmann::json ltsToJson() const;
  // Merges the listed peers that pass accept, stopping at capacity; returns
  // how many were added
  Roe<size_t> ltsFromJson(const nlohmann::json &jd,
                          const Filter &accept = nullptr);

  Roe<void> saveToFile(const std::string &path) const;
  Roe<size_t> loadFromFile(const std::string &path,
                           const Filter &accept = nullptr);

private:
  size_t maxPeers_;
  mutable std::mutex mutex_;
  std::map<TcpEndpoint, Peer> peers_;
  mutable std::mt19937 rng_;
};

} // namespace network
} // namespace qc

#endif // QCHAIN_PEER_REGISTRY_H

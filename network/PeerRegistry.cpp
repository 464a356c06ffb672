#include "PeerRegistry.h"
#include "Utilities.h"

#include <iterator>

namespace qc {
namespace network {

PeerRegistry::PeerRegistry(size_t maxPeers)
    : Module("qchain.network.peers"), maxPeers_(maxPeers),
      rng_(std::random_device{}()) {}

size_t PeerRegistry::getMaxPeers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return maxPeers_;
}

void PeerRegistry::setMaxPeers(size_t maxPeers) {
  std::lock_guard<std::mutex> lock(mutex_);
  maxPeers_ = maxPeers;
}

bool PeerRegistry::add(const TcpEndpoint &endpoint) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (peers_.count(endpoint) > 0 || peers_.size() >= maxPeers_) {
    return false;
  }
  Peer peer;
  peer.endpoint = endpoint;
  peer.lastSeen = utl::getTimestamp();
  peers_[endpoint] = peer;
  log().info << "Added peer " << endpoint << " (" << peers_.size() << "/"
             << maxPeers_ << ")";
  return true;
}

bool PeerRegistry::remove(const TcpEndpoint &endpoint) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (peers_.erase(endpoint) == 0) {
    return false;
  }
  log().info << "Removed peer " << endpoint;
  return true;
}

bool PeerRegistry::contains(const TcpEndpoint &endpoint) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.count(endpoint) > 0;
}

void PeerRegistry::markSeen(const TcpEndpoint &endpoint) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peers_.find(endpoint);
  if (it != peers_.end()) {
    it->second.lastSeen = utl::getTimestamp();
  }
}

std::vector<PeerRegistry::Peer> PeerRegistry::getPeers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Peer> result;
  result.reserve(peers_.size());
  for (const auto &entry : peers_) {
    result.push_back(entry.second);
  }
  return result;
}

std::vector<TcpEndpoint> PeerRegistry::getEndpoints() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TcpEndpoint> result;
  result.reserve(peers_.size());
  for (const auto &entry : peers_) {
    result.push_back(entry.first);
  }
  return result;
}

size_t PeerRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

bool PeerRegistry::isFull() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size() >= maxPeers_;
}

std::optional<TcpEndpoint> PeerRegistry::pickRandom() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (peers_.empty()) {
    return std::nullopt;
  }
  std::uniform_int_distribution<size_t> dist(0, peers_.size() - 1);
  auto it = peers_.begin();
  std::advance(it, dist(rng_));
  return it->first;
}

nlohmann::json PeerRegistry::ltsToJson() const {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json jd = nlohmann::json::array();
  for (const auto &entry : peers_) {
    jd.push_back(nlohmann::json{{"host", entry.first.address},
                                {"port", entry.first.port}});
  }
  return jd;
}

PeerRegistry::Roe<size_t> PeerRegistry::ltsFromJson(const nlohmann::json &jd,
                                                     const Filter &accept) {
  if (!jd.is_array()) {
    return Error(E_FORMAT, "Peer list must be a JSON array");
  }

  std::vector<TcpEndpoint> endpoints;
  for (const auto &item : jd) {
    if (!item.is_object() || !item.contains("host") ||
        !item["host"].is_string() || !item.contains("port") ||
        !item["port"].is_number_unsigned() ||
        item["port"].get<uint64_t>() == 0 ||
        item["port"].get<uint64_t>() > 65535) {
      return Error(E_FORMAT, "Peer entries must be {host, port} objects");
    }
    TcpEndpoint endpoint;
    endpoint.address = item["host"].get<std::string>();
    endpoint.port = item["port"].get<uint16_t>();
    endpoints.push_back(endpoint);
  }

  size_t added = 0;
  for (const auto &endpoint : endpoints) {
    if (accept && !accept(endpoint)) {
      log().debug << "Skipping listed peer " << endpoint;
      continue;
    }
    if (add(endpoint)) {
      ++added;
    }
  }
  return added;
}

PeerRegistry::Roe<void> PeerRegistry::saveToFile(const std::string &path) const {
  auto result = utl::writeToFile(path, ltsToJson().dump(2));
  if (!result) {
    return Error(E_WRITE, "Failed to save peers: " + result.error().message);
  }
  return {};
}

PeerRegistry::Roe<size_t> PeerRegistry::loadFromFile(const std::string &path,
                                                      const Filter &accept) {
  auto jsonResult = utl::loadJsonFile(path);
  if (!jsonResult) {
    return Error(E_READ, jsonResult.error().message);
  }
  return ltsFromJson(jsonResult.value(), accept);
}

} // namespace network
} // namespace qc

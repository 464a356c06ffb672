#include "Node.h"
#include "../lib/Utilities.h"

#include <algorithm>
#include <filesystem>
#include <thread>

namespace qc {

namespace {

// Clears the syncing flag on every exit path of syncChain()
class SyncGuard {
public:
  explicit SyncGuard(std::atomic<bool> &flag) : flag_(flag) {}
  ~SyncGuard() { flag_ = false; }

private:
  std::atomic<bool> &flag_;
};

bool isWildcardHost(const std::string &host) {
  return host.empty() || host == "0.0.0.0" || host == "::";
}

bool isLoopbackHost(const std::string &host) {
  return host == "127.0.0.1" || host == "localhost" || host == "::1";
}

Node::Roe<std::chrono::milliseconds> readSeconds(const nlohmann::json &jd,
                                                 const char *key) {
  if (!jd[key].is_number() || jd[key].get<double>() <= 0) {
    return Node::Error(Node::E_CONFIG,
                       std::string("Field '") + key +
                           "' must be a positive number of seconds");
  }
  return std::chrono::milliseconds(
      static_cast<int64_t>(jd[key].get<double>() * 1000));
}

} // namespace

// ----------------- Config -------------------------------------

nlohmann::json Node::Config::ltsToJson() const {
  nlohmann::json jd;
  jd["host"] = endpoint.address;
  jd["port"] = endpoint.port;
  jd["advertiseHost"] = advertiseHost;
  jd["seedPeers"] = nlohmann::json::array();
  for (const auto &seed : seedPeers) {
    jd["seedPeers"].push_back(seed.ltsToString());
  }
  jd["maxPeers"] = maxPeers;
  jd["pingInterval"] = pingInterval.count() / 1000.0;
  jd["syncInterval"] = syncInterval.count() / 1000.0;
  jd["queryTimeout"] = queryTimeout.count() / 1000.0;
  jd["downloadTimeout"] = downloadTimeout.count() / 1000.0;
  jd["syncBatchSize"] = syncBatchSize;
  jd["maxResponseBytes"] = maxResponseBytes;
  return jd;
}

Node::Roe<void> Node::Config::ltsFromJson(const nlohmann::json &jd) {
  try {
    if (!jd.is_object()) {
      return Error(E_CONFIG, "Node configuration must be a JSON object");
    }

    if (jd.contains("host")) {
      if (!jd["host"].is_string() || jd["host"].get<std::string>().empty()) {
        return Error(E_CONFIG, "Field 'host' must be a non-empty string");
      }
      endpoint.address = jd["host"].get<std::string>();
    }

    if (jd.contains("port")) {
      if (!jd["port"].is_number_unsigned() ||
          jd["port"].get<uint64_t>() > 65535) {
        return Error(E_CONFIG, "Field 'port' must be between 0 and 65535");
      }
      endpoint.port = jd["port"].get<uint16_t>();
    }

    if (jd.contains("advertiseHost")) {
      if (!jd["advertiseHost"].is_string()) {
        return Error(E_CONFIG, "Field 'advertiseHost' must be a string");
      }
      advertiseHost = jd["advertiseHost"].get<std::string>();
    }

    if (jd.contains("seedPeers")) {
      if (!jd["seedPeers"].is_array()) {
        return Error(E_CONFIG, "Field 'seedPeers' must be an array");
      }
      seedPeers.clear();
      for (const auto &item : jd["seedPeers"]) {
        network::TcpEndpoint seed;
        if (!item.is_string() ||
            !utl::parseHostPort(item.get<std::string>(), seed.address,
                                seed.port)) {
          return Error(E_CONFIG,
                       "Seed peers must be \"host:port\" strings, got " +
                           item.dump());
        }
        seedPeers.push_back(seed);
      }
    }

    struct Count {
      const char *key;
      size_t *target;
    };
    for (const Count &count :
         {Count{"maxPeers", &maxPeers}, Count{"syncBatchSize", &syncBatchSize},
          Count{"maxResponseBytes", &maxResponseBytes}}) {
      if (!jd.contains(count.key)) {
        continue;
      }
      if (!jd[count.key].is_number_unsigned() ||
          jd[count.key].get<uint64_t>() == 0) {
        return Error(E_CONFIG, std::string("Field '") + count.key +
                                   "' must be a positive integer");
      }
      *count.target = jd[count.key].get<size_t>();
    }

    struct Interval {
      const char *key;
      std::chrono::milliseconds *target;
    };
    for (const Interval &interval :
         {Interval{"pingInterval", &pingInterval},
          Interval{"syncInterval", &syncInterval},
          Interval{"queryTimeout", &queryTimeout},
          Interval{"downloadTimeout", &downloadTimeout}}) {
      if (!jd.contains(interval.key)) {
        continue;
      }
      auto value = readSeconds(jd, interval.key);
      if (!value) {
        return value.error();
      }
      *interval.target = value.value();
    }

    return {};
  } catch (const std::exception &e) {
    return Error(E_CONFIG,
                 "Failed to parse node configuration: " + std::string(e.what()));
  }
}

// ----------------- Node -------------------------------------

Node::Node(Chain &chain) : Service("qchain.node"), chain_(chain) {
  server_.redirectLogger(log().getFullName());
  client_.redirectLogger(log().getFullName());
  peers_.redirectLogger(log().getFullName());
  outbox_.redirectLogger(log().getFullName());
}

Node::~Node() { stop(); }

Service::Roe<void> Node::start(const Config &config) {
  if (isRunning()) {
    return Service::Error(E_CONFIG, "Node is already running on " +
                                        getEndpoint().ltsToString());
  }
  config_ = config;
  return Service::start();
}

network::TcpEndpoint Node::getEndpoint() const {
  std::lock_guard<std::mutex> lock(endpointMutex_);
  if (boundEndpoint_.port != 0) {
    return boundEndpoint_;
  }
  return config_.endpoint;
}

network::TcpEndpoint Node::getAdvertisedEndpoint() const {
  network::TcpEndpoint endpoint = getEndpoint();
  if (!config_.advertiseHost.empty()) {
    endpoint.address = config_.advertiseHost;
  } else if (isWildcardHost(endpoint.address)) {
    endpoint.address = "127.0.0.1";
  }
  return endpoint;
}

bool Node::isSelf(const network::TcpEndpoint &endpoint) const {
  network::TcpEndpoint self = getAdvertisedEndpoint();
  if (endpoint == self) {
    return true;
  }
  if (endpoint.port != self.port) {
    return false;
  }
  return isWildcardHost(endpoint.address) || isLoopbackHost(endpoint.address) ||
         endpoint.address == config_.endpoint.address;
}

bool Node::addPeer(const network::TcpEndpoint &endpoint) {
  if (endpoint.port == 0 || isSelf(endpoint)) {
    return false;
  }
  return peers_.add(endpoint);
}

std::string Node::getDataFile(const char *name) const {
  return (std::filesystem::path(config_.dataDir) / name).string();
}

Service::Roe<void> Node::onStart() {
  peers_.setMaxPeers(config_.maxPeers);
  client_.setMaxResponseBytes(config_.maxResponseBytes);

  network::FetchServer::Config serverConfig;
  serverConfig.endpoint = config_.endpoint;
  serverConfig.handler = [this](const std::string &request,
                                const network::TcpEndpoint &from) {
    return handleRequest(request, from);
  };
  // A complete JSON document ends the request even without a half-close
  serverConfig.isComplete = protocol::isCompleteMessage;
  serverConfig.receiveTimeout = config_.queryTimeout;

  auto started = server_.start(serverConfig);
  if (!started) {
    log().error << "Failed to start listener on " << config_.endpoint << ": "
                << started.error().message;
    return Service::Error(E_CONFIG, started.error().message);
  }
  {
    std::lock_guard<std::mutex> lock(endpointMutex_);
    boundEndpoint_ = server_.getEndpoint();
  }

  // Saved peers and seeds go in after binding so an entry pointing back at
  // us is recognized
  if (!config_.dataDir.empty()) {
    std::string peersFile = getDataFile(FILE_PEERS);
    std::error_code ec;
    if (std::filesystem::exists(peersFile, ec)) {
      auto loaded = peers_.loadFromFile(
          peersFile, [this](const network::TcpEndpoint &endpoint) {
            return !isSelf(endpoint);
          });
      if (loaded) {
        log().info << "Loaded " << loaded.value() << " peers from "
                   << peersFile;
      } else {
        log().warning << "Ignoring peer file " << peersFile << ": "
                      << loaded.error().message;
      }
    }
  }
  for (const auto &seed : config_.seedPeers) {
    if (!addPeer(seed)) {
      log().debug << "Skipping seed peer " << seed;
    }
  }

  auto outboxStarted = outbox_.start();
  if (!outboxStarted) {
    server_.stop();
    return Service::Error(E_CONFIG, "Failed to start outbound worker: " +
                                        outboxStarted.error().message);
  }

  log().info << "Node listening on " << getEndpoint() << " as "
             << getAdvertisedEndpoint() << " with " << peers_.size()
             << " peers, chain height " << chain_.getHeight();
  return {};
}

void Node::onStop() {
  server_.stop();
  outbox_.stop();

  auto chainSaved = saveChain();
  if (!chainSaved) {
    log().error << chainSaved.error().message;
  }
  auto peersSaved = savePeers();
  if (!peersSaved) {
    log().error << peersSaved.error().message;
  }
  log().info << "Node stopped";
}

void Node::runLoop() {
  auto runSync = [this]() {
    auto synced = syncChain();
    if (!synced) {
      log().warning << "Sync failed: " << synced.error().message;
    } else if (synced.value() > 0) {
      log().info << "Synced " << synced.value() << " blocks, height now "
                 << chain_.getHeight();
    }
  };

  runSync();

  auto lastPing = std::chrono::steady_clock::now();
  auto lastSync = lastPing;
  while (!isStopSet()) {
    auto now = std::chrono::steady_clock::now();
    if (now - lastPing >= config_.pingInterval) {
      pingPeers();
      lastPing = std::chrono::steady_clock::now();
    }
    if (now - lastSync >= config_.syncInterval) {
      runSync();
      lastSync = std::chrono::steady_clock::now();
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
}

// ----------------- inbound -------------------------------------

std::string Node::handleRequest(const std::string &request,
                                const network::TcpEndpoint &from) {
  auto decoded = protocol::decode(request);
  if (!decoded) {
    log().warning << "Ignoring request from " << from << ": "
                  << decoded.error().message;
    return "";
  }
  return std::visit(
      [this, &from](const auto &message) { return onMessage(message, from); },
      decoded.value());
}

std::string Node::onMessage(const protocol::Ping &message,
                            const network::TcpEndpoint &from) {
  network::TcpEndpoint peer{message.host, message.port};
  // A node bound to all interfaces advertises loopback; the address the
  // ping actually came from is the one that reaches it
  if (isWildcardHost(peer.address) ||
      (isLoopbackHost(peer.address) && !isLoopbackHost(from.address))) {
    peer.address = from.address;
  }
  if (peers_.contains(peer)) {
    peers_.markSeen(peer);
  } else if (addPeer(peer)) {
    log().info << "Registered peer " << peer << " from ping";
  }
  return protocol::encode(protocol::Pong{utl::getTimestamp()});
}

std::string Node::onMessage(const protocol::Pong &message,
                            const network::TcpEndpoint &from) {
  log().warning << "Unexpected pong from " << from;
  return "";
}

std::string Node::onMessage(const protocol::GetPeers &message,
                            const network::TcpEndpoint &from) {
  return protocol::encode(protocol::Peers{peers_.getEndpoints()});
}

std::string Node::onMessage(const protocol::Peers &message,
                            const network::TcpEndpoint &from) {
  log().warning << "Unexpected peers message from " << from;
  return "";
}

std::string Node::onMessage(const protocol::GetBlocks &message,
                            const network::TcpEndpoint &from) {
  protocol::Blocks reply;
  auto range = protocol::resolveRange(message.startIndex, message.endIndex,
                                      chain_.getLength());
  if (!range.empty) {
    reply.blocks = chain_.getBlocks(range.start, range.end);
  }
  log().debug << "Serving " << reply.blocks.size() << " blocks to " << from;
  return protocol::encode(reply);
}

std::string Node::onMessage(const protocol::Blocks &message,
                            const network::TcpEndpoint &from) {
  log().warning << "Unexpected blocks message from " << from;
  return "";
}

std::string Node::onMessage(const protocol::NewBlock &message,
                            const network::TcpEndpoint &from) {
  const Block &block = message.block;
  auto appended = chain_.appendBlock(block);
  if (!appended) {
    log().debug << "Dropping block " << block.getIndex() << " from " << from
                << ": " << appended.error().message;
    return "";
  }

  log().info << "Added block " << block.getIndex() << " from peer " << from;
  auto saved = saveChain();
  if (!saved) {
    log().error << saved.error().message;
  }
  broadcastNewBlock(block);
  return "";
}

std::string Node::onMessage(const protocol::NewTransaction &message,
                            const network::TcpEndpoint &from) {
  const Transaction &tx = message.transaction;
  auto added = chain_.addTransaction(tx);
  if (!added) {
    log().debug << "Dropping transaction " << tx.getTxid() << " from " << from
                << ": " << added.error().message;
    return "";
  }
  log().info << "Added transaction " << tx.getTxid() << " from peer " << from;
  broadcastNewTransaction(tx);
  return "";
}

// ----------------- outbound -------------------------------------

Node::Roe<protocol::Message> Node::query(const network::TcpEndpoint &peer,
                                         const protocol::Message &request,
                                         std::chrono::milliseconds timeout) {
  auto reply = client_.fetchSync(peer, protocol::encode(request), timeout);
  if (!reply) {
    return Error(E_PEER, reply.error().message);
  }
  if (reply.value().empty()) {
    return Error(E_RESPONSE, "Empty reply from " + peer.ltsToString() +
                                 " to " + protocol::typeName(request));
  }
  auto decoded = protocol::decode(reply.value());
  if (!decoded) {
    return Error(E_RESPONSE, "Bad reply from " + peer.ltsToString() + ": " +
                                 decoded.error().message);
  }
  return decoded.value();
}

Node::Roe<void> Node::ping(const network::TcpEndpoint &peer) {
  network::TcpEndpoint self = getAdvertisedEndpoint();
  protocol::Ping request{self.address, self.port, utl::getTimestamp()};
  auto reply = query(peer, request, config_.queryTimeout);
  if (!reply) {
    return reply.error();
  }
  if (!std::holds_alternative<protocol::Pong>(reply.value())) {
    return Error(E_RESPONSE, "Expected pong from " + peer.ltsToString() +
                                 ", got " + protocol::typeName(reply.value()));
  }
  return {};
}

Node::Roe<std::vector<network::TcpEndpoint>>
Node::requestPeers(const network::TcpEndpoint &peer) {
  auto reply = query(peer, protocol::GetPeers{}, config_.queryTimeout);
  if (!reply) {
    return reply.error();
  }
  auto *peers = std::get_if<protocol::Peers>(&reply.value());
  if (!peers) {
    return Error(E_RESPONSE, "Expected peers from " + peer.ltsToString() +
                                 ", got " + protocol::typeName(reply.value()));
  }
  return peers->peers;
}

Node::Roe<std::vector<Block>>
Node::requestBlocks(const network::TcpEndpoint &peer, int64_t startIndex,
                    int64_t endIndex, std::chrono::milliseconds timeout) {
  protocol::GetBlocks request;
  request.startIndex = startIndex;
  request.endIndex = endIndex;
  auto reply = query(peer, request, timeout);
  if (!reply) {
    return reply.error();
  }
  auto *blocks = std::get_if<protocol::Blocks>(&reply.value());
  if (!blocks) {
    return Error(E_RESPONSE, "Expected blocks from " + peer.ltsToString() +
                                 ", got " + protocol::typeName(reply.value()));
  }
  return std::move(blocks->blocks);
}

Node::Roe<uint64_t> Node::queryPeerHeight(const network::TcpEndpoint &peer) {
  auto blocks = requestBlocks(peer, -1, -1, config_.queryTimeout);
  if (!blocks) {
    return blocks.error();
  }
  if (blocks.value().empty()) {
    return Error(E_RESPONSE, "Peer " + peer.ltsToString() +
                                 " returned no tip block");
  }
  return blocks.value().front().getIndex();
}

Node::Roe<size_t> Node::downloadBlocks(const network::TcpEndpoint &peer,
                                       uint64_t startIndex,
                                       uint64_t endIndex) {
  const uint64_t batch = std::max<uint64_t>(1, config_.syncBatchSize);
  size_t appended = 0;
  std::optional<Error> failure;

  uint64_t next = startIndex;
  while (next <= endIndex && !isStopSet()) {
    uint64_t last = std::min(endIndex, next + batch - 1);
    auto blocks = requestBlocks(peer, static_cast<int64_t>(next),
                                static_cast<int64_t>(last),
                                config_.downloadTimeout);
    if (!blocks) {
      failure = Error(E_SYNC, "Block download [" + std::to_string(next) + ", " +
                                  std::to_string(last) + "] from " +
                                  peer.ltsToString() +
                                  " failed: " + blocks.error().message);
      break;
    }

    bool linked = true;
    for (const Block &block : blocks.value()) {
      if (block.getIndex() != chain_.getLength()) {
        continue;
      }
      auto result = chain_.appendBlock(block);
      if (!result) {
        log().warning << "Stopping sync at block " << block.getIndex() << ": "
                      << result.error().message;
        linked = false;
        break;
      }
      ++appended;
    }
    // A short or conflicting batch means the peer cannot take us further
    if (!linked || chain_.getLength() <= last) {
      break;
    }
    next = last + 1;
  }

  if (appended > 0) {
    auto saved = saveChain();
    if (!saved) {
      log().error << saved.error().message;
    }
  }
  if (failure) {
    if (appended == 0) {
      return *failure;
    }
    log().warning << failure->message;
  }
  return appended;
}

Node::Roe<size_t> Node::syncChain() {
  bool expected = false;
  if (!isSyncing_.compare_exchange_strong(expected, true)) {
    log().debug << "Sync already in progress";
    return size_t(0);
  }
  SyncGuard guard(isSyncing_);

  auto peers = peers_.getEndpoints();
  if (peers.empty()) {
    return size_t(0);
  }

  uint64_t bestHeight = chain_.getHeight();
  std::optional<network::TcpEndpoint> bestPeer;
  for (const auto &peer : peers) {
    auto height = queryPeerHeight(peer);
    if (!height) {
      log().debug << "Height query to " << peer
                  << " failed: " << height.error().message;
      continue;
    }
    if (height.value() > bestHeight) {
      bestHeight = height.value();
      bestPeer = peer;
    }
  }

  if (!bestPeer) {
    return size_t(0);
  }

  uint64_t localLength = chain_.getLength();
  log().info << "Peer " << *bestPeer << " is ahead (height " << bestHeight
             << ", local " << localLength - 1 << ")";
  return downloadBlocks(*bestPeer, localLength - 1, bestHeight);
}

size_t Node::pingPeers() {
  size_t alive = 0;
  for (const auto &peer : peers_.getEndpoints()) {
    auto result = ping(peer);
    if (result) {
      peers_.markSeen(peer);
      ++alive;
    } else {
      log().info << "Peer " << peer
                 << " did not answer, removing: " << result.error().message;
      peers_.remove(peer);
    }
  }

  if (peers_.size() * 2 < peers_.getMaxPeers()) {
    discoverPeers();
  }
  return alive;
}

size_t Node::discoverPeers() {
  auto peer = peers_.pickRandom();
  if (!peer) {
    return 0;
  }
  auto listed = requestPeers(*peer);
  if (!listed) {
    log().debug << "Peer discovery via " << *peer
                << " failed: " << listed.error().message;
    return 0;
  }
  size_t added = 0;
  for (const auto &endpoint : listed.value()) {
    if (addPeer(endpoint)) {
      ++added;
    }
  }
  if (added > 0) {
    log().info << "Discovered " << added << " peers via " << *peer;
  }
  return added;
}

Node::Roe<void> Node::addTransaction(const Transaction &tx) {
  auto added = chain_.addTransaction(tx);
  if (!added) {
    return Error(E_TX, added.error().message);
  }
  broadcastNewTransaction(tx);
  return {};
}

void Node::announceBlock(const Block &block) {
  auto saved = saveChain();
  if (!saved) {
    log().error << saved.error().message;
  }
  broadcastNewBlock(block);
}

void Node::broadcast(const protocol::Message &message) {
  auto targets = peers_.getEndpoints();
  if (targets.empty()) {
    return;
  }
  std::string payload = protocol::encode(message);
  std::string type = protocol::typeName(message);
  bool posted = outbox_.post([this, payload, type, targets]() {
    for (const auto &peer : targets) {
      auto sent = client_.fetchSync(peer, payload, config_.queryTimeout, false);
      if (!sent) {
        log().debug << "Failed to send " << type << " to " << peer << ": "
                    << sent.error().message;
      }
    }
  });
  if (!posted) {
    log().debug << "Outbound worker not running, dropping " << type;
  }
}

void Node::broadcastNewBlock(const Block &block) {
  broadcast(protocol::NewBlock{block});
}

void Node::broadcastNewTransaction(const Transaction &tx) {
  broadcast(protocol::NewTransaction{tx});
}

// ----------------- persistence -------------------------------------

Node::Roe<void> Node::saveChain() const {
  if (config_.dataDir.empty()) {
    return {};
  }
  std::lock_guard<std::mutex> lock(persistMutex_);
  auto saved = chain_.saveToFile(getDataFile(FILE_BLOCKCHAIN));
  if (!saved) {
    return Error(E_PERSIST, saved.error().message);
  }
  return {};
}

Node::Roe<void> Node::savePeers() const {
  if (config_.dataDir.empty()) {
    return {};
  }
  std::lock_guard<std::mutex> lock(persistMutex_);
  auto saved = peers_.saveToFile(getDataFile(FILE_PEERS));
  if (!saved) {
    return Error(E_PERSIST, saved.error().message);
  }
  return {};
}

} // namespace qc

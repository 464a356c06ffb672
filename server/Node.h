#ifndef QCHAIN_NODE_H
#define QCHAIN_NODE_H

#include "../consensus/Chain.h"
#include "../lib/ResultOrError.hpp"
#include "../lib/Service.h"
#include "../network/FetchClient.h"
#include "../network/FetchServer.h"
#include "../network/PeerRegistry.h"
#include "../network/Types.hpp"
#include "Outbox.h"
#include "Protocol.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace qc {

/**
 * Node - Peer-to-peer endpoint for one chain
 *
 * Serves the JSON protocol on a FetchServer, keeps a bounded peer registry
 * alive with periodic pings, pulls longer chains from peers and floods new
 * blocks and transactions. The chain is owned by the caller and shared with
 * the miner.
 *
 * The service thread is the maintenance loop (ping, discovery, sync).
 * Inbound requests are served on the FetchServer's connection threads and
 * all broadcasts run on the Outbox thread.
 */
class Node : public Service {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CONFIG = 1;
  constexpr static int32_t E_PEER = 2;
  constexpr static int32_t E_RESPONSE = 3;
  constexpr static int32_t E_TX = 4;
  constexpr static int32_t E_SYNC = 5;
  constexpr static int32_t E_PERSIST = 6;

  constexpr static uint16_t DEFAULT_PORT = 9333;
  constexpr static size_t DEFAULT_SYNC_BATCH = 100;
  constexpr static const char *DEFAULT_HOST = "0.0.0.0";
  constexpr static const char *FILE_BLOCKCHAIN = "blockchain.json";
  constexpr static const char *FILE_PEERS = "peers.json";

  struct Config {
    network::TcpEndpoint endpoint{DEFAULT_HOST, DEFAULT_PORT};
    // Host announced in pings; empty means derive it from the bind address
    std::string advertiseHost;
    // Empty disables persistence
    std::string dataDir;
    std::vector<network::TcpEndpoint> seedPeers;
    size_t maxPeers{network::PeerRegistry::DEFAULT_MAX_PEERS};
    std::chrono::milliseconds pingInterval{30000};
    std::chrono::milliseconds syncInterval{60000};
    std::chrono::milliseconds queryTimeout{5000};
    std::chrono::milliseconds downloadTimeout{30000};
    // Blocks asked for per get_blocks request while syncing
    size_t syncBatchSize{DEFAULT_SYNC_BATCH};
    size_t maxResponseBytes{network::FetchClient::MAX_RESPONSE_BYTES};

    nlohmann::json ltsToJson() const;
    Roe<void> ltsFromJson(const nlohmann::json &jd);
  };

  explicit Node(Chain &chain);
  ~Node() override;

  Service::Roe<void> start(const Config &config);

  const Config &getConfig() const { return config_; }
  Chain &getChain() { return chain_; }
  network::PeerRegistry &getPeerRegistry() { return peers_; }
  const network::PeerRegistry &getPeerRegistry() const { return peers_; }

  // Bound listening endpoint; the real port when 0 was requested
  network::TcpEndpoint getEndpoint() const;
  // Address other nodes should use to reach this one
  network::TcpEndpoint getAdvertisedEndpoint() const;

  bool isSyncing() const { return isSyncing_; }
  size_t getOutboundPendingCount() const { return outbox_.getPendingCount(); }

  // Adds a peer unless it is this node, already known, or the registry is full
  bool addPeer(const network::TcpEndpoint &endpoint);
  bool isSelf(const network::TcpEndpoint &endpoint) const;

  // Admit a transaction into the local pool and flood it to peers
  Roe<void> addTransaction(const Transaction &tx);

  // Persist and flood a block that was appended locally (e.g. just mined)
  void announceBlock(const Block &block);

  /**
   * Ping every known peer, drop the ones that do not answer with a pong and
   * ask a random survivor for more peers when fewer than half the slots are
   * in use.
   * @return Number of peers that answered
   */
  size_t pingPeers();

  // Ask one random peer for its peer list; returns how many were added
  size_t discoverPeers();

  /**
   * Adopt blocks from the single tallest peer if it is taller than us.
   * Blocks are appended with the index and link checks only.
   * @return Number of blocks appended, 0 when already in sync or when a
   *         sync is already in progress
   */
  Roe<size_t> syncChain();

  // Succeeds when the peer answers with a pong
  Roe<void> ping(const network::TcpEndpoint &peer);
  Roe<std::vector<network::TcpEndpoint>>
  requestPeers(const network::TcpEndpoint &peer);
  // Tip index reported by the peer
  Roe<uint64_t> queryPeerHeight(const network::TcpEndpoint &peer);
  Roe<std::vector<Block>> requestBlocks(const network::TcpEndpoint &peer,
                                        int64_t startIndex, int64_t endIndex,
                                        std::chrono::milliseconds timeout);
  /**
   * Download [startIndex, endIndex] in batches of syncBatchSize and append
   * what extends the tip. Stops at the first block that does not link.
   * @return Number of blocks appended; an error only when nothing was
   */
  Roe<size_t> downloadBlocks(const network::TcpEndpoint &peer,
                             uint64_t startIndex, uint64_t endIndex);

  Roe<void> saveChain() const;
  Roe<void> savePeers() const;

  // Entry point of the FetchServer; returns the reply, empty for none
  std::string handleRequest(const std::string &request,
                            const network::TcpEndpoint &from);

protected:
  void runLoop() override;
  Service::Roe<void> onStart() override;
  void onStop() override;

private:
  std::string onMessage(const protocol::Ping &message,
                        const network::TcpEndpoint &from);
  std::string onMessage(const protocol::Pong &message,
                        const network::TcpEndpoint &from);
  std::string onMessage(const protocol::GetPeers &message,
                        const network::TcpEndpoint &from);
  std::string onMessage(const protocol::Peers &message,
                        const network::TcpEndpoint &from);
  std::string onMessage(const protocol::GetBlocks &message,
                        const network::TcpEndpoint &from);
  std::string onMessage(const protocol::Blocks &message,
                        const network::TcpEndpoint &from);
  std::string onMessage(const protocol::NewBlock &message,
                        const network::TcpEndpoint &from);
  std::string onMessage(const protocol::NewTransaction &message,
                        const network::TcpEndpoint &from);

  Roe<protocol::Message> query(const network::TcpEndpoint &peer,
                               const protocol::Message &request,
                               std::chrono::milliseconds timeout);
  void broadcast(const protocol::Message &message);
  void broadcastNewBlock(const Block &block);
  void broadcastNewTransaction(const Transaction &tx);

  std::string getDataFile(const char *name) const;

  Chain &chain_;
  Config config_;
  mutable std::mutex endpointMutex_;
  network::TcpEndpoint boundEndpoint_;
  network::FetchServer server_;
  network::FetchClient client_;
  network::PeerRegistry peers_;
  Outbox outbox_;
  std::atomic<bool> isSyncing_{false};
  mutable std::mutex persistMutex_;
};

} // namespace qc

#endif // QCHAIN_NODE_H

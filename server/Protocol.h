#ifndef QCHAIN_PROTOCOL_H
#define QCHAIN_PROTOCOL_H

#include "../ledger/Block.h"
#include "../ledger/Transaction.h"
#include "../lib/ResultOrError.hpp"
#include "../network/Types.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace qc {
namespace protocol {

struct Error : RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, Error>;

constexpr static int32_t E_PARSE = 1;
constexpr static int32_t E_TYPE = 2;
constexpr static int32_t E_FIELD = 3;

// Wire type strings
constexpr const char *T_PING = "ping";
constexpr const char *T_PONG = "pong";
constexpr const char *T_GET_PEERS = "get_peers";
constexpr const char *T_PEERS = "peers";
constexpr const char *T_GET_BLOCKS = "get_blocks";
constexpr const char *T_BLOCKS = "blocks";
constexpr const char *T_NEW_BLOCK = "new_block";
constexpr const char *T_NEW_TRANSACTION = "new_transaction";

// Liveness probe; host/port is the address the sender listens on
struct Ping {
  std::string host;
  uint16_t port{0};
  double timestamp{0};
};

struct Pong {
  double timestamp{0};
};

struct GetPeers {};

struct Peers {
  std::vector<network::TcpEndpoint> peers;
};

// Missing indices default to the whole chain, negative ones count from the tip
struct GetBlocks {
  std::optional<int64_t> startIndex;
  std::optional<int64_t> endIndex;
};

struct Blocks {
  std::vector<Block> blocks;
};

struct NewBlock {
  Block block;
};

struct NewTransaction {
  Transaction transaction;
};

using Message = std::variant<Ping, Pong, GetPeers, Peers, GetBlocks, Blocks,
                             NewBlock, NewTransaction>;

std::string typeName(const Message &message);

nlohmann::json toJson(const Message &message);
Roe<Message> fromJson(const nlohmann::json &jd);

std::string encode(const Message &message);
Roe<Message> decode(const std::string &payload);

// True once data holds one whole JSON object. Only buffers ending in '}'
// are parsed, so checking after every read stays linear.
bool isCompleteMessage(const std::string &data);

struct BlockRange {
  uint64_t start{0};
  uint64_t end{0};
  bool empty{true};
};

/**
 * Resolve a get_blocks request against a chain of the given length.
 * Missing start is 0, missing end is the tip, negative values count back
 * from the end (-1 is the tip). End is clamped to the tip and a start past
 * the end collapses onto the end.
 */
BlockRange resolveRange(std::optional<int64_t> start,
                        std::optional<int64_t> end, uint64_t length);

} // namespace protocol
} // namespace qc

#endif // QCHAIN_PROTOCOL_H

#include "Protocol.h"

#include <limits>
#include <type_traits>

namespace qc {
namespace protocol {

namespace {

template <typename> inline constexpr bool always_false_v = false;

Roe<uint16_t> readPort(const nlohmann::json &jd) {
  if (!jd.contains("port") || !jd["port"].is_number_integer()) {
    return Error(E_FIELD, "Field 'port' must be an integer");
  }
  int64_t port = jd["port"].get<int64_t>();
  if (port < 0 || port > 65535) {
    return Error(E_FIELD, "Field 'port' out of range: " + std::to_string(port));
  }
  return static_cast<uint16_t>(port);
}

Roe<std::string> readHost(const nlohmann::json &jd) {
  if (!jd.contains("host") || !jd["host"].is_string()) {
    return Error(E_FIELD, "Field 'host' must be a string");
  }
  std::string host = jd["host"].get<std::string>();
  if (host.empty()) {
    return Error(E_FIELD, "Field 'host' cannot be empty");
  }
  return host;
}

double readTimestamp(const nlohmann::json &jd) {
  if (jd.contains("timestamp") && jd["timestamp"].is_number()) {
    return jd["timestamp"].get<double>();
  }
  return 0;
}

Roe<std::optional<int64_t>> readIndex(const nlohmann::json &jd,
                                      const char *key) {
  if (!jd.contains(key) || jd[key].is_null()) {
    return std::optional<int64_t>();
  }
  if (!jd[key].is_number_integer()) {
    return Error(E_FIELD, std::string("Field '") + key +
                              "' must be an integer");
  }
  if (jd[key].is_number_unsigned() &&
      jd[key].get<uint64_t>() >
          static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    return Error(E_FIELD, std::string("Field '") + key + "' is out of range");
  }
  return std::optional<int64_t>(jd[key].get<int64_t>());
}

Roe<Message> decodePing(const nlohmann::json &jd) {
  auto host = readHost(jd);
  if (!host) {
    return host.error();
  }
  auto port = readPort(jd);
  if (!port) {
    return port.error();
  }
  Ping ping;
  ping.host = host.value();
  ping.port = port.value();
  ping.timestamp = readTimestamp(jd);
  return Message(ping);
}

Roe<Message> decodePeers(const nlohmann::json &jd) {
  if (!jd.contains("peers") || !jd["peers"].is_array()) {
    return Error(E_FIELD, "Field 'peers' must be an array");
  }
  Peers peers;
  for (const auto &entry : jd["peers"]) {
    if (!entry.is_object()) {
      return Error(E_FIELD, "Peer entries must be objects");
    }
    auto host = readHost(entry);
    if (!host) {
      return host.error();
    }
    auto port = readPort(entry);
    if (!port) {
      return port.error();
    }
    peers.peers.push_back(network::TcpEndpoint{host.value(), port.value()});
  }
  return Message(peers);
}

Roe<Message> decodeGetBlocks(const nlohmann::json &jd) {
  auto start = readIndex(jd, "start_index");
  if (!start) {
    return start.error();
  }
  auto end = readIndex(jd, "end_index");
  if (!end) {
    return end.error();
  }
  GetBlocks request;
  request.startIndex = start.value();
  request.endIndex = end.value();
  return Message(request);
}

Roe<Message> decodeBlocks(const nlohmann::json &jd) {
  if (!jd.contains("blocks") || !jd["blocks"].is_array()) {
    return Error(E_FIELD, "Field 'blocks' must be an array");
  }
  Blocks blocks;
  blocks.blocks.reserve(jd["blocks"].size());
  for (const auto &entry : jd["blocks"]) {
    Block block;
    auto result = block.ltsFromJson(entry);
    if (!result) {
      return Error(E_FIELD, "Invalid block: " + result.error().message);
    }
    blocks.blocks.push_back(std::move(block));
  }
  return Message(std::move(blocks));
}

Roe<Message> decodeNewBlock(const nlohmann::json &jd) {
  if (!jd.contains("block")) {
    return Error(E_FIELD, "Missing field 'block'");
  }
  NewBlock message;
  auto result = message.block.ltsFromJson(jd["block"]);
  if (!result) {
    return Error(E_FIELD, "Invalid block: " + result.error().message);
  }
  return Message(std::move(message));
}

Roe<Message> decodeNewTransaction(const nlohmann::json &jd) {
  if (!jd.contains("transaction")) {
    return Error(E_FIELD, "Missing field 'transaction'");
  }
  NewTransaction message;
  auto result = message.transaction.ltsFromJson(jd["transaction"]);
  if (!result) {
    return Error(E_FIELD, "Invalid transaction: " + result.error().message);
  }
  return Message(std::move(message));
}

} // namespace

std::string typeName(const Message &message) {
  return std::visit(
      [](const auto &m) -> std::string {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Ping>) {
          return T_PING;
        } else if constexpr (std::is_same_v<T, Pong>) {
          return T_PONG;
        } else if constexpr (std::is_same_v<T, GetPeers>) {
          return T_GET_PEERS;
        } else if constexpr (std::is_same_v<T, Peers>) {
          return T_PEERS;
        } else if constexpr (std::is_same_v<T, GetBlocks>) {
          return T_GET_BLOCKS;
        } else if constexpr (std::is_same_v<T, Blocks>) {
          return T_BLOCKS;
        } else if constexpr (std::is_same_v<T, NewBlock>) {
          return T_NEW_BLOCK;
        } else if constexpr (std::is_same_v<T, NewTransaction>) {
          return T_NEW_TRANSACTION;
        } else {
          static_assert(always_false_v<T>, "unhandled message type");
        }
      },
      message);
}

nlohmann::json toJson(const Message &message) {
  nlohmann::json jd;
  jd["type"] = typeName(message);
  std::visit(
      [&jd](const auto &m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, Ping>) {
          jd["host"] = m.host;
          jd["port"] = m.port;
          jd["timestamp"] = m.timestamp;
        } else if constexpr (std::is_same_v<T, Pong>) {
          jd["timestamp"] = m.timestamp;
        } else if constexpr (std::is_same_v<T, Peers>) {
          jd["peers"] = nlohmann::json::array();
          for (const auto &peer : m.peers) {
            jd["peers"].push_back(
                nlohmann::json{{"host", peer.address}, {"port", peer.port}});
          }
        } else if constexpr (std::is_same_v<T, GetBlocks>) {
          if (m.startIndex) {
            jd["start_index"] = *m.startIndex;
          }
          if (m.endIndex) {
            jd["end_index"] = *m.endIndex;
          }
        } else if constexpr (std::is_same_v<T, Blocks>) {
          jd["blocks"] = nlohmann::json::array();
          for (const auto &block : m.blocks) {
            jd["blocks"].push_back(block.ltsToJson());
          }
        } else if constexpr (std::is_same_v<T, NewBlock>) {
          jd["block"] = m.block.ltsToJson();
        } else if constexpr (std::is_same_v<T, NewTransaction>) {
          jd["transaction"] = m.transaction.ltsToJson();
        }
      },
      message);
  return jd;
}

Roe<Message> fromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_PARSE, "Message must be a JSON object");
  }
  if (!jd.contains("type") || !jd["type"].is_string()) {
    return Error(E_PARSE, "Message is missing a string 'type' field");
  }

  try {
    const std::string type = jd["type"].get<std::string>();
    if (type == T_PING) {
      return decodePing(jd);
    }
    if (type == T_PONG) {
      return Message(Pong{readTimestamp(jd)});
    }
    if (type == T_GET_PEERS) {
      return Message(GetPeers{});
    }
    if (type == T_PEERS) {
      return decodePeers(jd);
    }
    if (type == T_GET_BLOCKS) {
      return decodeGetBlocks(jd);
    }
    if (type == T_BLOCKS) {
      return decodeBlocks(jd);
    }
    if (type == T_NEW_BLOCK) {
      return decodeNewBlock(jd);
    }
    if (type == T_NEW_TRANSACTION) {
      return decodeNewTransaction(jd);
    }
    return Error(E_TYPE, "Unknown message type: " + type);
  } catch (const nlohmann::json::exception &e) {
    return Error(E_FIELD, std::string("Malformed message: ") + e.what());
  }
}

std::string encode(const Message &message) { return toJson(message).dump(); }

Roe<Message> decode(const std::string &payload) {
  nlohmann::json jd;
  try {
    jd = nlohmann::json::parse(payload);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(E_PARSE, std::string("Invalid JSON: ") + e.what());
  }
  return fromJson(jd);
}

bool isCompleteMessage(const std::string &data) {
  size_t last = data.find_last_not_of(" \t\r\n");
  if (last == std::string::npos || data[last] != '}') {
    return false;
  }
  return nlohmann::json::accept(data);
}

BlockRange resolveRange(std::optional<int64_t> start,
                        std::optional<int64_t> end, uint64_t length) {
  BlockRange range;
  if (length == 0) {
    return range;
  }
  const int64_t len = static_cast<int64_t>(length);
  int64_t s = start.value_or(0);
  int64_t e = end.value_or(len - 1);
  if (s < 0) {
    s += len;
  }
  if (e < 0) {
    e += len;
  }
  if (e > len - 1) {
    e = len - 1;
  }
  if (s > e) {
    s = e;
  }
  if (s < 0) {
    s = 0;
  }
  if (e < 0) {
    return range;
  }
  range.start = static_cast<uint64_t>(s);
  range.end = static_cast<uint64_t>(e);
  range.empty = false;
  return range;
}

} // namespace protocol
} // namespace qc

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <tuple>

namespace qc {
namespace network {

struct TcpEndpoint {
  std::string address;
  uint16_t port{0};

  std::string ltsToString() const {
    return address + ":" + std::to_string(port);
  }

  bool operator==(const TcpEndpoint &other) const {
    return address == other.address && port == other.port;
  }
  bool operator!=(const TcpEndpoint &other) const { return !(*this == other); }
  bool operator<(const TcpEndpoint &other) const {
    return std::tie(address, port) < std::tie(other.address, other.port);
  }
};

inline std::ostream &operator<<(std::ostream &os, const TcpEndpoint &endpoint) {
  return os << endpoint.address << ":" << endpoint.port;
}

} // namespace network
} // namespace qc

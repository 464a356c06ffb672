#pragma once

#include "ResultOrError.hpp"
#include "TcpConnection.h"
#include "Types.hpp"

#include <cstdint>
#include <string>

namespace qc {
namespace network {

class TcpServer {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_STATE = 1;
  constexpr static int32_t E_SOCKET = 2;
  constexpr static int32_t E_BIND = 3;
  constexpr static int32_t E_TIMEOUT = 4;
  constexpr static int32_t E_NO_PENDING = 5;

  TcpServer() = default;
  ~TcpServer();

  TcpServer(const TcpServer &) = delete;
  TcpServer &operator=(const TcpServer &) = delete;

  /**
   * Bind to endpoint and start listening. Port 0 picks an ephemeral port,
   * getEndpoint() then reports the one actually bound.
   */
  Roe<void> listen(const TcpEndpoint &endpoint, int backlog = 64);

  // Accept a pending connection (non-blocking, E_NO_PENDING when none)
  Roe<TcpConnection> accept();

  // Wait for a pending connection (timeout in milliseconds, -1 for infinite)
  Roe<void> waitForEvents(int timeoutMs = -1);

  void stop();

  bool isListening() const { return listening_; }

  const TcpEndpoint &getEndpoint() const { return endpoint_; }

private:
  int socketFd_{-1};
  int epollFd_{-1};
  bool listening_{false};
  TcpEndpoint endpoint_;
};

} // namespace network
} // namespace qc

#pragma once

#include "ResultOrError.hpp"
#include "Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace qc {
namespace network {

class TcpConnection {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CLOSED = 1;
  constexpr static int32_t E_SEND = 2;
  constexpr static int32_t E_RECEIVE = 3;
  constexpr static int32_t E_TIMEOUT = 4;
  constexpr static int32_t E_PEER_CLOSED = 5;
  constexpr static int32_t E_SOCKET = 6;

  explicit TcpConnection(int socket_fd);
  ~TcpConnection();

  TcpConnection(const TcpConnection &) = delete;
  TcpConnection &operator=(const TcpConnection &) = delete;

  TcpConnection(TcpConnection &&other) noexcept;
  TcpConnection &operator=(TcpConnection &&other) noexcept;

  // Send the whole buffer, looping over partial writes
  Roe<size_t> send(const void *data, size_t length);
  Roe<size_t> send(const std::string &message);

  // Send data and shutdown writing in one call
  Roe<size_t> sendAndShutdown(const std::string &message);

  // Shutdown writing (half-close the connection)
  Roe<void> shutdownWrite();

  // Receive data; E_PEER_CLOSED on orderly shutdown by the peer
  Roe<size_t> receive(void *buffer, size_t maxLength);

  /**
   * Receive until the peer closes its side or until isComplete(buffer)
   * returns true, whichever comes first.
   * @param maxBytes upper bound on the accumulated size
   */
  template <typename Predicate>
  Roe<std::string> receiveUntil(Predicate isComplete, size_t maxBytes);

  Roe<std::string> receiveAll(size_t maxBytes);

  // Set socket send/receive timeout (0 = no timeout)
  Roe<void> setTimeout(std::chrono::milliseconds timeout);

  void close();

  bool isOpen() const { return socketFd_ >= 0; }

  const TcpEndpoint &getPeerEndpoint() const { return peer_; }

private:
  int socketFd_;
  TcpEndpoint peer_;
};

template <typename Predicate>
TcpConnection::Roe<std::string>
TcpConnection::receiveUntil(Predicate isComplete, size_t maxBytes) {
  std::string data;
  char buffer[8192];
  while (true) {
    auto result = receive(buffer, sizeof(buffer));
    if (!result) {
      if (result.error().code == E_PEER_CLOSED) {
        return data;
      }
      return result.error();
    }
    data.append(buffer, result.value());
    if (data.size() > maxBytes) {
      return Error(E_RECEIVE, "Message exceeds " + std::to_string(maxBytes) +
                                  " bytes");
    }
    if (isComplete(data)) {
      return data;
    }
  }
}

} // namespace network
} // namespace qc

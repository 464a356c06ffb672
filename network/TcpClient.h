#pragma once

#include "ResultOrError.hpp"
#include "TcpConnection.h"
#include "Types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace qc {
namespace network {

class TcpClient {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_STATE = 1;
  constexpr static int32_t E_RESOLVE = 2;
  constexpr static int32_t E_CONNECT = 3;
  constexpr static int32_t E_IO = 4;

  TcpClient() = default;
  ~TcpClient() = default;

  TcpClient(const TcpClient &) = delete;
  TcpClient &operator=(const TcpClient &) = delete;

  TcpClient(TcpClient &&other) noexcept = default;
  TcpClient &operator=(TcpClient &&other) noexcept = default;

  /**
   * Connect to a server. The timeout bounds the connect itself and is then
   * applied to every send and receive on the connection.
   */
  Roe<void> connect(const TcpEndpoint &endpoint,
                    std::chrono::milliseconds timeout);

  Roe<size_t> send(const std::string &message);

  // Send data and shutdown writing in one call
  Roe<size_t> sendAndShutdown(const std::string &message);

  // Read until the server closes the connection
  Roe<std::string> receiveAll(size_t maxBytes);

  void close();

  bool isConnected() const { return connection_.has_value(); }

private:
  std::optional<TcpConnection> connection_;
};

} // namespace network
} // namespace qc

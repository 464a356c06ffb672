#pragma once

#include "Module.h"
#include "ResultOrError.hpp"
#include "Types.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace qc {
namespace network {

/**
 * FetchClient - One request per connection
 *
 * Pattern: connect, send, half-close, read the reply until the server
 * closes, close.
 */
class FetchClient : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CONNECT = 1;
  constexpr static int32_t E_SEND = 2;
  constexpr static int32_t E_RECEIVE = 3;

  constexpr static size_t MAX_RESPONSE_BYTES = 64 * 1024 * 1024;

  FetchClient();
  ~FetchClient() override = default;

  /**
   * Synchronous fetch - blocks until the reply is complete
   * @param endpoint Remote server
   * @param data Request payload
   * @param timeout Bound on connect and on each socket read/write
   * @param expectResponse When false, returns an empty string right after
   *        the request has been sent
   */
  Roe<std::string> fetchSync(const TcpEndpoint &endpoint,
                             const std::string &data,
                             std::chrono::milliseconds timeout =
                                 std::chrono::milliseconds(5000),
                             bool expectResponse = true);

  // Replies larger than this fail with E_RECEIVE
  void setMaxResponseBytes(size_t maxBytes) { maxResponseBytes_ = maxBytes; }
  size_t getMaxResponseBytes() const { return maxResponseBytes_; }

private:
  size_t maxResponseBytes_{MAX_RESPONSE_BYTES};
};

} // namespace network
} // namespace qc

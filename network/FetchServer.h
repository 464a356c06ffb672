#pragma once

#include "ResultOrError.hpp"
#include "Service.h"
#include "TcpConnection.h"
#include "TcpServer.h"
#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace qc {
namespace network {

/**
 * FetchServer - Accepts one request per connection and answers it
 *
 * The accept loop runs in the service thread. Each accepted connection is
 * served by its own short-lived thread which reads the request, calls the
 * handler and writes the reply (if any) before closing.
 */
class FetchServer : public Service {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Returns the reply; an empty string closes without replying
  using RequestHandler =
      std::function<std::string(const std::string &, const TcpEndpoint &)>;
  // Lets the server answer peers that send a request without half-closing
  using CompletionCheck = std::function<bool(const std::string &)>;

  struct Config {
    TcpEndpoint endpoint;
    RequestHandler handler{nullptr};
    CompletionCheck isComplete{nullptr};
    std::chrono::milliseconds receiveTimeout{5000};
    size_t maxRequestBytes{64 * 1024 * 1024};
  };

  FetchServer();
  ~FetchServer() override;

  Service::Roe<void> start(const Config &config);

  // Bound endpoint, with the real port when 0 was requested
  TcpEndpoint getEndpoint() const;

protected:
  void runLoop() override;
  Service::Roe<void> onStart() override;
  void onStop() override;

private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void acceptPending();
  void serveConnection(TcpConnection connection);
  void reapWorkers(bool joinAll);

  TcpServer server_;
  Config config_;
  mutable std::mutex workersMutex_;
  std::list<Worker> workers_;
};

} // namespace network
} // namespace qc

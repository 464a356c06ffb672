#include "FetchServer.h"

namespace qc {
namespace network {

FetchServer::FetchServer() : Service("qchain.network.fetch_server") {}

FetchServer::~FetchServer() { stop(); }

Service::Roe<void> FetchServer::start(const Config &config) {
  if (!config.handler) {
    return Service::Error(-3, "FetchServer requires a request handler");
  }
  config_ = config;
  return Service::start();
}

TcpEndpoint FetchServer::getEndpoint() const { return server_.getEndpoint(); }

Service::Roe<void> FetchServer::onStart() {
  auto listenResult = server_.listen(config_.endpoint);
  if (!listenResult) {
    return Service::Error(-2, "Failed to start listening: " +
                                  listenResult.error().message);
  }
  log().info << "Listening on " << server_.getEndpoint();
  return {};
}

void FetchServer::onStop() {
  server_.stop();
  reapWorkers(true);
}

void FetchServer::runLoop() {
  log().debug << "Server loop started";

  while (!isStopSet()) {
    // 100ms tick so that stop() is observed promptly
    auto waitResult = server_.waitForEvents(100);
    if (waitResult) {
      acceptPending();
    } else if (waitResult.error().code != TcpServer::E_TIMEOUT) {
      log().error << "Waiting for connections failed: "
                  << waitResult.error().message;
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    reapWorkers(false);
  }

  log().debug << "Server loop ended";
}

void FetchServer::acceptPending() {
  while (!isStopSet()) {
    auto acceptResult = server_.accept();
    if (!acceptResult) {
      if (acceptResult.error().code != TcpServer::E_NO_PENDING) {
        log().warning << acceptResult.error().message;
      }
      return;
    }

    TcpConnection connection = std::move(acceptResult.value());
    log().debug << "Accepted connection from " << connection.getPeerEndpoint();

    auto done = std::make_shared<std::atomic<bool>>(false);
    Worker worker;
    worker.done = done;
    worker.thread = std::thread(
        [this, done](TcpConnection conn) {
          serveConnection(std::move(conn));
          *done = true;
        },
        std::move(connection));

    std::lock_guard<std::mutex> lock(workersMutex_);
    workers_.push_back(std::move(worker));
  }
}

void FetchServer::serveConnection(TcpConnection connection) {
  TcpEndpoint peer = connection.getPeerEndpoint();

  auto timeoutResult = connection.setTimeout(config_.receiveTimeout);
  if (!timeoutResult) {
    log().warning << "Failed to set timeout for " << peer << ": "
                  << timeoutResult.error().message;
  }

  CompletionCheck isComplete = config_.isComplete;
  auto request = connection.receiveUntil(
      [&isComplete](const std::string &data) {
        return isComplete && isComplete(data);
      },
      config_.maxRequestBytes);
  if (!request) {
    log().debug << "Failed to read request from " << peer << ": "
                << request.error().message;
    return;
  }
  if (request.value().empty()) {
    return;
  }

  std::string response;
  try {
    response = config_.handler(request.value(), peer);
  } catch (const std::exception &e) {
    log().error << "Error processing request from " << peer << ": "
                << e.what();
    return;
  }

  if (!response.empty()) {
    auto sent = connection.send(response);
    if (!sent) {
      log().debug << "Failed to send reply to " << peer << ": "
                  << sent.error().message;
    }
  }
}

void FetchServer::reapWorkers(bool joinAll) {
  std::list<Worker> finished;
  {
    std::lock_guard<std::mutex> lock(workersMutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (joinAll || *it->done) {
        finished.push_back(std::move(*it));
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &worker : finished) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
}

} // namespace network
} // namespace qc

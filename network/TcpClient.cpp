#include "TcpClient.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace qc {
namespace network {

namespace {

// Non-blocking connect bounded by timeout; returns 0 or an errno value
int connectWithTimeout(int fd, const struct sockaddr *addr, socklen_t len,
                       std::chrono::milliseconds timeout) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    return errno;
  }

  int rc = ::connect(fd, addr, len);
  if (rc < 0 && errno != EINPROGRESS) {
    return errno;
  }
  if (rc < 0) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready == 0) {
      return ETIMEDOUT;
    }
    if (ready < 0) {
      return errno;
    }
    int soError = 0;
    socklen_t soLen = sizeof(soError);
    if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &soLen) < 0) {
      return errno;
    }
    if (soError != 0) {
      return soError;
    }
  }

  if (fcntl(fd, F_SETFL, flags) < 0) {
    return errno;
  }
  return 0;
}

} // namespace

TcpClient::Roe<void> TcpClient::connect(const TcpEndpoint &endpoint,
                                        std::chrono::milliseconds timeout) {
  if (connection_) {
    return Error(E_STATE, "Already connected");
  }

  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo *info = nullptr;
  std::string port = std::to_string(endpoint.port);
  int gai = getaddrinfo(endpoint.address.c_str(), port.c_str(), &hints, &info);
  if (gai != 0 || info == nullptr) {
    return Error(E_RESOLVE, "Failed to resolve hostname " + endpoint.address +
                                ": " + gai_strerror(gai));
  }

  int lastError = 0;
  for (struct addrinfo *ai = info; ai != nullptr; ai = ai->ai_next) {
    int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      lastError = errno;
      continue;
    }
    lastError = connectWithTimeout(fd, ai->ai_addr, ai->ai_addrlen, timeout);
    if (lastError == 0) {
      connection_.emplace(fd);
      break;
    }
    ::close(fd);
  }
  freeaddrinfo(info);

  if (!connection_) {
    return Error(E_CONNECT, "Failed to connect to " + endpoint.ltsToString() +
                                ": " + std::strerror(lastError));
  }

  auto timeoutResult = connection_->setTimeout(timeout);
  if (!timeoutResult) {
    close();
    return Error(E_CONNECT, timeoutResult.error().message);
  }
  return {};
}

TcpClient::Roe<size_t> TcpClient::send(const std::string &message) {
  if (!connection_) {
    return Error(E_STATE, "Not connected");
  }
  auto result = connection_->send(message);
  if (!result) {
    return Error(E_IO, result.error().message);
  }
  return result.value();
}

TcpClient::Roe<size_t> TcpClient::sendAndShutdown(const std::string &message) {
  if (!connection_) {
    return Error(E_STATE, "Not connected");
  }
  auto result = connection_->sendAndShutdown(message);
  if (!result) {
    return Error(E_IO, result.error().message);
  }
  return result.value();
}

TcpClient::Roe<std::string> TcpClient::receiveAll(size_t maxBytes) {
  if (!connection_) {
    return Error(E_STATE, "Not connected");
  }
  auto result = connection_->receiveAll(maxBytes);
  if (!result) {
    return Error(E_IO, result.error().message);
  }
  return result.value();
}

void TcpClient::close() { connection_.reset(); }

} // namespace network
} // namespace qc

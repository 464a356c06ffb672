#include "TcpServer.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace qc {
namespace network {

TcpServer::~TcpServer() { stop(); }

TcpServer::Roe<void> TcpServer::listen(const TcpEndpoint &endpoint,
                                       int backlog) {
  if (listening_) {
    return Error(E_STATE, "Server already listening");
  }

  struct sockaddr_in server_addr;
  std::memset(&server_addr, 0, sizeof(server_addr));
  server_addr.sin_family = AF_INET;
  server_addr.sin_port = htons(endpoint.port);

  if (endpoint.address.empty() || endpoint.address == "0.0.0.0") {
    server_addr.sin_addr.s_addr = INADDR_ANY;
  } else if (inet_pton(AF_INET, endpoint.address.c_str(),
                       &server_addr.sin_addr) != 1) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo *info = nullptr;
    if (getaddrinfo(endpoint.address.c_str(), nullptr, &hints, &info) != 0 ||
        info == nullptr) {
      return Error(E_BIND, "Failed to resolve listen address: " +
                               endpoint.address);
    }
    server_addr.sin_addr =
        reinterpret_cast<struct sockaddr_in *>(info->ai_addr)->sin_addr;
    freeaddrinfo(info);
  }

  socketFd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (socketFd_ < 0) {
    return Error(E_SOCKET, "Failed to create socket");
  }

  int opt = 1;
  if (setsockopt(socketFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
    stop();
    return Error(E_SOCKET, "Failed to set socket options");
  }

  if (bind(socketFd_, (struct sockaddr *)&server_addr, sizeof(server_addr)) <
      0) {
    std::string reason = std::strerror(errno);
    stop();
    return Error(E_BIND, "Failed to bind to " + endpoint.ltsToString() + ": " +
                             reason);
  }

  if (::listen(socketFd_, backlog) < 0) {
    stop();
    return Error(E_BIND, "Failed to listen on " + endpoint.ltsToString());
  }

  int flags = fcntl(socketFd_, F_GETFL, 0);
  if (flags < 0 || fcntl(socketFd_, F_SETFL, flags | O_NONBLOCK) < 0) {
    stop();
    return Error(E_SOCKET, "Failed to set socket to non-blocking mode");
  }

  epollFd_ = epoll_create1(0);
  if (epollFd_ < 0) {
    stop();
    return Error(E_SOCKET, "Failed to create epoll instance");
  }

  struct epoll_event event;
  std::memset(&event, 0, sizeof(event));
  event.events = EPOLLIN;
  event.data.fd = socketFd_;
  if (epoll_ctl(epollFd_, EPOLL_CTL_ADD, socketFd_, &event) < 0) {
    stop();
    return Error(E_SOCKET, "Failed to add socket to epoll");
  }

  // Report the real port when an ephemeral one was requested
  struct sockaddr_in bound;
  socklen_t boundLen = sizeof(bound);
  endpoint_ = endpoint;
  if (getsockname(socketFd_, (struct sockaddr *)&bound, &boundLen) == 0) {
    endpoint_.port = ntohs(bound.sin_port);
  }

  listening_ = true;
  return {};
}

TcpServer::Roe<TcpConnection> TcpServer::accept() {
  if (!listening_) {
    return Error(E_STATE, "Server not listening");
  }

  struct sockaddr_in client_addr;
  socklen_t client_len = sizeof(client_addr);

  int client_fd =
      ::accept(socketFd_, (struct sockaddr *)&client_addr, &client_len);
  if (client_fd < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return Error(E_NO_PENDING, "No pending connections");
    }
    return Error(E_SOCKET, "Failed to accept connection: " +
                               std::string(std::strerror(errno)));
  }

  // Accepted sockets inherit O_NONBLOCK on some platforms; handlers block
  int flags = fcntl(client_fd, F_GETFL, 0);
  if (flags >= 0) {
    fcntl(client_fd, F_SETFL, flags & ~O_NONBLOCK);
  }

  return TcpConnection(client_fd);
}

TcpServer::Roe<void> TcpServer::waitForEvents(int timeoutMs) {
  if (!listening_) {
    return Error(E_STATE, "Server not listening");
  }

  struct epoll_event event;
  int num_events = epoll_wait(epollFd_, &event, 1, timeoutMs);

  if (num_events < 0) {
    if (errno == EINTR) {
      return Error(E_TIMEOUT, "Interrupted while waiting for events");
    }
    return Error(E_SOCKET, "epoll_wait failed");
  }

  if (num_events == 0) {
    return Error(E_TIMEOUT, "Timeout waiting for events");
  }

  return {};
}

void TcpServer::stop() {
  if (epollFd_ >= 0) {
    ::close(epollFd_);
    epollFd_ = -1;
  }
  if (socketFd_ >= 0) {
    ::close(socketFd_);
    socketFd_ = -1;
  }
  listening_ = false;
}

} // namespace network
} // namespace qc

#include "TcpConnection.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace qc {
namespace network {

TcpConnection::TcpConnection(int socket_fd) : socketFd_(socket_fd) {
  struct sockaddr_in peer_addr;
  socklen_t addr_len = sizeof(peer_addr);
  if (getpeername(socketFd_, (struct sockaddr *)&peer_addr, &addr_len) == 0 &&
      peer_addr.sin_family == AF_INET) {
    char addr_str[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &peer_addr.sin_addr, addr_str, INET_ADDRSTRLEN);
    peer_.address = addr_str;
    peer_.port = ntohs(peer_addr.sin_port);
  }
}

TcpConnection::~TcpConnection() { close(); }

TcpConnection::TcpConnection(TcpConnection &&other) noexcept
    : socketFd_(other.socketFd_), peer_(std::move(other.peer_)) {
  other.socketFd_ = -1;
  other.peer_ = {};
}

TcpConnection &TcpConnection::operator=(TcpConnection &&other) noexcept {
  if (this != &other) {
    close();
    socketFd_ = other.socketFd_;
    peer_ = std::move(other.peer_);
    other.socketFd_ = -1;
    other.peer_ = {};
  }
  return *this;
}

TcpConnection::Roe<size_t> TcpConnection::send(const void *data,
                                               size_t length) {
  if (socketFd_ < 0) {
    return Error(E_CLOSED, "Connection closed");
  }

  const char *ptr = static_cast<const char *>(data);
  size_t total = 0;
  while (total < length) {
    ssize_t sent = ::send(socketFd_, ptr + total, length - total, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return Error(E_TIMEOUT, "Send timeout");
      }
      return Error(E_SEND, "Failed to send data: " +
                               std::string(std::strerror(errno)));
    }
    total += static_cast<size_t>(sent);
  }
  return total;
}

TcpConnection::Roe<size_t> TcpConnection::send(const std::string &message) {
  return send(message.data(), message.size());
}

TcpConnection::Roe<size_t>
TcpConnection::sendAndShutdown(const std::string &message) {
  auto result = send(message);
  if (!result) {
    return result;
  }

  auto shutdownResult = shutdownWrite();
  if (!shutdownResult) {
    return shutdownResult.error();
  }
  return result;
}

TcpConnection::Roe<void> TcpConnection::shutdownWrite() {
  if (socketFd_ < 0) {
    return Error(E_CLOSED, "Connection closed");
  }

  if (shutdown(socketFd_, SHUT_WR) < 0) {
    return Error(E_SOCKET, "Failed to shutdown write: " +
                               std::string(std::strerror(errno)));
  }
  return {};
}

TcpConnection::Roe<size_t> TcpConnection::receive(void *buffer,
                                                  size_t maxLength) {
  if (socketFd_ < 0) {
    return Error(E_CLOSED, "Connection closed");
  }

  while (true) {
    ssize_t received = recv(socketFd_, buffer, maxLength, 0);
    if (received < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return Error(E_TIMEOUT, "Receive timeout (no data within socket timeout)");
      }
      return Error(E_RECEIVE, "Failed to receive data: " +
                                  std::string(std::strerror(errno)));
    }
    if (received == 0) {
      return Error(E_PEER_CLOSED, "Connection closed by peer");
    }
    return static_cast<size_t>(received);
  }
}

TcpConnection::Roe<std::string> TcpConnection::receiveAll(size_t maxBytes) {
  return receiveUntil([](const std::string &) { return false; }, maxBytes);
}

TcpConnection::Roe<void>
TcpConnection::setTimeout(std::chrono::milliseconds timeout) {
  if (socketFd_ < 0) {
    return Error(E_CLOSED, "Connection closed");
  }

  struct timeval tv;
  tv.tv_sec = timeout.count() / 1000;
  tv.tv_usec = (timeout.count() % 1000) * 1000;

  if (setsockopt(socketFd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
    return Error(E_SOCKET, "Failed to set receive timeout: " +
                               std::string(std::strerror(errno)));
  }
  if (setsockopt(socketFd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
    return Error(E_SOCKET, "Failed to set send timeout: " +
                               std::string(std::strerror(errno)));
  }
  return {};
}

void TcpConnection::close() {
  if (socketFd_ >= 0) {
    ::close(socketFd_);
    socketFd_ = -1;
  }
}

} // namespace network
} // namespace qc

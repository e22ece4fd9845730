#include "solo/socket.hpp"
#include "solo/logger.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace solo {

std::string Endpoint::toString() const {
  if (address.find(':') != std::string::npos) {
    return "[" + address + "]:" + std::to_string(port);
  }
  return address + ":" + std::to_string(port);
}

Socket::~Socket() { close(); }

Socket::Socket(Socket &&other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Socket &Socket::operator=(Socket &&other) noexcept {
  if (this != &other) {
    close();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

void Socket::close() {
  if (fd_ != -1) {
    ::close(fd_);
    fd_ = -1;
  }
}

void Socket::shutdown() {
  if (fd_ != -1) {
    ::shutdown(fd_, SHUT_RDWR);
  }
}

uint16_t Socket::localPort() const {
  if (fd_ == -1) {
    return 0;
  }

  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
    return 0;
  }

  if (addr.ss_family == AF_INET) {
    return ntohs(reinterpret_cast<sockaddr_in *>(&addr)->sin_port);
  }
  if (addr.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<sockaddr_in6 *>(&addr)->sin6_port);
  }
  return 0;
}

std::string connectAddress(const std::string &address) {
  if (address.empty() || address == "0.0.0.0") {
    return "127.0.0.1";
  }
  if (address == "::" || address == "::0") {
    return "::1";
  }
  return address;
}

Socket connectTo(const Endpoint &endpoint, std::string *error) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *res = nullptr;

  const std::string host = connectAddress(endpoint.address);
  const std::string port = std::to_string(endpoint.port);
  int rc = getaddrinfo(host.c_str(), port.c_str(), &hints, &res);
  if (rc != 0) {
    if (error)
      *error = "getaddrinfo(" + host + ") failed: " + gai_strerror(rc);
    return Socket{};
  }

  Socket socket;
  std::string lastError = "no usable address";
  for (addrinfo *it = res; it; it = it->ai_next) {
    int fd = ::socket(it->ai_family, it->ai_socktype | SOCK_CLOEXEC,
                      it->ai_protocol);
    if (fd == -1) {
      lastError = strerror(errno);
      continue;
    }

    int rcConnect;
    do {
      rcConnect = ::connect(fd, it->ai_addr, it->ai_addrlen);
    } while (rcConnect == -1 && errno == EINTR);

    if (rcConnect == 0) {
      socket = Socket(fd);
      break;
    }
    lastError = strerror(errno);
    ::close(fd);
  }
  freeaddrinfo(res);

  if (!socket.valid() && error) {
    *error = "connect to " + endpoint.toString() + " failed: " + lastError;
  }
  return socket;
}

bool sendAll(const Socket &socket, std::string_view data) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = ::send(socket.fd(), data.data() + sent, data.size() - sent,
                       MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

std::string receiveAll(const Socket &socket, std::size_t limit) {
  std::string data;
  data.resize(limit);
  std::size_t received = 0;

  while (received < limit) {
    ssize_t n = ::recv(socket.fd(), data.data() + received, limit - received, 0);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      // Timeout or reset: keep what arrived.
      break;
    }
    if (n == 0) {
      break;
    }
    received += static_cast<std::size_t>(n);
  }

  data.resize(received);
  return data;
}

void setReceiveTimeout(const Socket &socket, int milliseconds) {
  timeval tv{};
  tv.tv_sec = milliseconds / 1000;
  tv.tv_usec = (milliseconds % 1000) * 1000;
  if (setsockopt(socket.fd(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
    LOG_DEBUG("Failed to set SO_RCVTIMEO: " + std::string(strerror(errno)));
  }
}

} // namespace solo

#include "solo/endpoint.hpp"
#include "solo/errors.hpp"
#include "solo/logger.hpp"
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace solo {

EndpointMutex::EndpointMutex(Endpoint endpoint)
    : endpoint_(std::move(endpoint)) {}

bool EndpointMutex::tryAcquire() {
  if (held()) {
    return true;
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;
  addrinfo *res = nullptr;

  const std::string port = std::to_string(endpoint_.port);
  int rc = getaddrinfo(endpoint_.address.c_str(), port.c_str(), &hints, &res);
  if (rc != 0) {
    throw ConfigError("Cannot resolve address '" + endpoint_.address +
                      "': " + gai_strerror(rc));
  }

  // Only the first resolved address takes part: falling back to another
  // family after EADDRINUSE would hand out a second "mutex".
  Socket socket(::socket(res->ai_family, res->ai_socktype | SOCK_CLOEXEC,
                         res->ai_protocol));
  if (!socket.valid()) {
    int err = errno;
    freeaddrinfo(res);
    throw std::system_error(err, std::generic_category(),
                            "socket() for " + endpoint_.toString());
  }

  // Lets a released endpoint be taken again while old connections linger in
  // TIME_WAIT. A port with a live listener still refuses a second listen().
  int opt = 1;
  if (setsockopt(socket.fd(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) !=
      0) {
    LOG_WARN("Failed to set SO_REUSEADDR on " + endpoint_.toString() + ": " +
             std::string(strerror(errno)));
  }

  int bindRc = ::bind(socket.fd(), res->ai_addr, res->ai_addrlen);
  int bindErr = errno;
  freeaddrinfo(res);

  if (bindRc != 0) {
    if (bindErr == EADDRINUSE) {
      LOG_DEBUG("Endpoint " + endpoint_.toString() + " is already bound");
      return false;
    }
    throw std::system_error(bindErr, std::generic_category(),
                            "bind " + endpoint_.toString());
  }

  if (::listen(socket.fd(), SOMAXCONN) != 0) {
    int err = errno;
    if (err == EADDRINUSE) {
      LOG_DEBUG("Endpoint " + endpoint_.toString() + " is already listening");
      return false;
    }
    throw std::system_error(err, std::generic_category(),
                            "listen " + endpoint_.toString());
  }

  endpoint_.port = socket.localPort();
  socket_ = std::move(socket);
  LOG_DEBUG("Acquired endpoint " + endpoint_.toString());
  return true;
}

Socket EndpointMutex::takeSocket() { return std::move(socket_); }

} // namespace solo

#ifndef SOLO_SOCKET_HPP
#define SOLO_SOCKET_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace solo {

struct Endpoint {
  std::string address = "127.0.0.1";
  uint16_t port = 1337;

  // "127.0.0.1:1337", "[::1]:1337"
  std::string toString() const;
};

// Owning wrapper around a socket descriptor.
class Socket {
public:
  Socket() = default;
  explicit Socket(int fd) : fd_(fd) {}
  ~Socket();

  Socket(const Socket &) = delete;
  Socket &operator=(const Socket &) = delete;
  Socket(Socket &&other) noexcept;
  Socket &operator=(Socket &&other) noexcept;

  bool valid() const { return fd_ != -1; }
  int fd() const { return fd_; }

  void close();
  // Wakes up any thread blocked on this descriptor without closing it.
  void shutdown();

  // Port the descriptor is bound to, 0 if unbound.
  uint16_t localPort() const;

private:
  int fd_ = -1;
};

// The address a local process should connect to in order to reach a socket
// bound to `address`. Wildcards map to the loopback of the same family.
std::string connectAddress(const std::string &address);

// Opens a TCP connection. Returns an invalid Socket on failure and, when
// `error` is given, a description of what went wrong.
Socket connectTo(const Endpoint &endpoint, std::string *error = nullptr);

// Writes the whole buffer, retrying on short writes and EINTR.
bool sendAll(const Socket &socket, std::string_view data);

// Reads until the peer closes, `limit` bytes were read, or the receive
// timeout set on the socket expires.
std::string receiveAll(const Socket &socket, std::size_t limit);

void setReceiveTimeout(const Socket &socket, int milliseconds);

} // namespace solo

#endif // SOLO_SOCKET_HPP

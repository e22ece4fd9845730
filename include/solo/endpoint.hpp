#ifndef SOLO_ENDPOINT_HPP
#define SOLO_ENDPOINT_HPP

#include "solo/socket.hpp"

namespace solo {

// Exclusive bind of a TCP endpoint used as a cross-process mutex. The
// operating system guarantees that only one listener owns an (address, port)
// pair, so whoever binds it first is the host.
class EndpointMutex {
public:
  explicit EndpointMutex(Endpoint endpoint);

  // Returns true if the endpoint was bound and is now listening.
  // Returns false if another socket already holds it.
  // Throws ConfigError if the address cannot be resolved and
  // std::system_error for any other socket failure.
  bool tryAcquire();

  bool held() const { return socket_.valid(); }

  // After a successful acquire the port is the one actually bound, which
  // differs from the requested one when port 0 was asked for.
  const Endpoint &endpoint() const { return endpoint_; }

  // Hands the listening socket over to its new owner.
  Socket takeSocket();

private:
  Endpoint endpoint_;
  Socket socket_;
};

} // namespace solo

#endif // SOLO_ENDPOINT_HPP

#ifndef SOLO_CLIENT_HPP
#define SOLO_CLIENT_HPP

#include "solo/codec.hpp"
#include "solo/socket.hpp"
#include <optional>
#include <string>

namespace solo {

// One-shot sender used by a process that lost the endpoint race.
class ClientSender {
public:
  ClientSender(Endpoint endpoint, std::optional<std::string> secret,
               bool verbose = false);

  // Connects, sends the encoded arguments and disconnects. Failures are
  // absorbed: the caller's role is already decided, so false only means the
  // host never saw these arguments.
  bool send(const ArgumentSet &args) const;

  // Sends an already encoded message.
  bool sendRaw(const std::string &message) const;

private:
  Endpoint endpoint_;
  std::optional<std::string> secret_;
  bool verbose_;
};

} // namespace solo

#endif // SOLO_CLIENT_HPP

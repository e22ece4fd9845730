#include "solo/client.hpp"
#include "solo/logger.hpp"

namespace solo {

ClientSender::ClientSender(Endpoint endpoint,
                           std::optional<std::string> secret, bool verbose)
    : endpoint_(std::move(endpoint)), secret_(std::move(secret)),
      verbose_(verbose) {}

bool ClientSender::send(const ArgumentSet &args) const {
  LOG_DEBUG("Forwarding " + std::to_string(args.size()) +
            " argument(s) to host at " + endpoint_.toString());
  return sendRaw(encode(args, secret_));
}

bool ClientSender::sendRaw(const std::string &message) const {
  std::string error;
  Socket socket = connectTo(endpoint_, &error);
  if (!socket.valid()) {
    if (verbose_)
      LOG_WARN("Could not reach host: " + error);
    return false;
  }

  if (!sendAll(socket, message)) {
    if (verbose_)
      LOG_WARN("Failed to send arguments to " + endpoint_.toString());
    return false;
  }

  // Signal end of message; the host reads until EOF.
  socket.shutdown();
  return true;
}

} // namespace solo

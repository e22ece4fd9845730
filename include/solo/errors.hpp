#ifndef SOLO_ERRORS_HPP
#define SOLO_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace solo {

// Invalid option values, unresolvable addresses or unreadable config files.
class ConfigError : public std::invalid_argument {
public:
  explicit ConfigError(const std::string &message)
      : std::invalid_argument(message) {}
};

// Raised in non-strict mode when another process already holds the endpoint.
class AlreadyRunningError : public std::runtime_error {
public:
  AlreadyRunningError(const std::string &address, uint16_t port)
      : std::runtime_error("Application is already bound & listening @ " +
                           address + " on port " + std::to_string(port) +
                           ". Multiple instances are disallowed in the "
                           "current context."),
        address_(address), port_(port) {}

  const std::string &address() const { return address_; }
  uint16_t port() const { return port_; }

private:
  std::string address_;
  uint16_t port_;
};

} // namespace solo

#endif // SOLO_ERRORS_HPP

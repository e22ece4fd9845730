#ifndef SOLO_SINGLETON_HPP
#define SOLO_SINGLETON_HPP

#include "solo/codec.hpp"
#include "solo/config.hpp"
#include "solo/observers.hpp"
#include "solo/role.hpp"
#include "solo/socket.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

namespace solo {

// The host side of a single-instance application. The first process to bind
// the configured endpoint gets a Singleton; later processes forward their
// arguments to it and learn that they are clients.
//
//   auto app = solo::Singleton::create(options);   // exits if not first
//   app->trace("open", [](const solo::ArgumentSet &args) { ... });
//
// Destroying the Singleton releases the endpoint. It may be destroyed from
// inside an observer; the listener thread then finishes on its own.
class Singleton {
public:
  struct Host {
    std::unique_ptr<Singleton> instance;
  };
  struct Client {
    Endpoint endpoint;
    bool sent = false; // Whether our arguments reached the host
  };
  using Acquisition = std::variant<Host, Client>;

  // Validates the options and decides the role. Never exits or throws for a
  // role conflict; throws ConfigError or std::system_error for bad options
  // and unexpected socket failures.
  static Acquisition acquire(Options options);
  // As above, with `observer` traced under `key` before the host accepts
  // its first client.
  static Acquisition acquire(Options options, const std::string &key,
                             ObserverRegistry::Callback observer);

  // acquire() followed by the strict/non-strict policy: a client either
  // terminates the process (strict) or gets AlreadyRunningError.
  static std::unique_ptr<Singleton> create(Options options);
  static std::unique_ptr<Singleton> create(Options options,
                                           const std::string &key,
                                           ObserverRegistry::Callback observer);

  ~Singleton();

  Singleton(const Singleton &) = delete;
  Singleton &operator=(const Singleton &) = delete;

  // Registers `callback` under `key`, invoked as callback(args, extra...)
  // for every delivered argument set. Extra values are copied now and
  // replayed on each call; keyword-style parameters can travel as a
  // nlohmann::json object. Re-tracing a key replaces the previous entry.
  // Sets queued while nobody was tracing are handed over right away.
  template <typename F, typename... Extra>
  void trace(const std::string &key, F &&callback, Extra &&...extra) {
    addObserver(key,
                [callback = std::forward<F>(callback),
                 bound = std::make_tuple(std::forward<Extra>(extra)...)](
                    const ArgumentSet &args) {
                  std::apply(
                      [&](const auto &...values) {
                        std::invoke(callback, args, values...);
                      },
                      bound);
                });
  }

  // A plain function is its own key.
  template <typename R, typename... Params, typename... Extra>
  void trace(R (*callback)(Params...), Extra &&...extra) {
    trace(functionKey(callback), callback, std::forward<Extra>(extra)...);
  }

  void untrace(const std::string &key);

  template <typename R, typename... Params>
  void untrace(R (*callback)(Params...)) {
    untrace(functionKey(callback));
  }

  std::size_t observerCount() const;

  Role role() const { return Role::HOST; }
  const std::string &address() const;
  uint16_t port() const;
  const Endpoint &endpoint() const;
  const Options &options() const;

  // Argument sets received while nobody was tracing, oldest first.
  std::vector<ArgumentSet> arguments() const;
  std::size_t clients() const;
  bool isListening() const;
  // False once the accept loop has exited and the endpoint is free.
  bool isBound() const;

  // Idempotent.
  void release();

  // "Singleton @ 127.0.0.1 on port 1337"
  std::string toString() const;
  // All options and counters, secret masked.
  std::string describe() const;

private:
  struct Core;

  explicit Singleton(std::shared_ptr<Core> core);

  static Acquisition acquireWith(Options options, const std::string &key,
                                 ObserverRegistry::Callback observer);

  template <typename R, typename... Params>
  static std::string functionKey(R (*callback)(Params...)) {
    return "function@" +
           std::to_string(reinterpret_cast<std::uintptr_t>(callback));
  }

  void addObserver(const std::string &key, ObserverRegistry::Callback callback);

  // Shared with the listener thread, which keeps it alive until it exits.
  std::shared_ptr<Core> core_;
};

Role roleOf(const Singleton::Acquisition &acquisition);

std::ostream &operator<<(std::ostream &os, const Singleton &singleton);

} // namespace solo

#endif // SOLO_SINGLETON_HPP

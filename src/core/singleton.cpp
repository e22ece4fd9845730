#include "solo/singleton.hpp"
#include "solo/client.hpp"
#include "solo/endpoint.hpp"
#include "solo/errors.hpp"
#include "solo/lifecycle.hpp"
#include "solo/listener.hpp"
#include "solo/logger.hpp"
#include <cstdlib>
#include <deque>
#include <mutex>
#include <sstream>

namespace solo {

// Everything the listener thread touches. Owned jointly by the Singleton and
// the running thread, so it outlives a Singleton destroyed by an observer.
struct Singleton::Core {
  Core(Options opts, Socket socket, Endpoint bound)
      : options(std::move(opts)), endpoint(std::move(bound)),
        observers(options.verbose),
        lifecycle(endpoint,
                  Thresholds{options.releaseThreshold, options.maxClients},
                  observers),
        listener(std::move(socket), lifecycle, options.secret,
                 options.verbose,
                 [this](ArgumentSet args) { deliver(std::move(args)); }) {}

  void deliver(ArgumentSet args) {
    {
      std::lock_guard<std::mutex> lock(pendingMutex);
      pending.push_back(std::move(args));
    }
    drain();
  }

  // Hands queued sets to the observers in arrival order. One thread drains
  // at a time; a set queued meanwhile is picked up by that thread, so
  // delivery never blocks on a running observer.
  void drain() {
    {
      std::lock_guard<std::mutex> lock(pendingMutex);
      if (draining) {
        return;
      }
      draining = true;
    }

    for (;;) {
      ArgumentSet next;
      {
        std::lock_guard<std::mutex> lock(pendingMutex);
        if (pending.empty() || !lifecycle.listening() || observers.empty()) {
          draining = false;
          return;
        }
        next = std::move(pending.front());
        pending.pop_front();
      }
      observers.publish(next);
    }
  }

  Options options;
  Endpoint endpoint;

  mutable std::mutex pendingMutex;
  std::deque<ArgumentSet> pending;

  bool draining = false; // Guarded by pendingMutex

  ObserverRegistry observers;
  Lifecycle lifecycle;
  HostListener listener;
};

Singleton::Acquisition Singleton::acquire(Options options) {
  return acquireWith(std::move(options), "", nullptr);
}

Singleton::Acquisition Singleton::acquire(Options options,
                                          const std::string &key,
                                          ObserverRegistry::Callback observer) {
  return acquireWith(std::move(options), key, std::move(observer));
}

Singleton::Acquisition
Singleton::acquireWith(Options options, const std::string &key,
                       ObserverRegistry::Callback observer) {
  validate(options);

  Endpoint requested{options.address, static_cast<uint16_t>(options.port)};
  EndpointMutex mutex(requested);

  if (mutex.tryAcquire()) {
    LOG_DEBUG("Role: " + roleString(Role::HOST) + " @ " +
              mutex.endpoint().toString());
    Endpoint bound = mutex.endpoint();
    auto core = std::make_shared<Core>(std::move(options), mutex.takeSocket(),
                                       std::move(bound));
    if (observer) {
      core->observers.add(key, std::move(observer));
    }

    core->lifecycle.start(core->options.timeout);
    core->listener.start(core);
    LOG_INFO("Singleton locked @ " + core->endpoint.toString());
    return Host{std::unique_ptr<Singleton>(new Singleton(std::move(core)))};
  }

  LOG_DEBUG("Role: " + roleString(Role::CLIENT) + " of " +
            requested.toString());
  Client client{requested, false};
  if (options.client) {
    ClientSender sender(requested, options.secret, options.verbose);
    client.sent = sender.send(options.arguments);
  }
  return client;
}

std::unique_ptr<Singleton> Singleton::create(Options options) {
  return create(std::move(options), "", nullptr);
}

std::unique_ptr<Singleton> Singleton::create(Options options,
                                             const std::string &key,
                                             ObserverRegistry::Callback observer) {
  const bool strict = options.strict;
  const std::string address = options.address;
  const auto port = static_cast<uint16_t>(options.port);

  auto acquisition = acquireWith(std::move(options), key, std::move(observer));
  if (auto *host = std::get_if<Host>(&acquisition)) {
    return std::move(host->instance);
  }

  if (strict) {
    std::exit(EXIT_SUCCESS);
  }
  throw AlreadyRunningError(address, port);
}

Singleton::Singleton(std::shared_ptr<Core> core) : core_(std::move(core)) {}

Singleton::~Singleton() {
  release();
  // From inside an observer this returns at once; the listener thread drops
  // the last reference to the core when its loop exits.
  core_->listener.join();
}

void Singleton::addObserver(const std::string &key,
                            ObserverRegistry::Callback callback) {
  // The callback may destroy this Singleton while the queue drains.
  auto core = core_;
  core->observers.add(key, std::move(callback));
  core->drain();
}

void Singleton::untrace(const std::string &key) {
  core_->observers.remove(key);
}

std::size_t Singleton::observerCount() const {
  return core_->observers.size();
}

const std::string &Singleton::address() const {
  return core_->endpoint.address;
}

uint16_t Singleton::port() const { return core_->endpoint.port; }

const Endpoint &Singleton::endpoint() const { return core_->endpoint; }

const Options &Singleton::options() const { return core_->options; }

std::vector<ArgumentSet> Singleton::arguments() const {
  std::lock_guard<std::mutex> lock(core_->pendingMutex);
  return {core_->pending.begin(), core_->pending.end()};
}

std::size_t Singleton::clients() const { return core_->lifecycle.clients(); }

bool Singleton::isListening() const { return core_->lifecycle.listening(); }

bool Singleton::isBound() const { return core_->listener.running(); }

void Singleton::release() { core_->lifecycle.release(); }

std::string Singleton::toString() const {
  return "Singleton @ " + address() + " on port " + std::to_string(port());
}

std::string Singleton::describe() const {
  const Options &opts = core_->options;
  std::ostringstream ss;
  ss << std::boolalpha << "Singleton(address=" << address()
     << ", port=" << port() << ", timeout=" << opts.timeout
     << ", client=" << opts.client << ", strict=" << opts.strict
     << ", release_threshold=" << opts.releaseThreshold
     << ", max_clients=" << opts.maxClients << ", verbose=" << opts.verbose
     << ", secret=" << (opts.secret ? "***" : "none")
     << ", observers=" << observerCount() << ", clients=" << clients()
     << ", listening=" << isListening() << ")";
  return ss.str();
}

Role roleOf(const Singleton::Acquisition &acquisition) {
  return std::holds_alternative<Singleton::Host>(acquisition) ? Role::HOST
                                                              : Role::CLIENT;
}

std::ostream &operator<<(std::ostream &os, const Singleton &singleton) {
  return os << singleton.toString();
}

} // namespace solo

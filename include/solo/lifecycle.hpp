#ifndef SOLO_LIFECYCLE_HPP
#define SOLO_LIFECYCLE_HPP

#include "solo/observers.hpp"
#include "solo/socket.hpp"
#include "solo/timer.hpp"
#include <atomic>
#include <cstddef>
#include <memory>

namespace solo {

struct Thresholds {
  int releaseThreshold = 0; // 0 = never auto-release
  int maxClients = 0;       // 0 = process every client
};

// Listening flag, client counter, thresholds, auto-release timer and the
// idempotent release of a host.
class Lifecycle {
public:
  Lifecycle(Endpoint endpoint, Thresholds thresholds,
            ObserverRegistry &observers);
  ~Lifecycle();

  Lifecycle(const Lifecycle &) = delete;
  Lifecycle &operator=(const Lifecycle &) = delete;

  // Marks the host as listening and arms the timer when timeoutSeconds > 0.
  void start(int timeoutSeconds);

  bool listening() const { return listening_.load(); }
  std::size_t clients() const { return clients_.load(); }
  const Thresholds &thresholds() const { return thresholds_; }

  // Counts one accepted client and returns the new total.
  std::size_t recordClient();

  bool overMaxClients(std::size_t count) const;
  bool reachedReleaseThreshold(std::size_t count) const;

  // Stops listening, cancels the timer, drops every observer and wakes the
  // accept loop. Only the first call does anything; it returns true.
  bool release();

private:
  void wakeListener() const;

  Endpoint endpoint_;
  Thresholds thresholds_;
  ObserverRegistry &observers_;

  std::atomic<bool> listening_{false};
  std::atomic<bool> released_{false};
  std::atomic<std::size_t> clients_{0};
  std::unique_ptr<CountdownTimer> timer_;
};

} // namespace solo

#endif // SOLO_LIFECYCLE_HPP

#ifndef SOLO_LISTENER_HPP
#define SOLO_LISTENER_HPP

#include "solo/codec.hpp"
#include "solo/lifecycle.hpp"
#include "solo/socket.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace solo {

// Accept loop of a host. Connections are served one at a time on a
// background thread: read one message, authenticate, decode, deliver.
class HostListener {
public:
  using Deliver = std::function<void(ArgumentSet)>;

  // Bound on how long a silent client may hold up the loop.
  static constexpr int kReceiveTimeoutMs = 2000;

  HostListener(Socket socket, Lifecycle &lifecycle,
               std::optional<std::string> secret, bool verbose,
               Deliver deliver);
  ~HostListener();

  HostListener(const HostListener &) = delete;
  HostListener &operator=(const HostListener &) = delete;

  // Runs the loop on a new thread. `owner` stays alive until the loop exits,
  // so whatever it owns, this listener included, may be dropped by its
  // other holders from inside a delivery.
  void start(std::shared_ptr<void> owner);

  // Waits for the loop to exit after the lifecycle was released. Returns at
  // once when called from the loop itself.
  void join();

  // True until the loop has exited and closed the listening socket.
  bool running() const { return running_.load(); }

private:
  void run();
  // Returns false when the loop must stop.
  bool handle(Socket connection);
  void report(const std::string &message) const;
  void closeSocket();

  Socket socket_;
  std::mutex socketMutex_;
  Lifecycle &lifecycle_;
  std::optional<std::string> secret_;
  bool verbose_;
  Deliver deliver_;

  std::thread thread_;
  std::atomic<bool> running_{false};
};

} // namespace solo

#endif // SOLO_LISTENER_HPP

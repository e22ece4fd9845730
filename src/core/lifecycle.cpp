#include "solo/lifecycle.hpp"
#include "solo/logger.hpp"

namespace solo {

Lifecycle::Lifecycle(Endpoint endpoint, Thresholds thresholds,
                     ObserverRegistry &observers)
    : endpoint_(std::move(endpoint)), thresholds_(thresholds),
      observers_(observers) {}

Lifecycle::~Lifecycle() {
  // Joins a timer thread that may still be inside release().
  timer_.reset();
}

void Lifecycle::start(int timeoutSeconds) {
  listening_ = true;

  if (timeoutSeconds > 0) {
    timer_ = std::make_unique<CountdownTimer>(
        std::chrono::seconds(timeoutSeconds), [this]() {
          LOG_INFO("Timeout reached, releasing " + endpoint_.toString());
          release();
        });
    timer_->start();
  }
}

std::size_t Lifecycle::recordClient() { return ++clients_; }

bool Lifecycle::overMaxClients(std::size_t count) const {
  return thresholds_.maxClients > 0 &&
         count > static_cast<std::size_t>(thresholds_.maxClients);
}

bool Lifecycle::reachedReleaseThreshold(std::size_t count) const {
  return thresholds_.releaseThreshold > 0 &&
         count >= static_cast<std::size_t>(thresholds_.releaseThreshold);
}

bool Lifecycle::release() {
  if (released_.exchange(true)) {
    return false;
  }

  listening_ = false;
  if (timer_) {
    timer_->cancel();
  }
  observers_.clear();
  wakeListener();

  LOG_INFO("Released " + endpoint_.toString() + " after " +
           std::to_string(clients_.load()) + " client(s)");
  return true;
}

// accept() cannot be interrupted portably, so connect to ourselves and send
// an empty message. If the socket is already gone there is nothing to wake.
void Lifecycle::wakeListener() const {
  std::string error;
  Socket socket = connectTo(endpoint_, &error);
  if (!socket.valid()) {
    LOG_DEBUG("Wake-up connection skipped: " + error);
    return;
  }
  if (!sendAll(socket, "")) {
    LOG_DEBUG("Wake-up send failed on " + endpoint_.toString());
  }
}

} // namespace solo

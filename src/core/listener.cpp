#include "solo/listener.hpp"
#include "solo/logger.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sys/socket.h>

namespace solo {

HostListener::HostListener(Socket socket, Lifecycle &lifecycle,
                           std::optional<std::string> secret, bool verbose,
                           Deliver deliver)
    : socket_(std::move(socket)), lifecycle_(lifecycle),
      secret_(std::move(secret)), verbose_(verbose),
      deliver_(std::move(deliver)) {}

HostListener::~HostListener() {
  join();
  if (thread_.joinable()) {
    // The owner's last reference went away on the loop thread, after run()
    // returned; nothing touches this object any more.
    thread_.detach();
  }
  closeSocket();
}

void HostListener::start(std::shared_ptr<void> owner) {
  running_ = true;
  thread_ = std::thread([this, owner = std::move(owner)]() { run(); });
}

void HostListener::join() {
  if (!thread_.joinable() || thread_.get_id() == std::this_thread::get_id()) {
    return;
  }

  {
    // Fallback for a lost wake-up connection: a shut down listening socket
    // makes accept() fail right away on Linux.
    std::lock_guard<std::mutex> lock(socketMutex_);
    socket_.shutdown();
  }
  thread_.join();
}

void HostListener::run() {
  int listenFd;
  {
    std::lock_guard<std::mutex> lock(socketMutex_);
    listenFd = socket_.fd();
  }

  while (lifecycle_.listening()) {
    int fd = ::accept4(listenFd, nullptr, nullptr, SOCK_CLOEXEC);
    if (fd < 0) {
      if (!lifecycle_.listening()) {
        break;
      }
      if (errno == EINTR || errno == ECONNABORTED) {
        continue;
      }
      if (errno == EBADF || errno == EINVAL) {
        // Socket shut down underneath us.
        break;
      }
      report("accept() failed: " + std::string(strerror(errno)));
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      continue;
    }

    if (!handle(Socket(fd))) {
      break;
    }
  }

  closeSocket();
  running_ = false;
  LOG_DEBUG("Listener stopped");
}

bool HostListener::handle(Socket connection) {
  // The wake-up connection from release() is not a client.
  if (!lifecycle_.listening()) {
    return false;
  }

  std::size_t count = lifecycle_.recordClient();

  setReceiveTimeout(connection, kReceiveTimeoutMs);
  std::string message = receiveAll(connection, kMaxMessageSize);
  connection.close();

  if (lifecycle_.overMaxClients(count)) {
    LOG_DEBUG("Client #" + std::to_string(count) +
              " exceeds max_clients, arguments ignored");
  } else {
    try {
      auto args = decode(message, secret_);
      if (args) {
        deliver_(std::move(*args));
      } else {
        LOG_DEBUG("Client #" + std::to_string(count) +
                  " sent no usable arguments");
      }
    } catch (const std::exception &e) {
      report("Failed to process client #" + std::to_string(count) + ": " +
             e.what());
    }
  }

  if (lifecycle_.reachedReleaseThreshold(count)) {
    LOG_INFO("Release threshold of " +
             std::to_string(lifecycle_.thresholds().releaseThreshold) +
             " client(s) reached");
    lifecycle_.release();
    return false;
  }
  return true;
}

void HostListener::report(const std::string &message) const {
  if (verbose_) {
    LOG_WARN(message);
  } else {
    LOG_DEBUG(message);
  }
}

void HostListener::closeSocket() {
  std::lock_guard<std::mutex> lock(socketMutex_);
  socket_.close();
}

} // namespace solo

#include "solo/observers.hpp"
#include "solo/logger.hpp"
#include <algorithm>

namespace solo {

ObserverRegistry::ObserverRegistry(bool verbose) : verbose_(verbose) {}

void ObserverRegistry::add(const std::string &key, Callback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const Entry &e) { return e.key == key; });
  if (it != entries_.end()) {
    it->callback = std::move(callback);
    return;
  }
  entries_.push_back({key, std::move(callback)});
}

bool ObserverRegistry::remove(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::remove_if(entries_.begin(), entries_.end(),
                           [&](const Entry &e) { return e.key == key; });
  if (it == entries_.end()) {
    return false;
  }
  entries_.erase(it, entries_.end());
  return true;
}

void ObserverRegistry::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

bool ObserverRegistry::contains(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::any_of(entries_.begin(), entries_.end(),
                     [&](const Entry &e) { return e.key == key; });
}

std::size_t ObserverRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

bool ObserverRegistry::empty() const { return size() == 0; }

void ObserverRegistry::report(const std::string &message) const {
  if (verbose_) {
    LOG_WARN(message);
  } else {
    LOG_DEBUG(message);
  }
}

std::size_t ObserverRegistry::publish(const ArgumentSet &args) const {
  std::vector<Entry> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot = entries_;
  }

  std::size_t completed = 0;
  for (const auto &entry : snapshot) {
    try {
      entry.callback(args);
      ++completed;
    } catch (const std::exception &e) {
      report("Observer '" + entry.key + "' failed: " + e.what());
    } catch (...) {
      report("Observer '" + entry.key + "' threw a non-standard exception");
    }
  }
  return completed;
}

} // namespace solo

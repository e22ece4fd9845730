#ifndef SOLO_OBSERVERS_HPP
#define SOLO_OBSERVERS_HPP

#include "solo/codec.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace solo {

// Publish/subscribe table of argument observers, kept in registration order.
class ObserverRegistry {
public:
  using Callback = std::function<void(const ArgumentSet &)>;

  explicit ObserverRegistry(bool verbose = false);

  // Re-adding a key replaces its callback in place.
  void add(const std::string &key, Callback callback);
  // Returns false if nothing was registered under `key`.
  bool remove(const std::string &key);
  void clear();

  bool contains(const std::string &key) const;
  std::size_t size() const;
  bool empty() const;

  // Invokes every observer registered when the call started. An observer
  // that throws is skipped; the rest still run. Returns how many completed.
  std::size_t publish(const ArgumentSet &args) const;

private:
  struct Entry {
    std::string key;
    Callback callback;
  };

  void report(const std::string &message) const;

  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
  bool verbose_;
};

} // namespace solo

#endif // SOLO_OBSERVERS_HPP

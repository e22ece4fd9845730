#ifndef SOLO_CONFIG_HPP
#define SOLO_CONFIG_HPP

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace solo {

// Construction parameters of a Singleton.
struct Options {
  std::string address = "127.0.0.1";
  int port = 1337; // Prefer 49152-65535; 0 lets the OS pick one
  int timeout = 0; // Seconds before auto-release, 0 = keep the endpoint
  bool client = true;  // Forward our arguments when another host exists
  bool strict = true;  // Exit instead of throwing AlreadyRunningError
  int releaseThreshold = 0; // Release after this many clients, 0 = never
  int maxClients = 0;       // Process this many clients, 0 = all
  bool verbose = false;
  std::optional<std::string> secret;

  // This invocation's arguments, program name excluded.
  std::vector<std::string> arguments;
};

// Throws ConfigError describing the first invalid value.
void validate(const Options &options);

// Host name (RFC 1123) or numeric IPv4/IPv6 address.
bool isValidAddress(const std::string &address);

// Reads the "singleton" section of a config document into `options`;
// missing keys keep their current values. Throws ConfigError on type errors.
void applyJson(const nlohmann::json &j, Options &options);
nlohmann::json toJson(const Options &options);

class Config {
public:
  static Config &instance();

  // A missing file keeps the defaults unless `required` is set. Parse
  // errors throw ConfigError when `required`, otherwise they are logged.
  void load(const std::filesystem::path &configPath, bool required = false);
  void save();

  Options &getOptions() { return options_; }
  const std::filesystem::path &path() const { return configPath_; }

  // Forbidden
  Config(const Config &) = delete;
  Config &operator=(const Config &) = delete;

private:
  Config() = default;
  ~Config() = default;

  std::filesystem::path configPath_;
  Options options_;

  std::recursive_mutex mutex_;
};

} // namespace solo

#endif // SOLO_CONFIG_HPP

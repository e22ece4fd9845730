#include "solo/config.hpp"
#include "solo/codec.hpp"
#include "solo/errors.hpp"
#include "solo/logger.hpp"
#include <arpa/inet.h>
#include <cctype>
#include <fstream>
#include <iostream>

namespace solo {

using json = nlohmann::json;

bool isValidAddress(const std::string &address) {
  if (address.empty()) {
    return false;
  }

  in_addr v4{};
  in6_addr v6{};
  if (inet_pton(AF_INET, address.c_str(), &v4) == 1 ||
      inet_pton(AF_INET6, address.c_str(), &v6) == 1) {
    return true;
  }

  if (address.size() > 253) {
    return false;
  }

  // Dotted labels of letters, digits and inner hyphens, 63 chars at most.
  std::size_t labelStart = 0;
  while (labelStart <= address.size()) {
    std::size_t labelEnd = address.find('.', labelStart);
    if (labelEnd == std::string::npos)
      labelEnd = address.size();

    std::size_t len = labelEnd - labelStart;
    if (len == 0 || len > 63)
      return false;
    if (address[labelStart] == '-' || address[labelEnd - 1] == '-')
      return false;
    for (std::size_t i = labelStart; i < labelEnd; ++i) {
      auto c = static_cast<unsigned char>(address[i]);
      if (!std::isalnum(c) && c != '-')
        return false;
    }
    labelStart = labelEnd + 1;
  }
  return true;
}

void validate(const Options &options) {
  if (!isValidAddress(options.address)) {
    throw ConfigError("address must be a valid host name or IP address, got '" +
                      options.address + "'");
  }
  if (options.port < 0 || options.port > 65535) {
    throw ConfigError("port must be between 0 and 65535, got " +
                      std::to_string(options.port));
  }
  if (options.timeout < 0) {
    throw ConfigError("timeout must be greater than or equal to 0, got " +
                      std::to_string(options.timeout));
  }
  if (options.releaseThreshold < 0) {
    throw ConfigError(
        "release_threshold must be greater than or equal to 0, got " +
        std::to_string(options.releaseThreshold));
  }
  if (options.maxClients < 0) {
    throw ConfigError("max_clients must be greater than or equal to 0, got " +
                      std::to_string(options.maxClients));
  }
  if (options.secret) {
    if (options.secret->empty()) {
      throw ConfigError("secret must not be empty");
    }
    if (options.secret->find('\0') != std::string::npos) {
      throw ConfigError("secret must not contain NUL characters");
    }
    // Messages are sanitized before the secret is compared.
    if (sanitizeUtf8(*options.secret) != *options.secret) {
      throw ConfigError("secret must be valid UTF-8");
    }
  }
}

void applyJson(const json &j, Options &options) {
  if (!j.contains("singleton")) {
    return;
  }

  try {
    auto &s = j.at("singleton");
    options.address = s.value("address", options.address);
    options.port = s.value("port", options.port);
    options.timeout = s.value("timeout", options.timeout);
    options.client = s.value("client", options.client);
    options.strict = s.value("strict", options.strict);
    options.releaseThreshold =
        s.value("release_threshold", options.releaseThreshold);
    options.maxClients = s.value("max_clients", options.maxClients);
    options.verbose = s.value("verbose", options.verbose);

    if (s.contains("secret")) {
      if (s["secret"].is_null()) {
        options.secret.reset();
      } else {
        options.secret = s["secret"].get<std::string>();
      }
    }
  } catch (const json::exception &e) {
    throw ConfigError("Invalid singleton configuration: " +
                      std::string(e.what()));
  }
}

json toJson(const Options &options) {
  json j;
  j["singleton"] = {{"address", options.address},
                    {"port", options.port},
                    {"timeout", options.timeout},
                    {"client", options.client},
                    {"strict", options.strict},
                    {"release_threshold", options.releaseThreshold},
                    {"max_clients", options.maxClients},
                    {"verbose", options.verbose}};

  if (options.secret) {
    j["singleton"]["secret"] = *options.secret;
  } else {
    j["singleton"]["secret"] = nullptr;
  }
  return j;
}

Config &Config::instance() {
  static Config instance;
  return instance;
}

void Config::load(const std::filesystem::path &path, bool required) {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  configPath_ = path;

  if (!std::filesystem::exists(path)) {
    if (required) {
      throw ConfigError("Config file not found: " + path.string());
    }
    LOG_DEBUG("Config file not found at " + path.string() +
              ". Using defaults.");
    return;
  }

  try {
    std::ifstream file(path);
    json j;
    file >> j;

    Options loaded = options_;
    applyJson(j, loaded);
    options_ = loaded;

    LOG_INFO("Configuration loaded from " + path.string());
  } catch (const std::exception &e) {
    if (required) {
      throw ConfigError("Failed to parse config file " + path.string() + ": " +
                        e.what());
    }
    LOG_ERROR("Failed to parse config file: " + std::string(e.what()));
  }
}

void Config::save() {
  std::lock_guard<std::recursive_mutex> lock(mutex_);
  if (configPath_.empty())
    return;

  if (configPath_.has_parent_path()) {
    std::filesystem::create_directories(configPath_.parent_path());
  }

  try {
    std::ofstream file(configPath_);
    file << toJson(options_).dump(4);
    LOG_INFO("Configuration saved to " + configPath_.string());
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to write config file: " + std::string(e.what()));
  }
}

} // namespace solo

#include "solo/config.hpp"
#include "solo/errors.hpp"
#include "solo/logger.hpp"
#include "solo/path_manager.hpp"
#include "solo/singleton.hpp"
#include "solo/version.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace {

volatile std::sig_atomic_t gStopRequested = 0;

void onSignal(int) { gStopRequested = 1; }

void showHelp() {
  std::cout
      << "solo - run a single instance, forward arguments to it\n\n"
      << "Usage: solo [flags] [--] [args...]\n\n"
      << "The first solo on an endpoint becomes the host and prints every\n"
      << "argument list later invocations send to it, one per line.\n\n"
      << "Flags:\n"
      << "  -a, --address ADDR         Bind address (default 127.0.0.1)\n"
      << "  -p, --port N               Bind port (default 1337)\n"
      << "  -t, --timeout SECONDS      Release the endpoint after SECONDS\n"
      << "      --release-threshold N  Release after N clients\n"
      << "      --max-clients N        Process at most N clients\n"
      << "  -s, --secret TOKEN         Shared secret between host and clients\n"
      << "      --no-client            Do not forward arguments to the host\n"
      << "      --no-strict            Report an already running host\n"
      << "  -c, --config FILE          JSON config file\n"
      << "      --root DIR             State directory (config, logs)\n"
      << "      --write-config         Save the effective options and exit\n"
      << "  -v, --verbose              Enable verbose logging\n"
      << "      --version              Print the version\n"
      << "  -h, --help                 Show this help message\n";
}

struct CommandLine {
  std::optional<std::string> address;
  std::optional<int> port;
  std::optional<int> timeout;
  std::optional<int> releaseThreshold;
  std::optional<int> maxClients;
  std::optional<std::string> secret;
  bool noClient = false;
  bool noStrict = false;
  bool verbose = false;
  bool writeConfig = false;
  bool help = false;
  bool version = false;
  std::string configPath;
  std::string root;
  std::vector<std::string> arguments;
};

int parseNumber(const std::string &flag, const std::string &value) {
  try {
    std::size_t used = 0;
    int number = std::stoi(value, &used);
    if (used != value.size()) {
      throw std::invalid_argument(value);
    }
    return number;
  } catch (const std::exception &) {
    throw solo::ConfigError(flag + " expects an integer, got '" + value + "'");
  }
}

CommandLine parseCommandLine(int argc, char *argv[]) {
  CommandLine cl;
  int i = 1;

  auto next = [&](const std::string &flag) -> std::string {
    if (i + 1 >= argc) {
      throw solo::ConfigError(flag + " requires a value");
    }
    return argv[++i];
  };

  for (; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--") {
      ++i;
      break;
    }
    if (arg.empty() || arg[0] != '-') {
      break;
    }

    if (arg == "-a" || arg == "--address") {
      cl.address = next(arg);
    } else if (arg == "-p" || arg == "--port") {
      cl.port = parseNumber(arg, next(arg));
    } else if (arg == "-t" || arg == "--timeout") {
      cl.timeout = parseNumber(arg, next(arg));
    } else if (arg == "--release-threshold") {
      cl.releaseThreshold = parseNumber(arg, next(arg));
    } else if (arg == "--max-clients") {
      cl.maxClients = parseNumber(arg, next(arg));
    } else if (arg == "-s" || arg == "--secret") {
      cl.secret = next(arg);
    } else if (arg == "--no-client") {
      cl.noClient = true;
    } else if (arg == "--no-strict") {
      cl.noStrict = true;
    } else if (arg == "-c" || arg == "--config") {
      cl.configPath = next(arg);
    } else if (arg == "--root") {
      cl.root = next(arg);
    } else if (arg == "--write-config") {
      cl.writeConfig = true;
    } else if (arg == "-v" || arg == "--verbose") {
      cl.verbose = true;
    } else if (arg == "--version" || arg == "-version") {
      cl.version = true;
    } else if (arg == "-h" || arg == "--help") {
      cl.help = true;
    } else {
      throw solo::ConfigError("Unknown flag: " + arg);
    }
  }

  for (; i < argc; ++i) {
    cl.arguments.emplace_back(argv[i]);
  }
  return cl;
}

void applyCommandLine(const CommandLine &cl, solo::Options &options) {
  if (cl.address)
    options.address = *cl.address;
  if (cl.port)
    options.port = *cl.port;
  if (cl.timeout)
    options.timeout = *cl.timeout;
  if (cl.releaseThreshold)
    options.releaseThreshold = *cl.releaseThreshold;
  if (cl.maxClients)
    options.maxClients = *cl.maxClients;
  if (cl.secret)
    options.secret = *cl.secret;
  if (cl.noClient)
    options.client = false;
  if (cl.noStrict)
    options.strict = false;
  if (cl.verbose)
    options.verbose = true;
  options.arguments = cl.arguments;
}

std::string join(const solo::ArgumentSet &args) {
  std::string line;
  for (const auto &arg : args) {
    if (!line.empty())
      line += ' ';
    line += arg;
  }
  return line;
}

} // namespace

int main(int argc, char *argv[]) {
  CommandLine cl;
  try {
    cl = parseCommandLine(argc, argv);
  } catch (const solo::ConfigError &e) {
    std::cerr << "solo: " << e.what() << "\n";
    return 2;
  }

  if (cl.help) {
    showHelp();
    return 0;
  }

  if (cl.version) {
    std::cout << "solo v" << solo::SOLO_VERSION_STRING << "\n";
    return 0;
  }

  auto &pathMgr = solo::PathManager::instance();
  pathMgr.init(cl.root);

  solo::Logger::instance().init(cl.verbose ? pathMgr.currentLog()
                                           : std::filesystem::path(),
                                cl.verbose);
  LOG_DEBUG("=== solo v" + solo::SOLO_VERSION_STRING + " started ===");

  solo::Options options;
  try {
    auto &config = solo::Config::instance();
    if (!cl.configPath.empty()) {
      config.load(cl.configPath, true);
    } else {
      config.load(pathMgr.config());
    }

    options = config.getOptions();
    applyCommandLine(cl, options);
    solo::validate(options);

    if (cl.writeConfig) {
      config.getOptions() = options;
      config.save();
      std::cout << "Configuration written to " << config.path().string()
                << "\n";
      return 0;
    }
  } catch (const solo::ConfigError &e) {
    LOG_ERROR(e.what());
    return 2;
  }

  std::unique_ptr<solo::Singleton> app;
  try {
    // Traced before the first client is accepted, so none is missed.
    app = solo::Singleton::create(options, "stdout",
                                  [](const solo::ArgumentSet &args) {
                                    std::cout << join(args) << std::endl;
                                  });
  } catch (const solo::AlreadyRunningError &e) {
    std::cout << "AlreadyRunningError: " << e.what() << std::endl;
    return 0;
  } catch (const solo::ConfigError &e) {
    LOG_ERROR(e.what());
    return 2;
  } catch (const std::system_error &e) {
    LOG_ERROR(std::string("Cannot acquire endpoint: ") + e.what());
    return 2;
  } catch (const std::exception &e) {
    LOG_ERROR(e.what());
    return 1;
  }

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  std::cout << "Singleton locked @ " << app->address() << " on port "
            << app->port() << std::endl;

  while (!gStopRequested && app->isListening()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  LOG_INFO("Shutting down after " + std::to_string(app->clients()) +
           " client(s)");
  app->release();
  return 0;
}

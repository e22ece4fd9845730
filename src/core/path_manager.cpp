#include "solo/path_manager.hpp"
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace solo {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

void PathManager::init(const std::string& rootOverride) {
    rootDir_ = resolveRoot(rootOverride);
    logsDir_ = rootDir_ / "logs";
    configPath_ = rootDir_ / "config.json";

    // Generate path for current session log
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&in_time_t, &local);
    std::stringstream ss;
    ss << "solo_" << std::put_time(&local, "%Y%m%d_%H%M%S") << "_" << getpid() << ".log";
    currentLogPath_ = logsDir_ / ss.str();
}

std::filesystem::path PathManager::resolveRoot(const std::string& override) {
    if (!override.empty()) return std::filesystem::absolute(override);

    const char* envPath = std::getenv("SOLO_PATH");
    if (envPath && strlen(envPath) > 0) return std::filesystem::absolute(envPath);

    const char* xdgStateHome = std::getenv("XDG_STATE_HOME");
    if (xdgStateHome && strlen(xdgStateHome) > 0) {
        return std::filesystem::absolute(xdgStateHome) / "solo";
    }

    // Fallback to XDG default under home
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";

    return std::filesystem::path(home) / ".local" / "state" / "solo";
}

} // namespace solo

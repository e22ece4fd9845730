#ifndef SOLO_PATH_MANAGER_HPP
#define SOLO_PATH_MANAGER_HPP

#include <string>
#include <filesystem>

namespace solo {

class PathManager {
public:
    static PathManager& instance();

    // Resolves paths based on optional root override.
    // If rootOverride is empty, it checks SOLO_PATH env, then XDG defaults.
    // Nothing is created on disk.
    void init(const std::string& rootOverride = "");

    std::filesystem::path root() const { return rootDir_; }
    std::filesystem::path logs() const { return logsDir_; }
    std::filesystem::path config() const { return configPath_; }

    // Returns the path to the current session's log file
    std::filesystem::path currentLog() const { return currentLogPath_; }

private:
    PathManager() = default;

    std::filesystem::path rootDir_;
    std::filesystem::path logsDir_;
    std::filesystem::path configPath_;
    std::filesystem::path currentLogPath_;

    std::filesystem::path resolveRoot(const std::string& override);
};

} // namespace solo

#endif // SOLO_PATH_MANAGER_HPP

#ifndef SOLO_LOGGER_HPP
#define SOLO_LOGGER_HPP

#include <string>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <mutex>

namespace solo {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& instance();

    // An empty path keeps the logger console-only and closes any open file.
    void init(const std::filesystem::path& logPath, bool verbose);
    void log(LogLevel level, const std::string& message);

    // Forbidden
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;
    ~Logger();

    std::ofstream logFile_;
    bool verbose_ = false;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_DEBUG(msg) solo::Logger::instance().log(solo::LogLevel::DEBUG, msg)
#define LOG_INFO(msg) solo::Logger::instance().log(solo::LogLevel::INFO, msg)
#define LOG_WARN(msg) solo::Logger::instance().log(solo::LogLevel::WARNING, msg)
#define LOG_ERROR(msg) solo::Logger::instance().log(solo::LogLevel::ERROR, msg)

} // namespace solo

#endif // SOLO_LOGGER_HPP

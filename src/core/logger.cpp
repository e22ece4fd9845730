#include "solo/logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace solo {

namespace {

std::string timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "UNKNOWN";
}

} // namespace

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::init(const std::filesystem::path& logPath, bool verbose) {
    std::lock_guard<std::mutex> lock(mutex_);
    verbose_ = verbose;

    if (logFile_.is_open()) {
        logFile_.close();
    }

    if (logPath.empty()) {
        return;
    }

    if (logPath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(logPath.parent_path(), ec);
    }

    logFile_.open(logPath, std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << logPath << std::endl;
    } else {
        logFile_ << "\n=== solo session started: " << timestamp() << " ===\n";
    }
}

Logger::~Logger() {
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string record = "[" + timestamp() + "] [" + levelName(level) + "] " + message;

    if (logFile_.is_open()) {
        logFile_ << record << std::endl;
    }

    if (level == LogLevel::ERROR) {
        std::cerr << record << std::endl;
    } else if (verbose_ || level == LogLevel::WARNING) {
        std::cout << record << std::endl;
    }
}

} // namespace solo

#include <gtest/gtest.h>

#include "solo/logger.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace {

std::string readFile(const std::filesystem::path &path) {
    std::ifstream file(path);
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

} // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir = std::filesystem::temp_directory_path() /
              ("solo_log_" + std::to_string(getpid()) + "_" + std::to_string(stamp));
    }

    void TearDown() override {
        solo::Logger::instance().init({}, false);
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::filesystem::path dir;
};

TEST_F(LoggerTest, WritesLevelTaggedRecordsToSessionFile) {
    auto path = dir / "logs" / "session.log";
    solo::Logger::instance().init(path, false);

    LOG_DEBUG("debug record");
    LOG_INFO("info record");
    LOG_WARN("warn record");
    solo::Logger::instance().init({}, false);

    ASSERT_TRUE(std::filesystem::exists(path));
    std::string text = readFile(path);
    EXPECT_NE(text.find("=== solo session started: "), std::string::npos);
    EXPECT_NE(text.find("] [DEBUG] debug record"), std::string::npos);
    EXPECT_NE(text.find("] [INFO] info record"), std::string::npos);
    EXPECT_NE(text.find("] [WARN] warn record"), std::string::npos);
}

TEST_F(LoggerTest, ConsoleOnlyInitStopsFileOutput) {
    auto path = dir / "session.log";
    solo::Logger::instance().init(path, false);
    LOG_INFO("before");
    solo::Logger::instance().init({}, false);
    LOG_INFO("after");

    std::string text = readFile(path);
    EXPECT_NE(text.find("before"), std::string::npos);
    EXPECT_EQ(text.find("after"), std::string::npos);
}

TEST_F(LoggerTest, RecordsCarryATimestamp) {
    auto path = dir / "session.log";
    solo::Logger::instance().init(path, false);
    LOG_INFO("stamped");
    solo::Logger::instance().init({}, false);

    std::string text = readFile(path);
    auto pos = text.find("] [INFO] stamped");
    ASSERT_NE(pos, std::string::npos);
    auto open = text.rfind('[', pos);
    ASSERT_NE(open, std::string::npos);
    // "[YYYY-mm-dd HH:MM:SS"
    EXPECT_EQ(pos - open, 20u);
}

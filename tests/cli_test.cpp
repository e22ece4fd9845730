#include <gtest/gtest.h>

#include "solo/singleton.hpp"
#include "test_support.h"

#include <array>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

struct RunResult {
    int exitCode = -1;
    std::string output;
};

// Runs the solo binary with `args` (already shell-quoted where needed) and
// captures stdout and stderr.
RunResult runSolo(const std::string &args) {
    RunResult result;
    std::string command = std::string(SOLO_CLI_PATH) + " " + args + " 2>&1";
    FILE *pipe = popen(command.c_str(), "r");
    if (!pipe) return result;

    std::array<char, 256> buffer{};
    while (fgets(buffer.data(), buffer.size(), pipe)) {
        result.output += buffer.data();
    }
    int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }
    return result;
}

} // namespace

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root = std::filesystem::temp_directory_path() /
               ("solo_cli_" + std::to_string(getpid()) + "_" + std::to_string(stamp));
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    std::string flags(uint16_t port) const {
        return "--root " + root.string() + " --port " + std::to_string(port);
    }

    std::unique_ptr<solo::Singleton> startHost() {
        solo::Options options;
        options.port = 0;
        auto acquisition = solo::Singleton::acquire(options);
        auto host = std::move(std::get<solo::Singleton::Host>(acquisition).instance);
        host->trace("recorder", [this](const solo::ArgumentSet &args) {
            std::lock_guard<std::mutex> lock(mutex);
            received.push_back(args);
        });
        return host;
    }

    std::size_t receivedCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return received.size();
    }

    std::filesystem::path root;
    std::mutex mutex;
    std::vector<solo::ArgumentSet> received;
};

TEST_F(CliTest, StrictClientForwardsArgumentsSilently) {
    auto host = startHost();

    auto result = runSolo(flags(host->port()) + " foo bar baz");
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.output, "");

    ASSERT_TRUE(solo_test::waitFor([&] { return receivedCount() == 1; }));
    EXPECT_EQ(received[0], (solo::ArgumentSet{"foo", "bar", "baz"}));
}

TEST_F(CliTest, DoubleDashEndsFlagParsing) {
    auto host = startHost();

    auto result = runSolo(flags(host->port()) + " -- --port -v");
    EXPECT_EQ(result.exitCode, 0);

    ASSERT_TRUE(solo_test::waitFor([&] { return receivedCount() == 1; }));
    EXPECT_EQ(received[0], (solo::ArgumentSet{"--port", "-v"}));
}

TEST_F(CliTest, NonStrictClientReportsRunningHost) {
    auto host = startHost();

    auto result = runSolo(flags(host->port()) + " --no-strict");
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_NE(result.output.find("AlreadyRunningError"), std::string::npos);
    EXPECT_NE(result.output.find(std::to_string(host->port())), std::string::npos);
}

TEST_F(CliTest, NoClientSendsNothing) {
    auto host = startHost();

    auto result = runSolo(flags(host->port()) + " --no-client foo");
    EXPECT_EQ(result.exitCode, 0);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(host->clients(), 0u);
    EXPECT_EQ(receivedCount(), 0u);
}

TEST_F(CliTest, HostReleasesAfterTimeout) {
    const uint16_t port = solo_test::freePort();
    ASSERT_NE(port, 0);

    auto result = runSolo(flags(port) + " --timeout 1");
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_NE(result.output.find("Singleton locked @ 127.0.0.1 on port " + std::to_string(port)),
              std::string::npos);
    EXPECT_TRUE(solo_test::canAcquire(port));
}

TEST_F(CliTest, InvalidOptionsExitWithUsageError) {
    EXPECT_EQ(runSolo(flags(1337) + " --port 70000").exitCode, 2);
    EXPECT_EQ(runSolo(flags(1337) + " --timeout -1").exitCode, 2);
    EXPECT_EQ(runSolo(flags(1337) + " --port abc").exitCode, 2);
    EXPECT_EQ(runSolo("--bogus").exitCode, 2);
    EXPECT_EQ(runSolo("--port").exitCode, 2);
}

TEST_F(CliTest, MissingExplicitConfigIsAnError) {
    auto result = runSolo(flags(1337) + " --config " + (root / "absent.json").string());
    EXPECT_EQ(result.exitCode, 2);
}

TEST_F(CliTest, WriteConfigPersistsEffectiveOptions) {
    auto result = runSolo(flags(4242) + " --timeout 5 --max-clients 3 --write-config");
    EXPECT_EQ(result.exitCode, 0);

    std::ifstream file(root / "config.json");
    ASSERT_TRUE(file.is_open());
    auto j = nlohmann::json::parse(file);
    EXPECT_EQ(j["singleton"]["port"], 4242);
    EXPECT_EQ(j["singleton"]["timeout"], 5);
    EXPECT_EQ(j["singleton"]["max_clients"], 3);
}

TEST_F(CliTest, ConfigFileSuppliesDefaults) {
    auto host = startHost();

    std::filesystem::create_directories(root);
    std::ofstream(root / "config.json")
        << nlohmann::json{{"singleton", {{"port", host->port()}, {"strict", false}}}}.dump();

    auto result = runSolo("--root " + root.string());
    EXPECT_NE(result.output.find("AlreadyRunningError"), std::string::npos);
}

TEST(CliInfoTest, VersionAndHelp) {
    auto version = runSolo("--version");
    EXPECT_EQ(version.exitCode, 0);
    EXPECT_NE(version.output.find("solo v"), std::string::npos);

    auto help = runSolo("--help");
    EXPECT_EQ(help.exitCode, 0);
    EXPECT_NE(help.output.find("--release-threshold"), std::string::npos);
}

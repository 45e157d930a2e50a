#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <vector>
#include "../../src/common/configuration.h"

using namespace Leasehold;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Configuration::getInstance().resetToDefaults();
    }

    void TearDown() override {
        unsetenv("LEASEHOLD_LEASE_TIME_MS");
        unsetenv("LEASEHOLD_RETRY_MAX_ATTEMPTS");
        Configuration::getInstance().resetToDefaults();
    }

    Configuration& config_ = Configuration::getInstance();
};

TEST_F(ConfigurationTest, Defaults) {
    EXPECT_EQ(config_.getLeaseTimeMs(), 20000);
    EXPECT_EQ(config_.getRefreshIntervalMs(), 10000);
    EXPECT_EQ(config_.getLeaseCollection(), "competing-consumer-locks");
    EXPECT_EQ(config_.config().retry.strategy.get(), "exponential");
    EXPECT_EQ(config_.config().retry.max_attempts.get(), 5);
    EXPECT_TRUE(config_.validate());
}

TEST_F(ConfigurationTest, LoadFromString) {
    ASSERT_TRUE(config_.loadFromString(
        "leasehold:\n"
        "  coordinator:\n"
        "    lease_time_ms: 6000\n"
        "    lease_collection: locks\n"
        "  retry:\n"
        "    strategy: fixed\n"
        "    initial_backoff_ms: 50\n"
        "    max_attempts: 2\n"));
    EXPECT_EQ(config_.getLeaseTimeMs(), 6000);
    EXPECT_EQ(config_.getRefreshIntervalMs(), 3000);
    EXPECT_EQ(config_.getLeaseCollection(), "locks");
    EXPECT_EQ(config_.config().retry.strategy.get(), "fixed");
    EXPECT_EQ(config_.config().retry.initial_backoff_ms.get(), 50);
    EXPECT_EQ(config_.config().retry.max_attempts.get(), 2);
    // Untouched keys keep their defaults
    EXPECT_EQ(config_.config().retry.max_backoff_ms.get(), 2000);
}

TEST_F(ConfigurationTest, LoadFromFile) {
    std::string path = ::testing::TempDir() + "leasehold_config_test.yaml";
    {
        std::ofstream out(path);
        out << "leasehold:\n  coordinator:\n    refresh_interval_ms: 4000\n";
    }
    EXPECT_TRUE(config_.loadFromFile(path));
    EXPECT_EQ(config_.getRefreshIntervalMs(), 4000);
    std::remove(path.c_str());
}

TEST_F(ConfigurationTest, MissingFileFails) {
    EXPECT_FALSE(config_.loadFromFile("/nonexistent/leasehold.yaml"));
    EXPECT_EQ(config_.getLeaseTimeMs(), 20000);
}

TEST_F(ConfigurationTest, MalformedYamlFails) {
    EXPECT_FALSE(config_.loadFromString("leasehold: [unterminated"));
    EXPECT_FALSE(config_.loadFromString("leasehold:\n  coordinator:\n    lease_time_ms: soon\n"));
}

TEST_F(ConfigurationTest, ValidationErrors) {
    EXPECT_FALSE(config_.loadFromString(
        "leasehold:\n"
        "  coordinator:\n"
        "    lease_time_ms: 1000\n"
        "    refresh_interval_ms: 1000\n"
        "  retry:\n"
        "    strategy: sometimes\n"
        "    multiplier: 0.5\n"));
    std::vector<std::string> errors = config_.getValidationErrors();
    EXPECT_EQ(errors.size(), 3u);

    config_.resetToDefaults();
    EXPECT_TRUE(config_.validate());
    EXPECT_TRUE(config_.getValidationErrors().empty());
}

TEST_F(ConfigurationTest, EnvironmentOverridesFile) {
    ASSERT_TRUE(config_.loadFromString("leasehold:\n  coordinator:\n    lease_time_ms: 6000\n"));
    setenv("LEASEHOLD_LEASE_TIME_MS", "8000", 1);
    setenv("LEASEHOLD_RETRY_MAX_ATTEMPTS", "not-a-number", 1);
    EXPECT_EQ(config_.getLeaseTimeMs(), 8000);
    EXPECT_EQ(config_.getRefreshIntervalMs(), 4000);
    // Unparseable values fall back to the configured one
    EXPECT_EQ(config_.config().retry.max_attempts.get(), 5);
}

TEST_F(ConfigurationTest, CommandLineOverrides) {
    std::vector<std::string> args = {"lease_demo", "--lease-time", "9000", "--retry-strategy=none",
        "--processes", "3"};
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    config_.overrideFromCommandLine(static_cast<int>(args.size()), argv.data());
    EXPECT_EQ(config_.getLeaseTimeMs(), 9000);
    EXPECT_EQ(config_.config().retry.strategy.get(), "none");
    EXPECT_TRUE(config_.validate());
}

// =============================================================================
// Configuration Tests
// =============================================================================

#include <gtest/gtest.h>
#include "merklegate/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace merklegate;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* var : {"MG_LOG_LEVEL", "MG_LOG_FILE", "MG_INPUT", "MG_OUTPUT", "MG_FORMAT",
                                "MG_ADAPTER", "MG_SORT_LEAVES", "MG_MAX_THREADS"}) {
            unsetenv(var);
        }
        Config::getInstance().clear();
        file_ = std::filesystem::temp_directory_path() / "merklegate_config_test.conf";
    }

    void TearDown() override {
        Config::getInstance().clear();
        std::error_code ec;
        std::filesystem::remove(file_, ec);
        set_log_level(LogLevel::INFO);
    }

    std::filesystem::path file_;
};

TEST_F(ConfigTest, Defaults) {
    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load());

    EXPECT_EQ(config.get<std::string>("build.input"), "voters.csv");
    EXPECT_EQ(config.get<std::string>("build.output"), "out/merkle.json");
    EXPECT_EQ(config.get<std::string>("build.format"), "merkle");
    EXPECT_FALSE(config.get<bool>("build.sort_leaves"));
    EXPECT_EQ(config.get<size_t>("perf.max_threads", 7), 0u);
    EXPECT_EQ(config.get<std::string>("missing.key", "fallback"), "fallback");
}

TEST_F(ConfigTest, EnvironmentOverridesDefaults) {
    setenv("MG_INPUT", "roll.csv", 1);
    setenv("MG_SORT_LEAVES", "yes", 1);

    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load());
    EXPECT_EQ(config.get<std::string>("build.input"), "roll.csv");
    EXPECT_TRUE(config.get<bool>("build.sort_leaves"));

    unsetenv("MG_INPUT");
    unsetenv("MG_SORT_LEAVES");
}

TEST_F(ConfigTest, FileValuesAndValidation) {
    {
        std::ofstream out(file_);
        out << "# build settings\n";
        out << "build.format = voters\n";
        out << "build.adapter=xml\n";
        out << "perf.max_threads = 3\n";
        out << "log.level = loud\n";
    }

    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load(file_.string()));
    EXPECT_EQ(config.get<std::string>("build.format"), "voters");
    EXPECT_EQ(config.get<std::string>("build.adapter"), "csv");
    EXPECT_EQ(config.get<std::string>("log.level"), "info");
    EXPECT_EQ(config.get<size_t>("perf.max_threads"), 3u);
}

TEST_F(ConfigTest, EmptyOutputIsInvalid) {
    {
        std::ofstream out(file_);
        out << "build.output=\n";
    }
    EXPECT_FALSE(Config::getInstance().load(file_.string()));
}

TEST_F(ConfigTest, UnparsableNumberFallsBack) {
    Config& config = Config::getInstance();
    config.set("perf.max_threads", "many");
    EXPECT_EQ(config.get<size_t>("perf.max_threads", 2), 2u);
}

TEST_F(ConfigTest, LogLevelNames) {
    LogLevel level;
    EXPECT_TRUE(parse_log_level("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("warn", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_FALSE(parse_log_level("verbose", level));
}

TEST_F(ConfigTest, BoolValuesIgnoreCaseAndNonAscii) {
    Config& config = Config::getInstance();

    config.set("build.sort_leaves", "TRUE");
    EXPECT_TRUE(config.get<bool>("build.sort_leaves"));

    config.set("build.sort_leaves", "On");
    EXPECT_TRUE(config.get<bool>("build.sort_leaves"));

    // High-bit bytes must lower-case safely and read as false
    config.set("build.sort_leaves", "\xC3\x89T\xC3\x89");
    EXPECT_FALSE(config.get<bool>("build.sort_leaves", true));
}

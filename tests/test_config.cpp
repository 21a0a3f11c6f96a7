#include <gtest/gtest.h>
#include "dlqueue/config.hpp"
#include "dlqueue/logging.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace dlqueue;

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("dlqueue_config_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                                           "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir);
        test_file = dir / "config.yaml";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void write(const std::string& text) {
        std::ofstream file(test_file);
        file << text;
    }

    fs::path dir;
    fs::path test_file;
};

TEST_F(ConfigTest, DefaultsWhenNothingIsSet) {
    Config config;
    config.download_dir = "/data/downloads";
    const auto settings = config.resolve();

    EXPECT_EQ(settings.max_concurrent, 1u);
    EXPECT_EQ(settings.download_dir, fs::path("/data/downloads"));
    EXPECT_EQ(settings.staging_dir, fs::path("/data/downloads/.dlqueue/staging"));
    EXPECT_EQ(settings.resume_dir, fs::path("/data/downloads/.dlqueue/resume"));
    EXPECT_EQ(settings.throughput_interval, std::chrono::milliseconds(1000));
    EXPECT_EQ(settings.progress_interval, std::chrono::milliseconds(200));
    EXPECT_EQ(settings.connect_timeout_s, 30);
    EXPECT_EQ(settings.user_agent, "dlqueue/1.0");
    EXPECT_EQ(settings.log_level, "info");
    EXPECT_TRUE(settings.log_file.empty());
}

TEST_F(ConfigTest, LoadFromFile) {
    write("max_concurrent: 4\n"
          "download_dir: /srv/files\n"
          "staging_dir: /tmp/staging\n"
          "throughput_interval_ms: 500\n"
          "user_agent: test-agent\n"
          "log_level: debug\n");

    const auto config = loadConfigFile(test_file);
    ASSERT_TRUE(config.max_concurrent.has_value());
    EXPECT_EQ(*config.max_concurrent, 4u);
    EXPECT_FALSE(config.resume_dir.has_value());

    const auto settings = config.resolve();
    EXPECT_EQ(settings.max_concurrent, 4u);
    EXPECT_EQ(settings.staging_dir, fs::path("/tmp/staging"));
    EXPECT_EQ(settings.resume_dir, fs::path("/srv/files/.dlqueue/resume"));
    EXPECT_EQ(settings.throughput_interval, std::chrono::milliseconds(500));
    EXPECT_EQ(settings.user_agent, "test-agent");
    EXPECT_EQ(settings.log_level, "debug");
}

TEST_F(ConfigTest, EmptyFileIsEmptyConfig) {
    write("");
    const auto config = loadConfigFile(test_file);
    EXPECT_FALSE(config.max_concurrent.has_value());
    EXPECT_FALSE(config.download_dir.has_value());
}

TEST_F(ConfigTest, MalformedFileThrows) {
    write("max_concurrent: [1, 2\n");
    EXPECT_THROW((void)loadConfigFile(test_file), ConfigError);
}

TEST_F(ConfigTest, WrongTypeThrows) {
    write("max_concurrent: lots\n");
    EXPECT_THROW((void)loadConfigFile(test_file), ConfigError);
}

TEST_F(ConfigTest, ScalarTopLevelThrows) {
    write("just a string\n");
    EXPECT_THROW((void)loadConfigFile(test_file), ConfigError);
}

TEST_F(ConfigTest, ZeroConcurrencyIsRejected) {
    Config config;
    config.max_concurrent = 0;
    EXPECT_THROW((void)config.resolve(), ConfigError);
}

TEST_F(ConfigTest, MissingExplicitFileThrows) {
    EXPECT_THROW((void)loadConfig(dir / "missing.yaml"), ConfigError);
}

TEST_F(ConfigTest, ExplicitFileIsLoaded) {
    write("max_concurrent: 3\n");
    const auto config = loadConfig(test_file);
    ASSERT_TRUE(config.max_concurrent.has_value());
    EXPECT_EQ(*config.max_concurrent, 3u);
}

TEST_F(ConfigTest, MergePrefersOverrides) {
    Config file;
    file.max_concurrent = 2;
    file.user_agent = "from-file";
    file.log_level = "warn";

    Config cli;
    cli.max_concurrent = 8;
    cli.download_dir = "/cli";

    file.mergeWith(cli);
    EXPECT_EQ(*file.max_concurrent, 8u);
    EXPECT_EQ(*file.download_dir, "/cli");
    EXPECT_EQ(*file.user_agent, "from-file");
    EXPECT_EQ(*file.log_level, "warn");
}

TEST_F(ConfigTest, DefaultPathsStartWithLocalFile) {
    const auto paths = defaultConfigPaths();
    ASSERT_FALSE(paths.empty());
    EXPECT_EQ(paths.front(), fs::path(".dlqueue.yaml"));
}

TEST(LoggingTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(parseLogLevel("INFO"), spdlog::level::info);
    EXPECT_EQ(parseLogLevel("Warn"), spdlog::level::warn);
    EXPECT_EQ(parseLogLevel("error"), spdlog::level::err);
    EXPECT_EQ(parseLogLevel("off"), spdlog::level::off);
    EXPECT_THROW((void)parseLogLevel("loud"), ConfigError);
}

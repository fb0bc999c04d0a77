#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include "lineup/foundation/config_manager.hpp"

using namespace lineup::foundation;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto dirname = std::string("lineup_config_test_") +
            ::testing::UnitTest::GetInstance()->current_test_info()->name();
        tmpDir_ = std::filesystem::temp_directory_path() / dirname;
        std::filesystem::create_directories(tmpDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tmpDir_, ec);
    }

    std::filesystem::path writeFile(const std::string& name, const std::string& content) {
        auto path = tmpDir_ / name;
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }

    std::filesystem::path tmpDir_;
};

TEST_F(ConfigManagerTest, LoadAndGetNestedKeys) {
    auto path = writeFile("lineup.yaml",
                          "matchmaking:\n"
                          "  max_rating_distance: 150\n"
                          "simulation:\n"
                          "  num_players: 40\n"
                          "  max_time_seconds: 60.5\n"
                          "logging:\n"
                          "  level: DEBUG\n");

    ConfigManager config;
    ASSERT_TRUE(config.load(path).hasValue());

    EXPECT_EQ(config.get<int>("matchmaking.max_rating_distance").value(), 150);
    EXPECT_EQ(config.get<unsigned int>("simulation.num_players").value(), 40u);
    EXPECT_DOUBLE_EQ(config.get<double>("simulation.max_time_seconds").value(), 60.5);
    EXPECT_EQ(config.get<std::string>("logging.level").value(), "DEBUG");
    EXPECT_EQ(config.size(), 4u);
}

TEST_F(ConfigManagerTest, KeyNotFound) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("a: 1\n").hasValue());

    auto result = config.get<int>("b");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
}

TEST_F(ConfigManagerTest, TypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("matchmaking:\n  max_rating_distance: wide\n").hasValue());

    auto result = config.get<int>("matchmaking.max_rating_distance");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST_F(ConfigManagerTest, LoadNonexistentFile) {
    ConfigManager config;
    auto result = config.load(tmpDir_ / "missing.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, MalformedDocument) {
    ConfigManager config;
    auto result = config.loadFromString("a: [1, 2\n");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST_F(ConfigManagerTest, ReloadReplacesEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("a: 1\n").hasValue());
    ASSERT_TRUE(config.loadFromString("b: 2\n").hasValue());
    EXPECT_FALSE(config.hasKey("a"));
    EXPECT_TRUE(config.hasKey("b"));
}

TEST_F(ConfigManagerTest, SetReplacesLoadedValue) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("matchmaking:\n  max_rating_distance: 200\n").hasValue());

    config.set("matchmaking.max_rating_distance", 300);
    EXPECT_EQ(config.get<int>("matchmaking.max_rating_distance").value(), 300);

    config.set("simulation.seed", std::string("77"));
    EXPECT_EQ(config.get<uint64_t>("simulation.seed").value(), 77u);
}

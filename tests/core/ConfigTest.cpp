#include "core/Config.hpp"
#include "core/Errors.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>

using namespace showgrab::core;

namespace fs = std::filesystem;

namespace {

fs::path tempConfigPath(const std::string& name) {
    return fs::temp_directory_path() /
           (name + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".json");
}

} // namespace

TEST(ConfigTest, MissingFileGivesDefaults) {
    Config config = Config::load(tempConfigPath("showgrab_missing").string());
    EXPECT_TRUE(config.feedUrl.empty());
    EXPECT_TRUE(config.downloadDir.empty());
}

TEST(ConfigTest, LoadsValuesFromFile) {
    fs::path path = tempConfigPath("showgrab_config");
    {
        std::ofstream file(path);
        file << R"({"feedUrl": "https://example.com/feed", "downloadDir": "/tmp/shows", "extra": 1})";
    }

    Config config = Config::load(path.string());
    EXPECT_EQ(config.feedUrl, "https://example.com/feed");
    EXPECT_EQ(config.downloadDir, "/tmp/shows");
    fs::remove(path);
}

TEST(ConfigTest, JsonRoundTripKeepsFields) {
    Config config;
    config.feedUrl = "https://example.com/feed";
    config.downloadDir = "/srv/media";

    Config copy = Config::fromJson(config.toJson());
    EXPECT_EQ(copy.feedUrl, config.feedUrl);
    EXPECT_EQ(copy.downloadDir, config.downloadDir);
}

TEST(ConfigTest, MissingKeysKeepDefaults) {
    Config config = Config::fromJson(nlohmann::json{{"feedUrl", "https://example.com/feed"}});
    EXPECT_EQ(config.feedUrl, "https://example.com/feed");
    EXPECT_TRUE(config.downloadDir.empty());
}

TEST(ConfigTest, BadContentIsConfigError) {
    EXPECT_THROW(Config::fromJson(nlohmann::json{{"feedUrl", 42}}), ConfigError);
    EXPECT_THROW(Config::fromJson(nlohmann::json::array()), ConfigError);

    fs::path path = tempConfigPath("showgrab_broken");
    {
        std::ofstream file(path);
        file << "{ not json";
    }
    EXPECT_THROW(Config::load(path.string()), ConfigError);
    fs::remove(path);
}

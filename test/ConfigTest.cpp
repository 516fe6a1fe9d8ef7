#include "gtest/gtest.h"
#include "core/Common.hpp"
#include "utils/Config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace DupFinder;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    const std::vector<std::string> envVars = {
        "DUPFINDER_DATABASE_URL", "DUPFINDER_DATABASE_POOL_SIZE", "DUPFINDER_SIMILARITY_THRESHOLD",
        "DUPFINDER_LOG_LEVEL", "DUPFINDER_SERIALIZE_CONVERSATIONS",
        "DB_NAME", "DB_USER", "DB_PASSWORD", "DB_HOST", "DB_PORT"
    };
    fs::path testDir;

    void SetUp() override {
        for (const auto& name : envVars) unsetenv(name.c_str());
        testDir = fs::temp_directory_path() / "dupfinder_config_tests";
        fs::create_directories(testDir);
    }

    void TearDown() override {
        for (const auto& name : envVars) unsetenv(name.c_str());
        fs::remove_all(testDir);
    }

    fs::path writeConfig(const std::string& content) {
        fs::path path = testDir / "config.json";
        std::ofstream out(path);
        out << content;
        return path;
    }
};

TEST_F(ConfigTest, Defaults) {
    Settings settings = Settings::load(testDir / "missing.json");
    EXPECT_EQ(settings.similarityThreshold, 5u);
    EXPECT_EQ(settings.logLevel, "info");
    EXPECT_EQ(settings.database.poolSize, 4u);
    EXPECT_TRUE(settings.database.url.empty());
    EXPECT_TRUE(settings.serializeConversations);
}

TEST_F(ConfigTest, ReadsJsonFile) {
    auto path = writeConfig(R"({
        "database": { "url": "postgresql://bot@db/dupfinder", "pool_size": 8 },
        "similarity_threshold": 3,
        "log_level": "debug",
        "serialize_conversations": false
    })");

    Settings settings = Settings::load(path);
    EXPECT_EQ(settings.database.url, "postgresql://bot@db/dupfinder");
    EXPECT_EQ(settings.database.poolSize, 8u);
    EXPECT_EQ(settings.similarityThreshold, 3u);
    EXPECT_EQ(settings.logLevel, "debug");
    EXPECT_FALSE(settings.serializeConversations);
    EXPECT_EQ(settings.connectionString(), "postgresql://bot@db/dupfinder");
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    auto path = writeConfig(R"({ "similarity_threshold": 3, "database": { "url": "from-file" } })");
    setenv("DUPFINDER_SIMILARITY_THRESHOLD", "9", 1);
    setenv("DUPFINDER_DATABASE_URL", "from-env", 1);
    setenv("DUPFINDER_SERIALIZE_CONVERSATIONS", "no", 1);

    Settings settings = Settings::load(path);
    EXPECT_EQ(settings.similarityThreshold, 9u);
    EXPECT_EQ(settings.database.url, "from-env");
    EXPECT_FALSE(settings.serializeConversations);
}

TEST_F(ConfigTest, ThresholdOutOfRange) {
    EXPECT_THROW(Settings::fromJson(R"({ "similarity_threshold": 65 })"), ConfigError);
    EXPECT_THROW(Settings::fromJson(R"({ "similarity_threshold": -1 })"), ConfigError);
    EXPECT_NO_THROW(Settings::fromJson(R"({ "similarity_threshold": 64 })"));

    setenv("DUPFINDER_SIMILARITY_THRESHOLD", "five", 1);
    EXPECT_THROW(Settings::load(testDir / "missing.json"), ConfigError);
}

TEST_F(ConfigTest, MalformedJson) {
    EXPECT_THROW(Settings::fromJson("{ not json"), ConfigError);
    EXPECT_THROW(Settings::fromJson("[1, 2]"), ConfigError);
    EXPECT_THROW(Settings::fromJson(R"({ "similarity_threshold": "five" })"), ConfigError);
}

TEST_F(ConfigTest, InvalidPoolSizeAndLogLevel) {
    EXPECT_THROW(Settings::fromJson(R"({ "database": { "pool_size": 0 } })"), ConfigError);

    setenv("DUPFINDER_LOG_LEVEL", "chatty", 1);
    EXPECT_THROW(Settings::load(testDir / "missing.json"), ConfigError);
}

TEST_F(ConfigTest, ConnectionStringFromDatabaseVariables) {
    setenv("DB_NAME", "dupfinder_test_db", 1);
    setenv("DB_USER", "postgres", 1);

    Settings settings = Settings::load(testDir / "missing.json");
    EXPECT_EQ(settings.connectionString(), "host='localhost' port='5432' dbname='dupfinder_test_db' user='postgres'");
}

TEST_F(ConfigTest, ConnectionStringQuotesSpecialCharacters) {
    setenv("DB_NAME", "dupfinder", 1);
    setenv("DB_PASSWORD", R"(it's a p\ss)", 1);
    setenv("DB_HOST", "db.internal", 1);

    Settings settings = Settings::load(testDir / "missing.json");
    EXPECT_EQ(settings.connectionString(),
              R"(host='db.internal' port='5432' dbname='dupfinder' password='it\'s a p\\ss')");
}

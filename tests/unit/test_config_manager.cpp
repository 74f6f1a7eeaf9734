#include "config_manager.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace accounts;

class ConfigManagerTest : public ::testing::Test {
protected:
  void SetUp() override { ConfigManager::getInstance().clear(); }
  void TearDown() override {
    ConfigManager::getInstance().clear();
    std::error_code ec;
    std::filesystem::remove(tempFile_, ec);
  }

  std::string writeTempConfig(const std::string &content) {
    std::ofstream out(tempFile_);
    out << content;
    return tempFile_;
  }

  std::string tempFile_ = "config_manager_test.json";
};

TEST_F(ConfigManagerTest, DefaultsWithoutConfiguration) {
  auto &config = ConfigManager::getInstance();

  ServerConfig server = config.getServerConfig();
  EXPECT_EQ(server.address, "127.0.0.1");
  EXPECT_EQ(server.port, 8080);
  EXPECT_EQ(server.threads, 4);
  EXPECT_EQ(server.requestTimeout, std::chrono::seconds(30));
  EXPECT_EQ(server.maxRequestBodySize, 1024u * 1024u);
  EXPECT_EQ(server.serverName, "Accounts API");

  DocsConfig docs = config.getDocsConfig();
  EXPECT_EQ(docs.theme, "laserwave");
  EXPECT_EQ(docs.cdnUrl, "https://cdn.jsdelivr.net/npm/@scalar/api-reference");

  LogConfig logging = config.getLoggingConfig();
  EXPECT_EQ(logging.level, LogLevel::INFO);
  EXPECT_EQ(logging.format, LogFormat::TEXT);
  EXPECT_TRUE(logging.consoleOutput);
  EXPECT_FALSE(logging.fileOutput);
  EXPECT_TRUE(logging.componentFilter.empty());
}

TEST_F(ConfigManagerTest, LoadsNestedValues) {
  auto &config = ConfigManager::getInstance();
  ASSERT_TRUE(config.loadFromString(R"({
    "server": {"address": "0.0.0.0", "port": 9090, "threads": 2,
               "request_timeout": 5, "name": "Test"},
    "docs": {"theme": "moon"},
    "logging": {"level": "debug", "format": "json",
                "component_filter": ["Router", "HttpServer"]},
    "ratio": 0.5
  })"));

  EXPECT_TRUE(config.hasKey("server.port"));
  EXPECT_EQ(config.getInt("server.port"), 9090);
  EXPECT_DOUBLE_EQ(config.getDouble("ratio"), 0.5);

  ServerConfig server = config.getServerConfig();
  EXPECT_EQ(server.address, "0.0.0.0");
  EXPECT_EQ(server.port, 9090);
  EXPECT_EQ(server.threads, 2);
  EXPECT_EQ(server.requestTimeout, std::chrono::seconds(5));
  EXPECT_EQ(server.serverName, "Test");

  EXPECT_EQ(config.getDocsConfig().theme, "moon");

  LogConfig logging = config.getLoggingConfig();
  EXPECT_EQ(logging.level, LogLevel::DEBUG);
  EXPECT_EQ(logging.format, LogFormat::JSON);
  EXPECT_EQ(logging.componentFilter.size(), 2u);
  EXPECT_EQ(logging.componentFilter.count("Router"), 1u);
}

TEST_F(ConfigManagerTest, LoadsFromFile) {
  auto &config = ConfigManager::getInstance();
  ASSERT_TRUE(config.loadConfig(
      writeTempConfig(R"({"server": {"port": 8181}, "docs": {"cdn_url": "x"}})")));

  EXPECT_EQ(config.getServerConfig().port, 8181);
  EXPECT_EQ(config.getDocsConfig().cdnUrl, "x");
}

TEST_F(ConfigManagerTest, MissingFileIsReported) {
  EXPECT_FALSE(
      ConfigManager::getInstance().loadConfig("does_not_exist_config.json"));
}

TEST_F(ConfigManagerTest, MalformedJsonKeepsPreviousValues) {
  auto &config = ConfigManager::getInstance();
  ASSERT_TRUE(config.loadFromString(R"({"server": {"port": 7070}})"));

  EXPECT_FALSE(config.loadFromString("{ not json"));
  EXPECT_FALSE(config.loadFromString("[1, 2, 3]"));
  EXPECT_EQ(config.getServerConfig().port, 7070);
}

TEST_F(ConfigManagerTest, OutOfRangePortKeepsDefault) {
  auto &config = ConfigManager::getInstance();
  ASSERT_TRUE(config.loadFromString(R"({"server": {"port": 70000}})"));
  EXPECT_EQ(config.getServerConfig().port, 8080);
}

TEST_F(ConfigManagerTest, NegativeSizesKeepDefaults) {
  auto &config = ConfigManager::getInstance();
  ASSERT_TRUE(config.loadFromString(
      R"({"server": {"max_body_size": -1},
          "logging": {"max_file_size": -5}})"));

  EXPECT_EQ(config.getServerConfig().maxRequestBodySize, 1024u * 1024u);
  EXPECT_EQ(config.getLoggingConfig().maxFileSize, 10u * 1024u * 1024u);
}

TEST_F(ConfigManagerTest, TypedGettersFallBackOnBadValues) {
  auto &config = ConfigManager::getInstance();
  ASSERT_TRUE(config.loadFromString(
      R"({"a": "text", "b": "yes", "c": "off", "d": "a, b ,c"})"));

  EXPECT_EQ(config.getInt("a", 7), 7);
  EXPECT_DOUBLE_EQ(config.getDouble("a", 1.5), 1.5);
  EXPECT_TRUE(config.getBool("b"));
  EXPECT_FALSE(config.getBool("c", true));
  EXPECT_EQ(config.getString("missing", "fallback"), "fallback");
  EXPECT_EQ(config.getStringSet("d").size(), 3u);
}

TEST(ConfigParsingTest, LogLevelsAndFormats) {
  EXPECT_EQ(ConfigManager::parseLogLevel("warning"), LogLevel::WARN);
  EXPECT_EQ(ConfigManager::parseLogLevel("ERROR"), LogLevel::ERROR);
  EXPECT_EQ(ConfigManager::parseLogLevel("fatal"), LogLevel::FATAL);
  EXPECT_EQ(ConfigManager::parseLogLevel("verbose"), LogLevel::INFO);
  EXPECT_EQ(ConfigManager::parseLogFormat("Json"), LogFormat::JSON);
  EXPECT_EQ(ConfigManager::parseLogFormat("xml"), LogFormat::TEXT);
}

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>

#include "courier/core/config.hpp"
#include "courier/log/log.h"

using namespace courier;

namespace fs = std::filesystem;

// --- ConfigTest ---

TEST(ConfigTest, Defaults) {
  ClientConfig config;

  EXPECT_EQ(config.timeout_ms, 30000);
  EXPECT_EQ(config.keepalive_ms, 120000);
  EXPECT_EQ(config.max_redirects, 10);
  EXPECT_TRUE(config.follow_redirects);
  EXPECT_EQ(config.default_charset, "UTF-8");
  EXPECT_EQ(config.log_level, "info");
  EXPECT_FALSE(config.log_file.has_value());
  EXPECT_EQ(config.user_agent.rfind("courier/", 0), 0u);
  EXPECT_EQ(config.redirect_policy.statuses.count(307), 1u);
}

TEST(ConfigTest, FromJsonPartial) {
  json j = {
      {"timeout_ms", 500},
      {"keepalive_ms", 0},
      {"default_headers", {{"Accept", "application/json"}}},
      {"redirect_policy", {{"statuses", {301, 302}}, {"rewrite_post_on_301_302", false}}},
  };
  auto config = ClientConfig::from_json(j);

  EXPECT_EQ(config.timeout_ms, 500);
  EXPECT_EQ(config.keepalive_ms, 0);
  // 未出现的字段保持默认值
  EXPECT_EQ(config.max_redirects, 10);
  EXPECT_EQ(config.default_headers.at("Accept"), "application/json");
  EXPECT_EQ(config.redirect_policy.statuses.size(), 2u);
  EXPECT_EQ(config.redirect_policy.statuses.count(307), 0u);
  EXPECT_FALSE(config.redirect_policy.rewrite_post_on_301_302);
}

TEST(ConfigTest, SaveAndLoad) {
  auto dir = fs::temp_directory_path() / "courier_config_test";
  fs::create_directories(dir);
  auto path = dir / "config.json";

  ClientConfig config;
  config.timeout_ms = 1234;
  config.max_connections_per_host = 4;
  config.user_agent = "fetcher/1.0";
  config.log_level = "debug";
  config.log_file = dir / "courier.log";
  config.save(path);

  auto loaded = ClientConfig::load(path);
  EXPECT_EQ(loaded.timeout_ms, 1234);
  EXPECT_EQ(loaded.max_connections_per_host, 4u);
  EXPECT_EQ(loaded.user_agent, "fetcher/1.0");
  EXPECT_EQ(loaded.log_level, "debug");
  ASSERT_TRUE(loaded.log_file.has_value());
  EXPECT_EQ(loaded.log_file->filename().string(), "courier.log");

  fs::remove_all(dir);
}

TEST(ConfigTest, LoadMissingOrMalformed) {
  auto missing = ClientConfig::load("/nonexistent/courier/config.json");
  EXPECT_EQ(missing.timeout_ms, 30000);

  auto dir = fs::temp_directory_path() / "courier_config_bad";
  fs::create_directories(dir);
  auto path = dir / "config.json";
  {
    std::ofstream file(path);
    file << "{ not json";
  }
  auto malformed = ClientConfig::load(path);
  EXPECT_EQ(malformed.keepalive_ms, 120000);
  fs::remove_all(dir);
}

TEST(ConfigTest, EnvironmentOverrides) {
  setenv("COURIER_CONFIG", "/nonexistent/courier.json", 1);
  setenv("COURIER_TIMEOUT_MS", "750", 1);
  setenv("COURIER_KEEPALIVE_MS", "-1", 1);
  setenv("COURIER_MAX_REDIRECTS", "oops", 1);

  auto config = ClientConfig::from_env();
  EXPECT_EQ(config.timeout_ms, 750);
  EXPECT_EQ(config.keepalive_ms, -1);
  // 非数字的值被忽略
  EXPECT_EQ(config.max_redirects, 10);

  unsetenv("COURIER_CONFIG");
  unsetenv("COURIER_TIMEOUT_MS");
  unsetenv("COURIER_KEEPALIVE_MS");
  unsetenv("COURIER_MAX_REDIRECTS");
}

TEST(ConfigTest, ApplyDefaultsKeepsPerRequestValues) {
  ClientConfig config;
  config.timeout_ms = 1000;
  config.default_headers["Accept"] = "*/*";

  http::Request request;
  request.timeout_ms = 50;
  request.follow_redirects = false;
  request.headers.add("User-Agent", "custom");
  config.apply_defaults(request);

  EXPECT_EQ(*request.timeout_ms, 50);
  EXPECT_FALSE(*request.follow_redirects);
  EXPECT_EQ(*request.keepalive_ms, 120000);
  EXPECT_EQ(*request.max_redirects, 10);
  EXPECT_EQ(request.headers.get_or("User-Agent", ""), "custom");
  EXPECT_EQ(request.headers.get_or("Accept", ""), "*/*");
}

// --- ConfigPathsTest ---

TEST(ConfigPathsTest, DefaultFileUnderConfigDir) {
  auto file = config_paths::default_config_file();
  EXPECT_EQ(file.filename().string(), "config.json");
  EXPECT_EQ(file.parent_path(), config_paths::config_dir());
  EXPECT_EQ(config_paths::config_dir().filename().string(), "courier");
}

// --- LogTest ---

TEST(LogTest, FileSinkAndLevel) {
  auto dir = fs::temp_directory_path() / "courier_log_test";
  auto path = dir / "nested" / "courier.log";
  fs::remove_all(dir);

  init_log(path.string(), "warn");
  auto logger = get_logger();
  ASSERT_TRUE(logger);
  EXPECT_EQ(logger->name(), "courier");
  EXPECT_EQ(logger->level(), spdlog::level::warn);

  spdlog::info("hidden line");
  spdlog::warn("visible line");
  logger->flush();

  std::ifstream file(path);
  std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  EXPECT_NE(contents.find("visible line"), std::string::npos);
  EXPECT_EQ(contents.find("hidden line"), std::string::npos);

  // 未知级别回退到 info
  init_log("", "verbose");
  EXPECT_EQ(get_logger()->level(), spdlog::level::info);
  fs::remove_all(dir);
}

#include "upkeep/config/config.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include "gtest/gtest.h"

using namespace upkeep;

namespace {

auto has_problem(const std::vector<std::string>& problems,
                 std::string_view needle) -> bool {
  return std::ranges::any_of(problems, [&](const std::string& p) {
    return p.find(needle) != std::string::npos;
  });
}

}  // namespace

TEST(ConfigTest, Defaults) {
  SystemConfig config;

  EXPECT_EQ(config.storage.db_file, "upkeep.db");
  EXPECT_EQ(config.runner.log_level, "info");
  EXPECT_EQ(config.runner.tick_interval_ms, 1000);
  EXPECT_EQ(config.runner.time_limit_sec, 25);
  EXPECT_EQ(config.runner.time_buffer_sec, 3);
  EXPECT_TRUE(config.scheduling.scheduler_enabled);
  EXPECT_EQ(config.scheduling.preferred_time, 2);
  EXPECT_EQ(config.scheduling.timezone, "UTC");
  EXPECT_EQ(config.cache.backend, CacheBackendChoice::Auto);
  EXPECT_EQ(config.rate_limit.requests_per_minute, 60);
  EXPECT_TRUE(ConfigLoader::check(config).empty());
}

TEST(ConfigTest, LoadFromString) {
  std::string yaml = R"(
storage:
  db_file: /var/lib/upkeep/state.db
runner:
  log_level: debug
  tick_interval_ms: 250
  time_limit_sec: 40
scheduling:
  scheduler_enabled: false
  preferred_time: 4
  timezone: Europe/Berlin
  enable_scheduled_media_scan: false
  database_cleanup_frequency: monthly
cache:
  backend: memory
  memory_max_items: 50
rate_limit:
  requests_per_minute: 10
  lock_backoff_ms: 5
)";

  auto result = ConfigLoader::load_from_string(yaml);
  ASSERT_TRUE(result.has_value());
  const auto& config = *result;

  EXPECT_EQ(config.storage.db_file, "/var/lib/upkeep/state.db");
  EXPECT_EQ(config.runner.log_level, "debug");
  EXPECT_EQ(config.runner.tick_interval_ms, 250);
  EXPECT_EQ(config.runner.time_limit_sec, 40);
  EXPECT_EQ(config.runner.time_buffer_sec, 3);
  EXPECT_FALSE(config.scheduling.scheduler_enabled);
  EXPECT_EQ(config.scheduling.preferred_time, 4);
  EXPECT_EQ(config.scheduling.timezone, "Europe/Berlin");
  EXPECT_FALSE(
      config.scheduling.is_task_enabled("enable_scheduled_media_scan"));
  EXPECT_TRUE(config.scheduling.is_task_enabled("enable_scheduled_db_cleanup"));
  EXPECT_EQ(config.scheduling.frequency_for("database_cleanup_frequency",
                                            "weekly"),
            "monthly");
  EXPECT_EQ(config.scheduling.frequency_for("media_scan_frequency", "weekly"),
            "weekly");
  EXPECT_EQ(config.cache.backend, CacheBackendChoice::Memory);
  EXPECT_EQ(config.cache.memory_max_items, 50u);
  EXPECT_EQ(config.cache.prefix, "upkeep_");
  EXPECT_EQ(config.rate_limit.requests_per_minute, 10);
  EXPECT_EQ(config.rate_limit.lock_backoff_ms, 5);
  EXPECT_EQ(config.rate_limit.lock_attempts, 5);
}

TEST(ConfigTest, MissingSectionsKeepDefaults) {
  auto result = ConfigLoader::load_from_string("storage:\n  db_file: x.db\n");
  ASSERT_TRUE(result.has_value());

  EXPECT_EQ(result->storage.db_file, "x.db");
  EXPECT_EQ(result->runner.tick_interval_ms, 1000);
  EXPECT_TRUE(result->scheduling.task_frequency.empty());
}

TEST(ConfigTest, UnknownCacheBackendMeansAuto) {
  auto result = ConfigLoader::load_from_string("cache:\n  backend: redis\n");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->cache.backend, CacheBackendChoice::Auto);
}

TEST(ConfigTest, LoadFromFile) {
  auto path = std::filesystem::temp_directory_path() / "upkeep_config_test.yaml";
  {
    std::ofstream out(path);
    out << "runner:\n  log_level: warn\n";
  }

  auto result = ConfigLoader::load_from_file(path.string());
  std::filesystem::remove(path);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->runner.log_level, "warn");
}

TEST(ConfigTest, MissingFile) {
  auto result = ConfigLoader::load_from_file("/nonexistent/upkeep.yaml");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::FileNotFound));
}

TEST(ConfigTest, MalformedYaml) {
  auto result = ConfigLoader::load_from_string("runner: [unclosed");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, WrongTypeIsParseError) {
  auto result =
      ConfigLoader::load_from_string("runner:\n  tick_interval_ms: soon\n");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, EmptyDocumentIsParseError) {
  auto result = ConfigLoader::load_from_string("");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, ScalarRootIsParseError) {
  auto result = ConfigLoader::load_from_string("just a string");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, ToStringReloads) {
  SystemConfig config;
  config.storage.db_file = "round.db";
  config.scheduling.preferred_time = 7;
  config.scheduling.task_enabled["enable_scheduled_media_scan"] = false;
  config.scheduling.task_frequency["media_scan_frequency"] = "daily";
  config.cache.backend = CacheBackendChoice::Null;
  config.rate_limit.lock_ttl_sec = 9;

  auto yaml = ConfigLoader::to_string(config);
  auto reloaded = ConfigLoader::load_from_string(yaml);

  ASSERT_TRUE(reloaded.has_value()) << yaml;
  EXPECT_EQ(reloaded->storage.db_file, "round.db");
  EXPECT_EQ(reloaded->scheduling.preferred_time, 7);
  EXPECT_FALSE(
      reloaded->scheduling.is_task_enabled("enable_scheduled_media_scan"));
  EXPECT_EQ(reloaded->scheduling.frequency_for("media_scan_frequency", ""),
            "daily");
  EXPECT_EQ(reloaded->cache.backend, CacheBackendChoice::Null);
  EXPECT_EQ(reloaded->rate_limit.lock_ttl_sec, 9);
}

TEST(ConfigTest, CheckReportsProblems) {
  SystemConfig config;
  config.runner.tick_interval_ms = 0;
  config.runner.time_limit_sec = 3;
  config.runner.resume_delay_sec = -1;
  config.scheduling.preferred_time = 30;
  config.scheduling.task_frequency["media_scan_frequency"] = "hourly";
  config.scheduling.task_frequency["database_cleanup_frequency"] = "disabled";
  config.rate_limit.lock_attempts = 0;

  auto problems = ConfigLoader::check(config);

  EXPECT_EQ(problems.size(), 6u);
  EXPECT_TRUE(has_problem(problems, "tick_interval_ms"));
  EXPECT_TRUE(has_problem(problems, "time_limit_sec"));
  EXPECT_TRUE(has_problem(problems, "resume_delay_sec"));
  EXPECT_TRUE(has_problem(problems, "clamped"));
  EXPECT_TRUE(has_problem(problems, "media_scan_frequency: unknown frequency 'hourly'"));
  EXPECT_TRUE(has_problem(problems, "lock_attempts"));
  EXPECT_FALSE(has_problem(problems, "database_cleanup_frequency"));
}

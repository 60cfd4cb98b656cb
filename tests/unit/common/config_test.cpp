/// @file config_test.cpp
/// @brief Tests for flaresignal configuration management

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "common/config.h"

namespace flaresignal {
namespace {

TEST(ConfigTest, LoadFromString) {
    const std::string yaml_content = R"(
flare:
  baseline_window_days: 21
  threshold_margin: 0.75
correlation:
  categories:
    - food
    - product
logging:
  level: debug
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok()) << result.status().message();

    Config config = std::move(*result);

    EXPECT_EQ(config.GetInt("flare.baseline_window_days"), 21);
    EXPECT_DOUBLE_EQ(config.GetDouble("flare.threshold_margin"), 0.75);
    EXPECT_EQ(config.GetString("logging.level"), "debug");

    auto categories = config.GetStringList("correlation.categories");
    ASSERT_EQ(categories.size(), 2);
    EXPECT_EQ(categories[0], "food");
    EXPECT_EQ(categories[1], "product");
}

TEST(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.GetString("nonexistent.key", "default"), "default");
    EXPECT_EQ(config.GetInt("nonexistent.key", 42), 42);
    EXPECT_EQ(config.GetDouble("nonexistent.key", 3.14), 3.14);
    EXPECT_EQ(config.GetBool("nonexistent.key", true), true);
}

TEST(ConfigTest, WrongTypeFallsBackToDefault) {
    auto result = Config::LoadFromString("flare:\n  threshold_margin: high\n");
    ASSERT_TRUE(result.ok());

    EXPECT_DOUBLE_EQ(result->GetDouble("flare.threshold_margin", 0.5), 0.5);
    EXPECT_EQ(result->GetInt("flare.threshold_margin", 7), 7);
}

TEST(ConfigTest, SetValues) {
    Config config;

    config.Set("test.string", std::string("value"));
    config.Set("test.int", static_cast<int64_t>(123));
    config.Set("test.bool", true);
    config.Set("nested.deeper.margin", 0.25);

    EXPECT_EQ(config.GetString("test.string"), "value");
    EXPECT_EQ(config.GetInt("test.int"), 123);
    EXPECT_EQ(config.GetBool("test.bool"), true);
    EXPECT_DOUBLE_EQ(config.GetDouble("nested.deeper.margin"), 0.25);
}

TEST(ConfigTest, HasKey) {
    const std::string yaml_content = R"(
existing:
  key: value
)";

    auto result = Config::LoadFromString(yaml_content);
    ASSERT_TRUE(result.ok());

    Config config = std::move(*result);

    EXPECT_TRUE(config.HasKey("existing.key"));
    EXPECT_FALSE(config.HasKey("nonexistent.key"));
    EXPECT_FALSE(config.HasKey("existing.key.deeper"));
}

TEST(ConfigTest, LookupDoesNotModifyTree) {
    auto result = Config::LoadFromString("flare:\n  threshold_margin: 0.5\n");
    ASSERT_TRUE(result.ok());
    Config config = std::move(*result);

    EXPECT_FALSE(config.HasKey("flare.missing"));
    EXPECT_FALSE(config.HasKey("missing.section"));

    EXPECT_DOUBLE_EQ(config.GetDouble("flare.threshold_margin"), 0.5);
    EXPECT_FALSE(config.GetNode()["missing"].IsDefined());
}

TEST(ConfigTest, MergeConfigs) {
    const std::string base_yaml = R"(
key1: value1
nested:
  a: 1
  b: 2
)";

    const std::string overlay_yaml = R"(
key2: value2
nested:
  b: 20
  c: 3
)";

    auto base_result = Config::LoadFromString(base_yaml);
    auto overlay_result = Config::LoadFromString(overlay_yaml);
    ASSERT_TRUE(base_result.ok());
    ASSERT_TRUE(overlay_result.ok());

    Config base = std::move(*base_result);
    Config overlay = std::move(*overlay_result);

    base.Merge(overlay);

    EXPECT_EQ(base.GetString("key1"), "value1");
    EXPECT_EQ(base.GetString("key2"), "value2");
    EXPECT_EQ(base.GetInt("nested.a"), 1);
    EXPECT_EQ(base.GetInt("nested.b"), 20);  // Overwritten
    EXPECT_EQ(base.GetInt("nested.c"), 3);   // Added
}

TEST(ConfigTest, InvalidYaml) {
    const std::string invalid_yaml = "{ invalid yaml [";

    auto result = Config::LoadFromString(invalid_yaml);
    EXPECT_FALSE(result.ok());
}

TEST(ConfigTest, MissingFileIsNotFound) {
    auto result = Config::LoadFromFile("/nonexistent/flaresignal.yaml");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kNotFound);
}

TEST(ConfigTest, LoadFromEnvironment) {
    setenv("FSTEST_FLARE_MARGIN", "0.8", 1);
    setenv("FSTEST_FLARE_BASELINE_WINDOW_DAYS", "10", 1);
    setenv("FSTEST_CORRELATION_PERIOD_DAYS", "not-a-number", 1);
    setenv("FSTEST_LOG_LEVEL", "warn", 1);

    Config config = Config::LoadFromEnvironment("FSTEST_");

    EXPECT_DOUBLE_EQ(config.GetDouble("flare.threshold_margin"), 0.8);
    EXPECT_EQ(config.GetInt("flare.baseline_window_days"), 10);
    EXPECT_FALSE(config.HasKey("correlation.period_days"));
    EXPECT_EQ(config.GetString("logging.level"), "warn");

    unsetenv("FSTEST_FLARE_MARGIN");
    unsetenv("FSTEST_FLARE_BASELINE_WINDOW_DAYS");
    unsetenv("FSTEST_CORRELATION_PERIOD_DAYS");
    unsetenv("FSTEST_LOG_LEVEL");
}

TEST(ConfigTest, ToJson) {
    auto result = Config::LoadFromString("flare:\n  min_episode_days: 3\n  label: x\n");
    ASSERT_TRUE(result.ok());

    auto json = result->ToJson();
    EXPECT_EQ(json["flare"]["min_episode_days"], 3);
    EXPECT_EQ(json["flare"]["label"], "x");
}

TEST(ConfigTest, GlobalConfigFromFileAndEnvironment) {
    const auto path = std::filesystem::temp_directory_path() / "flaresignal_config_test.yaml";
    {
        std::ofstream out(path);
        out << "flare:\n  threshold_margin: 0.6\n  baseline_window_days: 21\n";
    }
    setenv("FSGLOBAL_FLARE_MARGIN", "0.9", 1);

    ASSERT_TRUE(InitGlobalConfig(path, "FSGLOBAL_").ok());
    EXPECT_DOUBLE_EQ(GlobalConfig().GetDouble("flare.threshold_margin"), 0.9);
    EXPECT_EQ(GlobalConfig().GetInt("flare.baseline_window_days"), 21);

    unsetenv("FSGLOBAL_FLARE_MARGIN");
    std::filesystem::remove(path);

    EXPECT_FALSE(InitGlobalConfig(path, "FSGLOBAL_").ok());
}

}  // namespace
}  // namespace flaresignal

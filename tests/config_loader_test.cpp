#include "config/config_loader.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>
#include <fstream>

using namespace FileCache::Config;
using FileCache::Testing::TempDirectory;

TEST(ConfigLoaderTest, MinimalDocumentUsesDefaults)
{
    auto config = loadConfigFromString(R"({"root": "/tmp/fc"})");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->root, "/tmp/fc");
    EXPECT_EQ(config->extension, ".cache");
    EXPECT_EQ(config->default_ttl_seconds, 3600);
    EXPECT_EQ(config->jitter_percentage, 10);
    EXPECT_FALSE(config->max_items.has_value());
    EXPECT_EQ(config->log_level, spdlog::level::info);
}

TEST(ConfigLoaderTest, ReadsEverySetting)
{
    auto config = loadConfigFromString(R"({
        "root": "/var/cache/app",
        "global_settings": {"log_level": "debug"},
        "cache_settings": {
            "extension": ".bin",
            "key_prefix": "app:",
            "default_ttl": 120,
            "max_items": 500,
            "jitter_percentage": 25,
            "stale_grace": 30,
            "lock_timeout": 3,
            "lock_poll_interval_ms": 5,
            "max_key_length": 64
        }
    })");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->extension, ".bin");
    EXPECT_EQ(config->key_prefix, "app:");
    EXPECT_EQ(config->default_ttl_seconds, 120);
    EXPECT_EQ(config->max_items, std::optional<std::uint64_t>(500));
    EXPECT_EQ(config->jitter_percentage, 25);
    EXPECT_EQ(config->stale_grace_seconds, 30);
    EXPECT_EQ(config->lock_timeout_seconds, 3);
    EXPECT_EQ(config->lock_poll_interval_ms, 5);
    EXPECT_EQ(config->max_key_length, 64u);
    EXPECT_EQ(config->log_level, spdlog::level::debug);
}

TEST(ConfigLoaderTest, MaxItemsAcceptsUnlimited)
{
    auto config =
        loadConfigFromString(R"({"root": "/r", "cache_settings": {"max_items": "unlimited"}})");
    ASSERT_TRUE(config.has_value());
    EXPECT_FALSE(config->max_items.has_value());

    auto bad = loadConfigFromString(R"({"root": "/r", "cache_settings": {"max_items": "lots"}})");
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error(), LoadError::ValidationError);
}

TEST(ConfigLoaderTest, RejectsInvalidValues)
{
    EXPECT_EQ(loadConfigFromString(R"({"cache_settings": {}})").error(), LoadError::ValidationError);
    EXPECT_EQ(
        loadConfigFromString(R"({"root": "/r", "cache_settings": {"jitter_percentage": 150}})")
            .error(),
        LoadError::ValidationError
    );
    EXPECT_EQ(
        loadConfigFromString(R"({"root": "/r", "cache_settings": {"extension": "cache"}})").error(),
        LoadError::ValidationError
    );
    EXPECT_EQ(
        loadConfigFromString(R"({"root": "/r", "cache_settings": {"default_ttl": "soon"}})")
            .error(),
        LoadError::JsonParseError
    );
    EXPECT_EQ(loadConfigFromString("{ not json").error(), LoadError::JsonParseError);
}

TEST(ConfigLoaderTest, UnknownLogLevelKeepsDefault)
{
    auto config =
        loadConfigFromString(R"({"root": "/r", "global_settings": {"log_level": "chatty"}})");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->log_level, spdlog::level::info);
}

TEST(ConfigLoaderTest, LoadsFromFile)
{
    TempDirectory dir;
    const auto path = dir.Path() / "config.json";
    {
        std::ofstream out(path);
        out << R"({"root": "/srv/cache", "cache_settings": {"default_ttl": 0}})";
    }
    auto config = loadConfigFromFile(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->default_ttl_seconds, 0);

    EXPECT_EQ(loadConfigFromFile(dir.Path() / "missing.json").error(), LoadError::FileNotFound);

    auto verbose = loadConfigFromFileVerbose(dir.Path() / "missing.json");
    ASSERT_FALSE(verbose.has_value());
    EXPECT_NE(verbose.error().find("File not found"), std::string::npos);
}

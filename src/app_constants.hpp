#ifndef FILECACHE_SRC_APP_CONSTANTS_HPP_
#define FILECACHE_SRC_APP_CONSTANTS_HPP_

#include <spdlog/common.h>
#include <cstdint>
#include <string_view>

namespace FileCache::Constants
{
// Application Info
constexpr std::string_view APP_NAME = "FileCache";
// TODO: Derive from cmake
constexpr std::string_view APP_VERSION_STRING = "FileCache version 0.1.0";
constexpr std::string_view APP_VERSION_SHORT  = "0.1.0";

// Logging
constexpr spdlog::level::level_enum DEFAULT_LOG_LEVEL   = spdlog::level::info;
constexpr spdlog::level::level_enum DEFAULT_FLUSH_LEVEL = spdlog::level::warn;
constexpr std::string_view DEFAULT_CONSOLE_LOG_PATTERN =
    "[%Y-%m-%d %H:%M:%S.%e] [ThreadID:%t] [%^%l%$] [%n] %v";

// Cache defaults
constexpr std::string_view DEFAULT_EXTENSION        = ".cache";
constexpr std::int64_t DEFAULT_TTL_SECONDS          = 3600;
constexpr int DEFAULT_JITTER_PERCENTAGE             = 10;
constexpr std::int64_t DEFAULT_STALE_GRACE_SECONDS  = 300;
constexpr std::int64_t DEFAULT_LOCK_TIMEOUT_SECONDS = 10;
constexpr std::int64_t DEFAULT_LOCK_POLL_MS         = 50;
constexpr std::size_t DEFAULT_MAX_KEY_LENGTH        = 250;
// Longer ttls are clamped so expiry arithmetic stays in range
constexpr std::int64_t MAX_TTL_SECONDS              = 100LL * 365 * 24 * 3600;

// Write temporaries older than this belong to a dead writer
constexpr std::int64_t STALE_TEMPORARY_AGE_SECONDS = 3600;

// On-disk layout. Entry files never start with '.', so everything below is
// invisible to listings and eviction scans.
constexpr std::string_view META_DIR_NAME  = ".filecache";
constexpr std::string_view TAGS_DIR_NAME  = "tags";
constexpr std::string_view LOCKS_DIR_NAME = "locks";
constexpr std::string_view LOCK_SUFFIX    = ".lock";
constexpr std::string_view TAG_SUFFIX     = ".json";

}  // namespace FileCache::Constants

#endif  // FILECACHE_SRC_APP_CONSTANTS_HPP_

#ifndef FILECACHE_SRC_CONFIG_CONFIG_TYPES_HPP_
#define FILECACHE_SRC_CONFIG_CONFIG_TYPES_HPP_

#include "app_constants.hpp"

#include <spdlog/spdlog.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace FileCache::Config
{

// Function to convert string to spdlog::level::level_enum
std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str);

//------------------------------------------------------------------------------//
// Structs for Configuration Types
//------------------------------------------------------------------------------//

struct CacheConfig {
    std::filesystem::path root;  ///< Directory holding every scope of this cache
    std::string extension  = std::string(Constants::DEFAULT_EXTENSION);
    std::string key_prefix;

    std::int64_t default_ttl_seconds = Constants::DEFAULT_TTL_SECONDS;  ///< 0 = never expire
    std::optional<std::uint64_t> max_items;                             ///< Unbounded if empty
    int jitter_percentage = Constants::DEFAULT_JITTER_PERCENTAGE;

    /// How long past expiry an entry may still be served by RememberWithStale.
    std::int64_t stale_grace_seconds   = Constants::DEFAULT_STALE_GRACE_SECONDS;
    std::int64_t lock_timeout_seconds  = Constants::DEFAULT_LOCK_TIMEOUT_SECONDS;
    std::int64_t lock_poll_interval_ms = Constants::DEFAULT_LOCK_POLL_MS;
    std::size_t max_key_length         = Constants::DEFAULT_MAX_KEY_LENGTH;

    spdlog::level::level_enum log_level = Constants::DEFAULT_LOG_LEVEL;

    bool IsValid() const;
};

//------------------------------------------------------------------------------//
// Implementation of Logging Conversion Functions
//------------------------------------------------------------------------------//

inline std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str)
{
    if (level_str == "trace") {
        return spdlog::level::trace;
    }
    if (level_str == "debug") {
        return spdlog::level::debug;
    }
    if (level_str == "info") {
        return spdlog::level::info;
    }
    if (level_str == "warn") {
        return spdlog::level::warn;
    }
    if (level_str == "error") {
        return spdlog::level::err;
    }
    if (level_str == "fatal" || level_str == "critical") {
        return spdlog::level::critical;
    }
    if (level_str == "off") {
        return spdlog::level::off;
    }
    return std::nullopt;
}

//------------------------------------------------------------------------------//
// Implementation of Configuration Structs Functions
//------------------------------------------------------------------------------//

inline bool CacheConfig::IsValid() const
{
    if (root.empty()) {
        return false;
    }
    if (!extension.empty() && (extension.front() != '.' || extension.size() < 2 ||
                               extension.find('/') != std::string::npos)) {
        spdlog::error("Extension '{}' must start with '.' and contain no '/'.", extension);
        return false;
    }
    if (default_ttl_seconds < 0 || stale_grace_seconds < 0) {
        return false;
    }
    if (jitter_percentage < 0 || jitter_percentage > 100) {
        spdlog::error("jitter_percentage ({}) must be within 0-100.", jitter_percentage);
        return false;
    }
    if (lock_timeout_seconds <= 0 || lock_poll_interval_ms <= 0) {
        return false;
    }
    if (max_key_length == 0) {
        return false;
    }
    return true;
}

}  // namespace FileCache::Config

#endif  // FILECACHE_SRC_CONFIG_CONFIG_TYPES_HPP_

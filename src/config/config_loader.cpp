#include "config_loader.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <system_error>
#include "config_types.hpp"

#define TRY_ASSIGN(target, json_obj, key, type)                            \
    try {                                                                  \
        if (json_obj.contains(key)) {                                      \
            target = json_obj.at(key).get<type>();                         \
        }                                                                  \
    } catch (const nlohmann::json::exception &e) {                         \
        spdlog::error("JSON parse error for key '{}': {}", key, e.what()); \
        return std::unexpected(LoadError::JsonParseError);                 \
    }

#define TRY_ASSIGN_REQUIRED(target, json_obj, key, type)                            \
    try {                                                                           \
        if (!json_obj.contains(key)) {                                              \
            spdlog::error("Missing required JSON key: '{}'", key);                  \
            return std::unexpected(LoadError::ValidationError);                     \
        }                                                                           \
        target = json_obj.at(key).get<type>();                                      \
    } catch (const nlohmann::json::exception &e) {                                  \
        spdlog::error("JSON parse error for required key '{}': {}", key, e.what()); \
        return std::unexpected(LoadError::JsonParseError);                          \
    }

namespace FileCache::Config
{

namespace
{

LoadResult ParseConfig(const nlohmann::json &j)
{
    if (!j.is_object()) {
        spdlog::error("Configuration root must be a JSON object.");
        return std::unexpected(LoadError::ValidationError);
    }

    CacheConfig config;

    std::string root_str;
    TRY_ASSIGN_REQUIRED(root_str, j, "root", std::string);
    config.root = root_str;

    if (j.contains("global_settings")) {
        const auto &gs = j.at("global_settings");
        if (!gs.is_object()) {
            spdlog::error("'global_settings' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        std::string log_level_str =
            spdlog::level::to_string_view(Constants::DEFAULT_LOG_LEVEL).data();
        TRY_ASSIGN(log_level_str, gs, "log_level", std::string);  // Assign default first
        if (!log_level_str.empty()) {
            auto level_opt = StringToLogLevel(log_level_str);
            if (!level_opt) {
                spdlog::error(
                    "Invalid 'log_level' value: {}. Using default '{}'.", log_level_str,
                    spdlog::level::to_string_view(config.log_level)
                );
                // Keep the default already set in config
            } else {
                config.log_level = *level_opt;
            }
        }
    }

    if (j.contains("cache_settings")) {
        const auto &cs = j.at("cache_settings");
        if (!cs.is_object()) {
            spdlog::error("'cache_settings' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        TRY_ASSIGN(config.extension, cs, "extension", std::string);
        TRY_ASSIGN(config.key_prefix, cs, "key_prefix", std::string);
        TRY_ASSIGN(config.default_ttl_seconds, cs, "default_ttl", std::int64_t);
        TRY_ASSIGN(config.jitter_percentage, cs, "jitter_percentage", int);
        TRY_ASSIGN(config.stale_grace_seconds, cs, "stale_grace", std::int64_t);
        TRY_ASSIGN(config.lock_timeout_seconds, cs, "lock_timeout", std::int64_t);
        TRY_ASSIGN(config.lock_poll_interval_ms, cs, "lock_poll_interval_ms", std::int64_t);
        TRY_ASSIGN(config.max_key_length, cs, "max_key_length", std::size_t);

        // max_items: a positive number, null, or "unlimited"
        if (cs.contains("max_items")) {
            const auto &mi = cs.at("max_items");
            if (mi.is_null()) {
                config.max_items.reset();
            } else if (mi.is_string()) {
                std::string mi_str;
                TRY_ASSIGN(mi_str, cs, "max_items", std::string);
                if (mi_str != "unlimited") {
                    spdlog::error("'max_items' string must be \"unlimited\", got '{}'", mi_str);
                    return std::unexpected(LoadError::ValidationError);
                }
                config.max_items.reset();
            } else if (mi.is_number_unsigned()) {
                std::uint64_t max_items = 0;
                TRY_ASSIGN(max_items, cs, "max_items", std::uint64_t);
                config.max_items = max_items;
            } else {
                spdlog::error("'max_items' must be a non-negative number or \"unlimited\".");
                return std::unexpected(LoadError::ValidationError);
            }
        }
    }

    if (!config.IsValid()) {
        spdlog::error("Cache configuration is invalid after parsing.");
        return std::unexpected(LoadError::ValidationError);
    }

    spdlog::info(
        "Cache settings: root='{}', ext='{}', default_ttl={}s, max_items={}, jitter={}%, "
        "grace={}s, lock_timeout={}s",
        config.root.string(), config.extension, config.default_ttl_seconds,
        config.max_items ? std::to_string(*config.max_items) : std::string("unlimited"),
        config.jitter_percentage, config.stale_grace_seconds, config.lock_timeout_seconds
    );
    return config;
}

}  // namespace

LoadResult loadConfigFromFile(const std::filesystem::path &file_path)
{
    spdlog::info("Attempting to load configuration from: {}", file_path.string());

    std::ifstream config_stream(file_path);
    if (!config_stream.is_open()) {
        spdlog::error("Failed to open config file: {}", file_path.string());
        return std::unexpected(LoadError::FileNotFound);
    }

    nlohmann::json j;
    try {
        config_stream >> j;
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::error("Failed to parse JSON config file: {}", e.what());
        return std::unexpected(LoadError::JsonParseError);
    }
    return ParseConfig(j);
}

LoadResult loadConfigFromString(const std::string &json_text)
{
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::error("Failed to parse JSON config: {}", e.what());
        return std::unexpected(LoadError::JsonParseError);
    }
    return ParseConfig(j);
}

LoadErrorMsg loadConfigFromFileVerbose(const std::filesystem::path &file_path)
{
    auto result = loadConfigFromFile(file_path);
    if (result.has_value()) {
        return result.value();
    } else {
        std::string error_message = "Failed to load config (" + file_path.string() + "): ";
        switch (result.error()) {
            case LoadError::FileNotFound:
                error_message += "File not found.";
                break;
            case LoadError::JsonParseError:
                error_message += "JSON parsing failed.";
                break;
            case LoadError::ValidationError:
                error_message += "Configuration validation failed.";
                break;
            default:
                error_message += "Unknown error.";
                break;
        }
        return std::unexpected(error_message);
    }
}

}  // namespace FileCache::Config

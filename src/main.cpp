#include "app_constants.hpp"
#include "cache/cache_engine.hpp"
#include "cache/cache_manager.hpp"
#include "config/config_loader.hpp"
#include "config/config_types.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace
{

using FileCache::Cache::Bytes;
using FileCache::Cache::CacheEngine;

Bytes ToBytes(const std::string &text)
{
    const auto *p = reinterpret_cast<const std::byte *>(text.data());
    return Bytes(p, p + text.size());
}

void PrintPayload(const Bytes &payload)
{
    std::cout.write(reinterpret_cast<const char *>(payload.data()), payload.size());
    std::cout << std::endl;
}

template <typename T>
int ReportFailure(const FileCache::Cache::StorageResult<T> &res, const char *what)
{
    spdlog::error("{} failed: {}", what, res.error().message());
    return EXIT_FAILURE;
}

}  // namespace

int main(int argc, char *argv[])
{
    // Command Line argument parsing
    CLI::App app{std::string(FileCache::Constants::APP_NAME)};
    app.require_subcommand(1);

    std::string config_path_str;
    std::string root_str;
    std::string scope_str;

    app.add_option("-c,--config", config_path_str, "Path to the configuration JSON file")
        ->check(CLI::ExistingFile);
    app.add_option("-r,--root", root_str, "Cache root directory (overrides the configuration)");
    app.add_option("-s,--scope", scope_str, "Nested scope, e.g. users/avatars");
    app.set_version_flag("-v,--version", std::string(FileCache::Constants::APP_VERSION_STRING));

    std::string key;
    std::string value;
    std::vector<std::string> tags;
    std::optional<std::int64_t> ttl_seconds;
    std::optional<std::uint64_t> max_items;
    bool jitter = false;

    auto *get_cmd = app.add_subcommand("get", "Print the value stored under a key");
    get_cmd->add_option("key", key)->required();

    auto *put_cmd = app.add_subcommand("put", "Store a value under a key");
    put_cmd->add_option("key", key)->required();
    put_cmd->add_option("value", value)->required();
    put_cmd->add_option("--ttl", ttl_seconds, "Seconds to live, 0 for no expiry");
    put_cmd->add_option("--tag", tags, "Tag to attach (repeatable)");
    put_cmd->add_flag("--jitter", jitter, "Perturb the ttl by the configured percentage");

    auto *has_cmd = app.add_subcommand("has", "Exit with 0 if a live value exists");
    has_cmd->add_option("key", key)->required();

    auto *delete_cmd = app.add_subcommand("delete", "Remove a key");
    delete_cmd->add_option("key", key)->required();

    auto *pull_cmd = app.add_subcommand("pull", "Print and remove a key");
    pull_cmd->add_option("key", key)->required();

    auto *keys_cmd  = app.add_subcommand("keys", "List live keys in the scope");
    auto *clear_cmd = app.add_subcommand("clear", "Remove every entry in the scope");

    auto *flush_cmd = app.add_subcommand("flush-tags", "Remove every entry carrying a tag");
    flush_cmd->add_option("tags", tags)->required();

    auto *evict_cmd = app.add_subcommand("evict", "Evict least recently used entries");
    evict_cmd->add_option("--max", max_items, "Item limit (defaults to the configured one)");

    auto *purge_cmd = app.add_subcommand("purge", "Remove expired and corrupt entries");
    auto *stats_cmd = app.add_subcommand("stats", "Print entry count and size of the scope");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    // Initialize default logger (console) before config is parsed
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern(std::string(FileCache::Constants::DEFAULT_CONSOLE_LOG_PATTERN));
        auto main_logger = std::make_shared<spdlog::logger>(
            std::string(FileCache::Constants::APP_NAME), console_sink
        );
        spdlog::set_default_logger(main_logger);
        spdlog::set_level(FileCache::Constants::DEFAULT_LOG_LEVEL);
        spdlog::flush_on(FileCache::Constants::DEFAULT_FLUSH_LEVEL);
    } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    // Load Configuration
    FileCache::Config::CacheConfig config;
    if (!config_path_str.empty()) {
        auto config_result =
            FileCache::Config::loadConfigFromFileVerbose(std::filesystem::path(config_path_str));
        if (!config_result) {
            spdlog::critical("Error loading configuration: {}", config_result.error());
            return EXIT_FAILURE;
        }
        config = std::move(config_result.value());
    }
    if (!root_str.empty()) {
        config.root = root_str;
    }
    if (config.root.empty()) {
        spdlog::critical("No cache root given; pass --root or set 'root' in the configuration");
        return EXIT_FAILURE;
    }
    spdlog::set_level(config.log_level);

    // Setup Core Components
    std::shared_ptr<FileCache::Cache::CacheManager> manager;
    try {
        manager = std::make_shared<FileCache::Cache::CacheManager>(config);
    } catch (const std::exception &e) {
        spdlog::critical("Error initializing components: {}", e.what());
        return EXIT_FAILURE;
    }
    if (auto init_res = manager->Initialize(); !init_res) {
        spdlog::critical("Error initializing cache: {}", init_res.error().message());
        return EXIT_FAILURE;
    }

    CacheEngine engine = manager->Engine();
    if (!scope_str.empty()) {
        auto scoped = engine.WithPath(scope_str);
        if (!scoped) {
            spdlog::critical("Invalid scope '{}': {}", scope_str, scoped.error().message());
            return EXIT_FAILURE;
        }
        engine = std::move(scoped.value());
    }

    // Dispatch
    if (get_cmd->parsed()) {
        auto payload = engine.Read(key);
        if (!payload)
            return EXIT_FAILURE;
        PrintPayload(*payload);
        return EXIT_SUCCESS;
    }

    if (put_cmd->parsed()) {
        CacheEngine target = tags.empty() ? engine : engine.Tags(tags);
        std::optional<std::chrono::seconds> ttl;
        if (ttl_seconds)
            ttl = std::chrono::seconds(*ttl_seconds);
        const Bytes payload = ToBytes(value);
        auto res            = jitter ? target.WriteWithExpiry(key, payload, ttl)
                                     : target.Write(key, payload, ttl);
        if (!res)
            return ReportFailure(res, "put");
        return EXIT_SUCCESS;
    }

    if (has_cmd->parsed()) {
        return engine.Has(key) ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (delete_cmd->parsed()) {
        auto res = engine.Delete(key);
        if (!res)
            return ReportFailure(res, "delete");
        return EXIT_SUCCESS;
    }

    if (pull_cmd->parsed()) {
        auto payload = engine.Pull(key);
        if (!payload)
            return EXIT_FAILURE;
        PrintPayload(*payload);
        return EXIT_SUCCESS;
    }

    if (keys_cmd->parsed()) {
        auto keys = engine.Keys();
        if (!keys)
            return ReportFailure(keys, "keys");
        for (const auto &k : *keys) {
            std::cout << k << '\n';
        }
        return EXIT_SUCCESS;
    }

    if (clear_cmd->parsed()) {
        auto removed = engine.Clear();
        if (!removed)
            return ReportFailure(removed, "clear");
        std::cout << *removed << std::endl;
        return EXIT_SUCCESS;
    }

    if (flush_cmd->parsed()) {
        auto removed = engine.FlushTags(tags);
        if (!removed)
            return ReportFailure(removed, "flush-tags");
        std::cout << *removed << std::endl;
        return EXIT_SUCCESS;
    }

    if (evict_cmd->parsed()) {
        if (max_items)
            engine.SetMaxItems(max_items);
        if (!engine.GetMaxItems()) {
            spdlog::error("No item limit configured; pass --max");
            return EXIT_FAILURE;
        }
        auto evicted = engine.EnforceLimit();
        if (!evicted)
            return ReportFailure(evicted, "evict");
        std::cout << *evicted << std::endl;
        return EXIT_SUCCESS;
    }

    if (purge_cmd->parsed()) {
        auto purged = engine.PurgeExpired();
        if (!purged)
            return ReportFailure(purged, "purge");
        std::cout << *purged << std::endl;
        return EXIT_SUCCESS;
    }

    if (stats_cmd->parsed()) {
        auto keys = engine.Keys();
        if (!keys)
            return ReportFailure(keys, "stats");
        auto size = engine.GetCacheSize();
        if (!size)
            return ReportFailure(size, "stats");
        std::cout << "scope: '" << engine.GetScope().GetPathString() << "'\n"
                  << "live entries: " << keys->size() << '\n'
                  << "size bytes: " << *size << std::endl;
        return EXIT_SUCCESS;
    }

    spdlog::shutdown();
    return EXIT_SUCCESS;
}

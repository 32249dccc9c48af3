#include "cache/cache_manager.hpp"
#include "cache/cache_engine.hpp"
#include "storage/local_storage.hpp"

#include <spdlog/spdlog.h>

namespace FileCache::Cache
{

CacheManager::CacheManager(const Config::CacheConfig& config, std::shared_ptr<IClock> clock)
    : config_(config),
      clock_(clock ? std::move(clock) : std::make_shared<SystemClock>()),
      storage_(std::make_shared<Storage::LocalStorage>(config.root)),
      key_codec_(config.max_key_length),
      tag_index_(std::make_shared<TagIndex>(storage_)),
      lock_manager_(std::make_unique<LockManager>(
          storage_, clock_, std::chrono::seconds(config.lock_timeout_seconds),
          std::chrono::milliseconds(config.lock_poll_interval_ms)
      )),
      evictor_(std::make_unique<Evictor>(storage_, tag_index_))
{
    if (!config_.IsValid()) {
        spdlog::critical("Invalid cache configuration for root '{}'", config_.root.string());
        throw Storage::StorageException(
            Storage::make_error_code(Storage::StorageErrc::InvalidPath)
        );
    }
}

StorageResult<void> CacheManager::Initialize()
{
    spdlog::info("Initializing cache at '{}'", config_.root.string());

    if (auto res = storage_->Initialize(); !res) {
        spdlog::error(
            "Failed to initialize cache root '{}': {}", config_.root.string(),
            res.error().message()
        );
        return res;
    }
    for (const auto& dir : {TagIndex::TagsDirectory(), LockManager::LocksDirectory()}) {
        if (auto res = storage_->CreateDirectory(dir); !res) {
            spdlog::error(
                "Failed to create metadata directory '{}': {}", dir.string(), res.error().message()
            );
            return res;
        }
    }

    spdlog::info(
        "Cache ready: extension '{}', default ttl {}s, max items {}", config_.extension,
        config_.default_ttl_seconds,
        config_.max_items ? std::to_string(*config_.max_items) : std::string("unlimited")
    );
    return {};
}

CacheEngine CacheManager::Engine()
{
    return CacheEngine(
        shared_from_this(), Scope(config_.extension, config_.key_prefix), config_.max_items
    );
}

}  // namespace FileCache::Cache

#ifndef FILECACHE_SRC_CACHE_CACHE_MANAGER_HPP_
#define FILECACHE_SRC_CACHE_CACHE_MANAGER_HPP_

#include "cache/clock.hpp"
#include "cache/evictor.hpp"
#include "cache/key_codec.hpp"
#include "cache/lock_manager.hpp"
#include "cache/metrics_collector.hpp"
#include "cache/tag_index.hpp"
#include "config/config_types.hpp"
#include "storage/i_storage.hpp"
#include "storage/storage_error.hpp"

#include <memory>

namespace FileCache::Cache
{

class CacheEngine;

/**
 * @brief Owns every component of one cache root and hands out engine views.
 *
 * All views created from the same manager share its storage, lock manager and
 * metrics. The manager must be owned by a std::shared_ptr; views keep it alive.
 */
class CacheManager : public std::enable_shared_from_this<CacheManager>
{
    private:
    using IStorage = Storage::IStorage;

    public:
    explicit CacheManager(
        const Config::CacheConfig& config, std::shared_ptr<IClock> clock = nullptr
    );
    ~CacheManager() = default;

    CacheManager(const CacheManager&)            = delete;
    CacheManager& operator=(const CacheManager&) = delete;
    CacheManager(CacheManager&&)                 = delete;
    CacheManager& operator=(CacheManager&&)      = delete;

    /// Creates the root and the reserved metadata directories.
    StorageResult<void> Initialize();

    /// View over the root scope with the configured key prefix.
    CacheEngine Engine();

    const Config::CacheConfig& GetConfig() const { return config_; }
    IStorage& GetStorage() { return *storage_; }
    const KeyCodec& GetKeyCodec() const { return key_codec_; }
    TagIndex& GetTagIndex() { return *tag_index_; }
    LockManager& GetLockManager() { return *lock_manager_; }
    Evictor& GetEvictor() { return *evictor_; }
    MetricsCollector& GetMetrics() { return metrics_; }
    const IClock& GetClock() const { return *clock_; }

    private:
    const Config::CacheConfig config_;
    const std::shared_ptr<IClock> clock_;
    const std::shared_ptr<IStorage> storage_;
    const KeyCodec key_codec_;
    std::shared_ptr<TagIndex> tag_index_;
    std::unique_ptr<LockManager> lock_manager_;
    std::unique_ptr<Evictor> evictor_;
    MetricsCollector metrics_;
};

}  // namespace FileCache::Cache

#endif  // FILECACHE_SRC_CACHE_CACHE_MANAGER_HPP_

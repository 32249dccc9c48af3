#ifndef FILECACHE_SRC_CACHE_CACHE_ENGINE_HPP_
#define FILECACHE_SRC_CACHE_CACHE_ENGINE_HPP_

#include "cache/entry_codec.hpp"
#include "cache/key_codec.hpp"
#include "cache/metrics_collector.hpp"
#include "storage/storage_error.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace FileCache::Cache
{

class CacheManager;

/**
 * @brief Public cache contract over one scope.
 *
 * An engine is a lightweight view: a scope, a staged tag set and an item
 * limit, backed by the components of its CacheManager. WithPath, WithPrefix
 * and Tags return new views and leave the receiver untouched.
 *
 * Read-side faults (missing, expired, corrupt or unreadable entries) are
 * reported as misses. Write-side faults are returned to the caller.
 */
class CacheEngine
{
    public:
    using Ttl       = std::optional<std::chrono::seconds>;
    using ComputeFn = std::function<Bytes()>;

    CacheEngine(
        std::shared_ptr<CacheManager> manager, Scope scope, std::optional<std::uint64_t> max_items
    );

    //------------------------------------------------------------------------------//
    // Views
    //------------------------------------------------------------------------------//

    StorageResult<CacheEngine> WithPath(std::string_view sub) const;
    CacheEngine WithPrefix(std::string key_prefix) const;

    /// View whose next Write attaches `tags`; consumed by that write.
    CacheEngine Tags(std::vector<std::string> tags) const;

    const Scope& GetScope() const { return scope_; }

    //------------------------------------------------------------------------------//
    // Basic Operations
    //------------------------------------------------------------------------------//

    /// ttl: std::nullopt for the configured default, zero for no expiry.
    /// A negative ttl removes the key instead.
    StorageResult<void> Write(
        const std::string& key, std::span<const std::byte> payload, Ttl ttl = std::nullopt
    );

    std::optional<Bytes> Read(const std::string& key);
    Bytes Read(const std::string& key, Bytes default_value);

    bool Has(const std::string& key);

    StorageResult<void> Delete(const std::string& key);

    /// Removes every entry directly in this scope. Returns the number removed.
    StorageResult<std::size_t> Clear();

    /// Keys of the live entries in this scope that carry this view's prefix,
    /// with the prefix stripped.
    StorageResult<std::vector<std::string>> Keys();

    /// Writes only when no live entry exists. Returns whether it wrote.
    StorageResult<bool> Add(
        const std::string& key, std::span<const std::byte> payload, Ttl ttl = std::nullopt
    );

    /// Read followed by Delete.
    std::optional<Bytes> Pull(const std::string& key);

    /// Deletes entries past expiry and grace, and entries that fail to decode.
    StorageResult<std::size_t> PurgeExpired();

    //------------------------------------------------------------------------------//
    // Computed Values
    //------------------------------------------------------------------------------//

    // Exceptions thrown by `compute` propagate unchanged and nothing is cached.
    // A failed write of the computed value is logged; the value is still returned.

    StorageResult<Bytes> Remember(const std::string& key, Ttl ttl, const ComputeFn& compute);
    StorageResult<Bytes> Permanent(const std::string& key, const ComputeFn& compute);

    /**
     * @brief Remember with stampede protection.
     *
     * Fresh entries are returned directly. An entry inside the grace window
     * after expiry is refreshed by whichever caller wins the key's lock; the
     * others are served the stale value. When nothing usable is cached the
     * caller waits for the lock, and if it never gets it, re-reads once and
     * finally computes without the lock.
     */
    StorageResult<Bytes> RememberWithStale(
        const std::string& key, Ttl ttl, const ComputeFn& compute
    );

    //------------------------------------------------------------------------------//
    // Tags, Locks, Eviction
    //------------------------------------------------------------------------------//

    /// Returns the number of entries removed.
    StorageResult<std::size_t> FlushTags(const std::vector<std::string>& tags);

    StorageResult<bool> AcquireLock(
        const std::string& key, std::optional<std::chrono::seconds> timeout = std::nullopt
    );
    StorageResult<bool> ReleaseLock(const std::string& key);

    void SetMaxItems(std::optional<std::uint64_t> max_items) { max_items_ = max_items; }
    std::optional<std::uint64_t> GetMaxItems() const { return max_items_; }

    /// Evicts least recently accessed entries down to the item limit.
    StorageResult<std::size_t> EnforceLimit();

    //------------------------------------------------------------------------------//
    // Expiry Jitter
    //------------------------------------------------------------------------------//

    std::chrono::seconds AddJitter(std::chrono::seconds ttl) const;
    StorageResult<void> WriteWithExpiry(
        const std::string& key, std::span<const std::byte> payload, Ttl ttl = std::nullopt
    );

    //------------------------------------------------------------------------------//
    // Introspection
    //------------------------------------------------------------------------------//

    MetricsSnapshot GetMetrics() const;
    void ResetMetrics();

    /// Sum of the on-disk sizes of the entry files in this scope.
    StorageResult<std::uint64_t> GetCacheSize() const;

    private:
    enum class EntryState { Fresh, Stale, Expired, Missing };

    struct Lookup {
        EntryState state = EntryState::Missing;
        std::filesystem::path location;
        std::optional<CacheEntry> entry;
    };

    std::string FullKey(const std::string& key) const { return scope_.GetKeyPrefix() + key; }

    StorageResult<Lookup> LookupEntry(const std::string& key) const;
    EntryState Classify(const EntryHeader& header) const;

    /// Bumps last access and counts the hit.
    void RecordHit(const std::filesystem::path& location);

    /// Removes an entry file and detaches it from its tags.
    StorageResult<bool> RemoveEntry(
        const std::filesystem::path& location, const std::optional<EntryHeader>& header
    );

    /// Removes abandoned write temporaries from this scope's directory.
    StorageResult<std::size_t> SweepTemporaries();

    StorageResult<void> StoreComputed(const std::string& key, const Bytes& value, Ttl ttl);
    Bytes RunCompute(const std::string& key, const ComputeFn& compute) const;

    std::shared_ptr<CacheManager> manager_;
    Scope scope_;
    std::vector<std::string> pending_tags_;
    std::optional<std::uint64_t> max_items_;
};

}  // namespace FileCache::Cache

#endif  // FILECACHE_SRC_CACHE_CACHE_ENGINE_HPP_

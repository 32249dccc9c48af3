#ifndef FILECACHE_SRC_CACHE_LOCK_MANAGER_HPP_
#define FILECACHE_SRC_CACHE_LOCK_MANAGER_HPP_

#include "cache/clock.hpp"
#include "cache/key_codec.hpp"
#include "storage/i_storage.hpp"
#include "storage/storage_error.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace FileCache::Cache
{

/**
 * @brief Cross-process advisory locks keyed by (scope, key).
 *
 * A lock is a marker file under `.filecache/locks` created with O_EXCL. The
 * marker records the holder's token, pid, host and acquisition time. A marker
 * older than the acquirer's timeout is considered abandoned and may be
 * reclaimed. Release only removes a marker whose token matches the one this
 * process wrote.
 */
class LockManager
{
    public:
    LockManager(
        std::shared_ptr<Storage::IStorage> storage, std::shared_ptr<IClock> clock,
        std::chrono::seconds default_timeout, std::chrono::milliseconds poll_interval
    );

    LockManager(const LockManager&)            = delete;
    LockManager& operator=(const LockManager&) = delete;

    /// Single non-blocking attempt. false means another holder has it.
    StorageResult<bool> Acquire(
        const std::string& scope, const std::string& key,
        std::optional<std::chrono::seconds> timeout = std::nullopt
    );

    /// Polls until the lock is acquired or `wait` has elapsed.
    StorageResult<bool> AcquireBlocking(
        const std::string& scope, const std::string& key,
        std::optional<std::chrono::seconds> wait = std::nullopt
    );

    /// true if a marker written by this process was removed.
    StorageResult<bool> Release(const std::string& scope, const std::string& key);

    bool IsHeld(const std::string& scope, const std::string& key) const;

    std::chrono::seconds GetDefaultTimeout() const { return default_timeout_; }

    static std::filesystem::path LocksDirectory();

    private:
    StorageResult<std::filesystem::path> MarkerLocation(
        const std::string& scope, const std::string& key
    ) const;

    StorageResult<bool> TryReclaim(
        const std::filesystem::path& marker, std::chrono::seconds timeout
    );

    std::string NewToken() const;

    std::shared_ptr<Storage::IStorage> storage_;
    std::shared_ptr<IClock> clock_;
    const std::chrono::seconds default_timeout_;
    const std::chrono::milliseconds poll_interval_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> held_tokens_;  ///< marker -> token
};

/// Releases the lock on destruction if it was acquired.
class LockGuard
{
    public:
    LockGuard(LockManager& manager, std::string scope, std::string key, bool acquired)
        : manager_(manager), scope_(std::move(scope)), key_(std::move(key)), acquired_(acquired)
    {
    }
    ~LockGuard();

    LockGuard(const LockGuard&)            = delete;
    LockGuard& operator=(const LockGuard&) = delete;

    bool Acquired() const { return acquired_; }

    private:
    LockManager& manager_;
    std::string scope_;
    std::string key_;
    bool acquired_;
};

}  // namespace FileCache::Cache

#endif  // FILECACHE_SRC_CACHE_LOCK_MANAGER_HPP_

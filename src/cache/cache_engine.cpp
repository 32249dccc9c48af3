#include "cache/cache_engine.hpp"
#include "app_constants.hpp"
#include "cache/cache_manager.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <random>

namespace FileCache::Cache
{

using Storage::make_error_code;
using Storage::StorageErrc;

namespace
{

bool IsCorruption(const std::error_code& ec) { return ec == StorageErrc::CorruptEntry; }

}  // namespace

CacheEngine::CacheEngine(
    std::shared_ptr<CacheManager> manager, Scope scope, std::optional<std::uint64_t> max_items
)
    : manager_(std::move(manager)), scope_(std::move(scope)), max_items_(max_items)
{
}

//------------------------------------------------------------------------------//
// Views
//------------------------------------------------------------------------------//

StorageResult<CacheEngine> CacheEngine::WithPath(std::string_view sub) const
{
    auto nested = scope_.WithPath(sub);
    if (!nested)
        return std::unexpected(nested.error());
    return CacheEngine(manager_, std::move(nested.value()), max_items_);
}

CacheEngine CacheEngine::WithPrefix(std::string key_prefix) const
{
    return CacheEngine(manager_, scope_.WithPrefix(std::move(key_prefix)), max_items_);
}

CacheEngine CacheEngine::Tags(std::vector<std::string> tags) const
{
    CacheEngine tagged(manager_, scope_, max_items_);
    std::ranges::sort(tags);
    tags.erase(std::unique(tags.begin(), tags.end()), tags.end());
    std::erase(tags, std::string{});
    tagged.pending_tags_ = std::move(tags);
    return tagged;
}

//------------------------------------------------------------------------------//
// Internals
//------------------------------------------------------------------------------//

CacheEngine::EntryState CacheEngine::Classify(const EntryHeader& header) const
{
    const auto now = manager_->GetClock().Now();
    if (!header.IsExpired(now))
        return EntryState::Fresh;
    const auto grace = std::chrono::seconds(manager_->GetConfig().stale_grace_seconds);
    if (now - grace < *header.expires_at)
        return EntryState::Stale;
    return EntryState::Expired;
}

StorageResult<CacheEngine::Lookup> CacheEngine::LookupEntry(const std::string& key) const
{
    auto location = manager_->GetKeyCodec().Resolve(scope_, key);
    if (!location)
        return std::unexpected(location.error());

    Lookup lookup;
    lookup.location = std::move(location.value());

    auto entry = LoadEntry(manager_->GetStorage(), lookup.location);
    if (!entry) {
        if (IsCorruption(entry.error())) {
            spdlog::warn(
                "Corrupt entry for key '{}' at '{}' treated as a miss", key,
                lookup.location.string()
            );
        } else if (entry.error() != StorageErrc::FileNotFound) {
            spdlog::warn(
                "Unreadable entry for key '{}' at '{}' treated as a miss: {}", key,
                lookup.location.string(), entry.error().message()
            );
        }
        return lookup;
    }
    if (entry->header.key != FullKey(key)) {
        spdlog::warn(
            "Entry at '{}' holds a different key; treated as a miss", lookup.location.string()
        );
        return lookup;
    }

    lookup.state = Classify(entry->header);
    lookup.entry = std::move(entry.value());
    return lookup;
}

void CacheEngine::RecordHit(const std::filesystem::path& location)
{
    if (auto res = manager_->GetStorage().Touch(location, manager_->GetClock().Now()); !res) {
        spdlog::debug(
            "Could not bump last access of '{}': {}", location.string(), res.error().message()
        );
    }
    manager_->GetMetrics().IncrementHits();
}

StorageResult<bool> CacheEngine::RemoveEntry(
    const std::filesystem::path& location, const std::optional<EntryHeader>& header
)
{
    auto exists = manager_->GetStorage().CheckIfFileExists(location);
    if (!exists)
        return std::unexpected(exists.error());
    if (!*exists)
        return false;

    if (auto res = manager_->GetStorage().Remove(location); !res)
        return std::unexpected(res.error());

    if (header) {
        const EntryRef ref{scope_.GetPathString(), header->key, location.generic_string()};
        for (const auto& tag : header->tags) {
            if (auto res = manager_->GetTagIndex().Detach(tag, ref); !res) {
                spdlog::warn(
                    "Failed to detach tag '{}' from '{}': {}", tag, location.string(),
                    res.error().message()
                );
            }
        }
    }
    return true;
}

Bytes CacheEngine::RunCompute(const std::string& key, const ComputeFn& compute) const
{
    try {
        return compute();
    } catch (const std::exception& e) {
        spdlog::warn("Compute for key '{}' failed, nothing cached: {}", key, e.what());
        throw;
    }
}

StorageResult<void> CacheEngine::StoreComputed(const std::string& key, const Bytes& value, Ttl ttl)
{
    auto res = Write(key, value, ttl);
    if (!res) {
        spdlog::error(
            "Failed to cache computed value for key '{}': {}", key, res.error().message()
        );
    }
    return res;
}

//------------------------------------------------------------------------------//
// Basic Operations
//------------------------------------------------------------------------------//

StorageResult<void> CacheEngine::Write(
    const std::string& key, std::span<const std::byte> payload, Ttl ttl
)
{
    const auto effective_ttl = std::min(
        ttl.value_or(std::chrono::seconds(manager_->GetConfig().default_ttl_seconds)),
        std::chrono::seconds(Constants::MAX_TTL_SECONDS)
    );
    if (effective_ttl < std::chrono::seconds::zero()) {
        pending_tags_.clear();
        return Delete(key);
    }

    const std::string full_key = FullKey(key);
    auto location              = manager_->GetKeyCodec().Resolve(scope_, key);
    if (!location)
        return std::unexpected(location.error());

    auto& storage   = manager_->GetStorage();
    auto& tag_index = manager_->GetTagIndex();
    const auto now  = manager_->GetClock().Now();

    EntryHeader header;
    header.key        = full_key;
    header.created_at = now;
    if (effective_ttl > std::chrono::seconds::zero())
        header.expires_at = now + effective_ttl;
    header.tags = std::move(pending_tags_);
    pending_tags_.clear();

    // Tags the previous version had but this write drops, and tags it adds.
    std::vector<std::string> dropped_tags;
    std::vector<std::string> added_tags = header.tags;
    if (auto previous = LoadEntryHeader(storage, *location); previous) {
        std::ranges::set_difference(previous->tags, header.tags, std::back_inserter(dropped_tags));
        added_tags.clear();
        std::ranges::set_difference(header.tags, previous->tags, std::back_inserter(added_tags));
    }

    // Tags are attached before the entry goes live. A reference to an entry
    // that does not carry the tag is skipped by Flush.
    const EntryRef ref{scope_.GetPathString(), full_key, location->generic_string()};
    std::vector<std::string> attached;
    auto rollback_tags = [&]() {
        for (const auto& tag : attached) {
            if (auto res = tag_index.Detach(tag, ref); !res) {
                spdlog::warn(
                    "Failed to roll back tag '{}' of key '{}': {}", tag, key,
                    res.error().message()
                );
            }
        }
    };
    for (const auto& tag : header.tags) {
        if (auto res = tag_index.Attach(tag, ref); !res) {
            spdlog::error(
                "Failed to attach tag '{}' to key '{}': {}", tag, key, res.error().message()
            );
            rollback_tags();
            return std::unexpected(res.error());
        }
        if (std::ranges::binary_search(added_tags, tag))
            attached.push_back(tag);
    }

    const Bytes encoded = EntryCodec::Encode(header, payload);
    if (auto res = storage.WriteAtomic(*location, encoded, now); !res) {
        spdlog::error(
            "Failed to write key '{}' to '{}': {}", key, location->string(), res.error().message()
        );
        rollback_tags();
        return std::unexpected(res.error());
    }
    manager_->GetMetrics().IncrementWrites();
    spdlog::trace("Wrote key '{}' ({} bytes) to '{}'", key, payload.size(), location->string());

    for (const auto& tag : dropped_tags) {
        if (auto res = tag_index.Detach(tag, ref); !res) {
            spdlog::warn(
                "Failed to detach tag '{}' from key '{}': {}", tag, key, res.error().message()
            );
        }
    }

    if (max_items_) {
        auto evicted = manager_->GetEvictor().Enforce(scope_, *max_items_);
        if (evicted) {
            manager_->GetMetrics().AddEvictions(*evicted);
        } else {
            spdlog::warn(
                "Eviction after writing key '{}' failed: {}", key, evicted.error().message()
            );
        }
    }
    return {};
}

std::optional<Bytes> CacheEngine::Read(const std::string& key)
{
    auto lookup = LookupEntry(key);
    if (!lookup) {
        spdlog::debug("Read of invalid key '{}': {}", key, lookup.error().message());
        manager_->GetMetrics().IncrementMisses();
        return std::nullopt;
    }

    if (lookup->state == EntryState::Fresh) {
        RecordHit(lookup->location);
        spdlog::trace("Cache hit for key '{}'", key);
        return std::move(lookup->entry->payload);
    }

    manager_->GetMetrics().IncrementMisses();
    spdlog::trace("Cache miss for key '{}'", key);
    if (lookup->state == EntryState::Expired) {
        if (auto res = RemoveEntry(lookup->location, lookup->entry->header); !res) {
            spdlog::warn(
                "Failed to remove expired key '{}': {}", key, res.error().message()
            );
        }
    }
    return std::nullopt;
}

Bytes CacheEngine::Read(const std::string& key, Bytes default_value)
{
    auto value = Read(key);
    if (!value)
        return default_value;
    return std::move(*value);
}

bool CacheEngine::Has(const std::string& key)
{
    auto location = manager_->GetKeyCodec().Resolve(scope_, key);
    if (!location) {
        manager_->GetMetrics().IncrementMisses();
        return false;
    }

    auto header = LoadEntryHeader(manager_->GetStorage(), *location);
    if (!header || header->key != FullKey(key)) {
        manager_->GetMetrics().IncrementMisses();
        return false;
    }

    const EntryState state = Classify(*header);
    if (state == EntryState::Fresh) {
        RecordHit(*location);
        return true;
    }

    manager_->GetMetrics().IncrementMisses();
    if (state == EntryState::Expired) {
        if (auto res = RemoveEntry(*location, *header); !res) {
            spdlog::warn("Failed to remove expired key '{}': {}", key, res.error().message());
        }
    }
    return false;
}

StorageResult<void> CacheEngine::Delete(const std::string& key)
{
    auto location = manager_->GetKeyCodec().Resolve(scope_, key);
    if (!location)
        return std::unexpected(location.error());

    std::optional<EntryHeader> header;
    if (auto loaded = LoadEntryHeader(manager_->GetStorage(), *location); loaded)
        header = std::move(loaded.value());

    auto removed = RemoveEntry(*location, header);
    if (!removed) {
        spdlog::error("Failed to delete key '{}': {}", key, removed.error().message());
        return std::unexpected(removed.error());
    }
    if (*removed)
        manager_->GetMetrics().AddDeletes(1);
    return {};
}

StorageResult<std::size_t> CacheEngine::SweepTemporaries()
{
    const auto cutoff = manager_->GetClock().Now() -
                        std::chrono::seconds(Constants::STALE_TEMPORARY_AGE_SECONDS);
    auto swept = manager_->GetStorage().RemoveStaleTemporaries(scope_.GetPath(), cutoff);
    if (!swept) {
        spdlog::error(
            "Failed to remove abandoned temporaries from scope '{}': {}", scope_.GetPathString(),
            swept.error().message()
        );
        return swept;
    }
    if (*swept > 0) {
        spdlog::info(
            "Removed {} abandoned temporar(ies) from scope '{}'", *swept, scope_.GetPathString()
        );
    }
    return swept;
}

StorageResult<std::size_t> CacheEngine::Clear()
{
    auto& storage = manager_->GetStorage();
    auto listing  = storage.List(scope_.GetPath(), scope_.GetExtension());
    if (!listing)
        return std::unexpected(listing.error());

    std::size_t removed = 0;
    while (true) {
        auto next = (*listing)->Next();
        if (!next)
            return std::unexpected(next.error());
        if (!next->has_value())
            break;
        if (auto res = storage.Remove(next->value().relative_path); !res) {
            spdlog::error(
                "Failed to remove '{}' while clearing: {}", next->value().relative_path.string(),
                res.error().message()
            );
            return std::unexpected(res.error());
        }
        ++removed;
    }

    if (auto swept = SweepTemporaries(); !swept)
        return std::unexpected(swept.error());

    auto dropped = manager_->GetTagIndex().DropScope(scope_.GetPathString());
    if (!dropped)
        return std::unexpected(dropped.error());

    manager_->GetMetrics().AddDeletes(removed);
    spdlog::info(
        "Cleared {} entr(ies) and {} tag reference(s) from scope '{}'", removed, *dropped,
        scope_.GetPathString()
    );
    return removed;
}

StorageResult<std::vector<std::string>> CacheEngine::Keys()
{
    auto& storage = manager_->GetStorage();
    auto listing  = storage.List(scope_.GetPath(), scope_.GetExtension());
    if (!listing)
        return std::unexpected(listing.error());

    const std::string& prefix = scope_.GetKeyPrefix();
    std::vector<std::string> keys;
    while (true) {
        auto next = (*listing)->Next();
        if (!next)
            return std::unexpected(next.error());
        if (!next->has_value())
            break;

        auto header = LoadEntryHeader(storage, next->value().relative_path);
        if (!header)
            continue;
        if (Classify(*header) != EntryState::Fresh)
            continue;
        if (!header->key.starts_with(prefix))
            continue;
        keys.push_back(header->key.substr(prefix.size()));
    }
    std::ranges::sort(keys);
    return keys;
}

StorageResult<bool> CacheEngine::Add(
    const std::string& key, std::span<const std::byte> payload, Ttl ttl
)
{
    auto& locks    = manager_->GetLockManager();
    const auto id  = FullKey(key);
    auto acquired  = locks.AcquireBlocking(scope_.GetPathString(), id);
    if (!acquired)
        return std::unexpected(acquired.error());
    if (!*acquired) {
        manager_->GetMetrics().IncrementLockContentions();
        return std::unexpected(make_error_code(StorageErrc::LockTimeout));
    }
    LockGuard guard(locks, scope_.GetPathString(), id, true);

    auto lookup = LookupEntry(key);
    if (!lookup)
        return std::unexpected(lookup.error());
    if (lookup->state == EntryState::Fresh)
        return false;

    if (auto res = Write(key, payload, ttl); !res)
        return std::unexpected(res.error());
    return true;
}

std::optional<Bytes> CacheEngine::Pull(const std::string& key)
{
    auto value = Read(key);
    if (!value)
        return std::nullopt;
    if (auto res = Delete(key); !res) {
        spdlog::warn("Pulled key '{}' but could not delete it: {}", key, res.error().message());
    }
    return value;
}

StorageResult<std::size_t> CacheEngine::PurgeExpired()
{
    auto& storage = manager_->GetStorage();
    auto listing  = storage.List(scope_.GetPath(), scope_.GetExtension());
    if (!listing)
        return std::unexpected(listing.error());

    std::size_t purged = 0;
    while (true) {
        auto next = (*listing)->Next();
        if (!next)
            return std::unexpected(next.error());
        if (!next->has_value())
            break;

        const auto& location = next->value().relative_path;
        auto header          = LoadEntryHeader(storage, location);
        std::optional<EntryHeader> known;
        if (header) {
            if (Classify(*header) != EntryState::Expired)
                continue;
            known = std::move(header.value());
        } else if (!IsCorruption(header.error())) {
            continue;
        }

        auto removed = RemoveEntry(location, known);
        if (!removed)
            return std::unexpected(removed.error());
        if (*removed)
            ++purged;
    }

    if (auto swept = SweepTemporaries(); !swept)
        return std::unexpected(swept.error());

    manager_->GetMetrics().AddDeletes(purged);
    spdlog::info("Purged {} expired entr(ies) from scope '{}'", purged, scope_.GetPathString());
    return purged;
}

//------------------------------------------------------------------------------//
// Computed Values
//------------------------------------------------------------------------------//

StorageResult<Bytes> CacheEngine::Remember(
    const std::string& key, Ttl ttl, const ComputeFn& compute
)
{
    if (auto cached = Read(key))
        return std::move(*cached);

    // Invalid keys surface here rather than being computed and dropped.
    if (auto valid = manager_->GetKeyCodec().ValidateKey(FullKey(key)); !valid)
        return std::unexpected(valid.error());

    Bytes value = RunCompute(key, compute);
    (void)StoreComputed(key, value, ttl);
    return value;
}

StorageResult<Bytes> CacheEngine::Permanent(const std::string& key, const ComputeFn& compute)
{
    return Remember(key, std::chrono::seconds::zero(), compute);
}

StorageResult<Bytes> CacheEngine::RememberWithStale(
    const std::string& key, Ttl ttl, const ComputeFn& compute
)
{
    auto lookup = LookupEntry(key);
    if (!lookup)
        return std::unexpected(lookup.error());

    auto& locks         = manager_->GetLockManager();
    auto& metrics       = manager_->GetMetrics();
    const auto lock_key = FullKey(key);
    const auto scope    = scope_.GetPathString();

    if (lookup->state == EntryState::Fresh) {
        RecordHit(lookup->location);
        return std::move(lookup->entry->payload);
    }
    metrics.IncrementMisses();

    if (lookup->state == EntryState::Stale) {
        auto acquired = locks.Acquire(scope, lock_key);
        if (acquired && *acquired) {
            LockGuard guard(locks, scope, lock_key, true);
            spdlog::debug("Refreshing stale key '{}' under lock", key);
            Bytes value = RunCompute(key, compute);
            (void)StoreComputed(key, value, ttl);
            return value;
        }
        if (!acquired) {
            spdlog::warn(
                "Lock attempt for stale key '{}' failed: {}", key, acquired.error().message()
            );
        } else {
            metrics.IncrementLockContentions();
        }
        metrics.IncrementStaleServed();
        spdlog::debug("Serving stale value for key '{}' while another caller refreshes", key);
        return std::move(lookup->entry->payload);
    }

    // Nothing usable: wait for whoever is computing, bounded by the lock timeout.
    auto acquired = locks.AcquireBlocking(scope, lock_key);
    if (acquired && *acquired) {
        LockGuard guard(locks, scope, lock_key, true);
        auto rechecked = LookupEntry(key);
        if (rechecked && rechecked->state == EntryState::Fresh) {
            RecordHit(rechecked->location);
            return std::move(rechecked->entry->payload);
        }
        Bytes value = RunCompute(key, compute);
        (void)StoreComputed(key, value, ttl);
        return value;
    }

    if (!acquired) {
        spdlog::warn("Lock wait for key '{}' failed: {}", key, acquired.error().message());
    } else {
        metrics.IncrementLockContentions();
        spdlog::debug("Timed out waiting for the lock on key '{}'", key);
    }

    auto reread = LookupEntry(key);
    if (reread && reread->state == EntryState::Fresh) {
        RecordHit(reread->location);
        return std::move(reread->entry->payload);
    }

    spdlog::debug("Computing key '{}' without the lock", key);
    Bytes value = RunCompute(key, compute);
    (void)StoreComputed(key, value, ttl);
    return value;
}

//------------------------------------------------------------------------------//
// Tags, Locks, Eviction
//------------------------------------------------------------------------------//

StorageResult<std::size_t> CacheEngine::FlushTags(const std::vector<std::string>& tags)
{
    auto removed = manager_->GetTagIndex().Flush(tags);
    if (!removed) {
        spdlog::error("Failed to flush tags: {}", removed.error().message());
        return removed;
    }
    manager_->GetMetrics().AddDeletes(*removed);
    spdlog::info("Flushed {} tag(s), {} entr(ies) removed", tags.size(), *removed);
    return removed;
}

StorageResult<bool> CacheEngine::AcquireLock(
    const std::string& key, std::optional<std::chrono::seconds> timeout
)
{
    if (auto valid = manager_->GetKeyCodec().ValidateKey(FullKey(key)); !valid)
        return std::unexpected(valid.error());

    auto acquired =
        manager_->GetLockManager().Acquire(scope_.GetPathString(), FullKey(key), timeout);
    if (acquired && !*acquired)
        manager_->GetMetrics().IncrementLockContentions();
    return acquired;
}

StorageResult<bool> CacheEngine::ReleaseLock(const std::string& key)
{
    return manager_->GetLockManager().Release(scope_.GetPathString(), FullKey(key));
}

StorageResult<std::size_t> CacheEngine::EnforceLimit()
{
    if (!max_items_)
        return 0;
    auto evicted = manager_->GetEvictor().Enforce(scope_, *max_items_);
    if (!evicted) {
        spdlog::error(
            "Eviction in scope '{}' failed: {}", scope_.GetPathString(), evicted.error().message()
        );
        return std::unexpected(make_error_code(StorageErrc::EvictionError));
    }
    manager_->GetMetrics().AddEvictions(*evicted);
    return evicted;
}

//------------------------------------------------------------------------------//
// Expiry Jitter
//------------------------------------------------------------------------------//

std::chrono::seconds CacheEngine::AddJitter(std::chrono::seconds ttl) const
{
    const int percentage = manager_->GetConfig().jitter_percentage;
    if (ttl <= std::chrono::seconds::zero() || percentage <= 0)
        return ttl;

    ttl = std::min(ttl, std::chrono::seconds(Constants::MAX_TTL_SECONDS));
    const std::int64_t delta =
        ttl.count() / 100 * percentage + ttl.count() % 100 * percentage / 100;
    if (delta == 0)
        return ttl;

    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<std::int64_t> dist(-delta, delta);
    // Never turn a finite ttl into "no expiry"
    return std::chrono::seconds(std::max<std::int64_t>(1, ttl.count() + dist(rng)));
}

StorageResult<void> CacheEngine::WriteWithExpiry(
    const std::string& key, std::span<const std::byte> payload, Ttl ttl
)
{
    const auto base =
        ttl.value_or(std::chrono::seconds(manager_->GetConfig().default_ttl_seconds));
    return Write(key, payload, AddJitter(base));
}

//------------------------------------------------------------------------------//
// Introspection
//------------------------------------------------------------------------------//

MetricsSnapshot CacheEngine::GetMetrics() const { return manager_->GetMetrics().Snapshot(); }

void CacheEngine::ResetMetrics() { manager_->GetMetrics().Reset(); }

StorageResult<std::uint64_t> CacheEngine::GetCacheSize() const
{
    auto listing = manager_->GetStorage().List(scope_.GetPath(), scope_.GetExtension());
    if (!listing)
        return std::unexpected(listing.error());

    std::uint64_t total = 0;
    while (true) {
        auto next = (*listing)->Next();
        if (!next)
            return std::unexpected(next.error());
        if (!next->has_value())
            break;
        total += static_cast<std::uint64_t>(next->value().attributes.st_size);
    }
    return total;
}

}  // namespace FileCache::Cache

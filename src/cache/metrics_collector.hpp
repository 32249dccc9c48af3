#ifndef FILECACHE_SRC_CACHE_METRICS_COLLECTOR_HPP_
#define FILECACHE_SRC_CACHE_METRICS_COLLECTOR_HPP_

#include <atomic>
#include <cstdint>

namespace FileCache::Cache
{

struct MetricsSnapshot {
    uint64_t hits             = 0;
    uint64_t misses           = 0;
    uint64_t writes           = 0;
    uint64_t deletes          = 0;
    uint64_t evictions        = 0;
    uint64_t stale_served     = 0;
    uint64_t lock_contentions = 0;

    /// hits / (hits + misses), 0 when nothing was read.
    double HitRate() const
    {
        const uint64_t reads = hits + misses;
        return reads == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(reads);
    }
};

/// In-process counters shared by every view of one cache.
class MetricsCollector
{
    public:
    MetricsCollector() = default;

    void IncrementHits() { hits_++; }
    void IncrementMisses() { misses_++; }
    void IncrementWrites() { writes_++; }
    void AddDeletes(uint64_t count) { deletes_ += count; }
    void AddEvictions(uint64_t count) { evictions_ += count; }
    void IncrementStaleServed() { stale_served_++; }
    void IncrementLockContentions() { lock_contentions_++; }

    MetricsSnapshot Snapshot() const
    {
        MetricsSnapshot s;
        s.hits             = hits_.load();
        s.misses           = misses_.load();
        s.writes           = writes_.load();
        s.deletes          = deletes_.load();
        s.evictions        = evictions_.load();
        s.stale_served     = stale_served_.load();
        s.lock_contentions = lock_contentions_.load();
        return s;
    }

    void Reset()
    {
        hits_             = 0;
        misses_           = 0;
        writes_           = 0;
        deletes_          = 0;
        evictions_        = 0;
        stale_served_     = 0;
        lock_contentions_ = 0;
    }

    private:
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> deletes_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> stale_served_{0};
    std::atomic<uint64_t> lock_contentions_{0};
};

}  // namespace FileCache::Cache

#endif  // FILECACHE_SRC_CACHE_METRICS_COLLECTOR_HPP_

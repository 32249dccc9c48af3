#include "cache/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <thread>
#include <vector>

using FileCache::Cache::MetricsCollector;

TEST(MetricsCollectorTest, HitRateWithoutReadsIsZero)
{
    MetricsCollector metrics;
    EXPECT_DOUBLE_EQ(metrics.Snapshot().HitRate(), 0.0);
}

TEST(MetricsCollectorTest, CountsAndReset)
{
    MetricsCollector metrics;
    metrics.IncrementHits();
    metrics.IncrementHits();
    metrics.IncrementHits();
    metrics.IncrementMisses();
    metrics.IncrementWrites();
    metrics.AddDeletes(2);
    metrics.AddEvictions(4);
    metrics.IncrementStaleServed();
    metrics.IncrementLockContentions();

    auto snapshot = metrics.Snapshot();
    EXPECT_EQ(snapshot.hits, 3u);
    EXPECT_EQ(snapshot.misses, 1u);
    EXPECT_EQ(snapshot.writes, 1u);
    EXPECT_EQ(snapshot.deletes, 2u);
    EXPECT_EQ(snapshot.evictions, 4u);
    EXPECT_EQ(snapshot.stale_served, 1u);
    EXPECT_EQ(snapshot.lock_contentions, 1u);
    EXPECT_DOUBLE_EQ(snapshot.HitRate(), 0.75);

    metrics.Reset();
    snapshot = metrics.Snapshot();
    EXPECT_EQ(snapshot.hits, 0u);
    EXPECT_EQ(snapshot.evictions, 0u);
}

TEST(MetricsCollectorTest, ConcurrentIncrements)
{
    MetricsCollector metrics;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&metrics] {
            for (int i = 0; i < 1000; ++i)
                metrics.IncrementHits();
        });
    }
    for (auto& thread : threads)
        thread.join();
    EXPECT_EQ(metrics.Snapshot().hits, 4000u);
}

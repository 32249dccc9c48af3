#include "cache/cache_engine.hpp"
#include "cache/lock_manager.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace FileCache::Cache;
using namespace std::chrono_literals;
using FileCache::Testing::CacheTestBase;
using FileCache::Testing::ToBytes;
using FileCache::Testing::ToString;

class RememberTest : public CacheTestBase
{
    protected:
    void ConfigureCache(FileCache::Config::CacheConfig& config) override
    {
        config.lock_timeout_seconds  = 1;
        config.lock_poll_interval_ms = 10;
        config.stale_grace_seconds   = 60;
    }

    /// A lock manager standing in for another process sharing the root.
    std::unique_ptr<LockManager> OtherProcessLocks()
    {
        auto storage = std::shared_ptr<FileCache::Storage::IStorage>(
            manager_, &manager_->GetStorage()
        );
        return std::make_unique<LockManager>(storage, clock_, 10s, 10ms);
    }

    int calls_ = 0;
    CacheEngine::ComputeFn Counting(std::string value)
    {
        return [this, value] {
            ++calls_;
            return ToBytes(value);
        };
    }
};

TEST_F(RememberTest, ComputesOnceThenServesCached)
{
    auto engine = Engine();
    EXPECT_EQ(ToString(*engine.Remember("k", 60s, Counting("v1"))), "v1");
    EXPECT_EQ(ToString(*engine.Remember("k", 60s, Counting("v2"))), "v1");
    EXPECT_EQ(calls_, 1);
}

TEST_F(RememberTest, ComputeFailureIsNotCached)
{
    auto engine = Engine();
    EXPECT_THROW(
        (void)engine.Remember("k", 60s, []() -> Bytes { throw std::runtime_error("boom"); }),
        std::runtime_error
    );
    EXPECT_FALSE(engine.Has("k"));
    EXPECT_EQ(engine.GetMetrics().writes, 0u);
    EXPECT_EQ(ToString(*engine.Remember("k", 60s, Counting("ok"))), "ok");
}

TEST_F(RememberTest, PermanentNeverExpires)
{
    auto engine = Engine();
    ASSERT_TRUE(engine.Permanent("k", Counting("v")).has_value());
    clock_->Advance(24h * 1000);
    EXPECT_EQ(ToString(*engine.Permanent("k", Counting("other"))), "v");
    EXPECT_EQ(calls_, 1);
}

TEST_F(RememberTest, InvalidKeyIsReported)
{
    auto engine = Engine();
    auto res    = engine.Remember("", 60s, Counting("v"));
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), FileCache::Storage::StorageErrc::InvalidKey);
    EXPECT_EQ(calls_, 0);
}

TEST_F(RememberTest, StaleFreshEntryIsReturnedWithoutCompute)
{
    auto engine = Engine();
    ASSERT_TRUE(engine.Write("k", ToBytes("cached"), 30s).has_value());
    EXPECT_EQ(ToString(*engine.RememberWithStale("k", 30s, Counting("new"))), "cached");
    EXPECT_EQ(calls_, 0);
}

TEST_F(RememberTest, StaleEntryRefreshedByLockWinner)
{
    auto engine = Engine();
    ASSERT_TRUE(engine.Write("k", ToBytes("old"), 30s).has_value());
    clock_->Advance(31s);

    EXPECT_EQ(ToString(*engine.RememberWithStale("k", 30s, Counting("new"))), "new");
    EXPECT_EQ(calls_, 1);
    EXPECT_EQ(ToString(*engine.Read("k")), "new");
    EXPECT_FALSE(manager_->GetLockManager().IsHeld("", "k"));
}

TEST_F(RememberTest, StaleEntryServedWhileAnotherRefreshes)
{
    auto engine = Engine();
    ASSERT_TRUE(engine.Write("k", ToBytes("old"), 30s).has_value());
    clock_->Advance(31s);

    auto other = OtherProcessLocks();
    ASSERT_TRUE(*other->Acquire("", "k"));

    EXPECT_EQ(ToString(*engine.RememberWithStale("k", 30s, Counting("new"))), "old");
    EXPECT_EQ(calls_, 0);
    EXPECT_EQ(engine.GetMetrics().stale_served, 1u);
    EXPECT_EQ(engine.GetMetrics().lock_contentions, 1u);
    EXPECT_TRUE(*other->Release("", "k"));
}

TEST_F(RememberTest, AbsentValueComputedUnderLock)
{
    auto engine = Engine();
    EXPECT_EQ(ToString(*engine.RememberWithStale("k", 30s, Counting("v"))), "v");
    EXPECT_EQ(calls_, 1);
    EXPECT_TRUE(engine.Has("k"));
    EXPECT_FALSE(manager_->GetLockManager().IsHeld("", "k"));
}

TEST_F(RememberTest, LockHolderThatNeverReleasesDoesNotBlockForever)
{
    auto engine = Engine();
    auto other  = OtherProcessLocks();
    ASSERT_TRUE(*other->Acquire("", "k"));

    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(ToString(*engine.RememberWithStale("k", 30s, Counting("v"))), "v");
    const auto spent = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(calls_, 1);
    EXPECT_LT(spent, 5s);
    EXPECT_EQ(engine.GetMetrics().lock_contentions, 1u);
}

TEST_F(RememberTest, FullyExpiredEntryIsRecomputed)
{
    auto engine = Engine();
    ASSERT_TRUE(engine.Write("k", ToBytes("old"), 30s).has_value());
    clock_->Advance(31s + 60s);
    EXPECT_EQ(ToString(*engine.RememberWithStale("k", 30s, Counting("new"))), "new");
    EXPECT_EQ(calls_, 1);
}

TEST_F(RememberTest, LockIsReleasedWhenComputeThrows)
{
    auto engine = Engine();
    EXPECT_THROW(
        (void)engine.RememberWithStale(
            "k", 30s, []() -> Bytes { throw std::runtime_error("boom"); }
        ),
        std::runtime_error
    );
    EXPECT_FALSE(manager_->GetLockManager().IsHeld("", "k"));
    EXPECT_TRUE(*OtherProcessLocks()->Acquire("", "k"));
}

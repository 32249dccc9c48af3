#include "cache/evictor.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

using namespace FileCache::Cache;
using namespace std::chrono_literals;
using FileCache::Testing::CacheTestBase;
using FileCache::Testing::ToBytes;

class EvictorTest : public CacheTestBase
{
};

TEST_F(EvictorTest, ScanIndexesByLastAccess)
{
    auto engine = Engine();
    for (const char* key : {"a", "b", "c"}) {
        ASSERT_TRUE(engine.Write(key, ToBytes(key)).has_value());
        clock_->Advance(1s);
    }

    auto index = manager_->GetEvictor().Scan(engine.GetScope());
    ASSERT_TRUE(index.has_value());
    ASSERT_EQ(index->size(), 3u);

    const auto& by_access = index->get<EvictionCandidate::ByLastAccess>();
    SystemTimePoint previous{};
    for (const auto& candidate : by_access) {
        EXPECT_GE(candidate.last_accessed_at, previous);
        previous = candidate.last_accessed_at;
    }
}

TEST_F(EvictorTest, EnforceKeepsMostRecentlyAccessed)
{
    auto engine = Engine();
    for (const char* key : {"a", "b", "c", "d"}) {
        ASSERT_TRUE(engine.Write(key, ToBytes(key)).has_value());
        clock_->Advance(1s);
    }
    // Touch "a" so "b" becomes the oldest.
    ASSERT_TRUE(engine.Read("a").has_value());

    auto evicted = manager_->GetEvictor().Enforce(engine.GetScope(), 3);
    ASSERT_TRUE(evicted.has_value());
    EXPECT_EQ(*evicted, 1u);

    EXPECT_TRUE(engine.Has("a"));
    EXPECT_FALSE(engine.Has("b"));
    EXPECT_TRUE(engine.Has("c"));
    EXPECT_TRUE(engine.Has("d"));
}

TEST_F(EvictorTest, EnforceUnderLimitIsNoop)
{
    auto engine = Engine();
    ASSERT_TRUE(engine.Write("a", ToBytes("1")).has_value());
    auto evicted = manager_->GetEvictor().Enforce(engine.GetScope(), 5);
    ASSERT_TRUE(evicted.has_value());
    EXPECT_EQ(*evicted, 0u);
}

TEST_F(EvictorTest, EvictionDetachesTags)
{
    auto engine = Engine();
    ASSERT_TRUE(engine.Tags({"t"}).Write("old", ToBytes("1")).has_value());
    clock_->Advance(1s);
    ASSERT_TRUE(engine.Write("new", ToBytes("2")).has_value());

    ASSERT_EQ(*manager_->GetEvictor().Enforce(engine.GetScope(), 1), 1u);
    EXPECT_TRUE(manager_->GetTagIndex().KeysFor("t")->empty());
}

TEST_F(EvictorTest, NestedScopesAreNotCounted)
{
    auto engine = Engine();
    auto nested = engine.WithPath("child");
    ASSERT_TRUE(nested.has_value());
    ASSERT_TRUE(engine.Write("top", ToBytes("1")).has_value());
    for (const char* key : {"x", "y", "z"})
        ASSERT_TRUE(nested->Write(key, ToBytes(key)).has_value());

    auto evicted = manager_->GetEvictor().Enforce(engine.GetScope(), 1);
    ASSERT_TRUE(evicted.has_value());
    EXPECT_EQ(*evicted, 0u);
    EXPECT_EQ(nested->Keys()->size(), 3u);
}

#ifndef FILECACHE_TESTS_TEST_UTILS_HPP_
#define FILECACHE_TESTS_TEST_UTILS_HPP_

#include "cache/cache_engine.hpp"
#include "cache/cache_manager.hpp"
#include "cache/clock.hpp"
#include "config/config_types.hpp"

#include <gtest/gtest.h>
#include <unistd.h>
#include <atomic>
#include <filesystem>
#include <memory>
#include <random>
#include <string>

namespace FileCache::Testing
{

namespace fs = std::filesystem;

inline Storage::Bytes ToBytes(const std::string& text)
{
    const auto* p = reinterpret_cast<const std::byte*>(text.data());
    return Storage::Bytes(p, p + text.size());
}

inline std::string ToString(const Storage::Bytes& bytes)
{
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

/// Fresh directory under the system temp dir, removed on destruction.
class TempDirectory
{
    public:
    TempDirectory()
    {
        static std::atomic<int> counter{0};
        std::random_device rd;
        path_ = fs::temp_directory_path() /
                ("filecache_test_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter++) + "_" + std::to_string(rd()));
        fs::create_directories(path_);
    }
    ~TempDirectory()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&)            = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const fs::path& Path() const { return path_; }

    private:
    fs::path path_;
};

/// Fixture owning a temp root, a manual clock and an initialized manager.
class CacheTestBase : public ::testing::Test
{
    protected:
    void SetUp() override
    {
        config_.root = dir_.Path() / "cache";
        ConfigureCache(config_);
        clock_   = std::make_shared<Cache::ManualClock>();
        manager_ = std::make_shared<Cache::CacheManager>(config_, clock_);
        ASSERT_TRUE(manager_->Initialize().has_value());
    }

    /// Override to tweak the configuration before the manager is built.
    virtual void ConfigureCache(Config::CacheConfig& config) { (void)config; }

    Cache::CacheEngine Engine() { return manager_->Engine(); }

    TempDirectory dir_;
    Config::CacheConfig config_;
    std::shared_ptr<Cache::ManualClock> clock_;
    std::shared_ptr<Cache::CacheManager> manager_;
};

}  // namespace FileCache::Testing

#endif  // FILECACHE_TESTS_TEST_UTILS_HPP_

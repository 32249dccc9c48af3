#ifndef FILECACHE_SRC_CACHE_CLOCK_HPP_
#define FILECACHE_SRC_CACHE_CLOCK_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>

namespace FileCache::Cache
{

using SystemTimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Source of wall-clock time for everything the engine records.
 *
 * Expiry, last-access and lock-age decisions all read this clock, so tests can
 * move time forward without sleeping.
 */
class IClock
{
    public:
    virtual ~IClock()                     = default;
    virtual SystemTimePoint Now() const = 0;
};

class SystemClock : public IClock
{
    public:
    SystemTimePoint Now() const override { return std::chrono::system_clock::now(); }
};

class ManualClock : public IClock
{
    public:
    explicit ManualClock(SystemTimePoint start = std::chrono::system_clock::now())
        : now_(start)
    {
    }

    SystemTimePoint Now() const override { return now_.load(); }

    void Set(SystemTimePoint tp) { now_.store(tp); }

    template <typename Rep, typename Period>
    void Advance(std::chrono::duration<Rep, Period> delta)
    {
        now_.store(now_.load() + std::chrono::duration_cast<SystemTimePoint::duration>(delta));
    }

    private:
    std::atomic<SystemTimePoint> now_;
};

inline std::int64_t ToEpochMillis(SystemTimePoint tp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline SystemTimePoint FromEpochMillis(std::int64_t ms)
{
    return SystemTimePoint(std::chrono::duration_cast<SystemTimePoint::duration>(
        std::chrono::milliseconds(ms)
    ));
}

}  // namespace FileCache::Cache

#endif  // FILECACHE_SRC_CACHE_CLOCK_HPP_

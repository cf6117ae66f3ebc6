#include "Util/Clock.h"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <ctime>

TimePoint SystemClock::Now() const
{
    return DirectorClock::now();
}

ManualClock::ManualClock(TimePoint start)
    : now_(start)
{
}

TimePoint ManualClock::Now() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualClock::Advance(Duration delta)
{
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += delta;
}

void ManualClock::Set(TimePoint now)
{
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = now;
}

Duration Elapsed(TimePoint earlier, TimePoint later)
{
    if (later <= earlier)
    {
        return Duration::zero();
    }
    return std::chrono::duration_cast<Duration>(later - earlier);
}

std::string FormatUtcMinute(TimePoint when)
{
    std::time_t t = DirectorClock::to_time_t(when);
    return fmt::format("{:%Y-%m-%d %H:%M}", fmt::gmtime(t));
}

std::string FormatUtcIso(TimePoint when)
{
    std::time_t t = DirectorClock::to_time_t(when);
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(t));
}

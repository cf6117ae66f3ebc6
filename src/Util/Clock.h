#pragma once

#include <chrono>
#include <mutex>
#include <string>

// Wall-clock time used by every pacing gate. UTC, millisecond resolution is enough.
using DirectorClock = std::chrono::system_clock;
using TimePoint = DirectorClock::time_point;
using Duration = std::chrono::milliseconds;

class Clock
{
public:
    virtual ~Clock() = default;
    virtual TimePoint Now() const = 0;
};

class SystemClock : public Clock
{
public:
    TimePoint Now() const override;
};

// Clock that only moves when told to. Used for replaying sessions and in tests.
class ManualClock : public Clock
{
public:
    explicit ManualClock(TimePoint start = TimePoint(std::chrono::hours(24 * 365 * 50)));

    TimePoint Now() const override;
    void Advance(Duration delta);
    void Set(TimePoint now);

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

// Milliseconds between two time points, clamped at zero when `later` is earlier.
Duration Elapsed(TimePoint earlier, TimePoint later);

// "YYYY-MM-DD HH:MM" in UTC.
std::string FormatUtcMinute(TimePoint when);
// ISO-8601 with seconds, UTC.
std::string FormatUtcIso(TimePoint when);

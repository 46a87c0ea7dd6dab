#pragma once
// include/townlife/sim/WorldClock.hpp
#include "townlife/core/Types.hpp"

#include <chrono>
#include <string>

namespace townlife::sim {

// Derives WorldTime from wall-clock time in the configured timezone.
// Day 1 starts at local midnight of the server start day, so the day
// counter ticks over at local midnight rather than at process start.
// Daylight-saving transitions follow the tz database.
class WorldClock {
public:
    WorldClock() = default;

    // Fixed offset, no tz database lookup.
    WorldClock(int utcOffsetMinutes, TimestampMs serverStartMs);

    // Resolves an IANA zone name; an empty or unknown name falls back to
    // the fixed offset.
    WorldClock(const std::string& timezone, int fallbackOffsetMinutes, TimestampMs serverStartMs);

    WorldTime at(TimestampMs nowMs) const;

    // Empty when running on the fixed offset.
    std::string timezone() const;
    int         utcOffsetMinutes() const { return utcOffsetMinutes_; }
    TimestampMs serverStartMs() const { return serverStartMs_; }

    // Restored state keeps the original anchor.
    void setServerStart(TimestampMs serverStartMs);

private:
    TimestampMs localMs(TimestampMs utcMs) const;

    const std::chrono::time_zone* zone_ = nullptr;
    int         utcOffsetMinutes_ = 0;
    TimestampMs serverStartMs_    = 0;
    TimestampMs anchorLocalMs_    = 0;   // local midnight of the start day
};

} // namespace townlife::sim

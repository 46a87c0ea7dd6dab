// src/sim/WorldClock.cpp
#include "townlife/sim/WorldClock.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace townlife::sim {

namespace {

TimestampMs FloorDiv(TimestampMs a, TimestampMs b) {
    TimestampMs q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

TimestampMs FloorMod(TimestampMs a, TimestampMs b) {
    return a - FloorDiv(a, b) * b;
}

const std::chrono::time_zone* ResolveZone(const std::string& name) {
    if (name.empty()) return nullptr;
    try {
        return std::chrono::locate_zone(name);
    } catch (const std::runtime_error& ex) {
        spdlog::warn("[Clock] timezone '{}' not found ({}); using fixed offset", name, ex.what());
        return nullptr;
    }
}

} // namespace

WorldClock::WorldClock(int utcOffsetMinutes, TimestampMs serverStartMs)
    : utcOffsetMinutes_(utcOffsetMinutes) {
    setServerStart(serverStartMs);
}

WorldClock::WorldClock(const std::string& timezone, int fallbackOffsetMinutes, TimestampMs serverStartMs)
    : zone_(ResolveZone(timezone)), utcOffsetMinutes_(fallbackOffsetMinutes) {
    setServerStart(serverStartMs);
}

std::string WorldClock::timezone() const {
    return zone_ ? std::string(zone_->name()) : std::string{};
}

TimestampMs WorldClock::localMs(TimestampMs utcMs) const {
    if (!zone_) return utcMs + utcOffsetMinutes_ * kMsPerMinute;

    using namespace std::chrono;
    const sys_time<milliseconds> utc{milliseconds{utcMs}};
    return zoned_time<milliseconds>{zone_, utc}.get_local_time().time_since_epoch().count();
}

void WorldClock::setServerStart(TimestampMs serverStartMs) {
    serverStartMs_ = serverStartMs;
    anchorLocalMs_ = FloorDiv(localMs(serverStartMs), kMsPerDay) * kMsPerDay;
}

WorldTime WorldClock::at(TimestampMs nowMs) const {
    const TimestampMs local     = localMs(nowMs);
    const TimestampMs msInDay   = FloorMod(local, kMsPerDay);

    WorldTime t;
    t.hour   = static_cast<int>(msInDay / kMsPerHour);
    t.minute = static_cast<int>((msInDay % kMsPerHour) / kMsPerMinute);
    // Local dates, so a 23 or 25 hour DST day still counts as one.
    t.day    = static_cast<int>(FloorDiv(local - anchorLocalMs_, kMsPerDay)) + 1;
    if (t.day < 1) t.day = 1;
    return t;
}

} // namespace townlife::sim

// tests/test_world_clock.cpp
#include <doctest/doctest.h>

#include "townlife/sim/WorldClock.hpp"

#include <chrono>
#include <stdexcept>

using townlife::TimestampMs;
using townlife::WorldTime;
using townlife::kMsPerHour;
using townlife::kMsPerMinute;
using townlife::sim::WorldClock;

namespace {

constexpr TimestampMs kNewYear2024Utc = 1'704'067'200'000;   // 2024-01-01T00:00:00Z

bool HasTzDatabase(const char* zone) {
    try {
        return std::chrono::locate_zone(zone) != nullptr;
    } catch (const std::runtime_error&) {
        return false;
    }
}

} // namespace

TEST_CASE("WorldClock: local time in a fixed +09:00 zone")
{
    const WorldClock clock(540, kNewYear2024Utc);

    CHECK(clock.at(kNewYear2024Utc) == WorldTime{9, 0, 1});
    CHECK(clock.at(kNewYear2024Utc + 14 * kMsPerHour + 59 * kMsPerMinute) == WorldTime{23, 59, 1});
    CHECK(clock.at(kNewYear2024Utc + 15 * kMsPerHour) == WorldTime{0, 0, 2});
    CHECK(clock.at(kNewYear2024Utc + 39 * kMsPerHour + 30 * kMsPerMinute) == WorldTime{0, 30, 3});
}

TEST_CASE("WorldClock: negative offsets and times before the start")
{
    const WorldClock clock(-300, kNewYear2024Utc);   // 2023-12-31 19:00 local

    CHECK(clock.at(kNewYear2024Utc) == WorldTime{19, 0, 1});
    CHECK(clock.at(kNewYear2024Utc + 5 * kMsPerHour) == WorldTime{0, 0, 2});
    CHECK(clock.at(kNewYear2024Utc - 20 * kMsPerHour).day == 1);
}

TEST_CASE("WorldClock: a restored anchor keeps the original day count")
{
    WorldClock clock(0, kNewYear2024Utc + 3 * 24 * kMsPerHour);
    CHECK(clock.at(kNewYear2024Utc + 3 * 24 * kMsPerHour).day == 1);

    clock.setServerStart(kNewYear2024Utc);
    CHECK(clock.serverStartMs() == kNewYear2024Utc);
    CHECK(clock.at(kNewYear2024Utc + 3 * 24 * kMsPerHour).day == 4);
}

TEST_CASE("WorldClock: a named zone follows the spring-forward switch")
{
    if (!HasTzDatabase("America/New_York")) {
        MESSAGE("tz database unavailable; skipping");
        return;
    }

    const WorldClock clock("America/New_York", 0, 1'709'985'600'000);   // 2024-03-09 07:00 EST
    CHECK(clock.timezone() == "America/New_York");

    CHECK(clock.at(1'709'985'600'000) == WorldTime{7, 0, 1});
    CHECK(clock.at(1'710'053'940'000) == WorldTime{1, 59, 2});   // last minute of EST
    CHECK(clock.at(1'710'054'000'000) == WorldTime{3, 0, 2});    // first minute of EDT
    // The 23-hour day still ends at local midnight.
    CHECK(clock.at(1'710'129'540'000) == WorldTime{23, 59, 2});
    CHECK(clock.at(1'710'129'600'000) == WorldTime{0, 0, 3});
}

TEST_CASE("WorldClock: a named zone follows the fall-back switch")
{
    if (!HasTzDatabase("America/New_York")) {
        MESSAGE("tz database unavailable; skipping");
        return;
    }

    const WorldClock clock("America/New_York", 0, 1'730'548'800'000);   // 2024-11-02 08:00 EDT

    CHECK(clock.at(1'730'548'800'000) == WorldTime{8, 0, 1});
    CHECK(clock.at(1'730'613'540'000) == WorldTime{1, 59, 2});   // last minute of EDT
    CHECK(clock.at(1'730'613'600'000) == WorldTime{1, 0, 2});    // 01:00 again, now EST
    CHECK(clock.at(1'730'696'340'000) == WorldTime{23, 59, 2});
    CHECK(clock.at(1'730'696'400'000) == WorldTime{0, 0, 3});
}

TEST_CASE("WorldClock: an unknown or empty zone name uses the fallback offset")
{
    const WorldClock unknown("Nowhere/Atlantis", 540, kNewYear2024Utc);
    CHECK(unknown.timezone().empty());
    CHECK(unknown.at(kNewYear2024Utc) == WorldTime{9, 0, 1});

    const WorldClock empty("", -300, kNewYear2024Utc);
    CHECK(empty.timezone().empty());
    CHECK(empty.at(kNewYear2024Utc) == WorldTime{19, 0, 1});
}

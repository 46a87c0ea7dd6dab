#pragma once
// include/townlife/core/Types.hpp
//
// Identifiers and small value types shared by every subsystem.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace townlife {

using AgentId    = std::string;
using MapId      = std::string;
using NodeId     = std::string;
using FacilityId = std::string;
using ActionId   = std::string;

// Wall-clock milliseconds since the Unix epoch.
using TimestampMs = std::int64_t;

inline constexpr TimestampMs kMsPerMinute = 60'000;
inline constexpr TimestampMs kMsPerHour   = 60 * kMsPerMinute;
inline constexpr TimestampMs kMsPerDay    = 24 * kMsPerHour;

struct Vec2 {
    double x{0}, y{0};

    bool operator==(const Vec2&) const = default;
};

double distance(Vec2 a, Vec2 b);
Vec2   lerp(Vec2 a, Vec2 b, double t);

enum class Direction : std::uint8_t { Down, Up, Left, Right };

// Horizontal wins when |dx| > |dy|, otherwise vertical.
Direction        facing(Vec2 from, Vec2 to);
std::string_view to_string(Direction d);

enum class Need : std::uint8_t { Satiety, Energy, Hygiene, Mood, Bladder };

inline constexpr std::array<Need, 5> kAllNeeds{
    Need::Satiety, Need::Energy, Need::Hygiene, Need::Mood, Need::Bladder};

std::string_view    to_string(Need n);
std::optional<Need> need_from_string(std::string_view s);

// Five need stats, 0..100, 100 = best.
struct NeedValues {
    double satiety{100};
    double energy{100};
    double hygiene{100};
    double mood{100};
    double bladder{100};

    double& operator[](Need n);
    double  operator[](Need n) const;
};

// Partial per-minute rates. An empty slot means "not specified".
struct NeedRates {
    std::array<std::optional<double>, 5> slots{};

    std::optional<double>&       operator[](Need n) { return slots[static_cast<std::size_t>(n)]; }
    const std::optional<double>& operator[](Need n) const { return slots[static_cast<std::size_t>(n)]; }

    bool empty() const;
};

struct WorldTime {
    int hour{0};
    int minute{0};
    int day{1};

    bool operator==(const WorldTime&) const = default;
};

double clamp_need(double v);

} // namespace townlife

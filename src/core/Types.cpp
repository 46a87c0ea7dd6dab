// src/core/Types.cpp
#include "townlife/core/Types.hpp"

#include <algorithm>
#include <cmath>

namespace townlife {

double distance(Vec2 a, Vec2 b) {
    return std::hypot(b.x - a.x, b.y - a.y);
}

Vec2 lerp(Vec2 a, Vec2 b, double t) {
    return Vec2{a.x + (b.x - a.x) * t, a.y + (b.y - a.y) * t};
}

Direction facing(Vec2 from, Vec2 to) {
    const double dx = to.x - from.x;
    const double dy = to.y - from.y;
    if (std::abs(dx) > std::abs(dy))
        return dx > 0 ? Direction::Right : Direction::Left;
    return dy > 0 ? Direction::Down : Direction::Up;
}

std::string_view to_string(Direction d) {
    switch (d) {
        case Direction::Down:  return "down";
        case Direction::Up:    return "up";
        case Direction::Left:  return "left";
        case Direction::Right: return "right";
    }
    return "down";
}

std::string_view to_string(Need n) {
    switch (n) {
        case Need::Satiety: return "satiety";
        case Need::Energy:  return "energy";
        case Need::Hygiene: return "hygiene";
        case Need::Mood:    return "mood";
        case Need::Bladder: return "bladder";
    }
    return "mood";
}

std::optional<Need> need_from_string(std::string_view s) {
    for (Need n : kAllNeeds)
        if (to_string(n) == s) return n;
    return std::nullopt;
}

double& NeedValues::operator[](Need n) {
    switch (n) {
        case Need::Satiety: return satiety;
        case Need::Energy:  return energy;
        case Need::Hygiene: return hygiene;
        case Need::Mood:    return mood;
        case Need::Bladder: return bladder;
    }
    return mood;
}

double NeedValues::operator[](Need n) const {
    return const_cast<NeedValues&>(*this)[n];
}

bool NeedRates::empty() const {
    return std::none_of(slots.begin(), slots.end(),
                        [](const std::optional<double>& r) { return r.has_value(); });
}

double clamp_need(double v) {
    return std::clamp(v, 0.0, 100.0);
}

} // namespace townlife

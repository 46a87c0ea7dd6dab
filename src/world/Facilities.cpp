// src/world/Facilities.cpp
#include "townlife/world/Facilities.hpp"

#include <algorithm>
#include <limits>

namespace townlife::world {

namespace {

bool atObstacle(const Obstacle& o, Vec2 p, double proximity) {
    if (o.kind == ObstacleKind::Zone)
        return o.bounds.contains(p);
    return o.bounds.inflated(proximity).contains(p);
}

} // namespace

std::optional<FacilityRef> facilityAt(const WorldMap& map, const PathNode& node, double proximity) {
    const Vec2 p = node.position();

    for (const Obstacle& o : map.obstacles())
        if (o.kind == ObstacleKind::Zone && o.facility && o.bounds.contains(p))
            return FacilityRef{map.id(), o.id, *o.facility};

    for (const Obstacle& o : map.obstacles())
        if (o.kind == ObstacleKind::Building && o.facility && atObstacle(o, p, proximity))
            return FacilityRef{map.id(), o.id, *o.facility};

    return std::nullopt;
}

std::vector<FacilityRef> facilitiesOn(const WorldMap& map) {
    std::vector<FacilityRef> out;
    for (const Obstacle& o : map.obstacles())
        if (o.facility) out.push_back(FacilityRef{map.id(), o.id, *o.facility});
    return out;
}

std::optional<NodeId> approachNode(const WorldMap& map, const Obstacle& obstacle,
                                   double proximity, const NodeSet& blocked) {
    const Vec2 c = obstacle.bounds.center();
    const PathNode* best = nullptr;
    double bestDist = std::numeric_limits<double>::max();

    for (const PathNode& n : map.nodes()) {
        if (n.isEntrance() || blocked.contains(n.id)) continue;
        if (!atObstacle(obstacle, n.position(), proximity)) continue;
        // Buildings are solid; stand next to them, not inside.
        if (obstacle.kind == ObstacleKind::Building && obstacle.bounds.contains(n.position())) continue;

        const double d = distance(n.position(), c);
        if (d < bestDist) {
            bestDist = d;
            best = &n;
        }
    }
    if (!best) return std::nullopt;
    return best->id;
}

FacilityMapping FacilityMapping::defaults() {
    return FacilityMapping({
        {"kitchen",    "eat"},
        {"restaurant", "eat"},
        {"bathroom",   "bathe"},
        {"hotspring",  "bathe"},
        {"bedroom",    "sleep"},
        {"toilet",     "toilet"},
        {"workspace",  "work"},
        {"public",     "rest"},
    });
}

std::optional<ActionId> FacilityMapping::actionForTag(const std::string& tag) const {
    auto it = tagToAction_.find(tag);
    if (it == tagToAction_.end()) return std::nullopt;
    return it->second;
}

std::vector<ActionId> FacilityMapping::actionsFor(const Facility& facility) const {
    std::vector<ActionId> out;
    for (const std::string& tag : facility.tags) {
        auto action = actionForTag(tag);
        if (action && std::find(out.begin(), out.end(), *action) == out.end())
            out.push_back(*action);
    }
    return out;
}

std::vector<std::string> FacilityMapping::tagsFor(const ActionId& action) const {
    std::vector<std::string> out;
    for (const auto& [tag, a] : tagToAction_)
        if (a == action) out.push_back(tag);
    return out;
}

bool FacilityMapping::supports(const Facility& facility, const ActionId& action) const {
    return std::any_of(facility.tags.begin(), facility.tags.end(), [&](const std::string& tag) {
        auto a = actionForTag(tag);
        return a && *a == action;
    });
}

} // namespace townlife::world

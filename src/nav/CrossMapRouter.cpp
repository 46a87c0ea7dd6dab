// src/nav/CrossMapRouter.cpp
#include "townlife/nav/CrossMapRouter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>

namespace townlife::nav {

namespace {

// How a map was reached during the map-level BFS.
struct MapHop {
    MapId  fromMap;
    NodeId exitEntranceId;   // entrance on fromMap
    NodeId entryNodeId;      // arrival node on this map
};

struct MapStep {
    MapId                 mapId;
    std::optional<NodeId> entryNodeId;
    std::optional<NodeId> exitEntranceId;
};

std::optional<std::vector<MapStep>> FindMapSequence(const world::MapCatalog& maps,
                                                    const MapId& startMapId,
                                                    const MapId& targetMapId) {
    std::unordered_map<MapId, std::optional<MapHop>> reached;
    reached.emplace(startMapId, std::nullopt);

    std::deque<MapId> frontier{startMapId};
    bool found = startMapId == targetMapId;
    while (!frontier.empty() && !found) {
        const MapId current = frontier.front();
        frontier.pop_front();

        auto it = maps.find(current);
        if (it == maps.end()) continue;

        for (const world::PathNode& n : it->second.nodes()) {
            if (!n.isEntrance() || !n.leadsTo) continue;
            const MapId& next = n.leadsTo->mapId;
            if (reached.contains(next)) continue;

            reached.emplace(next, MapHop{current, n.id, n.leadsTo->nodeId});
            if (next == targetMapId) { found = true; break; }
            frontier.push_back(next);
        }
    }
    if (!found) return std::nullopt;

    std::vector<MapStep> steps;
    std::optional<NodeId> exitFromHere;
    for (MapId at = targetMapId;;) {
        const auto& hop = reached.at(at);
        MapStep step{at, std::nullopt, exitFromHere};
        if (!hop) {
            steps.push_back(std::move(step));
            break;
        }
        step.entryNodeId = hop->entryNodeId;
        steps.push_back(std::move(step));
        exitFromHere = hop->exitEntranceId;
        at = hop->fromMap;
    }
    std::reverse(steps.begin(), steps.end());
    return steps;
}

const world::NodeSet& BlockedOn(const world::BlockedByMap& blockedPerMap, const MapId& mapId) {
    static const world::NodeSet kNone;
    auto it = blockedPerMap.find(mapId);
    return it == blockedPerMap.end() ? kNone : it->second;
}

} // namespace

std::optional<Route> PlanRoute(const world::MapCatalog& maps,
                               const MapId& startMapId,
                               const NodeId& startNodeId,
                               const MapId& targetMapId,
                               const NodeId& targetNodeId,
                               const world::BlockedByMap& blockedPerMap) {
    auto sequence = FindMapSequence(maps, startMapId, targetMapId);
    if (!sequence) {
        spdlog::debug("[CrossMap] no map sequence {} -> {}", startMapId, targetMapId);
        return std::nullopt;
    }

    Route route;
    for (std::size_t i = 0; i < sequence->size(); ++i) {
        const MapStep& step = (*sequence)[i];
        auto mapIt = maps.find(step.mapId);
        if (mapIt == maps.end()) return std::nullopt;

        const bool   first = i == 0;
        const bool   last  = i + 1 == sequence->size();
        const NodeId from  = first ? startNodeId : *step.entryNodeId;
        const NodeId to    = last ? targetNodeId : *step.exitEntranceId;

        NodePath path = FindPath(mapIt->second, from, to, BlockedOn(blockedPerMap, step.mapId));
        if (path.empty()) {
            spdlog::debug("[CrossMap] no path on {} from {} to {}", step.mapId, from, to);
            return std::nullopt;
        }
        route.segments.push_back(RouteSegment{step.mapId, std::move(path), step.exitEntranceId});
    }
    return route;
}

bool HasMoreSegments(const Route& route, std::size_t currentIndex) {
    return currentIndex + 1 < route.segments.size();
}

std::unordered_map<MapId, int> MapDistances(const world::MapCatalog& maps,
                                            const MapId& fromMapId,
                                            int maxHops) {
    std::unordered_map<MapId, int> dist{{fromMapId, 0}};
    std::deque<MapId> frontier{fromMapId};
    while (!frontier.empty()) {
        const MapId current = frontier.front();
        frontier.pop_front();

        const int d = dist.at(current);
        if (d >= maxHops) continue;

        auto it = maps.find(current);
        if (it == maps.end()) continue;
        for (const world::PathNode& n : it->second.nodes()) {
            if (!n.leadsTo || dist.contains(n.leadsTo->mapId)) continue;
            dist.emplace(n.leadsTo->mapId, d + 1);
            frontier.push_back(n.leadsTo->mapId);
        }
    }
    return dist;
}

} // namespace townlife::nav

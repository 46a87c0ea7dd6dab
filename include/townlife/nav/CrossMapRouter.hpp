#pragma once
// include/townlife/nav/CrossMapRouter.hpp
//
// Multi-map routes composed from per-map BFS paths joined at entrances.

#include "townlife/nav/Pathfinder.hpp"

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace townlife::nav {

struct RouteSegment {
    MapId                 mapId;
    NodePath              path;             // may be a single node (already at the exit)
    std::optional<NodeId> exitEntranceId;   // set on every segment but the last
};

struct Route {
    std::vector<RouteSegment> segments;
};

// BFS over maps (edges = entrance nodes with leadsTo), then one FindPath per
// map. Returns nullopt when any map hop or segment path is missing.
std::optional<Route> PlanRoute(const world::MapCatalog& maps,
                               const MapId& startMapId,
                               const NodeId& startNodeId,
                               const MapId& targetMapId,
                               const NodeId& targetNodeId,
                               const world::BlockedByMap& blockedPerMap = {});

bool HasMoreSegments(const Route& route, std::size_t currentIndex);

// Hop counts from `fromMapId` to every map reachable within `maxHops`
// (fromMapId itself maps to 0).
std::unordered_map<MapId, int> MapDistances(const world::MapCatalog& maps,
                                            const MapId& fromMapId,
                                            int maxHops);

} // namespace townlife::nav

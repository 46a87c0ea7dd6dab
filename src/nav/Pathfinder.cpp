// src/nav/Pathfinder.cpp
#include "townlife/nav/Pathfinder.hpp"

#include <algorithm>
#include <deque>
#include <unordered_map>
#include <utility>

namespace townlife::nav {

NodePath FindPath(const world::WorldMap& map,
                  const NodeId& start,
                  const NodeId& end,
                  const world::NodeSet& blocked) {
    if (start == end) return {start};
    if (blocked.contains(end)) return {};
    if (!map.findNode(start) || !map.findNode(end)) return {};

    std::unordered_map<NodeId, NodeId> parent;
    parent.emplace(start, NodeId{});

    std::deque<NodeId> frontier{start};
    while (!frontier.empty()) {
        const NodeId current = std::move(frontier.front());
        frontier.pop_front();

        const world::PathNode* node = map.findNode(current);
        if (!node) continue;

        for (const NodeId& next : node->connectedTo) {
            if (parent.contains(next) || blocked.contains(next)) continue;
            parent.emplace(next, current);

            if (next == end) {
                NodePath path{end};
                for (NodeId at = current; at != start; at = parent.at(at))
                    path.push_back(at);
                path.push_back(start);
                std::reverse(path.begin(), path.end());
                return path;
            }
            frontier.push_back(next);
        }
    }
    return {};
}

} // namespace townlife::nav

// src/world/Grid.cpp
#include "townlife/world/Grid.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace townlife::world {

namespace {

struct Spacing { double x, y; };

Spacing SpacingOf(const GridSpec& g) {
    return Spacing{g.width / (g.cols + 1), g.height / (g.rows + 1)};
}

bool InsideBuilding(Vec2 p, const std::vector<Obstacle>& obstacles) {
    return std::any_of(obstacles.begin(), obstacles.end(), [&](const Obstacle& o) {
        return o.kind == ObstacleKind::Building && o.bounds.contains(p);
    });
}

} // namespace

NodeId GridNodeId(const std::string& prefix, int row, int col) {
    return prefix + "-" + std::to_string(row) + "-" + std::to_string(col);
}

Vec2 TileCenter(const GridSpec& grid, int row, int col) {
    const Spacing s = SpacingOf(grid);
    return Vec2{std::round(s.x * (col + 1)), std::round(s.y * (row + 1))};
}

Rect TileRect(const GridSpec& grid, int row, int col, double tileW, double tileH) {
    const Spacing s = SpacingOf(grid);
    const double cx = s.x * (col + 1);
    const double cy = s.y * (row + 1);
    const double w = s.x * tileW;
    const double h = s.y * tileH;
    // Round once at the end so edges line up with node positions.
    return Rect{std::round(cx - w / 2), std::round(cy - h / 2), std::round(w), std::round(h)};
}

std::vector<PathNode> GenerateGridNodes(const GridSpec& grid,
                                        const std::vector<GridEntrance>& entrances,
                                        const std::vector<Obstacle>& obstacles) {
    std::vector<PathNode> nodes;
    std::unordered_map<NodeId, std::size_t> index;

    for (int row = 0; row < grid.rows; ++row) {
        for (int col = 0; col < grid.cols; ++col) {
            const Vec2 p = TileCenter(grid, row, col);
            if (InsideBuilding(p, obstacles)) continue;

            PathNode n;
            n.id = GridNodeId(grid.prefix, row, col);
            n.x = p.x;
            n.y = p.y;
            for (int dr = -1; dr <= 1; ++dr)
                for (int dc = -1; dc <= 1; ++dc) {
                    if (dr == 0 && dc == 0) continue;
                    const int r = row + dr, c = col + dc;
                    if (r < 0 || c < 0 || r >= grid.rows || c >= grid.cols) continue;
                    n.connectedTo.push_back(GridNodeId(grid.prefix, r, c));
                }
            index.emplace(n.id, nodes.size());
            nodes.push_back(std::move(n));
        }
    }

    // Drop links into skipped nodes.
    for (PathNode& n : nodes)
        std::erase_if(n.connectedTo, [&](const NodeId& id) { return !index.contains(id); });

    for (const GridEntrance& e : entrances) {
        const Vec2 p = TileCenter(grid, e.row, e.col);
        PathNode door;
        door.id = e.id;
        door.x = p.x;
        door.y = p.y;
        door.type = NodeType::Entrance;
        door.leadsTo = e.leadsTo;
        for (const NodeId& id : e.connectedTo) {
            auto it = index.find(id);
            if (it == index.end()) continue;
            door.connectedTo.push_back(id);
            nodes[it->second].connectedTo.push_back(e.id);
        }
        index.emplace(door.id, nodes.size());
        nodes.push_back(std::move(door));
    }
    return nodes;
}

bool MarkSpawn(std::vector<PathNode>& nodes, const NodeId& nodeId) {
    for (PathNode& n : nodes) {
        if (n.id != nodeId) continue;
        if (n.type == NodeType::Waypoint) n.type = NodeType::Spawn;
        return true;
    }
    return false;
}

} // namespace townlife::world

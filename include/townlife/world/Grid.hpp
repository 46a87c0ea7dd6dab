#pragma once
// include/townlife/world/Grid.hpp
//
// Grid map builder: rows x cols waypoints spread evenly over a pixel area,
// 8-connected, with nodes inside buildings left out. Tile coordinates may lie
// outside the grid for doors on the map edge.

#include "townlife/world/WorldMap.hpp"

#include <string>
#include <vector>

namespace townlife::world {

struct GridSpec {
    std::string prefix;
    int         cols   = 12;
    int         rows   = 9;
    double      width  = 800.0;
    double      height = 600.0;
};

struct GridEntrance {
    NodeId              id;
    int                 row = 0;
    int                 col = 0;
    std::vector<NodeId> connectedTo;   // linked both ways
    EntranceLink        leadsTo;
};

NodeId GridNodeId(const std::string& prefix, int row, int col);

Vec2 TileCenter(const GridSpec& grid, int row, int col);

// Building/zone bounds covering tileW x tileH tiles centered on (row, col).
Rect TileRect(const GridSpec& grid, int row, int col, double tileW, double tileH);

std::vector<PathNode> GenerateGridNodes(const GridSpec& grid,
                                        const std::vector<GridEntrance>& entrances = {},
                                        const std::vector<Obstacle>& obstacles = {});

// Marks `nodeId` as a spawn node. Returns false when it does not exist.
bool MarkSpawn(std::vector<PathNode>& nodes, const NodeId& nodeId);

} // namespace townlife::world

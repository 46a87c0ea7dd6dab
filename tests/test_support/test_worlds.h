#pragma once
//
// Small hand-built maps shared by the simulation tests.
//
//   MakeGrid4   : rows x cols, 4-connected, 100 px spacing
//   MakeTown    : t0 - t1 - t2 - t-door  (park zone around t1)
//   MakeCafe    : c-door - c1 - c2 - c3  (counter next to c2, NPC spot at c3)
//
// Town and cafe are linked through t-door <-> c-door.

#include "townlife/core/Config.hpp"
#include "townlife/world/WorldMap.hpp"

#include <string>
#include <utility>
#include <vector>

namespace townlife_test {

using namespace townlife;
using namespace townlife::world;

inline NodeId CellId(const std::string& prefix, int r, int c)
{
    return prefix + "-" + std::to_string(r) + "-" + std::to_string(c);
}

inline WorldMap MakeGrid4(const std::string& prefix, int rows, int cols)
{
    std::vector<PathNode> nodes;
    for (int r = 0; r < rows; ++r)
    {
        for (int c = 0; c < cols; ++c)
        {
            PathNode n;
            n.id = CellId(prefix, r, c);
            n.x = c * 100.0 + 50.0;
            n.y = r * 100.0 + 50.0;
            if (r > 0)        n.connectedTo.push_back(CellId(prefix, r - 1, c));
            if (r + 1 < rows) n.connectedTo.push_back(CellId(prefix, r + 1, c));
            if (c > 0)        n.connectedTo.push_back(CellId(prefix, r, c - 1));
            if (c + 1 < cols) n.connectedTo.push_back(CellId(prefix, r, c + 1));
            nodes.push_back(std::move(n));
        }
    }
    const NodeId spawn = CellId(prefix, 0, 0);
    return WorldMap(prefix, prefix, std::move(nodes), {}, spawn);
}

inline PathNode Node(NodeId id, double x, double y, std::vector<NodeId> links,
                     NodeType type = NodeType::Waypoint)
{
    PathNode n;
    n.id = std::move(id);
    n.x = x;
    n.y = y;
    n.type = type;
    n.connectedTo = std::move(links);
    return n;
}

inline WorldMap MakeTown()
{
    std::vector<PathNode> nodes{
        Node("t0", 50, 50, {"t1"}, NodeType::Spawn),
        Node("t1", 150, 50, {"t0", "t2"}),
        Node("t2", 250, 50, {"t1", "t-door"}),
        Node("t-door", 350, 50, {"t2"}, NodeType::Entrance),
    };
    nodes.back().leadsTo = EntranceLink{"cafe", "c-door"};

    std::vector<Obstacle> obstacles{
        Obstacle{"park", ObstacleKind::Zone, Rect{100, 0, 100, 100}, "Park",
                 Facility{{"public"}, {}, {}, {}, {}}},
    };
    return WorldMap("town", "Town", std::move(nodes), std::move(obstacles), "t0");
}

inline WorldMap MakeCafe(int counterCost = 5)
{
    std::vector<PathNode> nodes{
        Node("c-door", 50, 50, {"c1"}, NodeType::Entrance),
        Node("c1", 150, 50, {"c-door", "c2"}),
        Node("c2", 250, 50, {"c1", "c3"}),
        Node("c3", 250, 150, {"c2"}),
    };
    nodes.front().leadsTo = EntranceLink{"town", "t-door"};

    // Inflated by 40 px the counter reaches c2 but not c3.
    std::vector<Obstacle> obstacles{
        Obstacle{"counter", ObstacleKind::Building, Rect{280, 20, 40, 60}, "Counter",
                 Facility{{"restaurant"}, counterCost, {}, {}, {}}},
    };
    return WorldMap("cafe", "Cafe", std::move(nodes), std::move(obstacles), "c1");
}

inline MapCatalog MakeTownAndCafe()
{
    MapCatalog maps;
    maps.emplace("town", MakeTown());
    maps.emplace("cafe", MakeCafe());
    return maps;
}

// Fast, quiet settings for driving an engine with synthetic timestamps.
inline config::SimulationConfig FastConfig()
{
    config::SimulationConfig cfg;
    cfg.movement.speed = 1000.0;          // one 100 px hop per 0.1 s
    cfg.movement.transitionSeconds = 0.1;
    cfg.behavior.restChance = 0.0;
    cfg.behavior.wanderEveryNActions = 0;
    cfg.persistence.saveIntervalMs = 1'000;
    cfg.notifyEveryTicks = 1;
    return cfg;
}

} // namespace townlife_test

// tests/test_pathfinding.cpp
#include <doctest/doctest.h>

#include "test_support/test_worlds.h"

#include "townlife/nav/CrossMapRouter.hpp"
#include "townlife/nav/Pathfinder.hpp"
#include "townlife/world/Grid.hpp"

#include <algorithm>

namespace townlife_pathfinding_test {

using namespace townlife_test;
using townlife::nav::FindPath;
using townlife::nav::PlanRoute;

bool Links(const NodeId& from, const NodeId& to, const WorldMap& map)
{
    const PathNode* n = map.findNode(from);
    return n && std::find(n->connectedTo.begin(), n->connectedTo.end(), to) != n->connectedTo.end();
}

} // namespace townlife_pathfinding_test

using namespace townlife_pathfinding_test;

TEST_CASE("FindPath: start == end returns the start node only")
{
    const WorldMap map = MakeGrid4("g", 3, 3);
    const auto path = FindPath(map, "g-1-1", "g-1-1");
    REQUIRE(path.size() == 1);
    CHECK(path.front() == "g-1-1");
}

TEST_CASE("FindPath: shortest corner to corner path on an open grid")
{
    const WorldMap map = MakeGrid4("g", 3, 3);
    const auto path = FindPath(map, "g-0-0", "g-2-2");
    REQUIRE(path.size() == 5);
    CHECK(path.front() == "g-0-0");
    CHECK(path.back() == "g-2-2");
    for (std::size_t i = 1; i < path.size(); ++i)
        CHECK(Links(path[i - 1], path[i], map));
}

TEST_CASE("FindPath: routes around a blocked center node")
{
    const WorldMap map = MakeGrid4("g", 3, 3);
    const NodeSet blocked{"g-1-1"};
    const auto path = FindPath(map, "g-0-0", "g-2-2", blocked);
    REQUIRE(path.size() == 5);   // four hops
    CHECK(std::find(path.begin(), path.end(), "g-1-1") == path.end());
}

TEST_CASE("FindPath: blocked columns leave no path")
{
    const WorldMap map = MakeGrid4("g", 3, 4);
    NodeSet blocked;
    for (int r = 0; r < 3; ++r)
    {
        blocked.insert(CellId("g", r, 1));
        blocked.insert(CellId("g", r, 2));
    }
    CHECK(FindPath(map, "g-0-0", "g-2-3", blocked).empty());
}

TEST_CASE("FindPath: blocked destination, unknown nodes")
{
    const WorldMap map = MakeGrid4("g", 3, 3);
    CHECK(FindPath(map, "g-0-0", "g-0-1", NodeSet{"g-0-1"}).empty());
    CHECK(FindPath(map, "g-0-0", "nowhere").empty());
    CHECK(FindPath(map, "nowhere", "g-0-0").empty());
}

TEST_CASE("PlanRoute: town to cafe through one entrance pair")
{
    const MapCatalog maps = MakeTownAndCafe();
    const auto route = PlanRoute(maps, "town", "t0", "cafe", "c2");
    REQUIRE(route.has_value());
    REQUIRE(route->segments.size() == 2);

    const auto& first = route->segments[0];
    CHECK(first.mapId == "town");
    CHECK(first.path == townlife::nav::NodePath{"t0", "t1", "t2", "t-door"});
    REQUIRE(first.exitEntranceId.has_value());
    CHECK(*first.exitEntranceId == "t-door");

    const auto& second = route->segments[1];
    CHECK(second.mapId == "cafe");
    CHECK(second.path == townlife::nav::NodePath{"c-door", "c1", "c2"});
    CHECK_FALSE(second.exitEntranceId.has_value());

    CHECK(townlife::nav::HasMoreSegments(*route, 0));
    CHECK_FALSE(townlife::nav::HasMoreSegments(*route, 1));
}

TEST_CASE("PlanRoute: standing on the exit yields a one-node segment")
{
    const MapCatalog maps = MakeTownAndCafe();
    const auto route = PlanRoute(maps, "town", "t-door", "cafe", "c1");
    REQUIRE(route.has_value());
    REQUIRE(route->segments.size() == 2);
    CHECK(route->segments[0].path == townlife::nav::NodePath{"t-door"});
}

TEST_CASE("PlanRoute: blocked nodes on a later map fail the whole route")
{
    const MapCatalog maps = MakeTownAndCafe();
    BlockedByMap blocked;
    blocked["cafe"] = NodeSet{"c1"};
    CHECK_FALSE(PlanRoute(maps, "town", "t0", "cafe", "c2", blocked).has_value());
    CHECK_FALSE(PlanRoute(maps, "town", "t0", "attic", "a0").has_value());
}

TEST_CASE("MapDistances counts map hops up to the limit")
{
    const MapCatalog maps = MakeTownAndCafe();
    const auto all = townlife::nav::MapDistances(maps, "town", 3);
    REQUIRE(all.size() == 2);
    CHECK(all.at("town") == 0);
    CHECK(all.at("cafe") == 1);

    const auto none = townlife::nav::MapDistances(maps, "town", 0);
    CHECK(none.size() == 1);
}

TEST_CASE("GenerateGridNodes: 8-connected, buildings carve out nodes, doors link both ways")
{
    const GridSpec grid{"g", 3, 3, 400.0, 400.0};   // 100 px spacing

    const auto open = GenerateGridNodes(grid);
    REQUIRE(open.size() == 9);

    const WorldMap openMap("g", "g", open, {}, "g-0-0");
    CHECK(openMap.findNode("g-1-1")->connectedTo.size() == 8);
    CHECK(openMap.findNode("g-0-0")->connectedTo.size() == 3);
    CHECK(openMap.findNode("g-1-1")->x == doctest::Approx(200.0));

    const std::vector<Obstacle> obstacles{
        Obstacle{"block", ObstacleKind::Building, TileRect(grid, 1, 1, 1.0, 1.0), "Block", std::nullopt},
    };
    const std::vector<GridEntrance> doors{
        GridEntrance{"g-door", 1, 3, {"g-1-2"}, EntranceLink{"other", "o-door"}},
    };
    auto nodes = GenerateGridNodes(grid, doors, obstacles);
    CHECK(MarkSpawn(nodes, "g-0-0"));
    CHECK_FALSE(MarkSpawn(nodes, "g-9-9"));

    const WorldMap map("g", "g", nodes, obstacles, "g-0-0");
    CHECK(map.nodes().size() == 9);   // 8 waypoints + door
    CHECK(map.findNode("g-1-1") == nullptr);
    CHECK_FALSE(Links("g-0-0", "g-1-1", map));
    CHECK(map.findNode("g-0-0")->type == NodeType::Spawn);

    const PathNode* door = map.findNode("g-door");
    REQUIRE(door != nullptr);
    CHECK(door->isEntrance());
    REQUIRE(door->leadsTo.has_value());
    CHECK(door->leadsTo->mapId == "other");
    CHECK(Links("g-door", "g-1-2", map));
    CHECK(Links("g-1-2", "g-door", map));
}

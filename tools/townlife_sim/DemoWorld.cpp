// tools/townlife_sim/DemoWorld.cpp
#include "DemoWorld.hpp"

#include "townlife/world/Grid.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace townlife::demo {

namespace {

using namespace townlife::world;

Obstacle Zone(FacilityId id, Rect bounds, std::string label, Facility facility) {
    return Obstacle{std::move(id), ObstacleKind::Zone, bounds, std::move(label), std::move(facility)};
}

Obstacle Building(FacilityId id, Rect bounds, std::string label, std::optional<Facility> facility = std::nullopt) {
    return Obstacle{std::move(id), ObstacleKind::Building, bounds, std::move(label), std::move(facility)};
}

WorldMap MakeTown() {
    const GridSpec g{"town", 12, 9, 800.0, 600.0};
    std::vector<Obstacle> obstacles{
        Zone("town-park", TileRect(g, 6, 2, 3.0, 2.0), "Park", Facility{{"public"}, {}, {}, {}, {}}),
        Building("town-restroom", TileRect(g, 1, 9, 1.0, 1.0), "Restroom", Facility{{"toilet"}, {}, {}, {}, {}}),
        Building("town-fountain", TileRect(g, 4, 6, 1.0, 1.0), "Fountain"),
    };
    std::vector<GridEntrance> doors{
        {"town-cafe-door", 4, 12, {"town-4-11", "town-3-11"}, {"cafe", "cafe-door"}},
        {"town-home-door", 4, -1, {"town-4-0"}, {"home", "home-door"}},
    };
    auto nodes = GenerateGridNodes(g, doors, obstacles);
    MarkSpawn(nodes, "town-4-4");
    return WorldMap("town", "Town", std::move(nodes), std::move(obstacles), "town-4-4");
}

WorldMap MakeCafe() {
    const GridSpec g{"cafe", 10, 7, 640.0, 480.0};
    std::vector<Obstacle> obstacles{
        Building("cafe-counter", TileRect(g, 1, 5, 2.0, 1.0), "Counter",
                 Facility{{"restaurant"}, 8, 3, {}, {}}),
        Zone("cafe-floor", TileRect(g, 5, 7, 4.0, 2.0), "Staff area",
             Facility{{"workspace"}, {}, {}, {}, JobInfo{"cafe-staff", 12, 9, 17}}),
        Building("cafe-restroom", TileRect(g, 0, 9, 1.0, 1.0), "Restroom", Facility{{"toilet"}, {}, {}, {}, {}}),
    };
    std::vector<GridEntrance> doors{
        {"cafe-door", 3, -1, {"cafe-3-0", "cafe-2-0"}, {"town", "town-cafe-door"}},
    };
    auto nodes = GenerateGridNodes(g, doors, obstacles);
    MarkSpawn(nodes, "cafe-3-1");
    return WorldMap("cafe", "Cafe", std::move(nodes), std::move(obstacles), "cafe-3-1");
}

WorldMap MakeHome() {
    const GridSpec g{"home", 8, 6, 480.0, 360.0};
    std::vector<Obstacle> obstacles{
        Zone("home-bedroom", TileRect(g, 1, 1, 2.5, 2.5), "Bedroom", Facility{{"bedroom"}, {}, {}, "aki", {}}),
        Zone("home-kitchen", TileRect(g, 1, 5, 2.5, 2.5), "Kitchen", Facility{{"kitchen"}, {}, {}, "aki", {}}),
        Zone("home-bath", TileRect(g, 4, 1, 2.5, 2.0), "Bathroom", Facility{{"bathroom"}, {}, {}, "aki", {}}),
        Zone("home-toilet", TileRect(g, 4, 5, 1.5, 1.5), "Toilet", Facility{{"toilet"}, {}, {}, {}, {}}),
    };
    std::vector<GridEntrance> doors{
        {"home-door", 2, 8, {"home-2-7", "home-3-7"}, {"town", "town-home-door"}},
    };
    auto nodes = GenerateGridNodes(g, doors, obstacles);
    MarkSpawn(nodes, "home-2-6");
    return WorldMap("home", "Home", std::move(nodes), std::move(obstacles), "home-2-6");
}

} // namespace

sim::WorldSetup MakeDemoWorld() {
    sim::WorldSetup setup;
    for (WorldMap m : {MakeTown(), MakeCafe(), MakeHome()}) {
        MapId id = m.id();
        setup.maps.emplace(std::move(id), std::move(m));
    }

    sim::CharacterSeed aki;
    aki.id = "aki";
    aki.name = "Aki";
    aki.needs = NeedValues{80, 90, 70, 85, 60};
    aki.money = 120;
    aki.employment = sim::Employment{"cafe-staff"};
    aki.mapId = "home";
    setup.characters.push_back(aki);

    sim::CharacterSeed ren;
    ren.id = "ren";
    ren.name = "Ren";
    ren.needs = NeedValues{45, 70, 90, 60, 35};
    ren.money = 40;
    ren.mapId = "town";
    setup.characters.push_back(ren);

    setup.npcs.push_back(sim::NpcSeed{"mika", "Mika", "cafe", "cafe-3-5", Direction::Left});

    setup.schedules["aki"] = {
        {"07:00", "breakfast", "home", {}},
        {"09:00", "work", "cafe", {}},
        {"17:00", "free time", {}, {}},
        {"19:00", "dinner", "home", {}},
        {"22:00", "bath", "home", {}},
        {"23:00", "bedtime", "home", {}},
    };
    setup.schedules["ren"] = {
        {"08:00", "breakfast", "cafe", {}},
        {"12:00", "lunch", "cafe", {}},
        {"15:00", "break", "town", {}},
        {"20:00", "dinner", "cafe", {}},
    };
    setup.currentMapId = "town";
    return setup;
}

} // namespace townlife::demo

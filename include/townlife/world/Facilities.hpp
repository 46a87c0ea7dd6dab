#pragma once
// include/townlife/world/Facilities.hpp
//
// Facility lookup on a map and the injected tag <-> action table.

#include "townlife/world/WorldMap.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace townlife::world {

struct FacilityRef {
    MapId      mapId;
    FacilityId id;
    Facility   facility;
};

// A node is at a zone facility when it lies inside the zone, and at a
// building facility when it lies within `proximity` pixels of the building.
// Zones win over buildings.
std::optional<FacilityRef> facilityAt(const WorldMap& map, const PathNode& node, double proximity);

std::vector<FacilityRef> facilitiesOn(const WorldMap& map);

// Best node to stand on when using `obstacle`: the free node at the facility
// closest to its center, entrances excluded.
std::optional<NodeId> approachNode(const WorldMap& map, const Obstacle& obstacle,
                                   double proximity, const NodeSet& blocked);

// Maps facility tags to abstract action ids ("eat", "sleep", ...).
class FacilityMapping {
public:
    FacilityMapping() = default;
    explicit FacilityMapping(std::map<std::string, ActionId> tagToAction)
        : tagToAction_(std::move(tagToAction)) {}

    // kitchen/restaurant -> eat, bathroom/hotspring -> bathe, bedroom -> sleep,
    // toilet -> toilet, workspace -> work, public -> rest
    static FacilityMapping defaults();

    std::optional<ActionId>  actionForTag(const std::string& tag) const;
    std::vector<ActionId>    actionsFor(const Facility& facility) const;
    std::vector<std::string> tagsFor(const ActionId& action) const;
    bool                     supports(const Facility& facility, const ActionId& action) const;

    const std::map<std::string, ActionId>& table() const { return tagToAction_; }

private:
    std::map<std::string, ActionId> tagToAction_;
};

} // namespace townlife::world

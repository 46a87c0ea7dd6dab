#pragma once
// include/townlife/world/WorldMap.hpp
//
// Static map data: the node graph agents walk on, plus obstacles that may
// carry a facility. Maps are immutable once constructed.

#include "townlife/core/Types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace townlife::world {

enum class NodeType : std::uint8_t { Waypoint, Entrance, Spawn };

struct EntranceLink {
    MapId  mapId;
    NodeId nodeId;
};

struct PathNode {
    NodeId                      id;
    double                      x = 0.0;
    double                      y = 0.0;
    NodeType                    type = NodeType::Waypoint;
    std::vector<NodeId>         connectedTo;
    std::optional<EntranceLink> leadsTo;   // set on entrance nodes

    Vec2 position() const { return Vec2{x, y}; }
    bool isEntrance() const { return type == NodeType::Entrance; }
};

struct Rect {
    double x = 0.0, y = 0.0, width = 0.0, height = 0.0;

    bool contains(Vec2 p) const {
        return p.x >= x && p.x < x + width && p.y >= y && p.y < y + height;
    }
    Rect inflated(double by) const {
        return Rect{x - by, y - by, width + 2 * by, height + 2 * by};
    }
    Vec2 center() const { return Vec2{x + width / 2, y + height / 2}; }
};

struct JobInfo {
    std::string jobId;
    int         hourlyWage    = 0;
    int         workStartHour = 9;
    int         workEndHour   = 17;   // may be < start for overnight shifts
};

struct Facility {
    std::vector<std::string> tags;
    std::optional<int>       cost;
    std::optional<int>       quality;
    std::optional<AgentId>   owner;
    std::optional<JobInfo>   job;

    bool hasTag(const std::string& tag) const;
};

enum class ObstacleKind : std::uint8_t { Building, Zone };

struct Obstacle {
    FacilityId              id;
    ObstacleKind            kind = ObstacleKind::Building;
    Rect                    bounds;
    std::string             label;
    std::optional<Facility> facility;
};

using NodeSet = std::unordered_set<NodeId>;

class WorldMap {
public:
    WorldMap() = default;
    WorldMap(MapId id, std::string name, std::vector<PathNode> nodes,
             std::vector<Obstacle> obstacles, NodeId spawnNodeId);

    const MapId&                 id() const { return id_; }
    const std::string&           name() const { return name_; }
    const std::vector<PathNode>& nodes() const { return nodes_; }
    const std::vector<Obstacle>& obstacles() const { return obstacles_; }
    const NodeId&                spawnNodeId() const { return spawnNodeId_; }

    const PathNode* findNode(const NodeId& id) const;
    const Obstacle* findObstacle(const FacilityId& id) const;

private:
    MapId                                   id_;
    std::string                             name_;
    std::vector<PathNode>                   nodes_;
    std::vector<Obstacle>                   obstacles_;
    NodeId                                  spawnNodeId_;
    std::unordered_map<NodeId, std::size_t> index_;
};

using MapCatalog  = std::unordered_map<MapId, WorldMap>;
using BlockedByMap = std::unordered_map<MapId, NodeSet>;

// Throws std::invalid_argument on dangling node links, unknown spawn nodes,
// or entrance links to missing maps/nodes. Load-time only.
void validateMaps(const MapCatalog& maps);

} // namespace townlife::world

// src/world/WorldMap.cpp
#include "townlife/world/WorldMap.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace townlife::world {

bool Facility::hasTag(const std::string& tag) const {
    return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

WorldMap::WorldMap(MapId id, std::string name, std::vector<PathNode> nodes,
                   std::vector<Obstacle> obstacles, NodeId spawnNodeId)
    : id_(std::move(id)),
      name_(std::move(name)),
      nodes_(std::move(nodes)),
      obstacles_(std::move(obstacles)),
      spawnNodeId_(std::move(spawnNodeId)) {
    index_.reserve(nodes_.size());
    for (std::size_t i = 0; i < nodes_.size(); ++i)
        index_.emplace(nodes_[i].id, i);
}

const PathNode* WorldMap::findNode(const NodeId& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &nodes_[it->second];
}

const Obstacle* WorldMap::findObstacle(const FacilityId& id) const {
    auto it = std::find_if(obstacles_.begin(), obstacles_.end(),
                           [&](const Obstacle& o) { return o.id == id; });
    return it == obstacles_.end() ? nullptr : &*it;
}

void validateMaps(const MapCatalog& maps) {
    for (const auto& [mapId, map] : maps) {
        if (mapId != map.id())
            throw std::invalid_argument("map registered as '" + mapId + "' has id '" + map.id() + "'");

        if (!map.spawnNodeId().empty() && !map.findNode(map.spawnNodeId()))
            throw std::invalid_argument("map '" + mapId + "': unknown spawn node '" + map.spawnNodeId() + "'");

        for (const PathNode& n : map.nodes()) {
            for (const NodeId& next : n.connectedTo)
                if (!map.findNode(next))
                    throw std::invalid_argument("map '" + mapId + "': node '" + n.id +
                                                "' links to unknown node '" + next + "'");
            if (!n.leadsTo) continue;

            auto target = maps.find(n.leadsTo->mapId);
            if (target == maps.end())
                throw std::invalid_argument("map '" + mapId + "': entrance '" + n.id +
                                            "' leads to unknown map '" + n.leadsTo->mapId + "'");
            if (!target->second.findNode(n.leadsTo->nodeId))
                throw std::invalid_argument("map '" + mapId + "': entrance '" + n.id +
                                            "' leads to unknown node '" + n.leadsTo->nodeId + "'");
        }
    }
}

} // namespace townlife::world

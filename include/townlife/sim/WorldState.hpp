#pragma once
// include/townlife/sim/WorldState.hpp
//
// Authoritative mutable store: maps, agents, per-map NPC occupancy, simulated
// time and the pause flag. Only the tick thread touches it.

#include "townlife/sim/Components.hpp"
#include "townlife/world/WorldMap.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace townlife::sim {

struct CharacterSeed {
    AgentId                   id;
    std::string               name;
    NeedValues                needs;
    int                       money = 0;
    std::optional<Employment> employment;
    MapId                     mapId;
    std::optional<NodeId>     nodeId;   // defaults to the map's spawn node
};

struct NpcSeed {
    AgentId     id;
    std::string name;
    MapId       mapId;
    NodeId      nodeId;
    Direction   direction = Direction::Down;
};

// Plain copy of a character's components.
struct CharacterRecord {
    AgentId                           id;
    std::string                       name;
    NeedValues                        needs;
    int                               money = 0;
    std::optional<Employment>         employment;
    Location                          location;
    Navigation                        navigation;
    std::optional<CrossMapNavigation> crossMapNavigation;
    std::optional<Transition>         transition;
    std::optional<ActionState>        currentAction;
    std::optional<PendingAction>      pendingAction;
    int                               actionCounter = 0;
    std::optional<Conversation>       conversation;
    std::string                       indicator;
};

struct NpcRecord {
    AgentId                     id;
    std::string                 name;
    Location                    location;
    std::optional<Conversation> conversation;
};

// Mirrors the most recent map transition for the UI.
struct TransitionIndicator {
    bool   active = false;
    MapId  fromMapId;
    MapId  toMapId;
    double progress = 0.0;
};

class WorldState {
public:
    // Throws std::invalid_argument on invalid map data.
    void initialize(world::MapCatalog maps);

    // Throws std::invalid_argument on duplicate ids or unknown map/node.
    entt::entity addCharacter(const CharacterSeed& seed);
    entt::entity addNpc(const NpcSeed& seed);

    entt::registry&       registry() { return registry_; }
    const entt::registry& registry() const { return registry_; }

    entt::entity find(const AgentId& id) const;
    bool         isCharacter(entt::entity e) const;

    const std::vector<AgentId>& characterIds() const { return characterOrder_; }
    const std::vector<AgentId>& npcIds() const { return npcOrder_; }

    const world::MapCatalog& maps() const { return maps_; }
    const world::WorldMap*   map(const MapId& id) const;

    // Nodes occupied by NPCs on a map.
    const world::NodeSet& blockedNodes(const MapId& mapId) const;
    const world::BlockedByMap& blockedByMap() const { return blocked_; }

    std::optional<CharacterRecord> character(const AgentId& id) const;
    CharacterRecord                record(entt::entity e) const;
    std::optional<NpcRecord>       npc(const AgentId& id) const;
    std::vector<NpcRecord>         npcsOn(const MapId& mapId) const;

    // Moving, transitioning, or on an active cross-map route.
    bool isNavigating(entt::entity e) const;
    // No action, no pending action, not navigating, not in a conversation.
    bool isIdle(entt::entity e) const;

    // Swaps map/node/position at the fadeOut -> fadeIn boundary.
    void setCharacterMap(entt::entity e, const MapId& mapId, const NodeId& nodeId, Vec2 position);

    // Restores a character's persisted fields; movement and actions reset to rest.
    bool restoreCharacter(const CharacterRecord& rec);

    WorldTime time() const { return time_; }
    void      setTime(WorldTime t) { time_ = t; }

    bool isPaused() const { return paused_; }
    void setPaused(bool p) { paused_ = p; }

    std::uint64_t tick() const { return tick_; }
    void          advanceTick() { ++tick_; }

    const MapId& currentMapId() const { return currentMapId_; }
    void         setCurrentMapId(MapId id) { currentMapId_ = std::move(id); }

    const TransitionIndicator& transition() const { return transition_; }
    TransitionIndicator&       transition() { return transition_; }

private:
    entt::registry                           registry_;
    world::MapCatalog                        maps_;
    world::BlockedByMap                      blocked_;
    std::unordered_map<AgentId, entt::entity> byId_;
    std::vector<AgentId>                     characterOrder_;
    std::vector<AgentId>                     npcOrder_;

    WorldTime           time_{};
    bool                paused_ = false;
    std::uint64_t       tick_   = 0;
    MapId               currentMapId_;
    TransitionIndicator transition_;
};

} // namespace townlife::sim

#pragma once
// include/townlife/sim/NavigationSystem.hpp
//
// Per-agent navigation state machine:
//   Idle -> Moving -> (next node -> Moving | final node) -> Idle
// with a Transitioning overlay (fadeOut -> fadeIn) whenever a segment ends on
// an entrance. Cross-map routes chain segments through transitions.

#include "townlife/core/Config.hpp"
#include "townlife/sim/Events.hpp"
#include "townlife/sim/WorldState.hpp"

#include <unordered_set>

namespace townlife::sim {

class NavigationSystem {
public:
    NavigationSystem(WorldState& world, EventBus& bus, const config::MovementConfig& movement);

    // Fails if the agent is already navigating, the map or node is unknown,
    // or no path avoids the map's NPC-occupied nodes. A one-node path
    // (already there) succeeds without moving.
    bool navigateToNode(const AgentId& agentId, const NodeId& targetNodeId);

    // Plans a cross-map route and starts its first segment.
    bool navigateToMap(const AgentId& agentId, const MapId& targetMapId, const NodeId& targetNodeId);

    // Clears navigation, cross-map route and transition together.
    void cancel(const AgentId& agentId);

    // Advances movement and transitions by dtSeconds, then posts
    // NavigationCompleted for agents that stopped navigating since last tick.
    void tick(double dtSeconds);

    std::size_t navigatingCount() const { return navigatingLastTick_.size(); }

    // Forget edge-detection state (world re-initialized).
    void reset() { navigatingLastTick_.clear(); }

private:
    void updateMovement(entt::entity e, double dt);
    void continueToNextNode(entt::entity e, std::size_t nextIndex, Vec2 position);
    void arriveAtDestination(entt::entity e);
    void startSegment(entt::entity e);
    bool startPath(entt::entity e, const nav::NodePath& path, const world::WorldMap& map);
    void startTransition(entt::entity e, const world::PathNode& entrance);
    void updateTransition(entt::entity e, double dt);
    void completeCrossMap(entt::entity e);

    const AgentId& idOf(entt::entity e) const;

    WorldState&            world_;
    EventBus&              bus_;
    config::MovementConfig movement_;

    // Agents navigating at the end of the previous tick, plus any started since.
    std::unordered_set<AgentId> navigatingLastTick_;
};

} // namespace townlife::sim

#pragma once
// include/townlife/sim/Components.hpp
//
// Agent components. Characters and NPCs are entities in one registry;
// optional state (cross-map route, transition, action, pending action,
// conversation) is modelled by component presence.

#include "townlife/core/Types.hpp"
#include "townlife/nav/CrossMapRouter.hpp"

#include <entt/entt.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace townlife::sim {

struct CharacterTag {};
struct NpcTag {};

struct Identity {
    AgentId     id;
    std::string name;
};

struct Needs {
    NeedValues values;
};

struct Employment {
    std::string jobId;
};

struct Wallet {
    int                       money = 0;
    std::optional<Employment> employment;
};

struct Location {
    MapId     mapId;
    NodeId    nodeId;
    Vec2      position;
    Direction direction = Direction::Down;
};

// isMoving=false with an empty path is the rest state.
struct Navigation {
    bool                isMoving = false;
    nav::NodePath       path;
    std::size_t         currentPathIndex = 0;
    double              progress = 0.0;   // 0..1 along the current hop
    std::optional<Vec2> startPosition;
    std::optional<Vec2> targetPosition;
};

struct CrossMapNavigation {
    bool        isActive = true;
    nav::Route  route;
    std::size_t currentSegmentIndex = 0;
    MapId       targetMapId;
    NodeId      targetNodeId;
};

enum class TransitionPhase : std::uint8_t { FadeOut, FadeIn };

struct Transition {
    TransitionPhase phase = TransitionPhase::FadeOut;
    double          progress = 0.0;
    MapId           fromMapId;
    MapId           targetMapId;
    NodeId          targetNodeId;
    Vec2            targetPosition;
};

struct ActionState {
    ActionId                  actionId;
    TimestampMs               startTime = 0;
    TimestampMs               targetEndTime = 0;
    std::optional<FacilityId> facilityId;
    std::optional<AgentId>    targetNpcId;
    std::optional<int>        durationMinutes;
    std::optional<std::string> reason;
    bool                      placeholder = false;   // "thinking" while a decision is in flight
    std::uint64_t             ticket = 0;            // decision that owns the placeholder
};

// Intent to act once the agent has arrived.
struct PendingAction {
    ActionId                   actionId;
    std::optional<FacilityId>  facilityId;
    std::optional<AgentId>     targetNpcId;
    MapId                      facilityMapId;
    std::optional<std::string> reason;
    std::optional<int>         durationMinutes;
};

struct Conversation {
    AgentId partnerId;
};

struct ActionCounter {
    int completed = 0;
};

struct DisplayIndicator {
    std::string text;
};

} // namespace townlife::sim

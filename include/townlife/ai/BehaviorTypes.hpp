#pragma once
// include/townlife/ai/BehaviorTypes.hpp
//
// Decision intents and the immutable context handed to a BehaviorDecider.

#include "townlife/sim/ScheduleBook.hpp"
#include "townlife/sim/WorldState.hpp"
#include "townlife/world/Facilities.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace townlife::ai {

struct IdleDecision {
    std::string reason;
};

struct MoveDecision {
    std::optional<MapId>  targetMapId;
    std::optional<NodeId> targetNodeId;
    std::string           reason;
};

struct ActionDecision {
    ActionId                  actionId;
    std::optional<FacilityId> targetFacilityId;
    std::optional<AgentId>    targetNpcId;
    std::optional<int>        durationMinutes;
    std::string               reason;
};

using Intent = std::variant<IdleDecision, MoveDecision, ActionDecision>;

struct BehaviorDecision {
    Intent                              intent;
    std::optional<sim::ScheduleUpdate>  scheduleUpdate;
};

std::string_view intent_name(const Intent& intent);   // "idle" | "move" | "action"

struct FacilityInfo {
    world::FacilityRef    ref;
    std::vector<ActionId> actions;     // actions its tags allow
    int                   mapHops = 0; // 0 = current map
    double                distance = 0.0;  // pixels from the agent, current map only
};

struct NearbyMap {
    MapId       id;
    std::string name;
    int         hops = 0;
};

// Copied out of the world on the tick thread; deciders read nothing else.
struct BehaviorContext {
    sim::CharacterRecord                   character;
    WorldTime                              time;
    std::optional<world::FacilityRef>      currentFacility;
    std::vector<sim::ScheduleEntry>        schedule;
    std::vector<ActionId>                  availableActions;
    std::vector<sim::NpcRecord>            nearbyNpcs;
    std::vector<FacilityInfo>              currentMapFacilities;
    std::vector<FacilityInfo>              nearbyFacilities;
    std::vector<NearbyMap>                 nearbyMaps;
    std::vector<sim::ActionHistoryEntry>   todayActions;
};

} // namespace townlife::ai

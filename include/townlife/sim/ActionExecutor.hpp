#pragma once
// include/townlife/sim/ActionExecutor.hpp
#include "townlife/core/Types.hpp"
#include "townlife/world/Facilities.hpp"

#include <optional>
#include <string>
#include <vector>

namespace townlife::sim {

// Owns the timed action lifecycle. Completion is posted to the EventBus as
// EventKind::ActionCompleted. Called from the tick thread only.
class IActionExecutor {
public:
    virtual ~IActionExecutor() = default;

    virtual bool startAction(const AgentId& agentId,
                             const ActionId& actionId,
                             const std::optional<FacilityId>& facilityId = std::nullopt,
                             const std::optional<AgentId>& targetNpcId = std::nullopt,
                             std::optional<int> durationMinutes = std::nullopt,
                             const std::optional<std::string>& reason = std::nullopt) = 0;

    virtual void tick(TimestampMs nowMs) = 0;

    // Per-minute rates of the running action; they replace decay while active.
    virtual std::optional<NeedRates> activePerMinuteEffects(const AgentId& agentId) const = 0;

    virtual std::vector<ActionId> availableActions(const AgentId& agentId) const = 0;

    virtual std::optional<world::FacilityRef> currentFacility(const AgentId& agentId) const = 0;

    // Ends the current action without applying its effects.
    virtual void forceCompleteAction(const AgentId& agentId) = 0;
};

} // namespace townlife::sim

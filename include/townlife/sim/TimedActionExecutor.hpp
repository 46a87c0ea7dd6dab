#pragma once
// include/townlife/sim/TimedActionExecutor.hpp
//
// Reference IActionExecutor driven by the action catalog. Actions run in
// wall-clock time; fixed actions apply their effects on completion, variable
// actions expose per-minute rates that replace need decay while they run.

#include "townlife/core/Config.hpp"
#include "townlife/sim/ActionExecutor.hpp"
#include "townlife/sim/Events.hpp"
#include "townlife/sim/WorldState.hpp"

#include <expected>

namespace townlife::sim {

class TimedActionExecutor final : public IActionExecutor {
public:
    TimedActionExecutor(WorldState& world, EventBus& bus, config::ActionCatalog catalog,
                        world::FacilityMapping mapping, double facilityProximity);

    bool startAction(const AgentId& agentId,
                     const ActionId& actionId,
                     const std::optional<FacilityId>& facilityId = std::nullopt,
                     const std::optional<AgentId>& targetNpcId = std::nullopt,
                     std::optional<int> durationMinutes = std::nullopt,
                     const std::optional<std::string>& reason = std::nullopt) override;

    void tick(TimestampMs nowMs) override;

    std::optional<NeedRates> activePerMinuteEffects(const AgentId& agentId) const override;
    std::vector<ActionId>    availableActions(const AgentId& agentId) const override;
    std::optional<world::FacilityRef> currentFacility(const AgentId& agentId) const override;
    void forceCompleteAction(const AgentId& agentId) override;

    // Empty on success, otherwise the reason the action cannot start.
    std::expected<void, std::string> canExecute(const AgentId& agentId, const ActionId& actionId,
                                                const std::optional<AgentId>& targetNpcId = std::nullopt) const;

    const config::ActionCatalog& catalog() const { return catalog_; }
    TimestampMs                  now() const { return now_; }
    void                         setNow(TimestampMs nowMs) { now_ = nowMs; }

private:
    void complete(entt::entity e);
    void endConversation(entt::entity e);
    std::optional<AgentId> adjacentNpc(entt::entity e, const std::optional<AgentId>& wanted) const;
    bool withinWorkHours(const world::JobInfo& job) const;
    std::optional<int> costOf(const config::ActionConfig& def, const ActionId& actionId,
                              const std::optional<world::FacilityRef>& facility) const;

    WorldState&            world_;
    EventBus&              bus_;
    config::ActionCatalog  catalog_;
    world::FacilityMapping mapping_;
    double                 proximity_;
    TimestampMs            now_ = 0;
};

} // namespace townlife::sim

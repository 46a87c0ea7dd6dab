// src/sim/TimedActionExecutor.cpp
#include "townlife/sim/TimedActionExecutor.hpp"

#include "townlife/core/Profile.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace townlife::sim {

TimedActionExecutor::TimedActionExecutor(WorldState& world, EventBus& bus, config::ActionCatalog catalog,
                                         world::FacilityMapping mapping, double facilityProximity)
    : world_(world),
      bus_(bus),
      catalog_(std::move(catalog)),
      mapping_(std::move(mapping)),
      proximity_(facilityProximity) {}

std::optional<world::FacilityRef> TimedActionExecutor::currentFacility(const AgentId& agentId) const {
    const entt::entity e = world_.find(agentId);
    if (!world_.isCharacter(e)) return std::nullopt;

    const auto& loc = world_.registry().get<Location>(e);
    const world::WorldMap* map = world_.map(loc.mapId);
    const world::PathNode* node = map ? map->findNode(loc.nodeId) : nullptr;
    if (!node) return std::nullopt;
    return world::facilityAt(*map, *node, proximity_);
}

std::optional<AgentId> TimedActionExecutor::adjacentNpc(entt::entity e, const std::optional<AgentId>& wanted) const {
    const auto& loc = world_.registry().get<Location>(e);
    const world::WorldMap* map = world_.map(loc.mapId);
    const world::PathNode* here = map ? map->findNode(loc.nodeId) : nullptr;
    if (!here) return std::nullopt;

    for (const NpcRecord& npc : world_.npcsOn(loc.mapId)) {
        if (wanted && npc.id != *wanted) continue;
        const NodeId& at = npc.location.nodeId;
        const bool adjacent = at == loc.nodeId ||
                              std::find(here->connectedTo.begin(), here->connectedTo.end(), at) !=
                                  here->connectedTo.end();
        if (adjacent && !npc.conversation) return npc.id;
    }
    return std::nullopt;
}

// A facility's price applies only to the actions it offers.
std::optional<int> TimedActionExecutor::costOf(const config::ActionConfig& def, const ActionId& actionId,
                                               const std::optional<world::FacilityRef>& facility) const {
    if (def.cost) return def.cost;
    if (facility && mapping_.supports(facility->facility, actionId)) return facility->facility.cost;
    return std::nullopt;
}

bool TimedActionExecutor::withinWorkHours(const world::JobInfo& job) const {
    const int hour = world_.time().hour;
    if (job.workStartHour <= job.workEndHour)
        return hour >= job.workStartHour && hour < job.workEndHour;
    // Overnight shift (e.g. 22-6)
    return hour >= job.workStartHour || hour < job.workEndHour;
}

std::expected<void, std::string> TimedActionExecutor::canExecute(const AgentId& agentId, const ActionId& actionId,
                                                                 const std::optional<AgentId>& targetNpcId) const {
    const entt::entity e = world_.find(agentId);
    if (!world_.isCharacter(e)) return std::unexpected("character not found");

    if (const auto* a = world_.registry().try_get<ActionState>(e); a && !a->placeholder)
        return std::unexpected("already executing " + a->actionId);

    auto it = catalog_.find(actionId);
    if (it == catalog_.end()) return std::unexpected("unknown action " + actionId);
    const config::ActionConfig& def = it->second;
    if (def.system) return std::unexpected("system action");

    const auto facility = currentFacility(agentId);
    const auto tags = mapping_.tagsFor(actionId);
    if (!tags.empty()) {
        if (!facility) return std::unexpected("requires a facility for " + actionId);
        if (!mapping_.supports(facility->facility, actionId))
            return std::unexpected("facility " + facility->id + " does not support " + actionId);
    }

    if (def.ownerOnly && facility && facility->facility.owner && *facility->facility.owner != agentId)
        return std::unexpected("facility owned by " + *facility->facility.owner);

    const int money = world_.registry().get<Wallet>(e).money;
    const std::optional<int> cost = costOf(def, actionId, facility);
    if (cost && money < *cost)
        return std::unexpected("not enough money: " + std::to_string(money) + " < " + std::to_string(*cost));

    if (def.requiresNpc && !adjacentNpc(e, targetNpcId))
        return std::unexpected("no NPC within reach");

    if (def.requiresEmployment) {
        const auto& employment = world_.registry().get<Wallet>(e).employment;
        if (!employment) return std::unexpected("no employment");
        if (!facility || !facility->facility.job) return std::unexpected("current facility has no job");
        if (facility->facility.job->jobId != employment->jobId)
            return std::unexpected("job mismatch: " + facility->facility.job->jobId);
        if (!withinWorkHours(*facility->facility.job)) return std::unexpected("outside work hours");
    }
    return {};
}

std::vector<ActionId> TimedActionExecutor::availableActions(const AgentId& agentId) const {
    std::vector<ActionId> out;
    for (const auto& [id, def] : catalog_)
        if (!def.system && canExecute(agentId, id)) out.push_back(id);
    return out;
}

bool TimedActionExecutor::startAction(const AgentId& agentId,
                                      const ActionId& actionId,
                                      const std::optional<FacilityId>& facilityId,
                                      const std::optional<AgentId>& targetNpcId,
                                      std::optional<int> durationMinutes,
                                      const std::optional<std::string>& reason) {
    auto check = canExecute(agentId, actionId, targetNpcId);
    if (!check) {
        spdlog::info("[ActionExecutor] {} cannot start {}: {}", agentId, actionId, check.error());
        return false;
    }

    const entt::entity e = world_.find(agentId);
    auto& reg = world_.registry();
    const config::ActionConfig& def = catalog_.at(actionId);
    const auto facility = currentFacility(agentId);

    if (facilityId && facility && facility->id != *facilityId)
        spdlog::debug("[ActionExecutor] {} asked for {} but stands at {}", agentId, *facilityId, facility->id);

    const std::optional<int> cost = costOf(def, actionId, facility);
    if (cost) {
        reg.get<Wallet>(e).money -= *cost;
        spdlog::info("[ActionExecutor] {} paid {} for {}", agentId, *cost, actionId);
    }

    const int minutes = def.fixed || !def.durationRange ? def.durationMinutes : def.durationRange->clamp(durationMinutes);

    ActionState state;
    state.actionId        = actionId;
    state.startTime       = now_;
    state.targetEndTime   = now_ + static_cast<TimestampMs>(minutes) * kMsPerMinute;
    state.facilityId      = facilityId ? facilityId : (facility ? std::optional<FacilityId>(facility->id) : std::nullopt);
    state.durationMinutes = minutes;
    state.reason          = reason;

    if (def.requiresNpc) {
        if (auto npcId = adjacentNpc(e, targetNpcId)) {
            state.targetNpcId = npcId;
            reg.emplace_or_replace<Conversation>(e, Conversation{*npcId});
            reg.emplace_or_replace<Conversation>(world_.find(*npcId), Conversation{agentId});
        }
    }

    reg.emplace_or_replace<ActionState>(e, std::move(state));
    reg.get<DisplayIndicator>(e).text = def.indicator;

    spdlog::info("[ActionExecutor] {} started {} ({} min)", agentId, actionId, minutes);
    bus_.post(Event{EventKind::ActionStarted, agentId, actionId, std::nullopt, reason.value_or("")});
    return true;
}

void TimedActionExecutor::tick(TimestampMs nowMs) {
    TOWNLIFE_ZONE("ActionExecutor::tick");
    now_ = nowMs;

    std::vector<entt::entity> due;
    for (auto [e, action] : world_.registry().view<CharacterTag, ActionState>().each())
        if (!action.placeholder && nowMs >= action.targetEndTime) due.push_back(e);

    for (entt::entity e : due) complete(e);
}

void TimedActionExecutor::complete(entt::entity e) {
    auto& reg = world_.registry();
    const ActionState action = reg.get<ActionState>(e);
    const AgentId& agentId = reg.get<Identity>(e).id;

    if (auto it = catalog_.find(action.actionId); it != catalog_.end()) {
        const config::ActionConfig& def = it->second;

        if (def.fixed && !def.effects.empty()) {
            auto& needs = reg.get<Needs>(e).values;
            for (Need n : kAllNeeds)
                if (def.effects[n]) needs[n] = clamp_need(needs[n] + *def.effects[n]);
        }

        if (def.paysWage) {
            if (auto facility = currentFacility(agentId); facility && facility->facility.job) {
                const double hours = static_cast<double>(action.targetEndTime - action.startTime) /
                                     static_cast<double>(kMsPerHour);
                const int earnings = static_cast<int>(std::floor(facility->facility.job->hourlyWage * hours));
                reg.get<Wallet>(e).money += earnings;
                spdlog::info("[ActionExecutor] {} earned {} ({:.2f} h)", agentId, earnings, hours);
            }
        }
    }

    endConversation(e);
    reg.remove<ActionState>(e);
    reg.get<DisplayIndicator>(e).text.clear();

    spdlog::info("[ActionExecutor] {} completed {}", agentId, action.actionId);
    bus_.post(Event{EventKind::ActionCompleted, agentId, action.actionId, std::nullopt, {}});
}

void TimedActionExecutor::endConversation(entt::entity e) {
    auto& reg = world_.registry();
    if (const auto* c = reg.try_get<Conversation>(e)) {
        const entt::entity partner = world_.find(c->partnerId);
        if (partner != entt::null) reg.remove<Conversation>(partner);
        reg.remove<Conversation>(e);
    }
}

void TimedActionExecutor::forceCompleteAction(const AgentId& agentId) {
    const entt::entity e = world_.find(agentId);
    if (!world_.isCharacter(e) || !world_.registry().all_of<ActionState>(e)) return;

    spdlog::debug("[ActionExecutor] {} force-completed {}", agentId,
                  world_.registry().get<ActionState>(e).actionId);
    endConversation(e);
    world_.registry().remove<ActionState>(e);
    world_.registry().get<DisplayIndicator>(e).text.clear();
}

std::optional<NeedRates> TimedActionExecutor::activePerMinuteEffects(const AgentId& agentId) const {
    const entt::entity e = world_.find(agentId);
    if (!world_.isCharacter(e)) return std::nullopt;

    const auto* action = world_.registry().try_get<ActionState>(e);
    if (!action || action->placeholder) return std::nullopt;

    auto it = catalog_.find(action->actionId);
    if (it == catalog_.end() || it->second.fixed || it->second.perMinute.empty()) return std::nullopt;
    return it->second.perMinute;
}

} // namespace townlife::sim

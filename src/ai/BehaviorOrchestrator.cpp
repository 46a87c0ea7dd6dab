// src/ai/BehaviorOrchestrator.cpp
#include "townlife/ai/BehaviorOrchestrator.hpp"

#include "townlife/core/Profile.hpp"
#include "townlife/jobs/TaskPool.hpp"
#include "townlife/nav/CrossMapRouter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <type_traits>

namespace townlife::ai {

namespace {

constexpr const char* kThinking = "thinking";

bool Adjacent(const world::WorldMap& map, const NodeId& a, const NodeId& b) {
    if (a == b) return true;
    const world::PathNode* node = map.findNode(a);
    return node && std::find(node->connectedTo.begin(), node->connectedTo.end(), b) != node->connectedTo.end();
}

} // namespace

BehaviorOrchestrator::PendingGuard::~PendingGuard() {
    if (released_) return;
    auto it = owner_.pending_.find(agentId_);
    if (it != owner_.pending_.end() && it->second == ticket_) owner_.pending_.erase(it);

    // Drop our placeholder so the agent is idle again.
    const entt::entity e = owner_.world_.find(agentId_);
    if (!owner_.world_.isCharacter(e)) return;
    auto& reg = owner_.world_.registry();
    const auto* action = reg.try_get<sim::ActionState>(e);
    if (action && action->placeholder && action->ticket == ticket_) {
        reg.remove<sim::ActionState>(e);
        reg.get<sim::DisplayIndicator>(e).text.clear();
    }
}

BehaviorOrchestrator::BehaviorOrchestrator(OrchestratorDeps deps,
                                           std::shared_ptr<BehaviorDecider> decider,
                                           config::BehaviorConfig behavior,
                                           world::FacilityMapping mapping,
                                           double facilityProximity)
    : world_(deps.world),
      bus_(deps.bus),
      navigation_(deps.navigation),
      executor_(deps.executor),
      schedule_(deps.schedule),
      decay_(deps.decay),
      pool_(deps.pool),
      decider_(std::move(decider)),
      behavior_(std::move(behavior)),
      mapping_(std::move(mapping)),
      proximity_(facilityProximity),
      rng_(behavior_.seed, 0x77616e64ull) {
    using sim::EventKind;
    subscriptions_.push_back(bus_.subscribe(EventKind::ActionCompleted, [this](const sim::Event& e) { onActionCompleted(e); }));
    subscriptions_.push_back(bus_.subscribe(EventKind::NavigationCompleted, [this](const sim::Event& e) { onNavigationCompleted(e); }));
    subscriptions_.push_back(bus_.subscribe(EventKind::NeedInterrupt, [this](const sim::Event& e) { onNeedInterrupt(e); }));
    subscriptions_.push_back(bus_.subscribe(EventKind::PendingActionFailed, [this](const sim::Event& e) { onPendingActionFailed(e); }));
}

BehaviorOrchestrator::~BehaviorOrchestrator() {
    for (int id : subscriptions_) bus_.unsubscribe(id);
    // Workers hold `this` until they deliver.
    pool_.WaitAll();
}

// ---------------------------------------------------------------------------
// Launch
// ---------------------------------------------------------------------------

bool BehaviorOrchestrator::decide(const AgentId& agentId) {
    const entt::entity e = world_.find(agentId);
    if (!world_.isCharacter(e)) {
        spdlog::warn("[Behavior] decide: unknown character {}", agentId);
        return false;
    }
    if (pending_.contains(agentId)) {
        spdlog::debug("[Behavior] {} already has a decision in flight", agentId);
        return false;
    }
    if (!world_.isIdle(e)) return false;

    return launch(agentId, e, std::nullopt);
}

bool BehaviorOrchestrator::interrupt(const AgentId& agentId, Need need) {
    const auto forced = sim::ForcedActionFor(need);
    if (!forced) return false;

    const entt::entity e = world_.find(agentId);
    if (!world_.isCharacter(e) || pending_.contains(agentId) || !world_.isIdle(e)) {
        spdlog::debug("[Behavior] {} busy; {} interrupt skipped", agentId, to_string(need));
        return false;
    }

    spdlog::info("[Behavior] {} interrupted by {} -> {}", agentId, to_string(need), *forced);
    return launch(agentId, e, forced);
}

bool BehaviorOrchestrator::launch(const AgentId& agentId, entt::entity e, std::optional<ActionId> forcedAction) {
    TOWNLIFE_ZONE("Behavior::launch");
    const std::uint64_t ticket = ++nextTicket_;
    pending_[agentId] = ticket;
    PendingGuard guard(*this, agentId, ticket);

    // Snapshot before the placeholder goes in.
    BehaviorContext ctx = buildContext(e);
    std::shared_ptr<BehaviorDecider> decider = decider_;

    auto& reg = world_.registry();
    sim::ActionState placeholder;
    placeholder.actionId      = kThinking;
    placeholder.startTime     = now_;
    placeholder.targetEndTime = now_;
    placeholder.placeholder   = true;
    placeholder.ticket        = ticket;
    reg.emplace_or_replace<sim::ActionState>(e, std::move(placeholder));
    reg.get<sim::DisplayIndicator>(e).text = "...";

    pool_.Post([this, decider, ctx = std::move(ctx), agentId, ticket, forcedAction]() {
        Completion c{agentId, ticket, forcedAction, std::nullopt, {}};
        try {
            c.decision = forcedAction ? decider->decideInterruptFacility(*forcedAction, ctx)
                                      : decider->decide(ctx);
        } catch (const std::exception& ex) {
            c.error = ex.what();
        } catch (...) {
            c.error = "non-standard exception";
        }
        deliver(std::move(c));
    });

    triggers_.erase(agentId);
    guard.release();
    TOWNLIFE_PLOT("decisions in flight", static_cast<std::int64_t>(pending_.size()));
    return true;
}

void BehaviorOrchestrator::deliver(Completion c) {
    std::lock_guard lock(mailboxMutex_);
    mailbox_.push_back(std::move(c));
}

BehaviorContext BehaviorOrchestrator::buildContext(entt::entity e) const {
    BehaviorContext ctx;
    ctx.character = world_.record(e);
    ctx.time      = world_.time();

    const AgentId& id      = ctx.character.id;
    const sim::Location& loc = ctx.character.location;

    ctx.currentFacility  = executor_.currentFacility(id);
    ctx.schedule         = schedule_.scheduleFor(id);
    ctx.availableActions = executor_.availableActions(id);
    ctx.nearbyNpcs       = world_.npcsOn(loc.mapId);
    ctx.todayActions     = schedule_.historyFor(id);

    auto describe = [&](const world::WorldMap& map, int hops, std::vector<FacilityInfo>& out) {
        for (world::FacilityRef& ref : world::facilitiesOn(map)) {
            FacilityInfo info;
            info.actions = mapping_.actionsFor(ref.facility);
            info.mapHops = hops;
            if (hops == 0) {
                if (const world::Obstacle* o = map.findObstacle(ref.id))
                    info.distance = distance(loc.position, o->bounds.center());
            }
            info.ref = std::move(ref);
            out.push_back(std::move(info));
        }
    };

    if (const world::WorldMap* here = world_.map(loc.mapId)) describe(*here, 0, ctx.currentMapFacilities);

    std::vector<std::pair<MapId, int>> near;
    for (const auto& [mapId, hops] : nav::MapDistances(world_.maps(), loc.mapId, behavior_.nearbyMapHops))
        if (hops > 0) near.emplace_back(mapId, hops);
    std::sort(near.begin(), near.end(), [](const auto& a, const auto& b) {
        return a.second != b.second ? a.second < b.second : a.first < b.first;
    });

    for (const auto& [mapId, hops] : near) {
        const world::WorldMap* m = world_.map(mapId);
        if (!m) continue;
        ctx.nearbyMaps.push_back(NearbyMap{mapId, m->name(), hops});
        describe(*m, hops, ctx.nearbyFacilities);
    }
    return ctx;
}

// ---------------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------------

std::size_t BehaviorOrchestrator::drain() {
    TOWNLIFE_ZONE("Behavior::drain");
    std::vector<Completion> batch;
    {
        std::lock_guard lock(mailboxMutex_);
        batch.swap(mailbox_);
    }

    for (const Completion& c : batch) {
        try {
            resolve(c);
        } catch (const std::exception& ex) {
            spdlog::error("[Behavior] applying decision for {} failed: {}", c.agentId, ex.what());
        }
    }
    if (!batch.empty()) TOWNLIFE_PLOT("decisions in flight", static_cast<std::int64_t>(pending_.size()));
    return batch.size();
}

void BehaviorOrchestrator::resolve(const Completion& c) {
    PendingGuard guard(*this, c.agentId, c.ticket);

    const entt::entity e = world_.find(c.agentId);
    if (!world_.isCharacter(e)) return;

    auto& reg = world_.registry();
    if (const auto* a = reg.try_get<sim::ActionState>(e); a && a->placeholder && a->ticket == c.ticket) {
        reg.remove<sim::ActionState>(e);
        reg.get<sim::DisplayIndicator>(e).text.clear();
    }

    if (!c.decision) {
        spdlog::error("[Behavior] decider failed for {}: {}", c.agentId, c.error);
        scheduleDecision(c.agentId, behavior_.stuckRetryDelayMs);
        return;
    }

    // The world may have moved on while the decider was running.
    if (!world_.isIdle(e)) {
        spdlog::info("[Behavior] {} is no longer idle; discarding {} decision", c.agentId,
                     intent_name(c.decision->intent));
        bus_.post(sim::Event{sim::EventKind::DecisionDiscarded, c.agentId,
                             std::string(intent_name(c.decision->intent)), std::nullopt, {}});
        return;
    }

    if (c.decision->scheduleUpdate) schedule_.applyUpdate(c.agentId, *c.decision->scheduleUpdate);

    bus_.post(sim::Event{sim::EventKind::DecisionApplied, c.agentId,
                         std::string(intent_name(c.decision->intent)), std::nullopt, {}});

    const bool forced = c.forcedAction.has_value();
    std::visit(
        [&](const auto& d) {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, IdleDecision>) {
                applyIdle(c.agentId, e, d, forced);
            } else if constexpr (std::is_same_v<T, MoveDecision>) {
                applyMove(c.agentId, e, d);
            } else {
                ActionDecision action = d;
                if (forced && action.actionId != *c.forcedAction) {
                    spdlog::warn("[Behavior] {}: decider chose {} for a forced {}; keeping {}", c.agentId,
                                 action.actionId, *c.forcedAction, *c.forcedAction);
                    action.actionId = *c.forcedAction;
                }
                applyAction(c.agentId, e, std::move(action), forced);
            }
        },
        c.decision->intent);
}

void BehaviorOrchestrator::applyIdle(const AgentId& agentId, entt::entity e, const IdleDecision& d, bool forced) {
    world_.registry().get<sim::DisplayIndicator>(e).text = d.reason;
    schedule_.recordAction(agentId, "idle", std::nullopt, std::nullopt, d.reason);
    scheduleDecision(agentId, forced ? behavior_.stuckRetryDelayMs : behavior_.idleRetryDelayMs);
}

void BehaviorOrchestrator::applyMove(const AgentId& agentId, entt::entity e, const MoveDecision& d) {
    if (!d.targetMapId && !d.targetNodeId) {
        spdlog::info("[Behavior] {}: move without a target", agentId);
        scheduleDecision(agentId, behavior_.moveRetryDelayMs);
        return;
    }

    const MapId current = world_.registry().get<sim::Location>(e).mapId;
    const MapId mapId   = d.targetMapId.value_or(current);
    const world::WorldMap* map = world_.map(mapId);
    if (!map) {
        spdlog::info("[Behavior] {}: move to unknown map {}", agentId, mapId);
        scheduleDecision(agentId, behavior_.moveRetryDelayMs);
        return;
    }
    const NodeId nodeId = d.targetNodeId.value_or(map->spawnNodeId());

    const bool ok = mapId != current ? navigation_.navigateToMap(agentId, mapId, nodeId)
                                     : navigation_.navigateToNode(agentId, nodeId);
    if (!ok) {
        scheduleDecision(agentId, behavior_.moveRetryDelayMs);
        return;
    }

    schedule_.recordAction(agentId, "move", mapId, std::nullopt, d.reason);
    // Already there: no NavigationCompleted will follow.
    if (!world_.isNavigating(e)) scheduleDecision(agentId, behavior_.moveRetryDelayMs);
}

void BehaviorOrchestrator::applyAction(const AgentId& agentId, entt::entity e, ActionDecision d, bool forced) {
    bool ok = false;
    if (d.targetNpcId) {
        ok = approachNpc(agentId, e, d);
    } else if (d.targetFacilityId) {
        ok = approachFacility(agentId, e, d);
    } else if (forced) {
        const auto here = executor_.currentFacility(agentId);
        if (!mapping_.tagsFor(d.actionId).empty() && (!here || !mapping_.supports(here->facility, d.actionId))) {
            fallbackToSafeMap(agentId, e, d.actionId);
            return;
        }
        ok = startNow(agentId, d);
    } else {
        ok = startNow(agentId, d);
    }

    if (!ok) scheduleDecision(agentId, behavior_.retryDelayMs);
}

bool BehaviorOrchestrator::startNow(const AgentId& agentId, const ActionDecision& d) {
    if (!executor_.startAction(agentId, d.actionId, d.targetFacilityId, d.targetNpcId, d.durationMinutes, d.reason))
        return false;

    const auto target = d.targetFacilityId ? d.targetFacilityId : d.targetNpcId;
    schedule_.recordAction(agentId, d.actionId, target, d.durationMinutes, d.reason);
    return true;
}

bool BehaviorOrchestrator::approachNpc(const AgentId& agentId, entt::entity e, const ActionDecision& d) {
    const auto npc = world_.npc(*d.targetNpcId);
    const auto& loc = world_.registry().get<sim::Location>(e);
    if (!npc || npc->location.mapId != loc.mapId) {
        spdlog::info("[Behavior] {}: NPC {} is not on {}", agentId, *d.targetNpcId, loc.mapId);
        return false;
    }

    const world::WorldMap* map = world_.map(loc.mapId);
    if (!map) return false;
    if (Adjacent(*map, loc.nodeId, npc->location.nodeId)) return startNow(agentId, d);

    const world::PathNode* npcNode = map->findNode(npc->location.nodeId);
    if (!npcNode) return false;

    const world::NodeSet& blocked = world_.blockedNodes(loc.mapId);
    auto& reg = world_.registry();
    for (const NodeId& neighbor : npcNode->connectedTo) {
        const world::PathNode* n = map->findNode(neighbor);
        if (!n || n->isEntrance() || blocked.contains(neighbor)) continue;

        reg.emplace_or_replace<sim::PendingAction>(
            e, sim::PendingAction{d.actionId, std::nullopt, d.targetNpcId, loc.mapId,
                                  d.reason, d.durationMinutes});
        if (navigation_.navigateToNode(agentId, neighbor)) {
            spdlog::info("[Behavior] {} walking to {} to {}", agentId, *d.targetNpcId, d.actionId);
            return true;
        }
        reg.remove<sim::PendingAction>(e);
    }
    spdlog::info("[Behavior] {}: no free spot next to {}", agentId, *d.targetNpcId);
    return false;
}

bool BehaviorOrchestrator::approachFacility(const AgentId& agentId, entt::entity e, const ActionDecision& d) {
    const auto& loc = world_.registry().get<sim::Location>(e);

    // Current map first, then the rest in id order.
    std::vector<const world::WorldMap*> order;
    if (const world::WorldMap* here = world_.map(loc.mapId)) order.push_back(here);
    std::vector<MapId> others;
    for (const auto& [id, m] : world_.maps())
        if (id != loc.mapId) others.push_back(id);
    std::sort(others.begin(), others.end());
    for (const MapId& id : others) order.push_back(world_.map(id));

    const world::WorldMap* map = nullptr;
    const world::Obstacle* obstacle = nullptr;
    for (const world::WorldMap* m : order) {
        if (const world::Obstacle* o = m->findObstacle(*d.targetFacilityId); o && o->facility) {
            map = m;
            obstacle = o;
            break;
        }
    }
    if (!obstacle) {
        spdlog::info("[Behavior] {}: unknown facility {}", agentId, *d.targetFacilityId);
        return false;
    }

    if (map->id() == loc.mapId) {
        if (auto here = executor_.currentFacility(agentId); here && here->id == obstacle->id)
            return startNow(agentId, d);
    }

    const auto node = world::approachNode(*map, *obstacle, proximity_, world_.blockedNodes(map->id()));
    if (!node) {
        spdlog::info("[Behavior] {}: no free node at {}", agentId, obstacle->id);
        return false;
    }

    auto& reg = world_.registry();
    reg.emplace_or_replace<sim::PendingAction>(
        e, sim::PendingAction{d.actionId, d.targetFacilityId, std::nullopt, map->id(), d.reason, d.durationMinutes});

    const bool ok = map->id() == loc.mapId ? navigation_.navigateToNode(agentId, *node)
                                           : navigation_.navigateToMap(agentId, map->id(), *node);
    if (!ok) {
        reg.remove<sim::PendingAction>(e);
        return false;
    }
    spdlog::info("[Behavior] {} heading to {} ({}) for {}", agentId, obstacle->id, map->id(), d.actionId);
    return true;
}

void BehaviorOrchestrator::fallbackToSafeMap(const AgentId& agentId, entt::entity e, const ActionId& action) {
    const MapId& current = world_.registry().get<sim::Location>(e).mapId;
    if (behavior_.safeMapId && *behavior_.safeMapId != current) {
        if (const world::WorldMap* safe = world_.map(*behavior_.safeMapId)) {
            spdlog::info("[Behavior] {}: nowhere to {}; heading to {}", agentId, action, safe->id());
            if (navigation_.navigateToMap(agentId, safe->id(), safe->spawnNodeId())) {
                schedule_.recordAction(agentId, "move", safe->id(), std::nullopt, "no facility for " + action);
                return;
            }
        }
    }
    applyIdle(agentId, e, IdleDecision{"nowhere to " + action}, true);
}

// ---------------------------------------------------------------------------
// Pending actions, timers, wandering
// ---------------------------------------------------------------------------

void BehaviorOrchestrator::resolvePendingActions() {
    TOWNLIFE_ZONE("Behavior::resolvePending");
    auto& reg = world_.registry();
    settledOnArrival_.clear();

    for (const AgentId& id : world_.characterIds()) {
        const entt::entity e = world_.find(id);
        const auto* p = reg.try_get<sim::PendingAction>(e);
        if (!p || world_.isNavigating(e)) continue;

        const sim::PendingAction pending = *p;
        reg.remove<sim::PendingAction>(e);
        settledOnArrival_.insert(id);

        const ActionDecision d{pending.actionId, pending.facilityId, pending.targetNpcId, pending.durationMinutes,
                               pending.reason.value_or("")};
        if (!startNow(id, d)) {
            spdlog::info("[Behavior] {}: pending {} could not start on arrival", id, pending.actionId);
            bus_.post(sim::Event{sim::EventKind::PendingActionFailed, id, pending.actionId, std::nullopt, {}});
        }
    }
}

void BehaviorOrchestrator::scheduleDecision(const AgentId& agentId, int delayMs) {
    const TimestampMs due = now_ + delayMs;
    auto [it, inserted] = triggers_.try_emplace(agentId, due);
    if (!inserted && due < it->second) it->second = due;
}

void BehaviorOrchestrator::fireDueTriggers() {
    std::vector<AgentId> due;
    for (const AgentId& id : world_.characterIds()) {
        auto it = triggers_.find(id);
        if (it != triggers_.end() && it->second <= now_) {
            due.push_back(id);
            triggers_.erase(it);
        }
    }
    for (const AgentId& id : due) decide(id);
}

bool BehaviorOrchestrator::wander(const AgentId& agentId) {
    const entt::entity e = world_.find(agentId);
    if (!world_.isCharacter(e)) return false;
    const MapId current = world_.registry().get<sim::Location>(e).mapId;

    std::vector<MapId> candidates;
    for (const auto& [mapId, hops] : nav::MapDistances(world_.maps(), current, behavior_.wanderMaxHops))
        if (hops > 0) candidates.push_back(mapId);
    if (candidates.empty()) return false;
    std::sort(candidates.begin(), candidates.end());

    const MapId& target = candidates[rng_.next_bounded(static_cast<std::uint32_t>(candidates.size()))];
    const world::WorldMap* map = world_.map(target);
    if (!map) return false;

    const world::NodeSet& blocked = world_.blockedNodes(target);
    std::vector<NodeId> nodes;
    for (const world::PathNode& n : map->nodes())
        if (!n.isEntrance() && !blocked.contains(n.id)) nodes.push_back(n.id);
    if (nodes.empty()) return false;

    const NodeId& node = nodes[rng_.next_bounded(static_cast<std::uint32_t>(nodes.size()))];
    if (!navigation_.navigateToMap(agentId, target, node)) return false;

    spdlog::info("[Behavior] {} wandering to {}:{}", agentId, target, node);
    schedule_.recordAction(agentId, "move", target, std::nullopt, "wandering");
    return true;
}

void BehaviorOrchestrator::waitIdle() { pool_.WaitAll(); }

void BehaviorOrchestrator::reset() {
    pool_.WaitAll();
    {
        std::lock_guard lock(mailboxMutex_);
        mailbox_.clear();
    }
    pending_.clear();
    triggers_.clear();
    settledOnArrival_.clear();
}

void BehaviorOrchestrator::triggerInitialDecisions() {
    std::size_t started = 0;
    for (const AgentId& id : world_.characterIds())
        if (decide(id)) ++started;
    spdlog::info("[Behavior] initial decisions requested for {} character(s)", started);
}

// ---------------------------------------------------------------------------
// Event wiring
// ---------------------------------------------------------------------------

void BehaviorOrchestrator::onActionCompleted(const sim::Event& ev) {
    const entt::entity e = world_.find(ev.agentId);
    if (!world_.isCharacter(e)) return;

    auto& counter = world_.registry().get<sim::ActionCounter>(e);
    ++counter.completed;

    if (behavior_.wanderEveryNActions > 0 && counter.completed >= behavior_.wanderEveryNActions &&
        !decay_.hasLowNeed(world_.registry().get<sim::Needs>(e).values)) {
        counter.completed = 0;
        if (world_.isIdle(e) && !pending_.contains(ev.agentId) && wander(ev.agentId)) return;
    }
    decide(ev.agentId);
}

void BehaviorOrchestrator::onNavigationCompleted(const sim::Event& ev) {
    const entt::entity e = world_.find(ev.agentId);
    if (!world_.isCharacter(e) || world_.registry().all_of<sim::PendingAction>(e)) return;
    if (settledOnArrival_.contains(ev.agentId)) return;
    decide(ev.agentId);
}

void BehaviorOrchestrator::onNeedInterrupt(const sim::Event& ev) {
    if (!ev.need) return;
    interrupt(ev.agentId, *ev.need);
}

void BehaviorOrchestrator::onPendingActionFailed(const sim::Event& ev) {
    scheduleDecision(ev.agentId, behavior_.retryDelayMs);
}

} // namespace townlife::ai

// src/sim/NavigationSystem.cpp
#include "townlife/sim/NavigationSystem.hpp"

#include "townlife/core/Profile.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace townlife::sim {

NavigationSystem::NavigationSystem(WorldState& world, EventBus& bus, const config::MovementConfig& movement)
    : world_(world), bus_(bus), movement_(movement) {}

const AgentId& NavigationSystem::idOf(entt::entity e) const {
    return world_.registry().get<Identity>(e).id;
}

bool NavigationSystem::navigateToNode(const AgentId& agentId, const NodeId& targetNodeId) {
    const entt::entity e = world_.find(agentId);
    if (!world_.isCharacter(e)) {
        spdlog::warn("[Navigation] unknown character {}", agentId);
        return false;
    }
    if (world_.isNavigating(e)) {
        spdlog::debug("[Navigation] {} is already navigating", agentId);
        return false;
    }

    const auto& loc = world_.registry().get<Location>(e);
    const world::WorldMap* map = world_.map(loc.mapId);
    if (!map) {
        spdlog::warn("[Navigation] {} is on unknown map {}", agentId, loc.mapId);
        return false;
    }
    if (!map->findNode(targetNodeId)) {
        spdlog::warn("[Navigation] {}: unknown node {} on {}", agentId, targetNodeId, loc.mapId);
        return false;
    }

    const nav::NodePath path = nav::FindPath(*map, loc.nodeId, targetNodeId, world_.blockedNodes(loc.mapId));
    if (path.empty()) {
        spdlog::info("[Navigation] {}: no path {} -> {} on {}", agentId, loc.nodeId, targetNodeId, loc.mapId);
        return false;
    }
    if (path.size() == 1) return true;

    return startPath(e, path, *map);
}

bool NavigationSystem::navigateToMap(const AgentId& agentId, const MapId& targetMapId, const NodeId& targetNodeId) {
    const entt::entity e = world_.find(agentId);
    if (!world_.isCharacter(e)) {
        spdlog::warn("[Navigation] unknown character {}", agentId);
        return false;
    }
    if (world_.isNavigating(e)) {
        spdlog::debug("[Navigation] {} is already navigating", agentId);
        return false;
    }

    const auto& loc = world_.registry().get<Location>(e);
    if (targetMapId == loc.mapId) return navigateToNode(agentId, targetNodeId);

    auto route = nav::PlanRoute(world_.maps(), loc.mapId, loc.nodeId, targetMapId, targetNodeId,
                                world_.blockedByMap());
    if (!route || route->segments.empty()) {
        spdlog::info("[CrossMap] {}: could not find route to {}:{}", agentId, targetMapId, targetNodeId);
        return false;
    }

    spdlog::info("[CrossMap] {}: {} segment(s) to {}:{}", agentId, route->segments.size(), targetMapId,
                 targetNodeId);
    world_.registry().emplace_or_replace<CrossMapNavigation>(
        e, CrossMapNavigation{true, std::move(*route), 0, targetMapId, targetNodeId});
    startSegment(e);

    if (world_.isNavigating(e)) navigatingLastTick_.insert(agentId);
    return true;
}

void NavigationSystem::cancel(const AgentId& agentId) {
    const entt::entity e = world_.find(agentId);
    if (!world_.isCharacter(e)) return;

    auto& reg = world_.registry();
    reg.replace<Navigation>(e);
    if (reg.all_of<Transition>(e)) world_.transition().active = false;
    reg.remove<CrossMapNavigation, Transition>(e);
    navigatingLastTick_.erase(agentId);
}

bool NavigationSystem::startPath(entt::entity e, const nav::NodePath& path, const world::WorldMap& map) {
    const world::PathNode* first = path.size() > 1 ? map.findNode(path[1]) : nullptr;
    if (!first) return false;

    auto& loc = world_.registry().get<Location>(e);
    const Vec2 from = loc.position;
    const Vec2 to   = first->position();

    world_.registry().replace<Navigation>(e, Navigation{true, path, 0, 0.0, from, to});
    loc.direction = facing(from, to);
    navigatingLastTick_.insert(idOf(e));

    bus_.post(Event{EventKind::NavigationStarted, idOf(e), path.back(), std::nullopt, map.id()});
    return true;
}

void NavigationSystem::startSegment(entt::entity e) {
    auto& reg   = world_.registry();
    auto& cross = reg.get<CrossMapNavigation>(e);
    if (cross.currentSegmentIndex >= cross.route.segments.size()) {
        completeCrossMap(e);
        return;
    }

    const nav::RouteSegment& seg = cross.route.segments[cross.currentSegmentIndex];
    const world::WorldMap* map = world_.map(seg.mapId);
    if (!map || seg.path.empty()) {
        spdlog::warn("[CrossMap] {}: broken segment on {}", idOf(e), seg.mapId);
        completeCrossMap(e);
        return;
    }

    if (seg.path.size() < 2) {
        // Already standing on this segment's exit.
        const world::PathNode* node = map->findNode(seg.path.front());
        if (nav::HasMoreSegments(cross.route, cross.currentSegmentIndex) && node && node->isEntrance() &&
            node->leadsTo) {
            ++cross.currentSegmentIndex;
            startTransition(e, *node);
        } else {
            completeCrossMap(e);
        }
        return;
    }

    if (!startPath(e, seg.path, *map)) {
        spdlog::warn("[CrossMap] {}: could not start segment on {}", idOf(e), seg.mapId);
        completeCrossMap(e);
    }
}

void NavigationSystem::completeCrossMap(entt::entity e) {
    world_.registry().remove<CrossMapNavigation>(e);
}

void NavigationSystem::updateMovement(entt::entity e, double dt) {
    auto& nav = world_.registry().get<Navigation>(e);
    auto& loc = world_.registry().get<Location>(e);
    if (!nav.startPosition || !nav.targetPosition) {
        world_.registry().replace<Navigation>(e);
        return;
    }

    const double dist = distance(*nav.startPosition, *nav.targetPosition);
    const double newProgress =
        (dist <= 0.0 || movement_.speed <= 0.0) ? 1.0 : std::min(1.0, nav.progress + dt / (dist / movement_.speed));
    const Vec2 newPosition = lerp(*nav.startPosition, *nav.targetPosition, newProgress);
    loc.position = newPosition;

    if (newProgress < 1.0) {
        nav.progress = newProgress;
        return;
    }

    const std::size_t nextIndex = nav.currentPathIndex + 1;
    if (nextIndex + 1 >= nav.path.size())
        arriveAtDestination(e);
    else
        continueToNextNode(e, nextIndex, newPosition);
}

void NavigationSystem::continueToNextNode(entt::entity e, std::size_t nextIndex, Vec2 position) {
    auto& nav = world_.registry().get<Navigation>(e);
    auto& loc = world_.registry().get<Location>(e);

    const world::WorldMap* map = world_.map(loc.mapId);
    const world::PathNode* next = map ? map->findNode(nav.path[nextIndex + 1]) : nullptr;
    if (!next) {
        spdlog::warn("[Navigation] {}: path node {} vanished; stopping", idOf(e), nav.path[nextIndex + 1]);
        world_.registry().replace<Navigation>(e);
        world_.registry().remove<CrossMapNavigation>(e);
        return;
    }

    loc.nodeId   = nav.path[nextIndex];
    loc.position = position;

    nav.currentPathIndex = nextIndex;
    nav.progress         = 0.0;
    nav.startPosition    = position;
    nav.targetPosition   = next->position();
    loc.direction        = facing(position, next->position());
}

void NavigationSystem::arriveAtDestination(entt::entity e) {
    auto& reg = world_.registry();
    const Navigation nav = reg.get<Navigation>(e);
    auto& loc = reg.get<Location>(e);

    const NodeId finalNodeId = nav.path.back();
    const world::WorldMap* map = world_.map(loc.mapId);
    const world::PathNode* finalNode = map ? map->findNode(finalNodeId) : nullptr;

    loc.position  = *nav.targetPosition;
    loc.direction = facing(*nav.startPosition, *nav.targetPosition);
    loc.nodeId    = finalNodeId;
    reg.replace<Navigation>(e);

    if (auto* cross = reg.try_get<CrossMapNavigation>(e); cross && cross->isActive) {
        if (finalNode && finalNode->isEntrance() && finalNode->leadsTo &&
            nav::HasMoreSegments(cross->route, cross->currentSegmentIndex)) {
            spdlog::debug("[CrossMap] {} completed segment {}, transitioning", idOf(e), cross->currentSegmentIndex);
            ++cross->currentSegmentIndex;
            startTransition(e, *finalNode);
            return;
        }
        spdlog::info("[CrossMap] {} reached final destination {}:{}", idOf(e), loc.mapId, finalNodeId);
        completeCrossMap(e);
        return;
    }

    if (finalNode && finalNode->isEntrance() && finalNode->leadsTo)
        startTransition(e, *finalNode);
}

void NavigationSystem::startTransition(entt::entity e, const world::PathNode& entrance) {
    if (!entrance.leadsTo) return;

    const world::WorldMap* target = world_.map(entrance.leadsTo->mapId);
    const world::PathNode* node   = target ? target->findNode(entrance.leadsTo->nodeId) : nullptr;
    if (!node) {
        spdlog::warn("[Transition] {}: entrance {} leads nowhere", idOf(e), entrance.id);
        completeCrossMap(e);
        return;
    }

    const MapId& from = world_.registry().get<Location>(e).mapId;
    spdlog::info("[Transition] {}: {} -> {}", idOf(e), from, target->id());

    world_.registry().emplace_or_replace<Transition>(
        e, Transition{TransitionPhase::FadeOut, 0.0, from, target->id(), node->id, node->position()});
    world_.transition() = TransitionIndicator{true, from, target->id(), 0.0};
    navigatingLastTick_.insert(idOf(e));

    bus_.post(Event{EventKind::MapTransition, idOf(e), target->id(), std::nullopt, from});
}

void NavigationSystem::updateTransition(entt::entity e, double dt) {
    auto& reg = world_.registry();
    auto& t = reg.get<Transition>(e);

    const double fadeSpeed = movement_.transitionSeconds > 0.0 ? 1.0 / movement_.transitionSeconds : 1e9;
    t.progress += dt * fadeSpeed;

    if (t.phase == TransitionPhase::FadeOut) {
        world_.transition().progress = std::min(1.0, t.progress);
        if (t.progress >= 1.0) {
            world_.setCharacterMap(e, t.targetMapId, t.targetNodeId, t.targetPosition);
            t.phase = TransitionPhase::FadeIn;
            t.progress = 0.0;
        }
        return;
    }

    world_.transition().progress = std::max(0.0, 1.0 - t.progress);
    if (t.progress < 1.0) return;

    reg.remove<Transition>(e);
    world_.transition().active = false;

    if (auto* cross = reg.try_get<CrossMapNavigation>(e); cross && cross->isActive)
        startSegment(e);
}

void NavigationSystem::tick(double dtSeconds) {
    TOWNLIFE_ZONE("Navigation::tick");

    auto& reg = world_.registry();
    auto view = reg.view<CharacterTag>();
    const std::vector<entt::entity> agents(view.begin(), view.end());

    for (entt::entity e : agents) {
        if (reg.all_of<Transition>(e)) {
            updateTransition(e, dtSeconds);
            continue;
        }
        if (reg.get<Navigation>(e).isMoving) updateMovement(e, dtSeconds);
    }

    std::unordered_set<AgentId> navigatingNow;
    for (entt::entity e : agents)
        if (world_.isNavigating(e)) navigatingNow.insert(idOf(e));

    for (const AgentId& id : world_.characterIds()) {
        if (!navigatingLastTick_.contains(id) || navigatingNow.contains(id)) continue;
        const auto& loc = reg.get<Location>(world_.find(id));
        spdlog::debug("[Navigation] {} finished at {}:{}", id, loc.mapId, loc.nodeId);
        bus_.post(Event{EventKind::NavigationCompleted, id, loc.nodeId, std::nullopt, loc.mapId});
    }
    navigatingLastTick_ = std::move(navigatingNow);
}

} // namespace townlife::sim

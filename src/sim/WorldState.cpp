// src/sim/WorldState.cpp
#include "townlife/sim/WorldState.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace townlife::sim {

void WorldState::initialize(world::MapCatalog maps) {
    world::validateMaps(maps);

    registry_.clear();
    byId_.clear();
    characterOrder_.clear();
    npcOrder_.clear();
    blocked_.clear();

    maps_ = std::move(maps);
    if (currentMapId_.empty() && !maps_.empty())
        currentMapId_ = maps_.begin()->first;

    spdlog::info("[WorldState] initialized with {} maps", maps_.size());
}

const world::WorldMap* WorldState::map(const MapId& id) const {
    auto it = maps_.find(id);
    return it == maps_.end() ? nullptr : &it->second;
}

entt::entity WorldState::addCharacter(const CharacterSeed& seed) {
    if (byId_.contains(seed.id))
        throw std::invalid_argument("duplicate agent id '" + seed.id + "'");

    const world::WorldMap* m = map(seed.mapId);
    if (!m) throw std::invalid_argument("character '" + seed.id + "': unknown map '" + seed.mapId + "'");

    const NodeId nodeId = seed.nodeId.value_or(m->spawnNodeId());
    const world::PathNode* node = m->findNode(nodeId);
    if (!node) throw std::invalid_argument("character '" + seed.id + "': unknown node '" + nodeId + "'");

    const entt::entity e = registry_.create();
    registry_.emplace<CharacterTag>(e);
    registry_.emplace<Identity>(e, seed.id, seed.name);
    registry_.emplace<Needs>(e, Needs{NeedValues{
        clamp_need(seed.needs.satiety), clamp_need(seed.needs.energy), clamp_need(seed.needs.hygiene),
        clamp_need(seed.needs.mood), clamp_need(seed.needs.bladder)}});
    registry_.emplace<Wallet>(e, seed.money, seed.employment);
    registry_.emplace<Location>(e, seed.mapId, nodeId, node->position(), Direction::Down);
    registry_.emplace<Navigation>(e);
    registry_.emplace<ActionCounter>(e);
    registry_.emplace<DisplayIndicator>(e);

    byId_.emplace(seed.id, e);
    characterOrder_.push_back(seed.id);
    return e;
}

entt::entity WorldState::addNpc(const NpcSeed& seed) {
    if (byId_.contains(seed.id))
        throw std::invalid_argument("duplicate agent id '" + seed.id + "'");

    const world::WorldMap* m = map(seed.mapId);
    if (!m) throw std::invalid_argument("npc '" + seed.id + "': unknown map '" + seed.mapId + "'");
    const world::PathNode* node = m->findNode(seed.nodeId);
    if (!node) throw std::invalid_argument("npc '" + seed.id + "': unknown node '" + seed.nodeId + "'");

    const entt::entity e = registry_.create();
    registry_.emplace<NpcTag>(e);
    registry_.emplace<Identity>(e, seed.id, seed.name);
    registry_.emplace<Location>(e, seed.mapId, seed.nodeId, node->position(), seed.direction);

    byId_.emplace(seed.id, e);
    npcOrder_.push_back(seed.id);
    blocked_[seed.mapId].insert(seed.nodeId);
    return e;
}

entt::entity WorldState::find(const AgentId& id) const {
    auto it = byId_.find(id);
    return it == byId_.end() ? static_cast<entt::entity>(entt::null) : it->second;
}

bool WorldState::isCharacter(entt::entity e) const {
    return registry_.valid(e) && registry_.all_of<CharacterTag>(e);
}

const world::NodeSet& WorldState::blockedNodes(const MapId& mapId) const {
    static const world::NodeSet kNone;
    auto it = blocked_.find(mapId);
    return it == blocked_.end() ? kNone : it->second;
}

CharacterRecord WorldState::record(entt::entity e) const {
    CharacterRecord rec;
    const auto& ident = registry_.get<Identity>(e);
    rec.id = ident.id;
    rec.name = ident.name;
    rec.needs = registry_.get<Needs>(e).values;
    const auto& wallet = registry_.get<Wallet>(e);
    rec.money = wallet.money;
    rec.employment = wallet.employment;
    rec.location = registry_.get<Location>(e);
    rec.navigation = registry_.get<Navigation>(e);
    if (auto* c = registry_.try_get<CrossMapNavigation>(e)) rec.crossMapNavigation = *c;
    if (auto* t = registry_.try_get<Transition>(e)) rec.transition = *t;
    if (auto* a = registry_.try_get<ActionState>(e)) rec.currentAction = *a;
    if (auto* p = registry_.try_get<PendingAction>(e)) rec.pendingAction = *p;
    if (auto* c = registry_.try_get<Conversation>(e)) rec.conversation = *c;
    rec.actionCounter = registry_.get<ActionCounter>(e).completed;
    rec.indicator = registry_.get<DisplayIndicator>(e).text;
    return rec;
}

std::optional<CharacterRecord> WorldState::character(const AgentId& id) const {
    const entt::entity e = find(id);
    if (!isCharacter(e)) return std::nullopt;
    return record(e);
}

std::optional<NpcRecord> WorldState::npc(const AgentId& id) const {
    const entt::entity e = find(id);
    if (e == entt::null || !registry_.all_of<NpcTag>(e)) return std::nullopt;

    NpcRecord rec{registry_.get<Identity>(e).id, registry_.get<Identity>(e).name,
                  registry_.get<Location>(e), std::nullopt};
    if (auto* c = registry_.try_get<Conversation>(e)) rec.conversation = *c;
    return rec;
}

std::vector<NpcRecord> WorldState::npcsOn(const MapId& mapId) const {
    std::vector<NpcRecord> out;
    for (const AgentId& id : npcOrder_) {
        auto rec = npc(id);
        if (rec && rec->location.mapId == mapId) out.push_back(std::move(*rec));
    }
    return out;
}

bool WorldState::isNavigating(entt::entity e) const {
    if (registry_.get<Navigation>(e).isMoving) return true;
    if (registry_.all_of<Transition>(e)) return true;
    const auto* cross = registry_.try_get<CrossMapNavigation>(e);
    return cross && cross->isActive;
}

bool WorldState::isIdle(entt::entity e) const {
    if (!isCharacter(e)) return false;
    if (registry_.all_of<ActionState>(e)) return false;
    if (registry_.all_of<Conversation>(e)) return false;
    // An action waiting for arrival still owns the agent.
    if (registry_.all_of<PendingAction>(e)) return false;
    return !isNavigating(e);
}

void WorldState::setCharacterMap(entt::entity e, const MapId& mapId, const NodeId& nodeId, Vec2 position) {
    auto& loc = registry_.get<Location>(e);
    spdlog::debug("[WorldState] {} moved {} -> {}:{}", registry_.get<Identity>(e).id, loc.mapId, mapId, nodeId);
    loc.mapId = mapId;
    loc.nodeId = nodeId;
    loc.position = position;
}

bool WorldState::restoreCharacter(const CharacterRecord& rec) {
    const entt::entity e = find(rec.id);
    if (!isCharacter(e)) {
        spdlog::warn("[WorldState] restore skipped unknown character {}", rec.id);
        return false;
    }
    const world::WorldMap* m = map(rec.location.mapId);
    const world::PathNode* node = m ? m->findNode(rec.location.nodeId) : nullptr;
    if (!node) {
        spdlog::warn("[WorldState] restore of {} points at missing {}:{}", rec.id, rec.location.mapId,
                     rec.location.nodeId);
        return false;
    }

    auto& needs = registry_.get<Needs>(e).values;
    for (Need n : kAllNeeds) needs[n] = clamp_need(rec.needs[n]);

    auto& wallet = registry_.get<Wallet>(e);
    wallet.money = rec.money;
    if (rec.employment) wallet.employment = rec.employment;

    auto& loc = registry_.get<Location>(e);
    loc = Location{rec.location.mapId, rec.location.nodeId, node->position(), rec.location.direction};

    registry_.replace<Navigation>(e);
    registry_.remove<CrossMapNavigation, Transition, ActionState, PendingAction, Conversation>(e);
    registry_.get<ActionCounter>(e).completed = rec.actionCounter;
    registry_.get<DisplayIndicator>(e).text.clear();
    return true;
}

} // namespace townlife::sim

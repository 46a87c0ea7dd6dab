// src/sim/SimulationEngine.cpp
#include "townlife/sim/SimulationEngine.hpp"

#include "townlife/ai/RuleBasedDecider.hpp"
#include "townlife/core/Profile.hpp"
#include "townlife/sim/TimedActionExecutor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

namespace townlife::sim {

using json = nlohmann::json;

namespace {

// Clamp long stalls (debugger, suspended host) so agents do not teleport.
constexpr double kMaxTickDtSeconds = 0.25;

json NeedsJson(const NeedValues& n) {
    json j = json::object();
    for (Need k : kAllNeeds) j[std::string(to_string(k))] = n[k];
    return j;
}

json CharacterJson(const CharacterRecord& c) {
    json j{
        {"id", c.id},
        {"name", c.name},
        {"needs", NeedsJson(c.needs)},
        {"money", c.money},
        {"mapId", c.location.mapId},
        {"nodeId", c.location.nodeId},
        {"position", {{"x", c.location.position.x}, {"y", c.location.position.y}}},
        {"direction", std::string(to_string(c.location.direction))},
        {"isMoving", c.navigation.isMoving},
        {"actionCounter", c.actionCounter},
        {"indicator", c.indicator},
    };
    if (c.employment) j["jobId"] = c.employment->jobId;
    if (c.currentAction) {
        const ActionState& a = *c.currentAction;
        json action{{"actionId", a.actionId},
                    {"startTime", a.startTime},
                    {"targetEndTime", a.targetEndTime},
                    {"placeholder", a.placeholder}};
        if (a.facilityId) action["facilityId"] = *a.facilityId;
        if (a.targetNpcId) action["targetNpcId"] = *a.targetNpcId;
        if (a.durationMinutes) action["durationMinutes"] = *a.durationMinutes;
        j["currentAction"] = std::move(action);
    }
    if (c.pendingAction) {
        json pending{{"actionId", c.pendingAction->actionId}, {"facilityMapId", c.pendingAction->facilityMapId}};
        if (c.pendingAction->facilityId) pending["facilityId"] = *c.pendingAction->facilityId;
        if (c.pendingAction->targetNpcId) pending["targetNpcId"] = *c.pendingAction->targetNpcId;
        j["pendingAction"] = std::move(pending);
    }
    if (c.crossMapNavigation && c.crossMapNavigation->isActive)
        j["crossMapTarget"] = {{"mapId", c.crossMapNavigation->targetMapId},
                               {"nodeId", c.crossMapNavigation->targetNodeId}};
    if (c.conversation) j["conversationWith"] = c.conversation->partnerId;
    return j;
}

json NpcJson(const NpcRecord& n) {
    json j{
        {"id", n.id},
        {"name", n.name},
        {"mapId", n.location.mapId},
        {"nodeId", n.location.nodeId},
        {"position", {{"x", n.location.position.x}, {"y", n.location.position.y}}},
        {"direction", std::string(to_string(n.location.direction))},
        {"inConversation", n.conversation.has_value()},
    };
    return j;
}

} // namespace

TimestampMs SimulationEngine::WallNowMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

SimulationEngine::SimulationEngine(config::SimulationConfig cfg, EngineOptions opts)
    : cfg_(std::move(cfg)),
      store_(std::move(opts.store)),
      pool_(opts.workers),
      clock_(cfg_.time.timezone, cfg_.time.utcOffsetMinutes, 0) {
    const world::FacilityMapping mapping =
        cfg_.facilityTags.empty() ? world::FacilityMapping::defaults() : world::FacilityMapping(cfg_.facilityTags);

    navigation_ = std::make_unique<NavigationSystem>(world_, bus_, cfg_.movement);
    decay_      = std::make_unique<NeedDecayModel>(world_, bus_, cfg_.time, cfg_.behavior.interruptThreshold);

    if (opts.executor)
        executor_ = opts.executor(world_, bus_, cfg_);
    if (!executor_)
        executor_ = std::make_unique<TimedActionExecutor>(world_, bus_, cfg_.actions, mapping,
                                                          cfg_.movement.facilityProximity);
    decay_->setExecutor(executor_.get());

    schedule_ = std::make_unique<ScheduleBook>(world_, store_.get(), &pool_);

    decider_ = opts.decider ? std::move(opts.decider) : std::make_shared<ai::RuleBasedDecider>(cfg_.behavior);

    orchestrator_ = std::make_unique<ai::BehaviorOrchestrator>(
        ai::OrchestratorDeps{world_, bus_, *navigation_, *executor_, *schedule_, *decay_, pool_}, decider_,
        cfg_.behavior, mapping, cfg_.movement.facilityProximity);

    spdlog::info("[Engine] created: {} Hz, {} worker(s), store={}", cfg_.tickRate, pool_.Workers(),
                 store_ ? "yes" : "no");
}

SimulationEngine::~SimulationEngine() {
    stop();
    pool_.WaitAll();
}

void SimulationEngine::initialize(WorldSetup setup, std::optional<TimestampMs> serverStartMs) {
    std::lock_guard lock(mutex_);

    orchestrator_->reset();
    navigation_->reset();
    world_.initialize(std::move(setup.maps));
    for (const CharacterSeed& c : setup.characters) world_.addCharacter(c);
    for (const NpcSeed& n : setup.npcs) world_.addNpc(n);

    if (setup.currentMapId) {
        if (!world_.map(*setup.currentMapId))
            throw std::invalid_argument("unknown current map '" + *setup.currentMapId + "'");
        world_.setCurrentMapId(*setup.currentMapId);
    } else if (!world_.characterIds().empty()) {
        world_.setCurrentMapId(world_.registry().get<Location>(world_.find(world_.characterIds().front())).mapId);
    }

    for (auto& [id, entries] : setup.schedules) schedule_->setDefaultSchedule(id, std::move(entries));

    const TimestampMs start = serverStartMs.value_or(WallNowMs());
    clock_.setServerStart(start);
    world_.setTime(clock_.at(start));
    lastDay_ = world_.time().day;
    lastTickMs_.reset();
    lastSaveMs_.reset();
    decay_->clearBaseline();

    schedule_->loadCaches();

    spdlog::info("[Engine] initialized: {} character(s), {} npc(s), current map {}", world_.characterIds().size(),
                 world_.npcIds().size(), world_.currentMapId());
}

void SimulationEngine::triggerInitialDecisions() {
    std::lock_guard lock(mutex_);
    orchestrator_->triggerInitialDecisions();
}

template <typename F>
void SimulationEngine::guarded(const char* phase, F&& fn) {
    try {
        fn();
    } catch (const std::exception& ex) {
        spdlog::error("[Engine] {} failed at tick {}: {}", phase, world_.tick(), ex.what());
    } catch (...) {
        spdlog::error("[Engine] {} failed at tick {}: non-standard exception", phase, world_.tick());
    }
}

void SimulationEngine::syncClock(TimestampMs nowMs) {
    world_.setTime(clock_.at(nowMs));
}

void SimulationEngine::checkDayChange() {
    const int day = world_.time().day;
    if (lastDay_ && *lastDay_ == day) return;

    const int previous = lastDay_.value_or(day);
    lastDay_ = day;
    if (previous == day) return;

    spdlog::info("[Engine] day {} -> {}", previous, day);
    schedule_->clearCaches();
    schedule_->loadCaches();
    bus_.publish(Event{EventKind::DayChanged, {}, std::to_string(day), std::nullopt, {}});
}

void SimulationEngine::checkpoint(TimestampMs nowMs) {
    if (!store_) return;
    if (!lastSaveMs_) {
        lastSaveMs_ = nowMs;
        return;
    }
    if (nowMs - *lastSaveMs_ < cfg_.persistence.saveIntervalMs) return;
    lastSaveMs_ = nowMs;

    pool_.Post([store = store_, snap = worldSnapshot(nowMs)] {
        try {
            if (!store->saveState(snap)) spdlog::error("[Engine] checkpoint at tick {} failed", snap.tick);
        } catch (const std::exception& ex) {
            spdlog::error("[Engine] checkpoint threw: {}", ex.what());
        }
    });
}

void SimulationEngine::tick(TimestampMs nowMs) {
    json snap;
    bool notify = false;
    {
        std::lock_guard lock(mutex_);
        TOWNLIFE_ZONE("Engine::tick");

        guarded("clock", [&] { syncClock(nowMs); });

        const double dt = lastTickMs_ ? std::clamp(static_cast<double>(nowMs - *lastTickMs_) / 1000.0, 0.0,
                                                   kMaxTickDtSeconds)
                                      : 0.0;
        lastTickMs_ = nowMs;

        if (!world_.isPaused()) {
            orchestrator_->setNow(nowMs);
            guarded("decay", [&] { decay_->update(nowMs); });
            guarded("actions", [&] { executor_->tick(nowMs); });
            guarded("navigation", [&] { navigation_->tick(dt); });
            guarded("pending", [&] { orchestrator_->resolvePendingActions(); });
            guarded("decisions", [&] { orchestrator_->drain(); });
            guarded("triggers", [&] { orchestrator_->fireDueTriggers(); });
            guarded("events", [&] { bus_.dispatch(); });
            guarded("day", [&] { checkDayChange(); });
            guarded("checkpoint", [&] { checkpoint(nowMs); });
            world_.advanceTick();
        }

        const int every = std::max(1, cfg_.notifyEveryTicks);
        notify = (notifyCounter_++ % static_cast<std::uint64_t>(every)) == 0;
        if (notify) guarded("snapshot", [&] { snap = snapshot(); });
        TOWNLIFE_FRAME_MARK();
    }

    if (!notify || snap.is_null()) return;

    std::vector<std::pair<int, Subscriber>> subs;
    {
        std::lock_guard lock(subMutex_);
        subs.assign(subscribers_.begin(), subscribers_.end());
    }
    for (auto& [id, cb] : subs) {
        try {
            cb(snap);
        } catch (const std::exception& ex) {
            spdlog::error("[Engine] subscriber {} threw: {}", id, ex.what());
        } catch (...) {
            spdlog::error("[Engine] subscriber {} threw a non-standard exception", id);
        }
    }
}

void SimulationEngine::pause() {
    std::lock_guard lock(mutex_);
    if (world_.isPaused()) return;
    world_.setPaused(true);
    spdlog::info("[Engine] paused");
}

void SimulationEngine::unpause() {
    std::lock_guard lock(mutex_);
    if (!world_.isPaused()) return;
    world_.setPaused(false);
    // Paused wall time must not count as elapsed simulation time.
    decay_->clearBaseline();
    lastTickMs_.reset();
    spdlog::info("[Engine] resumed");
}

bool SimulationEngine::togglePause() {
    if (isPaused()) unpause();
    else pause();
    return isPaused();
}

bool SimulationEngine::isPaused() const {
    std::lock_guard lock(mutex_);
    return world_.isPaused();
}

int SimulationEngine::subscribe(Subscriber cb) {
    std::lock_guard lock(subMutex_);
    const int id = ++nextSub_;
    subscribers_.emplace(id, std::move(cb));
    return id;
}

void SimulationEngine::unsubscribe(int id) {
    std::lock_guard lock(subMutex_);
    subscribers_.erase(id);
}

json SimulationEngine::snapshot() const {
    json characters = json::array();
    for (const AgentId& id : world_.characterIds())
        if (auto c = world_.character(id)) characters.push_back(CharacterJson(*c));

    json npcs = json::array();
    for (const AgentId& id : world_.npcIds())
        if (auto n = world_.npc(id)) npcs.push_back(NpcJson(*n));

    const WorldTime t = world_.time();
    const TransitionIndicator& tr = world_.transition();
    return json{
        {"characters", std::move(characters)},
        {"npcs", std::move(npcs)},
        {"currentMapId", world_.currentMapId()},
        {"time", {{"hour", t.hour}, {"minute", t.minute}, {"day", t.day}}},
        {"isPaused", world_.isPaused()},
        {"transition",
         {{"active", tr.active}, {"fromMapId", tr.fromMapId}, {"toMapId", tr.toMapId}, {"progress", tr.progress}}},
        {"tick", world_.tick()},
    };
}

persist::WorldSnapshot SimulationEngine::worldSnapshot(TimestampMs nowMs) const {
    persist::WorldSnapshot snap;
    for (const AgentId& id : world_.characterIds()) {
        auto c = world_.character(id);
        if (!c) continue;
        persist::CharacterSnapshot cs;
        cs.id            = c->id;
        cs.needs         = c->needs;
        cs.money         = c->money;
        if (c->employment) cs.jobId = c->employment->jobId;
        cs.mapId         = c->location.mapId;
        cs.nodeId        = c->location.nodeId;
        cs.direction     = c->location.direction;
        cs.actionCounter = c->actionCounter;
        snap.characters.push_back(std::move(cs));
    }
    snap.currentMapId  = world_.currentMapId();
    snap.time          = world_.time();
    snap.serverStartMs = clock_.serverStartMs();
    snap.savedAtMs     = nowMs;
    snap.tick          = world_.tick();
    return snap;
}

bool SimulationEngine::restoreFromStore() {
    if (!store_) return false;
    auto snap = store_->loadState();
    if (!snap) {
        spdlog::info("[Engine] no saved state to restore");
        return false;
    }

    std::lock_guard lock(mutex_);
    orchestrator_->reset();

    std::size_t restored = 0;
    for (const persist::CharacterSnapshot& cs : snap->characters) {
        navigation_->cancel(cs.id);

        CharacterRecord rec;
        rec.id       = cs.id;
        rec.needs    = cs.needs;
        rec.money    = cs.money;
        if (cs.jobId) rec.employment = Employment{*cs.jobId};
        rec.location.mapId     = cs.mapId;
        rec.location.nodeId    = cs.nodeId;
        rec.location.direction = cs.direction;
        rec.actionCounter      = cs.actionCounter;
        if (world_.restoreCharacter(rec)) ++restored;
    }

    if (snap->serverStartMs > 0) clock_.setServerStart(snap->serverStartMs);
    if (world_.map(snap->currentMapId)) world_.setCurrentMapId(snap->currentMapId);
    if (lastTickMs_) syncClock(*lastTickMs_);
    lastDay_ = world_.time().day;
    decay_->clearBaseline();

    schedule_->clearCaches();
    schedule_->loadCaches();

    spdlog::info("[Engine] restored {} of {} character(s) from tick {}", restored, snap->characters.size(),
                 snap->tick);
    return true;
}

void SimulationEngine::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread([this] { loop(); });
    spdlog::info("[Engine] scheduler started");
}

void SimulationEngine::stop() {
    if (!running_.exchange(false)) return;
    if (thread_.joinable()) thread_.join();
    spdlog::info("[Engine] scheduler stopped");
}

void SimulationEngine::loop() {
    using clock = std::chrono::steady_clock;
    const auto period = std::chrono::milliseconds(1000 / std::max(1, cfg_.tickRate));
    auto next = clock::now();

    while (running_.load()) {
        tick(WallNowMs());
        next += period;
        const auto now = clock::now();
        // Behind by more than a period: skip ahead instead of bursting.
        if (next < now - period) next = now;
        std::this_thread::sleep_until(next);
    }
}

void SimulationEngine::shutdown() {
    stop();
    orchestrator_->waitIdle();

    if (store_) {
        persist::WorldSnapshot snap;
        {
            std::lock_guard lock(mutex_);
            snap = worldSnapshot(lastTickMs_.value_or(WallNowMs()));
        }
        if (!store_->saveState(snap)) spdlog::error("[Engine] final save failed");
        else spdlog::info("[Engine] final state saved at tick {}", snap.tick);
    }
    pool_.WaitAll();
}

} // namespace townlife::sim

#pragma once
// include/townlife/sim/SimulationEngine.hpp
//
// Owns every subsystem and drives them at a fixed rate. One instance per
// world; nothing here is global.
//
// Per tick: clock sync -> (paused: notify, stop) -> need decay -> actions ->
// navigation -> pending actions -> decisions -> delayed triggers -> event
// dispatch -> day change -> checkpoint -> tick++ -> notify.

#include "townlife/ai/BehaviorDecider.hpp"
#include "townlife/ai/BehaviorOrchestrator.hpp"
#include "townlife/core/Config.hpp"
#include "townlife/jobs/TaskPool.hpp"
#include "townlife/persist/StateStore.hpp"
#include "townlife/sim/ActionExecutor.hpp"
#include "townlife/sim/Events.hpp"
#include "townlife/sim/NavigationSystem.hpp"
#include "townlife/sim/NeedDecay.hpp"
#include "townlife/sim/ScheduleBook.hpp"
#include "townlife/sim/WorldClock.hpp"
#include "townlife/sim/WorldState.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace townlife::sim {

struct WorldSetup {
    world::MapCatalog                                       maps;
    std::vector<CharacterSeed>                              characters;
    std::vector<NpcSeed>                                    npcs;
    std::unordered_map<AgentId, std::vector<ScheduleEntry>> schedules;
    std::optional<MapId>                                    currentMapId;
};

using ExecutorFactory =
    std::function<std::unique_ptr<IActionExecutor>(WorldState&, EventBus&, const config::SimulationConfig&)>;

struct EngineOptions {
    std::shared_ptr<ai::BehaviorDecider>  decider;   // null = RuleBasedDecider
    ExecutorFactory                       executor;  // empty = TimedActionExecutor
    std::shared_ptr<persist::StateStore>  store;     // null = no persistence
    std::size_t                           workers = jobs::TaskPool::DefaultWorkers();
};

class SimulationEngine {
public:
    using Subscriber = std::function<void(const nlohmann::json& snapshot)>;

    explicit SimulationEngine(config::SimulationConfig cfg, EngineOptions opts = {});
    ~SimulationEngine();

    SimulationEngine(const SimulationEngine&) = delete;
    SimulationEngine& operator=(const SimulationEngine&) = delete;

    // Throws std::invalid_argument on invalid map or agent data.
    void initialize(WorldSetup setup, std::optional<TimestampMs> serverStartMs = std::nullopt);

    // Scheduler thread at cfg.tickRate Hz.
    void start();
    void stop();
    bool isRunning() const { return running_.load(); }

    // One deterministic step at wall time `nowMs`. Never throws.
    void tick(TimestampMs nowMs);

    void pause();
    void unpause();
    bool togglePause();
    bool isPaused() const;

    int  subscribe(Subscriber cb);
    void unsubscribe(int id);

    nlohmann::json          snapshot() const;
    persist::WorldSnapshot  worldSnapshot(TimestampMs nowMs) const;

    // Restores characters, clock anchor and current map from the store.
    bool restoreFromStore();

    // Stops the loop, waits for in-flight decisions and saves once.
    void shutdown();

    void triggerInitialDecisions();

    // Direct access for tools and tests; hold no references across start().
    WorldState&               world() { return world_; }
    EventBus&                 events() { return bus_; }
    NavigationSystem&         navigation() { return *navigation_; }
    NeedDecayModel&           needs() { return *decay_; }
    IActionExecutor&          executor() { return *executor_; }
    ScheduleBook&             schedules() { return *schedule_; }
    ai::BehaviorOrchestrator& behavior() { return *orchestrator_; }
    const WorldClock&         clock() const { return clock_; }
    const config::SimulationConfig& config() const { return cfg_; }

    static TimestampMs WallNowMs();

private:
    template <typename F>
    void guarded(const char* phase, F&& fn);

    void syncClock(TimestampMs nowMs);
    void checkDayChange();
    void checkpoint(TimestampMs nowMs);
    void loop();

    config::SimulationConfig             cfg_;
    std::shared_ptr<persist::StateStore> store_;
    jobs::TaskPool                       pool_;

    WorldState world_;
    EventBus   bus_;
    WorldClock clock_;

    std::unique_ptr<NavigationSystem>         navigation_;
    std::unique_ptr<NeedDecayModel>           decay_;
    std::unique_ptr<IActionExecutor>          executor_;
    std::unique_ptr<ScheduleBook>             schedule_;
    std::shared_ptr<ai::BehaviorDecider>      decider_;
    std::unique_ptr<ai::BehaviorOrchestrator> orchestrator_;

    // Serializes tick() against the public API.
    mutable std::mutex mutex_;

    std::optional<TimestampMs> lastTickMs_;
    std::optional<TimestampMs> lastSaveMs_;
    std::optional<int>         lastDay_;
    std::uint64_t              notifyCounter_ = 0;

    std::mutex                 subMutex_;
    std::map<int, Subscriber>  subscribers_;
    int                        nextSub_ = 0;

    std::atomic<bool> running_{false};
    std::thread       thread_;
};

} // namespace townlife::sim

// tests/test_behavior_orchestrator.cpp
#include <doctest/doctest.h>

#include "test_support/test_worlds.h"

#include "townlife/sim/SimulationEngine.hpp"
#include "townlife/sim/TimedActionExecutor.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace townlife_orchestrator_test {

using namespace townlife_test;
using namespace townlife::sim;
using townlife::ai::ActionDecision;
using townlife::ai::BehaviorContext;
using townlife::ai::BehaviorDecision;
using townlife::ai::IdleDecision;
using townlife::ai::MoveDecision;

constexpr TimestampMs kT0 = 1'704'067'200'000;   // 09:00 local on day 1

// Answers from a script; optionally waits on a gate so tests can observe the
// in-flight state.
class ScriptedDecider final : public townlife::ai::BehaviorDecider
{
public:
    std::function<BehaviorDecision(int call, const BehaviorContext&)> script;
    std::shared_future<void> gate;
    std::atomic<int> calls{0};
    std::atomic<int> interruptCalls{0};

    BehaviorDecision decide(const BehaviorContext& ctx) override
    {
        const int n = ++calls;
        if (gate.valid())
            gate.wait();
        if (script)
            return script(n, ctx);
        return BehaviorDecision{IdleDecision{"scripted idle"}, std::nullopt};
    }

    BehaviorDecision decideInterruptFacility(const ActionId& forced, const BehaviorContext&) override
    {
        ++interruptCalls;
        return BehaviorDecision{ActionDecision{forced, std::nullopt, std::nullopt, std::nullopt, "scripted"},
                                std::nullopt};
    }
};

// Delegates to the catalog executor; availableActions throws while `broken`.
class FlakyExecutor final : public IActionExecutor
{
public:
    FlakyExecutor(std::unique_ptr<IActionExecutor> inner, std::shared_ptr<std::atomic<bool>> broken)
        : inner_(std::move(inner)), broken_(std::move(broken)) {}

    bool startAction(const AgentId& agentId, const ActionId& actionId, const std::optional<FacilityId>& facilityId,
                     const std::optional<AgentId>& targetNpcId, std::optional<int> durationMinutes,
                     const std::optional<std::string>& reason) override
    {
        return inner_->startAction(agentId, actionId, facilityId, targetNpcId, durationMinutes, reason);
    }
    void tick(TimestampMs nowMs) override { inner_->tick(nowMs); }
    std::optional<NeedRates> activePerMinuteEffects(const AgentId& agentId) const override
    {
        return inner_->activePerMinuteEffects(agentId);
    }
    std::vector<ActionId> availableActions(const AgentId& agentId) const override
    {
        if (broken_->load())
            throw std::runtime_error("catalog offline");
        return inner_->availableActions(agentId);
    }
    std::optional<FacilityRef> currentFacility(const AgentId& agentId) const override
    {
        return inner_->currentFacility(agentId);
    }
    void forceCompleteAction(const AgentId& agentId) override { inner_->forceCompleteAction(agentId); }

private:
    std::unique_ptr<IActionExecutor>   inner_;
    std::shared_ptr<std::atomic<bool>> broken_;
};

struct EngineFixture
{
    std::shared_ptr<ScriptedDecider> decider = std::make_shared<ScriptedDecider>();
    config::SimulationConfig cfg = FastConfig();
    std::unique_ptr<SimulationEngine> engine;
    std::vector<Event> events;
    TimestampMs now = kT0;

    MapId startMap = "town";
    int money = 20;
    std::vector<NpcSeed> npcs;
    ExecutorFactory executorFactory;

    void boot(const NodeId& start = "t0")
    {
        EngineOptions opts;
        opts.decider = decider;
        opts.executor = executorFactory;
        opts.workers = 2;
        engine = std::make_unique<SimulationEngine>(cfg, std::move(opts));

        WorldSetup setup;
        setup.maps = MakeTownAndCafe();
        CharacterSeed aki;
        aki.id = "aki";
        aki.name = "Aki";
        aki.money = money;
        aki.mapId = startMap;
        aki.nodeId = start;
        setup.characters.push_back(aki);
        setup.npcs = npcs;
        engine->initialize(std::move(setup), kT0);
        engine->events().subscribeAll([this](const Event& e) { events.push_back(e); });
        engine->tick(now);
    }

    // Lets workers finish, then runs one tick `stepMs` later.
    void step(TimestampMs stepMs = 50)
    {
        engine->behavior().waitIdle();
        now += stepMs;
        engine->tick(now);
    }

    CharacterRecord aki() const { return *engine->world().character("aki"); }

    bool akiIdle() const { return engine->world().isIdle(engine->world().find("aki")); }

    int count(EventKind k) const
    {
        int n = 0;
        for (const Event& e : events)
            if (e.kind == k) ++n;
        return n;
    }
};

BehaviorDecision Act(ActionId action, std::optional<FacilityId> facility = std::nullopt)
{
    return BehaviorDecision{
        ActionDecision{std::move(action), std::move(facility), std::nullopt, std::nullopt, "scripted"},
        std::nullopt};
}

} // namespace townlife_orchestrator_test

using namespace townlife_orchestrator_test;

TEST_CASE("Orchestrator: one decision in flight per agent")
{
    EngineFixture f;
    std::promise<void> release;
    f.decider->gate = release.get_future().share();
    f.boot();

    CHECK(f.engine->behavior().decide("aki"));
    CHECK(f.engine->behavior().isPending("aki"));
    CHECK_FALSE(f.engine->behavior().decide("aki"));

    const CharacterRecord thinking = f.aki();
    const bool hasPlaceholder = thinking.currentAction.has_value() && thinking.currentAction->placeholder;
    const bool idleWhileThinking = f.engine->world().isIdle(f.engine->world().find("aki"));

    release.set_value();
    f.step();

    CHECK(hasPlaceholder);
    CHECK_FALSE(idleWhileThinking);
    CHECK(f.decider->calls.load() == 1);
    CHECK_FALSE(f.engine->behavior().isPending("aki"));
    CHECK_FALSE(f.aki().currentAction.has_value());
    CHECK(f.engine->behavior().hasTrigger("aki"));
    CHECK(f.count(EventKind::DecisionApplied) == 1);
}

TEST_CASE("Orchestrator: a result that arrives after the agent got busy is discarded")
{
    EngineFixture f;
    std::promise<void> release;
    f.decider->gate = release.get_future().share();
    f.decider->script = [](int, const BehaviorContext&) { return Act("eat", FacilityId{"counter"}); };
    f.boot("t1");   // inside the park

    REQUIRE(f.engine->behavior().decide("aki"));
    const bool started = f.engine->executor().startAction("aki", "rest");

    release.set_value();
    f.step();

    CHECK(started);
    CHECK(f.count(EventKind::DecisionDiscarded) == 1);
    CHECK(f.count(EventKind::DecisionApplied) == 0);
    REQUIRE(f.aki().currentAction.has_value());
    CHECK(f.aki().currentAction->actionId == "rest");
    CHECK_FALSE(f.aki().currentAction->placeholder);
    CHECK_FALSE(f.aki().pendingAction.has_value());
    CHECK_FALSE(f.engine->behavior().isPending("aki"));
}

TEST_CASE("Orchestrator: a facility on another map is reached first, then used")
{
    EngineFixture f;
    f.decider->script = [](int, const BehaviorContext&) { return Act("eat", FacilityId{"counter"}); };
    f.boot();

    REQUIRE(f.engine->behavior().decide("aki"));
    f.step();

    REQUIRE(f.aki().pendingAction.has_value());
    CHECK(f.aki().pendingAction->facilityMapId == "cafe");
    CHECK(f.aki().crossMapNavigation.has_value());

    for (int i = 0; i < 200 && !f.aki().currentAction; ++i)
        f.step();

    const CharacterRecord aki = f.aki();
    REQUIRE(aki.currentAction.has_value());
    CHECK(aki.currentAction->actionId == "eat");
    CHECK(aki.location.mapId == "cafe");
    CHECK(aki.location.nodeId == "c2");
    CHECK(aki.money == 15);
    CHECK_FALSE(aki.pendingAction.has_value());
    CHECK(f.count(EventKind::MapTransition) == 1);
    CHECK(f.count(EventKind::ActionStarted) == 1);
    CHECK(f.decider->calls.load() == 1);

    const auto history = f.engine->schedules().historyFor("aki");
    REQUIRE_FALSE(history.empty());
    CHECK(history.back().actionId == "eat");
}

TEST_CASE("Orchestrator: a failing decider leaves the agent idle and retries later")
{
    EngineFixture f;
    f.decider->script = [](int call, const BehaviorContext&) -> BehaviorDecision {
        if (call == 1)
            throw std::runtime_error("model unavailable");
        return BehaviorDecision{IdleDecision{"recovered"}, std::nullopt};
    };
    f.boot();

    REQUIRE(f.engine->behavior().decide("aki"));
    f.step();

    CHECK(f.engine->world().isIdle(f.engine->world().find("aki")));
    CHECK_FALSE(f.engine->behavior().isPending("aki"));
    CHECK(f.engine->behavior().hasTrigger("aki"));

    f.step(1'000);
    CHECK(f.decider->calls.load() == 1);

    f.step(f.cfg.behavior.stuckRetryDelayMs);
    f.engine->behavior().waitIdle();
    CHECK(f.decider->calls.load() == 2);
}

TEST_CASE("Orchestrator: need interrupt forces the action and skips the decider's choice")
{
    EngineFixture f;
    f.boot("t1");

    f.engine->events().post(Event{EventKind::NeedInterrupt, "aki", "energy", Need::Energy, {}});
    f.engine->events().dispatch();
    CHECK(f.engine->behavior().isPending("aki"));

    f.step();
    CHECK(f.decider->interruptCalls.load() == 1);
    CHECK(f.decider->calls.load() == 0);
    // Nowhere to sleep and no safe map: the agent stays idle with a retry queued.
    CHECK_FALSE(f.aki().currentAction.has_value());
    CHECK(f.aki().indicator == "nowhere to sleep");
    CHECK(f.engine->behavior().hasTrigger("aki"));
}

TEST_CASE("Orchestrator: wanders after enough completed actions")
{
    EngineFixture f;
    f.cfg.behavior.wanderEveryNActions = 1;
    f.decider->script = [](int, const BehaviorContext&) { return Act("rest"); };
    f.boot("t1");

    REQUIRE(f.engine->behavior().decide("aki"));
    f.step();
    REQUIRE(f.aki().currentAction.has_value());
    CHECK(f.aki().currentAction->actionId == "rest");

    f.step(16 * 60'000);

    const CharacterRecord aki = f.aki();
    CHECK_FALSE(aki.currentAction.has_value());
    REQUIRE(aki.crossMapNavigation.has_value());
    CHECK(aki.crossMapNavigation->targetMapId == "cafe");
    CHECK(f.decider->calls.load() == 1);
    CHECK_FALSE(f.engine->behavior().isPending("aki"));

    const auto history = f.engine->schedules().historyFor("aki");
    REQUIRE_FALSE(history.empty());
    CHECK(history.back().actionId == "move");
    CHECK(history.back().reason == std::optional<std::string>{"wandering"});
}

TEST_CASE("Orchestrator: a schedule update rides along with the decision")
{
    EngineFixture f;
    f.decider->script = [](int, const BehaviorContext&) {
        ScheduleUpdate update;
        update.type = ScheduleUpdate::Type::Add;
        update.entry = ScheduleEntry{"15:00", "nap", std::nullopt, std::nullopt};
        return BehaviorDecision{IdleDecision{"planning"}, update};
    };
    f.boot();

    REQUIRE(f.engine->behavior().decide("aki"));
    f.step();

    const auto schedule = f.engine->schedules().scheduleFor("aki");
    REQUIRE(schedule.size() == 1);
    CHECK(schedule.front().time == "15:00");
    CHECK(schedule.front().activity == "nap");
    CHECK(f.aki().indicator == "planning");
}

TEST_CASE("Orchestrator: a failed move is retried after the move delay")
{
    EngineFixture f;
    f.decider->script = [](int, const BehaviorContext&) {
        return BehaviorDecision{MoveDecision{std::nullopt, NodeId{"nowhere"}, "lost"}, std::nullopt};
    };
    f.boot();

    REQUIRE(f.engine->behavior().decide("aki"));
    f.step();

    CHECK(f.akiIdle());
    CHECK(f.engine->behavior().hasTrigger("aki"));
    CHECK(f.count(EventKind::NavigationStarted) == 0);
    CHECK(f.engine->schedules().historyFor("aki").empty());

    f.step(f.cfg.behavior.moveRetryDelayMs - 1);
    f.engine->behavior().waitIdle();
    CHECK(f.decider->calls.load() == 1);

    f.step(1);
    f.engine->behavior().waitIdle();
    CHECK(f.decider->calls.load() == 2);
}

TEST_CASE("Orchestrator: a forced action with no facility heads to the safe map")
{
    EngineFixture f;
    f.cfg.behavior.safeMapId = MapId{"cafe"};
    f.boot("t1");

    f.engine->events().post(Event{EventKind::NeedInterrupt, "aki", "energy", Need::Energy, {}});
    f.engine->events().dispatch();
    f.step();

    CHECK(f.decider->interruptCalls.load() == 1);
    REQUIRE(f.aki().crossMapNavigation.has_value());
    CHECK(f.aki().crossMapNavigation->targetMapId == "cafe");
    CHECK(f.aki().indicator != "nowhere to sleep");
    CHECK_FALSE(f.engine->behavior().hasTrigger("aki"));

    const auto history = f.engine->schedules().historyFor("aki");
    REQUIRE_FALSE(history.empty());
    CHECK(history.back().actionId == "move");
    CHECK(history.back().target == std::optional<std::string>{"cafe"});
    CHECK(history.back().reason == std::optional<std::string>{"no facility for sleep"});

    for (int i = 0; i < 300 && (f.aki().location.mapId != "cafe" || !f.akiIdle()); ++i)
        f.step();
    f.engine->behavior().waitIdle();

    CHECK(f.aki().location.mapId == "cafe");
    CHECK(f.aki().location.nodeId == "c1");
    CHECK(f.count(EventKind::MapTransition) == 1);
    // Arrival asks the decider what to do next.
    CHECK(f.decider->calls.load() == 1);
}

TEST_CASE("Orchestrator: talking to an NPC walks next to them first")
{
    EngineFixture f;
    f.startMap = "cafe";
    f.npcs.push_back(NpcSeed{"mika", "Mika", "cafe", "c3", Direction::Left});
    f.decider->script = [](int, const BehaviorContext&) {
        return BehaviorDecision{ActionDecision{"talk", std::nullopt, AgentId{"mika"}, std::nullopt, "catch up"},
                                std::nullopt};
    };
    f.boot("c1");

    REQUIRE(f.engine->behavior().decide("aki"));
    f.step();

    REQUIRE(f.aki().pendingAction.has_value());
    CHECK(f.aki().pendingAction->targetNpcId == std::optional<AgentId>{"mika"});
    CHECK_FALSE(f.akiIdle());

    for (int i = 0; i < 200 && !f.aki().currentAction; ++i)
        f.step();

    const CharacterRecord aki = f.aki();
    REQUIRE(aki.currentAction.has_value());
    CHECK(aki.currentAction->actionId == "talk");
    CHECK(aki.location.nodeId == "c2");
    REQUIRE(aki.conversation.has_value());
    CHECK(aki.conversation->partnerId == "mika");
    CHECK_FALSE(aki.pendingAction.has_value());
    CHECK(f.decider->calls.load() == 1);

    const auto history = f.engine->schedules().historyFor("aki");
    REQUIRE_FALSE(history.empty());
    CHECK(history.back().actionId == "talk");
    CHECK(history.back().target == std::optional<std::string>{"mika"});
}

TEST_CASE("Orchestrator: a pending action that cannot start on arrival is retried later")
{
    EngineFixture f;
    f.money = 2;   // the counter charges 5
    f.decider->script = [](int call, const BehaviorContext&) {
        if (call == 1)
            return Act("eat", FacilityId{"counter"});
        return BehaviorDecision{IdleDecision{"broke"}, std::nullopt};
    };
    f.boot();

    REQUIRE(f.engine->behavior().decide("aki"));
    for (int i = 0; i < 300 && f.count(EventKind::PendingActionFailed) == 0; ++i)
        f.step();

    REQUIRE(f.count(EventKind::PendingActionFailed) == 1);
    f.engine->behavior().waitIdle();

    const CharacterRecord aki = f.aki();
    CHECK(aki.location.mapId == "cafe");
    CHECK(aki.location.nodeId == "c2");
    CHECK(aki.money == 2);
    CHECK_FALSE(aki.currentAction.has_value());
    CHECK_FALSE(aki.pendingAction.has_value());
    CHECK(f.engine->behavior().hasTrigger("aki"));
    // Arriving does not short-circuit the retry delay.
    CHECK(f.decider->calls.load() == 1);

    f.step(f.cfg.behavior.retryDelayMs - 1);
    f.engine->behavior().waitIdle();
    CHECK(f.decider->calls.load() == 1);

    f.step(1);
    f.engine->behavior().waitIdle();
    CHECK(f.decider->calls.load() == 2);
}

TEST_CASE("Orchestrator: idle waits the idle delay, a stuck forced action the longer one")
{
    SUBCASE("chosen idle")
    {
        EngineFixture f;
        f.boot();

        REQUIRE(f.engine->behavior().decide("aki"));
        f.step();
        CHECK(f.aki().indicator == "scripted idle");

        f.step(f.cfg.behavior.idleRetryDelayMs - 1);
        f.engine->behavior().waitIdle();
        CHECK(f.decider->calls.load() == 1);

        f.step(1);
        f.engine->behavior().waitIdle();
        CHECK(f.decider->calls.load() == 2);
    }

    SUBCASE("forced with nowhere to go")
    {
        EngineFixture f;
        f.boot();

        REQUIRE(f.engine->behavior().interrupt("aki", Need::Energy));
        f.step();
        CHECK(f.aki().indicator == "nowhere to sleep");

        f.step(f.cfg.behavior.stuckRetryDelayMs - 1);
        f.engine->behavior().waitIdle();
        CHECK(f.decider->calls.load() == 0);

        f.step(1);
        f.engine->behavior().waitIdle();
        CHECK(f.decider->calls.load() == 1);
        CHECK(f.decider->interruptCalls.load() == 1);
    }
}

TEST_CASE("Orchestrator: an interrupt is refused while a decision is in flight")
{
    EngineFixture f;
    std::promise<void> release;
    f.decider->gate = release.get_future().share();
    f.boot();

    REQUIRE(f.engine->behavior().decide("aki"));
    const bool direct = f.engine->behavior().interrupt("aki", Need::Bladder);

    f.engine->events().post(Event{EventKind::NeedInterrupt, "aki", "bladder", Need::Bladder, {}});
    f.engine->events().dispatch();

    release.set_value();
    f.step();

    CHECK_FALSE(direct);
    CHECK(f.decider->calls.load() == 1);
    CHECK(f.decider->interruptCalls.load() == 0);
    CHECK_FALSE(f.engine->behavior().isPending("aki"));
    CHECK(f.count(EventKind::DecisionApplied) == 1);
}

TEST_CASE("Orchestrator: a context failure leaves no thinking placeholder behind")
{
    EngineFixture f;
    auto broken = std::make_shared<std::atomic<bool>>(false);
    f.executorFactory = [broken](WorldState& world, EventBus& bus, const config::SimulationConfig& cfg) {
        auto inner = std::make_unique<TimedActionExecutor>(world, bus, cfg.actions, FacilityMapping::defaults(),
                                                           cfg.movement.facilityProximity);
        return std::unique_ptr<IActionExecutor>(std::make_unique<FlakyExecutor>(std::move(inner), broken));
    };
    f.boot();

    broken->store(true);
    CHECK_THROWS_AS(f.engine->behavior().decide("aki"), std::runtime_error);

    CHECK_FALSE(f.engine->behavior().isPending("aki"));
    CHECK_FALSE(f.aki().currentAction.has_value());
    CHECK(f.aki().indicator.empty());
    CHECK(f.akiIdle());

    broken->store(false);
    REQUIRE(f.engine->behavior().decide("aki"));
    f.step();
    CHECK(f.decider->calls.load() == 1);
    CHECK(f.count(EventKind::DecisionApplied) == 1);
}

TEST_CASE("Orchestrator: an agent with an action waiting for arrival is not idle")
{
    EngineFixture f;
    f.boot();

    const entt::entity e = f.engine->world().find("aki");
    f.engine->world().registry().emplace<PendingAction>(
        e, PendingAction{"rest", std::nullopt, std::nullopt, "town", std::nullopt, std::nullopt});

    CHECK_FALSE(f.akiIdle());
    CHECK_FALSE(f.engine->behavior().decide("aki"));
    CHECK_FALSE(f.engine->behavior().interrupt("aki", Need::Energy));

    // t0 is outside the park, so rest fails on the next tick and the agent frees up.
    f.step();
    CHECK(f.akiIdle());
    CHECK(f.count(EventKind::PendingActionFailed) == 1);
    CHECK(f.engine->behavior().hasTrigger("aki"));
    CHECK(f.decider->calls.load() == 0);
}

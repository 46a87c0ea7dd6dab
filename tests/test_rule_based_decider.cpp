// tests/test_rule_based_decider.cpp
#include <doctest/doctest.h>

#include "townlife/ai/RuleBasedDecider.hpp"

#include <string>
#include <variant>

namespace townlife_decider_test {

using namespace townlife;
using namespace townlife::ai;

FacilityInfo Info(MapId mapId, FacilityId id, std::vector<std::string> tags, std::vector<ActionId> actions,
                  int hops, double distance, std::optional<int> cost = std::nullopt,
                  std::optional<AgentId> owner = std::nullopt)
{
    FacilityInfo f;
    f.ref = world::FacilityRef{std::move(mapId), std::move(id),
                               world::Facility{std::move(tags), cost, std::nullopt, std::move(owner), std::nullopt}};
    f.actions = std::move(actions);
    f.mapHops = hops;
    f.distance = distance;
    return f;
}

BehaviorContext BaseContext()
{
    BehaviorContext ctx;
    ctx.character.id = "aki";
    ctx.character.money = 20;
    ctx.character.location.mapId = "town";
    ctx.time = WorldTime{12, 10, 1};
    return ctx;
}

config::BehaviorConfig Quiet()
{
    config::BehaviorConfig cfg;
    cfg.restChance = 0.0;
    return cfg;
}

ActionDecision AsAction(const BehaviorDecision& d)
{
    REQUIRE(std::holds_alternative<ActionDecision>(d.intent));
    return std::get<ActionDecision>(d.intent);
}

} // namespace townlife_decider_test

using namespace townlife_decider_test;

TEST_CASE("CurrentScheduleEntry picks the latest entry already started")
{
    const std::vector<sim::ScheduleEntry> schedule{
        {"07:00", "breakfast", {}, {}},
        {"12:00", "lunch", {}, {}},
        {"19:00", "dinner", {}, {}},
    };
    CHECK_FALSE(CurrentScheduleEntry(schedule, WorldTime{6, 59, 1}).has_value());
    CHECK(CurrentScheduleEntry(schedule, WorldTime{12, 0, 1})->activity == "lunch");
    CHECK(CurrentScheduleEntry(schedule, WorldTime{18, 59, 1})->activity == "lunch");
    CHECK(CurrentScheduleEntry(schedule, WorldTime{23, 0, 1})->activity == "dinner");
}

TEST_CASE("RuleBasedDecider: an urgent need wins, bladder first")
{
    RuleBasedDecider decider(Quiet());
    BehaviorContext ctx = BaseContext();
    ctx.character.needs.satiety = 5;
    ctx.character.needs.bladder = 15;
    ctx.availableActions = {"toilet", "eat"};

    const ActionDecision d = AsAction(decider.decide(ctx));
    CHECK(d.actionId == "toilet");
    CHECK_FALSE(d.targetFacilityId.has_value());
    CHECK(d.reason.find("bladder critical") != std::string::npos);
}

TEST_CASE("RuleBasedDecider: an urgent need walks to the closest usable facility")
{
    RuleBasedDecider decider(Quiet());
    BehaviorContext ctx = BaseContext();
    ctx.character.needs.satiety = 10;
    ctx.currentMapFacilities = {
        Info("town", "far-stall", {"restaurant"}, {"eat"}, 0, 400.0),
        Info("town", "near-stall", {"restaurant"}, {"eat"}, 0, 90.0),
        Info("town", "private-kitchen", {"kitchen"}, {"eat"}, 0, 10.0, std::nullopt, AgentId{"ren"}),
        Info("town", "pricey", {"restaurant"}, {"eat"}, 0, 20.0, 500),
    };

    const ActionDecision d = AsAction(decider.decide(ctx));
    CHECK(d.actionId == "eat");
    CHECK(d.targetFacilityId == FacilityId{"near-stall"});
}

TEST_CASE("RuleBasedDecider: follows the schedule to a facility on another map")
{
    RuleBasedDecider decider(Quiet());
    BehaviorContext ctx = BaseContext();
    ctx.schedule = {{"12:00", "lunch", "cafe", {}}};
    ctx.nearbyFacilities = {
        Info("home", "kitchen", {"kitchen"}, {"eat"}, 2, 0.0),
        Info("cafe", "counter", {"restaurant"}, {"eat"}, 1, 0.0, 5),
    };

    const ActionDecision d = AsAction(decider.decide(ctx));
    CHECK(d.actionId == "eat");
    CHECK(d.targetFacilityId == FacilityId{"counter"});
    CHECK(d.reason == "scheduled: lunch at 12:00");
}

TEST_CASE("RuleBasedDecider: a schedule entry already done today is skipped")
{
    RuleBasedDecider decider(Quiet());
    BehaviorContext ctx = BaseContext();
    ctx.schedule = {{"12:00", "lunch", {}, {}}};
    ctx.availableActions = {"eat"};
    ctx.todayActions = {sim::ActionHistoryEntry{"12:02", "eat", {}, 30, {}}};

    const BehaviorDecision d = decider.decide(ctx);
    REQUIRE(std::holds_alternative<IdleDecision>(d.intent));
    CHECK(std::get<IdleDecision>(d.intent).reason == "no urgent needs or scheduled activities");
    CHECK(intent_name(d.intent) == "idle");

    // Eating before the entry started does not count.
    ctx.todayActions = {sim::ActionHistoryEntry{"08:00", "eat", {}, 30, {}}};
    CHECK(AsAction(decider.decide(ctx)).actionId == "eat");
}

TEST_CASE("RuleBasedDecider: custom aliases and restChance")
{
    config::BehaviorConfig cfg;
    cfg.restChance = 1.0;
    RuleBasedDecider decider(cfg);
    decider.setActivityAlias("siesta", "sleep");

    BehaviorContext ctx = BaseContext();
    ctx.schedule = {{"12:00", "siesta", {}, {}}};
    ctx.availableActions = {"sleep", "rest"};
    CHECK(AsAction(decider.decide(ctx)).actionId == "sleep");

    ctx.schedule.clear();
    const ActionDecision rest = AsAction(decider.decide(ctx));
    CHECK(rest.actionId == "rest");
    CHECK(intent_name(BehaviorDecision{rest, std::nullopt}.intent) == "action");
}

TEST_CASE("RuleBasedDecider: interrupt without a facility still names the forced action")
{
    RuleBasedDecider decider(Quiet());
    BehaviorContext ctx = BaseContext();

    const ActionDecision none = AsAction(decider.decideInterruptFacility("toilet", ctx));
    CHECK(none.actionId == "toilet");
    CHECK_FALSE(none.targetFacilityId.has_value());
    CHECK(none.reason == "interrupt: no facility found");

    ctx.nearbyFacilities = {Info("cafe", "restroom", {"toilet"}, {"toilet"}, 1, 0.0)};
    const ActionDecision found = AsAction(decider.decideInterruptFacility("toilet", ctx));
    CHECK(found.targetFacilityId == FacilityId{"restroom"});
}

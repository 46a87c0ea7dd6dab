// src/ai/RuleBasedDecider.cpp
#include "townlife/ai/RuleBasedDecider.hpp"

#include "townlife/core/Rng.hpp"
#include "townlife/sim/NeedDecay.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>

namespace townlife::ai {

namespace {

constexpr Need kUrgentOrder[] = {Need::Bladder, Need::Satiety, Need::Energy, Need::Hygiene};

bool Contains(const std::vector<ActionId>& v, const ActionId& a) {
    return std::find(v.begin(), v.end(), a) != v.end();
}

bool Usable(const FacilityInfo& f, const ActionId& action, const BehaviorContext& ctx) {
    if (!Contains(f.actions, action)) return false;
    if (ctx.currentFacility && ctx.currentFacility->id == f.ref.id) return false;
    const auto& fac = f.ref.facility;
    if (fac.owner && *fac.owner != ctx.character.id) return false;
    if (fac.cost && *fac.cost > ctx.character.money) return false;
    return true;
}

int Minutes(WorldTime t) { return t.hour * 60 + t.minute; }

} // namespace

std::optional<sim::ScheduleEntry> CurrentScheduleEntry(const std::vector<sim::ScheduleEntry>& schedule,
                                                       WorldTime now) {
    std::optional<sim::ScheduleEntry> current;
    int best = -1;
    for (const auto& entry : schedule) {
        const auto at = sim::ParseClock(entry.time);
        if (!at || *at > Minutes(now)) continue;
        if (*at >= best) {
            best = *at;
            current = entry;
        }
    }
    return current;
}

RuleBasedDecider::RuleBasedDecider(const config::BehaviorConfig& cfg)
    : urgentThreshold_(cfg.urgentThreshold),
      restChance_(cfg.restChance),
      seed_(cfg.seed),
      aliases_{
          {"breakfast", "eat"},
          {"lunch",     "eat"},
          {"dinner",    "eat"},
          {"bedtime",   "sleep"},
          {"bath",      "bathe"},
          {"break",     "rest"},
          {"chat",      "talk"},
      } {}

void RuleBasedDecider::setActivityAlias(std::string activity, ActionId action) {
    aliases_[std::move(activity)] = std::move(action);
}

std::optional<ActionDecision> RuleBasedDecider::pursue(const ActionId& action, const BehaviorContext& ctx,
                                                       std::string reason) const {
    if (Contains(ctx.availableActions, action))
        return ActionDecision{action, std::nullopt, std::nullopt, std::nullopt, std::move(reason)};

    const FacilityInfo* best = nullptr;
    for (const FacilityInfo& f : ctx.currentMapFacilities)
        if (Usable(f, action, ctx) && (!best || f.distance < best->distance)) best = &f;

    if (!best) {
        for (const FacilityInfo& f : ctx.nearbyFacilities)
            if (Usable(f, action, ctx) && (!best || f.mapHops < best->mapHops)) best = &f;
    }
    if (!best) return std::nullopt;

    return ActionDecision{action, best->ref.id, std::nullopt, std::nullopt, std::move(reason)};
}

BehaviorDecision RuleBasedDecider::decide(const BehaviorContext& ctx) {
    const auto& c = ctx.character;

    for (Need need : kUrgentOrder) {
        const double v = c.needs[need];
        if (v > urgentThreshold_) continue;

        const auto action = sim::ForcedActionFor(need);
        if (!action) continue;
        if (auto d = pursue(*action, ctx, fmt::format("{} critical ({:.0f} <= {:.0f})", to_string(need), v,
                                                      urgentThreshold_))) {
            spdlog::debug("[Decider] {}: urgent {}", c.id, d->actionId);
            return BehaviorDecision{*d, std::nullopt};
        }
        spdlog::debug("[Decider] {}: {} critical but no facility available", c.id, to_string(need));
    }

    if (auto entry = CurrentScheduleEntry(ctx.schedule, ctx.time)) {
        auto alias = aliases_.find(entry->activity);
        const ActionId action = alias != aliases_.end() ? alias->second : entry->activity;

        // Already done since the entry began.
        const bool done = std::any_of(ctx.todayActions.begin(), ctx.todayActions.end(),
                                      [&](const sim::ActionHistoryEntry& h) {
                                          return h.actionId == action &&
                                                 sim::ParseClock(h.time).value_or(-1) >=
                                                     sim::ParseClock(entry->time).value_or(0);
                                      });
        if (!done) {
            if (auto d = pursue(action, ctx, "scheduled: " + entry->activity + " at " + entry->time))
                return BehaviorDecision{*d, std::nullopt};
        }
    }

    rng::Pcg32 rng(seed_ ^ std::hash<std::string>{}(c.id),
                   static_cast<rng::Seed>(ctx.time.day) * 1440 + Minutes(ctx.time) + ctx.todayActions.size());

    if (Contains(ctx.availableActions, "rest") && rng.next_double01() < restChance_)
        return BehaviorDecision{ActionDecision{"rest", std::nullopt, std::nullopt, std::nullopt, "taking a break"},
                                std::nullopt};

    if (Contains(ctx.availableActions, "talk") && rng.next_double01() < restChance_)
        return BehaviorDecision{ActionDecision{"talk", std::nullopt, std::nullopt, std::nullopt, "chatting"},
                                std::nullopt};

    return BehaviorDecision{IdleDecision{"no urgent needs or scheduled activities"}, std::nullopt};
}

BehaviorDecision RuleBasedDecider::decideInterruptFacility(const ActionId& forcedAction,
                                                           const BehaviorContext& ctx) {
    if (auto d = pursue(forcedAction, ctx, "interrupt: " + forcedAction))
        return BehaviorDecision{*d, std::nullopt};

    return BehaviorDecision{
        ActionDecision{forcedAction, std::nullopt, std::nullopt, std::nullopt, "interrupt: no facility found"},
        std::nullopt};
}

} // namespace townlife::ai

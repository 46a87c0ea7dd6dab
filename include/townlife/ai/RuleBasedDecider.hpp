#pragma once
// include/townlife/ai/RuleBasedDecider.hpp
//
// Deterministic fallback decider:
//   1. a need at or below urgentThreshold forces its action
//   2. the schedule entry covering the current time
//   3. occasionally rest or chat, otherwise idle
// Randomness is seeded per call from the agent id and clock, so concurrent
// calls share no state.

#include "townlife/ai/BehaviorDecider.hpp"
#include "townlife/core/Config.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace townlife::ai {

class RuleBasedDecider final : public BehaviorDecider {
public:
    explicit RuleBasedDecider(const config::BehaviorConfig& cfg);

    BehaviorDecision decide(const BehaviorContext& context) override;
    BehaviorDecision decideInterruptFacility(const ActionId& forcedAction,
                                             const BehaviorContext& context) override;

    // Schedule activity -> action ("breakfast" -> "eat"). Activities that
    // name an action directly need no entry.
    void setActivityAlias(std::string activity, ActionId action);

private:
    std::optional<ActionDecision> pursue(const ActionId& action, const BehaviorContext& ctx,
                                         std::string reason) const;

    double                          urgentThreshold_;
    double                          restChance_;
    std::uint64_t                   seed_;
    std::map<std::string, ActionId> aliases_;
};

// Latest entry whose start time is at or before `now`.
std::optional<sim::ScheduleEntry> CurrentScheduleEntry(const std::vector<sim::ScheduleEntry>& schedule,
                                                       WorldTime now);

} // namespace townlife::ai

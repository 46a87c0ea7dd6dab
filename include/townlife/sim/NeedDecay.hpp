#pragma once
// include/townlife/sim/NeedDecay.hpp
#include "townlife/core/Config.hpp"
#include "townlife/sim/Events.hpp"

#include <optional>

namespace townlife::sim {

class WorldState;
class IActionExecutor;

// new = current + override * minutes when the running action overrides the
// stat, else current - rate * minutes; clamped to [0,100].
double ApplyNeedChange(double current, double ratePerMinute, double elapsedMinutes,
                       std::optional<double> overridePerMinute);

// bladder -> toilet, satiety -> eat, energy -> sleep, hygiene -> bathe.
// Mood never interrupts.
std::optional<ActionId> ForcedActionFor(Need need);

// Highest-priority need (bladder > satiety > energy > hygiene) that crossed
// from >= threshold to < threshold.
std::optional<Need> FirstCrossing(const NeedValues& before, const NeedValues& after, double threshold);

class NeedDecayModel {
public:
    NeedDecayModel(WorldState& world, EventBus& bus, const config::TimeConfig& time,
                   double interruptThreshold);

    void setExecutor(const IActionExecutor* executor) { executor_ = executor; }

    // Applies `elapsedMinutes` of change to every character and posts at most
    // one NeedInterrupt per character.
    void applyDecay(double elapsedMinutes);

    // Wall-clock gate: applies decay when statusDecayIntervalMs has passed.
    // Returns true when decay was applied.
    bool update(TimestampMs nowMs);

    // Unpause and restore reset the baseline so paused time never decays.
    void resetBaseline(TimestampMs nowMs) { lastDecayMs_ = nowMs; }
    // The next update() only records its time as the baseline.
    void clearBaseline() { lastDecayMs_.reset(); }

    bool hasLowNeed(const NeedValues& needs) const;
    double threshold() const { return threshold_; }

private:
    WorldState&               world_;
    EventBus&                 bus_;
    config::TimeConfig        time_;
    double                    threshold_;
    const IActionExecutor*    executor_ = nullptr;
    std::optional<TimestampMs> lastDecayMs_;
};

} // namespace townlife::sim

// src/sim/NeedDecay.cpp
#include "townlife/sim/NeedDecay.hpp"

#include "townlife/core/Profile.hpp"
#include "townlife/sim/ActionExecutor.hpp"
#include "townlife/sim/WorldState.hpp"

#include <spdlog/spdlog.h>

#include <array>

namespace townlife::sim {

namespace {
constexpr std::array<Need, 4> kInterruptOrder{Need::Bladder, Need::Satiety, Need::Energy, Need::Hygiene};
} // namespace

double ApplyNeedChange(double current, double ratePerMinute, double elapsedMinutes,
                       std::optional<double> overridePerMinute) {
    if (overridePerMinute)
        return clamp_need(current + *overridePerMinute * elapsedMinutes);
    return clamp_need(current - ratePerMinute * elapsedMinutes);
}

std::optional<ActionId> ForcedActionFor(Need need) {
    switch (need) {
        case Need::Bladder: return ActionId{"toilet"};
        case Need::Satiety: return ActionId{"eat"};
        case Need::Energy:  return ActionId{"sleep"};
        case Need::Hygiene: return ActionId{"bathe"};
        case Need::Mood:    return std::nullopt;
    }
    return std::nullopt;
}

std::optional<Need> FirstCrossing(const NeedValues& before, const NeedValues& after, double threshold) {
    for (Need n : kInterruptOrder)
        if (before[n] >= threshold && after[n] < threshold) return n;
    return std::nullopt;
}

NeedDecayModel::NeedDecayModel(WorldState& world, EventBus& bus, const config::TimeConfig& time,
                               double interruptThreshold)
    : world_(world), bus_(bus), time_(time), threshold_(interruptThreshold) {}

void NeedDecayModel::applyDecay(double elapsedMinutes) {
    TOWNLIFE_ZONE("NeedDecay::apply");
    if (elapsedMinutes < 0.0) elapsedMinutes = 0.0;

    auto view = world_.registry().view<CharacterTag, Identity, Needs>();
    for (auto [e, ident, needs] : view.each()) {
        std::optional<NeedRates> overrides;
        if (executor_) overrides = executor_->activePerMinuteEffects(ident.id);

        const NeedValues before = needs.values;
        for (Need n : kAllNeeds) {
            const std::optional<double> o = overrides ? (*overrides)[n] : std::nullopt;
            needs.values[n] = ApplyNeedChange(before[n], time_.decayRates[n], elapsedMinutes, o);
        }

        if (auto crossed = FirstCrossing(before, needs.values, threshold_)) {
            spdlog::info("[NeedDecay] {} {} dropped below {} ({:.1f})", ident.id, to_string(*crossed),
                         threshold_, needs.values[*crossed]);
            bus_.post(Event{EventKind::NeedInterrupt, ident.id, std::string(to_string(*crossed)), *crossed, {}});
        }
    }
    spdlog::debug("[NeedDecay] applied {:.2f} min", elapsedMinutes);
}

bool NeedDecayModel::update(TimestampMs nowMs) {
    if (!lastDecayMs_) {
        lastDecayMs_ = nowMs;
        return false;
    }
    const TimestampMs elapsed = nowMs - *lastDecayMs_;
    if (elapsed < time_.statusDecayIntervalMs) return false;

    applyDecay(static_cast<double>(elapsed) / static_cast<double>(kMsPerMinute));
    lastDecayMs_ = nowMs;
    return true;
}

bool NeedDecayModel::hasLowNeed(const NeedValues& needs) const {
    for (Need n : kInterruptOrder)
        if (needs[n] < threshold_) return true;
    return false;
}

} // namespace townlife::sim

#pragma once
// include/townlife/ai/BehaviorDecider.hpp
#include "townlife/ai/BehaviorTypes.hpp"

namespace townlife::ai {

// Strategy seam for behavior decisions. Called on TaskPool workers with a
// context copy; implementations must not touch WorldState. May block and may
// throw; the orchestrator reports failures and leaves the agent idle.
class BehaviorDecider {
public:
    virtual ~BehaviorDecider() = default;

    virtual BehaviorDecision decide(const BehaviorContext& context) = 0;

    // The action is already forced by a need interrupt; only the facility
    // (or NPC) is chosen here.
    virtual BehaviorDecision decideInterruptFacility(const ActionId& forcedAction,
                                                     const BehaviorContext& context) = 0;
};

} // namespace townlife::ai

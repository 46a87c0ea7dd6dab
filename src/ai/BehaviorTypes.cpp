// src/ai/BehaviorTypes.cpp
#include "townlife/ai/BehaviorTypes.hpp"

namespace townlife::ai {

std::string_view intent_name(const Intent& intent) {
    if (std::holds_alternative<IdleDecision>(intent)) return "idle";
    if (std::holds_alternative<MoveDecision>(intent)) return "move";
    return "action";
}

} // namespace townlife::ai

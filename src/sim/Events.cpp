// src/sim/Events.cpp
#include "townlife/sim/Events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace townlife::sim {

std::string_view to_string(EventKind k) {
    switch (k) {
        case EventKind::ActionStarted:       return "ActionStarted";
        case EventKind::ActionCompleted:     return "ActionCompleted";
        case EventKind::NavigationStarted:   return "NavigationStarted";
        case EventKind::NavigationCompleted: return "NavigationCompleted";
        case EventKind::MapTransition:       return "MapTransition";
        case EventKind::NeedInterrupt:       return "NeedInterrupt";
        case EventKind::PendingActionFailed: return "PendingActionFailed";
        case EventKind::DecisionApplied:     return "DecisionApplied";
        case EventKind::DecisionDiscarded:   return "DecisionDiscarded";
        case EventKind::DayChanged:          return "DayChanged";
    }
    return "Unknown";
}

void EventBus::unsubscribe(int id) {
    auto drop = [id](auto& vec) {
        vec.erase(std::remove_if(vec.begin(), vec.end(), [id](const auto& p) { return p.first == id; }),
                  vec.end());
    };
    for (auto& [_, handlers] : subs_) drop(handlers);
    drop(all_);
}

void EventBus::publish(const Event& e) {
    replay_.push_back({stamp_++, e});
    while (replay_.size() > replayCapacity_) replay_.pop_front();

    // A throwing handler must not take the rest of the tick down with it.
    auto invoke = [&e](const Handler& h) {
        try {
            h(e);
        } catch (const std::exception& ex) {
            spdlog::error("[EventBus] handler for {} ({}) threw: {}", to_string(e.kind), e.agentId, ex.what());
        }
    };

    if (auto it = subs_.find(e.kind); it != subs_.end()) {
        // Copy: handlers may subscribe/unsubscribe.
        auto handlers = it->second;
        for (auto& [_, h] : handlers) invoke(h);
    }
    auto all = all_;
    for (auto& [_, h] : all) invoke(h);
}

std::size_t EventBus::dispatch() {
    std::size_t n = 0;
    while (!queue_.empty()) {
        Event e = std::move(queue_.front());
        queue_.pop_front();
        publish(e);
        ++n;
    }
    return n;
}

} // namespace townlife::sim

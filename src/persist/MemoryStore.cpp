// src/persist/MemoryStore.cpp
#include "townlife/persist/StateStore.hpp"

namespace townlife::persist {

bool MemoryStore::saveState(const WorldSnapshot& snapshot) {
    std::lock_guard lock(mutex_);
    state_ = snapshot;
    return true;
}

std::optional<WorldSnapshot> MemoryStore::loadState() {
    std::lock_guard lock(mutex_);
    return state_;
}

bool MemoryStore::saveSchedule(const DailySchedule& schedule) {
    std::lock_guard lock(mutex_);
    schedules_[{schedule.characterId, schedule.day}] = schedule;
    return true;
}

std::optional<DailySchedule> MemoryStore::loadSchedule(const AgentId& characterId, int day) {
    std::lock_guard lock(mutex_);
    auto it = schedules_.find({characterId, day});
    if (it == schedules_.end()) return std::nullopt;
    return it->second;
}

bool MemoryStore::addActionHistory(const AgentId& characterId, int day, const ActionHistoryEntry& entry) {
    std::lock_guard lock(mutex_);
    history_[{characterId, day}].push_back(entry);
    return true;
}

std::vector<ActionHistoryEntry> MemoryStore::loadActionHistory(const AgentId& characterId, int day) {
    std::lock_guard lock(mutex_);
    auto it = history_.find({characterId, day});
    if (it == history_.end()) return {};
    return it->second;
}

bool MemoryStore::hasData() {
    std::lock_guard lock(mutex_);
    return state_.has_value();
}

void MemoryStore::clear() {
    std::lock_guard lock(mutex_);
    state_.reset();
    schedules_.clear();
    history_.clear();
}

} // namespace townlife::persist

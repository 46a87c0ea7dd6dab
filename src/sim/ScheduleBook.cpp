// src/sim/ScheduleBook.cpp
#include "townlife/sim/ScheduleBook.hpp"

#include "townlife/jobs/TaskPool.hpp"
#include "townlife/sim/WorldState.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <exception>

namespace townlife::sim {

namespace {

bool EarlierTime(const ScheduleEntry& a, const ScheduleEntry& b) {
    return ParseClock(a.time).value_or(0) < ParseClock(b.time).value_or(0);
}

void SortByTime(std::vector<ScheduleEntry>& entries) {
    std::stable_sort(entries.begin(), entries.end(), EarlierTime);
}

} // namespace

std::string_view to_string(ScheduleUpdate::Type t) {
    switch (t) {
        case ScheduleUpdate::Type::Add:    return "add";
        case ScheduleUpdate::Type::Remove: return "remove";
        case ScheduleUpdate::Type::Modify: return "modify";
    }
    return "add";
}

std::optional<ScheduleUpdate::Type> schedule_update_type_from_string(std::string_view s) {
    if (s == "add") return ScheduleUpdate::Type::Add;
    if (s == "remove") return ScheduleUpdate::Type::Remove;
    if (s == "modify") return ScheduleUpdate::Type::Modify;
    return std::nullopt;
}

std::optional<int> ParseClock(std::string_view hhmm) {
    const auto colon = hhmm.find(':');
    if (colon == std::string_view::npos) return std::nullopt;

    int h = 0, m = 0;
    const char* hb = hhmm.data();
    const char* he = hhmm.data() + colon;
    const char* mb = he + 1;
    const char* me = hhmm.data() + hhmm.size();
    if (std::from_chars(hb, he, h).ptr != he || std::from_chars(mb, me, m).ptr != me) return std::nullopt;
    if (h < 0 || h > 23 || m < 0 || m > 59) return std::nullopt;
    return h * 60 + m;
}

ScheduleBook::ScheduleBook(const WorldState& world, persist::StateStore* store, jobs::TaskPool* pool)
    : world_(world), store_(store), pool_(pool) {}

ScheduleBook::Key ScheduleBook::todayKey(const AgentId& characterId) const {
    return {characterId, world_.time().day};
}

void ScheduleBook::setDefaultSchedule(const AgentId& characterId, std::vector<ScheduleEntry> entries) {
    SortByTime(entries);
    defaults_[characterId] = std::move(entries);
}

std::vector<ScheduleEntry> ScheduleBook::scheduleFor(const AgentId& characterId) const {
    if (auto it = schedules_.find(todayKey(characterId)); it != schedules_.end()) return it->second;
    if (auto it = defaults_.find(characterId); it != defaults_.end()) return it->second;
    return {};
}

void ScheduleBook::applyUpdate(const AgentId& characterId, const ScheduleUpdate& update) {
    std::vector<ScheduleEntry> entries = scheduleFor(characterId);
    const ScheduleEntry& entry = update.entry;

    switch (update.type) {
        case ScheduleUpdate::Type::Add:
            entries.push_back(entry);
            SortByTime(entries);
            spdlog::info("[Schedule] {} add: {} {}", characterId, entry.time, entry.activity);
            break;

        case ScheduleUpdate::Type::Remove: {
            auto it = std::find_if(entries.begin(), entries.end(), [&](const ScheduleEntry& e) {
                return e.time == entry.time && e.activity == entry.activity;
            });
            if (it != entries.end()) {
                entries.erase(it);
                spdlog::info("[Schedule] {} remove: {} {}", characterId, entry.time, entry.activity);
            } else {
                spdlog::info("[Schedule] {} remove: no entry {} {}", characterId, entry.time, entry.activity);
            }
            break;
        }

        case ScheduleUpdate::Type::Modify: {
            auto it = std::find_if(entries.begin(), entries.end(),
                                   [&](const ScheduleEntry& e) { return e.time == entry.time; });
            if (it != entries.end()) {
                *it = entry;
                spdlog::info("[Schedule] {} modify: {} -> {}", characterId, entry.time, entry.activity);
            } else {
                entries.push_back(entry);
                SortByTime(entries);
                spdlog::info("[Schedule] {} modify (added): {} {}", characterId, entry.time, entry.activity);
            }
            break;
        }
    }

    const Key key = todayKey(characterId);
    schedules_[key] = entries;

    writeThrough([schedule = persist::DailySchedule{characterId, key.second, std::move(entries)}](
                persist::StateStore& store) {
        if (!store.saveSchedule(schedule))
            spdlog::error("[Schedule] failed to save schedule for {} day {}", schedule.characterId, schedule.day);
    });
}

void ScheduleBook::recordAction(const AgentId& characterId,
                                const ActionId& actionId,
                                const std::optional<std::string>& target,
                                std::optional<int> durationMinutes,
                                const std::optional<std::string>& reason) {
    const Key key = todayKey(characterId);
    auto& entries = history_[key];
    if (actionId == "idle" && !entries.empty() && entries.back().actionId == "idle") return;

    const WorldTime t = world_.time();
    ActionHistoryEntry entry{persist::FormatTime(t.hour, t.minute), actionId, target, durationMinutes, reason};
    entries.push_back(entry);

    spdlog::debug("[Schedule] history {} {} {}{}", characterId, entry.time, actionId,
                  target ? " -> " + *target : std::string{});

    writeThrough([characterId, day = key.second, entry = std::move(entry)](persist::StateStore& store) {
        if (!store.addActionHistory(characterId, day, entry))
            spdlog::error("[Schedule] failed to save history for {} day {}", characterId, day);
    });
}

std::vector<ActionHistoryEntry> ScheduleBook::historyFor(const AgentId& characterId) const {
    if (auto it = history_.find(todayKey(characterId)); it != history_.end()) return it->second;
    return {};
}

void ScheduleBook::loadCaches() {
    if (!store_) return;
    const int day = world_.time().day;

    for (const AgentId& id : world_.characterIds()) {
        if (auto schedule = store_->loadSchedule(id, day)) {
            schedules_[{id, day}] = std::move(schedule->entries);
            spdlog::info("[Schedule] loaded schedule for {} (day {})", id, day);
        }
        auto history = store_->loadActionHistory(id, day);
        if (!history.empty()) {
            spdlog::info("[Schedule] loaded {} history entries for {} (day {})", history.size(), id, day);
            history_[{id, day}] = std::move(history);
        }
    }
}

void ScheduleBook::clearCaches() {
    schedules_.clear();
    history_.clear();
}

void ScheduleBook::writeThrough(std::function<void(persist::StateStore&)> write) {
    persist::StateStore* store = store_;
    if (!store) return;

    auto task = [store, write = std::move(write)] {
        try {
            write(*store);
        } catch (const std::exception& ex) {
            spdlog::error("[Schedule] store write threw: {}", ex.what());
        }
    };
    if (pool_) pool_->Post(std::move(task));
    else task();
}

} // namespace townlife::sim

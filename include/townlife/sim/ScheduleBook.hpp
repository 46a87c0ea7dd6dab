#pragma once
// include/townlife/sim/ScheduleBook.hpp
//
// Per-character daily schedules and today's action history, cached for the
// current day and mirrored to the StateStore without blocking the tick.

#include "townlife/persist/StateStore.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace townlife::jobs { class TaskPool; }

namespace townlife::sim {

class WorldState;

using persist::ActionHistoryEntry;
using persist::ScheduleEntry;

struct ScheduleUpdate {
    enum class Type : std::uint8_t { Add, Remove, Modify };

    Type          type = Type::Add;
    ScheduleEntry entry;
};

std::string_view              to_string(ScheduleUpdate::Type t);
std::optional<ScheduleUpdate::Type> schedule_update_type_from_string(std::string_view s);

// "HH:MM" -> minutes after midnight; nullopt when malformed.
std::optional<int> ParseClock(std::string_view hhmm);

class ScheduleBook {
public:
    // `store` and `pool` may be null (no persistence / synchronous writes).
    ScheduleBook(const WorldState& world, persist::StateStore* store, jobs::TaskPool* pool);

    void setDefaultSchedule(const AgentId& characterId, std::vector<ScheduleEntry> entries);

    // Today's schedule: the cached copy when one exists, else the default.
    std::vector<ScheduleEntry> scheduleFor(const AgentId& characterId) const;

    //   add    -> append, then sort by time
    //   remove -> drop the first entry with the same time and activity
    //   modify -> replace the first entry with the same time, else add
    void applyUpdate(const AgentId& characterId, const ScheduleUpdate& update);

    // Consecutive idle entries collapse into one.
    void recordAction(const AgentId& characterId,
                      const ActionId& actionId,
                      const std::optional<std::string>& target = std::nullopt,
                      std::optional<int> durationMinutes = std::nullopt,
                      const std::optional<std::string>& reason = std::nullopt);

    std::vector<ActionHistoryEntry> historyFor(const AgentId& characterId) const;

    // Pull today's schedules and history for every character from the store.
    void loadCaches();
    void clearCaches();

private:
    using Key = std::pair<AgentId, int>;

    Key  todayKey(const AgentId& characterId) const;
    void writeThrough(std::function<void(persist::StateStore&)> write);

    const WorldState&    world_;
    persist::StateStore* store_;
    jobs::TaskPool*      pool_;

    std::unordered_map<AgentId, std::vector<ScheduleEntry>> defaults_;
    std::map<Key, std::vector<ScheduleEntry>>               schedules_;
    std::map<Key, std::vector<ActionHistoryEntry>>          history_;
};

} // namespace townlife::sim

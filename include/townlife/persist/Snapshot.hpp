#pragma once
// include/townlife/persist/Snapshot.hpp
//
// Persisted records: world checkpoint, daily schedules, action history.
// Uses nlohmann::json for (de)serialization.

#include "townlife/core/Types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace townlife::persist {

using json = nlohmann::json;

struct ScheduleEntry {
    std::string                time;       // "HH:MM"
    std::string                activity;
    std::optional<std::string> location;
    std::optional<std::string> note;

    bool operator==(const ScheduleEntry&) const = default;
};

struct DailySchedule {
    AgentId                    characterId;
    int                        day = 1;
    std::vector<ScheduleEntry> entries;
};

struct ActionHistoryEntry {
    std::string                time;       // "HH:MM"
    ActionId                   actionId;
    std::optional<std::string> target;     // facility, NPC or map id
    std::optional<int>         durationMinutes;
    std::optional<std::string> reason;
};

struct CharacterSnapshot {
    AgentId     id;
    NeedValues  needs;
    int         money = 0;
    std::optional<std::string> jobId;
    MapId       mapId;
    NodeId      nodeId;
    Direction   direction = Direction::Down;
    int         actionCounter = 0;
};

struct WorldSnapshot {
    // Bump this when the layout changes.
    std::int32_t                   schemaVersion = 1;
    std::vector<CharacterSnapshot> characters;
    MapId                          currentMapId;
    WorldTime                      time;
    TimestampMs                    serverStartMs = 0;
    TimestampMs                    savedAtMs = 0;
    std::uint64_t                  tick = 0;
};

std::string FormatTime(int hour, int minute);   // "HH:MM"

void to_json(json& j, const ScheduleEntry& v);
void from_json(const json& j, ScheduleEntry& v);

void to_json(json& j, const DailySchedule& v);
void from_json(const json& j, DailySchedule& v);

void to_json(json& j, const ActionHistoryEntry& v);
void from_json(const json& j, ActionHistoryEntry& v);

void to_json(json& j, const CharacterSnapshot& v);
void from_json(const json& j, CharacterSnapshot& v);

void to_json(json& j, const WorldSnapshot& v);
void from_json(const json& j, WorldSnapshot& v);

} // namespace townlife::persist

// src/persist/Snapshot.cpp
#include "townlife/persist/Snapshot.hpp"

#include <cstdio>

namespace townlife::persist {

namespace {

template <typename T>
void PutOpt(json& j, const char* key, const std::optional<T>& v) {
    if (v) j[key] = *v;
}

template <typename T>
void GetOpt(const json& j, const char* key, std::optional<T>& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null())
        out = it->template get<T>();
}

json NeedsToJson(const NeedValues& n) {
    json j = json::object();
    for (Need k : kAllNeeds) j[std::string(to_string(k))] = n[k];
    return j;
}

NeedValues NeedsFromJson(const json& j) {
    NeedValues n;
    for (Need k : kAllNeeds)
        n[k] = j.value(std::string(to_string(k)), 100.0);
    return n;
}

Direction DirectionFromString(const std::string& s) {
    for (Direction d : {Direction::Down, Direction::Up, Direction::Left, Direction::Right})
        if (to_string(d) == s) return d;
    return Direction::Down;
}

} // namespace

std::string FormatTime(int hour, int minute) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", hour, minute);
    return buf;
}

void to_json(json& j, const ScheduleEntry& v) {
    j = json{{"time", v.time}, {"activity", v.activity}};
    PutOpt(j, "location", v.location);
    PutOpt(j, "note", v.note);
}

void from_json(const json& j, ScheduleEntry& v) {
    v.time = j.at("time").get<std::string>();
    v.activity = j.at("activity").get<std::string>();
    GetOpt(j, "location", v.location);
    GetOpt(j, "note", v.note);
}

void to_json(json& j, const DailySchedule& v) {
    j = json{{"characterId", v.characterId}, {"day", v.day}, {"entries", v.entries}};
}

void from_json(const json& j, DailySchedule& v) {
    v.characterId = j.at("characterId").get<std::string>();
    v.day = j.at("day").get<int>();
    v.entries = j.value("entries", std::vector<ScheduleEntry>{});
}

void to_json(json& j, const ActionHistoryEntry& v) {
    j = json{{"time", v.time}, {"actionId", v.actionId}};
    PutOpt(j, "target", v.target);
    PutOpt(j, "durationMinutes", v.durationMinutes);
    PutOpt(j, "reason", v.reason);
}

void from_json(const json& j, ActionHistoryEntry& v) {
    v.time = j.at("time").get<std::string>();
    v.actionId = j.at("actionId").get<std::string>();
    GetOpt(j, "target", v.target);
    GetOpt(j, "durationMinutes", v.durationMinutes);
    GetOpt(j, "reason", v.reason);
}

void to_json(json& j, const CharacterSnapshot& v) {
    j = json{
        {"id", v.id},
        {"needs", NeedsToJson(v.needs)},
        {"money", v.money},
        {"mapId", v.mapId},
        {"nodeId", v.nodeId},
        {"direction", std::string(to_string(v.direction))},
        {"actionCounter", v.actionCounter},
    };
    PutOpt(j, "jobId", v.jobId);
}

void from_json(const json& j, CharacterSnapshot& v) {
    v.id = j.at("id").get<std::string>();
    v.needs = NeedsFromJson(j.value("needs", json::object()));
    v.money = j.value("money", 0);
    GetOpt(j, "jobId", v.jobId);
    v.mapId = j.at("mapId").get<std::string>();
    v.nodeId = j.at("nodeId").get<std::string>();
    v.direction = DirectionFromString(j.value("direction", std::string("down")));
    v.actionCounter = j.value("actionCounter", 0);
}

void to_json(json& j, const WorldSnapshot& v) {
    j = json{
        {"schema_version", v.schemaVersion},
        {"characters", v.characters},
        {"currentMapId", v.currentMapId},
        {"time", {{"hour", v.time.hour}, {"minute", v.time.minute}, {"day", v.time.day}}},
        {"serverStartMs", v.serverStartMs},
        {"savedAtMs", v.savedAtMs},
        {"tick", v.tick},
    };
}

void from_json(const json& j, WorldSnapshot& v) {
    v.schemaVersion = j.value("schema_version", 1);
    v.characters = j.value("characters", std::vector<CharacterSnapshot>{});
    v.currentMapId = j.value("currentMapId", std::string{});
    if (auto t = j.find("time"); t != j.end() && t->is_object()) {
        v.time.hour = t->value("hour", 0);
        v.time.minute = t->value("minute", 0);
        v.time.day = t->value("day", 1);
    }
    v.serverStartMs = j.value("serverStartMs", TimestampMs{0});
    v.savedAtMs = j.value("savedAtMs", TimestampMs{0});
    v.tick = j.value("tick", std::uint64_t{0});
}

} // namespace townlife::persist

// src/core/Config.cpp
#include "townlife/core/Config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <utility>

namespace townlife::config {

namespace {

// Reads j[key] into out when present and of the right type; logs otherwise.
template <typename T>
void Read(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->template get<T>();
    } catch (const json::exception& e) {
        spdlog::warn("[Config] ignoring '{}': {}", key, e.what());
    }
}

template <typename T>
void Read(const json& j, const char* key, std::optional<T>& out) {
    T value{};
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        value = it->template get<T>();
        out = value;
    } catch (const json::exception& e) {
        spdlog::warn("[Config] ignoring '{}': {}", key, e.what());
    }
}

NeedRates ReadRates(const json& j) {
    NeedRates r;
    if (!j.is_object()) return r;
    for (Need n : kAllNeeds) {
        std::optional<double> v;
        Read(j, std::string(to_string(n)).c_str(), v);
        r[n] = v;
    }
    return r;
}

json WriteRates(const NeedRates& r) {
    json j = json::object();
    for (Need n : kAllNeeds)
        if (r[n]) j[std::string(to_string(n))] = *r[n];
    return j;
}

ActionConfig ReadAction(const json& j, ActionConfig a) {
    if (auto it = j.find("durationRange"); it != j.end() && it->is_object()) {
        DurationRange range = a.durationRange.value_or(DurationRange{});
        Read(*it, "min", range.min);
        Read(*it, "max", range.max);
        Read(*it, "default", range.def);
        a.durationRange = range;
        a.fixed = false;
    }
    if (auto it = j.find("perMinute"); it != j.end()) a.perMinute = ReadRates(*it);
    Read(j, "fixed", a.fixed);
    Read(j, "duration", a.durationMinutes);
    if (auto it = j.find("effects"); it != j.end()) a.effects = ReadRates(*it);
    Read(j, "cost", a.cost);
    Read(j, "ownerOnly", a.ownerOnly);
    Read(j, "requiresEmployment", a.requiresEmployment);
    Read(j, "requiresNpc", a.requiresNpc);
    Read(j, "system", a.system);
    Read(j, "paysWage", a.paysWage);
    Read(j, "indicator", a.indicator);
    return a;
}

ActionConfig Variable(DurationRange range, NeedRates perMinute, std::string indicator) {
    ActionConfig a;
    a.fixed = false;
    a.durationMinutes = range.def;
    a.durationRange = range;
    a.perMinute = perMinute;
    a.indicator = std::move(indicator);
    return a;
}

ActionConfig Fixed(int minutes, NeedRates effects, std::string indicator) {
    ActionConfig a;
    a.fixed = true;
    a.durationMinutes = minutes;
    a.effects = effects;
    a.indicator = std::move(indicator);
    return a;
}

NeedRates Rates(std::initializer_list<std::pair<Need, double>> entries) {
    NeedRates r;
    for (auto [n, v] : entries) r[n] = v;
    return r;
}

} // namespace

double DecayRates::operator[](Need n) const {
    switch (n) {
        case Need::Satiety: return satiety;
        case Need::Energy:  return energy;
        case Need::Hygiene: return hygiene;
        case Need::Mood:    return mood;
        case Need::Bladder: return bladder;
    }
    return 0.0;
}

int DurationRange::clamp(std::optional<int> requested) const {
    return std::clamp(requested.value_or(def), min, std::max(min, max));
}

ActionCatalog DefaultActionCatalog() {
    ActionCatalog c;
    c["eat"]    = Variable({15, 60, 30},   Rates({{Need::Satiety, 2.0}, {Need::Mood, 0.5}}), "eating");
    c["sleep"]  = Variable({60, 480, 360}, Rates({{Need::Energy, 0.5}, {Need::Mood, 0.1}}), "sleeping");
    c["toilet"] = Variable({3, 15, 5},     Rates({{Need::Bladder, 20.0}}), "toilet");
    c["bathe"]  = Variable({15, 60, 30},   Rates({{Need::Hygiene, 2.0}, {Need::Mood, 0.5}}), "bathing");
    c["work"]   = Variable({60, 480, 240}, Rates({{Need::Energy, -0.3}, {Need::Mood, -0.1}}), "working");
    c["rest"]   = Fixed(15, Rates({{Need::Energy, 10.0}, {Need::Mood, 5.0}}), "resting");
    c["talk"]   = Fixed(10, Rates({{Need::Mood, 10.0}}), "talking");
    c["thinking"] = Fixed(0, {}, "thinking");

    c["eat"].ownerOnly = true;
    c["sleep"].ownerOnly = true;
    c["bathe"].ownerOnly = true;
    c["work"].requiresEmployment = true;
    c["work"].paysWage = true;
    c["talk"].requiresNpc = true;
    c["thinking"].system = true;
    return c;
}

SimulationConfig ParseConfig(const json& j) {
    SimulationConfig cfg;
    if (!j.is_object()) {
        spdlog::warn("[Config] root is not an object; using defaults");
        return cfg;
    }

    Read(j, "tickRate", cfg.tickRate);
    Read(j, "notifyEveryTicks", cfg.notifyEveryTicks);
    cfg.tickRate = std::max(1, cfg.tickRate);
    cfg.notifyEveryTicks = std::max(1, cfg.notifyEveryTicks);

    if (auto it = j.find("movement"); it != j.end() && it->is_object()) {
        Read(*it, "speed", cfg.movement.speed);
        Read(*it, "transitionSeconds", cfg.movement.transitionSeconds);
        Read(*it, "facilityProximity", cfg.movement.facilityProximity);
    }

    if (auto it = j.find("time"); it != j.end() && it->is_object()) {
        Read(*it, "timezone", cfg.time.timezone);
        Read(*it, "utcOffsetMinutes", cfg.time.utcOffsetMinutes);
        Read(*it, "statusDecayIntervalMs", cfg.time.statusDecayIntervalMs);
        if (auto r = it->find("decayRates"); r != it->end() && r->is_object()) {
            Read(*r, "satietyPerMinute", cfg.time.decayRates.satiety);
            Read(*r, "energyPerMinute", cfg.time.decayRates.energy);
            Read(*r, "hygienePerMinute", cfg.time.decayRates.hygiene);
            Read(*r, "moodPerMinute", cfg.time.decayRates.mood);
            Read(*r, "bladderPerMinute", cfg.time.decayRates.bladder);
        }
    }

    if (auto it = j.find("behavior"); it != j.end() && it->is_object()) {
        BehaviorConfig& b = cfg.behavior;
        Read(*it, "interruptThreshold", b.interruptThreshold);
        Read(*it, "urgentThreshold", b.urgentThreshold);
        Read(*it, "retryDelayMs", b.retryDelayMs);
        Read(*it, "moveRetryDelayMs", b.moveRetryDelayMs);
        Read(*it, "idleRetryDelayMs", b.idleRetryDelayMs);
        Read(*it, "stuckRetryDelayMs", b.stuckRetryDelayMs);
        Read(*it, "wanderEveryNActions", b.wanderEveryNActions);
        Read(*it, "wanderMaxHops", b.wanderMaxHops);
        Read(*it, "nearbyMapHops", b.nearbyMapHops);
        Read(*it, "restChance", b.restChance);
        Read(*it, "safeMapId", b.safeMapId);
        Read(*it, "seed", b.seed);
    }

    if (auto it = j.find("persistence"); it != j.end() && it->is_object()) {
        Read(*it, "saveIntervalMs", cfg.persistence.saveIntervalMs);
        std::string dir;
        Read(*it, "directory", dir);
        if (!dir.empty()) cfg.persistence.directory = dir;
    }

    if (auto it = j.find("actions"); it != j.end() && it->is_object()) {
        for (const auto& [id, body] : it->items()) {
            if (!body.is_object()) {
                spdlog::warn("[Config] action '{}' is not an object", id);
                continue;
            }
            auto existing = cfg.actions.find(id);
            cfg.actions[id] = ReadAction(body, existing != cfg.actions.end() ? existing->second : ActionConfig{});
        }
    }

    Read(j, "facilityTags", cfg.facilityTags);
    return cfg;
}

json ToJson(const SimulationConfig& cfg) {
    json j;
    j["tickRate"] = cfg.tickRate;
    j["notifyEveryTicks"] = cfg.notifyEveryTicks;
    j["movement"] = {
        {"speed", cfg.movement.speed},
        {"transitionSeconds", cfg.movement.transitionSeconds},
        {"facilityProximity", cfg.movement.facilityProximity},
    };
    j["time"] = {
        {"timezone", cfg.time.timezone},
        {"utcOffsetMinutes", cfg.time.utcOffsetMinutes},
        {"statusDecayIntervalMs", cfg.time.statusDecayIntervalMs},
        {"decayRates", {
            {"satietyPerMinute", cfg.time.decayRates.satiety},
            {"energyPerMinute", cfg.time.decayRates.energy},
            {"hygienePerMinute", cfg.time.decayRates.hygiene},
            {"moodPerMinute", cfg.time.decayRates.mood},
            {"bladderPerMinute", cfg.time.decayRates.bladder},
        }},
    };

    const BehaviorConfig& b = cfg.behavior;
    j["behavior"] = {
        {"interruptThreshold", b.interruptThreshold},
        {"urgentThreshold", b.urgentThreshold},
        {"retryDelayMs", b.retryDelayMs},
        {"moveRetryDelayMs", b.moveRetryDelayMs},
        {"idleRetryDelayMs", b.idleRetryDelayMs},
        {"stuckRetryDelayMs", b.stuckRetryDelayMs},
        {"wanderEveryNActions", b.wanderEveryNActions},
        {"wanderMaxHops", b.wanderMaxHops},
        {"nearbyMapHops", b.nearbyMapHops},
        {"restChance", b.restChance},
        {"seed", b.seed},
    };
    if (b.safeMapId) j["behavior"]["safeMapId"] = *b.safeMapId;

    j["persistence"] = {
        {"saveIntervalMs", cfg.persistence.saveIntervalMs},
        {"directory", cfg.persistence.directory.string()},
    };

    json actions = json::object();
    for (const auto& [id, a] : cfg.actions) {
        json body;
        body["fixed"] = a.fixed;
        body["duration"] = a.durationMinutes;
        if (!a.effects.empty()) body["effects"] = WriteRates(a.effects);
        if (a.durationRange)
            body["durationRange"] = {{"min", a.durationRange->min},
                                     {"max", a.durationRange->max},
                                     {"default", a.durationRange->def}};
        if (!a.perMinute.empty()) body["perMinute"] = WriteRates(a.perMinute);
        if (a.cost) body["cost"] = *a.cost;
        body["ownerOnly"] = a.ownerOnly;
        body["requiresEmployment"] = a.requiresEmployment;
        body["requiresNpc"] = a.requiresNpc;
        body["system"] = a.system;
        body["paysWage"] = a.paysWage;
        body["indicator"] = a.indicator;
        actions[id] = std::move(body);
    }
    j["actions"] = std::move(actions);
    if (!cfg.facilityTags.empty()) j["facilityTags"] = cfg.facilityTags;
    return j;
}

std::expected<SimulationConfig, ConfigError> LoadConfig(const std::filesystem::path& file) {
    std::ifstream ifs(file, std::ios::binary);
    if (!ifs)
        return std::unexpected(ConfigError{ConfigError::Code::IoOpenFail, "Cannot open file: " + file.string()});

    try {
        json doc = json::parse(ifs);
        if (!doc.is_object())
            return std::unexpected(ConfigError{ConfigError::Code::JsonTypeError, "Root JSON must be an object"});
        return ParseConfig(doc);
    } catch (const json::parse_error& e) {
        return std::unexpected(ConfigError{ConfigError::Code::JsonParseError, e.what()});
    }
}

} // namespace townlife::config

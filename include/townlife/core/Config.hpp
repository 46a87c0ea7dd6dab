#pragma once
// include/townlife/core/Config.hpp
//
// Simulation configuration. Loaded from JSON; every key is optional and
// missing or malformed values keep their defaults.

#include "townlife/core/Types.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace townlife::config {

using json = nlohmann::json;

struct MovementConfig {
    double speed             = 150.0;  // pixels per second
    double transitionSeconds = 0.5;    // per fade phase
    double facilityProximity = 40.0;   // pixels around a building that count as "at" it
};

struct DecayRates {
    double satiety = 0.1;
    double energy  = 0.05;
    double hygiene = 0.03;
    double mood    = 0.02;
    double bladder = 0.15;

    double operator[](Need n) const;
};

struct TimeConfig {
    std::string timezone             = "Asia/Tokyo";   // IANA name; empty = fixed offset
    int        utcOffsetMinutes      = 540;     // used when the zone cannot be resolved
    int        statusDecayIntervalMs = 60'000;
    DecayRates decayRates;
};

struct BehaviorConfig {
    double               interruptThreshold  = 10.0;
    double               urgentThreshold     = 20.0;
    int                  retryDelayMs        = 1'000;
    int                  moveRetryDelayMs    = 1'000;
    int                  idleRetryDelayMs    = 2'000;
    int                  stuckRetryDelayMs   = 5'000;
    int                  wanderEveryNActions = 3;
    int                  wanderMaxHops       = 2;
    int                  nearbyMapHops       = 3;
    double               restChance          = 0.1;
    std::optional<MapId> safeMapId;
    std::uint64_t        seed                = 0x70776e6cull;
};

struct PersistenceConfig {
    int                   saveIntervalMs = 30'000;
    std::filesystem::path directory;    // empty = in-memory store
};

struct DurationRange {
    int min = 0;
    int max = 0;
    int def = 0;

    int clamp(std::optional<int> requested) const;
};

// Either fixed (duration + effects applied on completion) or variable
// (duration range + per-minute effects that replace decay while active).
struct ActionConfig {
    bool                         fixed = true;
    int                          durationMinutes = 0;
    NeedRates                    effects;
    std::optional<DurationRange> durationRange;
    NeedRates                    perMinute;

    std::optional<int> cost;                    // flat cost; otherwise the facility's cost applies
    bool               ownerOnly          = false;
    bool               requiresEmployment = false;
    bool               requiresNpc        = false;
    bool               system             = false;  // placeholder actions ("thinking")
    bool               paysWage           = false;
    std::string        indicator;
};

using ActionCatalog = std::map<ActionId, ActionConfig>;

ActionCatalog DefaultActionCatalog();

struct SimulationConfig {
    int               tickRate         = 20;
    int               notifyEveryTicks = 5;
    MovementConfig    movement;
    TimeConfig        time;
    BehaviorConfig    behavior;
    PersistenceConfig persistence;
    ActionCatalog     actions = DefaultActionCatalog();
    std::map<std::string, ActionId> facilityTags;   // empty = built-in mapping
};

struct ConfigError {
    enum class Code { IoOpenFail, JsonParseError, JsonTypeError } code{};
    std::string message;
};

SimulationConfig ParseConfig(const json& j);
json             ToJson(const SimulationConfig& cfg);

std::expected<SimulationConfig, ConfigError> LoadConfig(const std::filesystem::path& file);

} // namespace townlife::config

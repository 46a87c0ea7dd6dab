// src/persist/JsonFileStore.cpp
#include "townlife/persist/StateStore.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <fstream>
#include <string>
#include <system_error>

namespace townlife::persist {

namespace fs = std::filesystem;

namespace {

// Character ids end up in file names.
std::string SafeName(const AgentId& id) {
    std::string out;
    out.reserve(id.size());
    for (unsigned char c : id)
        out.push_back(std::isalnum(c) || c == '-' || c == '_' ? static_cast<char>(c) : '_');
    return out;
}

} // namespace

std::expected<json, StoreError> ReadJsonFile(const fs::path& file) {
    try {
        std::ifstream ifs(file, std::ios::binary);
        if (!ifs)
            return std::unexpected(StoreError{StoreError::Code::IoOpenFail, "Cannot open file: " + file.string()});
        return json::parse(ifs);
    } catch (const json::parse_error& e) {
        return std::unexpected(StoreError{StoreError::Code::JsonParseError, e.what()});
    }
}

std::expected<void, StoreError> WriteJsonFileAtomic(const json& doc, const fs::path& file) {
    try {
        const std::string serialized = doc.dump(2);

        std::error_code ec;
        if (!file.parent_path().empty()) {
            fs::create_directories(file.parent_path(), ec);
            if (ec)
                return std::unexpected(StoreError{StoreError::Code::IoWriteFail,
                                                  "Cannot create " + file.parent_path().string() + ": " + ec.message()});
        }

        const fs::path tmp = file.string() + ".tmp";
        {
            std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
            if (!ofs)
                return std::unexpected(StoreError{StoreError::Code::IoWriteFail, "Cannot open for write: " + tmp.string()});
            ofs.write(serialized.data(), static_cast<std::streamsize>(serialized.size()));
            ofs.flush();
            if (!ofs)
                return std::unexpected(StoreError{StoreError::Code::IoWriteFail, "Write failed for: " + tmp.string()});
        }

        // rename(2) replaces the target atomically on POSIX filesystems.
        fs::rename(tmp, file, ec);
        if (ec) {
            fs::remove(tmp, ec);
            return std::unexpected(StoreError{StoreError::Code::IoWriteFail, "Rename failed for: " + file.string()});
        }
        return {};
    } catch (const json::type_error& e) {
        return std::unexpected(StoreError{StoreError::Code::JsonTypeError, e.what()});
    }
}

JsonFileStore::JsonFileStore(fs::path root) : root_(std::move(root)) {}

fs::path JsonFileStore::statePath() const { return root_ / "state.json"; }

fs::path JsonFileStore::schedulePath(const AgentId& characterId, int day) const {
    return root_ / "schedules" / (SafeName(characterId) + "_day" + std::to_string(day) + ".json");
}

fs::path JsonFileStore::historyPath(const AgentId& characterId, int day) const {
    return root_ / "history" / (SafeName(characterId) + "_day" + std::to_string(day) + ".json");
}

bool JsonFileStore::saveState(const WorldSnapshot& snapshot) {
    std::lock_guard lock(mutex_);
    auto r = WriteJsonFileAtomic(json(snapshot), statePath());
    if (!r) {
        spdlog::error("[Store] saveState failed: {}", r.error().message);
        return false;
    }
    return true;
}

std::optional<WorldSnapshot> JsonFileStore::loadState() {
    std::lock_guard lock(mutex_);
    auto doc = ReadJsonFile(statePath());
    if (!doc) {
        if (doc.error().code != StoreError::Code::IoOpenFail)
            spdlog::error("[Store] loadState failed: {}", doc.error().message);
        return std::nullopt;
    }
    try {
        return doc->get<WorldSnapshot>();
    } catch (const json::exception& e) {
        spdlog::error("[Store] state.json is malformed: {}", e.what());
        return std::nullopt;
    }
}

bool JsonFileStore::saveSchedule(const DailySchedule& schedule) {
    std::lock_guard lock(mutex_);
    auto r = WriteJsonFileAtomic(json(schedule), schedulePath(schedule.characterId, schedule.day));
    if (!r) {
        spdlog::error("[Store] saveSchedule({}, day {}) failed: {}", schedule.characterId, schedule.day,
                      r.error().message);
        return false;
    }
    return true;
}

std::optional<DailySchedule> JsonFileStore::loadSchedule(const AgentId& characterId, int day) {
    std::lock_guard lock(mutex_);
    auto doc = ReadJsonFile(schedulePath(characterId, day));
    if (!doc) return std::nullopt;
    try {
        return doc->get<DailySchedule>();
    } catch (const json::exception& e) {
        spdlog::warn("[Store] schedule for {} day {} is malformed: {}", characterId, day, e.what());
        return std::nullopt;
    }
}

bool JsonFileStore::addActionHistory(const AgentId& characterId, int day, const ActionHistoryEntry& entry) {
    std::lock_guard lock(mutex_);
    const fs::path file = historyPath(characterId, day);

    json entries = json::array();
    if (auto doc = ReadJsonFile(file); doc && doc->is_array())
        entries = std::move(*doc);
    entries.push_back(entry);

    auto r = WriteJsonFileAtomic(entries, file);
    if (!r) {
        spdlog::error("[Store] addActionHistory({}) failed: {}", characterId, r.error().message);
        return false;
    }
    return true;
}

std::vector<ActionHistoryEntry> JsonFileStore::loadActionHistory(const AgentId& characterId, int day) {
    std::lock_guard lock(mutex_);
    auto doc = ReadJsonFile(historyPath(characterId, day));
    if (!doc || !doc->is_array()) return {};
    try {
        return doc->get<std::vector<ActionHistoryEntry>>();
    } catch (const json::exception& e) {
        spdlog::warn("[Store] history for {} day {} is malformed: {}", characterId, day, e.what());
        return {};
    }
}

bool JsonFileStore::hasData() {
    std::lock_guard lock(mutex_);
    std::error_code ec;
    return fs::exists(statePath(), ec);
}

void JsonFileStore::clear() {
    std::lock_guard lock(mutex_);
    std::error_code ec;
    fs::remove(statePath(), ec);
    fs::remove_all(root_ / "schedules", ec);
    fs::remove_all(root_ / "history", ec);
    if (ec) spdlog::warn("[Store] clear: {}", ec.message());
}

} // namespace townlife::persist

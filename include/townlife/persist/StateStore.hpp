#pragma once
// include/townlife/persist/StateStore.hpp
//
// Persistence contract. Implementations are called from the tick thread and
// from TaskPool workers, so they must be internally synchronized. Nothing
// throws across this interface: failures come back as false / nullopt.

#include "townlife/persist/Snapshot.hpp"

#include <expected>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace townlife::persist {

class StateStore {
public:
    virtual ~StateStore() = default;

    virtual bool                         saveState(const WorldSnapshot& snapshot) = 0;
    virtual std::optional<WorldSnapshot> loadState() = 0;

    virtual bool                         saveSchedule(const DailySchedule& schedule) = 0;
    virtual std::optional<DailySchedule> loadSchedule(const AgentId& characterId, int day) = 0;

    virtual bool addActionHistory(const AgentId& characterId, int day, const ActionHistoryEntry& entry) = 0;
    virtual std::vector<ActionHistoryEntry> loadActionHistory(const AgentId& characterId, int day) = 0;

    virtual bool hasData() = 0;
    virtual void clear() = 0;
};

class MemoryStore final : public StateStore {
public:
    bool                         saveState(const WorldSnapshot& snapshot) override;
    std::optional<WorldSnapshot> loadState() override;

    bool                         saveSchedule(const DailySchedule& schedule) override;
    std::optional<DailySchedule> loadSchedule(const AgentId& characterId, int day) override;

    bool addActionHistory(const AgentId& characterId, int day, const ActionHistoryEntry& entry) override;
    std::vector<ActionHistoryEntry> loadActionHistory(const AgentId& characterId, int day) override;

    bool hasData() override;
    void clear() override;

private:
    using Key = std::pair<AgentId, int>;

    std::mutex                                 mutex_;
    std::optional<WorldSnapshot>               state_;
    std::map<Key, DailySchedule>               schedules_;
    std::map<Key, std::vector<ActionHistoryEntry>> history_;
};

struct StoreError {
    enum class Code { IoOpenFail, IoWriteFail, JsonParseError, JsonTypeError } code{};
    std::string message;
};

// Layout under the root directory:
//   state.json
//   schedules/<character>_day<N>.json
//   history/<character>_day<N>.json
// Every write goes to <file>.tmp first and is renamed over the target.
class JsonFileStore final : public StateStore {
public:
    explicit JsonFileStore(std::filesystem::path root);

    bool                         saveState(const WorldSnapshot& snapshot) override;
    std::optional<WorldSnapshot> loadState() override;

    bool                         saveSchedule(const DailySchedule& schedule) override;
    std::optional<DailySchedule> loadSchedule(const AgentId& characterId, int day) override;

    bool addActionHistory(const AgentId& characterId, int day, const ActionHistoryEntry& entry) override;
    std::vector<ActionHistoryEntry> loadActionHistory(const AgentId& characterId, int day) override;

    bool hasData() override;
    void clear() override;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path statePath() const;
    std::filesystem::path schedulePath(const AgentId& characterId, int day) const;
    std::filesystem::path historyPath(const AgentId& characterId, int day) const;

    std::mutex            mutex_;
    std::filesystem::path root_;
};

// Whole-document helpers used by JsonFileStore.
std::expected<json, StoreError> ReadJsonFile(const std::filesystem::path& file);
std::expected<void, StoreError> WriteJsonFileAtomic(const json& doc, const std::filesystem::path& file);

} // namespace townlife::persist

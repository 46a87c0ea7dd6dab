#pragma once
// include/townlife/sim/Events.hpp
//
// One event enum, one dispatcher. Systems post events while they iterate the
// registry; the engine dispatches the queue between tick phases, so handlers
// are free to mutate agent components.

#include "townlife/core/Types.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace townlife::sim {

enum class EventKind : std::uint8_t {
    ActionStarted,
    ActionCompleted,
    NavigationStarted,
    NavigationCompleted,
    MapTransition,
    NeedInterrupt,
    PendingActionFailed,
    DecisionApplied,
    DecisionDiscarded,
    DayChanged
};

std::string_view to_string(EventKind k);

struct Event {
    EventKind           kind;
    AgentId             agentId;
    std::string         subject;   // action id, map id or node id depending on kind
    std::optional<Need> need;      // NeedInterrupt only
    std::string         msg;
};

class EventBus {
public:
    using Handler = std::function<void(const Event&)>;

    struct ReplayEntry { std::uint64_t t; Event e; };

    explicit EventBus(std::size_t replayCapacity = 512) : replayCapacity_(replayCapacity) {}

    int subscribe(EventKind k, Handler h) {
        int id = ++sid_;
        subs_[k].emplace_back(id, std::move(h));
        return id;
    }
    // Receives every event (activity log feed).
    int subscribeAll(Handler h) {
        int id = ++sid_;
        all_.emplace_back(id, std::move(h));
        return id;
    }
    void unsubscribe(int id);
    void unsubscribeAll() { subs_.clear(); all_.clear(); }

    // Dispatch immediately.
    void publish(const Event& e);

    // Queue for the next dispatch().
    void post(Event e) { queue_.push_back(std::move(e)); }

    // Drain the queue, including events posted by handlers. Returns the count.
    std::size_t dispatch();

    bool hasQueued() const { return !queue_.empty(); }

    void clearReplay() { replay_.clear(); }
    const std::deque<ReplayEntry>& replay() const { return replay_; }

private:
    int                 sid_   = 0;
    std::uint64_t       stamp_ = 0;
    std::size_t         replayCapacity_;
    std::unordered_map<EventKind, std::vector<std::pair<int, Handler>>> subs_;
    std::vector<std::pair<int, Handler>> all_;
    std::deque<Event>       queue_;
    std::deque<ReplayEntry> replay_;
};

} // namespace townlife::sim

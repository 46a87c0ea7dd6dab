#pragma once
// include/townlife/ai/BehaviorOrchestrator.hpp
//
// Single-flight behavior decisions per agent.
//
//   decide()/interrupt()  (tick thread)
//     -> placeholder "thinking" action + context copy
//     -> decider runs on a TaskPool worker
//     -> result lands in the mailbox
//   drain()               (tick thread)
//     -> placeholder removed, idleness re-checked, stale results discarded
//     -> schedule update, then the intent is applied
//
// Also owns pending-action resolution, delayed re-decisions and forced
// wandering.

#include "townlife/ai/BehaviorDecider.hpp"
#include "townlife/core/Config.hpp"
#include "townlife/core/Rng.hpp"
#include "townlife/sim/ActionExecutor.hpp"
#include "townlife/sim/Events.hpp"
#include "townlife/sim/NavigationSystem.hpp"
#include "townlife/sim/NeedDecay.hpp"
#include "townlife/sim/ScheduleBook.hpp"
#include "townlife/sim/WorldState.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace townlife::jobs { class TaskPool; }

namespace townlife::ai {

struct OrchestratorDeps {
    sim::WorldState&       world;
    sim::EventBus&         bus;
    sim::NavigationSystem& navigation;
    sim::IActionExecutor&  executor;
    sim::ScheduleBook&     schedule;
    sim::NeedDecayModel&   decay;
    jobs::TaskPool&        pool;
};

class BehaviorOrchestrator {
public:
    BehaviorOrchestrator(OrchestratorDeps deps,
                         std::shared_ptr<BehaviorDecider> decider,
                         config::BehaviorConfig behavior,
                         world::FacilityMapping mapping,
                         double facilityProximity);
    ~BehaviorOrchestrator();

    BehaviorOrchestrator(const BehaviorOrchestrator&) = delete;
    BehaviorOrchestrator& operator=(const BehaviorOrchestrator&) = delete;

    // Refused while a decision is in flight or the agent is busy.
    bool decide(const AgentId& agentId);

    // Forced-action decision for a need that crossed the interrupt threshold.
    bool interrupt(const AgentId& agentId, Need need);

    // Asks every idle character for a decision.
    void triggerInitialDecisions();

    // Starts the pending action of every character that has stopped
    // navigating. The pending action is cleared whether or not it starts;
    // a failure waits retryDelayMs before the next decision.
    void resolvePendingActions();

    // Applies finished decisions. Returns how many were processed.
    std::size_t drain();

    // Fires delayed re-decisions that are due at `now`.
    void fireDueTriggers();

    // Re-decide after `delayMs`; an earlier trigger for the agent wins.
    void scheduleDecision(const AgentId& agentId, int delayMs);

    // Picks a random map within wanderMaxHops and a free node on it, and
    // walks there without consulting the decider.
    bool wander(const AgentId& agentId);

    // Context as the decider would see it.
    BehaviorContext buildContext(entt::entity e) const;

    void        setNow(TimestampMs nowMs) { now_ = nowMs; }
    TimestampMs now() const { return now_; }

    bool        isPending(const AgentId& agentId) const { return pending_.contains(agentId); }
    std::size_t pendingCount() const { return pending_.size(); }
    std::size_t triggerCount() const { return triggers_.size(); }
    bool        hasTrigger(const AgentId& agentId) const { return triggers_.contains(agentId); }

    // Blocks until every in-flight decider call has delivered its result.
    void waitIdle();

    // Forget in-flight decisions and timers (restore, shutdown).
    void reset();

private:
    struct Completion {
        AgentId                         agentId;
        std::uint64_t                   ticket = 0;
        std::optional<ActionId>         forcedAction;
        std::optional<BehaviorDecision> decision;
        std::string                     error;
    };

    // Erases the pending entry on scope exit unless released; only an entry
    // that still carries the same ticket is erased.
    class PendingGuard {
    public:
        PendingGuard(BehaviorOrchestrator& owner, AgentId agentId, std::uint64_t ticket)
            : owner_(owner), agentId_(std::move(agentId)), ticket_(ticket) {}
        ~PendingGuard();
        PendingGuard(const PendingGuard&) = delete;
        PendingGuard& operator=(const PendingGuard&) = delete;
        void release() { released_ = true; }

    private:
        BehaviorOrchestrator& owner_;
        AgentId               agentId_;
        std::uint64_t         ticket_;
        bool                  released_ = false;
    };

    bool launch(const AgentId& agentId, entt::entity e, std::optional<ActionId> forcedAction);
    void deliver(Completion c);
    void resolve(const Completion& c);

    void applyIdle(const AgentId& agentId, entt::entity e, const IdleDecision& d, bool forced);
    void applyMove(const AgentId& agentId, entt::entity e, const MoveDecision& d);
    void applyAction(const AgentId& agentId, entt::entity e, ActionDecision d, bool forced);

    bool startNow(const AgentId& agentId, const ActionDecision& d);
    bool approachNpc(const AgentId& agentId, entt::entity e, const ActionDecision& d);
    bool approachFacility(const AgentId& agentId, entt::entity e, const ActionDecision& d);
    void fallbackToSafeMap(const AgentId& agentId, entt::entity e, const ActionId& action);

    void onActionCompleted(const sim::Event& ev);
    void onNavigationCompleted(const sim::Event& ev);
    void onNeedInterrupt(const sim::Event& ev);
    void onPendingActionFailed(const sim::Event& ev);

    sim::WorldState&       world_;
    sim::EventBus&         bus_;
    sim::NavigationSystem& navigation_;
    sim::IActionExecutor&  executor_;
    sim::ScheduleBook&     schedule_;
    sim::NeedDecayModel&   decay_;
    jobs::TaskPool&        pool_;

    std::shared_ptr<BehaviorDecider> decider_;
    config::BehaviorConfig           behavior_;
    world::FacilityMapping           mapping_;
    double                           proximity_;

    TimestampMs   now_ = 0;
    std::uint64_t nextTicket_ = 0;
    rng::Pcg32    rng_;

    std::unordered_map<AgentId, std::uint64_t> pending_;    // tick thread only
    std::unordered_map<AgentId, TimestampMs>   triggers_;   // tick thread only
    // Agents whose pending action was settled this tick; their arrival
    // event must not start another decision.
    std::unordered_set<AgentId>                settledOnArrival_;

    std::mutex              mailboxMutex_;
    std::vector<Completion> mailbox_;

    std::vector<int> subscriptions_;
};

} // namespace townlife::ai

#pragma once

#include "core/Types.hpp"
#include "core/TemporalContext.hpp"
#include "agents/Agent.hpp"
#include "engine/DecisionEngine.hpp"
#include "engine/LearningEngine.hpp"
#include "engine/MarketInfluenceModel.hpp"
#include "network/RelationshipNetwork.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace merchant {

    struct TurnResult {
        AgentId agentId;
        Decision decision;
        std::optional<Outcome> outcome;     // empty for HOLD
    };

    // Runs one turn for every owned agent: decide, hand non-HOLD decisions to
    // the external executor, feed the outcome back into learning.
    // The engines are constructed by the caller and outlive the system.
    class MerchantSystem {
    public:
        // Settles a decision (mutating the agent) and reports what happened
        using TradeExecutor = std::function<Outcome(Agent&, const Decision&)>;
        using DecisionCallback = std::function<void(const Agent&, const Decision&)>;

        MerchantSystem(DecisionEngine& decisions,
            LearningEngine& learning,
            MarketInfluenceModel& influence,
            RelationshipNetwork& network);

        // Agent management
        Agent& addAgent(std::unique_ptr<Agent> agent);
        bool removeAgent(const AgentId& id);
        Agent* getAgent(const AgentId& id);
        const Agent* getAgent(const AgentId& id) const;
        std::vector<AgentId> agentIds() const;
        size_t agentCount() const;

        // Process one turn; results are ordered by agent id. The executor and
        // the decision callback may query the system; agents cannot be removed
        // until the turn ends.
        std::vector<TurnResult> runTurn(const MarketSnapshot& snapshot,
            const TemporalContext& context,
            const TradeExecutor& executor);

        // Aggregate influence of all agents, folded in ascending id order
        Influence marketInfluence() const;

        std::vector<PropagationEvent> shareInformation(const InformationPacket& info);

        // Strengthen (or weaken) the bond between two merchants after they interact
        bool updateNetwork(const AgentId& a, const AgentId& b, double interaction);

        // Per-personality stats
        std::map<std::string, PersonalityStats> getPersonalityStats() const;

        uint64_t getTurnCount() const;

        void setDecisionCallback(DecisionCallback cb) { decisionCallback_ = std::move(cb); }

    private:
        DecisionEngine& decisions_;
        LearningEngine& learning_;
        MarketInfluenceModel& influence_;
        RelationshipNetwork& network_;

        mutable std::shared_mutex mutex_;
        std::map<AgentId, std::unique_ptr<Agent>> agents_;
        std::map<std::string, PersonalityStats> personalityStats_;
        uint64_t turns_ = 0;

        DecisionCallback decisionCallback_;

        std::mutex turnMutex_;              // one turn at a time
        std::atomic<bool> inTurn_{ false };

        struct TurnGuard {
            std::atomic<bool>& flag;
            explicit TurnGuard(std::atomic<bool>& f) : flag(f) {}
            ~TurnGuard() { flag = false; }
        };

        void settle(Agent& agent, const Decision& decision, const Outcome& outcome);
        void recordStats(const std::string& personality, const TurnResult& result);
    };

} // namespace merchant

#pragma once

#include "core/Types.hpp"
#include "core/RuntimeConfig.hpp"
#include <deque>
#include <map>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace merchant {

    // Records trade outcomes per agent and adapts learned preferences.
    // Recording and adapting happen under one exclusive lock; every getter
    // returns a copy taken under a shared lock.
    class LearningEngine {
    public:
        explicit LearningEngine(const RuntimeConfig* cfg = nullptr);

        LearningEngine(const LearningEngine&) = delete;
        LearningEngine& operator=(const LearningEngine&) = delete;

        // Append to the bounded history (oldest evicted) and adapt preferences
        void recordOutcome(const AgentId& agentId, const Outcome& outcome);

        Preferences getPreferences(const AgentId& agentId) const;

        // successes / total, 0.5 with no history
        double successRate(const AgentId& agentId) const;

        // Mean profit, 0 with no history
        double averageProfit(const AgentId& agentId) const;

        // Empty until minPatternOutcomes outcomes are recorded
        std::optional<Pattern> analyzePatterns(const AgentId& agentId) const;

        size_t outcomeCount(const AgentId& agentId) const;
        std::vector<Outcome> getOutcomes(const AgentId& agentId) const;

        void reset(const AgentId& agentId);

    private:
        const RuntimeConfig* rtConfig_ = nullptr;

        mutable std::shared_mutex mutex_;
        std::map<AgentId, std::deque<Outcome>> outcomes_;
        std::map<AgentId, Preferences> preferences_;

        // Caller holds the exclusive lock
        void adapt(const AgentId& agentId, const Outcome& outcome);
    };

} // namespace merchant

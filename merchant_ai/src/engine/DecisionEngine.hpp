#pragma once

#include "core/Types.hpp"
#include "core/RuntimeConfig.hpp"
#include "core/TemporalContext.hpp"
#include "agents/Agent.hpp"
#include "strategies/TradingStrategy.hpp"
#include "utils/Random.hpp"
#include <map>
#include <memory>
#include <shared_mutex>
#include <vector>

namespace merchant {

    // Chooses a trading strategy per personality and market condition,
    // runs it, and shapes the result by the agent's personality.
    // Value, Momentum and Seasonal strategies are registered on construction.
    class DecisionEngine {
    public:
        explicit DecisionEngine(const RuntimeConfig* cfg = nullptr);

        DecisionEngine(const DecisionEngine&) = delete;
        DecisionEngine& operator=(const DecisionEngine&) = delete;

        // Strategy registry (replaces an existing strategy of the same kind)
        void registerStrategy(std::unique_ptr<TradingStrategy> strategy);
        bool unregisterStrategy(StrategyKind kind);
        bool hasStrategy(StrategyKind kind) const;

        // Mean per-item score in [0, 1]; 0.5 for an empty snapshot
        double evaluateMarket(const MarketSnapshot& snapshot) const;

        MarketCondition classify(double score) const;

        StrategyKind selectStrategy(const PersonalityProfile& personality, MarketCondition condition) const;

        // evaluate -> classify -> select -> strategy -> personality modifiers
        Decision decide(const Agent& agent,
            const MarketSnapshot& snapshot,
            const TemporalContext& context = TemporalContext()) const;

        // Per-item sell/buy screen in snapshot order, at most maxDecisions results.
        // Confidence carries a small jitter drawn from rng.
        std::vector<Decision> decideMany(const Agent& agent,
            const MarketSnapshot& snapshot,
            size_t maxDecisions,
            Random& rng) const;

        static Decision applyPersonalityModifiers(Decision decision, const PersonalityProfile& personality);

        // decideMany helpers
        static bool shouldSell(const PersonalityProfile& personality, const ItemQuote& item);
        static bool shouldBuy(const Agent& agent, const ItemQuote& item);
        static Quantity buyQuantity(const Agent& agent, const ItemQuote& item);
        static Quantity sellQuantity(const PersonalityProfile& personality);

    private:
        const RuntimeConfig* rtConfig_ = nullptr;

        mutable std::shared_mutex mutex_;
        std::map<StrategyKind, std::unique_ptr<TradingStrategy>> strategies_;

        StrategyKind selectStrategyLocked(const PersonalityProfile& personality, MarketCondition condition) const;

        double itemConfidence(const PersonalityProfile& personality, const ItemQuote& item, Random& rng) const;
    };

} // namespace merchant

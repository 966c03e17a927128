#pragma once

#include "core/Types.hpp"
#include "core/TemporalContext.hpp"
#include "agents/Agent.hpp"
#include <memory>
#include <string>

namespace merchant {

    enum class StrategyKind {
        VALUE,
        MOMENTUM,
        SEASONAL
    };

    std::string strategyName(StrategyKind kind);

    // Pure evaluation of a snapshot into one candidate decision.
    // Implementations always return a decision (HOLD when nothing qualifies),
    // keep confidence in [0, 1] and never return a negative quantity.
    class TradingStrategy {
    public:
        virtual ~TradingStrategy() = default;

        virtual Decision evaluate(const Agent& agent,
            const MarketSnapshot& snapshot,
            const TemporalContext& context) const = 0;

        virtual StrategyKind getKind() const = 0;

        std::string getName() const { return strategyName(getKind()); }

    protected:
        static constexpr double NO_DATA_CONFIDENCE = 0.1;
        static constexpr double NO_OPPORTUNITY_CONFIDENCE = 0.3;

        static Decision hold(double confidence, const std::string& reason);

        static Decision makeDecision(DecisionType type,
            const ItemQuote& item,
            Quantity quantity,
            double confidence,
            const std::string& reason);
    };

    std::unique_ptr<TradingStrategy> makeStrategy(StrategyKind kind);

} // namespace merchant

#pragma once

#include "TradingStrategy.hpp"

namespace merchant {

    // Momentum Strategy: follows the most recent price move
    class MomentumStrategy : public TradingStrategy {
    public:
        static constexpr double THRESHOLD = 0.1;
        static constexpr Quantity SELL_QUANTITY = 10;

        Decision evaluate(const Agent& agent,
            const MarketSnapshot& snapshot,
            const TemporalContext& context) const override;

        StrategyKind getKind() const override { return StrategyKind::MOMENTUM; }

        // affordable * momentum * 2, capped at half of affordable, at least 1
        static Quantity buyQuantity(Quantity affordable, double momentum);
    };

} // namespace merchant

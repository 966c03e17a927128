#pragma once

#include "TradingStrategy.hpp"

namespace merchant {

    // Value Strategy: buys items priced well under their base price and
    // sells items priced well over it
    class ValueStrategy : public TradingStrategy {
    public:
        static constexpr double BUY_RATIO = 1.2;     // base/current above this is undervalued
        static constexpr double SELL_RATIO = 0.8;    // base/current below this is overvalued
        static constexpr Quantity SELL_QUANTITY = 5;

        Decision evaluate(const Agent& agent,
            const MarketSnapshot& snapshot,
            const TemporalContext& context) const override;

        StrategyKind getKind() const override { return StrategyKind::VALUE; }

        static double confidenceFor(double ratio);
    };

} // namespace merchant

#pragma once

#include "TradingStrategy.hpp"
#include <string>

namespace merchant {

    // Seasonal Strategy: buys in-season items, sells out-of-season ones.
    // The season comes from the temporal context ("spring" when absent).
    class SeasonalStrategy : public TradingStrategy {
    public:
        static constexpr double IN_SEASON_SCORE = 0.8;
        static constexpr double THRESHOLD = 0.5;
        static constexpr Quantity SELL_QUANTITY = 5;

        Decision evaluate(const Agent& agent,
            const MarketSnapshot& snapshot,
            const TemporalContext& context) const override;

        StrategyKind getKind() const override { return StrategyKind::SEASONAL; }

        // Positive in season, negative out of season, 0 when neutral.
        // The first tag matching the season or its opposite decides.
        static double seasonalScore(const ItemQuote& item, const std::string& season);

        static std::string oppositeSeason(const std::string& season);
    };

} // namespace merchant

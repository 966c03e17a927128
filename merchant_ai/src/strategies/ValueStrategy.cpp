#include "ValueStrategy.hpp"
#include "utils/Statistics.hpp"
#include <algorithm>

namespace merchant {

    double ValueStrategy::confidenceFor(double ratio) {
        return Statistics::clamp((ratio - 1.0) * 0.5, 0.0, 1.0);
    }

    Decision ValueStrategy::evaluate(const Agent& agent,
        const MarketSnapshot& snapshot,
        const TemporalContext& /*context*/) const {
        if (snapshot.empty()) {
            return hold(NO_DATA_CONFIDENCE, "No market data available");
        }

        Decision best;
        double bestScore = 0.0;
        bool found = false;

        for (const auto& item : snapshot.items) {
            if (item.currentPrice <= 0 || item.basePrice <= 0) continue;

            double valueRatio = item.basePrice / item.currentPrice;

            if (valueRatio > BUY_RATIO && agent.canAfford(item.currentPrice)) {
                double score = (valueRatio - 1.0) * item.demand / (item.supply + 1.0);
                if (score > bestScore) {
                    Quantity units = agent.affordable(item.currentPrice);
                    bestScore = score;
                    best = makeDecision(DecisionType::BUY, item,
                        std::max<Quantity>(1, units / 4),
                        confidenceFor(valueRatio),
                        "Undervalued item with good demand");
                    found = true;
                }
            }

            if (valueRatio < SELL_RATIO) {
                double score = (1.0 - valueRatio) * item.supply / (item.demand + 1.0);
                if (score > bestScore) {
                    bestScore = score;
                    best = makeDecision(DecisionType::SELL, item, SELL_QUANTITY,
                        confidenceFor(1.0 / valueRatio),
                        "Overvalued item with low demand");
                    found = true;
                }
            }
        }

        if (!found) {
            return hold(NO_OPPORTUNITY_CONFIDENCE, "No valuable opportunities found");
        }
        return best;
    }

} // namespace merchant

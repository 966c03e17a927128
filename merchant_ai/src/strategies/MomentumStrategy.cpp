#include "MomentumStrategy.hpp"
#include "utils/Statistics.hpp"
#include <cmath>

namespace merchant {

    Quantity MomentumStrategy::buyQuantity(Quantity affordable, double momentum) {
        Quantity quantity = static_cast<Quantity>(affordable * momentum * 2.0);
        if (quantity > affordable / 2) {
            quantity = affordable / 2;
        }
        if (quantity < 1 && affordable > 0) {
            quantity = 1;
        }
        return quantity;
    }

    Decision MomentumStrategy::evaluate(const Agent& agent,
        const MarketSnapshot& snapshot,
        const TemporalContext& /*context*/) const {
        if (snapshot.empty()) {
            return hold(NO_DATA_CONFIDENCE, "No market data available");
        }

        Decision best;
        double bestScore = 0.0;
        bool found = false;

        for (const auto& item : snapshot.items) {
            if (item.priceHistory.size() < 2) continue;

            double momentum = Statistics::lastReturn(item.priceHistory);

            if (momentum > THRESHOLD && momentum > bestScore && agent.canAfford(item.currentPrice)) {
                bestScore = momentum;
                best = makeDecision(DecisionType::BUY, item,
                    buyQuantity(agent.affordable(item.currentPrice), momentum),
                    momentum * 2.0,
                    "Strong upward price momentum");
                found = true;
            }
            else if (momentum < -THRESHOLD && -momentum > bestScore) {
                bestScore = -momentum;
                best = makeDecision(DecisionType::SELL, item, SELL_QUANTITY,
                    -momentum * 2.0,
                    "Strong downward price momentum");
                found = true;
            }
        }

        if (!found) {
            return hold(NO_OPPORTUNITY_CONFIDENCE, "No strong momentum detected");
        }
        return best;
    }

} // namespace merchant

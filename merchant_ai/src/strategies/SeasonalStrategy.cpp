#include "SeasonalStrategy.hpp"
#include <algorithm>

namespace merchant {

    std::string SeasonalStrategy::oppositeSeason(const std::string& season) {
        if (season == "summer") return "winter";
        if (season == "winter") return "summer";
        if (season == "spring") return "autumn";
        if (season == "autumn") return "spring";
        return "";
    }

    double SeasonalStrategy::seasonalScore(const ItemQuote& item, const std::string& season) {
        std::string opposite = oppositeSeason(season);

        for (const auto& tag : item.tags) {
            if (tag == season) {
                return IN_SEASON_SCORE;
            }
            if (!opposite.empty() && tag == opposite) {
                return -IN_SEASON_SCORE;
            }
        }

        // Category patterns: potions sell in the extreme seasons, food at harvest
        if (item.category == "Potion" && (season == "winter" || season == "summer")) {
            return 0.4;
        }
        if (item.category == "Food" && season == "autumn") {
            return 0.6;
        }

        return 0.0;
    }

    Decision SeasonalStrategy::evaluate(const Agent& agent,
        const MarketSnapshot& snapshot,
        const TemporalContext& context) const {
        if (snapshot.empty()) {
            return hold(NO_DATA_CONFIDENCE, "No market data available");
        }

        std::string season = context.season();

        Decision best;
        double bestScore = 0.0;
        bool found = false;

        for (const auto& item : snapshot.items) {
            double score = seasonalScore(item, season);

            if (score > THRESHOLD && score > bestScore) {
                if (!agent.canAfford(item.currentPrice)) continue;

                Quantity units = agent.affordable(item.currentPrice);
                Quantity quantity = static_cast<Quantity>(units * score * 0.3);
                bestScore = score;
                best = makeDecision(DecisionType::BUY, item,
                    std::max<Quantity>(1, quantity), score,
                    "Seasonal item in high demand");
                found = true;
            }
            else if (score < -THRESHOLD && -score > bestScore) {
                bestScore = -score;
                best = makeDecision(DecisionType::SELL, item, SELL_QUANTITY, -score,
                    "Out of season item");
                found = true;
            }
        }

        if (!found) {
            return hold(NO_OPPORTUNITY_CONFIDENCE, "No seasonal opportunities");
        }
        return best;
    }

} // namespace merchant

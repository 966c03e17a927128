#include "TradingStrategy.hpp"
#include "ValueStrategy.hpp"
#include "MomentumStrategy.hpp"
#include "SeasonalStrategy.hpp"
#include "utils/Statistics.hpp"
#include <algorithm>

namespace merchant {

    std::string strategyName(StrategyKind kind) {
        switch (kind) {
        case StrategyKind::VALUE:    return "value";
        case StrategyKind::MOMENTUM: return "momentum";
        case StrategyKind::SEASONAL: return "seasonal";
        }
        return "value";
    }

    Decision TradingStrategy::hold(double confidence, const std::string& reason) {
        Decision decision;
        decision.type = DecisionType::HOLD;
        decision.confidence = Statistics::clamp(confidence, 0.0, 1.0);
        decision.reason = reason;
        return decision;
    }

    Decision TradingStrategy::makeDecision(DecisionType type,
        const ItemQuote& item,
        Quantity quantity,
        double confidence,
        const std::string& reason) {
        Decision decision;
        decision.type = type;
        decision.itemId = item.id;
        decision.quantity = std::max<Quantity>(0, quantity);
        decision.price = item.currentPrice;
        decision.confidence = Statistics::clamp(confidence, 0.0, 1.0);
        decision.reason = reason;
        return decision;
    }

    std::unique_ptr<TradingStrategy> makeStrategy(StrategyKind kind) {
        switch (kind) {
        case StrategyKind::MOMENTUM: return std::make_unique<MomentumStrategy>();
        case StrategyKind::SEASONAL: return std::make_unique<SeasonalStrategy>();
        default:                     return std::make_unique<ValueStrategy>();
        }
    }

} // namespace merchant

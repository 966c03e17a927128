#include "DecisionEngine.hpp"
#include "utils/Logger.hpp"
#include "utils/Statistics.hpp"
#include <algorithm>
#include <cmath>
#include <mutex>
#include <stdexcept>

namespace merchant {

    DecisionEngine::DecisionEngine(const RuntimeConfig* cfg)
        : rtConfig_(cfg)
    {
        strategies_[StrategyKind::VALUE] = makeStrategy(StrategyKind::VALUE);
        strategies_[StrategyKind::MOMENTUM] = makeStrategy(StrategyKind::MOMENTUM);
        strategies_[StrategyKind::SEASONAL] = makeStrategy(StrategyKind::SEASONAL);
    }

    void DecisionEngine::registerStrategy(std::unique_ptr<TradingStrategy> strategy) {
        if (!strategy) {
            throw std::invalid_argument("DecisionEngine: cannot register a null strategy");
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        StrategyKind kind = strategy->getKind();
        strategies_[kind] = std::move(strategy);
        Logger::debug("Registered {} strategy", strategyName(kind));
    }

    bool DecisionEngine::unregisterStrategy(StrategyKind kind) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return strategies_.erase(kind) > 0;
    }

    bool DecisionEngine::hasStrategy(StrategyKind kind) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return strategies_.count(kind) > 0;
    }

    double DecisionEngine::evaluateMarket(const MarketSnapshot& snapshot) const {
        if (snapshot.empty()) return 0.5;

        std::vector<double> scores;
        scores.reserve(snapshot.items.size());

        for (const auto& item : snapshot.items) {
            double priceRatio = item.basePrice > 0 ? item.currentPrice / item.basePrice : 1.0;
            double supplyDemandRatio = static_cast<double>(item.demand) / (item.supply + 1.0);

            scores.push_back(Statistics::clamp((priceRatio + supplyDemandRatio) / 2.0, 0.0, 1.0));
        }

        return Statistics::mean(scores, 0.5);
    }

    MarketCondition DecisionEngine::classify(double score) const {
        double bull = rtConfig_ ? rtConfig_->decision.bullishThreshold : 0.7;
        double bear = rtConfig_ ? rtConfig_->decision.bearishThreshold : 0.3;

        if (score > bull) return MarketCondition::BULLISH;
        if (score < bear) return MarketCondition::BEARISH;
        return MarketCondition::NEUTRAL;
    }

    StrategyKind DecisionEngine::selectStrategy(const PersonalityProfile& personality,
        MarketCondition condition) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return selectStrategyLocked(personality, condition);
    }

    StrategyKind DecisionEngine::selectStrategyLocked(const PersonalityProfile& personality,
        MarketCondition condition) const {
        switch (personality.getType()) {
        case PersonalityType::AGGRESSIVE:
            return condition == MarketCondition::BULLISH ? StrategyKind::MOMENTUM : StrategyKind::VALUE;

        case PersonalityType::CONSERVATIVE:
            return StrategyKind::VALUE;

        case PersonalityType::OPPORTUNISTIC:
            return condition == MarketCondition::BEARISH ? StrategyKind::VALUE : StrategyKind::MOMENTUM;

        default:
            return strategies_.count(StrategyKind::SEASONAL) ? StrategyKind::SEASONAL : StrategyKind::VALUE;
        }
    }

    Decision DecisionEngine::decide(const Agent& agent,
        const MarketSnapshot& snapshot,
        const TemporalContext& context) const {
        double score = evaluateMarket(snapshot);
        MarketCondition condition = classify(score);

        std::shared_lock<std::shared_mutex> lock(mutex_);

        StrategyKind kind = selectStrategyLocked(agent.getPersonality(), condition);
        auto it = strategies_.find(kind);
        if (it == strategies_.end()) {
            it = strategies_.find(StrategyKind::VALUE);
        }
        if (it == strategies_.end()) {
            Logger::warn("No strategy available for agent {}, holding", agent.getId());
            Decision decision;
            decision.reason = "No strategy available";
            return decision;
        }

        Logger::debug("Agent {} ({}) using {} strategy in {} market ({:.3f})",
            agent.getId(), agent.getPersonality().getName(),
            it->second->getName(), toString(condition), score);

        Decision decision = it->second->evaluate(agent, snapshot, context);
        return applyPersonalityModifiers(std::move(decision), agent.getPersonality());
    }

    Decision DecisionEngine::applyPersonalityModifiers(Decision decision, const PersonalityProfile& personality) {
        double riskFactor = 0.5 + personality.riskTolerance();
        decision.quantity = std::max<Quantity>(0,
            static_cast<Quantity>(std::llround(decision.quantity * riskFactor)));

        decision.confidence = Statistics::clamp(
            decision.confidence * personality.tradingFrequency(), 0.0, 1.0);

        return decision;
    }

    bool DecisionEngine::shouldSell(const PersonalityProfile& personality, const ItemQuote& item) {
        double profitMargin = (item.currentPrice - item.basePrice) / item.basePrice;
        return profitMargin >= personality.profitMarginTarget();
    }

    bool DecisionEngine::shouldBuy(const Agent& agent, const ItemQuote& item) {
        if (!agent.canAfford(item.currentPrice)) return false;

        double discount = (item.basePrice - item.currentPrice) / item.basePrice;
        // More risk-tolerant merchants accept smaller discounts
        double requiredDiscount = 0.1 * (1.0 - agent.getPersonality().riskTolerance());

        return discount >= requiredDiscount;
    }

    Quantity DecisionEngine::buyQuantity(const Agent& agent, const ItemQuote& item) {
        Quantity units = agent.affordable(item.currentPrice);
        Quantity quantity = static_cast<Quantity>(units * agent.getPersonality().riskTolerance() * 0.3);

        if (quantity == 0 && units > 0) {
            quantity = 1;
        }
        return quantity;
    }

    Quantity DecisionEngine::sellQuantity(const PersonalityProfile& personality) {
        switch (personality.getType()) {
        case PersonalityType::AGGRESSIVE:   return 10;
        case PersonalityType::CONSERVATIVE: return 2;
        default:                            return 5;
        }
    }

    double DecisionEngine::itemConfidence(const PersonalityProfile& personality,
        const ItemQuote& item, Random& rng) const {
        double jitter = rtConfig_ ? rtConfig_->decision.jitterRange : 0.05;

        double priceRatio = item.currentPrice / item.basePrice;
        double volatilityFactor = 1.0 - item.volatility;
        double priceFactor = 1.0 - std::abs(1.0 - priceRatio);

        double confidence = (volatilityFactor + priceFactor) / 2.0 * personality.tradingFrequency();
        if (jitter > 0) {
            confidence += rng.uniform(-jitter, jitter);
        }

        return Statistics::clamp(confidence, 0.0, 1.0);
    }

    std::vector<Decision> DecisionEngine::decideMany(const Agent& agent,
        const MarketSnapshot& snapshot,
        size_t maxDecisions,
        Random& rng) const {
        std::vector<Decision> decisions;
        decisions.reserve(std::min(maxDecisions, snapshot.items.size()));

        const auto& personality = agent.getPersonality();

        for (const auto& item : snapshot.items) {
            if (decisions.size() >= maxDecisions) break;
            if (item.basePrice <= 0 || item.currentPrice <= 0) continue;

            Decision decision;
            decision.itemId = item.id;
            decision.price = item.currentPrice;

            if (shouldSell(personality, item)) {
                decision.type = DecisionType::SELL;
                decision.quantity = sellQuantity(personality);
                decision.reason = "High profit margin";
            }
            else if (shouldBuy(agent, item)) {
                decision.type = DecisionType::BUY;
                decision.quantity = buyQuantity(agent, item);
                decision.reason = "Good value opportunity";
            }
            else {
                continue;
            }

            decision.confidence = itemConfidence(personality, item, rng);
            decisions.push_back(std::move(decision));
        }

        return decisions;
    }

} // namespace merchant

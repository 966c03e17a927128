#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <cmath>
#include <vector>
#include <map>

namespace merchant {

    using Price = double;
    using Quantity = int64_t;
    using Funds = int64_t;
    using Timestamp = uint64_t;
    using AgentId = std::string;
    using ItemId = std::string;

    enum class DecisionType {
        BUY,
        SELL,
        HOLD
    };

    enum class MarketCondition {
        BULLISH,
        NEUTRAL,
        BEARISH
    };

    inline std::string toString(DecisionType type) {
        switch (type) {
        case DecisionType::BUY:  return "Buy";
        case DecisionType::SELL: return "Sell";
        default:                 return "Hold";
        }
    }

    inline std::string toString(MarketCondition condition) {
        switch (condition) {
        case MarketCondition::BULLISH: return "bullish";
        case MarketCondition::BEARISH: return "bearish";
        default:                       return "neutral";
        }
    }

    struct Decision {
        DecisionType type = DecisionType::HOLD;
        ItemId itemId;
        Quantity quantity = 0;
        Price price = 0.0;
        double confidence = 0.0;    // [0, 1]
        std::string reason;
    };

    struct ItemQuote {
        ItemId id;
        Price currentPrice = 0.0;
        Price basePrice = 0.0;
        Quantity supply = 0;
        Quantity demand = 0;
        double volatility = 0.0;
        std::vector<Price> priceHistory;    // oldest -> newest
        std::string category;
        std::vector<std::string> tags;
    };

    struct MarketSnapshot {
        std::vector<ItemQuote> items;

        bool empty() const { return items.empty(); }
    };

    struct Outcome {
        Decision decision;
        double profit = 0.0;
        bool success = false;
        std::string marketState;    // may be empty
        Timestamp timestamp = 0;
    };

    struct TradeRecord {
        ItemId itemId;
        Quantity quantity = 0;
        Price buyPrice = 0.0;
        Price sellPrice = 0.0;
        double profit = 0.0;
        Timestamp timestamp = 0;
    };

    struct TradingStatistics {
        uint64_t totalTrades = 0;
        double totalProfit = 0.0;
        double bestTrade = 0.0;
        double worstTrade = 0.0;
        double successRate = 0.0;
        std::vector<TradeRecord> tradeHistory;
    };

    // Learned affinities. An item id lives in at most one of
    // preferredItems / avoidedItems.
    struct Preferences {
        std::map<ItemId, double> preferredItems;
        std::map<ItemId, double> avoidedItems;      // positive magnitude
        std::map<std::string, double> preferredStrategies;
        std::map<std::string, double> marketConditions;

        double itemPreference(const ItemId& item) const {
            auto pIt = preferredItems.find(item);
            if (pIt != preferredItems.end()) return pIt->second;

            auto aIt = avoidedItems.find(item);
            if (aIt != avoidedItems.end()) return -aIt->second;

            return 0.0;
        }

        std::string strategyForMarket(const std::string& marketState) const {
            if (preferredStrategies.empty()) {
                if (marketState == "volatile") return "momentum";
                if (marketState == "stable") return "value";
                return "balanced";
            }

            std::string best = "balanced";
            double bestScore = 0.0;
            for (const auto& [strategy, score] : preferredStrategies) {
                if (score > bestScore) {
                    bestScore = score;
                    best = strategy;
                }
            }
            return best;
        }
    };

    // Mined over an agent's outcome history; never stored.
    struct Pattern {
        ItemId mostProfitableItem;
        DecisionType mostSuccessfulAction = DecisionType::HOLD;
        std::string optimalMarketState;
    };

    struct Influence {
        double priceImpact = 0.0;
        double demandImpact = 0.0;
        double supplyImpact = 0.0;
        double reputation = 0.0;

        Price priceEffect(Price basePrice) const {
            return basePrice * (1.0 + priceImpact);
        }

        Quantity demandEffect(Quantity baseDemand) const {
            return static_cast<Quantity>(std::llround(baseDemand * (1.0 + demandImpact)));
        }

        Quantity supplyEffect(Quantity baseSupply) const {
            return static_cast<Quantity>(std::llround(baseSupply * (1.0 + supplyImpact)));
        }
    };

    enum class RelationshipType {
        NEUTRAL,
        FRIENDLY,
        RIVAL,
        ALLIED
    };

    struct Relationship {
        AgentId agentA;     // canonical: agentA < agentB
        AgentId agentB;
        RelationshipType type = RelationshipType::NEUTRAL;
        double strength = 0.5;
        double trust = 0.5;
        std::vector<TradeRecord> tradeHistory;

        const AgentId& other(const AgentId& id) const {
            return id == agentA ? agentB : agentA;
        }
    };

    struct InformationPacket {
        ItemId itemId;
        double priceChange = 0.0;
        AgentId source;
        double reliability = 1.0;   // [0, 1]
        Timestamp timestamp = 0;
    };

    struct PropagationEvent {
        AgentId target;
        InformationPacket packet;
        int delay = 0;              // ticks
        double reliability = 0.0;
    };

    // Per-personality diagnostics
    struct PersonalityStats {
        uint64_t decisions = 0;
        uint64_t buys = 0;
        uint64_t sells = 0;
        uint64_t holds = 0;
        uint64_t executed = 0;
        uint64_t successes = 0;
        double profit = 0.0;
    };

    inline Timestamp now() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();
    }

} // namespace merchant

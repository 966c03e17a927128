#include "Agent.hpp"
#include "utils/Statistics.hpp"
#include <algorithm>
#include <limits>
#include <mutex>

namespace merchant {

    Agent::Agent(AgentId id, std::string name, Funds startingFunds, PersonalityPtr personality)
        : id_(std::move(id))
        , name_(std::move(name))
        , personality_(personality ? std::move(personality) : makePersonality(PersonalityType::BALANCED))
        , funds_(std::max<Funds>(0, startingFunds))
    {
    }

    Funds Agent::getFunds() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return funds_;
    }

    void Agent::setFunds(Funds amount) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        funds_ = std::max<Funds>(0, amount);
    }

    void Agent::addFunds(Funds amount) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        funds_ = std::max<Funds>(0, funds_ + amount);
    }

    bool Agent::removeFunds(Funds amount) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (amount < 0 || funds_ < amount) return false;
        funds_ -= amount;
        return true;
    }

    Quantity Agent::affordable(Price price) const {
        if (price <= 0) return 0;
        std::shared_lock<std::shared_mutex> lock(mutex_);
        double units = static_cast<double>(funds_) / price;
        if (units >= static_cast<double>(std::numeric_limits<Quantity>::max())) {
            return std::numeric_limits<Quantity>::max();
        }
        return static_cast<Quantity>(units);
    }

    bool Agent::canAfford(Price price) const {
        if (price <= 0) return false;
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return static_cast<double>(funds_) >= price;
    }

    double Agent::getReputation() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return reputation_;
    }

    void Agent::setReputation(double reputation) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        reputation_ = Statistics::clamp(reputation, MIN_REPUTATION, MAX_REPUTATION);
    }

    void Agent::adjustReputation(double delta) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        reputation_ = Statistics::clamp(reputation_ + delta, MIN_REPUTATION, MAX_REPUTATION);
    }

    void Agent::recordTrade(const TradeRecord& record) {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        stats_.totalTrades++;
        stats_.totalProfit += record.profit;

        if (stats_.totalTrades == 1) {
            stats_.bestTrade = record.profit;
            stats_.worstTrade = record.profit;
        }
        else {
            stats_.bestTrade = std::max(stats_.bestTrade, record.profit);
            stats_.worstTrade = std::min(stats_.worstTrade, record.profit);
        }

        if (record.profit > 0) {
            profitableTrades_++;
        }
        stats_.successRate = static_cast<double>(profitableTrades_) / stats_.totalTrades;

        stats_.tradeHistory.push_back(record);
        if (stats_.tradeHistory.size() > MAX_TRADE_HISTORY) {
            stats_.tradeHistory.erase(stats_.tradeHistory.begin());
        }
    }

    TradingStatistics Agent::getTradingStats() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return stats_;
    }

    Preferences Agent::getPreferences() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return preferences_;
    }

    void Agent::setPreferences(Preferences preferences) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        preferences_ = std::move(preferences);
    }

} // namespace merchant

#pragma once

#include "core/Types.hpp"
#include "Personality.hpp"
#include <shared_mutex>
#include <string>

namespace merchant {

    // A simulated merchant. Funds and reputation are mutated by the external
    // execution layer through the methods below; reads and writes are guarded
    // by a shared mutex so worker threads can evaluate the same agent while
    // another thread settles its trades.
    class Agent {
    public:
        static constexpr double MIN_REPUTATION = -100.0;
        static constexpr double MAX_REPUTATION = 100.0;
        static constexpr size_t MAX_TRADE_HISTORY = 100;

        Agent(AgentId id, std::string name, Funds startingFunds, PersonalityPtr personality);

        Agent(const Agent&) = delete;
        Agent& operator=(const Agent&) = delete;

        const AgentId& getId() const { return id_; }
        const std::string& getName() const { return name_; }
        const PersonalityProfile& getPersonality() const { return *personality_; }
        PersonalityPtr getPersonalityPtr() const { return personality_; }

        // Funds (never negative)
        Funds getFunds() const;
        void setFunds(Funds amount);
        void addFunds(Funds amount);
        bool removeFunds(Funds amount);

        // Units of an item affordable at the given price, truncated and
        // saturated at the largest Quantity
        Quantity affordable(Price price) const;
        // At least one whole unit at the given price
        bool canAfford(Price price) const;

        // Reputation, clamped to [-100, 100]
        double getReputation() const;
        void setReputation(double reputation);
        void adjustReputation(double delta);

        // Trade bookkeeping
        void recordTrade(const TradeRecord& record);
        TradingStatistics getTradingStats() const;

        Preferences getPreferences() const;
        void setPreferences(Preferences preferences);

    private:
        const AgentId id_;
        const std::string name_;
        const PersonalityPtr personality_;

        mutable std::shared_mutex mutex_;
        Funds funds_;
        double reputation_ = 0.0;
        TradingStatistics stats_;
        uint64_t profitableTrades_ = 0;
        Preferences preferences_;
    };

} // namespace merchant

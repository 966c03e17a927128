#pragma once

#include "MerchantSystem.hpp"
#include "core/RuntimeConfig.hpp"
#include "core/SimClock.hpp"
#include "utils/Random.hpp"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace merchant {

    // Demo driver. Plays the collaborators the merchant core leaves external:
    // a market whose prices random-walk, an execution layer that settles
    // decisions against agent funds and holdings, and a reporting loop.
    class Simulation {
    public:
        Simulation();

        // Load configuration (missing file or bad JSON keeps defaults)
        void loadConfig(const std::string& configPath);
        void loadConfig(const nlohmann::json& config);

        // Create items, merchants and their relationships from RuntimeConfig
        void initialize();

        // Advance by count turns
        void step(int count = 1);

        // Run the configured number of turns and log the summary
        void run();

        void logSummary() const;

        // Settles one decision; exposed for the merchant system's executor
        Outcome execute(Agent& agent, const Decision& decision);

        MarketSnapshot snapshot() const;

        RuntimeConfig& getRuntimeConfig() { return rtConfig_; }
        const RuntimeConfig& getRuntimeConfig() const { return rtConfig_; }

        MerchantSystem& getSystem() { return system_; }
        const MerchantSystem& getSystem() const { return system_; }
        LearningEngine& getLearning() { return learning_; }
        RelationshipNetwork& getNetwork() { return network_; }
        const SimClock& getClock() const { return clock_; }

        const std::vector<ItemQuote>& getItems() const { return items_; }
        Quantity getHolding(const AgentId& agent, const ItemId& item) const;
        uint64_t getCurrentTurn() const { return currentTurn_; }

    private:
        struct Position {
            Quantity quantity = 0;
            Price averageCost = 0.0;
        };

        RuntimeConfig rtConfig_;                 // central tunable config
        SimClock clock_;
        Random rng_;

        DecisionEngine decisions_;
        LearningEngine learning_;
        MarketInfluenceModel influence_;
        RelationshipNetwork network_;
        MerchantSystem system_;

        std::vector<ItemQuote> items_;
        std::map<ItemId, Quantity> baseDemand_;
        std::map<ItemId, Quantity> baseSupply_;
        std::map<AgentId, std::map<ItemId, Position>> holdings_;

        nlohmann::json itemsData_;
        uint64_t currentTurn_ = 0;

        void createItemsFromConfig();
        void createDefaultItems();
        void createMerchants();
        void linkMerchants(const std::vector<std::vector<AgentId>>& groups);

        void walkPrices();
        void applyInfluence();
        void shareLargestMove();

        const ItemQuote* findItem(const ItemId& id) const;
        static std::string marketState(const ItemQuote& item);
    };

} // namespace merchant

#include "MerchantSystem.hpp"
#include "utils/Logger.hpp"
#include <mutex>
#include <stdexcept>

namespace merchant {

    MerchantSystem::MerchantSystem(DecisionEngine& decisions,
        LearningEngine& learning,
        MarketInfluenceModel& influence,
        RelationshipNetwork& network)
        : decisions_(decisions)
        , learning_(learning)
        , influence_(influence)
        , network_(network)
    {
    }

    Agent& MerchantSystem::addAgent(std::unique_ptr<Agent> agent) {
        if (!agent) {
            throw std::invalid_argument("MerchantSystem: null agent");
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);

        const AgentId id = agent->getId();
        if (agents_.count(id)) {
            throw std::invalid_argument("MerchantSystem: duplicate agent id " + id);
        }

        Agent& ref = *agent;
        agents_[id] = std::move(agent);
        network_.addAgent(id);

        Logger::info("Added merchant {} ({}, {} funds)", id, ref.getPersonality().getName(), ref.getFunds());
        return ref;
    }

    bool MerchantSystem::removeAgent(const AgentId& id) {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        if (inTurn_) {
            Logger::warn("Cannot remove merchant {} while a turn is running", id);
            return false;
        }

        if (agents_.erase(id) == 0) return false;

        network_.removeAgent(id);
        Logger::info("Removed merchant {}", id);
        return true;
    }

    Agent* MerchantSystem::getAgent(const AgentId& id) {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = agents_.find(id);
        return it != agents_.end() ? it->second.get() : nullptr;
    }

    const Agent* MerchantSystem::getAgent(const AgentId& id) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = agents_.find(id);
        return it != agents_.end() ? it->second.get() : nullptr;
    }

    std::vector<AgentId> MerchantSystem::agentIds() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<AgentId> ids;
        ids.reserve(agents_.size());
        for (const auto& [id, _] : agents_) {
            ids.push_back(id);
        }
        return ids;
    }

    size_t MerchantSystem::agentCount() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return agents_.size();
    }

    std::vector<TurnResult> MerchantSystem::runTurn(const MarketSnapshot& snapshot,
        const TemporalContext& context,
        const TradeExecutor& executor) {
        std::lock_guard<std::mutex> turnLock(turnMutex_);

        // Set before the roster is copied; removeAgent checks it under mutex_
        inTurn_ = true;
        TurnGuard guard(inTurn_);

        // Roster taken under the lock; decide, callback and executor run without it
        // so they may call back into the system.
        std::vector<std::pair<AgentId, Agent*>> roster;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            roster.reserve(agents_.size());
            for (auto& [id, agent] : agents_) {
                roster.emplace_back(id, agent.get());
            }
        }

        std::vector<TurnResult> results;
        results.reserve(roster.size());

        for (auto& [id, agent] : roster) {
            TurnResult result;
            result.agentId = id;
            result.decision = decisions_.decide(*agent, snapshot, context);

            if (decisionCallback_) {
                decisionCallback_(*agent, result.decision);
            }

            if (result.decision.type != DecisionType::HOLD && executor) {
                Outcome outcome = executor(*agent, result.decision);
                settle(*agent, result.decision, outcome);
                result.outcome = std::move(outcome);
            }

            recordStats(agent->getPersonality().getName(), result);
            results.push_back(std::move(result));
        }

        uint64_t turn = 0;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            turn = ++turns_;
        }
        Logger::debug("Turn {}: {} merchants evaluated ({})", turn, results.size(), context.season());
        return results;
    }

    void MerchantSystem::recordStats(const std::string& personality, const TurnResult& result) {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto& stats = personalityStats_[personality];
        stats.decisions++;

        switch (result.decision.type) {
        case DecisionType::BUY:  stats.buys++; break;
        case DecisionType::SELL: stats.sells++; break;
        default:                 stats.holds++; break;
        }

        if (result.outcome) {
            stats.executed++;
            stats.profit += result.outcome->profit;
            if (result.outcome->success) stats.successes++;
        }
    }

    void MerchantSystem::settle(Agent& agent, const Decision& decision, const Outcome& outcome) {
        learning_.recordOutcome(agent.getId(), outcome);

        TradeRecord record;
        record.itemId = decision.itemId;
        record.quantity = decision.quantity;
        record.profit = outcome.profit;
        record.timestamp = outcome.timestamp;
        if (decision.type == DecisionType::BUY) {
            record.buyPrice = decision.price;
        }
        else {
            record.sellPrice = decision.price;
        }
        agent.recordTrade(record);

        agent.setPreferences(learning_.getPreferences(agent.getId()));
    }

    Influence MerchantSystem::marketInfluence() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        std::vector<Influence> influences;
        influences.reserve(agents_.size());
        for (const auto& [_, agent] : agents_) {
            influences.push_back(influence_.compute(*agent));
        }
        return influence_.aggregate(influences);
    }

    std::vector<PropagationEvent> MerchantSystem::shareInformation(const InformationPacket& info) {
        return network_.propagate(info);
    }

    bool MerchantSystem::updateNetwork(const AgentId& a, const AgentId& b, double interaction) {
        return network_.updateStrength(a, b, interaction);
    }

    uint64_t MerchantSystem::getTurnCount() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return turns_;
    }

    std::map<std::string, PersonalityStats> MerchantSystem::getPersonalityStats() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return personalityStats_;
    }

} // namespace merchant

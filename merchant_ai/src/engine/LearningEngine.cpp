#include "LearningEngine.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <mutex>

namespace merchant {

    LearningEngine::LearningEngine(const RuntimeConfig* cfg)
        : rtConfig_(cfg)
    {
    }

    void LearningEngine::recordOutcome(const AgentId& agentId, const Outcome& outcome) {
        size_t limit = static_cast<size_t>(rtConfig_ ? rtConfig_->learning.historyLimit : 100);

        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto& history = outcomes_[agentId];
        history.push_back(outcome);
        while (history.size() > limit) {
            history.pop_front();
        }

        adapt(agentId, outcome);
    }

    void LearningEngine::adapt(const AgentId& agentId, const Outcome& outcome) {
        double successStep = rtConfig_ ? rtConfig_->learning.successStep : 0.1;
        double failureStep = rtConfig_ ? rtConfig_->learning.failureStep : 0.2;
        double cap = rtConfig_ ? rtConfig_->learning.preferenceCap : 1.0;
        double avoidAt = rtConfig_ ? rtConfig_->learning.avoidThreshold : -1.0;
        double condStep = rtConfig_ ? rtConfig_->learning.conditionStep : 0.05;

        auto& prefs = preferences_[agentId];
        const ItemId& item = outcome.decision.itemId;

        if (outcome.success) {
            double& score = prefs.preferredItems[item];
            score = std::min(cap, score + successStep);
            prefs.avoidedItems.erase(item);
        }
        else {
            // An avoided item that fails again stays avoided
            auto avoided = prefs.avoidedItems.find(item);
            if (avoided != prefs.avoidedItems.end()) {
                avoided->second += failureStep;
            }
            else {
                double& score = prefs.preferredItems[item];
                score -= failureStep;
                if (score < avoidAt) {
                    prefs.avoidedItems[item] = -score;
                    prefs.preferredItems.erase(item);
                    Logger::debug("Agent {} now avoids {}", agentId, item);
                }
            }
        }

        if (!outcome.marketState.empty()) {
            prefs.marketConditions[outcome.marketState] += outcome.success ? condStep : -condStep;
        }
    }

    Preferences LearningEngine::getPreferences(const AgentId& agentId) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        auto it = preferences_.find(agentId);
        if (it == preferences_.end()) {
            return Preferences{};
        }
        return it->second;
    }

    double LearningEngine::successRate(const AgentId& agentId) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        auto it = outcomes_.find(agentId);
        if (it == outcomes_.end() || it->second.empty()) {
            return 0.5;
        }

        size_t successes = 0;
        for (const auto& outcome : it->second) {
            if (outcome.success) successes++;
        }
        return static_cast<double>(successes) / it->second.size();
    }

    double LearningEngine::averageProfit(const AgentId& agentId) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        auto it = outcomes_.find(agentId);
        if (it == outcomes_.end() || it->second.empty()) {
            return 0.0;
        }

        double total = 0.0;
        for (const auto& outcome : it->second) {
            total += outcome.profit;
        }
        return total / it->second.size();
    }

    std::optional<Pattern> LearningEngine::analyzePatterns(const AgentId& agentId) const {
        size_t minOutcomes = static_cast<size_t>(rtConfig_ ? rtConfig_->learning.minPatternOutcomes : 10);

        std::shared_lock<std::shared_mutex> lock(mutex_);

        auto it = outcomes_.find(agentId);
        if (it == outcomes_.end() || it->second.size() < minOutcomes) {
            return std::nullopt;
        }

        // Ordered maps: ties resolve to the lowest key
        std::map<ItemId, double> itemProfits;
        std::map<DecisionType, int> actionSuccess;
        std::map<DecisionType, int> actionCount;
        std::map<std::string, int> stateSuccess;
        std::map<std::string, int> stateCount;

        for (const auto& outcome : it->second) {
            itemProfits[outcome.decision.itemId] += outcome.profit;

            actionCount[outcome.decision.type]++;
            if (outcome.success) actionSuccess[outcome.decision.type]++;

            if (!outcome.marketState.empty()) {
                stateCount[outcome.marketState]++;
                if (outcome.success) stateSuccess[outcome.marketState]++;
            }
        }

        Pattern pattern;

        double maxProfit = 0.0;
        for (const auto& [item, profit] : itemProfits) {
            if (profit > maxProfit) {
                maxProfit = profit;
                pattern.mostProfitableItem = item;
            }
        }

        double maxActionRate = 0.0;
        for (const auto& [action, count] : actionCount) {
            if (count <= 0) continue;
            double rate = static_cast<double>(actionSuccess[action]) / count;
            if (rate > maxActionRate) {
                maxActionRate = rate;
                pattern.mostSuccessfulAction = action;
            }
        }

        double maxStateRate = 0.0;
        for (const auto& [state, count] : stateCount) {
            if (count <= 0) continue;
            double rate = static_cast<double>(stateSuccess[state]) / count;
            if (rate > maxStateRate) {
                maxStateRate = rate;
                pattern.optimalMarketState = state;
            }
        }

        return pattern;
    }

    size_t LearningEngine::outcomeCount(const AgentId& agentId) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = outcomes_.find(agentId);
        return it != outcomes_.end() ? it->second.size() : 0;
    }

    std::vector<Outcome> LearningEngine::getOutcomes(const AgentId& agentId) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = outcomes_.find(agentId);
        if (it == outcomes_.end()) return {};
        return std::vector<Outcome>(it->second.begin(), it->second.end());
    }

    void LearningEngine::reset(const AgentId& agentId) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        outcomes_.erase(agentId);
        preferences_.erase(agentId);
    }

} // namespace merchant

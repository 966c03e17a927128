#include "RelationshipNetwork.hpp"
#include "utils/Logger.hpp"
#include "utils/Statistics.hpp"
#include <algorithm>
#include <mutex>

namespace merchant {

    std::string toString(RelationshipType type) {
        switch (type) {
        case RelationshipType::FRIENDLY: return "Friendly";
        case RelationshipType::RIVAL:    return "Rival";
        case RelationshipType::ALLIED:   return "Allied";
        default:                         return "Neutral";
        }
    }

    RelationshipNetwork::RelationshipNetwork(const RuntimeConfig* cfg)
        : rtConfig_(cfg)
    {
    }

    RelationshipNetwork::EdgeKey RelationshipNetwork::makeKey(const AgentId& a, const AgentId& b) {
        return a < b ? EdgeKey(a, b) : EdgeKey(b, a);
    }

    void RelationshipNetwork::addAgent(const AgentId& id) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        agents_.insert(id);
    }

    bool RelationshipNetwork::removeAgent(const AgentId& id) {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        if (agents_.erase(id) == 0) return false;

        for (auto it = edges_.begin(); it != edges_.end();) {
            if (it->first.first == id || it->first.second == id) {
                it = edges_.erase(it);
            }
            else {
                ++it;
            }
        }
        inbox_.erase(id);
        return true;
    }

    bool RelationshipNetwork::hasAgent(const AgentId& id) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return agents_.count(id) > 0;
    }

    size_t RelationshipNetwork::agentCount() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return agents_.size();
    }

    bool RelationshipNetwork::addRelationship(const AgentId& a, const AgentId& b, RelationshipType type) {
        double strength = rtConfig_ ? rtConfig_->network.initialStrength : 0.5;
        double trust = rtConfig_ ? rtConfig_->network.initialTrust : 0.5;

        std::unique_lock<std::shared_mutex> lock(mutex_);

        if (a == b || agents_.count(a) == 0 || agents_.count(b) == 0) {
            Logger::warn("Rejected {} relationship {} <-> {}: unknown agent", toString(type), a, b);
            return false;
        }

        EdgeKey key = makeKey(a, b);

        Relationship relationship;
        relationship.agentA = key.first;
        relationship.agentB = key.second;
        relationship.type = type;
        relationship.strength = strength;
        relationship.trust = trust;

        edges_[key] = std::move(relationship);
        return true;
    }

    std::optional<Relationship> RelationshipNetwork::getRelationship(const AgentId& a, const AgentId& b) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        auto it = edges_.find(makeKey(a, b));
        if (it == edges_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<Relationship> RelationshipNetwork::relationshipsOf(const AgentId& id) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        std::vector<Relationship> result;
        for (const auto& [key, relationship] : edges_) {
            if (key.first == id || key.second == id) {
                result.push_back(relationship);
            }
        }
        return result;
    }

    std::pair<int, double> RelationshipNetwork::propagationParams(const Relationship& relationship) const {
        int baseDelay = rtConfig_ ? rtConfig_->network.baseDelay : 3;
        double baseReliability = rtConfig_ ? rtConfig_->network.baseReliability : 0.7;

        switch (relationship.type) {
        case RelationshipType::ALLIED:
            return { 1, 0.95 * relationship.trust };

        case RelationshipType::FRIENDLY: {
            int delay = baseDelay - static_cast<int>(relationship.strength * 2.0);
            return { std::max(1, delay), baseReliability + 0.2 * relationship.trust };
        }

        case RelationshipType::RIVAL:
            return { baseDelay * 2, 0.3 * relationship.trust };

        default:
            return { baseDelay, baseReliability * relationship.trust };
        }
    }

    std::vector<PropagationEvent> RelationshipNetwork::propagate(const InformationPacket& info) {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        std::vector<PropagationEvent> events;
        if (agents_.count(info.source) == 0) {
            Logger::debug("Dropped information on {} from unknown source {}", info.itemId, info.source);
            return events;
        }

        for (const auto& [key, relationship] : edges_) {
            if (key.first != info.source && key.second != info.source) continue;

            auto [delay, reliability] = propagationParams(relationship);

            PropagationEvent event;
            event.target = relationship.other(info.source);
            event.packet = info;
            event.delay = delay;
            event.reliability = Statistics::clamp(reliability * info.reliability, 0.0, 1.0);
            events.push_back(std::move(event));
        }

        // Target order must not depend on which slot of the key the source is in
        std::sort(events.begin(), events.end(),
            [](const PropagationEvent& x, const PropagationEvent& y) { return x.target < y.target; });

        for (const auto& event : events) {
            inbox_[event.target].push_back(info);
        }

        Logger::debug("Information on {} from {} reached {} agents", info.itemId, info.source, events.size());
        return events;
    }

    std::vector<InformationPacket> RelationshipNetwork::getInformation(const AgentId& id) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        auto it = inbox_.find(id);
        if (it == inbox_.end()) return {};
        return it->second;
    }

    void RelationshipNetwork::clearInformation(const AgentId& id) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        inbox_.erase(id);
    }

    bool RelationshipNetwork::updateStrength(const AgentId& a, const AgentId& b, double delta) {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = edges_.find(makeKey(a, b));
        if (it == edges_.end()) {
            Logger::warn("Cannot update strength {} <-> {}: no relationship", a, b);
            return false;
        }

        auto& relationship = it->second;
        relationship.strength = Statistics::clamp(relationship.strength + delta, 0.0, 1.0);

        // Trust is lost slower than it is gained
        double trustDelta = delta > 0 ? delta * 0.5 : delta * 0.3;
        relationship.trust = Statistics::clamp(relationship.trust + trustDelta, 0.0, 1.0);
        return true;
    }

    bool RelationshipNetwork::recordTrade(const AgentId& a, const AgentId& b, const TradeRecord& record) {
        size_t limit = static_cast<size_t>(rtConfig_ ? rtConfig_->network.tradeHistoryLimit : 100);

        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = edges_.find(makeKey(a, b));
        if (it == edges_.end()) return false;

        auto& history = it->second.tradeHistory;
        history.push_back(record);
        if (history.size() > limit) {
            history.erase(history.begin(), history.begin() + (history.size() - limit));
        }
        return true;
    }

    bool RelationshipNetwork::isClusterEdge(const Relationship& relationship) const {
        double threshold = rtConfig_ ? rtConfig_->network.clusterStrengthThreshold : 0.7;

        return relationship.type == RelationshipType::ALLIED
            || (relationship.type == RelationshipType::FRIENDLY && relationship.strength > threshold);
    }

    std::vector<std::vector<AgentId>> RelationshipNetwork::clusters() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        std::map<AgentId, std::vector<AgentId>> adjacency;
        for (const auto& [key, relationship] : edges_) {
            if (!isClusterEdge(relationship)) continue;
            adjacency[key.first].push_back(key.second);
            adjacency[key.second].push_back(key.first);
        }

        std::set<AgentId> visited;
        std::vector<std::vector<AgentId>> result;

        for (const auto& start : agents_) {
            if (visited.count(start)) continue;

            std::vector<AgentId> cluster;
            std::vector<AgentId> stack{ start };

            while (!stack.empty()) {
                AgentId current = stack.back();
                stack.pop_back();

                if (!visited.insert(current).second) continue;
                cluster.push_back(current);

                auto adjIt = adjacency.find(current);
                if (adjIt == adjacency.end()) continue;
                for (const auto& neighbour : adjIt->second) {
                    if (!visited.count(neighbour)) {
                        stack.push_back(neighbour);
                    }
                }
            }

            if (cluster.size() > 1) {
                std::sort(cluster.begin(), cluster.end());
                result.push_back(std::move(cluster));
            }
        }

        // agents_ is ordered, so clusters already come out by smallest member
        return result;
    }

} // namespace merchant

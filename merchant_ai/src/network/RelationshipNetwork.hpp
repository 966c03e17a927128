#pragma once

#include "core/Types.hpp"
#include "core/RuntimeConfig.hpp"
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace merchant {

    std::string toString(RelationshipType type);

    // Undirected trust graph between agents. Each pair has one canonical edge
    // keyed by the sorted id pair; lookups are symmetric.
    class RelationshipNetwork {
    public:
        explicit RelationshipNetwork(const RuntimeConfig* cfg = nullptr);

        RelationshipNetwork(const RelationshipNetwork&) = delete;
        RelationshipNetwork& operator=(const RelationshipNetwork&) = delete;

        void addAgent(const AgentId& id);

        // Drops the agent with its relationships and inbox
        bool removeAgent(const AgentId& id);

        bool hasAgent(const AgentId& id) const;
        size_t agentCount() const;

        // Creates or overwrites the pair's relationship at the initial
        // strength and trust. False when either id is unknown or a == b.
        bool addRelationship(const AgentId& a, const AgentId& b, RelationshipType type);

        std::optional<Relationship> getRelationship(const AgentId& a, const AgentId& b) const;
        std::vector<Relationship> relationshipsOf(const AgentId& id) const;

        // One event per neighbour of info.source, ordered by target id.
        // The packet is also queued in each target's inbox.
        std::vector<PropagationEvent> propagate(const InformationPacket& info);

        std::vector<InformationPacket> getInformation(const AgentId& id) const;
        void clearInformation(const AgentId& id);

        // strength += delta, trust moves by delta*0.5 up or delta*0.3 down, both clamped.
        // False when no relationship exists for the pair.
        bool updateStrength(const AgentId& a, const AgentId& b, double delta);

        bool recordTrade(const AgentId& a, const AgentId& b, const TradeRecord& record);

        // Connected components over allied edges and strong friendly edges.
        // Only components with more than one agent; members and clusters sorted.
        std::vector<std::vector<AgentId>> clusters() const;

    private:
        using EdgeKey = std::pair<AgentId, AgentId>;

        const RuntimeConfig* rtConfig_ = nullptr;

        mutable std::shared_mutex mutex_;
        std::set<AgentId> agents_;
        std::map<EdgeKey, Relationship> edges_;
        std::map<AgentId, std::vector<InformationPacket>> inbox_;

        static EdgeKey makeKey(const AgentId& a, const AgentId& b);

        // Delay in ticks and reliability for one hop over the relationship
        std::pair<int, double> propagationParams(const Relationship& relationship) const;

        bool isClusterEdge(const Relationship& relationship) const;
    };

} // namespace merchant

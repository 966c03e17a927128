#include <catch2/catch.hpp>
#include "engine/DecisionEngine.hpp"
#include "engine/LearningEngine.hpp"
#include "network/RelationshipNetwork.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace merchant;
using Catch::Detail::Approx;

// ============================================================
// Concurrent access
// ============================================================

TEST_CASE("Concurrency: learning engine under parallel writers and readers", "[concurrency]") {
    LearningEngine engine;
    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 500;
    std::atomic<bool> badRead{ false };

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&engine, &badRead, t]() {
            AgentId agent = (t % 2 == 0) ? "shared" : "agent" + std::to_string(t);
            for (int i = 0; i < PER_THREAD; ++i) {
                Outcome o;
                o.decision.itemId = "item" + std::to_string(i % 5);
                o.success = (i + t) % 3 != 0;
                o.profit = o.success ? 1.0 : -1.0;
                o.marketState = (i % 2 == 0) ? "normal" : "volatile";
                engine.recordOutcome(agent, o);

                auto prefs = engine.getPreferences("shared");
                for (const auto& [item, _] : prefs.avoidedItems) {
                    if (prefs.preferredItems.count(item)) badRead = true;
                }
                double rate = engine.successRate("shared");
                if (rate < 0.0 || rate > 1.0) badRead = true;
            }
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE_FALSE(badRead.load());
    REQUIRE(engine.outcomeCount("shared") == 100);
    for (int t = 1; t < THREADS; t += 2) {
        REQUIRE(engine.outcomeCount("agent" + std::to_string(t)) == 100);
    }
    REQUIRE(engine.analyzePatterns("shared").has_value());
}

TEST_CASE("Concurrency: relationship network under parallel updates", "[concurrency]") {
    RelationshipNetwork net;
    const std::vector<AgentId> ids = { "a", "b", "c", "d", "e", "f" };
    for (const auto& id : ids) net.addAgent(id);
    for (size_t i = 0; i + 1 < ids.size(); ++i) {
        net.addRelationship(ids[i], ids[i + 1], RelationshipType::FRIENDLY);
    }

    constexpr int THREADS = 6;
    constexpr int PER_THREAD = 400;
    std::atomic<size_t> delivered{ 0 };
    std::atomic<bool> badCluster{ false };

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < PER_THREAD; ++i) {
                const AgentId& a = ids[static_cast<size_t>((t + i) % 5)];
                const AgentId& b = ids[static_cast<size_t>((t + i) % 5 + 1)];
                net.updateStrength(a, b, (i % 2 == 0) ? 0.05 : -0.04);

                InformationPacket info;
                info.itemId = "apple";
                info.source = ids[static_cast<size_t>(t)];
                delivered += net.propagate(info).size();

                for (const auto& cluster : net.clusters()) {
                    if (cluster.size() < 2) badCluster = true;
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    // Every source has one or two neighbours on the chain
    REQUIRE(delivered.load() > 0);
    REQUIRE_FALSE(badCluster.load());

    for (size_t i = 0; i + 1 < ids.size(); ++i) {
        auto rel = net.getRelationship(ids[i], ids[i + 1]);
        REQUIRE(rel.has_value());
        REQUIRE(rel->strength >= 0.0);
        REQUIRE(rel->strength <= 1.0);
        REQUIRE(rel->trust >= 0.0);
        REQUIRE(rel->trust <= 1.0);
    }

    size_t inboxTotal = 0;
    for (const auto& id : ids) inboxTotal += net.getInformation(id).size();
    REQUIRE(inboxTotal == delivered.load());
}

TEST_CASE("Concurrency: many agents decide against one engine", "[concurrency]") {
    DecisionEngine engine;

    MarketSnapshot snap;
    ItemQuote item;
    item.id = "A";
    item.basePrice = 100.0;
    item.currentPrice = 80.0;
    item.demand = 50;
    item.supply = 30;
    item.priceHistory = { 80.0 };
    snap.items.push_back(item);

    Agent agent("m1", "Careful", 1000, makePersonality(PersonalityType::CONSERVATIVE));
    Decision expected = engine.decide(agent, snap);

    std::atomic<int> mismatches{ 0 };
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 200; ++i) {
                Decision d = engine.decide(agent, snap);
                if (d.type != expected.type || d.itemId != expected.itemId || d.quantity != expected.quantity) {
                    mismatches++;
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(mismatches.load() == 0);
}

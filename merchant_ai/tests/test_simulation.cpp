#include <catch2/catch.hpp>
#include "engine/Simulation.hpp"

using namespace merchant;
using Catch::Detail::Approx;

namespace {
    nlohmann::json smallConfig() {
        return nlohmann::json::parse(R"({
            "simulation": { "turns": 10, "seed": 7, "daysPerSeason": 5 },
            "merchants": { "aggressive": 1, "conservative": 1, "balanced": 1, "opportunistic": 1, "startingFunds": 500 },
            "items": [
                { "id": "apple", "category": "Food", "basePrice": 10.0, "volatility": 0.15, "tags": ["summer"] },
                { "id": "iron",  "category": "Material", "basePrice": 40.0, "price": 30.0, "volatility": 0.04 }
            ]
        })");
    }
}

// ============================================================
// Simulation driver
// ============================================================

TEST_CASE("Simulation: config drives items and merchants", "[simulation]") {
    Simulation sim;
    sim.loadConfig(smallConfig());
    sim.initialize();

    REQUIRE(sim.getRuntimeConfig().simulation.turns == 10);
    REQUIRE(sim.getSystem().agentCount() == 4);

    const auto& items = sim.getItems();
    REQUIRE(items.size() == 2);
    REQUIRE(items[0].id == "apple");
    REQUIRE(items[0].currentPrice == Approx(10.0));
    REQUIRE(items[1].currentPrice == Approx(30.0));
    REQUIRE(items[1].basePrice == Approx(40.0));

    auto ids = sim.getSystem().agentIds();
    REQUIRE(ids.front() == "merchant_001");
    REQUIRE(sim.getSystem().getAgent("merchant_001")->getPersonality().getType() == PersonalityType::AGGRESSIVE);
    REQUIRE(sim.getSystem().getAgent("merchant_001")->getFunds() == 500);
}

TEST_CASE("Simulation: missing config file keeps defaults", "[simulation]") {
    Simulation sim;
    sim.loadConfig(std::string("/nonexistent/merchant_ai.json"));
    sim.initialize();

    REQUIRE(sim.getRuntimeConfig().simulation.turns == 50);
    REQUIRE(sim.getSystem().agentCount() == 8);
    REQUIRE(sim.getItems().size() == 6);
}

TEST_CASE("Simulation: merchants of one temperament form a cluster", "[simulation]") {
    Simulation sim;
    sim.initialize();

    auto clusters = sim.getNetwork().clusters();
    REQUIRE(clusters.size() == 4);
    for (const auto& cluster : clusters) {
        REQUIRE(cluster.size() == 2);
    }
}

TEST_CASE("Simulation: buying moves funds into holdings", "[simulation][execute]") {
    Simulation sim;
    sim.loadConfig(smallConfig());
    sim.initialize();

    Agent* agent = sim.getSystem().getAgent("merchant_002");
    REQUIRE(agent != nullptr);

    Decision buy;
    buy.type = DecisionType::BUY;
    buy.itemId = "iron";
    buy.quantity = 3;
    buy.price = 30.0;

    Outcome outcome = sim.execute(*agent, buy);
    REQUIRE(agent->getFunds() == 410);
    REQUIRE(sim.getHolding("merchant_002", "iron") == 3);
    REQUIRE(outcome.success);
    REQUIRE(outcome.profit == Approx(30.0));       // (40 - 30) * 3
    REQUIRE(outcome.marketState == "stable");

    Decision sell = buy;
    sell.type = DecisionType::SELL;
    sell.quantity = 5;
    sell.price = 35.0;

    outcome = sim.execute(*agent, sell);
    REQUIRE(sim.getHolding("merchant_002", "iron") == 0);
    REQUIRE(agent->getFunds() == 515);
    REQUIRE(outcome.success);
    REQUIRE(outcome.profit == Approx(15.0));
}

TEST_CASE("Simulation: selling nothing fails", "[simulation][execute]") {
    Simulation sim;
    sim.loadConfig(smallConfig());
    sim.initialize();

    Agent* agent = sim.getSystem().getAgent("merchant_001");
    Decision sell;
    sell.type = DecisionType::SELL;
    sell.itemId = "apple";
    sell.quantity = 5;
    sell.price = 12.0;

    Outcome outcome = sim.execute(*agent, sell);
    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.profit == 0.0);
    REQUIRE(agent->getFunds() == 500);
    REQUIRE(agent->getReputation() == Approx(-0.5));
}

TEST_CASE("Simulation: turns advance the clock and keep funds sane", "[simulation]") {
    Simulation sim;
    sim.loadConfig(smallConfig());
    sim.initialize();
    sim.step(12);

    REQUIRE(sim.getCurrentTurn() == 12);
    REQUIRE(sim.getClock().getCurrentDay() == 13);
    REQUIRE(sim.getClock().currentSeason() == "autumn");
    REQUIRE(sim.getSystem().getTurnCount() == 12);

    for (const auto& id : sim.getSystem().agentIds()) {
        const Agent* agent = sim.getSystem().getAgent(id);
        REQUIRE(agent->getFunds() >= 0);
        REQUIRE(agent->getReputation() >= -100.0);
        REQUIRE(agent->getReputation() <= 100.0);
        REQUIRE(sim.getLearning().outcomeCount(id) == agent->getTradingStats().totalTrades);
    }

    for (const auto& item : sim.getItems()) {
        REQUIRE(item.currentPrice > 0.0);
        REQUIRE(item.priceHistory.size() <= 20);
    }
}

TEST_CASE("Simulation: same seed gives the same run", "[simulation]") {
    Simulation first;
    first.loadConfig(smallConfig());
    first.initialize();
    first.step(15);

    Simulation second;
    second.loadConfig(smallConfig());
    second.initialize();
    second.step(15);

    for (size_t i = 0; i < first.getItems().size(); ++i) {
        REQUIRE(first.getItems()[i].currentPrice == second.getItems()[i].currentPrice);
    }
    for (const auto& id : first.getSystem().agentIds()) {
        REQUIRE(first.getSystem().getAgent(id)->getFunds() == second.getSystem().getAgent(id)->getFunds());
        REQUIRE(first.getLearning().outcomeCount(id) == second.getLearning().outcomeCount(id));
    }
}

#include <catch2/catch.hpp>
#include "core/RuntimeConfig.hpp"
#include "engine/MarketInfluenceModel.hpp"
#include "network/RelationshipNetwork.hpp"

using namespace merchant;
using Catch::Detail::Approx;

// ============================================================
// RuntimeConfig Unit Tests
// ============================================================

TEST_CASE("RuntimeConfig: defaults", "[config]") {
    RuntimeConfig cfg;
    REQUIRE(cfg.simulation.turns == 50);
    REQUIRE(cfg.simulation.daysPerSeason == 30);
    REQUIRE(cfg.decision.bullishThreshold == Approx(0.7));
    REQUIRE(cfg.decision.bearishThreshold == Approx(0.3));
    REQUIRE(cfg.decision.jitterRange == Approx(0.05));
    REQUIRE(cfg.learning.historyLimit == 100);
    REQUIRE(cfg.learning.avoidThreshold == Approx(-1.0));
    REQUIRE(cfg.learning.minPatternOutcomes == 10);
    REQUIRE(cfg.influence.aggregatePriceCap == Approx(0.5));
    REQUIRE(cfg.network.baseDelay == 3);
    REQUIRE(cfg.network.clusterStrengthThreshold == Approx(0.7));
    REQUIRE(cfg.merchants.startingFunds == 1000);
}

TEST_CASE("RuntimeConfig: toJson carries every section", "[config]") {
    auto j = RuntimeConfig().toJson();
    REQUIRE(j.contains("simulation"));
    REQUIRE(j.contains("merchants"));
    REQUIRE(j.contains("decision"));
    REQUIRE(j.contains("learning"));
    REQUIRE(j.contains("influence"));
    REQUIRE(j.contains("network"));
    REQUIRE(j["learning"]["failureStep"].get<double>() == Approx(0.2));
    REQUIRE(j["network"]["baseReliability"].get<double>() == Approx(0.7));
}

TEST_CASE("RuntimeConfig: fromJson is a merge patch", "[config]") {
    RuntimeConfig cfg;
    cfg.fromJson(nlohmann::json::parse(R"({
        "simulation": { "turns": 12 },
        "network": { "baseDelay": 5 },
        "unknown": { "ignored": true }
    })"));

    REQUIRE(cfg.simulation.turns == 12);
    REQUIRE(cfg.simulation.seed == 42);
    REQUIRE(cfg.network.baseDelay == 5);
    REQUIRE(cfg.network.baseReliability == Approx(0.7));
    REQUIRE(cfg.learning.historyLimit == 100);
}

TEST_CASE("RuntimeConfig: json round trip", "[config]") {
    RuntimeConfig cfg;
    cfg.merchants.aggressive = 7;
    cfg.influence.priceCap = 0.25;
    cfg.learning.successStep = 0.15;

    RuntimeConfig copy;
    copy.fromJson(cfg.toJson());
    REQUIRE(copy.merchants.aggressive == 7);
    REQUIRE(copy.influence.priceCap == Approx(0.25));
    REQUIRE(copy.learning.successStep == Approx(0.15));
}

TEST_CASE("RuntimeConfig: components read the live config", "[config]") {
    RuntimeConfig cfg;
    RelationshipNetwork net(&cfg);
    net.addAgent("a");
    net.addAgent("b");
    net.addRelationship("a", "b", RelationshipType::RIVAL);

    REQUIRE(net.propagate(InformationPacket{ "apple", 0.1, "a", 1.0, 0 })[0].delay == 6);

    cfg.network.baseDelay = 4;
    REQUIRE(net.propagate(InformationPacket{ "apple", 0.1, "a", 1.0, 0 })[0].delay == 8);

    MarketInfluenceModel model(&cfg);
    cfg.influence.goldFactorCap = 1.0;
    REQUIRE(model.goldFactor(1000000) == Approx(1.0));
}

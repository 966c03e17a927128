#include <catch2/catch.hpp>
#include "engine/MarketInfluenceModel.hpp"
#include "utils/Random.hpp"

using namespace merchant;
using Catch::Detail::Approx;

// ============================================================
// Per-agent influence
// ============================================================

TEST_CASE("MarketInfluence: gold factor", "[influence]") {
    MarketInfluenceModel model;
    REQUIRE(model.goldFactor(0) == 0.0);
    REQUIRE(model.goldFactor(-500) == 0.0);
    REQUIRE(model.goldFactor(900) == Approx(1.0));          // log10(10)
    REQUIRE(model.goldFactor(9900) == Approx(2.0));
    REQUIRE(model.goldFactor(1000000000) == Approx(3.0));   // capped
}

TEST_CASE("MarketInfluence: reputation and personality factors", "[influence]") {
    REQUIRE(MarketInfluenceModel::reputationFactor(-100.0) == Approx(0.0));
    REQUIRE(MarketInfluenceModel::reputationFactor(0.0) == Approx(1.0));
    REQUIRE(MarketInfluenceModel::reputationFactor(100.0) == Approx(2.0));

    REQUIRE(MarketInfluenceModel::personalityFactor(AggressivePersonality()) == Approx(1.35));
    REQUIRE(MarketInfluenceModel::personalityFactor(ConservativePersonality()) == Approx(0.75));
    REQUIRE(MarketInfluenceModel::personalityFactor(BalancedPersonality()) == Approx(1.0));
}

TEST_CASE("MarketInfluence: balanced merchant with modest funds", "[influence]") {
    MarketInfluenceModel model;
    Influence inf = model.compute(900, 0.0, BalancedPersonality());

    REQUIRE(inf.priceImpact == Approx(0.01));
    REQUIRE(inf.demandImpact == Approx(0.01));
    REQUIRE(inf.supplyImpact == Approx(0.005));
    REQUIRE(inf.reputation == 0.0);
}

TEST_CASE("MarketInfluence: compute from an agent", "[influence]") {
    MarketInfluenceModel model;
    Agent agent("m1", "Rich", 9900, makePersonality(PersonalityType::AGGRESSIVE));
    agent.setReputation(50.0);

    Influence inf = model.compute(agent);
    REQUIRE(inf.priceImpact == Approx(0.01 * 2.0 * 1.35));
    REQUIRE(inf.demandImpact == Approx(0.01 * 1.5 * 1.35));
    REQUIRE(inf.supplyImpact == Approx(0.01));
    REQUIRE(inf.reputation == Approx(50.0));
}

TEST_CASE("MarketInfluence: bankrupt merchant moves no price", "[influence]") {
    MarketInfluenceModel model;
    Influence inf = model.compute(0, 100.0, AggressivePersonality());
    REQUIRE(inf.priceImpact == 0.0);
    REQUIRE(inf.supplyImpact == 0.0);
    REQUIRE(inf.demandImpact > 0.0);
}

TEST_CASE("MarketInfluence: per-agent caps", "[influence][config]") {
    RuntimeConfig cfg;
    cfg.influence.baseInfluence = 1.0;
    MarketInfluenceModel model(&cfg);

    Influence inf = model.compute(1000000, 100.0, AggressivePersonality());
    REQUIRE(inf.priceImpact == Approx(0.2));
    REQUIRE(inf.demandImpact == Approx(0.15));
    REQUIRE(inf.supplyImpact == Approx(0.1));
}

TEST_CASE("MarketInfluence: richer and better reputed never moves price less", "[influence]") {
    MarketInfluenceModel model;
    Random rng(5);
    const PersonalityType types[] = {
        PersonalityType::AGGRESSIVE, PersonalityType::CONSERVATIVE,
        PersonalityType::BALANCED, PersonalityType::OPPORTUNISTIC
    };

    for (int i = 0; i < 500; ++i) {
        auto personality = makePersonality(types[i % 4]);
        Funds funds = rng.uniformInt(0, 200000);
        double reputation = rng.uniform(-100.0, 99.0);

        Funds richer = funds + rng.uniformInt(1, 200000);
        double better = std::min(100.0, reputation + rng.uniform(0.01, 50.0));

        Influence low = model.compute(funds, reputation, *personality);
        Influence high = model.compute(richer, better, *personality);
        REQUIRE(high.priceImpact >= low.priceImpact);
    }
}

// ============================================================
// Aggregation
// ============================================================

TEST_CASE("MarketInfluence: aggregate of nothing is zero", "[influence][aggregate]") {
    MarketInfluenceModel model;
    Influence total = model.aggregate({});
    REQUIRE(total.priceImpact == 0.0);
    REQUIRE(total.demandImpact == 0.0);
    REQUIRE(total.supplyImpact == 0.0);
    REQUIRE(total.reputation == 0.0);
}

TEST_CASE("MarketInfluence: aggregate has diminishing returns", "[influence][aggregate]") {
    MarketInfluenceModel model;
    Influence a;
    a.priceImpact = 0.2;
    a.demandImpact = 0.1;
    a.supplyImpact = 0.1;
    a.reputation = 20.0;

    Influence b = a;
    b.reputation = -10.0;

    Influence total = model.aggregate({ a, b });
    REQUIRE(total.priceImpact == Approx(0.38));      // 0.2 + 0.2 * (1 - 0.1)
    REQUIRE(total.demandImpact == Approx(0.195));    // 0.1 + 0.1 * (1 - 0.05)
    REQUIRE(total.supplyImpact == Approx(0.195));
    REQUIRE(total.reputation == Approx(5.0));
}

TEST_CASE("MarketInfluence: aggregate below the caps ignores order", "[influence][aggregate]") {
    MarketInfluenceModel model;
    auto make = [](double price, double demand, double supply) {
        Influence inf;
        inf.priceImpact = price;
        inf.demandImpact = demand;
        inf.supplyImpact = supply;
        return inf;
    };
    Influence a = make(0.2, 0.1, 0.02);
    Influence b = make(0.05, 0.05, 0.08);
    Influence c = make(0.1, 0.02, 0.05);

    Influence forward = model.aggregate({ a, b, c });
    Influence backward = model.aggregate({ c, b, a });

    // 2 - 2 * (1 - 0.1) * (1 - 0.025) * (1 - 0.05)
    REQUIRE(forward.priceImpact == Approx(0.33275));
    REQUIRE(backward.priceImpact == Approx(forward.priceImpact));
    REQUIRE(backward.demandImpact == Approx(forward.demandImpact));
    REQUIRE(backward.supplyImpact == Approx(forward.supplyImpact));
}

TEST_CASE("MarketInfluence: aggregate never exceeds caps", "[influence][aggregate]") {
    MarketInfluenceModel model;
    Random rng(11);

    for (int n = 1; n <= 60; ++n) {
        std::vector<Influence> influences;
        for (int i = 0; i < n; ++i) {
            Influence inf;
            inf.priceImpact = rng.uniform(0.0, 0.2);
            inf.demandImpact = rng.uniform(0.0, 0.15);
            inf.supplyImpact = rng.uniform(0.0, 0.1);
            inf.reputation = rng.uniform(-100.0, 100.0);
            influences.push_back(inf);
        }

        Influence total = model.aggregate(influences);
        REQUIRE(total.priceImpact <= 0.5);
        REQUIRE(total.demandImpact <= 0.4);
        REQUIRE(total.supplyImpact <= 0.3);
        REQUIRE(total.priceImpact >= 0.0);
    }
}

TEST_CASE("MarketInfluence: effect appliers", "[influence]") {
    Influence inf;
    inf.priceImpact = 0.1;
    inf.demandImpact = 0.25;
    inf.supplyImpact = 0.25;

    REQUIRE(inf.priceEffect(100.0) == Approx(110.0));
    REQUIRE(inf.demandEffect(100) == 125);
    REQUIRE(inf.supplyEffect(10) == 13);            // 12.5 rounds away from zero
    REQUIRE(Influence{}.demandEffect(77) == 77);
}

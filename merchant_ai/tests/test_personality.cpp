#include <catch2/catch.hpp>
#include "agents/Personality.hpp"
#include "engine/DecisionEngine.hpp"

using namespace merchant;
using Catch::Detail::Approx;

// ============================================================
// PersonalityProfile Unit Tests
// ============================================================

TEST_CASE("Personality: Aggressive traits", "[personality]") {
    AggressivePersonality p;
    REQUIRE(p.getType() == PersonalityType::AGGRESSIVE);
    REQUIRE(p.riskTolerance() == Approx(0.8));
    REQUIRE(p.tradingFrequency() == Approx(1.5));
    REQUIRE(p.profitMarginTarget() == Approx(0.3));
    REQUIRE(p.competitivenessFactor() == Approx(1.2));
    REQUIRE(p.patienceFactor() == Approx(0.5));
}

TEST_CASE("Personality: Conservative traits", "[personality]") {
    ConservativePersonality p;
    REQUIRE(p.getType() == PersonalityType::CONSERVATIVE);
    REQUIRE(p.riskTolerance() == Approx(0.2));
    REQUIRE(p.tradingFrequency() == Approx(0.7));
    REQUIRE(p.profitMarginTarget() == Approx(0.5));
    REQUIRE(p.competitivenessFactor() == Approx(0.8));
    REQUIRE(p.patienceFactor() == Approx(1.5));
}

TEST_CASE("Personality: Balanced traits", "[personality]") {
    BalancedPersonality p;
    REQUIRE(p.getType() == PersonalityType::BALANCED);
    REQUIRE(p.riskTolerance() == Approx(0.5));
    REQUIRE(p.tradingFrequency() == Approx(1.0));
    REQUIRE(p.profitMarginTarget() == Approx(0.4));
    REQUIRE(p.competitivenessFactor() == Approx(1.0));
    REQUIRE(p.patienceFactor() == Approx(1.0));
}

TEST_CASE("Personality: Opportunistic traits", "[personality]") {
    OpportunisticPersonality p;
    REQUIRE(p.getType() == PersonalityType::OPPORTUNISTIC);
    REQUIRE(p.riskTolerance() == Approx(0.6));
    REQUIRE(p.tradingFrequency() == Approx(1.3));
    REQUIRE(p.profitMarginTarget() == Approx(0.35));
    REQUIRE(p.competitivenessFactor() == Approx(1.1));
    REQUIRE(p.patienceFactor() == Approx(0.8));
}

TEST_CASE("Personality: names", "[personality]") {
    REQUIRE(personalityName(PersonalityType::AGGRESSIVE) == "Aggressive");
    REQUIRE(personalityName(PersonalityType::CONSERVATIVE) == "Conservative");
    REQUIRE(personalityName(PersonalityType::BALANCED) == "Balanced");
    REQUIRE(personalityName(PersonalityType::OPPORTUNISTIC) == "Opportunistic");
    REQUIRE(OpportunisticPersonality().getName() == "Opportunistic");
}

TEST_CASE("Personality: makePersonality shares one immutable profile", "[personality]") {
    auto a = makePersonality(PersonalityType::AGGRESSIVE);
    auto b = makePersonality(PersonalityType::AGGRESSIVE);
    REQUIRE(a == b);
    REQUIRE(a->getType() == PersonalityType::AGGRESSIVE);
    REQUIRE(makePersonality(PersonalityType::CONSERVATIVE)->getType() == PersonalityType::CONSERVATIVE);
}

TEST_CASE("Personality: lookup by name falls back to Balanced", "[personality]") {
    REQUIRE(personalityFromName("Aggressive")->getType() == PersonalityType::AGGRESSIVE);
    REQUIRE(personalityFromName("Opportunistic")->getType() == PersonalityType::OPPORTUNISTIC);
    REQUIRE(personalityFromName("Balanced")->getType() == PersonalityType::BALANCED);
    REQUIRE(personalityFromName("Reckless")->getType() == PersonalityType::BALANCED);
    REQUIRE(personalityFromName("")->getType() == PersonalityType::BALANCED);
}

namespace {
    // Same capability set, different numbers
    class CautiousTrader : public PersonalityProfile {
    public:
        PersonalityType getType() const override { return PersonalityType::CONSERVATIVE; }
        double riskTolerance() const override { return 0.0; }
        double tradingFrequency() const override { return 0.5; }
        double profitMarginTarget() const override { return 0.9; }
        double competitivenessFactor() const override { return 0.5; }
        double patienceFactor() const override { return 2.0; }
    };
}

TEST_CASE("Personality: custom archetype drives the modifiers", "[personality]") {
    CautiousTrader custom;

    Decision d;
    d.type = DecisionType::BUY;
    d.quantity = 10;
    d.confidence = 0.8;

    Decision shaped = DecisionEngine::applyPersonalityModifiers(d, custom);
    REQUIRE(shaped.quantity == 5);                 // round(10 * 0.5)
    REQUIRE(shaped.confidence == Approx(0.4));     // 0.8 * 0.5
}

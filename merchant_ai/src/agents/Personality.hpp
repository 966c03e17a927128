#pragma once

#include <memory>
#include <string>

namespace merchant {

    enum class PersonalityType {
        AGGRESSIVE,
        CONSERVATIVE,
        BALANCED,
        OPPORTUNISTIC
    };

    // Immutable trait bundle shared by every agent of an archetype.
    // Custom archetypes subclass this and report the closest built-in type.
    class PersonalityProfile {
    public:
        virtual ~PersonalityProfile() = default;

        virtual PersonalityType getType() const = 0;
        virtual double riskTolerance() const = 0;         // 0 risk-averse .. 1 risk-seeking
        virtual double tradingFrequency() const = 0;      // confidence multiplier
        virtual double profitMarginTarget() const = 0;
        virtual double competitivenessFactor() const = 0;
        virtual double patienceFactor() const = 0;

        std::string getName() const;
    };

    using PersonalityPtr = std::shared_ptr<const PersonalityProfile>;

    class AggressivePersonality : public PersonalityProfile {
    public:
        PersonalityType getType() const override { return PersonalityType::AGGRESSIVE; }
        double riskTolerance() const override { return 0.8; }
        double tradingFrequency() const override { return 1.5; }
        double profitMarginTarget() const override { return 0.3; }
        double competitivenessFactor() const override { return 1.2; }
        double patienceFactor() const override { return 0.5; }
    };

    class ConservativePersonality : public PersonalityProfile {
    public:
        PersonalityType getType() const override { return PersonalityType::CONSERVATIVE; }
        double riskTolerance() const override { return 0.2; }
        double tradingFrequency() const override { return 0.7; }
        double profitMarginTarget() const override { return 0.5; }
        double competitivenessFactor() const override { return 0.8; }
        double patienceFactor() const override { return 1.5; }
    };

    class BalancedPersonality : public PersonalityProfile {
    public:
        PersonalityType getType() const override { return PersonalityType::BALANCED; }
        double riskTolerance() const override { return 0.5; }
        double tradingFrequency() const override { return 1.0; }
        double profitMarginTarget() const override { return 0.4; }
        double competitivenessFactor() const override { return 1.0; }
        double patienceFactor() const override { return 1.0; }
    };

    class OpportunisticPersonality : public PersonalityProfile {
    public:
        PersonalityType getType() const override { return PersonalityType::OPPORTUNISTIC; }
        double riskTolerance() const override { return 0.6; }
        double tradingFrequency() const override { return 1.3; }
        double profitMarginTarget() const override { return 0.35; }
        double competitivenessFactor() const override { return 1.1; }
        double patienceFactor() const override { return 0.8; }
    };

    std::string personalityName(PersonalityType type);

    // Shared immutable instance per built-in archetype
    PersonalityPtr makePersonality(PersonalityType type);

    // Unknown names fall back to Balanced
    PersonalityPtr personalityFromName(const std::string& name);

} // namespace merchant

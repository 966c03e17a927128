#include "Personality.hpp"
#include "utils/Logger.hpp"

namespace merchant {

    std::string PersonalityProfile::getName() const {
        return personalityName(getType());
    }

    std::string personalityName(PersonalityType type) {
        switch (type) {
        case PersonalityType::AGGRESSIVE:    return "Aggressive";
        case PersonalityType::CONSERVATIVE:  return "Conservative";
        case PersonalityType::BALANCED:      return "Balanced";
        case PersonalityType::OPPORTUNISTIC: return "Opportunistic";
        }
        return "Unknown";
    }

    PersonalityPtr makePersonality(PersonalityType type) {
        static const PersonalityPtr aggressive = std::make_shared<AggressivePersonality>();
        static const PersonalityPtr conservative = std::make_shared<ConservativePersonality>();
        static const PersonalityPtr balanced = std::make_shared<BalancedPersonality>();
        static const PersonalityPtr opportunistic = std::make_shared<OpportunisticPersonality>();

        switch (type) {
        case PersonalityType::AGGRESSIVE:    return aggressive;
        case PersonalityType::CONSERVATIVE:  return conservative;
        case PersonalityType::OPPORTUNISTIC: return opportunistic;
        default:                             return balanced;
        }
    }

    PersonalityPtr personalityFromName(const std::string& name) {
        if (name == "Aggressive") return makePersonality(PersonalityType::AGGRESSIVE);
        if (name == "Conservative") return makePersonality(PersonalityType::CONSERVATIVE);
        if (name == "Opportunistic") return makePersonality(PersonalityType::OPPORTUNISTIC);
        if (name != "Balanced") {
            Logger::warn("Unknown personality '{}', using Balanced", name);
        }
        return makePersonality(PersonalityType::BALANCED);
    }

} // namespace merchant

#pragma once

#include "core/Types.hpp"
#include "core/RuntimeConfig.hpp"
#include "agents/Agent.hpp"
#include <vector>

namespace merchant {

    // Models how an agent's wealth, reputation and personality distort the
    // market. Stateless apart from configuration, so safe to share.
    class MarketInfluenceModel {
    public:
        explicit MarketInfluenceModel(const RuntimeConfig* cfg = nullptr);

        Influence compute(const Agent& agent) const;

        // Same as compute, from raw attributes
        Influence compute(Funds funds, double reputation, const PersonalityProfile& personality) const;

        // Diminishing-returns fold, acc += impact * (1 - acc * 0.5), applied in
        // input order. Before the caps this equals 2 - 2 * prod(1 - impact / 2),
        // so the order only affects floating-point rounding.
        Influence aggregate(const std::vector<Influence>& influences) const;

        // log10(funds / 100 + 1) capped at goldFactorCap; 0 for funds <= 0
        double goldFactor(Funds funds) const;

        // Maps [-100, 100] onto [0, 2]
        static double reputationFactor(double reputation);

        static double personalityFactor(const PersonalityProfile& personality);

    private:
        const RuntimeConfig* rtConfig_ = nullptr;
    };

} // namespace merchant

#include "MarketInfluenceModel.hpp"
#include "utils/Statistics.hpp"
#include <algorithm>
#include <cmath>

namespace merchant {

    MarketInfluenceModel::MarketInfluenceModel(const RuntimeConfig* cfg)
        : rtConfig_(cfg)
    {
    }

    double MarketInfluenceModel::goldFactor(Funds funds) const {
        if (funds <= 0) return 0.0;

        double cap = rtConfig_ ? rtConfig_->influence.goldFactorCap : 3.0;
        return Statistics::clamp(std::log10(static_cast<double>(funds) / 100.0 + 1.0), 0.0, cap);
    }

    double MarketInfluenceModel::reputationFactor(double reputation) {
        return (reputation + 100.0) / 100.0;
    }

    double MarketInfluenceModel::personalityFactor(const PersonalityProfile& personality) {
        return (personality.competitivenessFactor() + personality.tradingFrequency()) / 2.0;
    }

    Influence MarketInfluenceModel::compute(const Agent& agent) const {
        return compute(agent.getFunds(), agent.getReputation(), agent.getPersonality());
    }

    Influence MarketInfluenceModel::compute(Funds funds, double reputation,
        const PersonalityProfile& personality) const {
        double base = rtConfig_ ? rtConfig_->influence.baseInfluence : 0.01;
        double priceCap = rtConfig_ ? rtConfig_->influence.priceCap : 0.2;
        double demandCap = rtConfig_ ? rtConfig_->influence.demandCap : 0.15;
        double supplyCap = rtConfig_ ? rtConfig_->influence.supplyCap : 0.1;

        double gold = goldFactor(funds);
        double rep = reputationFactor(reputation);
        double pers = personalityFactor(personality);

        Influence influence;
        influence.priceImpact = std::min(base * gold * pers, priceCap);
        influence.demandImpact = std::min(base * rep * pers, demandCap);
        influence.supplyImpact = std::min(base * gold * 0.5, supplyCap);   // supply reacts less
        influence.reputation = reputation;
        return influence;
    }

    Influence MarketInfluenceModel::aggregate(const std::vector<Influence>& influences) const {
        if (influences.empty()) return Influence{};

        double priceCap = rtConfig_ ? rtConfig_->influence.aggregatePriceCap : 0.5;
        double demandCap = rtConfig_ ? rtConfig_->influence.aggregateDemandCap : 0.4;
        double supplyCap = rtConfig_ ? rtConfig_->influence.aggregateSupplyCap : 0.3;

        std::vector<double> price, demand, supply, reputation;
        price.reserve(influences.size());
        demand.reserve(influences.size());
        supply.reserve(influences.size());
        reputation.reserve(influences.size());

        for (const auto& influence : influences) {
            price.push_back(influence.priceImpact);
            demand.push_back(influence.demandImpact);
            supply.push_back(influence.supplyImpact);
            reputation.push_back(influence.reputation);
        }

        Influence total;
        total.priceImpact = Statistics::clamp(Statistics::diminishingSum(price), 0.0, priceCap);
        total.demandImpact = Statistics::clamp(Statistics::diminishingSum(demand), 0.0, demandCap);
        total.supplyImpact = Statistics::clamp(Statistics::diminishingSum(supply), 0.0, supplyCap);
        total.reputation = Statistics::mean(reputation);
        return total;
    }

} // namespace merchant

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>
#include <type_traits>

namespace merchant {

    /// Central, JSON-serialisable configuration for every tunable knob of the
    /// merchant AI core.  Components constructed without a config behave
    /// identically to ones constructed with a default RuntimeConfig.

    struct RuntimeConfig {

        // ---- Demo simulation loop -------------------------------------------------
        struct SimulationParams {
            int      turns = 50;
            uint32_t seed = 42;
            int      ticksPerDay = 1;
            int      daysPerSeason = 30;
            int      maxDecisionsPerTurn = 3;
            double   priceWalkStd = 0.05;
        } simulation;

        // ---- Merchant population --------------------------------------------------
        struct MerchantParams {
            int     aggressive = 2;
            int     conservative = 2;
            int     balanced = 2;
            int     opportunistic = 2;
            int64_t startingFunds = 1000;
        } merchants;

        // ---- Decision engine ------------------------------------------------------
        struct DecisionParams {
            double bullishThreshold = 0.7;
            double bearishThreshold = 0.3;
            double jitterRange = 0.05;     // confidence jitter in [-range, range]
        } decision;

        // ---- Learning -------------------------------------------------------------
        struct LearningParams {
            int    historyLimit = 100;
            double successStep = 0.1;
            double failureStep = 0.2;
            double preferenceCap = 1.0;
            double avoidThreshold = -1.0;
            double conditionStep = 0.05;
            int    minPatternOutcomes = 10;
        } learning;

        // ---- Market influence -----------------------------------------------------
        struct InfluenceParams {
            double baseInfluence = 0.01;
            double goldFactorCap = 3.0;
            double priceCap = 0.2;
            double demandCap = 0.15;
            double supplyCap = 0.1;
            double aggregatePriceCap = 0.5;
            double aggregateDemandCap = 0.4;
            double aggregateSupplyCap = 0.3;
        } influence;

        // ---- Relationship network -------------------------------------------------
        struct NetworkParams {
            int    baseDelay = 3;
            double baseReliability = 0.7;
            double initialStrength = 0.5;
            double initialTrust = 0.5;
            double clusterStrengthThreshold = 0.7;
            int    tradeHistoryLimit = 100;
        } network;

        // ==== JSON serialisation ==================================================

        nlohmann::json toJson() const {
            nlohmann::json j;

            j["simulation"] = {
                {"turns",               simulation.turns},
                {"seed",                simulation.seed},
                {"ticksPerDay",         simulation.ticksPerDay},
                {"daysPerSeason",       simulation.daysPerSeason},
                {"maxDecisionsPerTurn", simulation.maxDecisionsPerTurn},
                {"priceWalkStd",        simulation.priceWalkStd}
            };

            j["merchants"] = {
                {"aggressive",    merchants.aggressive},
                {"conservative",  merchants.conservative},
                {"balanced",      merchants.balanced},
                {"opportunistic", merchants.opportunistic},
                {"startingFunds", merchants.startingFunds}
            };

            j["decision"] = {
                {"bullishThreshold", decision.bullishThreshold},
                {"bearishThreshold", decision.bearishThreshold},
                {"jitterRange",      decision.jitterRange}
            };

            j["learning"] = {
                {"historyLimit",       learning.historyLimit},
                {"successStep",        learning.successStep},
                {"failureStep",        learning.failureStep},
                {"preferenceCap",      learning.preferenceCap},
                {"avoidThreshold",     learning.avoidThreshold},
                {"conditionStep",      learning.conditionStep},
                {"minPatternOutcomes", learning.minPatternOutcomes}
            };

            j["influence"] = {
                {"baseInfluence",      influence.baseInfluence},
                {"goldFactorCap",      influence.goldFactorCap},
                {"priceCap",           influence.priceCap},
                {"demandCap",          influence.demandCap},
                {"supplyCap",          influence.supplyCap},
                {"aggregatePriceCap",  influence.aggregatePriceCap},
                {"aggregateDemandCap", influence.aggregateDemandCap},
                {"aggregateSupplyCap", influence.aggregateSupplyCap}
            };

            j["network"] = {
                {"baseDelay",                network.baseDelay},
                {"baseReliability",          network.baseReliability},
                {"initialStrength",          network.initialStrength},
                {"initialTrust",             network.initialTrust},
                {"clusterStrengthThreshold", network.clusterStrengthThreshold},
                {"tradeHistoryLimit",        network.tradeHistoryLimit}
            };

            return j;
        }

        /// Merge-patch: only the keys present in `j` are updated; everything
        /// else keeps its current/default value.
        void fromJson(const nlohmann::json& j) {
            auto get = [](const nlohmann::json& obj, const char* key, auto& dst) {
                if (obj.contains(key)) dst = obj[key].get<std::remove_reference_t<decltype(dst)>>();
                };

            if (j.contains("simulation")) {
                auto& s = j["simulation"];
                get(s, "turns", simulation.turns);
                get(s, "seed", simulation.seed);
                get(s, "ticksPerDay", simulation.ticksPerDay);
                get(s, "daysPerSeason", simulation.daysPerSeason);
                get(s, "maxDecisionsPerTurn", simulation.maxDecisionsPerTurn);
                get(s, "priceWalkStd", simulation.priceWalkStd);
            }

            if (j.contains("merchants")) {
                auto& m = j["merchants"];
                get(m, "aggressive", merchants.aggressive);
                get(m, "conservative", merchants.conservative);
                get(m, "balanced", merchants.balanced);
                get(m, "opportunistic", merchants.opportunistic);
                get(m, "startingFunds", merchants.startingFunds);
            }

            if (j.contains("decision")) {
                auto& d = j["decision"];
                get(d, "bullishThreshold", decision.bullishThreshold);
                get(d, "bearishThreshold", decision.bearishThreshold);
                get(d, "jitterRange", decision.jitterRange);
            }

            if (j.contains("learning")) {
                auto& l = j["learning"];
                get(l, "historyLimit", learning.historyLimit);
                get(l, "successStep", learning.successStep);
                get(l, "failureStep", learning.failureStep);
                get(l, "preferenceCap", learning.preferenceCap);
                get(l, "avoidThreshold", learning.avoidThreshold);
                get(l, "conditionStep", learning.conditionStep);
                get(l, "minPatternOutcomes", learning.minPatternOutcomes);
            }

            if (j.contains("influence")) {
                auto& i = j["influence"];
                get(i, "baseInfluence", influence.baseInfluence);
                get(i, "goldFactorCap", influence.goldFactorCap);
                get(i, "priceCap", influence.priceCap);
                get(i, "demandCap", influence.demandCap);
                get(i, "supplyCap", influence.supplyCap);
                get(i, "aggregatePriceCap", influence.aggregatePriceCap);
                get(i, "aggregateDemandCap", influence.aggregateDemandCap);
                get(i, "aggregateSupplyCap", influence.aggregateSupplyCap);
            }

            if (j.contains("network")) {
                auto& n = j["network"];
                get(n, "baseDelay", network.baseDelay);
                get(n, "baseReliability", network.baseReliability);
                get(n, "initialStrength", network.initialStrength);
                get(n, "initialTrust", network.initialTrust);
                get(n, "clusterStrengthThreshold", network.clusterStrengthThreshold);
                get(n, "tradeHistoryLimit", network.tradeHistoryLimit);
            }
        }
    };

} // namespace merchant

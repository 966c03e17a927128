#include "Simulation.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <tuple>

namespace merchant {

    namespace {
        constexpr size_t PRICE_HISTORY_LIMIT = 20;
        constexpr Price MIN_PRICE = 0.01;
        constexpr double SHARE_THRESHOLD = 0.1;   // relative move that gets gossiped
    }

    Simulation::Simulation()
        : rng_(rtConfig_.simulation.seed)
        , decisions_(&rtConfig_)
        , learning_(&rtConfig_)
        , influence_(&rtConfig_)
        , network_(&rtConfig_)
        , system_(decisions_, learning_, influence_, network_)
    {
    }

    void Simulation::loadConfig(const std::string& configPath) {
        std::ifstream file(configPath);
        if (!file.is_open()) {
            Logger::warn("Could not open config file: {}, using defaults", configPath);
            return;
        }

        try {
            loadConfig(nlohmann::json::parse(file));
        }
        catch (const std::exception& e) {
            Logger::error("Failed to parse config: {}", e.what());
        }
    }

    void Simulation::loadConfig(const nlohmann::json& config) {
        rtConfig_.fromJson(config);

        // Logging settings (not in RuntimeConfig - keeps Logger decoupled)
        if (config.contains("logging")) {
            auto& log = config["logging"];
            Logger::init(
                log.value("file", "merchant_ai.log"),
                log.value("level", "info"),
                log.value("console", true)
            );
        }

        if (config.contains("items")) {
            itemsData_ = config["items"];
        }

        Logger::info("Configuration loaded (RuntimeConfig populated)");
    }

    void Simulation::initialize() {
        Logger::info("Initializing simulation...");

        clock_.initialize(rtConfig_.simulation.ticksPerDay, rtConfig_.simulation.daysPerSeason);
        rng_.seed(rtConfig_.simulation.seed);
        currentTurn_ = 0;

        if (itemsData_.is_array() && !itemsData_.empty()) {
            createItemsFromConfig();
        }
        else {
            createDefaultItems();
        }

        createMerchants();

        Logger::info("Simulation initialized with {} items and {} merchants (seed {})",
            items_.size(), system_.agentCount(), rtConfig_.simulation.seed);
    }

    void Simulation::createItemsFromConfig() {
        for (const auto& entry : itemsData_) {
            ItemQuote item;
            item.id = entry.at("id").get<std::string>();
            item.basePrice = entry.at("basePrice").get<double>();
            item.currentPrice = entry.value("price", item.basePrice);
            item.supply = entry.value("supply", static_cast<Quantity>(100));
            item.demand = entry.value("demand", static_cast<Quantity>(100));
            item.volatility = entry.value("volatility", 0.1);
            item.category = entry.value("category", "");
            item.tags = entry.value("tags", std::vector<std::string>{});
            item.priceHistory.push_back(item.currentPrice);

            baseDemand_[item.id] = item.demand;
            baseSupply_[item.id] = item.supply;

            Logger::info("Loaded item {} ({}) @ {:.2f}", item.id, item.category, item.currentPrice);
            items_.push_back(std::move(item));
        }
    }

    void Simulation::createDefaultItems() {
        // id, category, base price, volatility, tags
        std::vector<std::tuple<std::string, std::string, double, double, std::vector<std::string>>> defaults = {
            {"apple",    "Food",     10.0,  0.15, {"fresh", "summer"}},
            {"wheat",    "Food",     6.0,   0.08, {"grain"}},
            {"fur_coat", "Clothing", 120.0, 0.12, {"warm", "winter"}},
            {"flower",   "Luxury",   15.0,  0.2,  {"fresh", "spring"}},
            {"tonic",    "Potion",   25.0,  0.1,  {"herbal"}},
            {"iron",     "Material", 40.0,  0.04, {"metal"}}
        };

        for (const auto& [id, category, price, volatility, tags] : defaults) {
            ItemQuote item;
            item.id = id;
            item.category = category;
            item.basePrice = price;
            item.currentPrice = price;
            item.volatility = volatility;
            item.supply = 100;
            item.demand = 100;
            item.tags = tags;
            item.priceHistory.push_back(price);

            baseDemand_[id] = item.demand;
            baseSupply_[id] = item.supply;
            items_.push_back(std::move(item));
        }
    }

    void Simulation::createMerchants() {
        const auto& m = rtConfig_.merchants;
        const std::vector<std::pair<PersonalityType, int>> population = {
            {PersonalityType::AGGRESSIVE,    m.aggressive},
            {PersonalityType::CONSERVATIVE,  m.conservative},
            {PersonalityType::BALANCED,      m.balanced},
            {PersonalityType::OPPORTUNISTIC, m.opportunistic}
        };

        std::vector<std::vector<AgentId>> groups;
        int serial = 0;
        for (const auto& [type, count] : population) {
            std::vector<AgentId> group;
            for (int i = 0; i < count; ++i) {
                AgentId id = fmt::format("merchant_{:03d}", ++serial);
                std::string name = fmt::format("{} Merchant {}", personalityName(type), i + 1);
                system_.addAgent(std::make_unique<Agent>(id, name, m.startingFunds, makePersonality(type)));
                group.push_back(id);
            }
            groups.push_back(std::move(group));
        }

        linkMerchants(groups);
    }

    void Simulation::linkMerchants(const std::vector<std::vector<AgentId>>& groups) {
        // Same temperament trade together
        for (const auto& group : groups) {
            for (size_t i = 1; i < group.size(); ++i) {
                network_.addRelationship(group[i - 1], group[i], RelationshipType::ALLIED);
            }
        }

        // Group leaders: aggressive and opportunistic compete, everyone else is friendly
        for (size_t i = 0; i < groups.size(); ++i) {
            for (size_t j = i + 1; j < groups.size(); ++j) {
                if (groups[i].empty() || groups[j].empty()) continue;
                bool rivals = (i == 0 && j == 3);
                network_.addRelationship(groups[i].front(), groups[j].front(),
                    rivals ? RelationshipType::RIVAL : RelationshipType::FRIENDLY);
            }
        }
    }

    void Simulation::step(int count) {
        for (int i = 0; i < count; ++i) {
            clock_.tick();
            walkPrices();
            applyInfluence();

            MarketSnapshot snap = snapshot();
            TemporalContext context = clock_.context();

            auto results = system_.runTurn(snap, context,
                [this](Agent& agent, const Decision& decision) {
                    return execute(agent, decision);
                });

            size_t trades = 0;
            double profit = 0.0;
            for (const auto& result : results) {
                if (!result.outcome) continue;
                trades++;
                profit += result.outcome->profit;
            }

            // Side screen of per-item opportunities, reported only
            size_t limit = static_cast<size_t>(std::max(0, rtConfig_.simulation.maxDecisionsPerTurn));
            size_t opportunities = 0;
            for (const auto& id : system_.agentIds()) {
                if (const Agent* agent = system_.getAgent(id)) {
                    opportunities += decisions_.decideMany(*agent, snap, limit, rng_).size();
                }
            }

            shareLargestMove();
            currentTurn_++;

            Logger::info("Turn {} (day {}, {}): {} trades, profit {:.2f}, {} screened opportunities",
                currentTurn_, clock_.getCurrentDay(), context.season(), trades, profit, opportunities);
        }
    }

    void Simulation::run() {
        int turns = rtConfig_.simulation.turns;
        Logger::info("Running {} turns", turns);
        step(turns);
        logSummary();
    }

    void Simulation::walkPrices() {
        double walkStd = rtConfig_.simulation.priceWalkStd;

        for (auto& item : items_) {
            double shock = rng_.normal(0.0, walkStd * (1.0 + item.volatility));
            item.currentPrice = std::max(MIN_PRICE, item.currentPrice * (1.0 + shock));

            item.priceHistory.push_back(item.currentPrice);
            if (item.priceHistory.size() > PRICE_HISTORY_LIMIT) {
                item.priceHistory.erase(item.priceHistory.begin());
            }
        }
    }

    void Simulation::applyInfluence() {
        Influence total = system_.marketInfluence();

        for (auto& item : items_) {
            item.demand = total.demandEffect(baseDemand_[item.id]);
            item.supply = total.supplyEffect(baseSupply_[item.id]);
        }

        Logger::debug("Merchant influence: price {:+.3f}, demand {:+.3f}, supply {:+.3f}",
            total.priceImpact, total.demandImpact, total.supplyImpact);
    }

    void Simulation::shareLargestMove() {
        const ItemQuote* mover = nullptr;
        double largest = 0.0;
        for (const auto& item : items_) {
            if (item.priceHistory.size() < 2) continue;
            Price prev = item.priceHistory[item.priceHistory.size() - 2];
            if (prev <= 0.0) continue;
            double change = (item.currentPrice - prev) / prev;
            if (std::abs(change) > std::abs(largest)) {
                largest = change;
                mover = &item;
            }
        }

        if (!mover || std::abs(largest) < SHARE_THRESHOLD) return;

        auto ids = system_.agentIds();
        if (ids.empty()) return;

        InformationPacket info;
        info.itemId = mover->id;
        info.priceChange = largest;
        info.source = ids[static_cast<size_t>(rng_.uniformInt(0, static_cast<int>(ids.size()) - 1))];
        info.reliability = 1.0;
        info.timestamp = clock_.getTotalTicks();

        auto events = system_.shareInformation(info);
        Logger::debug("{} shared {} move {:+.1f}% with {} merchants",
            info.source, info.itemId, largest * 100.0, events.size());
    }

    Outcome Simulation::execute(Agent& agent, const Decision& decision) {
        Outcome outcome;
        outcome.decision = decision;
        outcome.timestamp = clock_.getTotalTicks();

        const ItemQuote* item = findItem(decision.itemId);
        if (!item) {
            Logger::warn("{} traded unknown item {}", agent.getId(), decision.itemId);
            return outcome;
        }
        outcome.marketState = marketState(*item);

        Position& position = holdings_[agent.getId()][decision.itemId];

        if (decision.type == DecisionType::BUY) {
            Quantity quantity = std::min(decision.quantity, agent.affordable(decision.price));
            if (quantity <= 0) {
                agent.adjustReputation(-0.5);
                return outcome;
            }

            Funds cost = static_cast<Funds>(std::llround(decision.price * quantity));
            if (!agent.removeFunds(cost)) {
                agent.adjustReputation(-0.5);
                return outcome;
            }

            Price total = position.averageCost * position.quantity + decision.price * quantity;
            position.quantity += quantity;
            position.averageCost = total / position.quantity;

            // Marked against the item's base value
            outcome.profit = (item->basePrice - decision.price) * quantity;
        }
        else if (decision.type == DecisionType::SELL) {
            Quantity quantity = std::min(decision.quantity, position.quantity);
            if (quantity <= 0) {
                agent.adjustReputation(-0.5);
                return outcome;
            }

            agent.addFunds(static_cast<Funds>(std::llround(decision.price * quantity)));
            position.quantity -= quantity;
            outcome.profit = (decision.price - position.averageCost) * quantity;
            if (position.quantity == 0) position.averageCost = 0.0;
        }

        outcome.success = outcome.profit > 0.0;
        agent.adjustReputation(outcome.success ? 1.0 : -0.5);

        Logger::trace("{} {} {} x{} @ {:.2f} -> {:.2f}", agent.getId(), toString(decision.type),
            decision.itemId, decision.quantity, decision.price, outcome.profit);
        return outcome;
    }

    MarketSnapshot Simulation::snapshot() const {
        MarketSnapshot snap;
        snap.items = items_;
        return snap;
    }

    Quantity Simulation::getHolding(const AgentId& agent, const ItemId& item) const {
        auto aIt = holdings_.find(agent);
        if (aIt == holdings_.end()) return 0;
        auto iIt = aIt->second.find(item);
        return iIt != aIt->second.end() ? iIt->second.quantity : 0;
    }

    const ItemQuote* Simulation::findItem(const ItemId& id) const {
        for (const auto& item : items_) {
            if (item.id == id) return &item;
        }
        return nullptr;
    }

    std::string Simulation::marketState(const ItemQuote& item) {
        if (item.volatility > 0.15) return "volatile";
        if (item.volatility < 0.05) return "stable";
        return "normal";
    }

    void Simulation::logSummary() const {
        Logger::info("=== Summary after {} turns ({} season) ===", currentTurn_, clock_.currentSeason());

        for (const auto& [name, stats] : system_.getPersonalityStats()) {
            Logger::info("{}: {} decisions ({} buy / {} sell / {} hold), {} executed, {} successful, profit {:.2f}",
                name, stats.decisions, stats.buys, stats.sells, stats.holds,
                stats.executed, stats.successes, stats.profit);
        }

        for (const auto& id : system_.agentIds()) {
            const Agent* agent = system_.getAgent(id);
            if (!agent) continue;

            auto stats = agent->getTradingStats();
            Logger::info("{} [{}] funds {} reputation {:.1f} trades {} success {:.2f} (learned {:.2f})",
                id, agent->getPersonality().getName(), agent->getFunds(), agent->getReputation(),
                stats.totalTrades, stats.successRate, learning_.successRate(id));

            if (auto pattern = learning_.analyzePatterns(id)) {
                Logger::info("  pattern: item '{}', action {}, market '{}'",
                    pattern->mostProfitableItem, toString(pattern->mostSuccessfulAction),
                    pattern->optimalMarketState);
            }
        }

        for (const auto& cluster : network_.clusters()) {
            std::string members;
            for (const auto& id : cluster) {
                if (!members.empty()) members += ", ";
                members += id;
            }
            Logger::info("Cluster: {}", members);
        }

        Influence total = system_.marketInfluence();
        Logger::info("Aggregate influence: price {:+.3f}, demand {:+.3f}, supply {:+.3f}, reputation {:.1f}",
            total.priceImpact, total.demandImpact, total.supplyImpact, total.reputation);
    }

} // namespace merchant

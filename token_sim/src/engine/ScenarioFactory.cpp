#include "ScenarioFactory.hpp"
#include "utils/Logger.hpp"
#include <fstream>
#include <limits>

namespace tokensim {

    using nlohmann::json;

    namespace {

        const json& require(const json& j, const char* key, const std::string& context) {
            if (!j.is_object() || !j.contains(key)) {
                throw ConfigurationError("Missing \"" + std::string(key) + "\" in " + context);
            }
            return j.at(key);
        }

        std::string typeOf(const json& j, const std::string& context) {
            return require(j, "type", context).get<std::string>();
        }

        std::vector<double> numbers(const json& j, const char* key, const std::string& context) {
            const auto& arr = require(j, key, context);
            if (!arr.is_array()) {
                throw ConfigurationError("\"" + std::string(key) + "\" in " + context + " must be an array");
            }
            return arr.get<std::vector<double>>();
        }

        SpaceFunction spaceOf(const json& j) {
            return parseSpaceFunction(j.value("space", std::string("linear")));
        }

        AddOnChain noiseOf(const json& j) {
            if (!j.contains("noise")) return AddOnChain();
            return ScenarioFactory::addOnsFromJson(j.at("noise"));
        }

        // A "distribution" object, optionally overridden per step by a "params" array
        std::vector<DistributionParams> stepParams(const json& j, const Distribution& base) {
            std::vector<DistributionParams> params;
            if (j.contains("params")) {
                for (const auto& p : j.at("params")) {
                    params.push_back(ScenarioFactory::paramsFromJson(p, base.params));
                }
            }
            if (params.empty()) {
                params.push_back(base.params);
            }
            return params;
        }

    } // namespace

    // ---- Distributions ---------------------------------------------------------

    DistributionParams ScenarioFactory::paramsFromJson(const json& j, DistributionParams base) {
        base.loc = j.value("loc", base.loc);
        base.scale = j.value("scale", base.scale);
        base.shape = j.value("shape", base.shape);
        base.mu = j.value("mu", base.mu);
        base.n = j.value("n", base.n);
        base.p = j.value("p", base.p);
        return base;
    }

    Distribution ScenarioFactory::distributionFromJson(const json& j) {
        Distribution d;
        if (j.is_number()) {
            return Distribution::constant(j.get<double>());
        }
        d.kind = parseDistributionKind(require(j, "kind", "distribution").get<std::string>());
        d.params = paramsFromJson(j);
        validateDistribution(d);
        return d;
    }

    // ---- Add-ons ---------------------------------------------------------------

    std::unique_ptr<AddOn> ScenarioFactory::addOnFromJson(const json& j) {
        std::string type = typeOf(j, "add-on");

        if (type == "random_noise") {
            Distribution noise = j.contains("distribution")
                ? distributionFromJson(j.at("distribution"))
                : Distribution::normal(0.0, 1.0);
            return std::make_unique<RandomNoise>(noise);
        }
        if (type == "proportional_noise") {
            return std::make_unique<ProportionalNoise>(
                j.value("mean", 0.0), j.value("std_divisor", 5.0), j.value("add_value", true));
        }
        if (type == "random_reduction") {
            Distribution reduction = j.contains("distribution")
                ? distributionFromJson(j.at("distribution"))
                : Distribution::uniform(0.0, 1.0);
            return std::make_unique<RandomReduction>(reduction);
        }
        if (type == "timed_multiplier") {
            return std::make_unique<TimedMultiplier>(
                require(j, "multiplier", "timed_multiplier").get<double>(),
                require(j, "first_step", "timed_multiplier").get<StepIndex>(),
                require(j, "last_step", "timed_multiplier").get<StepIndex>());
        }
        throw ConfigurationError("Unknown add-on type: " + type);
    }

    AddOnChain ScenarioFactory::addOnsFromJson(const json& list) {
        AddOnChain chain;
        if (list.is_object()) {
            chain.add(addOnFromJson(list));
            return chain;
        }
        for (const auto& item : list) {
            chain.add(addOnFromJson(item));
        }
        return chain;
    }

    // ---- User growth -----------------------------------------------------------

    std::unique_ptr<UserGrowth> ScenarioFactory::userGrowthFromJson(const json& j) {
        if (j.is_number()) {
            return std::make_unique<ConstantUserGrowth>(j.get<double>());
        }

        std::string type = typeOf(j, "users");
        if (type == "constant") {
            return std::make_unique<ConstantUserGrowth>(require(j, "users", "constant users").get<double>());
        }
        if (type == "from_data") {
            return std::make_unique<FromDataUserGrowth>(numbers(j, "values", "from_data users"));
        }
        if (type == "spaced") {
            return std::make_unique<SpacedUserGrowth>(
                require(j, "initial", "spaced users").get<double>(),
                require(j, "max", "spaced users").get<double>(),
                require(j, "steps", "spaced users").get<size_t>(),
                spaceOf(j),
                j.value("use_difference", false),
                noiseOf(j));
        }
        if (type == "stochastic") {
            Distribution base = j.contains("distribution")
                ? distributionFromJson(j.at("distribution"))
                : Distribution::poisson(1000.0);
            return std::make_unique<StochasticUserGrowth>(base.kind, stepParams(j, base),
                j.value("add_to_userbase", false),
                j.value("initial_users", 0.0),
                noiseOf(j));
        }
        throw ConfigurationError("Unknown user growth type: " + type);
    }

    // ---- Transactions ----------------------------------------------------------

    std::unique_ptr<TransactionModel> ScenarioFactory::transactionModelFromJson(const json& j) {
        if (j.is_number()) {
            return std::make_unique<ConstantTransactions>(j.get<double>());
        }
        std::string type = typeOf(j, "transactions");

        if (type == "constant") {
            return std::make_unique<ConstantTransactions>(
                require(j, "value_per_user", "constant transactions").get<double>(), noiseOf(j));
        }
        if (type == "from_data") {
            return std::make_unique<FromDataTransactions>(numbers(j, "values", "from_data transactions"));
        }
        if (type == "trend") {
            return std::make_unique<TrendTransactions>(
                require(j, "initial_mean", "trend transactions").get<double>(),
                require(j, "final_mean", "trend transactions").get<double>(),
                require(j, "steps", "trend transactions").get<size_t>(),
                spaceOf(j),
                noiseOf(j));
        }
        if (type == "stochastic") {
            StochasticTransactionParams params;
            if (j.contains("activity_probabilities")) {
                const auto& probs = j.at("activity_probabilities");
                params.activityProbabilities = probs.is_array()
                    ? probs.get<std::vector<double>>()
                    : std::vector<double>{ probs.get<double>() };
            }
            if (j.contains("transactions_per_user")) {
                params.transactionsPerUser = j.at("transactions_per_user").get<double>();
            }
            if (j.contains("transactions_distribution")) {
                params.transactionsDistribution = distributionFromJson(j.at("transactions_distribution"));
            }
            if (j.contains("value_per_transaction")) {
                params.valuePerTransaction = j.at("value_per_transaction").get<double>();
            }
            if (j.contains("value_distribution")) {
                params.valueDistribution = distributionFromJson(j.at("value_distribution"));
            }
            params.sign = parseSignPolicy(j.value("sign", std::string("positive")));
            return std::make_unique<StochasticTransactions>(params);
        }
        if (type == "marketcap") {
            Distribution fraction = j.contains("distribution")
                ? distributionFromJson(j.at("distribution"))
                : Distribution::normal(0.0, 0.25);
            return std::make_unique<MarketcapTransactions>(fraction,
                parseSignPolicy(j.value("sign", std::string("any"))));
        }
        throw ConfigurationError("Unknown transaction model type: " + type);
    }

    // ---- Holding time ----------------------------------------------------------

    std::unique_ptr<HoldingTimeModel> ScenarioFactory::holdingTimeFromJson(const json& j) {
        if (j.is_number()) {
            return std::make_unique<ConstantHoldingTime>(j.get<double>());
        }

        std::string type = typeOf(j, "holding_time");
        if (type == "constant") {
            return std::make_unique<ConstantHoldingTime>(require(j, "value", "constant holding_time").get<double>());
        }
        if (type == "stochastic") {
            Distribution base = j.contains("distribution")
                ? distributionFromJson(j.at("distribution"))
                : Distribution::lognormal(1.0);
            return std::make_unique<StochasticHoldingTime>(base.kind, stepParams(j, base),
                j.value("minimum", 0.1));
        }
        if (type == "adaptive") {
            return std::make_unique<AdaptiveHoldingTime>(
                require(j, "initial", "adaptive holding_time").get<double>(),
                j.value("minimum", 0.01),
                j.value("maximum", 12.0));
        }
        throw ConfigurationError("Unknown holding time type: " + type);
    }

    // ---- Pools and controllers -------------------------------------------------

    std::unique_ptr<AgentPool> ScenarioFactory::agentPoolFromJson(const json& j) {
        std::string name = require(j, "name", "agent pool").get<std::string>();
        std::string context = "agent pool " + name;

        std::string kind = j.value("type", std::string("basic"));
        std::string currency = require(j, "currency", context).get<std::string>();
        auto users = userGrowthFromJson(require(j, "users", context));
        auto transactions = transactionModelFromJson(require(j, "transactions", context));
        auto activation = j.value("activation_step", static_cast<StepIndex>(0));

        std::unique_ptr<AgentPool> pool;
        if (kind == "basic") {
            pool = std::make_unique<AgentPool>(name, currency, std::move(users), std::move(transactions), activation);
        } else if (kind == "buyback") {
            pool = std::make_unique<BuyBackAgentPool>(name, currency, std::move(users), std::move(transactions), activation);
        } else {
            throw ConfigurationError("Unknown agent pool type: " + kind);
        }

        pool->setDumper(j.value("dumper", false));
        if (j.contains("chained_to")) {
            pool->chainTo(j.at("chained_to").get<std::string>());
        }
        if (j.contains("fee")) {
            pool->setFee(j.at("fee").get<double>(), parseSupplyStyle(j.value("fee_style", std::string("perc"))));
        }
        return pool;
    }

    std::unique_ptr<SupplyController> ScenarioFactory::supplyControllerFromJson(const json& j) {
        std::string type = typeOf(j, "supply controller");

        if (type == "burn" || type == "mint") {
            auto direction = type == "burn" ? SupplyDirection::BURN : SupplyDirection::MINT;
            return std::make_unique<RateSupplyController>(direction,
                require(j, "param", type).get<double>(),
                j.value("style", std::string("perc")),
                j.value("self_destruct", false),
                j.value("name", type));
        }
        if (type == "vesting") {
            return std::make_unique<VestingSupplyController>(
                require(j, "amount", "vesting").get<double>(),
                require(j, "vesting_period", "vesting").get<size_t>(),
                j.value("cliff", static_cast<size_t>(0)),
                j.value("delay", static_cast<size_t>(0)),
                j.value("name", std::string("vesting")));
        }
        if (type == "dumping") {
            return std::make_unique<DumpingSupplyController>(
                require(j, "initial", "dumping").get<double>(),
                require(j, "final", "dumping").get<double>(),
                require(j, "steps", "dumping").get<size_t>(),
                spaceOf(j),
                j.value("name", std::string("dumping")));
        }
        if (type == "adaptive_stochastic") {
            Distribution removal = j.contains("removal")
                ? distributionFromJson(j.at("removal"))
                : Distribution::uniform(0.0, 0.1);
            Distribution addition = j.contains("addition")
                ? distributionFromJson(j.at("addition"))
                : Distribution::uniform(0.0, 0.05);
            return std::make_unique<AdaptiveStochasticSupplyController>(removal, addition,
                j.value("name", std::string("adaptive_stochastic")));
        }
        if (type == "from_data") {
            return std::make_unique<FromDataSupplyController>(numbers(j, "values", "from_data"),
                j.value("on_end_continue", true),
                j.value("name", std::string("from_data")));
        }
        if (type == "speculator") {
            SpeculatorParams params;
            if (j.contains("speculation")) {
                params.speculation = distributionFromJson(j.at("speculation"));
            }
            params.takeProfit = j.value("take_profit", params.takeProfit);
            params.stopLoss = j.value("stop_loss", params.stopLoss);
            params.maxShareOfSupply = j.value("max_share_of_supply", params.maxShareOfSupply);
            return std::make_unique<SpeculatorSupplyController>(params,
                j.value("name", std::string("speculator")));
        }
        throw ConfigurationError("Unknown supply controller type: " + type);
    }

    // ---- Pricing ---------------------------------------------------------------

    PriceCurve ScenarioFactory::curveFromJson(const json& j) {
        std::string shape = require(j, "shape", "curve").get<std::string>();
        if (shape == "linear") {
            return PriceCurves::linear(require(j, "slope", "linear curve").get<double>(), j.value("intercept", 0.0));
        }
        if (shape == "power") {
            return PriceCurves::power(require(j, "coefficient", "power curve").get<double>(),
                require(j, "exponent", "power curve").get<double>());
        }
        if (shape == "exponential") {
            return PriceCurves::exponential(require(j, "coefficient", "exponential curve").get<double>(),
                require(j, "rate", "exponential curve").get<double>());
        }
        throw ConfigurationError("Unknown curve shape: " + shape);
    }

    std::unique_ptr<PriceFunction> ScenarioFactory::priceFunctionFromJson(const json& j) {
        std::string type = typeOf(j, "price_function");

        if (type == "constant") {
            return std::make_unique<ConstantPrice>(require(j, "price", "constant price").get<double>());
        }
        if (type == "equation_of_exchange") {
            return std::make_unique<EquationOfExchangePrice>(j.value("smoothing", 1.0), j.value("use_velocity", true));
        }
        if (type == "constant_elasticity") {
            return std::make_unique<ConstantElasticityPrice>(
                j.value("demand_elasticity", 1.0), j.value("supply_elasticity", 1.0));
        }
        if (type == "linear_regression") {
            return std::make_unique<LinearRegressionPrice>(
                j.value("top_appreciation", 0.3),
                j.value("std_prior", 0.1),
                j.value("anchoring", 0.1),
                j.value("proportionate_noise", true));
        }
        if (type == "bonding_curve" || type == "issuance_curve") {
            auto curve = curveFromJson(require(j, "curve", type));
            double maxSupply = j.value("max_supply", std::numeric_limits<double>::infinity());
            if (type == "bonding_curve") {
                return std::make_unique<BondingCurvePrice>(curve, maxSupply);
            }
            return std::make_unique<IssuanceCurvePrice>(curve, maxSupply);
        }
        throw ConfigurationError("Unknown price function type: " + type);
    }

    // ---- Economies -------------------------------------------------------------

    std::unique_ptr<TokenEconomy> ScenarioFactory::fromJson(const json& scenario) {
        try {
            EconomyConfig config;
            config.tokenId = require(scenario, "token", "scenario").get<std::string>();
            config.fiat = scenario.value("fiat", config.fiat);
            config.unitOfTime = parseUnitOfTime(scenario.value("unit_of_time", std::string("day")));
            config.initialPrice = require(scenario, "initial_price", "scenario " + config.tokenId).get<double>();
            config.burnToken = scenario.value("burn_token", false);
            config.scheduleIsAdded = scenario.value("supply_is_added", false);
            config.safeguardSupply = scenario.value("safeguard_supply", false);
            config.name = scenario.value("name", config.tokenId);

            const auto& supply = require(scenario, "supply", "scenario " + config.tokenId);
            if (supply.is_array()) {
                config.supplySchedule = supply.get<std::vector<double>>();
                if (config.supplySchedule.empty()) {
                    throw ConfigurationError("Supply schedule of " + config.tokenId + " is empty");
                }
                // Starting point for additive schedules
                config.initialSupply = scenario.value("initial_supply", 0.0);
            } else {
                config.initialSupply = supply.get<double>();
            }

            auto economy = std::make_unique<TokenEconomy>(config);

            if (scenario.contains("holding_time")) {
                economy->setHoldingTimeModel(holdingTimeFromJson(scenario.at("holding_time")));
            }
            economy->setPriceFunction(priceFunctionFromJson(
                require(scenario, "price_function", "scenario " + config.tokenId)));

            for (const auto& pool : scenario.value("agent_pools", json::array())) {
                economy->addAgentPool(agentPoolFromJson(pool));
            }
            for (const auto& controller : scenario.value("supply_controllers", json::array())) {
                economy->addSupplyController(supplyControllerFromJson(controller));
            }
            for (const auto& addOn : scenario.value("addons", json::array())) {
                std::string target = require(addOn, "target", "add-on").get<std::string>();
                if (target == "price") target = economy->getKeys().price;
                else if (target == "supply") target = economy->getKeys().supply;
                economy->addAddOn(target, addOnFromJson(addOn));
            }

            Logger::info("Built scenario {}: token {}, {} pools, {} supply controllers",
                economy->getName(), config.tokenId, economy->getAgentPoolCount(),
                economy->getSupplyControllerCount());
            return economy;
        }
        catch (const json::exception& e) {
            throw ConfigurationError(std::string("Invalid scenario JSON: ") + e.what());
        }
    }

    ScenarioDocument ScenarioFactory::documentFromJson(const json& doc) {
        ScenarioDocument out;
        try {
            if (doc.contains("run")) {
                out.run.fromJson(doc.at("run"));
            }
        }
        catch (const json::exception& e) {
            throw ConfigurationError(std::string("Invalid run configuration: ") + e.what());
        }

        if (doc.contains("scenarios")) {
            for (const auto& s : doc.at("scenarios")) {
                auto economy = fromJson(s);
                std::string name = economy->getName();
                out.scenarios.push_back({ name, std::move(economy) });
            }
        } else {
            auto economy = fromJson(doc);
            std::string name = economy->getName();
            out.scenarios.push_back({ name, std::move(economy) });
        }

        if (out.scenarios.empty()) {
            throw ConfigurationError("Configuration holds no scenarios");
        }
        return out;
    }

    ScenarioDocument ScenarioFactory::load(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw ConfigurationError("Could not open config file: " + path);
        }

        json doc;
        try {
            doc = json::parse(file);
        }
        catch (const json::exception& e) {
            throw ConfigurationError("Failed to parse " + path + ": " + e.what());
        }
        return documentFromJson(doc);
    }

} // namespace tokensim

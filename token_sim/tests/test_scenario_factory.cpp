#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "engine/ScenarioFactory.hpp"
#include "engine/MetaSimulator.hpp"

using namespace tokensim;
using Catch::Approx;
using nlohmann::json;

namespace {

    json minimalScenario() {
        return json::parse(R"({
            "token": "tk",
            "initial_price": 0.03,
            "supply": 1000000,
            "price_function": { "type": "constant", "price": 0.03 }
        })");
    }

} // namespace

TEST_CASE("ScenarioFactory: minimal scenario uses defaults", "[factory]") {
    auto econ = ScenarioFactory::fromJson(minimalScenario());
    REQUIRE(econ->getTokenId() == "tk");
    REQUIRE(econ->getName() == "tk");
    REQUIRE(econ->getUnitOfTime() == UnitOfTime::DAY);
    REQUIRE(econ->getKeys().fiatVolume == "transactions_$");
    REQUIRE(econ->hasPriceFunction());
    REQUIRE(econ->getAgentPoolCount() == 0);

    const auto& data = econ->run(3, 1);
    REQUIRE(data.column("tk_supply") == std::vector<double>{ 1e6, 1e6, 1e6 });
}

TEST_CASE("ScenarioFactory: full scenario wires every component", "[factory]") {
    auto j = json::parse(R"({
        "name": "full",
        "token": "tk",
        "fiat": "usd",
        "unit_of_time": "month",
        "initial_price": 0.05,
        "supply": 500000,
        "holding_time": { "type": "adaptive", "initial": 2.0 },
        "price_function": { "type": "linear_regression", "anchoring": 0.2 },
        "agent_pools": [
            { "name": "retail", "currency": "usd",
              "users": { "type": "spaced", "initial": 100, "max": 1000, "steps": 12, "space": "geom",
                         "noise": [ { "type": "proportional_noise" } ] },
              "transactions": { "type": "trend", "initial_mean": 5, "final_mean": 8, "steps": 12 } },
            { "name": "whales", "currency": "tk", "activation_step": 3,
              "users": { "type": "stochastic", "distribution": { "kind": "poisson", "mu": 5 },
                         "add_to_userbase": true },
              "transactions": { "type": "marketcap", "distribution": { "kind": "normal", "loc": 0, "scale": 0.01 },
                                "sign": "negative" } }
        ],
        "supply_controllers": [
            { "type": "vesting", "amount": 10000, "vesting_period": 6, "cliff": 2 },
            { "type": "dumping", "initial": 500, "final": 100, "steps": 5 },
            { "type": "adaptive_stochastic" },
            { "type": "burn", "param": 0.001 }
        ],
        "addons": [
            { "target": "price", "type": "timed_multiplier", "multiplier": 1.1, "first_step": 4, "last_step": 6 },
            { "target": "supply", "type": "random_reduction", "distribution": 0 }
        ]
    })");

    auto econ = ScenarioFactory::fromJson(j);
    REQUIRE(econ->getName() == "full");
    REQUIRE(econ->getUnitOfTime() == UnitOfTime::MONTH);
    REQUIRE(econ->getAgentPoolCount() == 2);
    REQUIRE(econ->getAgentPool(1).getActivationStep() == 3);
    REQUIRE(econ->getAgentPool(0).getUserGrowth().getType() == "SpacedUserGrowth");
    REQUIRE(econ->getAgentPool(1).getTransactionModel().getType() == "MarketcapTransactions");
    REQUIRE(econ->getSupplyControllerCount() == 4);

    const auto& data = econ->run(12, 17);
    REQUIRE(data.rows() == 12);
    REQUIRE(data.hasColumn("transactions_usd"));
    REQUIRE(data.at("whales_users", 0) == 0.0);
    for (double s : data.column("tk_supply")) {
        REQUIRE(s >= 0.0);
    }
}

TEST_CASE("ScenarioFactory: supply arrays become schedules", "[factory]") {
    auto j = minimalScenario();
    j["supply"] = { 100.0, 200.0, 300.0 };

    auto econ = ScenarioFactory::fromJson(j);
    REQUIRE(econ->getConfig().supplySchedule.size() == 3);
    REQUIRE_THROWS_AS(econ->prepare(5), ConfigurationError);
    REQUIRE(econ->run(3, 1).column("tk_supply") == std::vector<double>{ 100.0, 200.0, 300.0 });

    j["supply"] = json::array();
    REQUIRE_THROWS_AS(ScenarioFactory::fromJson(j), ConfigurationError);
}

TEST_CASE("ScenarioFactory: bad input raises ConfigurationError", "[factory]") {
    auto missingToken = minimalScenario();
    missingToken.erase("token");
    REQUIRE_THROWS_AS(ScenarioFactory::fromJson(missingToken), ConfigurationError);

    auto missingPrice = minimalScenario();
    missingPrice.erase("price_function");
    REQUIRE_THROWS_AS(ScenarioFactory::fromJson(missingPrice), ConfigurationError);

    auto badStyle = minimalScenario();
    badStyle["supply_controllers"] = json::parse(R"([{ "type": "burn", "param": 0.1, "style": "percent" }])");
    REQUIRE_THROWS_AS(ScenarioFactory::fromJson(badStyle), ConfigurationError);

    auto badType = minimalScenario();
    badType["price_function"] = json::parse(R"({ "type": "magic" })");
    REQUIRE_THROWS_AS(ScenarioFactory::fromJson(badType), ConfigurationError);

    auto wrongKind = minimalScenario();
    wrongKind["initial_price"] = "cheap";
    REQUIRE_THROWS_AS(ScenarioFactory::fromJson(wrongKind), ConfigurationError);
}

TEST_CASE("ScenarioFactory: distributions parse numbers and objects", "[factory]") {
    auto constant = ScenarioFactory::distributionFromJson(json(2.5));
    REQUIRE(constant.kind == DistributionKind::CONSTANT);
    REQUIRE(constant.params.loc == 2.5);

    auto poisson = ScenarioFactory::distributionFromJson(json::parse(R"({ "kind": "poisson", "mu": 12 })"));
    REQUIRE(poisson.kind == DistributionKind::POISSON);
    REQUIRE(poisson.params.mu == 12.0);

    REQUIRE_THROWS_AS(ScenarioFactory::distributionFromJson(json::parse(R"({ "kind": "normal", "scale": -1 })")),
        ConfigurationError);
    REQUIRE_THROWS_AS(ScenarioFactory::distributionFromJson(json::parse(R"({ "loc": 1 })")), ConfigurationError);
}

TEST_CASE("ScenarioFactory: shorthand numbers for users and holding time", "[factory]") {
    auto users = ScenarioFactory::userGrowthFromJson(json(40));
    REQUIRE(users->getType() == "ConstantUserGrowth");

    auto holding = ScenarioFactory::holdingTimeFromJson(json(3.0));
    REQUIRE(holding->getType() == "ConstantHoldingTime");

    auto mint = ScenarioFactory::supplyControllerFromJson(
        json::parse(R"({ "type": "mint", "param": 50, "style": "fixed", "self_destruct": true, "name": "airdrop" })"));
    REQUIRE(mint->name() == "airdrop");
    REQUIRE(mint->getType() == "RateSupplyController");
}

TEST_CASE("ScenarioFactory: pool options and extra supply controllers", "[factory]") {
    auto j = json::parse(R"({
        "token": "tk",
        "initial_price": 1,
        "supply": [10, 10, 10],
        "supply_is_added": true,
        "safeguard_supply": true,
        "price_function": { "type": "constant", "price": 1 },
        "agent_pools": [
            { "name": "retail", "currency": "$", "users": 4, "transactions": 2, "fee": 0.5 },
            { "name": "copycats", "currency": "$", "users": 1, "transactions": 1, "chained_to": "retail" },
            { "name": "exits", "currency": "tk", "users": 1, "transactions": 3, "dumper": true },
            { "name": "protocol", "type": "buyback", "currency": "$", "users": 1, "transactions": 6 }
        ],
        "supply_controllers": [
            { "type": "from_data", "values": [1, 2], "on_end_continue": true },
            { "type": "speculator", "speculation": 0, "take_profit": 1.5, "stop_loss": 0.5 }
        ]
    })");
    j["initial_supply"] = 100;

    auto econ = ScenarioFactory::fromJson(j);
    REQUIRE(econ->getConfig().scheduleIsAdded);
    REQUIRE(econ->getConfig().safeguardSupply);
    REQUIRE(econ->getAgentPool(0).getFee() == 0.5);
    REQUIRE(econ->getAgentPool(1).getChainedTo() == "retail");
    REQUIRE(econ->getAgentPool(2).isDumper());
    REQUIRE(econ->getAgentPool(3).getType() == "BuyBackAgentPool");
    REQUIRE(econ->getSupplyControllerCount() == 2);

    const auto& data = econ->run(3, 5);
    REQUIRE(data.at("copycats_users", 0) == 4.0);
    REQUIRE(data.at("exits_transactions", 0) == -3.0);
    REQUIRE(data.at("treasury_$", 0) == Approx(4.0));
    REQUIRE(econ->getConfig().initialSupply == 100.0);

    auto badPool = j;
    badPool["agent_pools"][0]["type"] = "staking";
    REQUIRE_THROWS_AS(ScenarioFactory::fromJson(badPool), ConfigurationError);
}

TEST_CASE("ScenarioFactory: documents carry run settings and several scenarios", "[factory]") {
    auto doc = json::parse(R"({
        "run": { "iterations": 6, "repetitions": 3, "seed": 11, "logging": { "level": "warn" } },
        "scenarios": [
            { "name": "a", "token": "tk", "initial_price": 1, "supply": 10,
              "price_function": { "type": "constant", "price": 1 } },
            { "name": "b", "token": "tk", "initial_price": 1, "supply": 20,
              "price_function": { "type": "bonding_curve", "curve": { "shape": "power", "coefficient": 0.1, "exponent": 1 } } }
        ]
    })");

    auto parsed = ScenarioFactory::documentFromJson(doc);
    REQUIRE(parsed.run.iterations == 6);
    REQUIRE(parsed.run.repetitions == 3);
    REQUIRE(parsed.run.seed.has_value());
    REQUIRE(*parsed.run.seed == 11);
    REQUIRE(parsed.run.threads == 1);
    REQUIRE(parsed.run.logging.level == "warn");
    REQUIRE(parsed.run.logging.console);
    REQUIRE(parsed.scenarios.size() == 2);
    REQUIRE(parsed.scenarios[1].name == "b");

    TokenMetaSimulator sim;
    for (auto& s : parsed.scenarios) {
        sim.addScenario(s.name, std::move(s.economy));
    }
    ExecuteOptions options;
    options.seed = parsed.run.seed;
    sim.execute(parsed.run.iterations, parsed.run.repetitions, options);
    REQUIRE(sim.getTimeseries("tk_price", "b").front().front() == Approx(2.0));
}

TEST_CASE("ScenarioFactory: run config round-trips through JSON", "[factory]") {
    RunConfig run;
    run.iterations = 12;
    run.seed = 99;
    run.logging.console = false;

    RunConfig copy;
    copy.fromJson(run.toJson());
    REQUIRE(copy.iterations == 12);
    REQUIRE(copy.repetitions == 30);
    REQUIRE(copy.seed == run.seed);
    REQUIRE_FALSE(copy.logging.console);

    copy.fromJson(json::parse(R"({ "seed": null })"));
    REQUIRE_FALSE(copy.seed.has_value());
}

TEST_CASE("ScenarioFactory: bundled example configuration loads", "[factory]") {
    auto doc = ScenarioFactory::load(std::string(TOKEN_SIM_CONFIG_DIR) + "/example_scenario.json");
    REQUIRE(doc.scenarios.size() == 2);
    REQUIRE(doc.scenarios[0].name == "baseline");
    REQUIRE(doc.scenarios[0].economy->getAgentPoolCount() == 2);
    REQUIRE(doc.scenarios[1].name == "bonding");

    auto& baseline = *doc.scenarios[0].economy;
    const auto& data = baseline.run(static_cast<size_t>(doc.run.iterations), 42);
    REQUIRE(data.rows() == 36);
    for (double p : data.column("tk_price")) {
        REQUIRE(p >= 0.0);
    }

    REQUIRE_THROWS_AS(ScenarioFactory::load("/nonexistent/scenario.json"), ConfigurationError);
}
